#include "PiNet/AccessPoint/BootActivationSequencer.hpp"
#include "PiNet/System/ConnectionManager.hpp"
#include "PiNet/System/LinkManager.hpp"
#include "PiNet/Util/Logger.hpp"

#include <algorithm>
#include <format>

using tl::unexpected, std::string, std::string_view, std::format;
using std::chrono::duration_cast, std::chrono::seconds;

namespace PiNet
{
    Clock::duration SequencerTiming::worst_case() const
    {
        // Three readiness stages, settle, then every attempt plus the gaps between them
        const int attempts = std::max(activation_attempts, 1);
        return 3 * readiness_timeout + settle_delay + (attempts - 1) * retry_delay +
            attempts * Clock::duration(Config::ACTIVATION_COMMAND_BUDGET);
    }

    SequencerTiming SequencerTiming::from_env()
    {
        SequencerTiming timing;
        timing.readiness_timeout = Config::env_seconds_or("PINET_AP_READINESS_TIMEOUT", Config::BOOT_READINESS_TIMEOUT);
        timing.poll_interval = std::max(Config::env_seconds_or("PINET_AP_POLL_INTERVAL", Config::BOOT_POLL_INTERVAL),
                                        seconds{1});
        timing.settle_delay = Config::env_seconds_or("PINET_AP_SETTLE_DELAY", Config::BOOT_SETTLE_DELAY);
        timing.retry_delay = Config::env_seconds_or("PINET_AP_RETRY_DELAY", Config::BOOT_RETRY_DELAY);
        timing.activation_attempts = std::max(Config::env_int_or("PINET_AP_ATTEMPTS", Config::BOOT_ACTIVATION_ATTEMPTS), 1);
        return timing;
    }

    BootActivationSequencer::BootActivationSequencer(const ConnectionManager& connections, LinkControl& links,
                                                     Clock& clock, string interface, string connection,
                                                     const SequencerTiming timing)
        : connections_(connections), links_(links), clock_(clock), interface_(std::move(interface)),
          connection_(std::move(connection)), timing_(timing)
    {
        s_ = logger().get_sink("PiNet Boot");
    }

    tl::expected<void, Error> BootActivationSequencer::wait_for(const string_view stage,
                                                                const std::function<bool()>& ready)
    {
        const auto start = clock_.now();
        while (true)
        {
            if (ready())
            {
                XTR_LOGL(info, s_, "{} ready after {}s", stage,
                         duration_cast<seconds>(clock_.now() - start).count());
                return {};
            }
            const auto elapsed = clock_.now() - start;
            if (elapsed + timing_.poll_interval > timing_.readiness_timeout)
            {
                XTR_LOGL(error, s_, "Timed out waiting for {} after {}s", stage,
                         duration_cast<seconds>(elapsed).count());
                return unexpected(Error{
                    ErrorCode::ReadinessTimeout,
                    format("Timed out waiting for {} after {}s", stage, duration_cast<seconds>(elapsed).count())
                });
            }
            clock_.sleep_for(timing_.poll_interval);
        }
    }

    tl::expected<void, Error> BootActivationSequencer::activate()
    {
        Error last{ErrorCode::ActivationError, format("No activation attempted for {}", connection_)};
        for (int attempt = 1; attempt <= timing_.activation_attempts; ++attempt)
        {
            XTR_LOGL(info, s_, "Activating {} (attempt {}/{})", connection_, attempt, timing_.activation_attempts);
            auto activated = connections_.up(connection_);
            if (activated)
            {
                XTR_LOGL(info, s_, "Access point {} is up", connection_);
                return {};
            }
            last = activated.error();
            if (attempt < timing_.activation_attempts)
            {
                clock_.sleep_for(timing_.retry_delay);
            }
        }
        XTR_LOGL(error, s_, "Giving up on {} after {} attempts", connection_, timing_.activation_attempts);
        return unexpected(Error{
            ErrorCode::ActivationError,
            format("Failed to activate {} after {} attempts: {}", connection_, timing_.activation_attempts,
                   last.message)
        });
    }

    tl::expected<void, Error> BootActivationSequencer::run()
    {
        XTR_LOGL(info, s_, "Starting access point activation for {} on {}", connection_, interface_);

        if (auto unblocked = connections_.unblock_wifi(); !unblocked)
        {
            XTR_LOGL(warning, s_, "rfkill unblock failed: {}", unblocked.error().message);
        }
        if (auto radio = connections_.radio_wifi_on(); !radio)
        {
            XTR_LOGL(warning, s_, "Enabling the wifi radio failed: {}", radio.error().message);
        }

        auto ready = wait_for(format("interface {}", interface_), [this]
        {
            const auto exists = links_.exists(interface_);
            return exists && *exists;
        }).and_then([this]
        {
            return wait_for(format("NetworkManager to manage {}", interface_), [this]
            {
                const auto state = connections_.device_state(interface_);
                return state && (*state == "disconnected" || *state == "connected");
            });
        }).and_then([this]
        {
            return wait_for("NetworkManager", [this] { return connections_.general_status().has_value(); });
        });
        if (!ready)
        {
            return ready;
        }

        auto exists = connections_.exists(connection_);
        if (!exists)
        {
            return unexpected(exists.error());
        }
        if (!*exists)
        {
            XTR_LOGL(error, s_, "Connection {} does not exist, configure the access point first", connection_);
            return unexpected(Error{
                ErrorCode::AccessPointNotConfigured, format("Connection {} does not exist", connection_)
            });
        }

        XTR_LOGL(info, s_, "Waiting {}s for the radio firmware to settle",
                 duration_cast<seconds>(timing_.settle_delay).count());
        clock_.sleep_for(timing_.settle_delay);

        return activate();
    }
}
