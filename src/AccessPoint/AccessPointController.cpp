#include "PiNet/AccessPoint/AccessPointController.hpp"
#include "PiNet/AccessPoint/BootUnit.hpp"
#include "PiNet/Dhcp/ConfigDocument.hpp"
#include "PiNet/Dhcp/DhcpService.hpp"
#include "PiNet/Dhcp/SharedConfigStore.hpp"
#include "PiNet/System/ConnectionManager.hpp"
#include "PiNet/Util/Address.hpp"
#include "PiNet/Util/Logger.hpp"
#include "PiNet/Util/Strings.hpp"

#include <charconv>
#include <format>

using tl::unexpected, std::string, std::string_view, std::vector, std::format;

namespace
{
    constexpr const char* INSTALLED_KEY = "installed";
    constexpr const char* ENABLED_KEY = "enabled";
    constexpr const char* ACTIVE_KEY = "active";

    // Clears the status cache when a mutation returns, on every path
    class CacheInvalidator
    {
    public:
        explicit CacheInvalidator(PiNet::StatusCache<bool>& cache) : cache_(cache)
        {
        }

        ~CacheInvalidator()
        {
            cache_.invalidate_all();
        }

        CacheInvalidator(const CacheInvalidator&) = delete;
        CacheInvalidator& operator=(const CacheInvalidator&) = delete;

    private:
        PiNet::StatusCache<bool>& cache_;
    };

    bool is_connectable(const string_view state)
    {
        return state == "disconnected" || state == "connected";
    }

    bool is_hex(const string_view text)
    {
        for (const char c : text)
        {
            if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F')))
            {
                return false;
            }
        }
        return true;
    }
}

namespace PiNet
{
    AccessPointSettings AccessPointSettings::from_env()
    {
        AccessPointSettings settings;
        settings.connection_name = Config::get_ap_connection_name();
        settings.interface = Config::get_wireless_interface();
        return settings;
    }

    const char* AccessPointState::describe() const
    {
        if (!installed)
        {
            return "absent";
        }
        return active ? "active" : "inactive";
    }

    AccessPointController::AccessPointController(const ConnectionManager& connections,
                                                 const SharedConfigStore& store, const DhcpService& dhcp,
                                                 const BootUnit& boot_unit, LinkControl& links, Clock& clock,
                                                 AccessPointSettings settings)
        : connections_(connections), store_(store), dhcp_(dhcp), boot_unit_(boot_unit), links_(links),
          clock_(clock), settings_(std::move(settings)), cache_(clock, settings_.cache_ttl)
    {
        s_ = logger().get_sink("PiNet AccessPoint");
    }

    tl::expected<void, Error> AccessPointController::validate(const AccessPointConfig& config)
    {
        if (config.ssid.empty() || config.ssid.size() > 32)
        {
            return unexpected(Error{
                ErrorCode::InvalidSsid, format("SSID must be 1-32 bytes, got {}", config.ssid.size())
            });
        }
        // WPA2-PSK: an 8-63 character passphrase or a 64 digit hex key
        const auto length = config.passphrase.size();
        const bool hex_key = length == 64 && is_hex(config.passphrase);
        if (length < Config::AP_MIN_PASSPHRASE_LENGTH || (length > 63 && !hex_key))
        {
            return unexpected(Error{
                ErrorCode::InvalidPassphrase,
                format("Passphrase must be {}-63 characters", Config::AP_MIN_PASSPHRASE_LENGTH)
            });
        }
        if (config.channel < Config::AP_MIN_CHANNEL || config.channel > Config::AP_MAX_CHANNEL)
        {
            return unexpected(Error{
                ErrorCode::InvalidChannel,
                format("Channel must be {}-{}, got {}", Config::AP_MIN_CHANNEL, Config::AP_MAX_CHANNEL,
                       config.channel)
            });
        }
        return Util::validate_ipv4(config.address);
    }

    tl::expected<void, Error> AccessPointController::configure(const string_view ssid, const string_view passphrase,
                                                               const int channel, const string_view address)
    {
        const AccessPointConfig config{string(ssid), string(passphrase), channel, string(address)};
        if (auto valid = validate(config); !valid)
        {
            XTR_LOGL(warning, s_, "Rejected access point configuration: {}", valid.error().message);
            return valid;
        }

        CacheInvalidator invalidate(cache_);

        auto exists = connections_.exists(settings_.connection_name);
        if (!exists)
        {
            return unexpected(exists.error());
        }
        if (*exists)
        {
            XTR_LOGL(info, s_, "Replacing existing profile {}", settings_.connection_name);
            if (auto removed = connections_.remove(settings_.connection_name); !removed)
            {
                return removed;
            }
        }

        const AccessPointProfile profile{
            settings_.connection_name, settings_.interface, config.ssid, config.passphrase, config.channel,
            config.address, Config::AP_PREFIX_LENGTH
        };
        if (auto added = connections_.add_access_point(profile); !added)
        {
            return added;
        }

        {
            std::lock_guard lock(config_mutex_);
            last_known_good_ = config;
        }
        XTR_LOGL(info, s_, "Access point configured: ssid {}, channel {}, gateway {}", config.ssid, config.channel,
                 config.address);
        return {};
    }

    tl::expected<void, Error> AccessPointController::wait_until_connectable()
    {
        string last_state = "unknown";
        for (int attempt = 1; attempt <= settings_.readiness_attempts; ++attempt)
        {
            auto state = connections_.device_state(settings_.interface);
            if (state)
            {
                if (is_connectable(*state))
                {
                    XTR_LOGL(debug, s_, "{} is {}", settings_.interface, *state);
                    return {};
                }
                last_state = *state;
            }
            if (attempt < settings_.readiness_attempts)
            {
                clock_.sleep_for(settings_.readiness_interval);
            }
        }
        XTR_LOGL(error, s_, "{} did not become ready (last state: {})", settings_.interface, last_state);
        return unexpected(Error{
            ErrorCode::ReadinessTimeout,
            format("{} did not become ready after {} checks (last state: {})", settings_.interface,
                   settings_.readiness_attempts, last_state)
        });
    }

    tl::expected<Outcome, Error> AccessPointController::enable()
    {
        auto installed = connections_.exists(settings_.connection_name);
        if (!installed)
        {
            return unexpected(installed.error());
        }
        if (!*installed)
        {
            XTR_LOGL(error, s_, "Access point is not configured");
            return unexpected(Error{ErrorCode::AccessPointNotConfigured, "Access point is not configured"});
        }

        CacheInvalidator invalidate(cache_);

        if (auto unblocked = connections_.unblock_wifi(); !unblocked)
        {
            return unexpected(Error{ErrorCode::RadioUnblockError, unblocked.error().message});
        }
        if (auto radio = connections_.radio_wifi_on(); !radio)
        {
            return unexpected(Error{ErrorCode::RadioUnblockError, radio.error().message});
        }
        if (auto ready = wait_until_connectable(); !ready)
        {
            return unexpected(ready.error());
        }

        // Boot activation is owned by the boot unit
        if (auto manual = connections_.set_autoconnect(settings_.connection_name, false); !manual)
        {
            return unexpected(manual.error());
        }

        boot_unit_.remove_legacy_units();

        auto dhcp = reconcile_dhcp_conflicts();
        if (!dhcp)
        {
            return unexpected(dhcp.error());
        }

        if (auto registered = boot_unit_.install().and_then([this] { return boot_unit_.register_for_boot(); });
            !registered)
        {
            return unexpected(registered.error());
        }
        boot_unit_.require_network_online();

        if (auto activated = connections_.up(settings_.connection_name); !activated)
        {
            return unexpected(Error{
                ErrorCode::ActivationError,
                format("Access point registered for boot but failed to start: {}", activated.error().message)
            });
        }

        XTR_LOGL(info, s_, "Access point {} enabled and active", settings_.connection_name);
        return *dhcp;
    }

    tl::expected<void, Error> AccessPointController::disable()
    {
        CacheInvalidator invalidate(cache_);

        if (auto down = connections_.down(settings_.connection_name); !down)
        {
            XTR_LOGL(info, s_, "Deactivating {}: {}", settings_.connection_name, down.error().message);
        }

        auto exists = connections_.exists(settings_.connection_name);
        if (!exists)
        {
            return unexpected(exists.error());
        }
        if (*exists)
        {
            if (auto manual = connections_.set_autoconnect(settings_.connection_name, false); !manual)
            {
                return manual;
            }
        }

        if (auto removed = boot_unit_.uninstall(); !removed)
        {
            return removed;
        }
        boot_unit_.remove_legacy_units();

        XTR_LOGL(info, s_, "Access point {} disabled", settings_.connection_name);
        return {};
    }

    tl::expected<void, Error> AccessPointController::restart()
    {
        CacheInvalidator invalidate(cache_);

        if (auto down = connections_.down(settings_.connection_name); !down)
        {
            XTR_LOGL(info, s_, "Deactivating {}: {}", settings_.connection_name, down.error().message);
        }
        clock_.sleep_for(settings_.restart_settle);

        if (auto up = connections_.up(settings_.connection_name); !up)
        {
            return unexpected(Error{ErrorCode::ActivationError, up.error().message});
        }
        XTR_LOGL(info, s_, "Access point {} restarted", settings_.connection_name);
        return {};
    }

    AccessPointConfig AccessPointController::last_known_good() const
    {
        std::lock_guard lock(config_mutex_);
        return last_known_good_;
    }

    tl::expected<AccessPointConfig, Error> AccessPointController::get_config()
    {
        auto installed = is_installed();
        if (!installed)
        {
            return unexpected(installed.error());
        }
        if (!*installed)
        {
            return unexpected(Error{ErrorCode::AccessPointNotConfigured, "Access point is not configured"});
        }

        AccessPointConfig config = last_known_good();
        const auto& name = settings_.connection_name;

        if (auto ssid = connections_.field(name, "802-11-wireless.ssid"); ssid && !ssid->empty())
        {
            config.ssid = *ssid;
        }

        if (auto channel = connections_.field(name, "802-11-wireless.channel"); channel)
        {
            int parsed{};
            const auto [ptr, ec] = std::from_chars(channel->data(), channel->data() + channel->size(), parsed);
            if (ec == std::errc{} && ptr == channel->data() + channel->size() && parsed > 0)
            {
                config.channel = parsed;
            }
        }

        // "10.0.2.1/24", possibly followed by further addresses
        if (auto addresses = connections_.field(name, "ipv4.addresses"); addresses)
        {
            const auto first = Util::split(*addresses, ',').front();
            const auto address = string(Util::trim(string_view(first).substr(0, first.find('/'))));
            if (Util::is_ipv4(address))
            {
                config.address = address;
            }
        }
        return config;
    }

    tl::expected<vector<Neighbour>, Error> AccessPointController::get_connected_clients()
    {
        auto active = is_active();
        if (!active)
        {
            return unexpected(active.error());
        }
        if (!*active)
        {
            return vector<Neighbour>{};
        }
        return links_.neighbours(settings_.interface);
    }

    tl::expected<bool, Error> AccessPointController::is_installed()
    {
        return cache_.get_or_fetch(INSTALLED_KEY, [this] { return connections_.exists(settings_.connection_name); });
    }

    tl::expected<bool, Error> AccessPointController::is_enabled()
    {
        return cache_.get_or_fetch(ENABLED_KEY, [this] { return boot_unit_.enabled(); });
    }

    tl::expected<bool, Error> AccessPointController::is_active()
    {
        return cache_.get_or_fetch(ACTIVE_KEY, [this] { return connections_.is_active(settings_.connection_name); });
    }

    tl::expected<AccessPointState, Error> AccessPointController::state()
    {
        AccessPointState state;
        auto installed = is_installed();
        if (!installed)
        {
            return unexpected(installed.error());
        }
        auto enabled = is_enabled();
        if (!enabled)
        {
            return unexpected(enabled.error());
        }
        auto active = is_active();
        if (!active)
        {
            return unexpected(active.error());
        }
        state.installed = *installed;
        state.enabled = *enabled;
        state.active = *active;
        return state;
    }

    tl::expected<Outcome, Error> AccessPointController::reconcile_dhcp_conflicts()
    {
        const string exclusion = format("{}={}", Config::EXCEPT_INTERFACE_KEY, settings_.interface);
        const string obsolete = format("{}={}", Config::INTERFACE_KEY, settings_.interface);

        auto changed = store_.update([&](ConfigDocument& document)
        {
            if (document.remove_line(obsolete))
            {
                XTR_LOGL(info, s_, "Removing obsolete {}", obsolete);
            }
            document.ensure_singleton(Config::BIND_DYNAMIC_DIRECTIVE);
            document.ensure_singleton(exclusion);
        });
        if (!changed)
        {
            XTR_LOGL(error, s_, "Failed to keep dnsmasq off {}: {}", settings_.interface, changed.error().message);
            return unexpected(changed.error());
        }
        return dhcp_.propagate(*changed);
    }
}
