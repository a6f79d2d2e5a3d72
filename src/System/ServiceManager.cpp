#include "PiNet/System/ServiceManager.hpp"
#include "PiNet/System/CommandRunner.hpp"
#include "PiNet/Util/Logger.hpp"
#include "PiNet/Util/Strings.hpp"
#include "PiNet/Config.hpp"

using tl::unexpected, std::string, std::string_view;

namespace PiNet
{
    ServiceManager::ServiceManager(CommandRunner& runner) : runner_(runner)
    {
        s_ = logger().get_sink("PiNet systemd");
    }

    tl::expected<void, Error> ServiceManager::unit_command(const string_view verb, const string_view unit) const
    {
        XTR_LOGL(debug, s_, "systemctl {} {}", verb, unit);
        return run_checked(runner_, s_, {Config::SYSTEMCTL_PATH, string(verb), string(unit)})
            .map([](const string&) {});
    }

    tl::expected<void, Error> ServiceManager::enable(const string_view unit) const
    {
        return unit_command("enable", unit);
    }

    tl::expected<void, Error> ServiceManager::disable(const string_view unit) const
    {
        return unit_command("disable", unit);
    }

    tl::expected<void, Error> ServiceManager::start(const string_view unit) const
    {
        return unit_command("start", unit);
    }

    tl::expected<void, Error> ServiceManager::stop(const string_view unit) const
    {
        return unit_command("stop", unit);
    }

    tl::expected<void, Error> ServiceManager::restart(const string_view unit) const
    {
        XTR_LOGL(info, s_, "Restarting {}", unit);
        return unit_command("restart", unit);
    }

    tl::expected<void, Error> ServiceManager::daemon_reload() const
    {
        return run_checked(runner_, s_, {Config::SYSTEMCTL_PATH, "daemon-reload"}).map([](const string&) {});
    }

    tl::expected<bool, Error> ServiceManager::is_enabled(const string_view unit) const
    {
        // is-enabled exits non-zero for disabled units; only stdout matters
        auto result = runner_.run({Config::SYSTEMCTL_PATH, "is-enabled", string(unit)});
        if (!result)
        {
            return unexpected(result.error());
        }
        return Util::trim(result->out) == "enabled";
    }

    tl::expected<bool, Error> ServiceManager::is_active(const string_view unit) const
    {
        auto result = runner_.run({Config::SYSTEMCTL_PATH, "is-active", string(unit)});
        if (!result)
        {
            return unexpected(result.error());
        }
        return result->ok();
    }
}
