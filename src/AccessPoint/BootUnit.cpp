#include "PiNet/AccessPoint/BootUnit.hpp"
#include "PiNet/System/ServiceManager.hpp"
#include "PiNet/Util/Logger.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

using tl::unexpected, std::string, std::format;
namespace fs = std::filesystem;

namespace PiNet
{
    BootUnit::BootUnit(const ServiceManager& services, string unit_dir, const Clock::duration start_timeout,
                       string unit_name, string activator)
        : services_(services), unit_dir_(std::move(unit_dir)), start_timeout_(start_timeout),
          unit_name_(std::move(unit_name)), activator_(std::move(activator))
    {
        s_ = logger().get_sink("PiNet BootUnit");
    }

    string BootUnit::path() const
    {
        return (fs::path(unit_dir_) / unit_name_).string();
    }

    string BootUnit::render() const
    {
        const auto timeout = std::chrono::ceil<std::chrono::seconds>(start_timeout_).count();
        return format(
            "[Unit]\n"
            "Description=PiNet WiFi access point activation\n"
            "After={0} network-online.target\n"
            "Wants={0} network-online.target\n"
            "\n"
            "[Service]\n"
            "Type=oneshot\n"
            "ExecStart={1}\n"
            "RemainAfterExit=yes\n"
            "TimeoutStartSec={2}\n"
            "\n"
            "[Install]\n"
            "WantedBy=multi-user.target\n",
            Config::NETWORK_MANAGER_UNIT, activator_, timeout);
    }

    bool BootUnit::installed() const
    {
        std::error_code ec;
        return fs::exists(path(), ec);
    }

    tl::expected<void, Error> BootUnit::install() const
    {
        const string content = render();
        if (installed())
        {
            std::ifstream in(path());
            std::ostringstream current;
            current << in.rdbuf();
            if (in && current.str() == content)
            {
                XTR_LOGL(debug, s_, "{} is up to date", path());
                return {};
            }
        }

        std::ofstream out(path(), std::ios::trunc);
        out << content;
        out.flush();
        if (!out)
        {
            XTR_LOGL(error, s_, "Failed to write {}", path());
            return unexpected(Error{ErrorCode::BootUnitWriteError, format("Failed to write {}", path())});
        }
        XTR_LOGL(info, s_, "Installed {}", path());
        if (auto reloaded = services_.daemon_reload(); !reloaded)
        {
            // systemd never saw the unit, so nothing may be left on disk for it
            XTR_LOGL(error, s_, "daemon-reload failed after writing {}, removing it", path());
            if (auto removed = remove_file(path()); !removed)
            {
                XTR_LOGL(warning, s_, "Could not remove {}: {}", path(), removed.error().message);
            }
            return unexpected(reloaded.error());
        }
        return {};
    }

    tl::expected<void, Error> BootUnit::register_for_boot() const
    {
        auto enabled = services_.enable(unit_name_);
        if (!enabled)
        {
            XTR_LOGL(error, s_, "Failed to enable {}, removing it", unit_name_);
            if (auto removed = remove_file(path()); removed)
            {
                if (auto reloaded = services_.daemon_reload(); !reloaded)
                {
                    XTR_LOGL(warning, s_, "daemon-reload failed: {}", reloaded.error().message);
                }
            }
            return unexpected(enabled.error());
        }
        XTR_LOGL(info, s_, "{} enabled for boot", unit_name_);
        return {};
    }

    tl::expected<void, Error> BootUnit::uninstall() const
    {
        // A unit that was never started or enabled reports failure here
        if (auto stopped = services_.stop(unit_name_); !stopped)
        {
            XTR_LOGL(debug, s_, "Stopping {}: {}", unit_name_, stopped.error().message);
        }
        if (auto disabled = services_.disable(unit_name_); !disabled)
        {
            XTR_LOGL(debug, s_, "Disabling {}: {}", unit_name_, disabled.error().message);
        }
        if (auto removed = remove_file(path()); !removed)
        {
            return removed;
        }
        return services_.daemon_reload();
    }

    tl::expected<bool, Error> BootUnit::enabled() const
    {
        return services_.is_enabled(unit_name_);
    }

    void BootUnit::require_network_online() const
    {
        if (auto enabled = services_.enable(Config::WAIT_ONLINE_UNIT); !enabled)
        {
            XTR_LOGL(warning, s_, "Could not enable {}: {}", Config::WAIT_ONLINE_UNIT, enabled.error().message);
        }
    }

    void BootUnit::remove_legacy_units() const
    {
        const string legacy = Config::LEGACY_AP_BOOT_UNIT;
        const string legacy_path = (fs::path(unit_dir_) / legacy).string();
        std::error_code ec;
        if (!fs::exists(legacy_path, ec))
        {
            return;
        }

        if (auto stopped = services_.stop(legacy); !stopped)
        {
            XTR_LOGL(debug, s_, "Stopping {}: {}", legacy, stopped.error().message);
        }
        if (auto disabled = services_.disable(legacy); !disabled)
        {
            XTR_LOGL(debug, s_, "Disabling {}: {}", legacy, disabled.error().message);
        }
        if (auto removed = remove_file(legacy_path); !removed)
        {
            XTR_LOGL(warning, s_, "Could not remove legacy unit: {}", removed.error().message);
            return;
        }
        XTR_LOGL(info, s_, "Removed legacy unit {}", legacy);
        if (auto reloaded = services_.daemon_reload(); !reloaded)
        {
            XTR_LOGL(warning, s_, "daemon-reload after legacy cleanup failed: {}", reloaded.error().message);
        }
    }

    tl::expected<void, Error> BootUnit::remove_file(const string& file) const
    {
        std::error_code ec;
        fs::remove(file, ec);
        if (ec)
        {
            XTR_LOGL(error, s_, "Failed to remove {}: {}", file, ec.message());
            return unexpected(Error{
                ErrorCode::BootUnitRemoveError, format("Failed to remove {}: {}", file, ec.message())
            });
        }
        return {};
    }
}
