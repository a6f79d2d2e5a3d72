#include "PiNet/System/ConnectionManager.hpp"
#include "PiNet/System/CommandRunner.hpp"
#include "PiNet/Util/Logger.hpp"
#include "PiNet/Util/Strings.hpp"
#include "PiNet/Config.hpp"

#include <algorithm>
#include <format>

using tl::unexpected, std::string, std::string_view, std::vector, std::format;

namespace PiNet
{
    vector<string> split_terse(const string_view line)
    {
        vector<string> fields(1);
        for (std::size_t i = 0; i < line.size(); ++i)
        {
            const char c = line[i];
            if (c == '\\' && i + 1 < line.size())
            {
                fields.back() += line[++i];
            }
            else if (c == ':')
            {
                fields.emplace_back();
            }
            else
            {
                fields.back() += c;
            }
        }
        return fields;
    }

    ConnectionManager::ConnectionManager(CommandRunner& runner) : runner_(runner)
    {
        s_ = logger().get_sink("PiNet NetworkManager");
    }

    tl::expected<bool, Error> ConnectionManager::exists(const string_view name) const
    {
        auto result = runner_.run({Config::NMCLI_PATH, "connection", "show", string(name)});
        if (!result)
        {
            return unexpected(result.error());
        }
        return result->ok();
    }

    tl::expected<void, Error> ConnectionManager::add_access_point(const AccessPointProfile& profile) const
    {
        XTR_LOGL(info, s_, "Creating access point profile {} on {} (ssid {}, channel {})",
                 profile.name, profile.interface, profile.ssid, profile.channel);
        return run_checked(runner_, s_, {
                               Config::NMCLI_PATH, "connection", "add",
                               "type", "wifi",
                               "ifname", profile.interface,
                               "con-name", profile.name,
                               "autoconnect", "no",
                               "ssid", profile.ssid,
                               "802-11-wireless.mode", "ap",
                               "802-11-wireless.band", "bg",
                               "802-11-wireless.channel", std::to_string(profile.channel),
                               "ipv4.method", "shared",
                               "ipv4.addresses", format("{}/{}", profile.address, profile.prefix),
                               "wifi-sec.key-mgmt", "wpa-psk",
                               "wifi-sec.psk", profile.passphrase
                           }).map([](const string&) {});
    }

    tl::expected<void, Error> ConnectionManager::add_static_ethernet(const string_view name,
                                                                     const string_view interface,
                                                                     const string_view address,
                                                                     const int prefix) const
    {
        XTR_LOGL(info, s_, "Creating connection {} for {}", name, interface);
        return run_checked(runner_, s_, {
                               Config::NMCLI_PATH, "connection", "add",
                               "type", "ethernet",
                               "ifname", string(interface),
                               "con-name", string(name),
                               "ipv4.addresses", format("{}/{}", address, prefix),
                               "ipv4.method", "manual",
                               "connection.autoconnect", "yes"
                           }).map([](const string&) {});
    }

    tl::expected<void, Error> ConnectionManager::set_static_address(const string_view name,
                                                                    const string_view address,
                                                                    const int prefix) const
    {
        XTR_LOGL(info, s_, "Modifying existing connection {}", name);
        return run_checked(runner_, s_, {
                               Config::NMCLI_PATH, "connection", "modify", string(name),
                               "ipv4.addresses", format("{}/{}", address, prefix),
                               "ipv4.method", "manual"
                           }).map([](const string&) {});
    }

    tl::expected<void, Error> ConnectionManager::set_autoconnect(const string_view name, const bool enabled) const
    {
        return run_checked(runner_, s_, {
                               Config::NMCLI_PATH, "connection", "modify", string(name),
                               "autoconnect", enabled ? "yes" : "no"
                           }).map([](const string&) {});
    }

    tl::expected<void, Error> ConnectionManager::up(const string_view name) const
    {
        return run_checked(runner_, s_, {Config::NMCLI_PATH, "connection", "up", string(name)})
            .map([](const string&) {});
    }

    tl::expected<void, Error> ConnectionManager::down(const string_view name) const
    {
        return run_checked(runner_, s_, {Config::NMCLI_PATH, "connection", "down", string(name)})
            .map([](const string&) {});
    }

    tl::expected<void, Error> ConnectionManager::remove(const string_view name) const
    {
        return run_checked(runner_, s_, {Config::NMCLI_PATH, "connection", "delete", string(name)})
            .map([](const string&) {});
    }

    tl::expected<string, Error> ConnectionManager::field(const string_view name, const string_view field_name) const
    {
        auto output = run_checked(runner_, s_, {
                                      Config::NMCLI_PATH, "-t", "-f", string(field_name),
                                      "connection", "show", string(name)
                                  });
        if (!output)
        {
            return unexpected(output.error());
        }
        for (const auto& line : Util::lines(*output))
        {
            // "<field>:<value>"; the value may itself contain escaped colons
            const auto separator = line.find(':');
            if (separator == string::npos || string_view(line).substr(0, separator) != field_name)
            {
                continue;
            }
            const auto parts = split_terse(string_view(line).substr(separator + 1));
            return Util::join(parts, ":");
        }
        return unexpected(Error{
            ErrorCode::CommandFailed, format("Field {} not reported for connection {}", field_name, name)
        });
    }

    tl::expected<vector<string>, Error> ConnectionManager::active_connections() const
    {
        auto output = run_checked(runner_, s_, {
                                      Config::NMCLI_PATH, "-t", "-f", "NAME", "connection", "show", "--active"
                                  });
        if (!output)
        {
            return unexpected(output.error());
        }
        vector<string> names;
        for (const auto& line : Util::lines(*output))
        {
            names.push_back(split_terse(line).front());
        }
        return names;
    }

    tl::expected<bool, Error> ConnectionManager::is_active(const string_view name) const
    {
        return active_connections().map([name](const vector<string>& names)
        {
            return std::ranges::find(names, name) != names.end();
        });
    }

    tl::expected<string, Error> ConnectionManager::device_state(const string_view interface) const
    {
        auto output = run_checked(runner_, s_, {Config::NMCLI_PATH, "-t", "-f", "DEVICE,STATE", "device"});
        if (!output)
        {
            return unexpected(output.error());
        }
        for (const auto& line : Util::lines(*output))
        {
            const auto fields = split_terse(line);
            if (fields.size() >= 2 && fields[0] == interface)
            {
                return fields[1];
            }
        }
        return string("absent");
    }

    tl::expected<void, Error> ConnectionManager::general_status() const
    {
        return run_checked(runner_, s_, {Config::NMCLI_PATH, "general", "status"}).map([](const string&) {});
    }

    tl::expected<void, Error> ConnectionManager::radio_wifi_on() const
    {
        return run_checked(runner_, s_, {Config::NMCLI_PATH, "radio", "wifi", "on"}).map([](const string&) {});
    }

    tl::expected<void, Error> ConnectionManager::unblock_wifi() const
    {
        return run_checked(runner_, s_, {Config::RFKILL_PATH, "unblock", "wifi"}).map([](const string&) {});
    }
}
