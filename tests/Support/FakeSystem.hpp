#ifndef PINET_TESTS_FAKE_SYSTEM_HPP
#define PINET_TESTS_FAKE_SYSTEM_HPP

#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <unistd.h>

#include "PiNet/Config.hpp"
#include "PiNet/System/CommandRunner.hpp"
#include "PiNet/System/LinkManager.hpp"
#include "PiNet/Util/Clock.hpp"
#include "PiNet/Util/Strings.hpp"

namespace PiNet::Testing
{
    // helper: prints PASS/FAIL and records failures
    inline void check(const bool condition, const std::string& what, int& result_code)
    {
        if (condition)
        {
            std::cout << "PASS: " << what << std::endl;
        }
        else
        {
            std::cerr << "FAIL: " << what << std::endl;
            result_code = EXIT_FAILURE;
        }
    }

    /**
     * @brief Manual clock; sleeping advances time instantly
     */
    class FakeClock final : public Clock
    {
    public:
        time_point now() const override { return now_; }

        void sleep_for(const duration d) override
        {
            now_ += d;
            slept_ += d;
            ++sleeps_;
        }

        void advance(const duration d) { now_ += d; }

        duration slept() const { return slept_; }
        int sleeps() const { return sleeps_; }

    private:
        time_point now_{};
        duration slept_{};
        int sleeps_{0};
    };

    /**
     * @brief In-memory stand-in for nmcli, systemctl and rfkill
     *
     * Profiles, device states and unit states are kept in maps and updated
     * by the commands the code under test issues. Every call is recorded.
     */
    class FakeCommandRunner final : public CommandRunner
    {
    public:
        struct Profile
        {
            std::map<std::string, std::string> fields;
            bool active{false};
        };

        std::map<std::string, Profile> profiles;
        std::map<std::string, std::string> devices{{"wlan0", "disconnected"}, {"eth0", "connected"}};
        // Consumed one per device query; the last value sticks
        std::deque<std::string> wlan_states;
        std::set<std::string> enabled_units;
        std::set<std::string> active_units{Config::DHCP_SERVICE_UNIT, Config::NETWORK_MANAGER_UNIT};
        std::map<std::string, int> restarts;
        bool general_status_ok{true};
        int daemon_reloads{0};

        std::vector<std::vector<std::string>> calls;

        // Commands containing needle exit 1, the first `times` matches only (-1: always)
        void fail_when(std::string needle, const int times = -1)
        {
            failures_.emplace_back(std::move(needle), times);
        }

        std::size_t count_calls(const std::string_view needle) const
        {
            std::size_t n = 0;
            for (const auto& call : calls)
            {
                if (Util::join(call, " ").find(needle) != std::string::npos)
                {
                    ++n;
                }
            }
            return n;
        }

        tl::expected<CommandResult, Error> run(const std::vector<std::string>& argv) override
        {
            calls.push_back(argv);
            const std::string line = Util::join(argv, " ");
            for (auto& [needle, times] : failures_)
            {
                if (times != 0 && line.find(needle) != std::string::npos)
                {
                    if (times > 0)
                    {
                        --times;
                    }
                    return CommandResult{1, "", "injected failure"};
                }
            }

            if (argv[0] == Config::NMCLI_PATH)
            {
                return nmcli(std::vector<std::string>(argv.begin() + 1, argv.end()));
            }
            if (argv[0] == Config::SYSTEMCTL_PATH)
            {
                return systemctl(std::vector<std::string>(argv.begin() + 1, argv.end()));
            }
            if (argv[0] == Config::RFKILL_PATH)
            {
                return CommandResult{0, "", ""};
            }
            return CommandResult{127, "", argv[0] + ": command not found"};
        }

    private:
        static CommandResult ok(std::string out = {}) { return CommandResult{0, std::move(out), ""}; }

        static CommandResult missing(const std::string& name)
        {
            return CommandResult{10, "", "Error: unknown connection '" + name + "'."};
        }

        static std::string field_key(const std::string& key)
        {
            if (key == "ssid")
            {
                return "802-11-wireless.ssid";
            }
            if (key == "ifname")
            {
                return "connection.interface-name";
            }
            if (key == "autoconnect")
            {
                return "connection.autoconnect";
            }
            if (key == "type")
            {
                return "connection.type";
            }
            return key;
        }

        static void apply_fields(Profile& profile, const std::vector<std::string>& args, std::size_t from)
        {
            for (; from + 1 < args.size(); from += 2)
            {
                profile.fields[field_key(args[from])] = args[from + 1];
            }
        }

        static std::string escape(const std::string& value)
        {
            std::string escaped;
            for (const char c : value)
            {
                if (c == ':' || c == '\\')
                {
                    escaped += '\\';
                }
                escaped += c;
            }
            return escaped;
        }

        CommandResult nmcli(std::vector<std::string> args)
        {
            std::string fields;
            if (args.size() >= 3 && args[0] == "-t" && args[1] == "-f")
            {
                fields = args[2];
                args.erase(args.begin(), args.begin() + 3);
            }

            if (args.size() == 1 && args[0] == "device")
            {
                if (!wlan_states.empty())
                {
                    devices["wlan0"] = wlan_states.front();
                    if (wlan_states.size() > 1)
                    {
                        wlan_states.pop_front();
                    }
                }
                std::string out;
                for (const auto& [device, state] : devices)
                {
                    out += device + ":" + state + "\n";
                }
                return ok(out);
            }
            if (args.size() == 2 && args[0] == "general" && args[1] == "status")
            {
                return general_status_ok ? ok("connected\n") : CommandResult{8, "", "NetworkManager is not running"};
            }
            if (args.size() == 3 && args[0] == "radio")
            {
                return ok();
            }
            if (args.size() < 2 || args[0] != "connection")
            {
                return CommandResult{2, "", "unsupported"};
            }

            const std::string& verb = args[1];
            if (verb == "show" && args.size() == 3 && args[2] == "--active")
            {
                std::string out;
                for (const auto& [name, profile] : profiles)
                {
                    if (profile.active)
                    {
                        out += escape(name) + "\n";
                    }
                }
                return ok(out);
            }
            if (verb == "add")
            {
                Profile profile;
                apply_fields(profile, args, 2);
                const std::string name = profile.fields["con-name"];
                profiles[name] = profile;
                return ok("Connection '" + name + "' successfully added.\n");
            }
            if (args.size() < 3)
            {
                return CommandResult{2, "", "missing connection name"};
            }

            const std::string& name = args[2];
            const auto it = profiles.find(name);
            if (it == profiles.end())
            {
                return missing(name);
            }
            if (verb == "show")
            {
                if (fields.empty())
                {
                    return ok("connection.id: " + name + "\n");
                }
                const auto value = it->second.fields.find(fields);
                return ok(fields + ":" + escape(value == it->second.fields.end() ? "" : value->second) + "\n");
            }
            if (verb == "modify")
            {
                apply_fields(it->second, args, 3);
                return ok();
            }
            if (verb == "up")
            {
                it->second.active = true;
                return ok("Connection successfully activated\n");
            }
            if (verb == "down")
            {
                if (!it->second.active)
                {
                    return CommandResult{10, "", "Error: '" + name + "' is not an active connection."};
                }
                it->second.active = false;
                return ok();
            }
            if (verb == "delete")
            {
                profiles.erase(it);
                return ok();
            }
            return CommandResult{2, "", "unsupported"};
        }

        CommandResult systemctl(const std::vector<std::string>& args)
        {
            if (args.size() == 1 && args[0] == "daemon-reload")
            {
                ++daemon_reloads;
                return ok();
            }
            if (args.size() != 2)
            {
                return CommandResult{2, "", "unsupported"};
            }
            const std::string& verb = args[0];
            const std::string& unit = args[1];
            if (verb == "enable")
            {
                enabled_units.insert(unit);
            }
            else if (verb == "disable")
            {
                enabled_units.erase(unit);
            }
            else if (verb == "start")
            {
                active_units.insert(unit);
            }
            else if (verb == "stop")
            {
                active_units.erase(unit);
            }
            else if (verb == "restart")
            {
                active_units.insert(unit);
                ++restarts[unit];
            }
            else if (verb == "is-enabled")
            {
                return enabled_units.contains(unit) ? ok("enabled\n") : CommandResult{1, "disabled\n", ""};
            }
            else if (verb == "is-active")
            {
                return active_units.contains(unit) ? ok("active\n") : CommandResult{3, "inactive\n", ""};
            }
            else
            {
                return CommandResult{2, "", "unsupported"};
            }
            return ok();
        }

        std::vector<std::pair<std::string, int>> failures_;
    };

    /**
     * @brief LinkControl backed by plain containers
     */
    class FakeLinkControl final : public LinkControl
    {
    public:
        std::set<std::string> present{"lo", "eth0", "wlan0"};
        std::vector<Interface> interfaces;
        std::map<std::string, std::vector<Neighbour>> neighbour_table;
        int exists_calls{0};

        tl::expected<bool, Error> exists(const std::string_view interface_name) override
        {
            ++exists_calls;
            return present.contains(std::string(interface_name));
        }

        tl::expected<std::vector<Interface>, Error> list_interfaces() override
        {
            return interfaces;
        }

        tl::expected<std::vector<Neighbour>, Error> neighbours(const std::string_view interface_name) override
        {
            const auto it = neighbour_table.find(std::string(interface_name));
            return it == neighbour_table.end() ? std::vector<Neighbour>{} : it->second;
        }
    };

    /**
     * @brief Scratch directory removed on destruction
     */
    class TempDir
    {
    public:
        TempDir()
        {
            std::string pattern = (std::filesystem::temp_directory_path() / "pinet-test-XXXXXX").string();
            if (mkdtemp(pattern.data()))
            {
                path_ = pattern;
            }
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        bool valid() const { return !path_.empty(); }
        const std::filesystem::path& path() const { return path_; }
        std::string file(const std::string_view name) const { return (path_ / name).string(); }

    private:
        std::filesystem::path path_;
    };

    inline std::string read_file(const std::string& path)
    {
        std::ifstream in(path);
        std::ostringstream content;
        content << in.rdbuf();
        return content.str();
    }

    inline void write_file(const std::string& path, const std::string& content)
    {
        std::ofstream out(path, std::ios::trunc);
        out << content;
    }

    // Lines equal to `line` after trimming
    inline std::size_t count_lines(const std::string& text, const std::string_view line)
    {
        std::size_t n = 0;
        for (const auto& entry : Util::lines(text))
        {
            if (Util::trim(entry) == line)
            {
                ++n;
            }
        }
        return n;
    }
}

#endif //PINET_TESTS_FAKE_SYSTEM_HPP
