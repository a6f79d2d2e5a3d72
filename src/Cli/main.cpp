#include <charconv>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "PiNet/AccessPoint/AccessPointController.hpp"
#include "PiNet/AccessPoint/BootActivationSequencer.hpp"
#include "PiNet/AccessPoint/BootUnit.hpp"
#include "PiNet/Adapter/AdapterConfigurator.hpp"
#include "PiNet/Dhcp/DhcpService.hpp"
#include "PiNet/Dhcp/Reservation.hpp"
#include "PiNet/Dhcp/SharedConfigStore.hpp"
#include "PiNet/System/CommandRunner.hpp"
#include "PiNet/System/ConnectionManager.hpp"
#include "PiNet/System/LinkManager.hpp"
#include "PiNet/System/ServiceManager.hpp"
#include "PiNet/Config.hpp"

using namespace PiNet;
using std::string, std::string_view, std::vector;

namespace
{
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FAILED = 1;
    constexpr int EXIT_USAGE = 2;

    void print_usage()
    {
        std::cerr << "Usage: pinetctl <command>\n"
            << "  adapter list\n"
            << "  adapter usb\n"
            << "  adapter assign <interface> <address> [prefix]\n"
            << "  reservation add <mac> <address> [hostname]\n"
            << "  reservation remove <mac>\n"
            << "  reservation list\n"
            << "  ap configure <ssid> <passphrase> [channel] [gateway]\n"
            << "  ap enable | disable | restart | status | clients | activate\n"
            << "  status\n";
    }

    std::optional<int> parse_int(const string_view text)
    {
        int value{};
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size())
        {
            return std::nullopt;
        }
        return value;
    }

    int report(const tl::expected<void, Error>& result, const string_view done)
    {
        if (!result)
        {
            std::cerr << "Error: " << result.error().message << std::endl;
            return EXIT_FAILED;
        }
        std::cout << done << std::endl;
        return EXIT_OK;
    }

    int report(const tl::expected<Outcome, Error>& result, const string_view done)
    {
        if (!result)
        {
            std::cerr << "Error: " << result.error().message << std::endl;
            return EXIT_FAILED;
        }
        std::cout << done << std::endl;
        if (result->degraded())
        {
            std::cerr << "Warning: " << result->warning << std::endl;
        }
        return EXIT_OK;
    }

    const char* yes_no(const bool value)
    {
        return value ? "yes" : "no";
    }

    void print_interfaces(const vector<Interface>& interfaces)
    {
        std::cout << std::left << std::setw(16) << "NAME" << std::setw(10) << "KIND" << std::setw(6) << "UP"
            << std::setw(6) << "LINK" << std::setw(20) << "ADDRESS" << std::setw(19) << "MAC" << "DRIVER\n";
        for (const auto& entry : interfaces)
        {
            const string address = entry.address ? *entry.address + "/" + std::to_string(entry.prefix) : "-";
            std::cout << std::left << std::setw(16) << entry.name << std::setw(10) << to_string(entry.kind)
                << std::setw(6) << yes_no(entry.admin_up) << std::setw(6) << yes_no(entry.link_up)
                << std::setw(20) << address << std::setw(19) << (entry.mac.empty() ? "-" : entry.mac)
                << (entry.driver.empty() ? "-" : entry.driver) << "\n";
        }
    }

    /**
     * @brief Every component wired to the real control planes
     */
    struct System
    {
        ProcessRunner runner;
        SteadyClock clock;
        NetlinkManager links;
        ConnectionManager connections{runner};
        ServiceManager services{runner};
        SharedConfigStore store{Config::get_dhcp_config_path()};
        DhcpService dhcp{services};
        SequencerTiming timing{SequencerTiming::from_env()};
        BootUnit boot_unit{services, Config::get_unit_dir(), timing.worst_case()};
        AccessPointController access_point{
            connections, store, dhcp, boot_unit, links, clock, AccessPointSettings::from_env()
        };
        AdapterConfigurator adapters{connections, store, dhcp};
        ReservationManager reservations{store, dhcp};
    };

    int adapter_command(System& system, const vector<string_view>& args)
    {
        if (args.empty())
        {
            print_usage();
            return EXIT_USAGE;
        }

        if (args[0] == "list" || args[0] == "usb")
        {
            auto interfaces = system.links.list_interfaces();
            if (!interfaces)
            {
                std::cerr << "Error: " << interfaces.error().message << std::endl;
                return EXIT_FAILED;
            }
            print_interfaces(args[0] == "usb" ? usb_adapters(*interfaces) : *interfaces);
            return EXIT_OK;
        }

        if (args[0] == "assign" && (args.size() == 3 || args.size() == 4))
        {
            int prefix = Config::ADAPTER_DEFAULT_PREFIX;
            if (args.size() == 4)
            {
                const auto parsed = parse_int(args[3]);
                if (!parsed)
                {
                    std::cerr << "Invalid prefix: " << args[3] << std::endl;
                    return EXIT_USAGE;
                }
                prefix = *parsed;
            }
            return report(system.adapters.assign(args[1], args[2], prefix),
                          "Adapter " + string(args[1]) + " configured.");
        }

        print_usage();
        return EXIT_USAGE;
    }

    int reservation_command(System& system, const vector<string_view>& args)
    {
        if (!args.empty() && args[0] == "add" && (args.size() == 3 || args.size() == 4))
        {
            return report(system.reservations.add(args[1], args[2], args.size() == 4 ? args[3] : string_view{}),
                          "Reservation saved.");
        }
        if (args.size() == 2 && args[0] == "remove")
        {
            return report(system.reservations.remove(args[1]), "Reservation removed.");
        }
        if (args.size() == 1 && args[0] == "list")
        {
            auto reservations = system.reservations.list();
            if (!reservations)
            {
                std::cerr << "Error: " << reservations.error().message << std::endl;
                return EXIT_FAILED;
            }
            for (const auto& reservation : *reservations)
            {
                std::cout << std::left << std::setw(19) << reservation.mac << std::setw(16) << reservation.ip
                    << (reservation.hostname.empty() ? "-" : reservation.hostname) << "\n";
            }
            return EXIT_OK;
        }

        print_usage();
        return EXIT_USAGE;
    }

    int ap_status(System& system)
    {
        auto state = system.access_point.state();
        if (!state)
        {
            std::cerr << "Error: " << state.error().message << std::endl;
            return EXIT_FAILED;
        }
        std::cout << "State:     " << state->describe() << "\n"
            << "Installed: " << yes_no(state->installed) << "\n"
            << "Enabled:   " << yes_no(state->enabled) << "\n"
            << "Active:    " << yes_no(state->active) << "\n";
        if (!state->installed)
        {
            return EXIT_OK;
        }

        auto config = system.access_point.get_config();
        if (!config)
        {
            std::cerr << "Error: " << config.error().message << std::endl;
            return EXIT_FAILED;
        }
        std::cout << "SSID:      " << config->ssid << "\n"
            << "Channel:   " << config->channel << "\n"
            << "Gateway:   " << config->address << "\n"
            << "Interface: " << system.access_point.settings().interface << std::endl;
        return EXIT_OK;
    }

    int ap_command(System& system, const vector<string_view>& args)
    {
        if (args.empty())
        {
            print_usage();
            return EXIT_USAGE;
        }
        auto& ap = system.access_point;
        const auto& verb = args[0];

        if (verb == "configure" && args.size() >= 3 && args.size() <= 5)
        {
            int channel = Config::AP_DEFAULT_CHANNEL;
            if (args.size() >= 4)
            {
                const auto parsed = parse_int(args[3]);
                if (!parsed)
                {
                    std::cerr << "Invalid channel: " << args[3] << std::endl;
                    return EXIT_USAGE;
                }
                channel = *parsed;
            }
            const string_view gateway = args.size() == 5 ? args[4] : string_view(Config::AP_DEFAULT_ADDRESS);
            return report(ap.configure(args[1], args[2], channel, gateway), "Access point configured.");
        }
        if (args.size() != 1)
        {
            print_usage();
            return EXIT_USAGE;
        }

        if (verb == "enable")
        {
            return report(ap.enable(), "Access point enabled.");
        }
        if (verb == "disable")
        {
            return report(ap.disable(), "Access point disabled.");
        }
        if (verb == "restart")
        {
            return report(ap.restart(), "Access point restarted.");
        }
        if (verb == "status")
        {
            return ap_status(system);
        }
        if (verb == "clients")
        {
            auto clients = ap.get_connected_clients();
            if (!clients)
            {
                std::cerr << "Error: " << clients.error().message << std::endl;
                return EXIT_FAILED;
            }
            for (const auto& client : *clients)
            {
                std::cout << std::left << std::setw(16) << client.ip << std::setw(19) << client.mac << client.state
                    << "\n";
            }
            return EXIT_OK;
        }
        if (verb == "activate")
        {
            BootActivationSequencer sequencer(system.connections, system.links, system.clock,
                                              ap.settings().interface, ap.settings().connection_name,
                                              system.timing);
            return report(sequencer.run(), "Access point activated.");
        }

        print_usage();
        return EXIT_USAGE;
    }

    int status_command(System& system)
    {
        const auto dnsmasq = system.dhcp.is_running();
        const auto network_manager = system.services.is_active(Config::NETWORK_MANAGER_UNIT);
        std::cout << "dnsmasq:        " << (dnsmasq ? yes_no(*dnsmasq) : "unknown") << "\n"
            << "NetworkManager: " << (network_manager ? yes_no(*network_manager) : "unknown") << "\n";

        if (auto interfaces = system.links.list_interfaces(); interfaces)
        {
            std::cout << "USB adapters:   " << usb_adapters(*interfaces).size() << "\n";
        }
        std::cout << "\nAccess point\n";
        return ap_status(system);
    }
}

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        print_usage();
        return EXIT_USAGE;
    }
    const string_view command = argv[1];
    const vector<string_view> args(argv + 2, argv + argc);

    try
    {
        System system;
        if (auto initialized = system.links.initialize(); !initialized)
        {
            std::cerr << "Failed to open netlink: " << initialized.error().message << std::endl;
            return EXIT_FAILED;
        }

        if (command == "adapter")
        {
            return adapter_command(system, args);
        }
        if (command == "reservation")
        {
            return reservation_command(system, args);
        }
        if (command == "ap")
        {
            return ap_command(system, args);
        }
        if (command == "status" && args.empty())
        {
            return status_command(system);
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return EXIT_FAILED;
    }

    print_usage();
    return EXIT_USAGE;
}
