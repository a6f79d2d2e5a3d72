#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "PiNet/System/LinkManager.hpp"
#include "Support/FakeSystem.hpp"

using PiNet::Interface;
using PiNet::InterfaceKind;
using PiNet::NetlinkManager;
using PiNet::Testing::check;

namespace
{
    Interface make(std::string name, const InterfaceKind kind)
    {
        Interface entry;
        entry.name = std::move(name);
        entry.kind = kind;
        return entry;
    }
}

int main()
{
    int result_code = EXIT_SUCCESS;
    std::cout << "--- PiNet Netlink Test ---" << std::endl;
    std::cout << "INFO: Read-only queries against the loopback interface, no privileges needed." << std::endl;

    // --- Test 1: Queries before initialize() ---
    std::cout << "\nTEST 1: Uninitialized manager..." << std::endl;
    {
        NetlinkManager idle;
        const auto exists = idle.exists("lo");
        check(!exists && exists.error().code == PiNet::ErrorCode::NetlinkSocketNotInitialized,
              "query without a socket is an error", result_code);
    }

    NetlinkManager netlink;
    if (auto ready = netlink.initialize(); !ready)
    {
        std::cerr << "FAIL: " << ready.error().message << std::endl;
        return EXIT_FAILURE;
    }

    // --- Test 2: Existence ---
    std::cout << "\nTEST 2: exists()..." << std::endl;
    const auto lo = netlink.exists("lo");
    check(lo && *lo, "lo exists", result_code);
    const auto missing = netlink.exists("pinet_missing0");
    check(missing && !*missing, "unknown interface does not exist", result_code);
    const auto up = netlink.is_up("pinet_missing0");
    check(!up && up.error().code == PiNet::ErrorCode::NetlinkInterfaceNotFound, "is_up on unknown interface fails",
          result_code);

    // --- Test 3: Interface listing ---
    std::cout << "\nTEST 3: list_interfaces()..." << std::endl;
    const auto interfaces = netlink.list_interfaces();
    check(interfaces.has_value(), "interfaces listed", result_code);
    if (interfaces)
    {
        const auto it = std::ranges::find_if(*interfaces, [](const Interface& e) { return e.name == "lo"; });
        check(it != interfaces->end(), "lo listed", result_code);
        if (it != interfaces->end())
        {
            check(it->kind == InterfaceKind::Loopback, "lo classified as loopback", result_code);
            check(!it->address || *it->address == "127.0.0.1", "lo address is 127.0.0.1 when assigned",
                  result_code);
        }
        check(std::ranges::none_of(PiNet::usb_adapters(*interfaces), [](const Interface& e) { return e.name == "lo"; }),
              "loopback is never a USB adapter", result_code);
    }

    // --- Test 4: Neighbour table ---
    std::cout << "\nTEST 4: neighbours()..." << std::endl;
    check(netlink.neighbours("lo").has_value(), "neighbour query on lo succeeds", result_code);
    const auto unknown = netlink.neighbours("pinet_missing0");
    check(!unknown && unknown.error().code == PiNet::ErrorCode::NetlinkInterfaceNotFound,
          "neighbour query on unknown interface fails", result_code);

    // --- Test 5: USB adapter filter ---
    std::cout << "\nTEST 5: usb_adapters()..." << std::endl;
    const std::vector<Interface> synthetic{
        make("lo", InterfaceKind::Loopback),
        make("eth0", InterfaceKind::Wired),
        make("eth1", InterfaceKind::Wired),
        make("usb0", InterfaceKind::Wired),
        make("wlan0", InterfaceKind::Wireless),
        make("docker0", InterfaceKind::Wired),
    };
    const auto adapters = PiNet::usb_adapters(synthetic);
    check(adapters.size() == 2 && adapters[0].name == "eth1" && adapters[1].name == "usb0",
          "eth1 and usb0 only; built-in eth0 excluded", result_code);

    netlink.cleanup();
    const auto after = netlink.exists("lo");
    check(!after, "queries fail after cleanup()", result_code);

    std::cout << "\n--- Netlink Test Finished ---" << std::endl;
    return result_code;
}
