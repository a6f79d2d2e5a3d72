#include <iostream>
#include <string>

#include "PiNet/Config.hpp"
#include "PiNet/Dhcp/ConfigDocument.hpp"
#include "PiNet/Dhcp/DhcpService.hpp"
#include "PiNet/Dhcp/Reservation.hpp"
#include "PiNet/Dhcp/SharedConfigStore.hpp"
#include "PiNet/System/ServiceManager.hpp"
#include "Support/FakeSystem.hpp"

using PiNet::DhcpReservation;
using PiNet::Testing::check;
using PiNet::Testing::read_file;
using PiNet::Testing::write_file;

namespace
{
    std::size_t count_reservations(const std::string& text, const std::string& mac)
    {
        std::size_t n = 0;
        for (const auto& line : PiNet::Util::lines(text))
        {
            if (line.starts_with("dhcp-host=" + mac))
            {
                ++n;
            }
        }
        return n;
    }
}

int main()
{
    int result_code = EXIT_SUCCESS;
    std::cout << "--- PiNet Reservation Test ---" << std::endl;

    // --- Test 1: Line format and parsing ---
    std::cout << "\nTEST 1: Parsing reservation lines..." << std::endl;
    const auto plain = DhcpReservation::parse("dhcp-host=AA:BB:CC:DD:EE:FF,10.0.0.10");
    check(plain && plain->mac == "aa:bb:cc:dd:ee:ff" && plain->ip == "10.0.0.10" && plain->hostname.empty(),
          "mac,ip parsed and MAC lowercased", result_code);
    const auto named = DhcpReservation::parse("dhcp-host=aa:bb:cc:dd:ee:ff,wled-kitchen,10.0.0.11");
    check(named && named->hostname == "wled-kitchen" && named->ip == "10.0.0.11", "mac,hostname,ip parsed",
          result_code);
    check(named && named->to_line() == "dhcp-host=aa:bb:cc:dd:ee:ff,wled-kitchen,10.0.0.11",
          "formatted back to the same line", result_code);

    const auto extra = DhcpReservation::parse("dhcp-host=aa:bb:cc:dd:ee:ff,a,b,10.0.0.12");
    check(!extra && extra.error().code == PiNet::ErrorCode::MalformedReservation, "four fields are malformed",
          result_code);
    const auto swapped = DhcpReservation::parse("dhcp-host=aa:bb:cc:dd:ee:ff,10.0.0.12,host");
    check(!swapped && swapped.error().code == PiNet::ErrorCode::MalformedReservation,
          "address must be the last field", result_code);
    check(!DhcpReservation::parse("dhcp-host=aa:bb:cc:dd:ee:ff").has_value(), "single field is malformed",
          result_code);

    // --- Test 2: Validation happens before any write ---
    std::cout << "\nTEST 2: Validation..." << std::endl;
    PiNet::Testing::TempDir dir;
    if (!dir.valid())
    {
        std::cerr << "FAIL: could not create a temporary directory" << std::endl;
        return EXIT_FAILURE;
    }
    const std::string path = dir.file("dnsmasq.conf");
    write_file(path, "domain-needed\n");

    PiNet::Testing::FakeCommandRunner runner;
    PiNet::ServiceManager services(runner);
    PiNet::DhcpService dhcp(services);
    PiNet::SharedConfigStore store(path);
    PiNet::ReservationManager reservations(store, dhcp);

    const auto bad_mac = reservations.add("aa:bb:cc:dd:ee", "10.0.0.10");
    const auto bad_ip = reservations.add("aa:bb:cc:dd:ee:ff", "10.0.0.300");
    check(!bad_mac && bad_mac.error().category() == PiNet::ErrorCategory::Validation, "bad MAC rejected",
          result_code);
    check(!bad_ip && bad_ip.error().code == PiNet::ErrorCode::InvalidAddress, "bad IP rejected", result_code);
    check(read_file(path) == "domain-needed\n" && runner.calls.empty(), "nothing written, nothing reloaded",
          result_code);

    // --- Test 3: Key-based replace ---
    std::cout << "\nTEST 3: Re-adding a MAC replaces its address..." << std::endl;
    const auto first = reservations.add("aa:bb:cc:dd:ee:ff", "10.0.0.10");
    const auto second = reservations.add("AA:BB:CC:DD:EE:FF", "10.0.0.20");
    check(first && second && !second->degraded(), "both adds succeed", result_code);
    const auto text = read_file(path);
    check(count_reservations(text, "aa:bb:cc:dd:ee:ff") == 1, "exactly one line for the MAC", result_code);
    check(text.find("dhcp-host=aa:bb:cc:dd:ee:ff,10.0.0.20") != std::string::npos, "line carries the new address",
          result_code);
    check(text.find("10.0.0.10") == std::string::npos, "old address gone", result_code);
    check(text.find("# DHCP Reservations\n") != std::string::npos, "section header written", result_code);
    check(runner.restarts[PiNet::Config::DHCP_SERVICE_UNIT] == 2, "dnsmasq restarted once per change",
          result_code);

    // --- Test 4: Same reservation again is a no-op ---
    std::cout << "\nTEST 4: Identical add..." << std::endl;
    const auto same = reservations.add("aa:bb:cc:dd:ee:ff", "10.0.0.20");
    check(same && read_file(path) == text, "file unchanged", result_code);
    check(runner.restarts[PiNet::Config::DHCP_SERVICE_UNIT] == 2, "no reload for an unchanged file", result_code);

    // --- Test 5: Reservations stay grouped under the section header ---
    std::cout << "\nTEST 5: Section grouping..." << std::endl;
    (void)reservations.add("11:22:33:44:55:66", "10.0.0.30", "printer");
    write_file(path, read_file(path) + "\n# something else\nport=53\n");
    (void)reservations.add("11:22:33:44:55:77", "10.0.0.31");
    const auto grouped = read_file(path);
    check(grouped.find("dhcp-host=11:22:33:44:55:77,10.0.0.31") < grouped.find("# something else"),
          "new line inserted into the existing section", result_code);

    // --- Test 6: list and remove ---
    std::cout << "\nTEST 6: list and remove..." << std::endl;
    write_file(path, read_file(path) + "dhcp-host=broken\n");
    const auto listed = reservations.list();
    check(listed && listed->size() == 3, "three valid reservations listed, malformed line skipped", result_code);

    const auto removed = reservations.remove("11:22:33:44:55:66");
    check(removed && read_file(path).find("11:22:33:44:55:66") == std::string::npos, "reservation removed",
          result_code);
    const auto after = reservations.list();
    check(after && after->size() == 2, "two reservations remain", result_code);

    // --- Test 7: Reload failure is degraded success ---
    std::cout << "\nTEST 7: Degraded reload..." << std::endl;
    runner.fail_when("restart dnsmasq.service");
    const auto degraded = reservations.add("aa:bb:cc:dd:ee:01", "10.0.0.40");
    check(degraded && degraded->degraded(), "saved but not reloaded", result_code);
    check(read_file(path).find("aa:bb:cc:dd:ee:01") != std::string::npos, "reservation still saved", result_code);

    // --- Test 8: Section header from earlier releases ---
    std::cout << "\nTEST 8: Legacy section header..." << std::endl;
    {
        const std::string legacy_path = dir.file("legacy-dnsmasq.conf");
        write_file(legacy_path, "domain-needed\n\n# WLED Reservations\ndhcp-host=aa:bb:cc:00:00:01,10.0.1.5\n");
        PiNet::Testing::FakeCommandRunner legacy_runner;
        PiNet::ServiceManager legacy_services(legacy_runner);
        PiNet::DhcpService legacy_dhcp(legacy_services);
        PiNet::SharedConfigStore legacy_store(legacy_path);
        PiNet::ReservationManager legacy(legacy_store, legacy_dhcp);

        check(legacy.add("aa:bb:cc:00:00:02", "10.0.1.6").has_value(), "reservation added", result_code);
        (void)legacy_store.update([](PiNet::ConfigDocument& document)
        {
            document.ensure_singleton(PiNet::Config::BIND_DYNAMIC_DIRECTIVE);
        });
        check(legacy.add("aa:bb:cc:00:00:03", "10.0.1.7").has_value(), "second reservation added", result_code);

        const auto legacy_text = read_file(legacy_path);
        check(legacy_text.find(PiNet::Config::RESERVATION_SECTION_MARKER) == std::string::npos,
              "no second section created", result_code);
        const auto section = PiNet::ConfigDocument::parse(legacy_text).block(
            PiNet::Config::LEGACY_RESERVATION_SECTION_MARKER);
        check(section.size() == 3 && section[1] == "dhcp-host=aa:bb:cc:00:00:02,10.0.1.6" &&
              section[2] == "dhcp-host=aa:bb:cc:00:00:03,10.0.1.7", "reservations joined the existing section",
              result_code);
        check(legacy_text.rfind("bind-dynamic\n") == legacy_text.size() - std::string("bind-dynamic\n").size(),
              "bind-dynamic stays outside the section", result_code);
    }

    std::cout << "\n--- Reservation Test Finished ---" << std::endl;
    return result_code;
}
