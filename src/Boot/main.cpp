#include <iostream>

#include "PiNet/AccessPoint/BootActivationSequencer.hpp"
#include "PiNet/System/CommandRunner.hpp"
#include "PiNet/System/ConnectionManager.hpp"
#include "PiNet/System/LinkManager.hpp"
#include "PiNet/Config.hpp"

// Run by pinet-wifi-ap.service once at boot
int main()
{
    try
    {
        PiNet::ProcessRunner runner;
        PiNet::ConnectionManager connections(runner);
        PiNet::SteadyClock clock;

        PiNet::NetlinkManager links;
        if (auto initialized = links.initialize(); !initialized)
        {
            std::cerr << "Failed to open netlink: " << initialized.error().message << std::endl;
            return 1;
        }

        PiNet::BootActivationSequencer sequencer(connections, links, clock,
                                                 PiNet::Config::get_wireless_interface(),
                                                 PiNet::Config::get_ap_connection_name(),
                                                 PiNet::SequencerTiming::from_env());
        if (auto activated = sequencer.run(); !activated)
        {
            std::cerr << "Access point activation failed: " << activated.error().message << std::endl;
            return 1;
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Access point activated." << std::endl;
    return 0;
}
