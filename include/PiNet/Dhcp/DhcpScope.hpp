#ifndef PINET_DHCP_DHCP_SCOPE_HPP
#define PINET_DHCP_DHCP_SCOPE_HPP

#include <string>
#include <string_view>
#include <vector>

namespace PiNet
{
    /**
     * @brief Per-interface dnsmasq scope, stored as a marker block
     *
     *   # eth1 - USB Ethernet Adapter
     *   interface=eth1
     *   dhcp-range=eth1,192.168.7.10,192.168.7.50,24h
     *   dhcp-option=eth1,3,192.168.7.1
     *   dhcp-option=eth1,6,8.8.8.8,8.8.4.4
     */
    struct DhcpScope
    {
        std::string interface;
        std::string range_start;
        std::string range_end;
        std::string lease;
        std::string gateway;
        std::string dns_servers;

        // Range .10-.50 within the /24 of the gateway address
        static DhcpScope for_address(std::string_view interface, std::string_view address);
        static std::string marker_for(std::string_view interface);

        std::string marker() const;
        std::vector<std::string> body() const;
    };
}

#endif //PINET_DHCP_DHCP_SCOPE_HPP
