#include "PiNet/Dhcp/DhcpScope.hpp"
#include "PiNet/Util/Address.hpp"
#include "PiNet/Config.hpp"

#include <format>

using std::string, std::string_view, std::vector, std::format;

namespace PiNet
{
    DhcpScope DhcpScope::for_address(const string_view interface, const string_view address)
    {
        const string network = Util::network_prefix(address);
        return DhcpScope{
            string(interface),
            format("{}.{}", network, Config::DHCP_RANGE_FIRST_HOST),
            format("{}.{}", network, Config::DHCP_RANGE_LAST_HOST),
            Config::DHCP_LEASE_TIME,
            string(address),
            Config::DHCP_DNS_SERVERS
        };
    }

    string DhcpScope::marker_for(const string_view interface)
    {
        return format("# {} - {}", interface, Config::ADAPTER_SCOPE_PURPOSE);
    }

    string DhcpScope::marker() const
    {
        return marker_for(interface);
    }

    vector<string> DhcpScope::body() const
    {
        return {
            format("{}={}", Config::INTERFACE_KEY, interface),
            format("dhcp-range={},{},{},{}", interface, range_start, range_end, lease),
            format("dhcp-option={},3,{}", interface, gateway),
            format("dhcp-option={},6,{}", interface, dns_servers),
        };
    }
}
