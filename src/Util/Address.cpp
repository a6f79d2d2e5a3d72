#include "PiNet/Util/Address.hpp"
#include "PiNet/Util/Strings.hpp"

#include <arpa/inet.h>
#include <net/if.h>

#include <format>

using tl::unexpected, std::string_view;

namespace PiNet::Util
{
    bool is_ipv4(const string_view address)
    {
        if (address.empty() || address.size() > 15)
        {
            return false;
        }
        in_addr parsed{};
        return inet_pton(AF_INET, std::string(address).c_str(), &parsed) == 1;
    }

    tl::expected<std::string, Error> normalize_mac(const string_view mac)
    {
        std::string lowered = to_lower(trim(mac));
        bool valid = lowered.size() == 17;
        for (std::size_t i = 0; valid && i < lowered.size(); ++i)
        {
            const char c = lowered[i];
            if (i % 3 == 2)
            {
                valid = c == ':';
            }
            else
            {
                valid = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
            }
        }
        if (!valid)
        {
            return unexpected(Error{ErrorCode::InvalidMacAddress, std::format("Invalid MAC address: '{}'", mac)});
        }
        return lowered;
    }

    bool is_interface_name(const string_view name)
    {
        if (name.empty() || name.size() >= IFNAMSIZ || name == "." || name == "..")
        {
            return false;
        }
        for (const char c : name)
        {
            if (c == '/' || c == ':' || c == ' ' || c == '\t' || c == '\n')
            {
                return false;
            }
        }
        return true;
    }

    bool is_hostname(const string_view hostname)
    {
        if (hostname.empty() || hostname.size() > 63 || hostname.front() == '-')
        {
            return false;
        }
        for (const char c : hostname)
        {
            const bool alnum = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
            if (!alnum && c != '-' && c != '.' && c != '_')
            {
                return false;
            }
        }
        return true;
    }

    std::string network_prefix(const string_view address)
    {
        const auto last_dot = address.rfind('.');
        return std::string(address.substr(0, last_dot));
    }

    tl::expected<void, Error> validate_ipv4(const string_view address)
    {
        if (!is_ipv4(address))
        {
            return unexpected(Error{ErrorCode::InvalidAddress, std::format("Invalid IPv4 address: '{}'", address)});
        }
        return {};
    }

    tl::expected<void, Error> validate_prefix(const int prefix)
    {
        if (prefix < 1 || prefix > 32)
        {
            return unexpected(Error{ErrorCode::InvalidPrefix, std::format("Invalid prefix length: {}", prefix)});
        }
        return {};
    }

    tl::expected<void, Error> validate_interface_name(const string_view name)
    {
        if (!is_interface_name(name))
        {
            return unexpected(Error{
                ErrorCode::InvalidInterfaceName, std::format("Invalid interface name: '{}'", name)
            });
        }
        return {};
    }
}
