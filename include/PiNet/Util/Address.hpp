#ifndef PINET_ADDRESS_HPP
#define PINET_ADDRESS_HPP

#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include "PiNet/Util/Error.hpp"

namespace PiNet::Util
{
    // Dotted-quad IPv4 only; no shorthand forms
    bool is_ipv4(std::string_view address);

    // Lowercase, colon-separated, six octets
    tl::expected<std::string, Error> normalize_mac(std::string_view mac);

    bool is_interface_name(std::string_view name);

    bool is_hostname(std::string_view hostname);

    // "10.0.0.1" -> "10.0.0"
    std::string network_prefix(std::string_view address);

    tl::expected<void, Error> validate_ipv4(std::string_view address);
    tl::expected<void, Error> validate_prefix(int prefix);
    tl::expected<void, Error> validate_interface_name(std::string_view name);
}

#endif //PINET_ADDRESS_HPP
