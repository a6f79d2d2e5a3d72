#ifndef PINET_SYSTEM_CONNECTION_MANAGER_HPP
#define PINET_SYSTEM_CONNECTION_MANAGER_HPP

#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "PiNet/Util/Error.hpp"

namespace PiNet
{
    class CommandRunner;

    /**
     * @brief Fields of a NetworkManager wifi profile in access-point mode
     */
    struct AccessPointProfile
    {
        std::string name;
        std::string interface;
        std::string ssid;
        std::string passphrase;
        int channel{};
        std::string address;
        int prefix{24};
    };

    /**
     * @brief NetworkManager control plane (nmcli) plus the rfkill radio switch
     */
    class ConnectionManager
    {
    public:
        explicit ConnectionManager(CommandRunner& runner);

        tl::expected<bool, Error> exists(std::string_view name) const;
        tl::expected<void, Error> add_access_point(const AccessPointProfile& profile) const;
        tl::expected<void, Error> add_static_ethernet(std::string_view name, std::string_view interface,
                                                      std::string_view address, int prefix) const;
        tl::expected<void, Error> set_static_address(std::string_view name, std::string_view address,
                                                     int prefix) const;
        tl::expected<void, Error> set_autoconnect(std::string_view name, bool enabled) const;
        tl::expected<void, Error> up(std::string_view name) const;
        tl::expected<void, Error> down(std::string_view name) const;
        tl::expected<void, Error> remove(std::string_view name) const;

        // Single profile field in terse form, e.g. "802-11-wireless.ssid"
        tl::expected<std::string, Error> field(std::string_view name, std::string_view field_name) const;
        tl::expected<std::vector<std::string>, Error> active_connections() const;
        tl::expected<bool, Error> is_active(std::string_view name) const;

        // NetworkManager device state ("unavailable", "disconnected", "connected", ...)
        tl::expected<std::string, Error> device_state(std::string_view interface) const;
        tl::expected<void, Error> general_status() const;

        tl::expected<void, Error> radio_wifi_on() const;
        tl::expected<void, Error> unblock_wifi() const;

    private:
        CommandRunner& runner_;
        mutable xtr::sink s_;
    };

    // Splits one terse nmcli line on unescaped ':' and decodes "\:" and "\\"
    std::vector<std::string> split_terse(std::string_view line);
}

#endif //PINET_SYSTEM_CONNECTION_MANAGER_HPP
