#ifndef PINET_SYSTEM_LINK_MANAGER_HPP
#define PINET_SYSTEM_LINK_MANAGER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "PiNet/Util/Error.hpp"

struct nl_sock;
struct nl_cache;

namespace PiNet
{
    enum class InterfaceKind
    {
        Wired,
        Wireless,
        Loopback
    };

    const char* to_string(InterfaceKind kind);

    struct Interface
    {
        std::string name;
        InterfaceKind kind{InterfaceKind::Wired};
        bool admin_up{false};
        bool link_up{false};
        std::optional<std::string> address;
        int prefix{0};
        std::string mac;
        std::string driver;
    };

    /**
     * @brief Neighbour-table entry, as reported for AP clients
     */
    struct Neighbour
    {
        std::string ip;
        std::string mac;
        std::string state;
    };

    /**
     * @brief Address/link control plane
     */
    class LinkControl
    {
    public:
        virtual ~LinkControl() = default;

        virtual tl::expected<bool, Error> exists(std::string_view interface_name) = 0;
        virtual tl::expected<std::vector<Interface>, Error> list_interfaces() = 0;
        // Entries in REACHABLE or STALE state only
        virtual tl::expected<std::vector<Neighbour>, Error> neighbours(std::string_view interface_name) = 0;
    };

    /**
     * @brief libnl route-netlink implementation of LinkControl
     *
     * Holds one netlink socket and a link cache, refilled on every query so
     * readiness polls always observe the current kernel state.
     */
    class NetlinkManager final : public LinkControl
    {
    private:
        nl_sock* nl_socket_{nullptr};
        nl_cache* link_cache_{nullptr};
        xtr::sink s_;

        tl::expected<void, Error> refresh();

    public:
        NetlinkManager();
        ~NetlinkManager() override;

        tl::expected<void, Error> initialize();
        void cleanup();

        tl::expected<bool, Error> exists(std::string_view interface_name) override;
        tl::expected<bool, Error> is_up(std::string_view interface_name);
        tl::expected<std::vector<Interface>, Error> list_interfaces() override;
        tl::expected<std::vector<Neighbour>, Error> neighbours(std::string_view interface_name) override;

        // Non-copyable and non-movable
        NetlinkManager(const NetlinkManager&) = delete;
        NetlinkManager& operator=(const NetlinkManager&) = delete;
        NetlinkManager(NetlinkManager&&) = delete;
        NetlinkManager& operator=(NetlinkManager&&) = delete;
    };

    // eth*/usb* interfaces other than the built-in wired port
    std::vector<Interface> usb_adapters(const std::vector<Interface>& interfaces);
}

#endif //PINET_SYSTEM_LINK_MANAGER_HPP
