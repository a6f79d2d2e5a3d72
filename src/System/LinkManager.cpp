#include <format>
#include <filesystem>
#include <system_error>
#include <net/if.h>
#include <arpa/inet.h>

#include <netlink/cache.h>
#include <netlink/errno.h>
#include <netlink/netlink.h>
#include <netlink/socket.h>
#include <netlink/addr.h>
#include <netlink/route/link.h>
#include <netlink/route/addr.h>
#include <netlink/route/neighbour.h>
#include <linux/neighbour.h>

#include "PiNet/System/LinkManager.hpp"
#include "PiNet/Util/Logger.hpp"
#include "PiNet/Config.hpp"

using tl::unexpected, std::string, std::string_view, std::vector, std::format;

namespace
{
    std::optional<string> ipv4_of(nl_addr* addr)
    {
        if (!addr || nl_addr_get_family(addr) != AF_INET || nl_addr_get_len(addr) != sizeof(in_addr))
        {
            return std::nullopt;
        }
        char buffer[INET_ADDRSTRLEN]{};
        if (!inet_ntop(AF_INET, nl_addr_get_binary_addr(addr), buffer, sizeof(buffer)))
        {
            return std::nullopt;
        }
        return string(buffer);
    }

    string hardware_address_of(nl_addr* addr)
    {
        if (!addr)
        {
            return {};
        }
        char buffer[64]{};
        nl_addr2str(addr, buffer, sizeof(buffer));
        return string(buffer);
    }

    string driver_of(const string& name)
    {
        std::error_code ec;
        const auto target = std::filesystem::read_symlink(
            std::filesystem::path("/sys/class/net") / name / "device" / "driver", ec);
        return ec ? string() : target.filename().string();
    }

    bool is_wireless(const string& name)
    {
        std::error_code ec;
        const auto base = std::filesystem::path("/sys/class/net") / name;
        return std::filesystem::exists(base / "wireless", ec) || std::filesystem::exists(base / "phy80211", ec);
    }
}

namespace PiNet
{
    const char* to_string(const InterfaceKind kind)
    {
        switch (kind)
        {
            case InterfaceKind::Wireless:
                return "wireless";
            case InterfaceKind::Loopback:
                return "loopback";
            case InterfaceKind::Wired:
            default:
                return "wired";
        }
    }

    NetlinkManager::NetlinkManager()
    {
        s_ = logger().get_sink("PiNet Netlink");
    }

    NetlinkManager::~NetlinkManager()
    {
        cleanup();
    }

    tl::expected<void, Error> NetlinkManager::initialize()
    {
        nl_socket_ = nl_socket_alloc();
        if (!nl_socket_)
        {
            XTR_LOGL(error, s_, "Failed to allocate netlink socket");
            return unexpected(Error{ErrorCode::NlSocketAllocError, "Failed to allocate netlink socket"});
        }

        if (const int err = nl_connect(nl_socket_, NETLINK_ROUTE); err < 0)
        {
            XTR_LOGL(error, s_, "Failed to connect to netlink: {}", nl_geterror(err));
            nl_socket_free(nl_socket_);
            nl_socket_ = nullptr;
            return unexpected(Error{
                ErrorCode::NlConnectError, format("Failed to connect to netlink: {}", nl_geterror(err))
            });
        }

        if (const int err = rtnl_link_alloc_cache(nl_socket_, AF_UNSPEC, &link_cache_); err < 0)
        {
            XTR_LOGL(error, s_, "Failed to allocate link cache: {}", nl_geterror(err));
            nl_socket_free(nl_socket_);
            nl_socket_ = nullptr;
            return unexpected(Error{
                ErrorCode::NlCacheAllocError, format("Failed to allocate link cache: {}", nl_geterror(err))
            });
        }

        return {};
    }

    void NetlinkManager::cleanup()
    {
        if (link_cache_)
        {
            nl_cache_free(link_cache_);
            link_cache_ = nullptr;
        }
        if (nl_socket_)
        {
            nl_socket_free(nl_socket_);
            nl_socket_ = nullptr;
        }
    }

    tl::expected<void, Error> NetlinkManager::refresh()
    {
        if (!nl_socket_ || !link_cache_)
        {
            return unexpected(Error{ErrorCode::NetlinkSocketNotInitialized, "Netlink socket not initialized"});
        }
        // Refresh cache to get latest state
        if (const int err = nl_cache_refill(nl_socket_, link_cache_); err < 0)
        {
            return unexpected(Error{
                ErrorCode::NlCacheAllocError, format("Failed to refresh link cache: {}", nl_geterror(err))
            });
        }
        return {};
    }

    tl::expected<bool, Error> NetlinkManager::exists(const string_view interface_name)
    {
        if (auto refreshed = refresh(); !refreshed)
        {
            return unexpected(refreshed.error());
        }

        rtnl_link* link = rtnl_link_get_by_name(link_cache_, string(interface_name).c_str());
        const bool exists = (link != nullptr);

        if (link)
        {
            rtnl_link_put(link);
        }

        return exists;
    }

    tl::expected<bool, Error> NetlinkManager::is_up(const string_view interface_name)
    {
        if (auto refreshed = refresh(); !refreshed)
        {
            return unexpected(refreshed.error());
        }

        rtnl_link* link = rtnl_link_get_by_name(link_cache_, string(interface_name).c_str());
        if (!link)
        {
            return unexpected(Error{
                ErrorCode::NetlinkInterfaceNotFound, format("Interface {} not found", interface_name)
            });
        }

        const bool is_up = (rtnl_link_get_flags(link) & IFF_UP) != 0;
        rtnl_link_put(link);
        return is_up;
    }

    tl::expected<vector<Interface>, Error> NetlinkManager::list_interfaces()
    {
        if (auto refreshed = refresh(); !refreshed)
        {
            return unexpected(refreshed.error());
        }

        nl_cache* addr_cache = nullptr;
        if (const int err = rtnl_addr_alloc_cache(nl_socket_, &addr_cache); err < 0)
        {
            return unexpected(Error{
                ErrorCode::NlCacheAllocError, format("Failed to allocate address cache: {}", nl_geterror(err))
            });
        }

        vector<Interface> interfaces;
        for (nl_object* obj = nl_cache_get_first(link_cache_); obj; obj = nl_cache_get_next(obj))
        {
            auto* link = reinterpret_cast<rtnl_link*>(obj);
            const char* name = rtnl_link_get_name(link);
            if (!name)
            {
                continue;
            }
            Interface entry;
            entry.name = name;

            const unsigned int flags = rtnl_link_get_flags(link);
            entry.admin_up = (flags & IFF_UP) != 0;
            entry.link_up = rtnl_link_get_carrier(link) != 0;
            if (flags & IFF_LOOPBACK)
            {
                entry.kind = InterfaceKind::Loopback;
            }
            else if (is_wireless(entry.name))
            {
                entry.kind = InterfaceKind::Wireless;
            }
            entry.mac = hardware_address_of(rtnl_link_get_addr(link));
            entry.driver = driver_of(entry.name);

            const int ifindex = rtnl_link_get_ifindex(link);
            for (nl_object* addr_obj = nl_cache_get_first(addr_cache); addr_obj;
                 addr_obj = nl_cache_get_next(addr_obj))
            {
                auto* addr = reinterpret_cast<rtnl_addr*>(addr_obj);
                if (rtnl_addr_get_ifindex(addr) != ifindex || rtnl_addr_get_family(addr) != AF_INET)
                {
                    continue;
                }
                if (auto ip = ipv4_of(rtnl_addr_get_local(addr)))
                {
                    entry.address = std::move(ip);
                    entry.prefix = rtnl_addr_get_prefixlen(addr);
                    break;
                }
            }

            interfaces.push_back(std::move(entry));
        }

        nl_cache_free(addr_cache);
        return interfaces;
    }

    tl::expected<vector<Neighbour>, Error> NetlinkManager::neighbours(const string_view interface_name)
    {
        if (auto refreshed = refresh(); !refreshed)
        {
            return unexpected(refreshed.error());
        }

        const int ifindex = rtnl_link_name2i(link_cache_, string(interface_name).c_str());
        if (ifindex == 0)
        {
            return unexpected(Error{
                ErrorCode::NetlinkInterfaceNotFound, format("Interface {} not found", interface_name)
            });
        }

        nl_cache* neigh_cache = nullptr;
        if (const int err = rtnl_neigh_alloc_cache(nl_socket_, &neigh_cache); err < 0)
        {
            return unexpected(Error{
                ErrorCode::NlCacheAllocError, format("Failed to allocate neighbour cache: {}", nl_geterror(err))
            });
        }

        vector<Neighbour> result;
        for (nl_object* obj = nl_cache_get_first(neigh_cache); obj; obj = nl_cache_get_next(obj))
        {
            auto* neigh = reinterpret_cast<rtnl_neigh*>(obj);
            if (rtnl_neigh_get_ifindex(neigh) != ifindex)
            {
                continue;
            }

            const int state = rtnl_neigh_get_state(neigh);
            const char* state_name = nullptr;
            if (state & NUD_REACHABLE)
            {
                state_name = "REACHABLE";
            }
            else if (state & NUD_STALE)
            {
                state_name = "STALE";
            }
            if (!state_name)
            {
                continue;
            }

            auto ip = ipv4_of(rtnl_neigh_get_dst(neigh));
            if (!ip)
            {
                continue;
            }
            result.push_back(Neighbour{*ip, hardware_address_of(rtnl_neigh_get_lladdr(neigh)), state_name});
        }

        nl_cache_free(neigh_cache);
        return result;
    }

    vector<Interface> usb_adapters(const vector<Interface>& interfaces)
    {
        vector<Interface> adapters;
        for (const auto& entry : interfaces)
        {
            if (entry.kind != InterfaceKind::Wired || entry.name == Config::BUILTIN_WIRED_INTERFACE)
            {
                continue;
            }
            if (entry.name.starts_with("eth") || entry.name.starts_with("usb"))
            {
                adapters.push_back(entry);
            }
        }
        return adapters;
    }
}
