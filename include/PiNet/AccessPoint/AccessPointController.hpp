#ifndef PINET_ACCESS_POINT_ACCESS_POINT_CONTROLLER_HPP
#define PINET_ACCESS_POINT_ACCESS_POINT_CONTROLLER_HPP

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "PiNet/Config.hpp"
#include "PiNet/Core/StatusCache.hpp"
#include "PiNet/System/LinkManager.hpp"
#include "PiNet/Util/Clock.hpp"
#include "PiNet/Util/Error.hpp"

namespace PiNet
{
    class BootUnit;
    class ConnectionManager;
    class DhcpService;
    class ServiceManager;
    class SharedConfigStore;

    struct AccessPointSettings
    {
        std::string connection_name{Config::AP_CONNECTION_NAME};
        std::string interface{Config::WIRELESS_INTERFACE};
        int readiness_attempts{Config::ENABLE_READINESS_ATTEMPTS};
        Clock::duration readiness_interval{Config::ENABLE_READINESS_INTERVAL};
        Clock::duration restart_settle{Config::RESTART_SETTLE_DELAY};
        Clock::duration cache_ttl{Config::STATUS_CACHE_TTL};

        // PINET_AP_CONNECTION and PINET_AP_INTERFACE
        static AccessPointSettings from_env();
    };

    struct AccessPointConfig
    {
        std::string ssid{Config::AP_DEFAULT_SSID};
        std::string passphrase;
        int channel{Config::AP_DEFAULT_CHANNEL};
        std::string address{Config::AP_DEFAULT_ADDRESS};
    };

    /**
     * @brief installed / enabled / active are independent; every combination is legal
     */
    struct AccessPointState
    {
        bool installed{false};
        bool enabled{false};
        bool active{false};

        // "absent", "inactive" or "active"
        const char* describe() const;
    };

    /**
     * @brief State machine over the NetworkManager access-point profile
     *
     * The profile runs in "shared" mode, so NetworkManager's own dnsmasq
     * serves the wireless clients. The system dnsmasq is kept off the
     * wireless interface through bind-dynamic and except-interface.
     *
     * Boot activation goes through BootUnit rather than NetworkManager
     * autoconnect, which fires before the radio firmware is ready.
     *
     * Status reads go through a StatusCache that every mutation clears.
     */
    class AccessPointController
    {
    public:
        AccessPointController(const ConnectionManager& connections, const SharedConfigStore& store,
                              const DhcpService& dhcp, const BootUnit& boot_unit, LinkControl& links, Clock& clock,
                              AccessPointSettings settings = {});

        // Rejects invalid input before any external call
        static tl::expected<void, Error> validate(const AccessPointConfig& config);

        tl::expected<void, Error> configure(std::string_view ssid, std::string_view passphrase, int channel,
                                            std::string_view address);
        tl::expected<Outcome, Error> enable();
        tl::expected<void, Error> disable();
        tl::expected<void, Error> restart();

        tl::expected<AccessPointConfig, Error> get_config();
        tl::expected<std::vector<Neighbour>, Error> get_connected_clients();

        tl::expected<bool, Error> is_installed();
        tl::expected<bool, Error> is_enabled();
        tl::expected<bool, Error> is_active();
        tl::expected<AccessPointState, Error> state();

        // bind-dynamic and except-interface=<wlan> once each, no interface=<wlan>
        tl::expected<Outcome, Error> reconcile_dhcp_conflicts();

        const AccessPointSettings& settings() const { return settings_; }

    private:
        tl::expected<void, Error> wait_until_connectable();
        AccessPointConfig last_known_good() const;

        const ConnectionManager& connections_;
        const SharedConfigStore& store_;
        const DhcpService& dhcp_;
        const BootUnit& boot_unit_;
        LinkControl& links_;
        Clock& clock_;
        AccessPointSettings settings_;
        StatusCache<bool> cache_;

        mutable std::mutex config_mutex_;
        AccessPointConfig last_known_good_;

        xtr::sink s_;
    };
}

#endif //PINET_ACCESS_POINT_ACCESS_POINT_CONTROLLER_HPP
