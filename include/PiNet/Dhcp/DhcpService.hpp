#ifndef PINET_DHCP_DHCP_SERVICE_HPP
#define PINET_DHCP_DHCP_SERVICE_HPP

#include <string>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "PiNet/Config.hpp"
#include "PiNet/Util/Error.hpp"

namespace PiNet
{
    class ServiceManager;

    /**
     * @brief The system-wide dnsmasq instance that consumes the shared config
     */
    class DhcpService
    {
    public:
        explicit DhcpService(ServiceManager& services, std::string unit = Config::DHCP_SERVICE_UNIT);

        tl::expected<void, Error> reload() const;
        tl::expected<bool, Error> is_running() const;

        // Reloads if the config changed; a failed reload yields a degraded Outcome
        Outcome propagate(bool changed) const;

        const std::string& unit() const { return unit_; }

    private:
        ServiceManager& services_;
        std::string unit_;
        mutable xtr::sink s_;
    };
}

#endif //PINET_DHCP_DHCP_SERVICE_HPP
