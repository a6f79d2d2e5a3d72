#include "PiNet/Dhcp/DhcpService.hpp"
#include "PiNet/System/ServiceManager.hpp"
#include "PiNet/Util/Logger.hpp"

#include <format>

namespace PiNet
{
    DhcpService::DhcpService(ServiceManager& services, std::string unit)
        : services_(services), unit_(std::move(unit))
    {
        s_ = logger().get_sink("PiNet dnsmasq");
    }

    tl::expected<void, Error> DhcpService::reload() const
    {
        // dnsmasq rereads its config file only on restart
        return services_.restart(unit_);
    }

    tl::expected<bool, Error> DhcpService::is_running() const
    {
        return services_.is_active(unit_);
    }

    Outcome DhcpService::propagate(const bool changed) const
    {
        if (!changed)
        {
            return Outcome::applied();
        }
        if (auto reloaded = reload(); !reloaded)
        {
            XTR_LOGL(warning, s_, "Configuration saved but {} was not reloaded: {}", unit_,
                     reloaded.error().message);
            return Outcome::degraded_with(
                std::format("Configuration saved but {} was not reloaded: {}", unit_, reloaded.error().message));
        }
        return Outcome::applied();
    }
}
