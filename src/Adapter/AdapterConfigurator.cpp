#include "PiNet/Adapter/AdapterConfigurator.hpp"
#include "PiNet/Dhcp/ConfigDocument.hpp"
#include "PiNet/Dhcp/DhcpScope.hpp"
#include "PiNet/Dhcp/DhcpService.hpp"
#include "PiNet/Dhcp/SharedConfigStore.hpp"
#include "PiNet/System/ConnectionManager.hpp"
#include "PiNet/Util/Address.hpp"
#include "PiNet/Util/Logger.hpp"

#include <format>

using tl::unexpected, std::string, std::string_view, std::format;

namespace PiNet
{
    AdapterConfigurator::AdapterConfigurator(const ConnectionManager& connections, const SharedConfigStore& store,
                                             const DhcpService& dhcp)
        : connections_(connections), store_(store), dhcp_(dhcp)
    {
        s_ = logger().get_sink("PiNet Adapter");
    }

    string AdapterConfigurator::profile_name(const string_view interface)
    {
        return format("{}{}", interface, Config::ADAPTER_PROFILE_SUFFIX);
    }

    tl::expected<Outcome, Error> AdapterConfigurator::assign(const string_view interface, const string_view address,
                                                             const int prefix) const
    {
        if (auto valid = Util::validate_interface_name(interface)
                .and_then([&] { return Util::validate_ipv4(address); })
                .and_then([&] { return Util::validate_prefix(prefix); }); !valid)
        {
            XTR_LOGL(warning, s_, "Rejected assignment for {}: {}", interface, valid.error().message);
            return unexpected(valid.error());
        }

        const string profile = profile_name(interface);
        auto exists = connections_.exists(profile);
        if (!exists)
        {
            return unexpected(exists.error());
        }

        auto configured = *exists
                              ? connections_.set_static_address(profile, address, prefix)
                              : connections_.add_static_ethernet(profile, interface, address, prefix);
        if (!configured)
        {
            return unexpected(configured.error());
        }
        if (auto activated = connections_.up(profile); !activated)
        {
            return unexpected(activated.error());
        }
        XTR_LOGL(info, s_, "Assigned {}/{} to {}", address, prefix, interface);

        const auto scope = DhcpScope::for_address(interface, address);
        auto changed = store_.update([&](ConfigDocument& document)
        {
            if (!document.has_block(scope.marker()))
            {
                document.upsert_block(scope.marker(), scope.body());
            }
            else if (document.block(scope.marker()) != scope.body())
            {
                XTR_LOGL(warning, s_, "Keeping existing DHCP scope for {}; it does not match {}", interface,
                         address);
            }
            document.ensure_singleton(Config::BIND_DYNAMIC_DIRECTIVE);
        });
        if (!changed)
        {
            XTR_LOGL(warning, s_, "Address assigned to {} but DHCP scope not saved: {}", interface,
                     changed.error().message);
            return Outcome::degraded_with(
                format("Address assigned but DHCP not configured: {}", changed.error().message));
        }
        return dhcp_.propagate(*changed);
    }
}
