#ifndef PINET_ADAPTER_ADAPTER_CONFIGURATOR_HPP
#define PINET_ADAPTER_ADAPTER_CONFIGURATOR_HPP

#include <string>
#include <string_view>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "PiNet/Config.hpp"
#include "PiNet/Util/Error.hpp"

namespace PiNet
{
    class ConnectionManager;
    class DhcpService;
    class SharedConfigStore;

    /**
     * @brief Static address plus DHCP scope for a wired adapter
     *
     * The scope is written once per interface. Reassigning an interface to a
     * different network keeps the existing scope; a warning is logged.
     */
    class AdapterConfigurator
    {
    public:
        AdapterConfigurator(const ConnectionManager& connections, const SharedConfigStore& store,
                            const DhcpService& dhcp);

        tl::expected<Outcome, Error> assign(std::string_view interface, std::string_view address,
                                            int prefix = Config::ADAPTER_DEFAULT_PREFIX) const;

        static std::string profile_name(std::string_view interface);

    private:
        const ConnectionManager& connections_;
        const SharedConfigStore& store_;
        const DhcpService& dhcp_;
        mutable xtr::sink s_;
    };
}

#endif //PINET_ADAPTER_ADAPTER_CONFIGURATOR_HPP
