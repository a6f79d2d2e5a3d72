#ifndef PINET_SYSTEM_SERVICE_MANAGER_HPP
#define PINET_SYSTEM_SERVICE_MANAGER_HPP

#include <string_view>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "PiNet/Util/Error.hpp"

namespace PiNet
{
    class CommandRunner;

    /**
     * @brief systemd control plane (systemctl)
     */
    class ServiceManager
    {
    public:
        explicit ServiceManager(CommandRunner& runner);

        tl::expected<void, Error> enable(std::string_view unit) const;
        tl::expected<void, Error> disable(std::string_view unit) const;
        tl::expected<void, Error> start(std::string_view unit) const;
        tl::expected<void, Error> stop(std::string_view unit) const;
        tl::expected<void, Error> restart(std::string_view unit) const;
        tl::expected<void, Error> daemon_reload() const;

        tl::expected<bool, Error> is_enabled(std::string_view unit) const;
        tl::expected<bool, Error> is_active(std::string_view unit) const;

    private:
        tl::expected<void, Error> unit_command(std::string_view verb, std::string_view unit) const;

        CommandRunner& runner_;
        mutable xtr::sink s_;
    };
}

#endif //PINET_SYSTEM_SERVICE_MANAGER_HPP
