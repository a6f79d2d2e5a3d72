#ifndef PINET_ACCESS_POINT_BOOT_UNIT_HPP
#define PINET_ACCESS_POINT_BOOT_UNIT_HPP

#include <string>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "PiNet/Config.hpp"
#include "PiNet/Util/Clock.hpp"
#include "PiNet/Util/Error.hpp"

namespace PiNet
{
    class ServiceManager;

    /**
     * @brief The one-shot systemd unit that runs pinet-ap-activate at boot
     */
    class BootUnit
    {
    public:
        BootUnit(const ServiceManager& services, std::string unit_dir, Clock::duration start_timeout,
                 std::string unit_name = Config::AP_BOOT_UNIT,
                 std::string activator = Config::AP_ACTIVATOR_PATH);

        std::string path() const;
        const std::string& name() const { return unit_name_; }
        std::string render() const;

        // Writes the unit file when missing or stale, then reloads systemd
        tl::expected<void, Error> install() const;
        // Enables the unit; the file is removed again if that fails
        tl::expected<void, Error> register_for_boot() const;
        // Stops, disables and deletes the unit
        tl::expected<void, Error> uninstall() const;

        bool installed() const;
        tl::expected<bool, Error> enabled() const;

        // network-online.target is only reached with the wait-online service enabled
        void require_network_online() const;

        // Units left behind by earlier releases
        void remove_legacy_units() const;

    private:
        tl::expected<void, Error> remove_file(const std::string& file) const;

        const ServiceManager& services_;
        std::string unit_dir_;
        Clock::duration start_timeout_;
        std::string unit_name_;
        std::string activator_;
        mutable xtr::sink s_;
    };
}

#endif //PINET_ACCESS_POINT_BOOT_UNIT_HPP
