#ifndef PINET_ACCESS_POINT_BOOT_ACTIVATION_SEQUENCER_HPP
#define PINET_ACCESS_POINT_BOOT_ACTIVATION_SEQUENCER_HPP

#include <functional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "PiNet/Config.hpp"
#include "PiNet/Util/Clock.hpp"
#include "PiNet/Util/Error.hpp"

namespace PiNet
{
    class ConnectionManager;
    class LinkControl;

    struct SequencerTiming
    {
        Clock::duration readiness_timeout{Config::BOOT_READINESS_TIMEOUT};
        Clock::duration poll_interval{Config::BOOT_POLL_INTERVAL};
        Clock::duration settle_delay{Config::BOOT_SETTLE_DELAY};
        Clock::duration retry_delay{Config::BOOT_RETRY_DELAY};
        int activation_attempts{Config::BOOT_ACTIVATION_ATTEMPTS};

        // Upper bound of one run(), used for the boot unit's start timeout
        Clock::duration worst_case() const;

        // PINET_AP_READINESS_TIMEOUT, PINET_AP_POLL_INTERVAL, PINET_AP_SETTLE_DELAY,
        // PINET_AP_RETRY_DELAY (seconds) and PINET_AP_ATTEMPTS
        static SequencerTiming from_env();
    };

    /**
     * @brief Brings the access point up once the radio stack is ready
     *
     * Run unattended by the one-shot boot unit, and on demand from the CLI.
     * Each readiness stage is polled within readiness_timeout; a stage that
     * never becomes ready fails the run with ReadinessTimeout before any
     * activation is attempted. Activation itself is the only retried step.
     */
    class BootActivationSequencer
    {
    public:
        BootActivationSequencer(const ConnectionManager& connections, LinkControl& links, Clock& clock,
                                std::string interface = Config::get_wireless_interface(),
                                std::string connection = Config::get_ap_connection_name(),
                                SequencerTiming timing = {});

        tl::expected<void, Error> run();

        const SequencerTiming& timing() const { return timing_; }

    private:
        tl::expected<void, Error> wait_for(std::string_view stage, const std::function<bool()>& ready);
        tl::expected<void, Error> activate();

        const ConnectionManager& connections_;
        LinkControl& links_;
        Clock& clock_;
        std::string interface_;
        std::string connection_;
        SequencerTiming timing_;
        xtr::sink s_;
    };
}

#endif //PINET_ACCESS_POINT_BOOT_ACTIVATION_SEQUENCER_HPP
