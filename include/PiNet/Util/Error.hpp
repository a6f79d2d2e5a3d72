#ifndef PINET_ERROR_HPP
#define PINET_ERROR_HPP

#include <string>
#include <utility>

namespace PiNet
{
    enum class ErrorCode
    {
        // Validation
        InvalidSsid,
        InvalidPassphrase,
        InvalidChannel,
        InvalidAddress,
        InvalidPrefix,
        InvalidMacAddress,
        InvalidHostname,
        InvalidInterfaceName,
        MalformedReservation,

        // External commands
        CommandSpawnError,
        CommandFailed,

        // Shared config file
        ConfigReadError,
        ConfigWriteError,
        ConfigBackupError,

        // Boot unit
        BootUnitWriteError,
        BootUnitRemoveError,

        // Access point
        AccessPointNotConfigured,
        RadioUnblockError,
        ActivationError,

        // Readiness polling
        ReadinessTimeout,

        // Netlink
        NlSocketAllocError,
        NlConnectError,
        NlCacheAllocError,
        NetlinkSocketNotInitialized,
        NetlinkInterfaceNotFound,
    };

    enum class ErrorCategory
    {
        Validation,
        ExternalFailure,
        ReadinessTimeout,
        NotConfigured,
    };

    constexpr ErrorCategory category_of(const ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::InvalidSsid:
            case ErrorCode::InvalidPassphrase:
            case ErrorCode::InvalidChannel:
            case ErrorCode::InvalidAddress:
            case ErrorCode::InvalidPrefix:
            case ErrorCode::InvalidMacAddress:
            case ErrorCode::InvalidHostname:
            case ErrorCode::InvalidInterfaceName:
            case ErrorCode::MalformedReservation:
                return ErrorCategory::Validation;
            case ErrorCode::ReadinessTimeout:
                return ErrorCategory::ReadinessTimeout;
            case ErrorCode::AccessPointNotConfigured:
                return ErrorCategory::NotConfigured;
            default:
                return ErrorCategory::ExternalFailure;
        }
    }

    struct Error
    {
        Error(const ErrorCode c, std::string msg) : code(c), message(std::move(msg))
        {
        }

        [[nodiscard]] ErrorCategory category() const { return category_of(code); }

        ErrorCode code;
        std::string message;
    };

    /**
     * @brief Result of a mutation whose primary effect succeeded
     *
     * A mutation that reached its desired state but could not propagate it to
     * a dependent service (dnsmasq reload) is degraded, not failed.
     */
    struct Outcome
    {
        bool reloaded{true};
        std::string warning;

        [[nodiscard]] bool degraded() const { return !reloaded; }

        static Outcome applied() { return Outcome{}; }

        static Outcome degraded_with(std::string why)
        {
            return Outcome{false, std::move(why)};
        }
    };
}
#endif //PINET_ERROR_HPP
