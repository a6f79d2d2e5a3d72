#ifndef PINET_SYSTEM_COMMAND_RUNNER_HPP
#define PINET_SYSTEM_COMMAND_RUNNER_HPP

#include <string>
#include <vector>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "PiNet/Util/Error.hpp"

namespace PiNet
{
    struct CommandResult
    {
        int exit_code{-1};
        std::string out;
        std::string err;

        [[nodiscard]] bool ok() const { return exit_code == 0; }
    };

    /**
     * @brief Invokes external control-plane commands (nmcli, systemctl, rfkill)
     *
     * A command that ran and exited non-zero is a CommandResult, not an error;
     * only failing to run it at all is reported as Error.
     */
    class CommandRunner
    {
    public:
        virtual ~CommandRunner() = default;

        virtual tl::expected<CommandResult, Error> run(const std::vector<std::string>& argv) = 0;
    };

    /**
     * @brief fork/exec runner capturing stdout and stderr
     */
    class ProcessRunner final : public CommandRunner
    {
    public:
        tl::expected<CommandResult, Error> run(const std::vector<std::string>& argv) override;
    };

    std::string command_line(const std::vector<std::string>& argv);

    /**
     * @brief Runs argv and maps a non-zero exit to CommandFailed
     *
     * Failures are logged on the caller's sink with the exact command and its stderr.
     * @return captured stdout on success
     */
    tl::expected<std::string, Error> run_checked(CommandRunner& runner, xtr::sink& s,
                                                 const std::vector<std::string>& argv);
}

#endif //PINET_SYSTEM_COMMAND_RUNNER_HPP
