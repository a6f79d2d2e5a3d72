#include "PiNet/System/CommandRunner.hpp"
#include "PiNet/Util/Strings.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>

using tl::unexpected, std::string, std::vector, std::format;

extern char** environ;

namespace
{
    // Control-plane output is parsed, keep it untranslated
    vector<string> child_environment()
    {
        vector<string> env;
        for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry)
        {
            if (std::strncmp(*entry, "LC_ALL=", 7) != 0)
            {
                env.emplace_back(*entry);
            }
        }
        env.emplace_back("LC_ALL=C");
        return env;
    }

    // PATH lookup happens before fork(), the child only calls execve
    string resolve_executable(const string& name)
    {
        if (name.find('/') != string::npos)
        {
            return name;
        }
        const char* path = std::getenv("PATH");
        const string search = path != nullptr && *path != '\0' ? path : "/usr/local/bin:/usr/bin:/bin";
        for (const auto& dir : PiNet::Util::split(search, ':'))
        {
            const string candidate = (dir.empty() ? string(".") : dir) + "/" + name;
            if (access(candidate.c_str(), X_OK) == 0)
            {
                return candidate;
            }
        }
        return name;
    }

    vector<char*> pointers(const vector<string>& strings)
    {
        vector<char*> result;
        result.reserve(strings.size() + 1);
        for (const auto& entry : strings)
        {
            result.push_back(const_cast<char*>(entry.c_str()));
        }
        result.push_back(nullptr);
        return result;
    }

    void close_pipe(int (&fds)[2])
    {
        for (auto& fd : fds)
        {
            if (fd != -1)
            {
                close(fd);
                fd = -1;
            }
        }
    }

    // Drains both pipes until the child closes them
    void drain(const int out_fd, const int err_fd, string& out, string& err)
    {
        std::array<pollfd, 2> fds{{{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}}};
        std::array<string*, 2> sinks{&out, &err};
        int open_count = 2;
        char buffer[4096];

        while (open_count > 0)
        {
            if (poll(fds.data(), fds.size(), -1) < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                return;
            }
            for (std::size_t i = 0; i < fds.size(); ++i)
            {
                if (fds[i].fd == -1 || fds[i].revents == 0)
                {
                    continue;
                }
                const ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
                if (n > 0)
                {
                    sinks[i]->append(buffer, static_cast<std::size_t>(n));
                }
                else if (n == 0 || errno != EINTR)
                {
                    fds[i].fd = -1;
                    --open_count;
                }
            }
        }
    }
}

namespace PiNet
{
    string command_line(const vector<string>& argv)
    {
        // Secrets never reach the log
        vector<string> shown(argv);
        for (std::size_t i = 1; i < shown.size(); ++i)
        {
            if (shown[i - 1] == "wifi-sec.psk")
            {
                shown[i] = "******";
            }
        }
        return Util::join(shown, " ");
    }

    tl::expected<CommandResult, Error> ProcessRunner::run(const vector<string>& argv)
    {
        if (argv.empty())
        {
            return unexpected(Error{ErrorCode::CommandSpawnError, "Empty command"});
        }

        int out_pipe[2]{-1, -1};
        int err_pipe[2]{-1, -1};
        if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0)
        {
            const int pipe_errno = errno;
            close_pipe(out_pipe);
            close_pipe(err_pipe);
            return unexpected(Error{
                ErrorCode::CommandSpawnError,
                format("Failed to create pipes for '{}': {}", command_line(argv), strerror(pipe_errno))
            });
        }

        // Everything the child needs is built here; after fork() it may only call async-signal-safe functions
        const string executable = resolve_executable(argv.front());
        const vector<string> environment = child_environment();
        const auto args = pointers(argv);
        const auto envp = pointers(environment);

        const pid_t pid = fork();
        if (pid < 0)
        {
            const int fork_errno = errno;
            close_pipe(out_pipe);
            close_pipe(err_pipe);
            return unexpected(Error{
                ErrorCode::CommandSpawnError,
                format("Failed to fork for '{}': {}", command_line(argv), strerror(fork_errno))
            });
        }

        if (pid == 0)
        {
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            execve(executable.c_str(), args.data(), envp.data());
            _exit(127);
        }

        close(out_pipe[1]);
        out_pipe[1] = -1;
        close(err_pipe[1]);
        err_pipe[1] = -1;

        CommandResult result;
        drain(out_pipe[0], err_pipe[0], result.out, result.err);
        close_pipe(out_pipe);
        close_pipe(err_pipe);

        int status = 0;
        while (waitpid(pid, &status, 0) < 0)
        {
            if (errno != EINTR)
            {
                return unexpected(Error{
                    ErrorCode::CommandSpawnError,
                    format("Failed to wait for '{}': {}", command_line(argv), strerror(errno))
                });
            }
        }

        if (WIFEXITED(status))
        {
            result.exit_code = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status))
        {
            result.exit_code = 128 + WTERMSIG(status);
        }

        if (result.exit_code == 127 && result.err.empty())
        {
            result.err = format("{}: command not found", argv.front());
        }
        return result;
    }

    tl::expected<string, Error> run_checked(CommandRunner& runner, xtr::sink& s, const vector<string>& argv)
    {
        auto result = runner.run(argv);
        if (!result)
        {
            XTR_LOGL(error, s, "Command failed to start: {}: {}", command_line(argv), result.error().message);
            return unexpected(result.error());
        }
        if (!result->ok())
        {
            const string detail(Util::trim(result->err.empty() ? result->out : result->err));
            XTR_LOGL(error, s, "Command failed: {} (exit {}): {}", command_line(argv), result->exit_code, detail);
            return unexpected(Error{
                ErrorCode::CommandFailed,
                format("{} exited with {}: {}", command_line(argv), result->exit_code, detail)
            });
        }
        return std::move(result->out);
    }
}
