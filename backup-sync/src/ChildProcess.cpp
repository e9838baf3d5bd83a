/**
 * @file ChildProcess.cpp
 * @brief
 */

// Header Being Defined
#include <nas_backup/backup_sync/ChildProcess.hpp>

// System Includes
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

// Standard Library Includes
#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdio>
#include <initializer_list>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Third Party Library Includes
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/logger.h>

// Project Includes
#include <nas_backup/backup_sync/SyncError.hpp>
#include <nas_backup/backup_sync/TimeUtils.hpp>

namespace nas_backup::backup_sync
{
namespace
{
constexpr auto CHECK_INTERVAL  = std::chrono::milliseconds(100);
constexpr auto SIGTERM_TIMEOUT = std::chrono::seconds(30);

// Exit status of a child whose exec failed. The parent learns the real errno
// through the exec pipe, this only keeps the child from running parent code.
constexpr int EXEC_FAILURE_EXIT = 127;

auto close_fd(int& fileDescriptor) -> void
{
    if (fileDescriptor >= 0)
    {
        ::close(fileDescriptor);
        fileDescriptor = -1;
    }
}
} // namespace

ChildProcess::ChildProcess(
    std::vector<std::string>        command,
    std::shared_ptr<spdlog::logger> logger
)
    : m_Command(std::move(command)),
      m_Logger(std::move(logger))
{
    if (m_Command.empty())
    {
        throw sync_exception(
            ErrorKind::JOB_EXECUTION,
            "Cannot start an empty command"
        );
    }
}

ChildProcess::~ChildProcess()
{
    // Only reached with a live child when run() threw part way through
    if (m_ProcessID > 0)
    {
        this->signal_group(SIGKILL);
        ::waitpid(m_ProcessID, nullptr, 0);
    }

    this->close_pipes();
}

auto ChildProcess::run(const std::chrono::seconds timeout) -> ProcessOutcome
{
    ProcessOutcome outcome;

    const auto start    = std::chrono::steady_clock::now();
    const auto deadline = start + timeout;

    this->spawn();
    this->check_exec_status();

    std::optional<int> returnCode;
    if (this->collect_output(deadline, outcome))
    {
        returnCode = this->wait_for_exit(deadline);
    }

    if (!returnCode.has_value())
    {
        m_Logger->warn(
            "Process {} has been running for {}. Attempting to send SIGTERM",
            m_ProcessID,
            describe_duration(timeout)
        );

        this->interrupt();
        this->close_pipes();

        throw sync_exception(
            ErrorKind::JOB_TIMEOUT,
            fmt::format("Timeout after {}", describe_duration(timeout))
        );
    }

    outcome.returnCode = returnCode.value();
    outcome.elapsed = std::chrono::steady_clock::now() - start;
    this->close_pipes();

    return outcome;
}

auto ChildProcess::spawn() -> void
{
    std::array<int, 2> stdoutPipes = { -1, -1 };
    std::array<int, 2> stderrPipes = { -1, -1 };
    std::array<int, 2> execPipes   = { -1, -1 };

    const auto close_all = [&]()
    {
        for (auto* pipes : { &stdoutPipes, &stderrPipes, &execPipes })
        {
            close_fd(pipes->at(0));
            close_fd(pipes->at(1));
        }
    };

    // All ends are close-on-exec, dup2() clears the flag on the copies the
    // child keeps as its stdout and stderr
    if (::pipe2(stdoutPipes.data(), O_CLOEXEC) != 0
        || ::pipe2(stderrPipes.data(), O_CLOEXEC) != 0
        || ::pipe2(execPipes.data(), O_CLOEXEC) != 0)
    {
        const int pipeError = errno;
        close_all();

        throw sync_exception(
            ErrorKind::JOB_EXECUTION,
            fmt::format(
                "Failed to create pipes for {}: {}",
                m_Command.front(),
                describe_errno(pipeError)
            )
        );
    }

    int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    // argv is built before fork() so the child does not allocate
    std::vector<char*> argv;
    argv.reserve(m_Command.size() + 1);
    for (auto& argument : m_Command)
    {
        argv.emplace_back(argument.data());
    }
    argv.emplace_back(nullptr);

    m_Logger->trace("Executing {{ {} }}", fmt::join(m_Command, ", "));

    const ::pid_t pid = ::fork();

    if (pid == 0) // Child Process
    {
        ::setpgid(0, 0);

        if (devNull >= 0)
        {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(stdoutPipes.at(1), STDOUT_FILENO);
        ::dup2(stderrPipes.at(1), STDERR_FILENO);

        ::execvp(argv.front(), argv.data());

        // If we get here `::execvp()` failed
        const int execError = errno;
        [[maybe_unused]]
        const auto written
            = ::write(execPipes.at(1), &execError, sizeof(execError));

        ::_exit(EXEC_FAILURE_EXIT);
    }

    close_fd(devNull);

    if (pid == -1)
    {
        const int forkError = errno;
        close_all();

        throw sync_exception(
            ErrorKind::JOB_EXECUTION,
            fmt::format(
                "Failed to fork process for {}: {}",
                m_Command.front(),
                describe_errno(forkError)
            )
        );
    }

    // Also set from the parent so the group exists before any signal is sent
    ::setpgid(pid, pid);

    m_ProcessID = pid;

    // Close write ends in the parent process
    close_fd(stdoutPipes.at(1));
    close_fd(stderrPipes.at(1));
    close_fd(execPipes.at(1));

    m_StdoutPipe = stdoutPipes.at(0);
    m_StderrPipe = stderrPipes.at(0);
    m_ExecPipe   = execPipes.at(0);

    m_Logger->debug("Started {} (pid: {})", m_Command.front(), pid);
}

auto ChildProcess::check_exec_status() -> void
{
    int     execError = 0;
    ssize_t bytesRead = -1;

    do
    {
        bytesRead = ::read(m_ExecPipe, &execError, sizeof(execError));
    } while (bytesRead == -1 && errno == EINTR);

    close_fd(m_ExecPipe);

    // EOF means exec() succeeded and closed the pipe
    if (bytesRead != static_cast<ssize_t>(sizeof(execError)))
    {
        return;
    }

    ::waitpid(m_ProcessID, nullptr, 0);
    m_ProcessID = -1;
    this->close_pipes();

    throw sync_exception(
        ErrorKind::JOB_EXECUTION,
        fmt::format(
            "[Errno {}] {}: '{}'",
            execError,
            describe_errno(execError),
            m_Command.front()
        )
    );
}

auto ChildProcess::collect_output(
    const std::chrono::steady_clock::time_point deadline,
    ProcessOutcome&                             outcome
) -> bool
{
    std::array<char, BUFSIZ> buffer {};

    std::array<::pollfd, 2> streams = {
        { { .fd = m_StdoutPipe, .events = POLLIN, .revents = 0 },
          { .fd = m_StderrPipe, .events = POLLIN, .revents = 0 } }
    };
    const std::array<std::string*, 2> sinks
        = { &outcome.stdoutText, &outcome.stderrText };

    std::size_t openStreams = streams.size();

    while (openStreams > 0)
    {
        const auto remaining
            = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()
            );

        if (remaining.count() <= 0)
        {
            return false;
        }

        const auto pollTimeout = std::min<std::chrono::milliseconds::rep>(
            remaining.count(),
            std::numeric_limits<int>::max()
        );

        const int ready = ::poll(
            streams.data(),
            streams.size(),
            static_cast<int>(pollTimeout)
        );

        if (ready == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }

            throw sync_exception(
                ErrorKind::JOB_EXECUTION,
                fmt::format(
                    "poll() failed while reading output of {}: {}",
                    m_Command.front(),
                    describe_errno(errno)
                )
            );
        }

        for (std::size_t idx = 0; idx < streams.size(); ++idx)
        {
            auto& stream = streams.at(idx);

            if (stream.fd < 0 || stream.revents == 0)
            {
                continue;
            }

            const auto bytesRead
                = ::read(stream.fd, buffer.data(), buffer.size());

            if (bytesRead > 0)
            {
                sinks.at(idx)->append(
                    buffer.data(),
                    static_cast<std::size_t>(bytesRead)
                );
            }
            else if (bytesRead == 0 || (errno != EINTR && errno != EAGAIN))
            {
                // Negative fds are ignored by poll()
                stream.fd = -1;
                --openStreams;
            }
        }
    }

    return true;
}

auto ChildProcess::wait_for_exit(
    const std::chrono::steady_clock::time_point deadline
) -> std::optional<int>
{
    while (true)
    {
        int           status     = 0;
        const ::pid_t waitReturn = ::waitpid(m_ProcessID, &status, WNOHANG);

        if (waitReturn == m_ProcessID)
        {
            m_Logger->trace("Process {} successfully reaped", m_ProcessID);
            m_ProcessID = -1;

            return ChildProcess::decode_wait_status(status);
        }

        if (waitReturn == -1 && errno != EINTR)
        {
            const int waitError = errno;
            m_ProcessID         = -1;

            throw sync_exception(
                ErrorKind::JOB_EXECUTION,
                fmt::format(
                    "waitpid() failed for {}: {}",
                    m_Command.front(),
                    describe_errno(waitError)
                )
            );
        }

        // Output streams closed but the process is still running
        if (std::chrono::steady_clock::now() >= deadline)
        {
            return std::nullopt;
        }

        std::this_thread::sleep_for(CHECK_INTERVAL);
    }
}

auto ChildProcess::interrupt() -> void
{
    if (!this->signal_group(SIGTERM))
    {
        this->signal_group(SIGKILL);
    }

    const auto start = std::chrono::steady_clock::now();

    while ((std::chrono::steady_clock::now() - start) < SIGTERM_TIMEOUT)
    {
        if (::waitpid(m_ProcessID, nullptr, WNOHANG) == m_ProcessID)
        {
            m_Logger->trace("Process {} successfully reaped", m_ProcessID);
            m_ProcessID = -1;
            return;
        }

        std::this_thread::sleep_for(CHECK_INTERVAL);
    }

    m_Logger->error(
        "Failed to terminate process {} with SIGTERM",
        m_ProcessID
    );

    this->signal_group(SIGKILL);

    if (::waitpid(m_ProcessID, nullptr, 0) == m_ProcessID)
    {
        m_Logger->trace("Process {} successfully reaped", m_ProcessID);
    }
    else
    {
        m_Logger->error(
            "Failed to reap process {} after SIGKILL!",
            m_ProcessID
        );
    }

    m_ProcessID = -1;
}

auto ChildProcess::signal_group(const int signal) -> bool
{
    // A negative pid addresses the whole process group (rsync and its ssh)
    if (::kill(-m_ProcessID, signal) == 0)
    {
        m_Logger->debug(
            "Successfully sent process group {} signal {}",
            m_ProcessID,
            signal
        );
        return true;
    }

    m_Logger->error(
        "Failed to send process group {} signal {}! Error message: {}",
        m_ProcessID,
        signal,
        describe_errno(errno)
    );

    return false;
}

auto ChildProcess::close_pipes() -> void
{
    close_fd(m_StdoutPipe);
    close_fd(m_StderrPipe);
    close_fd(m_ExecPipe);
}

auto ChildProcess::decode_wait_status(const int status) -> int
{
    // NOLINTBEGIN(*-include-cleaner)
    if (WIFEXITED(status))
    {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status))
    {
        constexpr int SIGNAL_EXIT_BASE = 128;
        return SIGNAL_EXIT_BASE + WTERMSIG(status);
    }
    // NOLINTEND(*-include-cleaner)

    return -1;
}
} // namespace nas_backup::backup_sync
