/**
 * @file ChildProcess.hpp
 * @brief Supervised execution of one external command with captured output
 * and a wall-clock deadline
 */

#pragma once

// System Includes
#include <sys/types.h>

// Standard Library Includes
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Third Party Library Includes
#include <spdlog/logger.h>

namespace nas_backup::backup_sync
{
struct ProcessOutcome
{
    int                                 returnCode = -1;
    std::string                         stdoutText;
    std::string                         stderrText;
    std::chrono::steady_clock::duration elapsed {};
};

class ChildProcess
{
  public: // Constructors
    ChildProcess(
        std::vector<std::string>        command,
        std::shared_ptr<spdlog::logger> logger
    );
    ChildProcess(ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) = delete;
    auto operator=(ChildProcess&) -> ChildProcess = delete;
    auto operator=(ChildProcess&&) -> ChildProcess = delete;

    ~ChildProcess();

  public: // Methods
    /**
     * @brief Start the command and block until it exits or `timeout` passes
     *
     * The child runs in its own process group. When the deadline passes the
     * whole group gets a SIGTERM, then a SIGKILL if it is still alive after
     * the grace period.
     *
     * A child killed by a signal reports `128 + signal` as its return code.
     *
     * @throws sync_exception with ErrorKind::JOB_TIMEOUT once the child has
     * been terminated after missing the deadline
     * @throws sync_exception with ErrorKind::JOB_EXECUTION if the pipes cannot
     * be created, the fork fails or the executable cannot be started
     */
    auto run(std::chrono::seconds timeout) -> ProcessOutcome;

  private: // Methods
    auto spawn() -> void;
    auto check_exec_status() -> void;
    auto collect_output(
        std::chrono::steady_clock::time_point deadline,
        ProcessOutcome&                       outcome
    ) -> bool;
    auto wait_for_exit(std::chrono::steady_clock::time_point deadline)
        -> std::optional<int>;
    auto interrupt() -> void;
    auto signal_group(int signal) -> bool;
    auto close_pipes() -> void;

  private: // Static Methods
    static auto decode_wait_status(int status) -> int;

  private: // Members
    std::vector<std::string>        m_Command;
    std::shared_ptr<spdlog::logger> m_Logger;
    ::pid_t                         m_ProcessID  = -1;
    int                             m_StdoutPipe = -1;
    int                             m_StderrPipe = -1;
    int                             m_ExecPipe   = -1;
};
} // namespace nas_backup::backup_sync
