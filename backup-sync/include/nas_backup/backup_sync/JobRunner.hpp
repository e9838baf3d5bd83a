/**
 * @file JobRunner.hpp
 * @brief Runs rsync once for a single job
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Third Party Library Includes
#include <spdlog/logger.h>

// Project Includes
#include <nas_backup/backup_sync/BackupConfig.hpp>
#include <nas_backup/backup_sync/JobSpec.hpp>
#include <nas_backup/backup_sync/RunResult.hpp>

namespace nas_backup::backup_sync
{
class JobRunner
{
  public: // Constructors
    JobRunner(const Settings& settings, std::shared_ptr<spdlog::logger> logger);

  public: // Methods
    /**
     * @brief Argument list for one job, executable first
     *
     * rsync -e <remote shell> <options...> [--dry-run]
     *       [--exclude <pattern>...] <source> <destination>
     */
    [[nodiscard]]
    auto compose_rsync_command(const JobSpec& job) const
        -> std::vector<std::string>;

    /**
     * @brief Execute `job` exactly once and describe how it went
     *
     * Never throws for job-level failures: a timeout or a failure to start
     * rsync is recorded in the returned RunResult.
     */
    [[nodiscard]]
    auto run(const JobSpec& job) const -> RunResult;

    [[nodiscard]]
    auto get_timeout() const -> std::chrono::seconds
    {
        return m_Timeout;
    }

  private: // Methods
    [[nodiscard]]
    auto compose_remote_shell() const -> std::string;

  private: // Members
    std::optional<std::filesystem::path> m_SshKey;
    std::vector<std::string>             m_RsyncOptions;
    std::string                          m_RsyncPath;
    std::chrono::seconds                 m_Timeout;
    bool                                 m_DryRun;
    std::shared_ptr<spdlog::logger>      m_Logger;
};
} // namespace nas_backup::backup_sync
