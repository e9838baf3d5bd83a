/**
 * @file Orchestrator.hpp
 * @brief Runs every enabled job once, in configuration order
 */

#pragma once

// Standard Library Includes
#include <filesystem>
#include <memory>
#include <vector>

// Third Party Library Includes
#include <spdlog/logger.h>

// Project Includes
#include <nas_backup/backup_sync/JobRunner.hpp>
#include <nas_backup/backup_sync/JobSpec.hpp>
#include <nas_backup/backup_sync/Notifier.hpp>
#include <nas_backup/backup_sync/StatusStore.hpp>

namespace nas_backup::backup_sync
{
class Orchestrator
{
  public: // Constructors
    Orchestrator(
        std::vector<JobSpec>            jobs,
        std::filesystem::path           lockFile,
        const JobRunner&                jobRunner,
        StatusStore&                    statusStore,
        Notifier&                       notifier,
        std::shared_ptr<spdlog::logger> logger
    );
    Orchestrator(Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    auto operator=(Orchestrator&) -> Orchestrator = delete;
    auto operator=(Orchestrator&&) -> Orchestrator = delete;

  public: // Methods
    /**
     * @brief Run one batch
     *
     * Holds the batch lock for the whole run. Disabled jobs are skipped and
     * not counted. The status document is saved once, after the last job,
     * and a single notification lists every failed job.
     *
     * @return true if every enabled job succeeded. false if any failed,
     * another batch holds the lock or the lock file is unusable.
     */
    auto run_batch() -> bool;

  private: // Members
    std::vector<JobSpec>            m_Jobs;
    std::filesystem::path           m_LockFile;
    const JobRunner&                m_JobRunner;
    StatusStore&                    m_StatusStore;
    Notifier&                       m_Notifier;
    std::shared_ptr<spdlog::logger> m_Logger;
};
} // namespace nas_backup::backup_sync
