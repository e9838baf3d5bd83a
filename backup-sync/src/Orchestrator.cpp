/**
 * @file Orchestrator.cpp
 * @brief
 */

// Header Being Defined
#include <nas_backup/backup_sync/Orchestrator.hpp>

// Standard Library Includes
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

// Third Party Library Includes
#include <spdlog/logger.h>

// Project Includes
#include <nas_backup/backup_sync/BatchLock.hpp>
#include <nas_backup/backup_sync/RunResult.hpp>
#include <nas_backup/backup_sync/SyncError.hpp>
#include <nas_backup/backup_sync/TimeUtils.hpp>

namespace nas_backup::backup_sync
{
Orchestrator::Orchestrator(
    std::vector<JobSpec>            jobs,
    std::filesystem::path           lockFile,
    const JobRunner&                jobRunner,
    StatusStore&                    statusStore,
    Notifier&                       notifier,
    std::shared_ptr<spdlog::logger> logger
)
    : m_Jobs(std::move(jobs)),
      m_LockFile(std::move(lockFile)),
      m_JobRunner(jobRunner),
      m_StatusStore(statusStore),
      m_Notifier(notifier),
      m_Logger(std::move(logger))
{
}

auto Orchestrator::run_batch() -> bool
{
    std::optional<BatchLock> batchLock;

    try
    {
        batchLock.emplace(m_LockFile);
    }
    catch (const sync_exception& se)
    {
        m_Logger->error(
            "{}: {}. Not starting this batch",
            to_string(se.kind()),
            se.what()
        );
        return false;
    }

    m_Logger->info("Starting backup sync run");

    const auto batchStart = std::chrono::system_clock::now();
    const auto batchTimer = std::chrono::steady_clock::now();

    m_StatusStore.load();

    std::size_t            successfulJobs = 0;
    std::vector<RunResult> failedJobs;

    for (const auto& job : m_Jobs)
    {
        if (!job.enabled)
        {
            m_Logger->info("Skipping disabled job: {}", job.name);
            continue;
        }

        auto result = m_JobRunner.run(job);
        m_StatusStore.record_run(result);

        if (result.success)
        {
            ++successfulJobs;
        }
        else
        {
            failedJobs.emplace_back(std::move(result));
        }
    }

    m_StatusStore.finalize_run(
        to_iso8601(batchStart),
        successfulJobs,
        failedJobs.size()
    );
    m_StatusStore.persist();

    if (!failedJobs.empty())
    {
        m_Notifier.notify(failedJobs);
    }

    const auto batchDuration = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - batchTimer
    );

    m_Logger->info(
        "Backup sync completed in {:.1f}s",
        batchDuration.count()
    );
    m_Logger->info(
        "Results: {} successful, {} failed",
        successfulJobs,
        failedJobs.size()
    );

    return failedJobs.empty();
}
} // namespace nas_backup::backup_sync
