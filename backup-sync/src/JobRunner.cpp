/**
 * @file JobRunner.cpp
 * @brief
 */

// Header Being Defined
#include <nas_backup/backup_sync/JobRunner.hpp>

// Standard Library Includes
#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// Third Party Library Includes
#include <spdlog/fmt/fmt.h>
// NOLINTNEXTLINE(misc-include-cleaner) Required to print a range in a log
#include <spdlog/fmt/ranges.h>
#include <spdlog/logger.h>

// Project Includes
#include <nas_backup/backup_sync/ChildProcess.hpp>
#include <nas_backup/backup_sync/StatsParser.hpp>
#include <nas_backup/backup_sync/SyncError.hpp>
#include <nas_backup/backup_sync/TimeUtils.hpp>

namespace nas_backup::backup_sync
{
JobRunner::JobRunner(
    const Settings&                 settings,
    std::shared_ptr<spdlog::logger> logger
)
    : m_SshKey(settings.sshKey),
      m_RsyncOptions(settings.rsyncOptions),
      m_RsyncPath(settings.rsyncPath),
      m_Timeout(settings.timeout),
      m_DryRun(settings.dryRun),
      m_Logger(std::move(logger))
{
}

auto JobRunner::compose_remote_shell() const -> std::string
{
    if (m_SshKey.has_value())
    {
        return fmt::format(
            "ssh -i {} -o StrictHostKeyChecking=no",
            m_SshKey->string()
        );
    }

    return "ssh -o StrictHostKeyChecking=no";
}

auto JobRunner::compose_rsync_command(const JobSpec& job) const
    -> std::vector<std::string>
{
    std::vector<std::string> command = { m_RsyncPath,
                                         "-e",
                                         this->compose_remote_shell() };

    command.insert(
        std::end(command),
        std::begin(m_RsyncOptions),
        std::end(m_RsyncOptions)
    );

    if (m_DryRun)
    {
        command.emplace_back("--dry-run");
    }

    for (const auto& pattern : job.exclude)
    {
        command.emplace_back("--exclude");
        command.emplace_back(pattern);
    }

    command.emplace_back(job.source);
    command.emplace_back(job.destination);

    return command;
}

auto JobRunner::run(const JobSpec& job) const -> RunResult
{
    RunResult result;
    result.name        = job.name;
    result.source      = job.source;
    result.destination = job.destination;
    result.state       = JobState::RUNNING;

    const auto command = this->compose_rsync_command(job);

    m_Logger->info("Starting sync for {}: {}", job.name, fmt::join(command, " "));

    result.startTime = to_iso8601(std::chrono::system_clock::now());

    try
    {
        ChildProcess process(command, m_Logger);
        auto         outcome = process.run(m_Timeout);

        result.duration
            = std::chrono::duration<double>(outcome.elapsed).count();
        result.returnCode = outcome.returnCode;
        result.success    = (outcome.returnCode == 0);
        result.stats      = parse_rsync_stats(outcome.stdoutText);
        result.stdoutText = std::move(outcome.stdoutText);
        result.stderrText = std::move(outcome.stderrText);
        result.state = (result.success ? JobState::SUCCEEDED : JobState::FAILED);

        if (result.success)
        {
            m_Logger->info(
                "{} completed successfully in {:.1f}s",
                job.name,
                result.duration
            );
        }
        else
        {
            m_Logger->error(
                "{} failed with return code {}",
                job.name,
                result.returnCode
            );
            m_Logger->debug("{} error output: {}", job.name, result.stderrText);
        }

        return result;
    }
    catch (const sync_exception& se)
    {
        result.success    = false;
        result.returnCode = -1;
        result.error      = se.what();
        result.stats.clear();
        result.stdoutText.clear();

        if (se.kind() == ErrorKind::JOB_TIMEOUT)
        {
            result.duration
                = std::chrono::duration<double>(m_Timeout).count();
            result.stderrText = "Process timed out";
            result.state      = JobState::TIMED_OUT;

            m_Logger->error(
                "{} timed out after {}",
                job.name,
                describe_duration(m_Timeout)
            );

            return result;
        }

        // Time to the known failure point, which is taken to be immediate
        result.duration   = 0.0;
        result.stderrText = se.what();
        result.state      = JobState::ERRORED;

        m_Logger->error(
            "{} failed with {}: {}",
            job.name,
            to_string(se.kind()),
            se.what()
        );
    }
    catch (const std::exception& e)
    {
        result.success    = false;
        result.returnCode = -1;
        result.duration   = 0.0;
        result.error      = e.what();
        result.stderrText = e.what();
        result.state      = JobState::ERRORED;

        m_Logger->error(
            "{} failed with {}: {}",
            job.name,
            to_string(ErrorKind::JOB_EXECUTION),
            e.what()
        );
    }

    return result;
}
} // namespace nas_backup::backup_sync
