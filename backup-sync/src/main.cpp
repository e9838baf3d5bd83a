/**
 * @file main.cpp
 * @brief One batch of backup syncs. Exits 0 only if every enabled job
 * succeeded.
 */

// Standard Library Includes
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iterator>
#include <string>

// Third Party Library Includes
#include <curl/curl.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

// Project Includes
#include <nas_backup/backup_sync/BackupConfig.hpp>
#include <nas_backup/backup_sync/JobRunner.hpp>
#include <nas_backup/backup_sync/Logging.hpp>
#include <nas_backup/backup_sync/Notifier.hpp>
#include <nas_backup/backup_sync/Orchestrator.hpp>
#include <nas_backup/backup_sync/StatusStore.hpp>
#include <nas_backup/backup_sync/SyncError.hpp>

namespace
{
auto resolve_config_path(const int argc, char** argv) -> std::filesystem::path
{
    if (argc > 1)
    {
        return argv[1];
    }

    // NOLINTNEXTLINE(*-mt-unsafe)
    if (const auto* configEnv = std::getenv("SYNC_CONFIG"))
    {
        return configEnv;
    }

    return "config.json";
}

auto dry_run_requested() -> bool
{
    // NOLINTNEXTLINE(*-mt-unsafe)
    const auto* dryRunPtr = std::getenv("DRY_RUN");

    if (dryRunPtr == nullptr)
    {
        return false;
    }

    std::string dryRun(dryRunPtr);
    std::transform(
        std::begin(dryRun),
        std::end(dryRun),
        std::begin(dryRun),
        [](unsigned char c) { return std::toupper(c); }
    );

    return dryRun == "TRUE";
}
} // namespace

auto main(int argc, char** argv) -> int
{
    using namespace nas_backup::backup_sync;

    spdlog::cfg::load_env_levels();

    const auto configFile = resolve_config_path(argc, argv);

    BackupConfig config;

    try
    {
        config = load_config(configFile);
    }
    catch (const sync_exception& se)
    {
        const auto logger = make_logger(Settings {}.logDirectory);
        logger->critical("{}: {}", to_string(se.kind()), se.what());
        return EXIT_FAILURE;
    }

    config.settings.dryRun = dry_run_requested();

    const auto logger = make_logger(config.settings.logDirectory);
    logger->info("Configuration loaded from {}", configFile.string());

    if (config.settings.dryRun)
    {
        logger->info("Dry run enabled. rsync will not modify any destination.");
    }

    if (::curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
    {
        logger->warn("cURL global initialization failed");
    }

    bool batchSucceeded = false;

    try
    {
        const JobRunner jobRunner(config.settings, logger);
        StatusStore     statusStore(
            config.settings.statusFile,
            config.settings.historyFile,
            logger
        );
        Notifier notifier(config.settings.notification, logger);

        Orchestrator orchestrator(
            config.jobs,
            config.settings.lockFile,
            jobRunner,
            statusStore,
            notifier,
            logger
        );

        batchSucceeded = orchestrator.run_batch();
    }
    catch (const std::exception& e)
    {
        logger->error("{}", e.what());
        batchSucceeded = false;
    }

    ::curl_global_cleanup();

    return batchSucceeded ? EXIT_SUCCESS : EXIT_FAILURE;
}
