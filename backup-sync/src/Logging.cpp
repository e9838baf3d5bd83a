/**
 * @file Logging.cpp
 * @brief
 */

// Header Being Defined
#include <nas_backup/backup_sync/Logging.hpp>

// Standard Library Includes
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

// Third Party Library Includes
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace nas_backup::backup_sync
{
namespace
{
constexpr auto LOGGER_NAME = "backup-sync";
constexpr auto LOG_PATTERN = "%Y-%m-%d %H:%M:%S,%e - %l - %v";
} // namespace

auto make_logger(const std::optional<std::filesystem::path>& logDirectory)
    -> std::shared_ptr<spdlog::logger>
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.emplace_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::error_code directoryError;
    if (logDirectory.has_value())
    {
        std::filesystem::create_directories(logDirectory.value(), directoryError);

        if (!directoryError)
        {
            // Rotates at midnight: sync_2024-01-31.log
            sinks.emplace_back(
                std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                    (logDirectory.value() / "sync.log").string(),
                    0,
                    0
                )
            );
        }
    }

    auto logger = std::make_shared<spdlog::logger>(
        LOGGER_NAME,
        std::begin(sinks),
        std::end(sinks)
    );

    // Applies the levels loaded from SPDLOG_LEVEL
    spdlog::initialize_logger(logger);
    logger->set_pattern(LOG_PATTERN);
    logger->flush_on(spdlog::level::info);

    if (directoryError)
    {
        logger->warn(
            "Cannot create log directory {}: {}. Logging to the console only",
            logDirectory->string(),
            directoryError.message()
        );
    }

    return logger;
}
} // namespace nas_backup::backup_sync
