/**
 * @file Logging.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <filesystem>
#include <memory>
#include <optional>

// Third Party Library Includes
#include <spdlog/logger.h>

namespace nas_backup::backup_sync
{
/**
 * @brief Build the logger handed to every component
 *
 * Logs go to the console and, when `logDirectory` is given, to
 * `<logDirectory>/sync_YYYY-MM-DD.log`. Levels follow SPDLOG_LEVEL once
 * `spdlog::cfg::load_env_levels()` has run.
 */
[[nodiscard]]
auto make_logger(const std::optional<std::filesystem::path>& logDirectory)
    -> std::shared_ptr<spdlog::logger>;
} // namespace nas_backup::backup_sync
