/**
 * @file TimeUtils.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <string>

namespace nas_backup::backup_sync
{
/**
 * @brief Local time as `YYYY-MM-DDTHH:MM:SS.ffffff`
 */
[[nodiscard]]
auto to_iso8601(std::chrono::system_clock::time_point timePoint)
    -> std::string;

/**
 * @brief Human readable length of a timeout, e.g. "1 hour" or "90 seconds"
 */
[[nodiscard]]
auto describe_duration(std::chrono::seconds duration) -> std::string;
} // namespace nas_backup::backup_sync
