/**
 * @file StatsParser.hpp
 * @brief Pulls the transfer summary out of `rsync --stats` output
 */

#pragma once

// Standard Library Includes
#include <string_view>

// Project Includes
#include <nas_backup/backup_sync/RunResult.hpp>

namespace nas_backup::backup_sync
{
/**
 * @brief Extract the recognized summary counters from rsync's stdout
 *
 * Values are kept exactly as rsync printed them (thousands separators and
 * units included). Labels that never appear are simply absent from the
 * returned map.
 *
 * Recognized labels and their keys:
 *  - "Number of files:"              -> total_files
 *  - "Number of created files:"      -> created_files
 *  - "Number of deleted files:"      -> deleted_files
 *  - "Total transferred file size:"  -> transferred_size
 *  - "Total file size:"              -> total_size
 */
[[nodiscard]]
auto parse_rsync_stats(std::string_view output) -> SyncStats;
} // namespace nas_backup::backup_sync
