/**
 * @file BackupConfig.hpp
 * @brief Typed configuration records and the JSON loader that fills them
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Third Party Library Includes
#include <nlohmann/json.hpp>

// Project Includes
#include <nas_backup/backup_sync/JobSpec.hpp>

namespace nas_backup::backup_sync
{
struct NotificationSettings
{
    std::string   smtpServer;
    std::uint16_t smtpPort = 587;
    std::string   smtpUser;
    std::string   smtpPass;
    std::string   email;
};

struct Settings
{
    std::optional<std::filesystem::path> sshKey;
    std::vector<std::string> rsyncOptions = { "-avz", "--delete", "--stats" };
    std::string              rsyncPath    = "rsync";
    std::chrono::seconds     timeout      = std::chrono::hours(1);
    std::filesystem::path    statusFile   = "status.json";
    std::optional<std::filesystem::path> historyFile;
    std::filesystem::path                lockFile;
    std::filesystem::path                logDirectory = "logs";
    bool                                 dryRun       = false;
    NotificationSettings                 notification;
};

struct BackupConfig
{
    std::vector<JobSpec> jobs;
    Settings             settings;
};

/**
 * @brief Read and validate the configuration file at `file`
 *
 * @throws sync_exception with ErrorKind::CONFIG_LOAD when the file cannot be
 * read, is not valid JSON or fails validation
 */
[[nodiscard]]
auto load_config(const std::filesystem::path& file) -> BackupConfig;

/**
 * @brief Validate an already parsed configuration document
 *
 * Unknown keys inside a job, `settings` (except the dashboard's
 * `web_interface` block) and `settings.notification` are rejected.
 * `timeout_seconds` must lie within 1 second and 1 week.
 *
 * @throws sync_exception with ErrorKind::CONFIG_LOAD
 */
[[nodiscard]]
auto parse_config(const nlohmann::json& config) -> BackupConfig;

/**
 * @brief Split a raw option string on whitespace. No quoting support.
 */
[[nodiscard]]
auto split_rsync_options(const std::string& options)
    -> std::vector<std::string>;
} // namespace nas_backup::backup_sync
