/**
 * @file BackupConfig.cpp
 * @brief
 */

// Header Being Defined
#include <nas_backup/backup_sync/BackupConfig.hpp>

// Standard Library Includes
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Third Party Library Includes
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

// Project Includes
#include <nas_backup/backup_sync/JobSpec.hpp>
#include <nas_backup/backup_sync/SyncError.hpp>

namespace nas_backup::backup_sync
{
namespace
{
// One week. steady_clock deadlines overflow at about 292 years.
constexpr auto MAX_TIMEOUT = std::chrono::seconds(7 * 24 * 60 * 60);

[[noreturn]]
auto config_error(const std::string& message) -> void
{
    throw sync_exception(ErrorKind::CONFIG_LOAD, message);
}

auto reject_unknown_keys(
    const nlohmann::json&                   object,
    std::initializer_list<std::string_view> knownKeys,
    const std::string&                      context
) -> void
{
    for (const auto& item : object.items())
    {
        const std::string& key = item.key();

        const bool isKnown = std::ranges::any_of(
            knownKeys,
            [&key](std::string_view known) { return known == key; }
        );

        if (!isKnown)
        {
            config_error(fmt::format("Unknown key \"{}\" in {}", key, context));
        }
    }
}

auto required_string(
    const nlohmann::json& object,
    const std::string&    key,
    const std::string&    context
) -> std::string
{
    if (!object.contains(key) || !object.at(key).is_string())
    {
        config_error(
            fmt::format("{} is missing string field \"{}\"", context, key)
        );
    }

    auto value = object.at(key).get<std::string>();

    if (value.empty())
    {
        config_error(fmt::format("{} has an empty \"{}\"", context, key));
    }

    return value;
}

// null and "" both mean "not configured"
auto optional_string(const nlohmann::json& object, const std::string& key)
    -> std::string
{
    if (!object.contains(key) || object.at(key).is_null())
    {
        return {};
    }

    return object.at(key).get<std::string>();
}

auto parse_job(const nlohmann::json& job, const std::size_t index) -> JobSpec
{
    const std::string context = fmt::format("sync_jobs[{}]", index);

    if (!job.is_object())
    {
        config_error(fmt::format("{} is not an object", context));
    }

    reject_unknown_keys(
        job,
        { "name", "source", "destination", "exclude", "enabled" },
        context
    );

    JobSpec spec;
    spec.name        = required_string(job, "name", context);
    spec.source      = required_string(job, "source", context);
    spec.destination = required_string(job, "destination", context);
    spec.enabled     = job.value("enabled", true);

    if (job.contains("exclude"))
    {
        if (!job.at("exclude").is_array())
        {
            config_error(fmt::format("{}.exclude is not an array", context));
        }

        for (const auto& pattern : job.at("exclude"))
        {
            spec.exclude.emplace_back(pattern.get<std::string>());
        }
    }

    return spec;
}

auto parse_rsync_options(const nlohmann::json& options)
    -> std::vector<std::string>
{
    std::vector<std::string> tokens;

    if (options.is_string())
    {
        tokens = split_rsync_options(options.get<std::string>());
    }
    else if (options.is_array())
    {
        for (const auto& option : options)
        {
            tokens.emplace_back(option.get<std::string>());
        }
    }
    else
    {
        config_error("settings.rsync_options must be a string or an array");
    }

    for (const auto& token : tokens)
    {
        if (!token.starts_with('-'))
        {
            config_error(
                fmt::format(
                    "rsync option \"{}\" is not an option flag. Sources and "
                    "destinations belong in sync_jobs",
                    token
                )
            );
        }
    }

    return tokens;
}

auto parse_notification(const nlohmann::json& notification)
    -> NotificationSettings
{
    if (!notification.is_object())
    {
        config_error("settings.notification is not an object");
    }

    reject_unknown_keys(
        notification,
        { "smtp_server", "smtp_port", "smtp_user", "smtp_pass", "email" },
        "settings.notification"
    );

    NotificationSettings parsed;
    parsed.smtpServer = optional_string(notification, "smtp_server");
    parsed.smtpUser   = optional_string(notification, "smtp_user");
    parsed.smtpPass   = optional_string(notification, "smtp_pass");
    parsed.email      = optional_string(notification, "email");

    if (notification.contains("smtp_port"))
    {
        const auto port = notification.at("smtp_port").get<std::int64_t>();

        constexpr std::int64_t MAX_PORT = 65535;
        if (port < 1 || port > MAX_PORT)
        {
            config_error(
                fmt::format("settings.notification.smtp_port {} is out of range", port)
            );
        }

        parsed.smtpPort = static_cast<std::uint16_t>(port);
    }

    if (!parsed.email.empty() && parsed.smtpServer.empty())
    {
        config_error(
            "settings.notification.email is set but smtp_server is missing"
        );
    }

    return parsed;
}

auto parse_settings(const nlohmann::json& settings) -> Settings
{
    Settings parsed;

    if (!settings.is_object())
    {
        config_error("settings is not an object");
    }

    reject_unknown_keys(
        settings,
        { "ssh_key",
          "rsync_options",
          "rsync_path",
          "timeout_seconds",
          "status_file",
          "history_file",
          "lock_file",
          "log_dir",
          "notification",
          "web_interface" },
        "settings"
    );

    if (const auto sshKey = optional_string(settings, "ssh_key");
        !sshKey.empty())
    {
        parsed.sshKey = sshKey;
    }

    if (settings.contains("rsync_options"))
    {
        parsed.rsyncOptions = parse_rsync_options(settings.at("rsync_options"));
    }

    if (settings.contains("rsync_path"))
    {
        parsed.rsyncPath = required_string(settings, "rsync_path", "settings");
    }

    if (settings.contains("timeout_seconds"))
    {
        const auto seconds
            = settings.at("timeout_seconds").get<std::int64_t>();

        if (seconds <= 0 || seconds > MAX_TIMEOUT.count())
        {
            config_error(
                fmt::format(
                    "settings.timeout_seconds must be between 1 and {}",
                    MAX_TIMEOUT.count()
                )
            );
        }

        parsed.timeout = std::chrono::seconds(seconds);
    }

    if (settings.contains("status_file"))
    {
        parsed.statusFile = required_string(settings, "status_file", "settings");
    }

    if (const auto history = optional_string(settings, "history_file");
        !history.empty())
    {
        parsed.historyFile = history;
    }

    if (settings.contains("log_dir"))
    {
        parsed.logDirectory = required_string(settings, "log_dir", "settings");
    }

    parsed.lockFile = optional_string(settings, "lock_file");

    if (settings.contains("notification"))
    {
        parsed.notification = parse_notification(settings.at("notification"));
    }

    return parsed;
}
} // namespace

auto split_rsync_options(const std::string& options) -> std::vector<std::string>
{
    std::istringstream stream(options);

    return { std::istream_iterator<std::string>(stream),
             std::istream_iterator<std::string>() };
}

auto parse_config(const nlohmann::json& config) -> BackupConfig
try
{
    if (!config.is_object())
    {
        config_error("Configuration root is not an object");
    }

    if (!config.contains("sync_jobs") || !config.at("sync_jobs").is_array())
    {
        config_error("Configuration is missing the \"sync_jobs\" array");
    }

    BackupConfig parsed;
    parsed.settings = parse_settings(config.value("settings", nlohmann::json::object()));

    std::set<std::string> seenNames;
    std::size_t           index = 0;

    for (const auto& job : config.at("sync_jobs"))
    {
        auto spec = parse_job(job, index++);

        if (!seenNames.insert(spec.name).second)
        {
            config_error(fmt::format("Duplicate job name \"{}\"", spec.name));
        }

        parsed.jobs.emplace_back(std::move(spec));
    }

    if (parsed.settings.lockFile.empty())
    {
        parsed.settings.lockFile = parsed.settings.statusFile;
        parsed.settings.lockFile += ".lock";
    }

    return parsed;
}
catch (const nlohmann::json::exception& je)
{
    throw sync_exception(
        ErrorKind::CONFIG_LOAD,
        fmt::format("Invalid configuration value: {}", je.what())
    );
}

auto load_config(const std::filesystem::path& file) -> BackupConfig
{
    std::ifstream configFile(file);

    if (!configFile.good())
    {
        throw sync_exception(
            ErrorKind::CONFIG_LOAD,
            fmt::format(
                "Failed to load config file {}! OS Error: {}",
                file.string(),
                describe_errno(errno)
            )
        );
    }

    nlohmann::json config;

    try
    {
        config = nlohmann::json::parse(configFile);
    }
    catch (const nlohmann::json::parse_error& pe)
    {
        throw sync_exception(
            ErrorKind::CONFIG_LOAD,
            fmt::format("Failed to parse config file {}: {}", file.string(), pe.what())
        );
    }

    return parse_config(config);
}
} // namespace nas_backup::backup_sync
