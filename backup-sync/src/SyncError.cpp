/**
 * @file SyncError.cpp
 * @brief
 */

// Header Being Defined
#include <nas_backup/backup_sync/SyncError.hpp>

// Standard Library Includes
#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>

namespace nas_backup::backup_sync
{
auto to_string(const ErrorKind kind) -> std::string_view
{
    using namespace std::string_view_literals;

    switch (kind)
    {
    case ErrorKind::CONFIG_LOAD:
        return "ConfigLoadError"sv;
    case ErrorKind::STATUS_LOAD:
        return "StatusLoadError"sv;
    case ErrorKind::JOB_TIMEOUT:
        return "JobTimeoutError"sv;
    case ErrorKind::JOB_EXECUTION:
        return "JobExecutionError"sv;
    case ErrorKind::STATUS_PERSIST:
        return "StatusPersistError"sv;
    case ErrorKind::NOTIFICATION_DELIVERY:
        return "NotificationDeliveryError"sv;
    case ErrorKind::BATCH_LOCKED:
        return "BatchLockedError"sv;
    case ErrorKind::LOCK_FILE:
        return "LockFileError"sv;
    }

    return "UnknownError"sv;
}

auto describe_errno(const int errorNumber) -> std::string
{
    std::string errorMessage(BUFSIZ, '\0');

    // GNU strerror_r may return a static string instead of filling the buffer
    // NOLINTNEXTLINE(*-include-cleaner)
    return ::strerror_r(errorNumber, errorMessage.data(), errorMessage.size());
}
} // namespace nas_backup::backup_sync
