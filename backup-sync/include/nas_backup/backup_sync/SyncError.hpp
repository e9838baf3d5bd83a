/**
 * @file SyncError.hpp
 * @brief Error kinds raised while loading config, running jobs and
 * persisting their results
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace nas_backup::backup_sync
{
enum class ErrorKind : std::uint8_t
{
    CONFIG_LOAD,
    STATUS_LOAD,
    JOB_TIMEOUT,
    JOB_EXECUTION,
    STATUS_PERSIST,
    NOTIFICATION_DELIVERY,
    BATCH_LOCKED,
    LOCK_FILE,
};

[[nodiscard]]
auto to_string(ErrorKind kind) -> std::string_view;

struct sync_exception : std::runtime_error
{
    sync_exception(ErrorKind kind, const std::string& message)
        : std::runtime_error(message),
          m_Kind(kind)
    {
    }

    [[nodiscard]]
    auto kind() const noexcept -> ErrorKind
    {
        return m_Kind;
    }

  private:
    ErrorKind m_Kind;
};

/**
 * @brief Thread-safe description of an errno value
 */
[[nodiscard]]
auto describe_errno(int errorNumber) -> std::string;
} // namespace nas_backup::backup_sync
