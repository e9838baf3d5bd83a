/**
 * @file BatchLock.cpp
 * @brief
 */

// Header Being Defined
#include <nas_backup/backup_sync/BatchLock.hpp>

// System Includes
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

// Standard Library Includes
#include <cerrno>
#include <filesystem>
#include <string>
#include <system_error>

// Third Party Library Includes
#include <spdlog/fmt/fmt.h>

// Project Includes
#include <nas_backup/backup_sync/SyncError.hpp>

namespace nas_backup::backup_sync
{
BatchLock::BatchLock(const std::filesystem::path& lockFile)
{
    if (lockFile.has_parent_path())
    {
        std::error_code directoryError;
        std::filesystem::create_directories(lockFile.parent_path(), directoryError);

        if (directoryError)
        {
            throw sync_exception(
                ErrorKind::LOCK_FILE,
                fmt::format(
                    "Cannot create directory for lock file {}: {}",
                    lockFile.string(),
                    directoryError.message()
                )
            );
        }
    }

    m_FileDescriptor
        = ::open(lockFile.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);

    if (m_FileDescriptor < 0)
    {
        throw sync_exception(
            ErrorKind::LOCK_FILE,
            fmt::format(
                "Cannot open lock file {}: {}",
                lockFile.string(),
                describe_errno(errno)
            )
        );
    }

    if (::flock(m_FileDescriptor, LOCK_EX | LOCK_NB) != 0)
    {
        const int lockError = errno;

        ::close(m_FileDescriptor);
        m_FileDescriptor = -1;

        if (lockError == EWOULDBLOCK)
        {
            throw sync_exception(
                ErrorKind::BATCH_LOCKED,
                fmt::format("Another batch already holds {}", lockFile.string())
            );
        }

        throw sync_exception(
            ErrorKind::LOCK_FILE,
            fmt::format(
                "flock failed on {}: {}",
                lockFile.string(),
                describe_errno(lockError)
            )
        );
    }
}

BatchLock::~BatchLock()
{
    if (m_FileDescriptor >= 0)
    {
        ::flock(m_FileDescriptor, LOCK_UN);
        ::close(m_FileDescriptor);
    }
}
} // namespace nas_backup::backup_sync
