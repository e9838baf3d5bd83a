/**
 * @file BatchLock.hpp
 * @brief Exclusive, process-wide lock held for the duration of one batch
 */

#pragma once

// Standard Library Includes
#include <filesystem>

namespace nas_backup::backup_sync
{
/**
 * Holds an exclusive flock(2) on `lockFile` from construction until
 * destruction. The lock is released by the kernel if the process dies.
 */
class BatchLock
{
  public: // Constructors
    /**
     * Missing parent directories of `lockFile` are created.
     *
     * @throws sync_exception with ErrorKind::BATCH_LOCKED if another process
     * already holds the lock
     * @throws sync_exception with ErrorKind::LOCK_FILE if the lock file cannot
     * be created, opened or locked
     */
    explicit BatchLock(const std::filesystem::path& lockFile);
    BatchLock(BatchLock&) = delete;
    BatchLock(BatchLock&&) = delete;
    auto operator=(BatchLock&) -> BatchLock = delete;
    auto operator=(BatchLock&&) -> BatchLock = delete;

    ~BatchLock();

  private: // Members
    int m_FileDescriptor = -1;
};
} // namespace nas_backup::backup_sync
