/**
 * @file TestUtils.hpp
 * @brief Scratch directories, throwaway scripts and a silent logger for tests
 */

#pragma once

// System Includes
#include <stdlib.h>

// Standard Library Includes
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

// Third Party Library Includes
#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>

namespace nas_backup::backup_sync::test_support
{
inline auto make_null_logger() -> std::shared_ptr<spdlog::logger>
{
    return std::make_shared<spdlog::logger>(
        "backup-sync-test",
        std::make_shared<spdlog::sinks::null_sink_mt>()
    );
}

class TemporaryDirectory
{
  public: // Constructors
    TemporaryDirectory()
    {
        std::string pattern
            = (std::filesystem::temp_directory_path() / "backup-sync-XXXXXX")
                  .string();

        if (::mkdtemp(pattern.data()) == nullptr)
        {
            throw std::runtime_error("mkdtemp failed");
        }

        m_Path = pattern;
    }
    TemporaryDirectory(TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&&) = delete;
    auto operator=(TemporaryDirectory&) -> TemporaryDirectory = delete;
    auto operator=(TemporaryDirectory&&) -> TemporaryDirectory = delete;

    ~TemporaryDirectory()
    {
        std::error_code ignored;
        std::filesystem::remove_all(m_Path, ignored);
    }

  public: // Methods
    [[nodiscard]]
    auto path() const -> const std::filesystem::path&
    {
        return m_Path;
    }

    [[nodiscard]]
    auto operator/(const std::string& name) const -> std::filesystem::path
    {
        return m_Path / name;
    }

  private: // Members
    std::filesystem::path m_Path;
};

inline auto write_file(const std::filesystem::path& file, const std::string& contents)
    -> void
{
    std::ofstream output(file, std::ios::trunc | std::ios::binary);
    output << contents;
}

/**
 * @brief Write an executable /bin/sh script. Its arguments are whatever the
 * caller passes, rsync-style command lines included.
 */
inline auto write_script(const std::filesystem::path& file, const std::string& body)
    -> std::filesystem::path
{
    write_file(file, "#!/bin/sh\n" + body + "\n");

    std::filesystem::permissions(
        file,
        std::filesystem::perms::owner_all,
        std::filesystem::perm_options::replace
    );

    return file;
}
} // namespace nas_backup::backup_sync::test_support
