/**
 * @file StatusStore.hpp
 * @brief Durable record of the latest result of every job plus run counters
 */

#pragma once

// Standard Library Includes
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Third Party Library Includes
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

// Project Includes
#include <nas_backup/backup_sync/RunResult.hpp>

namespace nas_backup::backup_sync
{
struct BatchSummary
{
    std::size_t successful = 0;
    std::size_t failed     = 0;
    std::size_t total      = 0;
};

struct StatusDocument
{
    std::map<std::string, RunResult> jobs;
    std::optional<std::string>       lastRun;
    std::uint64_t                    totalRuns = 0;
    std::optional<BatchSummary>      lastSummary;
};

auto to_json(nlohmann::json& json, const BatchSummary& summary) -> void;
auto from_json(const nlohmann::json& json, BatchSummary& summary) -> void;
auto to_json(nlohmann::json& json, const StatusDocument& document) -> void;
auto from_json(const nlohmann::json& json, StatusDocument& document) -> void;

class StatusStore
{
  public: // Constructors
    StatusStore(
        std::filesystem::path                statusFile,
        std::optional<std::filesystem::path> historyFile,
        std::shared_ptr<spdlog::logger>      logger
    );

  public: // Methods
    /**
     * @brief Replace the in-memory document with the one on disk
     *
     * A missing file yields the empty document. An unreadable or corrupt file
     * is logged and also yields the empty document.
     */
    auto load() -> const StatusDocument&;

    /**
     * @brief Overwrite the stored result for `result.name`
     */
    auto record_run(const RunResult& result) -> void;

    auto finalize_run(
        const std::string& batchStart,
        std::size_t        successful,
        std::size_t        failed
    ) -> void;

    /**
     * @brief Write the whole document to disk
     *
     * Failures are logged and reported through the return value only.
     * Results recorded since the last persist are also appended to the
     * history file when one is configured.
     */
    auto persist() -> bool;

    [[nodiscard]]
    auto get_document() const -> const StatusDocument&
    {
        return m_Document;
    }

  private: // Methods
    [[nodiscard]]
    auto read_document() const -> StatusDocument;
    auto write_document() const -> void;
    auto append_history() -> void;

  private: // Members
    std::filesystem::path                m_StatusFile;
    std::optional<std::filesystem::path> m_HistoryFile;
    std::shared_ptr<spdlog::logger>      m_Logger;
    StatusDocument                       m_Document;
    std::vector<RunResult>               m_UnsavedHistory;
};
} // namespace nas_backup::backup_sync
