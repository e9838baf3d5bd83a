/**
 * @file StatusStore.cpp
 * @brief
 */

// Header Being Defined
#include <nas_backup/backup_sync/StatusStore.hpp>

// Standard Library Includes
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

// Third Party Library Includes
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>

// Project Includes
#include <nas_backup/backup_sync/RunResult.hpp>
#include <nas_backup/backup_sync/SyncError.hpp>

namespace nas_backup::backup_sync
{
namespace
{
constexpr int JSON_INDENT = 2;

// Captured rsync output can hold file names that are not valid UTF-8
auto dump_json(const nlohmann::json& json, const int indent) -> std::string
{
    return json.dump(
        indent,
        ' ',
        false,
        nlohmann::json::error_handler_t::replace
    );
}

template <typename Count>
auto read_count(const nlohmann::json& json, const std::string& key, Count fallback)
    -> Count
{
    if (!json.contains(key))
    {
        return fallback;
    }

    const auto& value = json.at(key);

    if (!value.is_number_unsigned())
    {
        throw sync_exception(
            ErrorKind::STATUS_LOAD,
            fmt::format("\"{}\" must be a non-negative integer, got {}", key, value.dump())
        );
    }

    return value.get<Count>();
}
} // namespace

auto to_json(nlohmann::json& json, const BatchSummary& summary) -> void
{
    json = nlohmann::json {
        { "successful", summary.successful },
        { "failed", summary.failed },
        { "total", summary.total },
    };
}

auto from_json(const nlohmann::json& json, BatchSummary& summary) -> void
{
    summary.successful = read_count(json, "successful", std::size_t { 0 });
    summary.failed     = read_count(json, "failed", std::size_t { 0 });
    summary.total
        = read_count(json, "total", summary.successful + summary.failed);
}

auto to_json(nlohmann::json& json, const StatusDocument& document) -> void
{
    json = nlohmann::json {
        { "jobs", document.jobs },
        { "last_run", nullptr },
        { "total_runs", document.totalRuns },
    };

    if (document.lastRun.has_value())
    {
        json["last_run"] = document.lastRun.value();
    }

    if (document.lastSummary.has_value())
    {
        json["last_summary"] = document.lastSummary.value();
    }
}

auto from_json(const nlohmann::json& json, StatusDocument& document) -> void
{
    document = StatusDocument {};

    if (!json.is_object())
    {
        throw sync_exception(
            ErrorKind::STATUS_LOAD,
            fmt::format("Status document is a JSON {}, not an object", json.type_name())
        );
    }

    if (json.contains("jobs"))
    {
        document.jobs = json.at("jobs").get<std::map<std::string, RunResult>>();
    }

    if (json.contains("last_run") && json.at("last_run").is_string())
    {
        document.lastRun = json.at("last_run").get<std::string>();
    }

    document.totalRuns = read_count(json, "total_runs", std::uint64_t { 0 });

    if (json.contains("last_summary") && json.at("last_summary").is_object())
    {
        document.lastSummary = json.at("last_summary").get<BatchSummary>();
    }
}

StatusStore::StatusStore(
    std::filesystem::path                statusFile,
    std::optional<std::filesystem::path> historyFile,
    std::shared_ptr<spdlog::logger>      logger
)
    : m_StatusFile(std::move(statusFile)),
      m_HistoryFile(std::move(historyFile)),
      m_Logger(std::move(logger))
{
}

auto StatusStore::load() -> const StatusDocument&
{
    m_UnsavedHistory.clear();

    std::error_code errorCode;

    // Anything other than a clean "does not exist" goes through the read path
    if (!std::filesystem::exists(m_StatusFile, errorCode) && !errorCode)
    {
        m_Logger->info(
            "No status file at {}. Starting with an empty status",
            m_StatusFile.string()
        );
        m_Document = StatusDocument {};

        return m_Document;
    }

    try
    {
        m_Document = this->read_document();
        m_Logger->debug(
            "Loaded status for {} jobs from {}",
            m_Document.jobs.size(),
            m_StatusFile.string()
        );
    }
    catch (const sync_exception& se)
    {
        m_Logger->error("{}: {}", to_string(se.kind()), se.what());
        m_Document = StatusDocument {};
    }

    return m_Document;
}

auto StatusStore::read_document() const -> StatusDocument
{
    std::ifstream statusFile(m_StatusFile);

    if (!statusFile.good())
    {
        throw sync_exception(
            ErrorKind::STATUS_LOAD,
            fmt::format(
                "Failed to open status file {}! OS Error: {}",
                m_StatusFile.string(),
                describe_errno(errno)
            )
        );
    }

    try
    {
        return nlohmann::json::parse(statusFile).get<StatusDocument>();
    }
    catch (const nlohmann::json::exception& je)
    {
        throw sync_exception(
            ErrorKind::STATUS_LOAD,
            fmt::format(
                "Failed to load status file {}: {}",
                m_StatusFile.string(),
                je.what()
            )
        );
    }
}

auto StatusStore::record_run(const RunResult& result) -> void
{
    m_Document.jobs.insert_or_assign(result.name, result);

    if (m_HistoryFile.has_value())
    {
        m_UnsavedHistory.emplace_back(result);
    }
}

auto StatusStore::finalize_run(
    const std::string& batchStart,
    const std::size_t  successful,
    const std::size_t  failed
) -> void
{
    m_Document.lastRun = batchStart;
    m_Document.totalRuns += 1;
    m_Document.lastSummary = BatchSummary { .successful = successful,
                                            .failed     = failed,
                                            .total = successful + failed };
}

auto StatusStore::persist() -> bool
{
    bool persisted = true;

    try
    {
        this->write_document();
        m_Logger->debug("Status written to {}", m_StatusFile.string());
    }
    catch (const sync_exception& se)
    {
        m_Logger->error("{}: {}", to_string(se.kind()), se.what());
        persisted = false;
    }

    this->append_history();

    return persisted;
}

auto StatusStore::write_document() const -> void
{
    std::filesystem::path temporaryFile = m_StatusFile;
    temporaryFile += ".tmp";

    std::error_code errorCode;

    if (m_StatusFile.has_parent_path())
    {
        std::filesystem::create_directories(m_StatusFile.parent_path(), errorCode);
    }

    {
        std::ofstream output(temporaryFile, std::ios::trunc);

        if (!output.good())
        {
            throw sync_exception(
                ErrorKind::STATUS_PERSIST,
                fmt::format(
                    "Failed to open {} for writing! OS Error: {}",
                    temporaryFile.string(),
                    describe_errno(errno)
                )
            );
        }

        output << dump_json(nlohmann::json(m_Document), JSON_INDENT) << '\n';
        output.flush();

        if (!output.good())
        {
            throw sync_exception(
                ErrorKind::STATUS_PERSIST,
                fmt::format("Failed to write {}", temporaryFile.string())
            );
        }
    }

    std::filesystem::rename(temporaryFile, m_StatusFile, errorCode);

    if (errorCode)
    {
        const auto renameError = errorCode.message();
        std::filesystem::remove(temporaryFile, errorCode);

        throw sync_exception(
            ErrorKind::STATUS_PERSIST,
            fmt::format(
                "Failed to move status into place at {}: {}",
                m_StatusFile.string(),
                renameError
            )
        );
    }
}

auto StatusStore::append_history() -> void
{
    if (!m_HistoryFile.has_value() || m_UnsavedHistory.empty())
    {
        return;
    }

    std::ofstream history(m_HistoryFile.value(), std::ios::app);

    if (!history.good())
    {
        m_Logger->error(
            "{}: Failed to open history file {}! OS Error: {}",
            to_string(ErrorKind::STATUS_PERSIST),
            m_HistoryFile->string(),
            describe_errno(errno)
        );
        return;
    }

    for (const auto& result : m_UnsavedHistory)
    {
        history << dump_json(nlohmann::json(result), -1) << '\n';
    }

    if (!history.good())
    {
        m_Logger->error(
            "{}: Failed to append to history file {}",
            to_string(ErrorKind::STATUS_PERSIST),
            m_HistoryFile->string()
        );
        return;
    }

    m_UnsavedHistory.clear();
}
} // namespace nas_backup::backup_sync
