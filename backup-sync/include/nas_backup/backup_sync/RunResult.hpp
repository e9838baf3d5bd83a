/**
 * @file RunResult.hpp
 * @brief Outcome of a single execution of one sync job
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

// Third Party Library Includes
#include <nlohmann/json.hpp>

namespace nas_backup::backup_sync
{
/**
 * PENDING -> RUNNING -> one of the four terminal states. Only terminal states
 * are ever stored in a RunResult.
 */
enum class JobState : std::uint8_t
{
    PENDING,
    RUNNING,
    SUCCEEDED,
    FAILED,
    TIMED_OUT,
    ERRORED,
};

[[nodiscard]]
auto to_string(JobState state) -> std::string_view;

[[nodiscard]]
auto job_state_from_string(std::string_view state) -> std::optional<JobState>;

using SyncStats = std::map<std::string, std::string>;

struct RunResult
{
    std::string                name;
    std::string                source;
    std::string                destination;
    std::string                startTime;
    double                     duration   = 0.0;
    bool                       success    = false;
    int                        returnCode = -1;
    SyncStats                  stats;
    std::string                stdoutText;
    std::string                stderrText;
    std::optional<std::string> error;
    JobState                   state = JobState::PENDING;
};

// Persisted field names are shared with the status dashboard
auto to_json(nlohmann::json& json, const RunResult& result) -> void;

// Missing fields fall back to the RunResult defaults
auto from_json(const nlohmann::json& json, RunResult& result) -> void;
} // namespace nas_backup::backup_sync
