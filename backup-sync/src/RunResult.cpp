/**
 * @file RunResult.cpp
 * @brief
 */

// Header Being Defined
#include <nas_backup/backup_sync/RunResult.hpp>

// Standard Library Includes
#include <optional>
#include <string>
#include <string_view>

// Third Party Library Includes
#include <nlohmann/json.hpp>

namespace nas_backup::backup_sync
{
auto to_string(const JobState state) -> std::string_view
{
    using namespace std::string_view_literals;

    switch (state)
    {
    case JobState::PENDING:
        return "PENDING"sv;
    case JobState::RUNNING:
        return "RUNNING"sv;
    case JobState::SUCCEEDED:
        return "SUCCEEDED"sv;
    case JobState::FAILED:
        return "FAILED"sv;
    case JobState::TIMED_OUT:
        return "TIMED_OUT"sv;
    case JobState::ERRORED:
        return "ERRORED"sv;
    }

    return "UNKNOWN"sv;
}

auto job_state_from_string(const std::string_view state)
    -> std::optional<JobState>
{
    for (const auto candidate :
         { JobState::PENDING,
           JobState::RUNNING,
           JobState::SUCCEEDED,
           JobState::FAILED,
           JobState::TIMED_OUT,
           JobState::ERRORED })
    {
        if (to_string(candidate) == state)
        {
            return candidate;
        }
    }

    return std::nullopt;
}

auto to_json(nlohmann::json& json, const RunResult& result) -> void
{
    json = nlohmann::json {
        { "name", result.name },
        { "source", result.source },
        { "destination", result.destination },
        { "last_run", result.startTime },
        { "duration", result.duration },
        { "success", result.success },
        { "return_code", result.returnCode },
        { "stats", result.stats },
        { "stdout", result.stdoutText },
        { "stderr", result.stderrText },
        { "state", std::string(to_string(result.state)) },
    };

    if (result.error.has_value())
    {
        json["error"] = result.error.value();
    }
}

auto from_json(const nlohmann::json& json, RunResult& result) -> void
{
    result.name        = json.value("name", "");
    result.source      = json.value("source", "");
    result.destination = json.value("destination", "");
    result.startTime   = json.value("last_run", "");
    result.duration    = json.value("duration", 0.0);
    result.success     = json.value("success", false);
    result.returnCode  = json.value("return_code", -1);
    result.stats       = json.value("stats", SyncStats {});
    result.stdoutText  = json.value("stdout", "");
    result.stderrText  = json.value("stderr", "");

    if (json.contains("error") && json.at("error").is_string())
    {
        result.error = json.at("error").get<std::string>();
    }
    else
    {
        result.error.reset();
    }

    // Documents written before the state field existed only carry `success`
    const auto state = job_state_from_string(json.value("state", ""));
    if (state.has_value())
    {
        result.state = state.value();
    }
    else
    {
        result.state = result.success ? JobState::SUCCEEDED : JobState::FAILED;
    }
}
} // namespace nas_backup::backup_sync
