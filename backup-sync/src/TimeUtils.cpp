/**
 * @file TimeUtils.cpp
 * @brief
 */

// Header Being Defined
#include <nas_backup/backup_sync/TimeUtils.hpp>

// System Includes
#include <time.h>

// Standard Library Includes
#include <chrono>
#include <ctime>
#include <string>

// Third Party Library Includes
#include <spdlog/fmt/chrono.h>
#include <spdlog/fmt/fmt.h>

namespace nas_backup::backup_sync
{
auto to_iso8601(const std::chrono::system_clock::time_point timePoint)
    -> std::string
{
    const std::time_t seconds = std::chrono::system_clock::to_time_t(timePoint);
    const auto        micros
        = std::chrono::duration_cast<std::chrono::microseconds>(
              timePoint.time_since_epoch()
          )
              .count()
        % 1'000'000;

    std::tm localTime {};
    ::localtime_r(&seconds, &localTime);

    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06}", localTime, micros);
}

auto describe_duration(const std::chrono::seconds duration) -> std::string
{
    const auto count = duration.count();

    constexpr auto SECONDS_PER_HOUR   = 3600;
    constexpr auto SECONDS_PER_MINUTE = 60;

    if (count % SECONDS_PER_HOUR == 0)
    {
        const auto hours = count / SECONDS_PER_HOUR;
        return fmt::format("{} hour{}", hours, (hours == 1 ? "" : "s"));
    }

    if (count % SECONDS_PER_MINUTE == 0)
    {
        const auto minutes = count / SECONDS_PER_MINUTE;
        return fmt::format("{} minute{}", minutes, (minutes == 1 ? "" : "s"));
    }

    return fmt::format("{} second{}", count, (count == 1 ? "" : "s"));
}
} // namespace nas_backup::backup_sync
