/**
 * @file StatsParser.cpp
 * @brief
 */

// Header Being Defined
#include <nas_backup/backup_sync/StatsParser.hpp>

// Standard Library Includes
#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace nas_backup::backup_sync
{
namespace
{
using namespace std::string_view_literals;

constexpr std::array<std::pair<std::string_view, std::string_view>, 5>
    STAT_LABELS = {
        { { "Number of files:"sv, "total_files"sv },
          { "Number of created files:"sv, "created_files"sv },
          { "Number of deleted files:"sv, "deleted_files"sv },
          { "Total transferred file size:"sv, "transferred_size"sv },
          { "Total file size:"sv, "total_size"sv } }
    };

constexpr auto WHITESPACE = " \t\r\n"sv;

auto trim(std::string_view text) -> std::string_view
{
    const auto first = text.find_first_not_of(WHITESPACE);

    if (first == std::string_view::npos)
    {
        return {};
    }

    const auto last = text.find_last_not_of(WHITESPACE);

    return text.substr(first, last - first + 1);
}
} // namespace

auto parse_rsync_stats(const std::string_view output) -> SyncStats
{
    SyncStats stats;

    std::size_t lineStart = 0;
    while (lineStart < output.size())
    {
        auto lineEnd = output.find('\n', lineStart);
        if (lineEnd == std::string_view::npos)
        {
            lineEnd = output.size();
        }

        const auto line = trim(output.substr(lineStart, lineEnd - lineStart));
        lineStart       = lineEnd + 1;

        for (const auto& [label, key] : STAT_LABELS)
        {
            if (!line.starts_with(label))
            {
                continue;
            }

            // Labels end with the line's first colon
            const auto value = trim(line.substr(line.find(':') + 1));
            stats.insert_or_assign(std::string(key), std::string(value));
            break;
        }
    }

    return stats;
}
} // namespace nas_backup::backup_sync
