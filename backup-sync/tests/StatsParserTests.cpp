/**
 * @file StatsParserTests.cpp
 * @brief
 */

// Third Party Library Includes
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// Project Includes
#include <nas_backup/backup_sync/StatsParser.hpp>

using ::testing::IsEmpty;
using ::testing::Pair;
using ::testing::UnorderedElementsAre;

using nas_backup::backup_sync::parse_rsync_stats;

namespace
{
// NOLINTNEXTLINE
TEST(StatsParserTest, ExtractsRecognizedLabels)
{
    const auto stats = parse_rsync_stats(
        "Number of files: 120\nTotal transferred file size: 4,096 bytes\n"
    );

    EXPECT_THAT(
        stats,
        UnorderedElementsAre(
            Pair("total_files", "120"),
            Pair("transferred_size", "4,096 bytes")
        )
    );
}

// NOLINTNEXTLINE
TEST(StatsParserTest, NoRecognizedLinesGivesEmptyMap)
{
    EXPECT_THAT(parse_rsync_stats(""), IsEmpty());
    EXPECT_THAT(
        parse_rsync_stats("sending incremental file list\nphotos/a.jpg\n"),
        IsEmpty()
    );
}

// NOLINTNEXTLINE
TEST(StatsParserTest, ParsesFullRsyncSummary)
{
    constexpr auto output
        = "sending incremental file list\n"
          "\n"
          "Number of files: 1,523 (reg: 1,400, dir: 123)\n"
          "Number of created files: 12 (reg: 12)\n"
          "Number of deleted files: 3 (reg: 3)\n"
          "Number of regular files transferred: 15\n"
          "Total file size: 12.34G bytes\n"
          "Total transferred file size: 45.67M bytes\n"
          "Literal data: 45.67M bytes\n"
          "\n"
          "sent 45.70M bytes  received 1.23K bytes  9.14M bytes/sec\n"
          "total size is 12.34G  speedup is 270.01\n";

    EXPECT_THAT(
        parse_rsync_stats(output),
        UnorderedElementsAre(
            Pair("total_files", "1,523 (reg: 1,400, dir: 123)"),
            Pair("created_files", "12 (reg: 12)"),
            Pair("deleted_files", "3 (reg: 3)"),
            Pair("total_size", "12.34G bytes"),
            Pair("transferred_size", "45.67M bytes")
        )
    );
}

// NOLINTNEXTLINE
TEST(StatsParserTest, ToleratesCarriageReturnsAndMissingTrailingNewline)
{
    const auto stats
        = parse_rsync_stats("Number of deleted files: 0\r\nTotal file size: 10 bytes");

    EXPECT_THAT(
        stats,
        UnorderedElementsAre(
            Pair("deleted_files", "0"),
            Pair("total_size", "10 bytes")
        )
    );
}

// NOLINTNEXTLINE
TEST(StatsParserTest, EmptyValueIsKept)
{
    EXPECT_THAT(
        parse_rsync_stats("Number of files:\n"),
        UnorderedElementsAre(Pair("total_files", ""))
    );
}
} // namespace
