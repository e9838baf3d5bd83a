/**
 * @file ChildProcessTests.cpp
 * @brief
 */

// Standard Library Includes
#include <chrono>
#include <string>
#include <vector>

// Third Party Library Includes
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// Project Includes
#include <nas_backup/backup_sync/ChildProcess.hpp>
#include <nas_backup/backup_sync/SyncError.hpp>

// Test Includes
#include <TestUtils.hpp>

using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Lt;

using nas_backup::backup_sync::ChildProcess;
using nas_backup::backup_sync::ErrorKind;
using nas_backup::backup_sync::sync_exception;
using nas_backup::backup_sync::test_support::make_null_logger;

namespace
{
auto shell(const std::string& script) -> std::vector<std::string>
{
    return { "/bin/sh", "-c", script };
}

// NOLINTNEXTLINE
TEST(ChildProcessTest, CapturesBothStreamsAndExitCode)
{
    ChildProcess process(
        shell("echo to-stdout; echo to-stderr >&2; exit 3"),
        make_null_logger()
    );

    const auto outcome = process.run(std::chrono::seconds(10));

    EXPECT_THAT(outcome.returnCode, Eq(3));
    EXPECT_THAT(outcome.stdoutText, Eq("to-stdout\n"));
    EXPECT_THAT(outcome.stderrText, Eq("to-stderr\n"));
}

// NOLINTNEXTLINE
TEST(ChildProcessTest, DrainsOutputLargerThanThePipeBuffer)
{
    ChildProcess process(shell("yes | head -n 50000"), make_null_logger());

    const auto outcome = process.run(std::chrono::seconds(30));

    EXPECT_THAT(outcome.returnCode, Eq(0));
    EXPECT_THAT(outcome.stdoutText.size(), Eq(100000U));
    EXPECT_THAT(outcome.stderrText, IsEmpty());
}

// NOLINTNEXTLINE
TEST(ChildProcessTest, StdinIsClosed)
{
    ChildProcess process(shell("cat; echo done"), make_null_logger());

    const auto outcome = process.run(std::chrono::seconds(10));

    EXPECT_THAT(outcome.returnCode, Eq(0));
    EXPECT_THAT(outcome.stdoutText, Eq("done\n"));
}

// NOLINTNEXTLINE
TEST(ChildProcessTest, KillsTheChildAfterTheDeadline)
{
    ChildProcess process(shell("exec sleep 30"), make_null_logger());

    const auto start = std::chrono::steady_clock::now();

    try
    {
        [[maybe_unused]]
        const auto outcome = process.run(std::chrono::seconds(1));
        FAIL() << "A 30 second sleep finished inside a 1 second deadline";
    }
    catch (const sync_exception& se)
    {
        EXPECT_THAT(se.kind(), Eq(ErrorKind::JOB_TIMEOUT));
        EXPECT_THAT(std::string(se.what()), Eq("Timeout after 1 second"));
    }

    EXPECT_THAT(
        std::chrono::steady_clock::now() - start,
        Lt(std::chrono::seconds(10))
    );
}

// NOLINTNEXTLINE
TEST(ChildProcessTest, ReportsMissingExecutable)
{
    ChildProcess process(
        { "/nonexistent/backup-sync/rsync", "--version" },
        make_null_logger()
    );

    try
    {
        [[maybe_unused]]
        const auto outcome = process.run(std::chrono::seconds(10));
        FAIL() << "A missing executable was started";
    }
    catch (const sync_exception& se)
    {
        EXPECT_THAT(se.kind(), Eq(ErrorKind::JOB_EXECUTION));
        EXPECT_THAT(
            std::string(se.what()),
            Eq("[Errno 2] No such file or directory: "
               "'/nonexistent/backup-sync/rsync'")
        );
    }
}

// NOLINTNEXTLINE
TEST(ChildProcessTest, SignalDeathMapsToShellStyleCode)
{
    ChildProcess process(shell("kill -TERM $$"), make_null_logger());

    EXPECT_THAT(process.run(std::chrono::seconds(10)).returnCode, Eq(143));
}

// NOLINTNEXTLINE
TEST(ChildProcessTest, RejectsEmptyCommand)
{
    try
    {
        ChildProcess process({}, make_null_logger());
        FAIL() << "An empty command was accepted";
    }
    catch (const sync_exception& se)
    {
        EXPECT_THAT(se.kind(), Eq(ErrorKind::JOB_EXECUTION));
        EXPECT_THAT(std::string(se.what()), HasSubstr("empty command"));
    }
}
} // namespace
