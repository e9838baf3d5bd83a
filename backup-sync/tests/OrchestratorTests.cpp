/**
 * @file OrchestratorTests.cpp
 * @brief
 */

// Standard Library Includes
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Third Party Library Includes
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// Project Includes
#include <nas_backup/backup_sync/BackupConfig.hpp>
#include <nas_backup/backup_sync/BatchLock.hpp>
#include <nas_backup/backup_sync/JobRunner.hpp>
#include <nas_backup/backup_sync/JobSpec.hpp>
#include <nas_backup/backup_sync/Notifier.hpp>
#include <nas_backup/backup_sync/Orchestrator.hpp>
#include <nas_backup/backup_sync/RunResult.hpp>
#include <nas_backup/backup_sync/StatusStore.hpp>

// Test Includes
#include <TestUtils.hpp>

using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Key;
using ::testing::Not;
using ::testing::SizeIs;

using nas_backup::backup_sync::BatchLock;
using nas_backup::backup_sync::JobRunner;
using nas_backup::backup_sync::JobSpec;
using nas_backup::backup_sync::JobState;
using nas_backup::backup_sync::MailMessage;
using nas_backup::backup_sync::NotificationSettings;
using nas_backup::backup_sync::Notifier;
using nas_backup::backup_sync::Orchestrator;
using nas_backup::backup_sync::Settings;
using nas_backup::backup_sync::StatusDocument;
using nas_backup::backup_sync::StatusStore;
using nas_backup::backup_sync::test_support::make_null_logger;
using nas_backup::backup_sync::test_support::TemporaryDirectory;
using nas_backup::backup_sync::test_support::write_script;

namespace
{
class CapturingNotifier : public Notifier
{
  public: // Constructors
    CapturingNotifier()
        : Notifier(
              NotificationSettings { .smtpServer = "smtp.example.com",
                                     .smtpPort   = 587,
                                     .smtpUser   = "backup@example.com",
                                     .smtpPass   = "secret",
                                     .email      = "ops@example.com" },
              make_null_logger()
          )
    {
    }

  public: // Methods
    [[nodiscard]]
    auto get_sent() const -> const std::vector<MailMessage>&
    {
        return m_Sent;
    }

  protected: // Methods
    auto deliver(const MailMessage& message) -> void override
    {
        m_Sent.emplace_back(message);
    }

  private: // Members
    std::vector<MailMessage> m_Sent;
};

auto make_job(const std::string& name, const bool enabled = true) -> JobSpec
{
    JobSpec job;
    job.name        = name;
    job.source      = "/mnt/nas/" + name + "/";
    job.destination = "backup@host:/backup/" + name + "/";
    job.enabled     = enabled;
    return job;
}

// Fixture with a fake rsync that fails for any destination containing "fail"
class OrchestratorTest : public ::testing::Test
{
  protected: // Methods
    auto SetUp() -> void override
    {
        m_Settings.rsyncPath = write_script(
                                   m_Directory / "rsync",
                                   "for last; do :; done\n"
                                   "case \"$last\" in\n"
                                   "  *fail*) echo 'rsync error' >&2; exit 12;;\n"
                                   "esac\n"
                                   "echo 'Number of files: 3'\n"
                                   "exit 0"
        )
                                   .string();
        m_Settings.statusFile = m_Directory / "status.json";
        m_Settings.lockFile   = m_Directory / "status.json.lock";
    }

    auto run_batch(const std::vector<JobSpec>& jobs) -> bool
    {
        const JobRunner runner(m_Settings, make_null_logger());
        StatusStore     store(m_Settings.statusFile, std::nullopt, make_null_logger());

        Orchestrator orchestrator(
            jobs,
            m_Settings.lockFile,
            runner,
            store,
            m_Notifier,
            make_null_logger()
        );

        const bool succeeded = orchestrator.run_batch();
        m_LastDocument       = store.get_document();

        return succeeded;
    }

  protected: // Members
    TemporaryDirectory m_Directory;
    Settings           m_Settings;
    CapturingNotifier  m_Notifier;
    StatusDocument     m_LastDocument;
};

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, MixedBatchRecordsAndNotifiesFailures)
{
    const bool succeeded = run_batch(
        { make_job("photos"), make_job("fail-documents"), make_job("music", false) }
    );

    EXPECT_FALSE(succeeded);

    EXPECT_THAT(m_LastDocument.jobs, ElementsAre(Key("fail-documents"), Key("photos")));
    EXPECT_THAT(m_LastDocument.totalRuns, Eq(1U));
    ASSERT_TRUE(m_LastDocument.lastRun.has_value());
    ASSERT_TRUE(m_LastDocument.lastSummary.has_value());
    EXPECT_THAT(m_LastDocument.lastSummary->successful, Eq(1U));
    EXPECT_THAT(m_LastDocument.lastSummary->failed, Eq(1U));
    EXPECT_THAT(m_LastDocument.lastSummary->total, Eq(2U));

    const auto& failed = m_LastDocument.jobs.at("fail-documents");
    EXPECT_THAT(failed.returnCode, Eq(12));
    EXPECT_THAT(failed.state, Eq(JobState::FAILED));

    ASSERT_THAT(m_Notifier.get_sent(), SizeIs(1));
    EXPECT_THAT(
        m_Notifier.get_sent().front().subject,
        Eq("Backup Sync Failed - 1 job(s)")
    );

    StatusStore reloaded(m_Settings.statusFile, std::nullopt, make_null_logger());
    EXPECT_THAT(reloaded.load().jobs, SizeIs(2));
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, CleanBatchSendsNothing)
{
    EXPECT_TRUE(run_batch({ make_job("photos"), make_job("documents") }));

    EXPECT_THAT(m_Notifier.get_sent(), IsEmpty());
    EXPECT_THAT(m_LastDocument.jobs.at("photos").stats.at("total_files"), Eq("3"));
    EXPECT_THAT(m_LastDocument.jobs.at("documents").state, Eq(JobState::SUCCEEDED));
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, EmptyBatchStillCountsAsARun)
{
    EXPECT_TRUE(run_batch({ make_job("photos", false) }));

    EXPECT_THAT(m_LastDocument.jobs, IsEmpty());
    EXPECT_THAT(m_LastDocument.totalRuns, Eq(1U));
    ASSERT_TRUE(m_LastDocument.lastSummary.has_value());
    EXPECT_THAT(m_LastDocument.lastSummary->total, Eq(0U));
    EXPECT_THAT(m_Notifier.get_sent(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, RunCounterAccumulatesAcrossBatches)
{
    EXPECT_TRUE(run_batch({ make_job("photos") }));
    EXPECT_FALSE(run_batch({ make_job("fail-photos") }));
    EXPECT_TRUE(run_batch({ make_job("photos") }));

    EXPECT_THAT(m_LastDocument.totalRuns, Eq(3U));
    EXPECT_THAT(m_LastDocument.jobs, SizeIs(2));
    EXPECT_THAT(m_Notifier.get_sent(), SizeIs(1));
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, HeldLockSkipsTheBatch)
{
    const BatchLock otherBatch(m_Settings.lockFile);

    EXPECT_FALSE(run_batch({ make_job("photos") }));

    EXPECT_FALSE(std::filesystem::exists(m_Settings.statusFile));
    EXPECT_THAT(m_Notifier.get_sent(), IsEmpty());
}
// NOLINTNEXTLINE
TEST_F(OrchestratorTest, NotificationListsEveryFailedJob)
{
    const bool succeeded = run_batch(
        { make_job("fail-photos"),
          make_job("documents"),
          make_job("fail-music"),
          make_job("fail-archive", false) }
    );

    EXPECT_FALSE(succeeded);
    ASSERT_TRUE(m_LastDocument.lastSummary.has_value());
    EXPECT_THAT(m_LastDocument.lastSummary->failed, Eq(2U));

    ASSERT_THAT(m_Notifier.get_sent(), SizeIs(1));
    const auto& message = m_Notifier.get_sent().front();

    EXPECT_THAT(message.subject, Eq("Backup Sync Failed - 2 job(s)"));
    EXPECT_THAT(
        message.body,
        AllOf(
            HasSubstr("• fail-photos\n"),
            HasSubstr("• fail-music\n"),
            HasSubstr("Unknown error (return code 12)"),
            Not(HasSubstr("documents")),
            Not(HasSubstr("fail-archive"))
        )
    );
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, FreshStateDirectoryIsCreated)
{
    m_Settings.statusFile = m_Directory / "var" / "lib" / "status.json";
    m_Settings.lockFile   = m_Directory / "var" / "lib" / "status.json.lock";

    EXPECT_TRUE(run_batch({ make_job("photos") }));

    EXPECT_TRUE(std::filesystem::exists(m_Settings.statusFile));
    EXPECT_THAT(m_LastDocument.jobs, ElementsAre(Key("photos")));
}
} // namespace
