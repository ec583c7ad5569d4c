#include "core/job_runner.hpp"
#include "support/fake_ai_client.hpp"
#include "support/in_memory_catalog_store.hpp"
#include "test_base.hpp"
#include <regex>
#include <set>
#include <thread>

class JobRunnerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        orchestrator_ = std::make_unique<PipelineOrchestrator>(store_, settings_, ai_);
        runner_ = std::make_unique<JobRunner>(store_, *orchestrator_);
    }

    void TearDown() override
    {
        runner_.reset();
        orchestrator_.reset();
        TestBase::TearDown();
    }

    InMemoryCatalogStore store_;
    FakeAiClient ai_;
    std::unique_ptr<PipelineOrchestrator> orchestrator_;
    std::unique_ptr<JobRunner> runner_;
};

TEST_F(JobRunnerTest, JobIdsAreTwelveHexCharacters)
{
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i)
    {
        std::string id = JobRunner::generateJobId();
        EXPECT_TRUE(std::regex_match(id, std::regex("[0-9a-f]{12}"))) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 50u);
}

TEST_F(JobRunnerTest, IngestJobCompletesWithAppliedFlag)
{
    writeFile("a.jpg", "a");
    std::string job_id = runner_->triggerIngest();
    ASSERT_FALSE(job_id.empty());
    runner_->waitForAll();

    auto job = runner_->getJobStatus(job_id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->kind, JobKind::INGEST);
    EXPECT_EQ(job->target, "all");
    EXPECT_EQ(job->state, JobState::COMPLETED);
    EXPECT_TRUE(job->applied);

    // Nothing left to change
    std::string second = runner_->triggerIngest();
    runner_->waitForAll();
    EXPECT_FALSE(runner_->getJobStatus(second)->applied);
}

TEST_F(JobRunnerTest, ProcessOneJobReportsItemOutcome)
{
    writeFile("a.jpg", "a");
    orchestrator_->ingest();
    int64_t id = store_.findMediaByPath(pathOf("a.jpg"))->id;

    ai_.replyWith(R"({"caption": "hello"})");
    std::string job_id = runner_->triggerProcessOne(id);
    runner_->waitForAll();

    auto job = runner_->getJobStatus(job_id);
    EXPECT_EQ(job->kind, JobKind::PROCESS_ONE);
    EXPECT_EQ(job->target, std::to_string(id));
    EXPECT_TRUE(job->applied);
    EXPECT_EQ(store_.getMedia(id)->status, MediaStatus::DONE);

    // Done records are left alone, so the second job applies nothing
    std::string again = runner_->triggerProcessOne(id);
    runner_->waitForAll();
    EXPECT_FALSE(runner_->getJobStatus(again)->applied);
}

TEST_F(JobRunnerTest, TargetsDescribeTheJob)
{
    std::string pending = runner_->triggerProcessPending(true);
    std::string retry = runner_->triggerRetryErrors();
    std::string tags = runner_->triggerTagScan({3, 5});
    std::string all_tags = runner_->triggerTagScan({});
    runner_->waitForAll();

    EXPECT_EQ(runner_->getJobStatus(pending)->target, "pending+errors");
    EXPECT_EQ(runner_->getJobStatus(retry)->target, "errors");
    EXPECT_EQ(runner_->getJobStatus(tags)->target, "3,5");
    EXPECT_EQ(runner_->getJobStatus(tags)->kind, JobKind::TAG_SCAN);
    EXPECT_EQ(runner_->getJobStatus(all_tags)->target, "all");
    EXPECT_FALSE(runner_->getJobStatus("000000000000").has_value());
}

TEST_F(JobRunnerTest, FinishedWorkersAreJoinedOnLaunch)
{
    std::vector<std::string> ids;
    for (int i = 0; i < 40; ++i)
        ids.push_back(runner_->triggerTagScan({}));

    auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (runner_->workerCount() > 0 && std::chrono::steady_clock::now() < give_up)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_EQ(runner_->workerCount(), 0u);

    for (const auto &id : ids)
        EXPECT_EQ(runner_->getJobStatus(id)->state, JobState::COMPLETED);

    // Launching again does not carry the old threads along
    runner_->triggerTagScan({});
    EXPECT_LE(runner_->workerCount(), 1u);
    runner_->waitForAll();
    EXPECT_EQ(runner_->workerCount(), 0u);
}
