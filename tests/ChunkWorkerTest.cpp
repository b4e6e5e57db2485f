#include <gtest/gtest.h>

#include "core/ChunkWorker.h"
#include "core/PartPlanner.h"
#include "FakeFetchClient.h"
#include "TestSupport.h"

#include <mutex>

namespace {

const std::string kUrl = "https://example.com/data.bin";

struct WorkerFixture {
    TempDir dir;
    EngineConfig cfg = testConfig(dir);
    std::string content = makeContent(40 * 1024);

    FakeFetchClient client;
    ManifestStore manifest{ cfg.manifestDir };
    ScratchArea scratch{ cfg.scratchDir };
    ConcurrencyBudget budget{ 2 };
    ProgressTracker progress{ 40 * 1024 };
    CancellationToken token;
    RetryPolicy policy = RetryPolicy::fromConfig(cfg);

    Job job;
    std::unique_ptr<PartQueue> queue;

    std::mutex reportsMutex;
    std::vector<WorkerReport> reports;

    WorkerFixture() {
        client.addSource(kUrl, content);

        job.id = "job-worker";
        job.locator = kUrl;
        job.targetName = "data.bin";
        job.totalSize = content.size();
        job.partSize = cfg.partSize;

        auto parts = PartPlanner(cfg.partSize).plan(content.size());
        manifest.init();
        manifest.recordPlan(job, parts);
        std::string err;
        scratch.ensureJobDir(job.id, err);
        queue = std::make_unique<PartQueue>(parts, policy);
    }

    void runWorker() {
        ChunkWorker worker(job, *queue, client, budget, manifest, scratch, progress, token,
            [this](const WorkerReport& rep) {
                std::lock_guard<std::mutex> lock(reportsMutex);
                reports.push_back(rep);
            });
        worker.run();
    }

    std::vector<Part> persistedParts() {
        Job loaded;
        std::vector<Part> parts;
        manifest.loadJob(job.id, loaded, parts);
        return parts;
    }
};

TEST(ChunkWorker, FetchesEveryPartIntoItsFile)
{
    WorkerFixture f;
    f.runWorker();

    ASSERT_TRUE(f.queue->allDone());
    auto parts = f.queue->snapshot();
    ASSERT_EQ(3u, parts.size());
    for (const auto& p : parts) {
        EXPECT_EQ(f.content.substr(p.offset, p.length), readAll(f.scratch.partPath(f.job.id, p.index)));
        EXPECT_TRUE(p.hasCrc);
    }

    for (const auto& p : f.persistedParts())
        EXPECT_EQ(PartState::Done, p.state);

    EXPECT_EQ(f.content.size(), f.progress.transferred());
    EXPECT_EQ(3u, f.reports.size());
}

TEST(ChunkWorker, TransientFailuresAreRetried)
{
    WorkerFixture f;
    f.client.failRange(kUrl, 0, fetchError(ErrorKind::Transient, "connection reset"), 2);
    f.runWorker();

    ASSERT_TRUE(f.queue->allDone());
    EXPECT_EQ(2u, f.queue->snapshot()[0].attempts);

    std::size_t retried = 0;
    for (const auto& r : f.reports) {
        if (!r.success) {
            EXPECT_TRUE(r.willRetry);
            EXPECT_EQ(ErrorKind::Transient, r.error.kind);
            ++retried;
        }
    }
    EXPECT_EQ(2u, retried);
}

TEST(ChunkWorker, ShortReadIsRetried)
{
    WorkerFixture f;
    f.client.truncateRange(kUrl, f.cfg.partSize);
    f.runWorker();

    ASSERT_TRUE(f.queue->allDone());
    const Part part = f.queue->snapshot()[1];
    EXPECT_EQ(1u, part.attempts);
    EXPECT_EQ(f.content.substr(part.offset, part.length), readAll(f.scratch.partPath(f.job.id, 1)));
}

TEST(ChunkWorker, FatalErrorIsNotRetried)
{
    WorkerFixture f;
    f.client.failRange(kUrl, 0, fetchError(ErrorKind::Fatal, "403 forbidden"));
    f.runWorker();

    EXPECT_TRUE(f.queue->anyFailed());
    auto parts = f.queue->snapshot();
    EXPECT_EQ(PartState::Failed, parts[0].state);
    EXPECT_EQ(1u, parts[0].attempts);
    EXPECT_EQ(PartState::Done, parts[1].state);

    EXPECT_EQ(PartState::Failed, f.persistedParts()[0].state);

    bool sawFatal = false;
    for (const auto& r : f.reports) {
        if (r.partIndex == 0) {
            EXPECT_FALSE(r.willRetry);
            sawFatal = r.error.kind == ErrorKind::Fatal;
        }
    }
    EXPECT_TRUE(sawFatal);
}

TEST(ChunkWorker, RetryBudgetRunsOut)
{
    WorkerFixture f;
    f.client.failRangeAlways(kUrl, 0, fetchError(ErrorKind::Transient, "timeout"));
    f.runWorker();

    auto part = f.queue->snapshot()[0];
    EXPECT_EQ(PartState::Failed, part.state);
    EXPECT_EQ(f.cfg.maxPartAttempts, part.attempts);
    EXPECT_EQ(f.cfg.maxPartAttempts, f.persistedParts()[0].attempts);
}

TEST(ChunkWorker, RateLimitWaitsForHint)
{
    WorkerFixture f;
    f.client.failRange(kUrl, 0, fetchError(ErrorKind::RateLimited, "429", std::chrono::milliseconds(50)));

    const auto start = std::chrono::steady_clock::now();
    f.runWorker();

    ASSERT_TRUE(f.queue->allDone());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
}

TEST(ChunkWorker, CancelSeversStalledFetch)
{
    WorkerFixture f;
    f.client.setStall(true);

    std::thread canceller([&f]() {
        eventually([&f]() { return f.client.activeStreams() > 0; });
        f.token.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    f.runWorker();
    canceller.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    for (const auto& p : f.queue->snapshot())
        EXPECT_EQ(PartState::Pending, p.state);
    EXPECT_EQ(0u, f.budget.inUse());
}

} // namespace
