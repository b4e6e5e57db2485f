#include <gtest/gtest.h>

#include "io/ManifestStore.h"
#include "core/PartPlanner.h"
#include "TestSupport.h"

#include <filesystem>
#include <thread>
#include <vector>

namespace {

Job makeJob(const std::string& id, std::uint64_t size, std::uint64_t partSize) {
    Job job;
    job.id = id;
    job.locator = "https://example.com/files/" + id + ".bin";
    job.targetName = "my file \"" + id + "\".bin";
    job.totalSize = size;
    job.partSize = partSize;
    job.state = JobState::Downloading;
    job.createdAt = 1700000000;
    job.concurrencyLimit = 2;
    return job;
}

void replaceInFile(const std::string& path, const std::string& from, const std::string& to) {
    std::string text = readAll(path);
    auto pos = text.find(from);
    ASSERT_NE(std::string::npos, pos) << from;
    text.replace(pos, from.size(), to);
    writeAll(path, text);
}

TEST(ManifestStore, PlanSurvivesReopen)
{
    TempDir dir;
    auto job = makeJob("job-a", 100, 30);
    {
        ManifestStore store(dir.path());
        ASSERT_TRUE(store.init());
        ASSERT_TRUE(store.recordPlan(job, PartPlanner(30).plan(100)));
        ASSERT_TRUE(store.markDone(job.id, 2, 30, 0xDEADBEEF));
        ASSERT_TRUE(store.markFailed(job.id, 1, "connection reset", 3));
    }

    ManifestStore reopened(dir.path());
    Job loaded;
    std::vector<Part> parts;
    ASSERT_TRUE(reopened.loadJob(job.id, loaded, parts));

    EXPECT_EQ(job.locator, loaded.locator);
    EXPECT_EQ(job.targetName, loaded.targetName);
    ASSERT_TRUE(loaded.totalSize.has_value());
    EXPECT_EQ(100u, *loaded.totalSize);
    EXPECT_EQ(30u, loaded.partSize);
    EXPECT_EQ(JobState::Downloading, loaded.state);
    EXPECT_EQ(2u, loaded.concurrencyLimit);

    ASSERT_EQ(4u, parts.size());
    EXPECT_EQ(PartState::Done, parts[2].state);
    EXPECT_EQ(30u, parts[2].lengthOnDisk);
    EXPECT_TRUE(parts[2].hasCrc);
    EXPECT_EQ(0xDEADBEEFu, parts[2].crc);
    EXPECT_EQ(PartState::Failed, parts[1].state);
    EXPECT_EQ(3u, parts[1].attempts);
    EXPECT_EQ("connection reset", parts[1].error);
    EXPECT_EQ(PartState::Pending, parts[0].state);
}

TEST(ManifestStore, InFlightPartsComeBackPending)
{
    TempDir dir;
    auto job = makeJob("job-b", 90, 30);
    {
        ManifestStore store(dir.path());
        ASSERT_TRUE(store.init());
        ASSERT_TRUE(store.recordPlan(job, PartPlanner(30).plan(90)));
        ASSERT_TRUE(store.markDone(job.id, 0, 30, 1));
        ASSERT_TRUE(store.markInFlight(job.id, 1));
    }

    ManifestStore reopened(dir.path());
    Job loaded;
    std::vector<Part> parts;
    ASSERT_TRUE(reopened.loadJob(job.id, loaded, parts));
    EXPECT_EQ(PartState::Done, parts[0].state);
    EXPECT_EQ(PartState::Pending, parts[1].state);
    EXPECT_EQ(PartState::Pending, parts[2].state);
}

TEST(ManifestStore, ConcurrentPartUpdatesAreNotLost)
{
    TempDir dir;
    auto job = makeJob("job-c", 64 * 10, 10);
    {
        ManifestStore store(dir.path());
        ASSERT_TRUE(store.init());
        ASSERT_TRUE(store.recordPlan(job, PartPlanner(10).plan(640)));

        std::vector<std::thread> threads;
        for (unsigned t = 0; t < 8; ++t) {
            threads.emplace_back([&store, &job, t]() {
                for (std::uint64_t i = t; i < 64; i += 8) {
                    EXPECT_TRUE(store.markInFlight(job.id, i));
                    EXPECT_TRUE(store.markDone(job.id, i, 10, static_cast<std::uint32_t>(i)));
                }
            });
        }
        for (auto& th : threads)
            th.join();
    }

    ManifestStore reopened(dir.path());
    Job loaded;
    std::vector<Part> parts;
    ASSERT_TRUE(reopened.loadJob(job.id, loaded, parts));
    ASSERT_EQ(64u, parts.size());
    for (const auto& p : parts) {
        EXPECT_EQ(PartState::Done, p.state) << "part " << p.index;
        EXPECT_EQ(p.index, p.crc);
    }
}

TEST(ManifestStore, ActiveJobsExcludeTerminal)
{
    TempDir dir;
    ManifestStore store(dir.path());
    ASSERT_TRUE(store.init());

    auto running = makeJob("job-run", 10, 10);
    auto failed = makeJob("job-failed", 10, 10);
    failed.createdAt += 5;
    ASSERT_TRUE(store.recordPlan(running, PartPlanner(10).plan(10)));
    ASSERT_TRUE(store.recordPlan(failed, PartPlanner(10).plan(10)));
    ASSERT_TRUE(store.setJobState(failed.id, JobState::Failed, "part 0 failed"));

    auto all = store.listJobs();
    ASSERT_EQ(2u, all.size());
    EXPECT_EQ("job-run", all[0].id);
    EXPECT_EQ("part 0 failed", all[1].error);

    auto active = store.listActiveJobs();
    ASSERT_EQ(1u, active.size());
    EXPECT_EQ("job-run", active[0].id);
}

TEST(ManifestStore, RemoveDeletesRecord)
{
    TempDir dir;
    ManifestStore store(dir.path());
    ASSERT_TRUE(store.init());

    auto job = makeJob("job-gone", 10, 10);
    ASSERT_TRUE(store.recordPlan(job, PartPlanner(10).plan(10)));
    ASSERT_TRUE(store.exists(job.id));

    ASSERT_TRUE(store.remove(job.id));
    EXPECT_FALSE(store.exists(job.id));
    EXPECT_FALSE(store.markDone(job.id, 0, 10, 0));

    ManifestStore reopened(dir.path());
    EXPECT_FALSE(reopened.exists(job.id));
    EXPECT_TRUE(reopened.listJobs().empty());
}

TEST(ManifestStore, ResetRetriesRequeuesFailedParts)
{
    TempDir dir;
    ManifestStore store(dir.path());
    ASSERT_TRUE(store.init());

    auto job = makeJob("job-retry", 20, 10);
    ASSERT_TRUE(store.recordPlan(job, PartPlanner(10).plan(20)));
    ASSERT_TRUE(store.markDone(job.id, 0, 10, 7));
    ASSERT_TRUE(store.markFailed(job.id, 1, "403", 8));
    ASSERT_TRUE(store.resetRetries(job.id));

    Job loaded;
    std::vector<Part> parts;
    ASSERT_TRUE(store.loadJob(job.id, loaded, parts));
    EXPECT_EQ(PartState::Done, parts[0].state);
    EXPECT_EQ(PartState::Pending, parts[1].state);
    EXPECT_EQ(0u, parts[1].attempts);
}

TEST(ManifestStore, HistoryNewestFirst)
{
    TempDir dir;
    ManifestStore store(dir.path());
    ASSERT_TRUE(store.init());

    for (int i = 0; i < 3; ++i) {
        HistoryEntry e;
        e.targetName = "file " + std::to_string(i) + ".bin";
        e.size = 100u + static_cast<std::uint64_t>(i);
        e.durationSec = 1.5;
        e.completedAt = 1700000000 + i;
        e.archivePath = "/archive/file " + std::to_string(i) + ".bin";
        ASSERT_TRUE(store.appendHistory(e));
    }

    auto recent = store.recentHistory(2);
    ASSERT_EQ(2u, recent.size());
    EXPECT_EQ("file 2.bin", recent[0].targetName);
    EXPECT_EQ(102u, recent[0].size);
    EXPECT_EQ("/archive/file 2.bin", recent[0].archivePath);
    EXPECT_EQ("file 1.bin", recent[1].targetName);

    ASSERT_TRUE(store.clearHistory());
    EXPECT_TRUE(store.recentHistory(10).empty());
}

} // namespace

TEST(ManifestStore, DamagedManifestsAreSkipped)
{
    TempDir dir;
    {
        ManifestStore store(dir.path());
        ASSERT_TRUE(store.init());
        for (const char* id : { "job-good", "job-count", "job-index" })
            ASSERT_TRUE(store.recordPlan(makeJob(id, 100, 30), PartPlanner(30).plan(100)));
    }

    const auto path = [&dir](const std::string& id) {
        return (std::filesystem::path(dir.path()) / (id + ".meta")).string();
    };
    replaceInFile(path("job-count"), "parts 4\n", "parts 18446744073709551615\n");
    replaceInFile(path("job-index"), "\n1 30 30 ", "\n7 30 30 ");

    ManifestStore reopened(dir.path());
    auto jobs = reopened.listActiveJobs();
    ASSERT_EQ(1u, jobs.size());
    EXPECT_EQ("job-good", jobs[0].id);

    Job loaded;
    std::vector<Part> parts;
    EXPECT_FALSE(reopened.loadJob("job-count", loaded, parts));
    EXPECT_FALSE(reopened.loadJob("job-index", loaded, parts));
}
