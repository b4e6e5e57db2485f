#pragma once
#include <map>
#include <set>
#include <deque>
#include <mutex>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <chrono>
#include <optional>
#include <condition_variable>

#include "utils.h"
#include "JobRegistry.h"
#include "JobController.h"
#include "ConcurrencyBudget.h"
#include "../io/ManifestStore.h"
#include "../io/ScratchArea.h"
#include "../io/StorageTiering.h"
#include "../net/FetchClient.h"
#include "../monitor/Logger.h"

// Control/query surface of the download engine. Jobs past Queued are
// capped at cfg.globalConcurrency; the rest wait in FIFO order.
class Engine {
public:
    Engine(const EngineConfig& config, FetchClient& client, Logger& logger, StorageTiering& tiering);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Requeues every unfinished job found in the manifest store and starts
    // admitting jobs.
    bool start();

    // Stops all running jobs without deleting anything.
    void shutdown();

    std::string enqueue(const std::string& locator, const std::string& targetName,
        const JobOptions& options = {});
    CancelResult cancel(const std::string& jobId);

    // Failed jobs only.
    bool resume(const std::string& jobId);
    bool discard(const std::string& jobId);

    std::optional<JobStatus> getStatus(const std::string& jobId);
    std::vector<JobStatus> listJobs();

    std::vector<HistoryEntry> history(std::size_t limit) const;
    bool clearHistory();

    bool waitForTerminal(const std::string& jobId, std::chrono::milliseconds timeout);
    std::size_t activeJobs() const;

    static std::string targetNameFor(const std::string& locator, const std::string& requested);

private:
    void dispatchLoop();
    void admitLocked();
    void onTerminal(const std::string& jobId, JobState state);
    void reap();

    std::shared_ptr<JobController> makeController(const Job& job);
    std::string nextJobId();
    std::optional<JobStatus> statusFromManifest(const std::string& jobId);

private:
    EngineConfig cfg;
    FetchClient& client;
    Logger& logger;
    StorageTiering& tiering;

    ManifestStore manifest;
    ScratchArea scratch;
    ConcurrencyBudget budget;
    JobContext ctx;
    JobRegistry registry;

    mutable std::mutex mtx;
    std::condition_variable cv;
    std::deque<std::string> queued;
    std::set<std::string> running;
    std::map<std::string, JobStatus> finished;
    std::vector<std::shared_ptr<JobController>> retired;
    std::uint64_t sequence{ 0 };
    bool started{ false };
    bool stopping{ false };

    std::thread dispatcher;
};
