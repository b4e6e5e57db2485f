#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <chrono>
#include <functional>
#include <condition_variable>

#include "utils.h"
#include "PartQueue.h"
#include "ThreadPool.h"
#include "RetryPolicy.h"
#include "ConcurrencyBudget.h"
#include "CancellationToken.h"
#include "../io/ManifestStore.h"
#include "../io/ScratchArea.h"
#include "../io/StorageTiering.h"
#include "../net/FetchClient.h"
#include "../monitor/ProgressTracker.h"
#include "../monitor/Logger.h"

// Collaborators shared by every job of one engine.
struct JobContext {
    const EngineConfig& cfg;
    FetchClient& client;
    ManifestStore& manifest;
    const ScratchArea& scratch;
    ConcurrencyBudget& budget;
    StorageTiering& tiering;
    Logger& logger;
};

// Drives one job from Queued to a terminal state on its own thread:
// plan (or reconcile a previous run), download, assemble, tier.
class JobController {
public:
    using TerminalCallback = std::function<void(const std::string& jobId, JobState state)>;

    JobController(const Job& job, JobContext ctx, TerminalCallback onTerminal);
    ~JobController();

    JobController(const JobController&) = delete;
    JobController& operator=(const JobController&) = delete;

    // Queued -> Planning. False if the job already left Queued.
    bool start();

    // Severs every transport of the job, removes its scratch files and
    // manifest, and waits up to cfg.cancelTimeout for Cancelled.
    CancelResult cancel();

    // Severs and joins without deleting anything; the job stays resumable.
    void stop();
    void join();

    bool waitTerminal(std::chrono::milliseconds timeout);

    JobStatus status();
    JobState state() const;
    const std::string& id() const { return jobId; }

private:
    enum class Entry {
        Download,
        Tier,     // assembled file already verified
        Complete  // archive already in place
    };

    void run();

    bool prepare(Entry& entry);
    bool planFresh();
    bool resumeFromManifest(Entry& entry);
    bool downloadAndAssemble();
    bool download();
    bool tier();

    void complete();
    void conclude();
    void removeArtifacts();

    bool setState(JobState s, bool persist = true);
    void setTerminal(JobState s, const std::string& err);
    void fail(const std::string& err);
    bool interrupted() const;

    void onWorkerReport(const WorkerReport& report);
    void logProgress(PartQueue& queue);

    std::string tag() const { return "[job " + jobId + "] "; }

private:
    const std::string jobId;
    JobContext ctx;
    TerminalCallback onTerminal;
    RetryPolicy retryPolicy;

    Job job;
    std::vector<Part> parts;
    std::shared_ptr<PartQueue> queue;
    Job workerJob; // stable copy handed to workers while downloading
    mutable std::mutex mtx;
    std::condition_variable terminalCv;

    CancellationToken token;
    std::atomic<bool> cancelRequested{ false };
    std::atomic<bool> stopRequested{ false };
    bool started{ false };
    bool completed{ false };

    std::mutex failureMutex;
    std::string failure;

    ThreadPool pool;
    std::atomic<std::size_t> activeWorkers{ 0 };
    ProgressTracker progress;
    std::chrono::steady_clock::time_point runStart;

    std::thread runner;
};
