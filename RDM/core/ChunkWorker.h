#pragma once
#include <functional>

#include "utils.h"
#include "PartQueue.h"
#include "ConcurrencyBudget.h"
#include "CancellationToken.h"
#include "../io/ManifestStore.h"
#include "../io/ScratchArea.h"
#include "../net/FetchClient.h"
#include "../monitor/ProgressTracker.h"

struct PartOutcome {
    bool done = false;
    std::uint64_t length = 0;
    std::uint32_t crc = 0;
    FetchError error;
};

// Pulls parts of one job from its queue and fetches them one at a time.
class ChunkWorker {
public:
    using ReportCallback = std::function<void(const WorkerReport&)>;

    ChunkWorker(const Job& job,
        PartQueue& queue,
        FetchClient& client,
        ConcurrencyBudget& budget,
        ManifestStore& manifest,
        const ScratchArea& scratch,
        ProgressTracker& progress,
        CancellationToken& token,
        ReportCallback cb);

    void run();

    // One attempt at one part: streams the range into the part file and
    // fsyncs it. Does not touch the queue or the manifest.
    PartOutcome fetchPart(const Part& part);

private:
    const Job& job;
    PartQueue& partQueue;
    FetchClient& fetchClient;
    ConcurrencyBudget& budget;
    ManifestStore& manifest;
    const ScratchArea& scratch;
    ProgressTracker& progress;
    CancellationToken& token;
    ReportCallback report;
};
