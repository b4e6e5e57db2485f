#pragma once
#include <vector>
#include <mutex>
#include <chrono>
#include <optional>
#include <condition_variable>
#include "utils.h"
#include "RetryPolicy.h"
#include "CancellationToken.h"

// In-memory part states of one running job, shared by its workers.
class PartQueue {
public:
    PartQueue(std::vector<Part> parts, const RetryPolicy& policy);

    // Next eligible Pending part, now InFlight. Waits out retry backoff;
    // nullopt when nothing is left Pending or the token fires.
    std::optional<Part> next(CancellationToken& token);

    void addProgress(std::uint64_t partIndex, std::uint64_t bytes);
    void markDone(std::uint64_t partIndex, std::uint64_t length, std::uint32_t crc);

    // Applies the retry policy. False if the part is now permanently Failed;
    // updated receives the part's new retry state either way.
    bool markFailed(std::uint64_t partIndex, const FetchError& err, Part& updated);

    // InFlight back to Pending, for fetches interrupted by stop/cancel.
    void release(std::uint64_t partIndex);

    bool allDone() const;
    bool anyFailed() const;

    // Waits up to d for every part to be Done or one to fail permanently.
    bool waitSettled(std::chrono::milliseconds d);
    void wake();

    std::vector<Part> snapshot() const;
    std::uint64_t bytesDone() const;

private:
    bool settledLocked() const;

private:
    std::vector<Part> parts;
    const RetryPolicy& retry;

    mutable std::mutex mtx;
    std::condition_variable cv;
};
