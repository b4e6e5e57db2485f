#pragma once
#include <chrono>
#include "utils.h"

// Exponential backoff for part fetches. The state it acts on (attempt
// count, next eligible time) lives on the Part itself.
class RetryPolicy {
public:
    RetryPolicy(unsigned maxAttempts,
        std::chrono::milliseconds base,
        std::chrono::milliseconds max,
        std::chrono::milliseconds rateLimitFloor);

    static RetryPolicy fromConfig(const EngineConfig& cfg);

    static bool retryable(ErrorKind kind);

    // attempts counts the failure just seen.
    bool shouldRetry(unsigned attempts, const FetchError& err) const;
    std::chrono::milliseconds delay(unsigned attempts, const FetchError& err) const;

    // Records the failure on the part and schedules it; false when the part
    // has exhausted its budget or the error is not retryable.
    bool scheduleRetry(Part& part, const FetchError& err,
        std::chrono::steady_clock::time_point now) const;

    unsigned maxAttempts() const { return attemptsLimit; }

private:
    unsigned attemptsLimit;
    std::chrono::milliseconds backoffBase;
    std::chrono::milliseconds backoffMax;
    std::chrono::milliseconds floor;
};
