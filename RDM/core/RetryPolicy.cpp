#include "RetryPolicy.h"

#include <algorithm>

RetryPolicy::RetryPolicy(unsigned maxAttempts,
    std::chrono::milliseconds base,
    std::chrono::milliseconds max,
    std::chrono::milliseconds rateLimitFloor)
    : attemptsLimit(maxAttempts),
    backoffBase(base),
    backoffMax(max),
    floor(rateLimitFloor) {
}

RetryPolicy RetryPolicy::fromConfig(const EngineConfig& cfg) {
    return RetryPolicy(cfg.maxPartAttempts, cfg.backoffBase, cfg.backoffMax, cfg.rateLimitFloor);
}

bool RetryPolicy::retryable(ErrorKind kind) {
    return kind == ErrorKind::Transient
        || kind == ErrorKind::RateLimited
        || kind == ErrorKind::Corrupt;
}

bool RetryPolicy::shouldRetry(unsigned attempts, const FetchError& err) const {
    return retryable(err.kind) && attempts < attemptsLimit;
}

std::chrono::milliseconds RetryPolicy::delay(unsigned attempts, const FetchError& err) const {
    if (err.kind == ErrorKind::RateLimited)
        return std::max(err.retryAfter, floor);

    // base * 2^(attempts-1), saturating at backoffMax
    std::chrono::milliseconds d = backoffBase;
    for (unsigned i = 1; i < attempts && d < backoffMax; ++i)
        d *= 2;
    return std::min(d, backoffMax);
}

bool RetryPolicy::scheduleRetry(Part& part, const FetchError& err,
    std::chrono::steady_clock::time_point now) const {
    ++part.attempts;
    part.error = err.message;

    if (!shouldRetry(part.attempts, err)) {
        part.state = PartState::Failed;
        return false;
    }

    part.state = PartState::Pending;
    part.nextEligible = now + delay(part.attempts, err);
    return true;
}
