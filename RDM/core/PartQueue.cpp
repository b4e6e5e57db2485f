#include "PartQueue.h"

#include <algorithm>

PartQueue::PartQueue(std::vector<Part> initial, const RetryPolicy& policy)
    : parts(std::move(initial)), retry(policy) {
}

std::optional<Part> PartQueue::next(CancellationToken& token) {
    auto wakeOnCancel = token.attach([this]() { wake(); });

    std::unique_lock<std::mutex> lock(mtx);
    while (!token.cancelled()) {
        const auto now = std::chrono::steady_clock::now();

        Part* eligible = nullptr;
        auto earliest = std::chrono::steady_clock::time_point::max();
        for (auto& part : parts) {
            if (part.state != PartState::Pending)
                continue;
            if (part.nextEligible <= now) {
                eligible = &part;
                break;
            }
            earliest = std::min(earliest, part.nextEligible);
        }

        if (eligible) {
            eligible->state = PartState::InFlight;
            eligible->bytesReceived = 0;
            return *eligible;
        }

        if (earliest == std::chrono::steady_clock::time_point::max())
            return std::nullopt;

        cv.wait_until(lock, earliest);
    }
    return std::nullopt;
}

void PartQueue::addProgress(std::uint64_t partIndex, std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mtx);
    if (partIndex < parts.size())
        parts[partIndex].bytesReceived += bytes;
}

void PartQueue::markDone(std::uint64_t partIndex, std::uint64_t length, std::uint32_t crc) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (partIndex >= parts.size())
            return;

        Part& part = parts[partIndex];
        part.state = PartState::Done;
        part.lengthOnDisk = length;
        part.bytesReceived = length;
        part.crc = crc;
        part.hasCrc = true;
        part.error.clear();
    }
    cv.notify_all();
}

bool PartQueue::markFailed(std::uint64_t partIndex, const FetchError& err, Part& updated) {
    bool rescheduled = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (partIndex >= parts.size())
            return false;

        Part& part = parts[partIndex];
        part.bytesReceived = 0;
        rescheduled = retry.scheduleRetry(part, err, std::chrono::steady_clock::now());
        updated = part;
    }
    cv.notify_all();
    return rescheduled;
}

void PartQueue::release(std::uint64_t partIndex) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (partIndex < parts.size() && parts[partIndex].state == PartState::InFlight) {
            parts[partIndex].state = PartState::Pending;
            parts[partIndex].bytesReceived = 0;
        }
    }
    cv.notify_all();
}

bool PartQueue::allDone() const {
    std::lock_guard<std::mutex> lock(mtx);
    return std::all_of(parts.begin(), parts.end(), [](const Part& p) {
        return p.state == PartState::Done;
        });
}

bool PartQueue::anyFailed() const {
    std::lock_guard<std::mutex> lock(mtx);
    return std::any_of(parts.begin(), parts.end(), [](const Part& p) {
        return p.state == PartState::Failed;
        });
}

bool PartQueue::settledLocked() const {
    bool done = true;
    for (const auto& p : parts) {
        if (p.state == PartState::Failed)
            return true;
        if (p.state != PartState::Done)
            done = false;
    }
    return done;
}

bool PartQueue::waitSettled(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(mtx);
    return cv.wait_for(lock, d, [this]() { return settledLocked(); });
}

void PartQueue::wake() {
    std::lock_guard<std::mutex> lock(mtx);
    cv.notify_all();
}

std::vector<Part> PartQueue::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx);
    return parts;
}

std::uint64_t PartQueue::bytesDone() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::uint64_t total = 0;
    for (const auto& p : parts)
        total += (p.state == PartState::Done) ? p.length : p.bytesReceived;
    return total;
}
