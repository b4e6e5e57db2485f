#include "ProgressTracker.h"

namespace {
const std::chrono::seconds kWindow{ 5 };
}

ProgressTracker::ProgressTracker(std::uint64_t total)
    : totalBytes(total),
    start(std::chrono::steady_clock::now()),
    windowStart(start) {
}

void ProgressTracker::add(std::uint64_t bytes) {
    current.fetch_add(bytes, std::memory_order_relaxed);
}

std::uint64_t ProgressTracker::transferred() const {
    return current.load(std::memory_order_relaxed);
}

double ProgressTracker::speedBytesPerSec() {
    std::lock_guard<std::mutex> lock(windowMutex);

    const auto now = std::chrono::steady_clock::now();
    const std::chrono::duration<double> elapsed = now - windowStart;
    const std::uint64_t bytes = transferred();

    if (elapsed.count() >= 1.0)
        lastSpeed = static_cast<double>(bytes - windowBytes) / elapsed.count();

    if (now - windowStart >= kWindow) {
        windowStart = now;
        windowBytes = bytes;
    }
    return lastSpeed;
}

double ProgressTracker::averageBytesPerSec() const {
    std::lock_guard<std::mutex> lock(windowMutex);
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    return elapsed.count() > 0 ? static_cast<double>(transferred()) / elapsed.count() : 0.0;
}

void ProgressTracker::reset(std::uint64_t total) {
    std::lock_guard<std::mutex> lock(windowMutex);
    totalBytes.store(total);
    current.store(0, std::memory_order_relaxed);
    start = std::chrono::steady_clock::now();
    windowStart = start;
    windowBytes = 0;
    lastSpeed = 0.0;
}
