#pragma once
#include <atomic>
#include <cstdint>
#include <chrono>
#include <mutex>

class ProgressTracker {
public:
    explicit ProgressTracker(std::uint64_t totalBytes = 0);

    void add(std::uint64_t bytes);
    std::uint64_t transferred() const;

    // Bytes per second over the last few seconds.
    double speedBytesPerSec();
    double averageBytesPerSec() const;

    void reset(std::uint64_t totalBytes);
    std::uint64_t total() const { return totalBytes.load(); }

private:
    std::atomic<std::uint64_t> totalBytes;
    std::atomic<std::uint64_t> current{ 0 };
    std::chrono::steady_clock::time_point start;

    mutable std::mutex windowMutex;
    std::chrono::steady_clock::time_point windowStart;
    std::uint64_t windowBytes = 0;
    double lastSpeed = 0.0;
};
