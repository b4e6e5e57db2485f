#pragma once
#include <mutex>
#include <cstddef>
#include <condition_variable>

#include "CancellationToken.h"

// Process-wide cap on simultaneous range fetches, shared by every job.
class ConcurrencyBudget {
public:
    class Slot {
    public:
        Slot() = default;
        explicit Slot(ConcurrencyBudget* b) : budget(b) {}
        ~Slot() { release(); }

        Slot(Slot&& other) noexcept : budget(other.budget) { other.budget = nullptr; }
        Slot& operator=(Slot&& other) noexcept;
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        bool held() const { return budget != nullptr; }
        void release();

    private:
        ConcurrencyBudget* budget = nullptr;
    };

    explicit ConcurrencyBudget(std::size_t limit);

    // Blocks until a slot frees up; an empty Slot if the token fires first.
    Slot acquire(CancellationToken& token);

    std::size_t inUse() const;
    std::size_t limit() const { return maxSlots; }

private:
    void release();

private:
    std::size_t maxSlots;
    std::size_t used = 0;
    mutable std::mutex mtx;
    std::condition_variable cv;
};
