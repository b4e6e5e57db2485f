#include "ConcurrencyBudget.h"

#include <stdexcept>

ConcurrencyBudget::Slot& ConcurrencyBudget::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        release();
        budget = other.budget;
        other.budget = nullptr;
    }
    return *this;
}

void ConcurrencyBudget::Slot::release() {
    if (budget) {
        budget->release();
        budget = nullptr;
    }
}

ConcurrencyBudget::ConcurrencyBudget(std::size_t limit)
    : maxSlots(limit) {
    if (maxSlots == 0)
        throw std::invalid_argument("concurrency must be > 0");
}

ConcurrencyBudget::Slot ConcurrencyBudget::acquire(CancellationToken& token) {
    // Wake every waiter on cancel; each re-checks its own token.
    auto wake = token.attach([this]() {
        std::lock_guard<std::mutex> lock(mtx);
        cv.notify_all();
        });

    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [&]() { return used < maxSlots || token.cancelled(); });

    if (token.cancelled())
        return Slot();

    ++used;
    return Slot(this);
}

void ConcurrencyBudget::release() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (used > 0)
            --used;
    }
    cv.notify_one();
}

std::size_t ConcurrencyBudget::inUse() const {
    std::lock_guard<std::mutex> lock(mtx);
    return used;
}
