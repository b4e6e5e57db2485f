#include "CancellationToken.h"

#include <utility>

CancellationToken::Registration::Registration(Registration&& other) noexcept
    : owner(other.owner), regId(other.regId) {
    other.owner = nullptr;
    other.regId = 0;
}

CancellationToken::Registration& CancellationToken::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        reset();
        owner = other.owner;
        regId = other.regId;
        other.owner = nullptr;
        other.regId = 0;
    }
    return *this;
}

void CancellationToken::Registration::reset() {
    if (owner && regId != 0)
        owner->detach(regId);
    owner = nullptr;
    regId = 0;
}

bool CancellationToken::cancelled() const {
    return isCancelled.load();
}

void CancellationToken::cancel() {
    std::lock_guard<std::mutex> lock(mtx);
    if (isCancelled.load())
        return;

    isCancelled.store(true);

    // Still under the lock: a concurrent detach() waits for the close to
    // finish, so the transport is never closed after its owner destroyed it.
    for (auto& entry : callbacks)
        entry.second();
    callbacks.clear();

    cv.notify_all();
}

CancellationToken::Registration CancellationToken::attach(Callback cb) {
    std::unique_lock<std::mutex> lock(mtx);
    if (isCancelled.load()) {
        lock.unlock();
        cb();
        return Registration();
    }

    std::uint64_t id = nextId++;
    callbacks.emplace(id, std::move(cb));
    return Registration(this, id);
}

void CancellationToken::detach(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mtx);
    callbacks.erase(id);
}

bool CancellationToken::waitFor(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lock(mtx);
    return cv.wait_for(lock, d, [this]() { return isCancelled.load(); });
}
