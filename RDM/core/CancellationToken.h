#pragma once
#include <map>
#include <atomic>
#include <mutex>
#include <chrono>
#include <cstdint>
#include <functional>
#include <condition_variable>

// Coordination signal for hard cancellation. Attached callbacks close the
// transports a worker owns; cancel() runs them on the cancelling thread so
// no byte keeps arriving once it returns.
class CancellationToken {
public:
    using Callback = std::function<void()>;

    class Registration {
    public:
        Registration() = default;
        Registration(CancellationToken* token, std::uint64_t id) : owner(token), regId(id) {}
        ~Registration() { reset(); }

        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

        void reset();

    private:
        CancellationToken* owner = nullptr;
        std::uint64_t regId = 0;
    };

    bool cancelled() const;

    // Idempotent. Callbacks run exactly once, in registration order.
    void cancel();

    // Runs cb immediately if already cancelled. Callbacks must not attach or
    // detach on the same token.
    Registration attach(Callback cb);

    // Sleeps up to d; true if cancelled meanwhile.
    bool waitFor(std::chrono::milliseconds d) const;

private:
    void detach(std::uint64_t id);

private:
    mutable std::mutex mtx;
    mutable std::condition_variable cv;
    std::atomic<bool> isCancelled{ false }; // readable without mtx
    std::uint64_t nextId = 1;
    std::map<std::uint64_t, Callback> callbacks;
};
