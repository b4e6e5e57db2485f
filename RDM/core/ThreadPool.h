#pragma once
#include <vector>
#include <thread>
#include <functional>
#include <mutex>

// Fixed set of worker threads for one job. Workers stop by themselves
// (queue drained or token cancelled); join() waits for them.
class ThreadPool {
public:
    using WorkerFn = std::function<void(std::size_t workerIndex)>;

    ThreadPool() = default;
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void start(std::size_t n, const WorkerFn& worker);
    void join();

    std::size_t size() const;

private:
    std::vector<std::thread> threads;
    mutable std::mutex mtx;
};
