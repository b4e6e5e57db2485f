#include "ThreadPool.h"

ThreadPool::~ThreadPool() {
    join();
}

void ThreadPool::start(std::size_t n, const WorkerFn& worker) {
    std::lock_guard<std::mutex> lock(mtx);

    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t index = threads.size();
        threads.emplace_back([worker, index]() { worker(index); });
    }
}

void ThreadPool::join() {
    std::vector<std::thread> running;
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.swap(threads);
    }

    for (auto& t : running) {
        if (t.joinable())
            t.join();
    }
}

std::size_t ThreadPool::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return threads.size();
}
