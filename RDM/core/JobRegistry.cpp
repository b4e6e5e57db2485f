#include "JobRegistry.h"

bool JobRegistry::add(const std::shared_ptr<JobController>& controller) {
    std::lock_guard<std::mutex> lock(mtx);
    return controllers.emplace(controller->id(), controller).second;
}

std::shared_ptr<JobController> JobRegistry::find(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = controllers.find(jobId);
    return it != controllers.end() ? it->second : nullptr;
}

std::shared_ptr<JobController> JobRegistry::remove(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = controllers.find(jobId);
    if (it == controllers.end())
        return nullptr;

    auto controller = std::move(it->second);
    controllers.erase(it);
    return controller;
}

std::vector<std::shared_ptr<JobController>> JobRegistry::all() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::shared_ptr<JobController>> out;
    out.reserve(controllers.size());
    for (const auto& kv : controllers)
        out.push_back(kv.second);
    return out;
}

