#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "JobController.h"

// Controllers of the jobs this process is driving, by job id. Entries come
// in on enqueue/recovery/resume and leave when the job turns terminal.
class JobRegistry {
public:
    // False if a controller for the id is already registered.
    bool add(const std::shared_ptr<JobController>& controller);
    std::shared_ptr<JobController> find(const std::string& jobId) const;
    std::shared_ptr<JobController> remove(const std::string& jobId);

    std::vector<std::shared_ptr<JobController>> all() const;

private:
    std::map<std::string, std::shared_ptr<JobController>> controllers;
    mutable std::mutex mtx;
};
