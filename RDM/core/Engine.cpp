#include "Engine.h"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace {
std::string manifestDirFor(const EngineConfig& cfg) {
    if (!cfg.manifestDir.empty())
        return cfg.manifestDir;
    return (fs::path(cfg.scratchDir) / ".manifest").string();
}

const EngineConfig& validated(const EngineConfig& cfg) {
    if (cfg.partSize == 0)
        throw std::invalid_argument("part size must be positive");
    if (cfg.perJobConcurrency == 0)
        throw std::invalid_argument("per-job concurrency must be positive");
    if (cfg.maxPartAttempts == 0)
        throw std::invalid_argument("max part attempts must be positive");
    return cfg;
}

JobStatus statusOf(const Job& job, const std::vector<Part>& parts) {
    JobStatus st;
    st.id = job.id;
    st.locator = job.locator;
    st.targetName = job.targetName;
    st.state = job.state;
    st.error = job.error;
    st.bytesTotal = job.totalSize.value_or(0);
    st.archivePath = job.archivePath;
    st.createdAt = job.createdAt;
    st.updatedAt = job.updatedAt;

    for (const auto& p : parts) {
        const std::uint64_t bytes = p.state == PartState::Done ? p.length : 0;
        st.bytesDone += bytes;
        st.parts.push_back({ p.index, p.state, bytes, p.length, p.attempts });
    }
    return st;
}
}

Engine::Engine(const EngineConfig& config, FetchClient& c, Logger& l, StorageTiering& t)
    : cfg(validated(config)),
    client(c),
    logger(l),
    tiering(t),
    manifest(manifestDirFor(cfg)),
    scratch(cfg.scratchDir),
    budget(cfg.globalConcurrency),
    ctx{ cfg, client, manifest, scratch, budget, tiering, logger }
{
}

Engine::~Engine() {
    shutdown();
}

bool Engine::start() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (started)
            return true;
    }

    if (!manifest.init()) {
        logger.error("cannot open manifest store: " + manifest.lastError());
        return false;
    }

    for (const auto& dir : { cfg.scratchDir, cfg.archiveDir }) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            logger.error("cannot create " + dir + ": " + ec.message());
            return false;
        }
    }

    std::size_t recovered = 0;
    for (Job job : manifest.listActiveJobs()) {
        const JobState persisted = job.state;
        job.state = JobState::Queued;
        if (!registry.add(makeController(job)))
            continue;

        logger.info("recovering " + job.id + " (" + toString(persisted) + "): " + job.targetName);

        std::lock_guard<std::mutex> lock(mtx);
        queued.push_back(job.id);
        ++recovered;
    }

    if (recovered > 0)
        logger.info("recovered " + std::to_string(recovered) + " unfinished jobs");

    {
        std::lock_guard<std::mutex> lock(mtx);
        started = true;
        stopping = false;
    }
    dispatcher = std::thread(&Engine::dispatchLoop, this);
    return true;
}

void Engine::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!started)
            return;
        started = false;
        stopping = true;
    }
    cv.notify_all();

    if (dispatcher.joinable())
        dispatcher.join();

    for (auto& controller : registry.all())
        controller->stop();

    reap();

    for (auto& controller : registry.all())
        registry.remove(controller->id());

    {
        std::lock_guard<std::mutex> lock(mtx);
        queued.clear();
        running.clear();
    }
    logger.info("engine stopped, unfinished jobs resume on next start");
}

std::string Engine::enqueue(const std::string& locator, const std::string& targetName,
    const JobOptions& options) {
    if (locator.empty()) {
        logger.error("enqueue: empty locator");
        return "";
    }

    Job job;
    job.id = nextJobId();
    job.locator = locator;
    job.targetName = targetNameFor(locator, targetName);
    job.totalSize = options.knownSize;
    job.partSize = cfg.partSize;
    job.concurrencyLimit = options.concurrencyLimit;
    job.createdAt = unixNow();
    job.updatedAt = job.createdAt;

    if (!registry.add(makeController(job))) {
        logger.error("enqueue: duplicate job id " + job.id);
        return "";
    }
    {
        std::lock_guard<std::mutex> lock(mtx);
        queued.push_back(job.id);
    }
    cv.notify_all();

    logger.info("enqueued " + job.id + ": " + locator + " -> " + job.targetName);
    return job.id;
}

CancelResult Engine::cancel(const std::string& jobId) {
    if (auto controller = registry.find(jobId)) {
        CancelResult result = controller->cancel();
        logger.info("cancel " + jobId + ": " + toString(result));
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mtx);
        if (finished.count(jobId))
            return CancelResult::NoOp;
    }

    // Failed jobs from an earlier run only live in the manifest.
    if (manifest.exists(jobId))
        return CancelResult::NoOp;
    return CancelResult::NotFound;
}

bool Engine::resume(const std::string& jobId) {
    if (registry.find(jobId))
        return false;

    Job stored;
    std::vector<Part> parts;
    if (!manifest.exists(jobId) || !manifest.loadJob(jobId, stored, parts)
        || stored.state != JobState::Failed) {
        logger.warn("resume " + jobId + ": not a failed job with a manifest");
        return false;
    }

    if (!manifest.resetRetries(jobId) || !manifest.setJobState(jobId, JobState::Queued)) {
        logger.error("resume " + jobId + ": " + manifest.lastError());
        return false;
    }

    stored.state = JobState::Queued;
    stored.error.clear();
    if (!registry.add(makeController(stored)))
        return false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        finished.erase(jobId);
        queued.push_back(jobId);
    }
    cv.notify_all();

    logger.info("resuming " + jobId + ": " + stored.targetName);
    return true;
}

bool Engine::discard(const std::string& jobId) {
    if (registry.find(jobId))
        return false;

    bool failed = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = finished.find(jobId);
        failed = it != finished.end() && it->second.state == JobState::Failed;
    }

    if (manifest.exists(jobId)) {
        Job stored;
        std::vector<Part> parts;
        if (!manifest.loadJob(jobId, stored, parts) || stored.state != JobState::Failed)
            return false;
        if (!manifest.remove(jobId)) {
            logger.error("discard " + jobId + ": " + manifest.lastError());
            return false;
        }
        failed = true;
    }

    if (!failed)
        return false;

    std::string err;
    if (!scratch.removeJob(jobId, err))
        logger.warn("discard " + jobId + ": " + err);

    {
        std::lock_guard<std::mutex> lock(mtx);
        finished.erase(jobId);
    }
    logger.info("discarded " + jobId);
    return true;
}

std::optional<JobStatus> Engine::getStatus(const std::string& jobId) {
    if (auto controller = registry.find(jobId))
        return controller->status();

    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = finished.find(jobId);
        if (it != finished.end())
            return it->second;
    }

    return statusFromManifest(jobId);
}

std::vector<JobStatus> Engine::listJobs() {
    std::vector<JobStatus> out;
    std::set<std::string> seen;

    for (const auto& controller : registry.all()) {
        out.push_back(controller->status());
        seen.insert(controller->id());
    }

    {
        std::lock_guard<std::mutex> lock(mtx);
        for (const auto& kv : finished) {
            if (seen.insert(kv.first).second)
                out.push_back(kv.second);
        }
    }

    for (const auto& job : manifest.listJobs()) {
        if (seen.count(job.id))
            continue;
        if (auto st = statusFromManifest(job.id)) {
            seen.insert(job.id);
            out.push_back(*st);
        }
    }

    std::sort(out.begin(), out.end(), [](const JobStatus& a, const JobStatus& b) {
        return a.createdAt != b.createdAt ? a.createdAt < b.createdAt : a.id < b.id;
        });
    return out;
}

std::vector<HistoryEntry> Engine::history(std::size_t limit) const {
    return manifest.recentHistory(limit);
}

bool Engine::clearHistory() {
    return manifest.clearHistory();
}

bool Engine::waitForTerminal(const std::string& jobId, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    auto controller = registry.find(jobId);
    if (!controller) {
        auto st = getStatus(jobId);
        return st && isTerminal(st->state);
    }

    if (!controller->waitTerminal(timeout))
        return false;

    // Terminal also means retired from the registry.
    std::unique_lock<std::mutex> lock(mtx);
    return cv.wait_until(lock, deadline, [&]() { return registry.find(jobId) != controller; });
}

std::size_t Engine::activeJobs() const {
    std::lock_guard<std::mutex> lock(mtx);
    return queued.size() + running.size();
}

std::string Engine::targetNameFor(const std::string& locator, const std::string& requested) {
    std::string name = requested;

    if (name.empty()) {
        std::string path = locator.substr(0, locator.find_first_of("?#"));
        auto scheme = path.find("://");
        if (scheme != std::string::npos)
            path = path.substr(scheme + 3);

        auto slash = path.rfind('/');
        name = slash == std::string::npos ? "" : path.substr(slash + 1);
    }

    name = fs::path(name).filename().string();
    if (name.empty() || name == "." || name == "..")
        name = "download";
    return name;
}

void Engine::dispatchLoop() {
    std::unique_lock<std::mutex> lock(mtx);
    while (!stopping) {
        admitLocked();

        std::vector<std::shared_ptr<JobController>> dead;
        dead.swap(retired);
        if (!dead.empty()) {
            lock.unlock();
            dead.clear(); // joins their runner threads
            lock.lock();
            continue;
        }

        cv.wait(lock, [this]() {
            return stopping || !retired.empty()
                || (!queued.empty() && running.size() < cfg.globalConcurrency);
            });
    }
}

void Engine::admitLocked() {
    while (running.size() < cfg.globalConcurrency && !queued.empty()) {
        const std::string jobId = queued.front();
        queued.pop_front();

        auto controller = registry.find(jobId);
        if (!controller)
            continue;

        // False when it was cancelled while queued.
        if (controller->start()) {
            running.insert(jobId);
            logger.debug("admitted " + jobId + " (" + std::to_string(running.size()) + "/"
                + std::to_string(cfg.globalConcurrency) + " running)");
        }
    }
}

void Engine::onTerminal(const std::string& jobId, JobState state) {
    auto controller = registry.find(jobId);
    JobStatus st;
    if (controller)
        st = controller->status();

    {
        // Registry removal and the finished entry change together, so a
        // status query always finds the job in one of them.
        std::lock_guard<std::mutex> lock(mtx);
        if (controller) {
            finished[jobId] = st;
            registry.remove(jobId);
            retired.push_back(std::move(controller));
        }
        running.erase(jobId);
        queued.erase(std::remove(queued.begin(), queued.end(), jobId), queued.end());
    }
    cv.notify_all();

    logger.debug(jobId + " finished as " + toString(state));
}

void Engine::reap() {
    std::vector<std::shared_ptr<JobController>> dead;
    {
        std::lock_guard<std::mutex> lock(mtx);
        dead.swap(retired);
    }
}

std::shared_ptr<JobController> Engine::makeController(const Job& job) {
    return std::make_shared<JobController>(job, ctx,
        [this](const std::string& jobId, JobState state) { onTerminal(jobId, state); });
}

std::string Engine::nextJobId() {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    for (;;) {
        std::string id;
        {
            std::lock_guard<std::mutex> lock(mtx);
            id = "job-" + std::to_string(ms) + "-" + std::to_string(++sequence);
        }
        if (!registry.find(id) && !manifest.exists(id))
            return id;
    }
}

std::optional<JobStatus> Engine::statusFromManifest(const std::string& jobId) {
    if (!manifest.exists(jobId))
        return std::nullopt;

    Job job;
    std::vector<Part> parts;
    if (!manifest.loadJob(jobId, job, parts))
        return std::nullopt;
    return statusOf(job, parts);
}
