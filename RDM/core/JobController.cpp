#include "JobController.h"
#include "ChunkWorker.h"
#include "PartPlanner.h"
#include "ResumeReconciler.h"
#include "../io/Assembler.h"
#include "../io/FileOps.h"

#include <sstream>
#include <iomanip>
#include <algorithm>

namespace {
const std::chrono::milliseconds kPollInterval{ 50 };

bool samePlan(const std::vector<Part>& a, const std::vector<Part>& b) {
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].index != b[i].index || a[i].offset != b[i].offset || a[i].length != b[i].length)
            return false;
    }
    return true;
}
}

JobController::JobController(const Job& j, JobContext c, TerminalCallback cb)
    : jobId(j.id),
    ctx(c),
    onTerminal(std::move(cb)),
    retryPolicy(RetryPolicy::fromConfig(c.cfg)),
    job(j)
{
    if (job.partSize == 0)
        job.partSize = ctx.cfg.partSize;
}

JobController::~JobController() {
    stop();
}

bool JobController::start() {
    std::lock_guard<std::mutex> lock(mtx);
    if (started || job.state != JobState::Queued)
        return false;

    started = true;
    runner = std::thread(&JobController::run, this);
    return true;
}

void JobController::run() {
    runStart = std::chrono::steady_clock::now();

    Entry entry = Entry::Download;
    bool ok = prepare(entry);

    if (ok && entry == Entry::Download)
        ok = downloadAndAssemble();

    if (ok && entry != Entry::Complete)
        ok = tier();

    if (ok)
        complete();
    else
        conclude();
}

bool JobController::prepare(Entry& entry) {
    setState(JobState::Planning, false);
    if (interrupted())
        return false;

    // An existing manifest means an earlier run planned this job.
    if (ctx.manifest.exists(jobId))
        return resumeFromManifest(entry);

    return planFresh();
}

bool JobController::planFresh() {
    std::optional<std::uint64_t> total;
    std::uint64_t partSize = 0;
    {
        std::lock_guard<std::mutex> lock(mtx);
        total = job.totalSize;
        partSize = job.partSize;
    }

    if (!total) {
        std::uint64_t size = 0;
        FetchError err;
        unsigned attempts = 0;

        for (;;) {
            if (interrupted())
                return false;

            auto query = ctx.client.openSizeQuery(job.locator);
            bool found = false;
            {
                // Cancel closes the query's connection like a range stream's.
                auto severance = token.attach([&query]() { query->close(); });
                found = query->run(size, err);
            }
            if (found)
                break;

            ++attempts;
            if (interrupted())
                return false;
            if (!retryPolicy.shouldRetry(attempts, err)) {
                fail("size lookup failed (" + std::string(toString(err.kind)) + "): " + err.message);
                return false;
            }
            const auto wait = retryPolicy.delay(attempts, err);
            ctx.logger.warn(tag() + "size lookup failed: " + err.message + ", retrying in "
                + std::to_string(wait.count()) + " ms");
            if (token.waitFor(wait))
                return false;
        }
        total = size;
    }

    if (interrupted())
        return false;

    std::vector<Part> planned = PartPlanner(partSize).plan(*total);

    Job snapshot;
    {
        std::lock_guard<std::mutex> lock(mtx);
        job.totalSize = total;
        parts = planned;
        snapshot = job;
    }

    // Leftovers of a run that died before its plan was recorded.
    std::string err;
    if (!ctx.scratch.removeJob(jobId, err) || !ctx.scratch.ensureJobDir(jobId, err)) {
        fail(err);
        return false;
    }

    if (!ctx.manifest.recordPlan(snapshot, planned)) {
        fail("manifest write failed: " + ctx.manifest.lastError());
        return false;
    }

    ctx.logger.info(tag() + "planned " + std::to_string(planned.size()) + " parts for "
        + std::to_string(*total) + " bytes");
    return true;
}

bool JobController::resumeFromManifest(Entry& entry) {
    Job stored;
    std::vector<Part> loaded;
    if (!ctx.manifest.loadJob(jobId, stored, loaded)) {
        fail("cannot load manifest: " + ctx.manifest.lastError());
        return false;
    }

    if (stored.state == JobState::Cancelling) {
        // The process died mid-cancel; finish it.
        cancelRequested.store(true);
        return false;
    }

    if (!stored.totalSize || stored.partSize == 0
        || !samePlan(loaded, PartPlanner(stored.partSize).plan(*stored.totalSize))) {
        ctx.logger.warn(tag() + "manifest plan is inconsistent, planning again");
        if (!ctx.manifest.remove(jobId)) {
            fail("cannot drop manifest: " + ctx.manifest.lastError());
            return false;
        }
        return planFresh();
    }

    const std::uint64_t total = *stored.totalSize;
    {
        std::lock_guard<std::mutex> lock(mtx);
        job.totalSize = stored.totalSize;
        job.partSize = stored.partSize;
        job.createdAt = stored.createdAt;
        job.archivePath = stored.archivePath;
        if (job.concurrencyLimit == 0)
            job.concurrencyLimit = stored.concurrencyLimit;
        parts = loaded;
    }

    if (stored.state == JobState::Tiering) {
        auto assembled = regularFileSize(ctx.scratch.assembledPath(jobId, stored.targetName));
        if (assembled && *assembled == total) {
            ctx.logger.info(tag() + "assembled file found, resuming at Tiering");
            entry = Entry::Tier;
            return true;
        }

        if (!stored.archivePath.empty()) {
            auto archived = regularFileSize(stored.archivePath);
            if (archived && *archived == total) {
                ctx.logger.info(tag() + "archive already in place at " + stored.archivePath);
                entry = Entry::Complete;
                return true;
            }
        }

        ctx.logger.warn(tag() + "assembled file lost, downloading again");
    }

    if (!setState(JobState::Resuming))
        return false;

    ResumeReconciler reconciler(ctx.scratch, ctx.cfg.verifyChecksums);
    ReconcileSummary summary = reconciler.reconcile(jobId, loaded);

    for (auto index : summary.corruptParts) {
        ctx.logger.warn(tag() + "part " + std::to_string(index) + " is " + toString(ErrorKind::Corrupt)
            + " on scratch, fetching it again");
        if (!ctx.manifest.markPending(jobId, index)) {
            fail("manifest write failed: " + ctx.manifest.lastError());
            return false;
        }
    }

    std::string err;
    if (!ctx.scratch.ensureJobDir(jobId, err)) {
        fail(err);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mtx);
        parts = loaded;
    }

    ctx.logger.info(tag() + "resumed: " + std::to_string(summary.kept) + " parts kept, "
        + std::to_string(summary.reset + summary.corrupt) + " to fetch");
    return true;
}

bool JobController::downloadAndAssemble() {
    Assembler assembler(ctx.scratch, ctx.cfg.verifyChecksums);

    for (;;) {
        if (!download())
            return false;

        if (!setState(JobState::Assembling))
            return false;

        Job snapshot;
        std::vector<Part> current;
        {
            std::lock_guard<std::mutex> lock(mtx);
            snapshot = job;
            current = parts;
        }

        AssemblyResult result = assembler.assemble(snapshot, current);
        if (result.ok) {
            // Tiering is durable before the part files go away.
            if (!setState(JobState::Tiering))
                return false;
            assembler.removeParts(jobId, current);
            ctx.logger.info(tag() + "assembled " + result.path);
            return true;
        }

        if (!result.corruptPart) {
            fail("assembly failed: " + result.error);
            return false;
        }

        const auto index = *result.corruptPart;
        unsigned attempts = 0;
        {
            std::lock_guard<std::mutex> lock(mtx);
            Part& part = parts[index];
            part.state = PartState::Pending;
            part.hasCrc = false;
            part.lengthOnDisk = 0;
            part.bytesReceived = 0;
            attempts = ++part.attempts;
        }

        if (attempts >= retryPolicy.maxAttempts()) {
            fail("part " + std::to_string(index) + " failed after " + std::to_string(attempts)
                + " attempts: " + result.error);
            return false;
        }

        ctx.logger.warn(tag() + result.error + ", fetching it again");
        if (!ctx.manifest.markPending(jobId, index)) {
            fail("manifest write failed: " + ctx.manifest.lastError());
            return false;
        }
    }
}

bool JobController::download() {
    if (interrupted())
        return false;

    std::shared_ptr<PartQueue> q;
    std::size_t pending = 0;
    std::size_t limit = 0;
    {
        std::lock_guard<std::mutex> lock(mtx);
        pending = static_cast<std::size_t>(std::count_if(parts.begin(), parts.end(),
            [](const Part& p) { return p.state != PartState::Done; }));
        if (pending == 0)
            return true;
        limit = job.concurrencyLimit != 0 ? job.concurrencyLimit : ctx.cfg.perJobConcurrency;
    }

    if (!setState(JobState::Downloading))
        return false;

    {
        std::lock_guard<std::mutex> lock(mtx);
        workerJob = job;
        queue = std::make_shared<PartQueue>(parts, retryPolicy);
        q = queue;
    }

    progress.reset(job.totalSize.value_or(0));

    const std::size_t workerCount = std::max<std::size_t>(1, std::min(limit, pending));
    activeWorkers.store(workerCount);

    pool.start(workerCount, [this, q](std::size_t) {
        ChunkWorker worker(
            workerJob,
            *q,
            ctx.client,
            ctx.budget,
            ctx.manifest,
            ctx.scratch,
            progress,
            token,
            [this](const WorkerReport& rep) {
                onWorkerReport(rep);
            }
        );

        worker.run();
        activeWorkers.fetch_sub(1);
        });

    // Wait for every part to settle, log progress periodically
    auto lastProgressLog = std::chrono::steady_clock::now();
    while (!q->waitSettled(kPollInterval)) {
        if (token.cancelled() || activeWorkers.load() == 0)
            break;

        auto now = std::chrono::steady_clock::now();
        if (now - lastProgressLog >= ctx.cfg.progressInterval) {
            logProgress(*q);
            lastProgressLog = now;
        }
    }

    pool.join();

    {
        std::lock_guard<std::mutex> lock(mtx);
        parts = q->snapshot();
        queue.reset();
    }

    if (interrupted())
        return false;

    if (q->anyFailed() || token.cancelled()) {
        std::string err;
        {
            std::lock_guard<std::mutex> lock(failureMutex);
            err = failure;
        }
        fail(err.empty() ? "part failed permanently" : err);
        return false;
    }

    if (!q->allDone()) {
        fail("workers stopped with parts outstanding");
        return false;
    }

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - runStart;
    std::ostringstream os;
    os << "all parts done in " << std::fixed << std::setprecision(2) << elapsed.count()
        << "s, avg speed " << std::setprecision(2) << (progress.averageBytesPerSec() / 1'000'000.0)
        << " MB/s, workers " << workerCount;
    ctx.logger.info(tag() + os.str());
    return true;
}

bool JobController::tier() {
    if (!setState(JobState::Tiering))
        return false;

    std::string archivePath;
    std::string targetName;
    {
        std::lock_guard<std::mutex> lock(mtx);
        archivePath = job.archivePath;
        targetName = job.targetName;
    }

    if (archivePath.empty()) {
        archivePath = StorageTiering::uniqueArchivePath(ctx.cfg.archiveDir, targetName);
        if (!ctx.manifest.setArchivePath(jobId, archivePath)) {
            fail("manifest write failed: " + ctx.manifest.lastError());
            return false;
        }
        std::lock_guard<std::mutex> lock(mtx);
        job.archivePath = archivePath;
    }

    const std::string source = ctx.scratch.assembledPath(jobId, targetName);
    auto delay = ctx.cfg.tieringBackoff;

    for (unsigned attempt = 1;; ++attempt) {
        if (interrupted())
            return false;

        TierResult result = ctx.tiering.relocate(source, archivePath);
        if (result.ok) {
            ctx.logger.info(tag() + (result.renamed ? "moved to " : "copied to ") + archivePath);
            if (!result.warning.empty())
                ctx.logger.warn(tag() + result.warning);
            return true;
        }

        if (attempt >= ctx.cfg.tieringAttempts) {
            fail("tiering failed after " + std::to_string(attempt) + " attempts: " + result.error);
            return false;
        }

        ctx.logger.warn(tag() + "tiering attempt " + std::to_string(attempt) + " failed: "
            + result.error + ", retrying in " + std::to_string(delay.count()) + " ms");

        if (token.waitFor(delay))
            return false;
        delay = std::min(delay * 2, ctx.cfg.backoffMax);
    }
}

void JobController::complete() {
    HistoryEntry entry;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (completed)
            return;
        completed = true;

        entry.targetName = job.targetName;
        entry.size = job.totalSize.value_or(0);
        entry.archivePath = job.archivePath;
    }

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - runStart;
    entry.durationSec = elapsed.count();
    entry.completedAt = unixNow();

    if (!ctx.manifest.appendHistory(entry))
        ctx.logger.warn(tag() + "history write failed: " + ctx.manifest.lastError());

    std::string err;
    if (!ctx.scratch.removeJob(jobId, err))
        ctx.logger.warn(tag() + err);

    if (!ctx.manifest.remove(jobId))
        ctx.logger.warn(tag() + "cannot prune manifest: " + ctx.manifest.lastError());

    ctx.logger.info(tag() + "completed: " + entry.archivePath);
    setTerminal(JobState::Completed, "");
}

void JobController::conclude() {
    if (cancelRequested.load()) {
        removeArtifacts();
        ctx.logger.info(tag() + "cancelled");
        setTerminal(JobState::Cancelled, "");
        return;
    }

    if (stopRequested.load()) {
        ctx.logger.info(tag() + "stopped, resumable on next start");
        return;
    }

    std::string err;
    {
        std::lock_guard<std::mutex> lock(failureMutex);
        err = failure;
    }

    // Failed jobs keep their manifest so they can be resumed.
    if (ctx.manifest.exists(jobId) && !ctx.manifest.setJobState(jobId, JobState::Failed, err))
        ctx.logger.warn(tag() + "cannot record failure: " + ctx.manifest.lastError());

    ctx.logger.error(tag() + "failed: " + err);
    setTerminal(JobState::Failed, err);
}

void JobController::removeArtifacts() {
    std::string err;
    if (!ctx.scratch.removeJob(jobId, err))
        ctx.logger.warn(tag() + err);

    if (ctx.manifest.exists(jobId) && !ctx.manifest.remove(jobId))
        ctx.logger.warn(tag() + "cannot remove manifest: " + ctx.manifest.lastError());
}

bool JobController::setState(JobState s, bool persist) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (isTerminal(job.state))
            return false;
        // A pending cancel owns the state from here on.
        if (cancelRequested.load() && !isTerminal(s))
            return true;
        job.state = s;
        job.updatedAt = unixNow();
    }

    if (persist && !ctx.manifest.setJobState(jobId, s)) {
        fail("manifest write failed: " + ctx.manifest.lastError());
        return false;
    }

    ctx.logger.debug(tag() + "-> " + toString(s));
    return true;
}

void JobController::setTerminal(JobState s, const std::string& err) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (isTerminal(job.state))
            return;
        job.state = s;
        job.error = err;
        job.updatedAt = unixNow();
    }
    terminalCv.notify_all();

    if (onTerminal)
        onTerminal(jobId, s);
}

void JobController::fail(const std::string& err) {
    std::lock_guard<std::mutex> lock(failureMutex);
    if (failure.empty())
        failure = err;
}

bool JobController::interrupted() const {
    return cancelRequested.load() || stopRequested.load();
}

CancelResult JobController::cancel() {
    std::unique_lock<std::mutex> lock(mtx);
    if (isTerminal(job.state))
        return CancelResult::NoOp;

    if (!started) {
        // Nothing runs yet; only a recovered job has artifacts.
        started = true;
        job.state = JobState::Cancelled;
        job.updatedAt = unixNow();
        lock.unlock();

        removeArtifacts();
        ctx.logger.info(tag() + "cancelled while queued");
        terminalCv.notify_all();
        if (onTerminal)
            onTerminal(jobId, JobState::Cancelled);
        return CancelResult::Cancelled;
    }

    const bool first = !cancelRequested.exchange(true);
    bool persistCancelling = false;
    if (first && job.state != JobState::Tiering) {
        job.state = JobState::Cancelling;
        job.updatedAt = unixNow();
        persistCancelling = true;
    }
    lock.unlock();

    if (first) {
        ctx.logger.info(tag() + "cancelling");
        if (persistCancelling && ctx.manifest.exists(jobId)
            && !ctx.manifest.setJobState(jobId, JobState::Cancelling))
            ctx.logger.debug(tag() + "cancelling not recorded: " + ctx.manifest.lastError());

        // Closes every open transport of this job before returning.
        token.cancel();
    }

    lock.lock();
    terminalCv.wait_for(lock, ctx.cfg.cancelTimeout, [this]() { return isTerminal(job.state); });

    if (job.state == JobState::Cancelled)
        return CancelResult::Cancelled;
    if (isTerminal(job.state))
        return CancelResult::NoOp;
    return CancelResult::TimedOut;
}

void JobController::stop() {
    bool sever = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (started && !isTerminal(job.state)) {
            stopRequested.store(true);
            sever = true;
        }
        started = true;
    }

    if (sever)
        token.cancel();
    join();
}

void JobController::join() {
    if (runner.joinable() && runner.get_id() != std::this_thread::get_id())
        runner.join();
}

bool JobController::waitTerminal(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx);
    return terminalCv.wait_for(lock, timeout, [this]() { return isTerminal(job.state); });
}

JobState JobController::state() const {
    std::lock_guard<std::mutex> lock(mtx);
    return job.state;
}

JobStatus JobController::status() {
    JobStatus st;
    std::shared_ptr<PartQueue> q;
    std::vector<Part> current;
    {
        std::lock_guard<std::mutex> lock(mtx);
        st.id = job.id;
        st.locator = job.locator;
        st.targetName = job.targetName;
        st.state = job.state;
        st.error = job.error;
        st.bytesTotal = job.totalSize.value_or(0);
        st.archivePath = job.archivePath;
        st.createdAt = job.createdAt;
        st.updatedAt = job.updatedAt;
        q = queue;
        current = parts;
    }

    if (q)
        current = q->snapshot();

    for (const auto& p : current) {
        std::uint64_t bytes = 0;
        if (p.state == PartState::Done)
            bytes = p.length;
        else if (p.state == PartState::InFlight)
            bytes = p.bytesReceived;

        st.bytesDone += bytes;
        st.parts.push_back({ p.index, p.state, bytes, p.length, p.attempts });
    }

    if (st.state == JobState::Downloading)
        st.bytesPerSec = progress.speedBytesPerSec();
    return st;
}

void JobController::onWorkerReport(const WorkerReport& report) {
    const std::string part = "part " + std::to_string(report.partIndex);

    if (report.success) {
        ctx.logger.debug(tag() + part + " done (" + std::to_string(report.bytesDownloaded) + " bytes)");
        return;
    }

    if (report.error.kind == ErrorKind::Cancelled)
        return;

    if (report.willRetry) {
        ctx.logger.warn(tag() + part + " attempt " + std::to_string(report.attempts) + " failed ("
            + toString(report.error.kind) + "): " + report.error.message);
        return;
    }

    const std::string err = part + " failed after " + std::to_string(report.attempts) + " attempts ("
        + toString(report.error.kind) + "): " + report.error.message;
    ctx.logger.error(tag() + err);
    fail(err);

    // The file cannot be completed; sever the rest of the job's fetches.
    token.cancel();
}

void JobController::logProgress(PartQueue& q) {
    const auto snapshot = q.snapshot();
    std::size_t doneParts = 0;
    std::size_t activeParts = 0;
    for (const auto& p : snapshot) {
        if (p.state == PartState::Done)
            ++doneParts;
        else if (p.state == PartState::InFlight)
            ++activeParts;
    }

    const std::uint64_t total = progress.total();
    const std::uint64_t done = q.bytesDone();
    const double pct = total > 0 ? static_cast<double>(done) * 100.0 / static_cast<double>(total) : 100.0;

    std::ostringstream os;
    os << "Progress: "
        << done << "/" << total << " bytes ("
        << std::fixed << std::setprecision(1) << pct << "%), "
        << std::setprecision(2) << (progress.speedBytesPerSec() / 1'000'000.0) << " MB/s, parts "
        << doneParts << "/" << snapshot.size() << ", active " << activeParts;

    ctx.logger.info(tag() + os.str());
}
