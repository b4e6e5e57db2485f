#include "ManifestStore.h"
#include "FileOps.h"

#include <fstream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <algorithm>

namespace fs = std::filesystem;

namespace {
const char* kMagic = "RDM-MANIFEST";
const int kVersion = 1;
const char* kSuffix = ".meta";

bool expectLabel(std::istream& in, const char* label) {
    std::string word;
    in >> word;
    return in && word == label;
}
}

ManifestStore::ManifestStore(const std::string& dir)
    : manifestDir(dir) {
}

bool ManifestStore::init() {
    std::error_code ec;
    fs::create_directories(manifestDir, ec);
    if (ec) {
        setError("cannot create manifest dir '" + manifestDir + "': " + ec.message());
        return false;
    }
    return true;
}

std::string ManifestStore::pathFor(const std::string& jobId) const {
    return (fs::path(manifestDir) / (jobId + kSuffix)).string();
}

std::string ManifestStore::historyPath() const {
    return (fs::path(manifestDir) / "history.log").string();
}

std::string ManifestStore::serialize(const Job& job, const std::vector<Part>& parts) {
    std::ostringstream out;

    out << kMagic << ' ' << kVersion << '\n';
    out << "id " << std::quoted(job.id) << '\n';
    out << "locator " << std::quoted(job.locator) << '\n';
    out << "target " << std::quoted(job.targetName) << '\n';
    out << "size " << (job.totalSize ? 1 : 0) << ' ' << job.totalSize.value_or(0) << '\n';
    out << "partSize " << job.partSize << '\n';
    out << "state " << toString(job.state) << '\n';
    out << "times " << job.createdAt << ' ' << job.updatedAt << '\n';
    out << "concurrency " << job.concurrencyLimit << '\n';
    out << "archive " << std::quoted(job.archivePath) << '\n';
    out << "error " << std::quoted(job.error) << '\n';
    out << "parts " << parts.size() << '\n';

    for (const auto& p : parts) {
        out << p.index << ' '
            << p.offset << ' '
            << p.length << ' '
            << static_cast<int>(p.state) << ' '
            << p.attempts << ' '
            << p.lengthOnDisk << ' '
            << (p.hasCrc ? 1 : 0) << ' '
            << p.crc << ' '
            << std::quoted(p.error) << '\n';
    }

    return out.str();
}

bool ManifestStore::readFile(const std::string& path, Job& job, std::vector<Part>& parts) const {
    std::ifstream in(path);
    if (!in.is_open())
        return false;

    int version = 0;
    if (!expectLabel(in, kMagic))
        return false;
    in >> version;
    if (!in || version != kVersion)
        return false;

    int hasSize = 0;
    std::uint64_t size = 0;
    std::string stateName;
    std::size_t partCount = 0;

    if (!expectLabel(in, "id")) return false;
    in >> std::quoted(job.id);
    if (!expectLabel(in, "locator")) return false;
    in >> std::quoted(job.locator);
    if (!expectLabel(in, "target")) return false;
    in >> std::quoted(job.targetName);
    if (!expectLabel(in, "size")) return false;
    in >> hasSize >> size;
    if (!expectLabel(in, "partSize")) return false;
    in >> job.partSize;
    if (!expectLabel(in, "state")) return false;
    in >> stateName;
    if (!expectLabel(in, "times")) return false;
    in >> job.createdAt >> job.updatedAt;
    if (!expectLabel(in, "concurrency")) return false;
    in >> job.concurrencyLimit;
    if (!expectLabel(in, "archive")) return false;
    in >> std::quoted(job.archivePath);
    if (!expectLabel(in, "error")) return false;
    in >> std::quoted(job.error);
    if (!expectLabel(in, "parts")) return false;
    in >> partCount;

    if (!in || !parseJobState(stateName, job.state))
        return false;

    job.totalSize.reset();
    if (hasSize)
        job.totalSize = size;

    // A count the recorded size cannot produce means a damaged file.
    std::uint64_t maxParts = 0;
    if (hasSize && job.partSize > 0)
        maxParts = size / job.partSize + (size % job.partSize != 0 ? 1 : 0);
    if (partCount > maxParts)
        return false;

    // No reserve: the count is only trusted as far as lines actually parse.
    parts.clear();

    for (std::size_t i = 0; i < partCount; ++i) {
        Part p;
        int state = 0;
        int hasCrc = 0;

        in >> p.index >> p.offset >> p.length >> state
           >> p.attempts >> p.lengthOnDisk >> hasCrc >> p.crc
           >> std::quoted(p.error);

        if (!in || p.index != i || state < 0 || state > static_cast<int>(PartState::Failed))
            return false;

        p.state = static_cast<PartState>(state);
        p.hasCrc = hasCrc != 0;
        parts.push_back(p);
    }

    return true;
}

std::shared_ptr<ManifestStore::Record> ManifestStore::record(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(recordsMutex);

    auto it = records.find(jobId);
    if (it != records.end())
        return it->second;

    auto rec = std::make_shared<Record>();
    if (!readFile(pathFor(jobId), rec->job, rec->parts))
        return nullptr;

    records[jobId] = rec;
    return rec;
}

bool ManifestStore::persist(Record& rec) {
    if (rec.removed) {
        setError("manifest for job " + rec.job.id + " was removed");
        return false;
    }

    rec.job.updatedAt = unixNow();

    std::string err;
    if (!writeFileDurably(pathFor(rec.job.id), serialize(rec.job, rec.parts), err)) {
        setError(err);
        return false;
    }
    return true;
}

bool ManifestStore::recordPlan(const Job& job, const std::vector<Part>& parts) {
    auto rec = std::make_shared<Record>();
    rec->job = job;
    rec->parts = parts;

    {
        std::lock_guard<std::mutex> lock(rec->mtx);
        if (!persist(*rec))
            return false;
    }

    std::lock_guard<std::mutex> lock(recordsMutex);
    records[job.id] = rec;
    return true;
}

bool ManifestStore::updatePart(const std::string& jobId, std::uint64_t partIndex,
    const std::function<void(Part&)>& change) {
    auto rec = record(jobId);
    if (!rec) {
        setError("no manifest for job " + jobId);
        return false;
    }

    std::lock_guard<std::mutex> lock(rec->mtx);
    if (partIndex >= rec->parts.size()) {
        setError("part " + std::to_string(partIndex) + " out of range for job " + jobId);
        return false;
    }

    Part& part = rec->parts[partIndex];
    const Part before = part;
    change(part);

    if (!persist(*rec)) {
        part = before;
        return false;
    }
    return true;
}

bool ManifestStore::markInFlight(const std::string& jobId, std::uint64_t partIndex) {
    return updatePart(jobId, partIndex, [](Part& p) {
        p.state = PartState::InFlight;
        p.lengthOnDisk = 0;
        p.hasCrc = false;
        });
}

bool ManifestStore::markDone(const std::string& jobId, std::uint64_t partIndex,
    std::uint64_t lengthWritten, std::uint32_t crc) {
    return updatePart(jobId, partIndex, [&](Part& p) {
        p.state = PartState::Done;
        p.lengthOnDisk = lengthWritten;
        p.crc = crc;
        p.hasCrc = true;
        p.error.clear();
        });
}

bool ManifestStore::markFailed(const std::string& jobId, std::uint64_t partIndex,
    const std::string& err, unsigned attempts) {
    return updatePart(jobId, partIndex, [&](Part& p) {
        p.state = PartState::Failed;
        p.attempts = attempts;
        p.lengthOnDisk = 0;
        p.hasCrc = false;
        p.error = err;
        });
}

bool ManifestStore::markPending(const std::string& jobId, std::uint64_t partIndex) {
    return updatePart(jobId, partIndex, [](Part& p) {
        p.state = PartState::Pending;
        p.lengthOnDisk = 0;
        p.hasCrc = false;
        });
}

bool ManifestStore::setJobState(const std::string& jobId, JobState state, const std::string& err) {
    auto rec = record(jobId);
    if (!rec) {
        setError("no manifest for job " + jobId);
        return false;
    }

    std::lock_guard<std::mutex> lock(rec->mtx);
    const Job before = rec->job;
    rec->job.state = state;
    rec->job.error = err;

    if (!persist(*rec)) {
        rec->job = before;
        return false;
    }
    return true;
}

bool ManifestStore::setArchivePath(const std::string& jobId, const std::string& archivePath) {
    auto rec = record(jobId);
    if (!rec) {
        setError("no manifest for job " + jobId);
        return false;
    }

    std::lock_guard<std::mutex> lock(rec->mtx);
    const std::string before = rec->job.archivePath;
    rec->job.archivePath = archivePath;

    if (!persist(*rec)) {
        rec->job.archivePath = before;
        return false;
    }
    return true;
}

bool ManifestStore::resetRetries(const std::string& jobId) {
    auto rec = record(jobId);
    if (!rec) {
        setError("no manifest for job " + jobId);
        return false;
    }

    std::lock_guard<std::mutex> lock(rec->mtx);
    const auto before = rec->parts;
    for (auto& p : rec->parts) {
        p.attempts = 0;
        if (p.state == PartState::Failed)
            p.state = PartState::Pending;
    }

    if (!persist(*rec)) {
        rec->parts = before;
        return false;
    }
    return true;
}

bool ManifestStore::loadJob(const std::string& jobId, Job& job, std::vector<Part>& parts) {
    auto rec = record(jobId);
    if (!rec) {
        setError("no readable manifest for job " + jobId);
        return false;
    }

    std::lock_guard<std::mutex> lock(rec->mtx);

    // A crash may have happened mid-write: never trust an InFlight part.
    for (auto& p : rec->parts) {
        if (p.state == PartState::InFlight) {
            p.state = PartState::Pending;
            p.lengthOnDisk = 0;
            p.hasCrc = false;
        }
    }

    job = rec->job;
    parts = rec->parts;
    return true;
}

std::vector<Job> ManifestStore::listJobs() {
    std::vector<Job> jobs;

    std::error_code ec;
    fs::directory_iterator it(manifestDir, ec);
    if (ec)
        return jobs;

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != kSuffix)
            continue;

        const std::string jobId = entry.path().stem().string();
        auto rec = record(jobId);
        if (!rec) {
            setError("skipping unreadable manifest " + entry.path().string());
            continue;
        }

        std::lock_guard<std::mutex> lock(rec->mtx);
        jobs.push_back(rec->job);
    }

    std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
        return a.createdAt != b.createdAt ? a.createdAt < b.createdAt : a.id < b.id;
        });
    return jobs;
}

std::vector<Job> ManifestStore::listActiveJobs() {
    auto jobs = listJobs();
    jobs.erase(std::remove_if(jobs.begin(), jobs.end(), [](const Job& j) {
        return isTerminal(j.state);
        }), jobs.end());
    return jobs;
}

bool ManifestStore::exists(const std::string& jobId) const {
    {
        std::lock_guard<std::mutex> lock(recordsMutex);
        if (records.count(jobId))
            return true;
    }
    std::error_code ec;
    return fs::exists(pathFor(jobId), ec);
}

bool ManifestStore::remove(const std::string& jobId) {
    // Held throughout so record() cannot reload the file while it is deleted.
    std::lock_guard<std::mutex> lock(recordsMutex);

    std::shared_ptr<Record> rec;
    std::unique_lock<std::mutex> recLock;
    auto it = records.find(jobId);
    if (it != records.end()) {
        rec = it->second;
        records.erase(it);
        recLock = std::unique_lock<std::mutex>(rec->mtx);
        rec->removed = true;
    }

    std::error_code ec;
    fs::remove(pathFor(jobId), ec);
    if (ec) {
        setError("cannot remove manifest for job " + jobId + ": " + ec.message());
        return false;
    }

    syncDirectory(manifestDir);
    return true;
}

bool ManifestStore::appendHistory(const HistoryEntry& entry) {
    std::lock_guard<std::mutex> lock(historyMutex);

    std::ofstream out(historyPath(), std::ios::app);
    if (!out.is_open()) {
        setError("cannot open history file " + historyPath());
        return false;
    }

    out << std::quoted(entry.targetName) << ' '
        << entry.size << ' '
        << std::fixed << std::setprecision(3) << entry.durationSec << ' '
        << entry.completedAt << ' '
        << std::quoted(entry.archivePath) << '\n';
    out.flush();

    return static_cast<bool>(out);
}

std::vector<HistoryEntry> ManifestStore::recentHistory(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(historyMutex);

    std::vector<HistoryEntry> all;
    std::ifstream in(historyPath());
    if (!in.is_open())
        return all;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream ls(line);
        HistoryEntry e;
        ls >> std::quoted(e.targetName) >> e.size >> e.durationSec
           >> e.completedAt >> std::quoted(e.archivePath);
        if (ls)
            all.push_back(e);
    }

    std::reverse(all.begin(), all.end());
    if (all.size() > limit)
        all.resize(limit);
    return all;
}

bool ManifestStore::clearHistory() {
    std::lock_guard<std::mutex> lock(historyMutex);

    std::error_code ec;
    fs::remove(historyPath(), ec);
    if (ec) {
        setError("cannot clear history: " + ec.message());
        return false;
    }
    return true;
}

std::string ManifestStore::lastError() const {
    std::lock_guard<std::mutex> lock(errorMutex);
    return error;
}

void ManifestStore::setError(const std::string& msg) {
    std::lock_guard<std::mutex> lock(errorMutex);
    error = msg;
}
