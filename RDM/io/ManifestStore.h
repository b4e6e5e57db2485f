#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <functional>
#include "../core/utils.h"

// Durable record of jobs and their parts, one text file per job:
// <dir>/<jobId>.meta. Every mutating call returns only after the new
// record has been fsynced and renamed into place.
class ManifestStore
{
public:
    explicit ManifestStore(const std::string& dir);

    bool init();

    bool recordPlan(const Job& job, const std::vector<Part>& parts);
    bool markInFlight(const std::string& jobId, std::uint64_t partIndex);
    bool markDone(const std::string& jobId, std::uint64_t partIndex,
        std::uint64_t lengthWritten, std::uint32_t crc);
    bool markFailed(const std::string& jobId, std::uint64_t partIndex,
        const std::string& error, unsigned attempts);
    bool markPending(const std::string& jobId, std::uint64_t partIndex);

    bool setJobState(const std::string& jobId, JobState state, const std::string& error = "");
    bool setArchivePath(const std::string& jobId, const std::string& archivePath);
    bool resetRetries(const std::string& jobId);

    // Parts left InFlight by a previous run come back as Pending.
    bool loadJob(const std::string& jobId, Job& job, std::vector<Part>& parts);

    std::vector<Job> listJobs();
    std::vector<Job> listActiveJobs();

    bool exists(const std::string& jobId) const;
    bool remove(const std::string& jobId);

    bool appendHistory(const HistoryEntry& entry);
    std::vector<HistoryEntry> recentHistory(std::size_t limit) const;
    bool clearHistory();

    std::string lastError() const;

private:
    struct Record {
        std::mutex mtx;
        Job job;
        std::vector<Part> parts;
        bool removed = false;
    };

    std::shared_ptr<Record> record(const std::string& jobId);
    bool persist(Record& rec);
    bool updatePart(const std::string& jobId, std::uint64_t partIndex,
        const std::function<void(Part&)>& change);

    std::string pathFor(const std::string& jobId) const;
    std::string historyPath() const;
    bool readFile(const std::string& path, Job& job, std::vector<Part>& parts) const;
    static std::string serialize(const Job& job, const std::vector<Part>& parts);

    void setError(const std::string& msg);

private:
    std::string manifestDir;

    std::map<std::string, std::shared_ptr<Record>> records;
    mutable std::mutex recordsMutex;

    mutable std::mutex historyMutex;

    mutable std::mutex errorMutex;
    std::string error;
};
