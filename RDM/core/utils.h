#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <chrono>
#include <optional>

struct EngineConfig {
    std::string scratchDir = "scratch";
    std::string archiveDir = "archive";
    std::string manifestDir; // empty = <scratchDir>/.manifest

    std::uint64_t partSize = 32ull * 1024 * 1024;

    std::size_t globalConcurrency = 4;
    std::size_t perJobConcurrency = 4;

    unsigned maxPartAttempts = 8;
    std::chrono::milliseconds backoffBase{ 1000 };
    std::chrono::milliseconds backoffMax{ 60000 };
    std::chrono::milliseconds rateLimitFloor{ 5000 };

    unsigned tieringAttempts = 5;
    std::chrono::milliseconds tieringBackoff{ 2000 };

    std::chrono::milliseconds cancelTimeout{ 2000 };
    std::chrono::milliseconds progressInterval{ 1000 };

    bool verifyChecksums = true;
};

enum class JobState {
    Queued,
    Planning,
    Resuming,
    Downloading,
    Assembling,
    Tiering,
    Completed,
    Cancelling,
    Cancelled,
    Failed
};

enum class PartState {
    Pending,
    InFlight,
    Done,
    Failed
};

enum class ErrorKind {
    None,
    Transient,
    RateLimited,
    Fatal,
    Cancelled,
    Corrupt
};

enum class CancelResult {
    Cancelled,
    NoOp,      // already terminal
    NotFound,
    TimedOut   // still Cancelling when the wait ran out
};

struct FetchError {
    ErrorKind kind = ErrorKind::None;
    std::chrono::milliseconds retryAfter{ 0 }; // provider hint, 0 = none
    std::string message;
};

struct Part {
    std::uint64_t index = 0;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    PartState state = PartState::Pending;

    // Retry state
    unsigned attempts = 0;
    std::chrono::steady_clock::time_point nextEligible{};

    std::uint64_t lengthOnDisk = 0;
    std::uint32_t crc = 0;
    bool hasCrc = false;
    std::string error;

    std::uint64_t bytesReceived = 0; // in-memory only, for status of InFlight parts
};

struct Job {
    std::string id;
    std::string locator;
    std::string targetName;

    std::optional<std::uint64_t> totalSize;
    std::uint64_t partSize = 0;

    JobState state = JobState::Queued;
    std::int64_t createdAt = 0; // unix seconds
    std::int64_t updatedAt = 0;
    std::string error;

    std::size_t concurrencyLimit = 0; // 0 = engine default
    std::string archivePath;
};

struct JobOptions {
    std::optional<std::uint64_t> knownSize;
    std::size_t concurrencyLimit = 0;
};

struct PartProgress {
    std::uint64_t index;
    PartState state;
    std::uint64_t bytes;
    std::uint64_t length;
    unsigned attempts;
};

struct JobStatus {
    std::string id;
    std::string locator;
    std::string targetName;
    JobState state = JobState::Queued;
    std::string error;

    std::uint64_t bytesDone = 0;
    std::uint64_t bytesTotal = 0;
    double bytesPerSec = 0.0;

    std::vector<PartProgress> parts;
    std::string archivePath;
    std::int64_t createdAt = 0;
    std::int64_t updatedAt = 0;
};

struct WorkerReport {
    std::uint64_t partIndex = 0;
    std::uint64_t bytesDownloaded = 0;
    bool success = false;
    FetchError error;
    unsigned attempts = 0;
    bool willRetry = false;
};

struct HistoryEntry {
    std::string targetName;
    std::uint64_t size = 0;
    double durationSec = 0.0;
    std::int64_t completedAt = 0;
    std::string archivePath;
};

const char* toString(JobState state);
const char* toString(PartState state);
const char* toString(ErrorKind kind);
const char* toString(CancelResult result);

bool parseJobState(const std::string& text, JobState& out);
bool isTerminal(JobState state);

std::int64_t unixNow();
