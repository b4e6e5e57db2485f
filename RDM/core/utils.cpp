#include "utils.h"

const char* toString(JobState state) {
    switch (state) {
    case JobState::Queued:      return "Queued";
    case JobState::Planning:    return "Planning";
    case JobState::Resuming:    return "Resuming";
    case JobState::Downloading: return "Downloading";
    case JobState::Assembling:  return "Assembling";
    case JobState::Tiering:     return "Tiering";
    case JobState::Completed:   return "Completed";
    case JobState::Cancelling:  return "Cancelling";
    case JobState::Cancelled:   return "Cancelled";
    case JobState::Failed:      return "Failed";
    }
    return "Unknown";
}

const char* toString(PartState state) {
    switch (state) {
    case PartState::Pending:  return "Pending";
    case PartState::InFlight: return "InFlight";
    case PartState::Done:     return "Done";
    case PartState::Failed:   return "Failed";
    }
    return "Unknown";
}

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:        return "None";
    case ErrorKind::Transient:   return "Transient";
    case ErrorKind::RateLimited: return "RateLimited";
    case ErrorKind::Fatal:       return "Fatal";
    case ErrorKind::Cancelled:   return "Cancelled";
    case ErrorKind::Corrupt:     return "Corrupt";
    }
    return "Unknown";
}

const char* toString(CancelResult result) {
    switch (result) {
    case CancelResult::Cancelled: return "Cancelled";
    case CancelResult::NoOp:      return "NoOp";
    case CancelResult::NotFound:  return "NotFound";
    case CancelResult::TimedOut:  return "TimedOut";
    }
    return "Unknown";
}

bool parseJobState(const std::string& text, JobState& out) {
    static const JobState all[] = {
        JobState::Queued, JobState::Planning, JobState::Resuming,
        JobState::Downloading, JobState::Assembling, JobState::Tiering,
        JobState::Completed, JobState::Cancelling, JobState::Cancelled,
        JobState::Failed
    };

    for (JobState s : all) {
        if (text == toString(s)) {
            out = s;
            return true;
        }
    }
    return false;
}

bool isTerminal(JobState state) {
    return state == JobState::Completed
        || state == JobState::Cancelled
        || state == JobState::Failed;
}

std::int64_t unixNow() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}
