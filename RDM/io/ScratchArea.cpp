#include "ScratchArea.h"
#include "FileOps.h"

#include <filesystem>

namespace fs = std::filesystem;

ScratchArea::ScratchArea(const std::string& root)
    : rootDir(root) {
}

std::string ScratchArea::jobDir(const std::string& jobId) const {
    return (fs::path(rootDir) / jobId).string();
}

std::string ScratchArea::partsDir(const std::string& jobId) const {
    return (fs::path(rootDir) / jobId / "parts").string();
}

std::string ScratchArea::outputDir(const std::string& jobId) const {
    return (fs::path(rootDir) / jobId / "out").string();
}

std::string ScratchArea::partPath(const std::string& jobId, std::uint64_t index) const {
    return (fs::path(partsDir(jobId)) / ("part." + std::to_string(index))).string();
}

std::string ScratchArea::assembledPath(const std::string& jobId, const std::string& targetName) const {
    return (fs::path(outputDir(jobId)) / targetName).string();
}

bool ScratchArea::ensureJobDir(const std::string& jobId, std::string& error) const {
    for (const auto& dir : { partsDir(jobId), outputDir(jobId) }) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            error = "cannot create scratch dir " + dir + ": " + ec.message();
            return false;
        }
    }
    return true;
}

std::optional<std::uint64_t> ScratchArea::partLength(const std::string& jobId, std::uint64_t index) const {
    return regularFileSize(partPath(jobId, index));
}

void ScratchArea::removePart(const std::string& jobId, std::uint64_t index) const {
    std::error_code ec;
    fs::remove(partPath(jobId, index), ec);
}

bool ScratchArea::removeJob(const std::string& jobId, std::string& error) const {
    std::error_code ec;
    fs::remove_all(jobDir(jobId), ec);
    if (ec) {
        error = "cannot remove scratch dir: " + ec.message();
        return false;
    }
    return true;
}

bool ScratchArea::hasJob(const std::string& jobId) const {
    std::error_code ec;
    return fs::exists(jobDir(jobId), ec);
}
