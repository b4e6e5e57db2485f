#pragma once
#include <string>
#include <cstdint>
#include <optional>

// Layout of in-progress data on the scratch volume:
//   <root>/<jobId>/parts/part.<index>   one file per part
//   <root>/<jobId>/out/<targetName>     assembled file, before tiering
// Part files and the assembled file live in separate directories so no
// target name can alias a part file.
class ScratchArea {
public:
    explicit ScratchArea(const std::string& root);

    std::string jobDir(const std::string& jobId) const;
    std::string partsDir(const std::string& jobId) const;
    std::string outputDir(const std::string& jobId) const;
    std::string partPath(const std::string& jobId, std::uint64_t index) const;
    std::string assembledPath(const std::string& jobId, const std::string& targetName) const;

    // Creates the job directory with its parts/ and out/ subdirectories.
    bool ensureJobDir(const std::string& jobId, std::string& error) const;
    std::optional<std::uint64_t> partLength(const std::string& jobId, std::uint64_t index) const;

    void removePart(const std::string& jobId, std::uint64_t index) const;
    bool removeJob(const std::string& jobId, std::string& error) const;
    bool hasJob(const std::string& jobId) const;

private:
    std::string rootDir;
};
