#pragma once
#include <string>
#include <vector>
#include <functional>
#include "../core/utils.h"
#include "../monitor/Logger.h"

struct DownloadRequest {
    std::string url;
    std::string output; // empty = name from url
};

struct CliRequest {
    std::vector<DownloadRequest> downloads;
    bool list = false;
    bool help = false;
    std::string resumeId;
    std::string discardId;

    LogLevel logLevel = LogLevel::Info;
    std::string logFile;
};

// Fills EngineConfig and the request from defaults, then RDM_* environment
// variables, then command-line flags.
class ArgumentParser {
public:
    using EnvLookup = std::function<const char*(const char*)>;

    ArgumentParser();
    explicit ArgumentParser(EnvLookup lookup);

    bool parse(int argc, char* argv[], EngineConfig& cfg, CliRequest& out) const;
    bool applyEnvironment(EngineConfig& cfg, CliRequest& out) const;

    void printUsage() const;

    // Plain bytes or with a K/M/G suffix (binary units).
    static bool parseSize(const std::string& text, std::uint64_t& out);

private:
    EnvLookup env;
};
