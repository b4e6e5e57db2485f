#include "ArgumentParser.h"
#include <iostream>
#include <cstdlib>
#include <cctype>

namespace {
bool parseCount(const std::string& text, std::size_t& out) {
    std::uint64_t value = 0;
    if (!ArgumentParser::parseSize(text, value) || value == 0)
        return false;
    out = static_cast<std::size_t>(value);
    return true;
}

bool parseAttempts(const std::string& text, unsigned& out) {
    std::size_t value = 0;
    if (!parseCount(text, value))
        return false;
    out = static_cast<unsigned>(value);
    return true;
}
}

ArgumentParser::ArgumentParser()
    : env([](const char* name) { return static_cast<const char*>(std::getenv(name)); }) {
}

ArgumentParser::ArgumentParser(EnvLookup lookup)
    : env(std::move(lookup)) {
}

bool ArgumentParser::parseSize(const std::string& text, std::uint64_t& out) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0])))
        return false;

    char* end = nullptr;
    const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    std::string suffix(end);

    std::uint64_t multiplier = 1;
    if (suffix == "K" || suffix == "k") multiplier = 1024ull;
    else if (suffix == "M" || suffix == "m") multiplier = 1024ull * 1024;
    else if (suffix == "G" || suffix == "g") multiplier = 1024ull * 1024 * 1024;
    else if (!suffix.empty()) return false;

    out = static_cast<std::uint64_t>(value) * multiplier;
    return true;
}

bool ArgumentParser::applyEnvironment(EngineConfig& cfg, CliRequest& out) const {
    auto get = [this](const char* name) -> std::string {
        const char* v = env ? env(name) : nullptr;
        return v ? std::string(v) : std::string();
    };

    std::string v;
    if (!(v = get("RDM_SCRATCH_DIR")).empty()) cfg.scratchDir = v;
    if (!(v = get("RDM_ARCHIVE_DIR")).empty()) cfg.archiveDir = v;
    if (!(v = get("RDM_MANIFEST_DIR")).empty()) cfg.manifestDir = v;

    if (!(v = get("RDM_PART_SIZE")).empty() && (!parseSize(v, cfg.partSize) || cfg.partSize == 0)) {
        std::cerr << "Invalid RDM_PART_SIZE: " << v << "\n";
        return false;
    }
    if (!(v = get("RDM_MAX_WORKERS")).empty() && !parseCount(v, cfg.globalConcurrency)) {
        std::cerr << "Invalid RDM_MAX_WORKERS: " << v << "\n";
        return false;
    }
    if (!(v = get("RDM_JOB_WORKERS")).empty() && !parseCount(v, cfg.perJobConcurrency)) {
        std::cerr << "Invalid RDM_JOB_WORKERS: " << v << "\n";
        return false;
    }
    if (!(v = get("RDM_MAX_RETRIES")).empty() && !parseAttempts(v, cfg.maxPartAttempts)) {
        std::cerr << "Invalid RDM_MAX_RETRIES: " << v << "\n";
        return false;
    }
    if (!(v = get("RDM_LOG_LEVEL")).empty() && !parseLogLevel(v, out.logLevel)) {
        std::cerr << "Invalid RDM_LOG_LEVEL: " << v << "\n";
        return false;
    }
    if (!(v = get("RDM_LOG_FILE")).empty()) out.logFile = v;

    return true;
}

bool ArgumentParser::parse(int argc, char* argv[], EngineConfig& cfg, CliRequest& out) const {
    if (!applyEnvironment(cfg, out)) {
        printUsage();
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;
        bool ok = true;

        if (arg == "-h" || arg == "--help") {
            out.help = true;
        }
        else if (arg == "-o" && hasValue) {
            // Names the target of the url before it.
            if (out.downloads.empty() || !out.downloads.back().output.empty())
                ok = false;
            else
                out.downloads.back().output = argv[++i];
        }
        else if (arg == "-t" && hasValue) {
            ok = parseCount(argv[++i], cfg.globalConcurrency);
        }
        else if (arg == "-j" && hasValue) {
            ok = parseCount(argv[++i], cfg.perJobConcurrency);
        }
        else if (arg == "-s" && hasValue) {
            ok = parseSize(argv[++i], cfg.partSize) && cfg.partSize > 0;
        }
        else if (arg == "--scratch" && hasValue) {
            cfg.scratchDir = argv[++i];
        }
        else if (arg == "--archive" && hasValue) {
            cfg.archiveDir = argv[++i];
        }
        else if (arg == "--manifest" && hasValue) {
            cfg.manifestDir = argv[++i];
        }
        else if (arg == "--retries" && hasValue) {
            ok = parseAttempts(argv[++i], cfg.maxPartAttempts);
        }
        else if (arg == "--log-level" && hasValue) {
            ok = parseLogLevel(argv[++i], out.logLevel);
        }
        else if (arg == "--log-file" && hasValue) {
            out.logFile = argv[++i];
        }
        else if (arg == "--list") {
            out.list = true;
        }
        else if (arg == "--resume" && hasValue) {
            out.resumeId = argv[++i];
        }
        else if (arg == "--discard" && hasValue) {
            out.discardId = argv[++i];
        }
        else if (!arg.empty() && arg[0] != '-') {
            out.downloads.push_back({ arg, "" });
        }
        else {
            ok = false;
        }

        if (!ok) {
            std::cerr << "Invalid argument: " << arg << "\n";
            printUsage();
            return false;
        }
    }

    return true;
}

void ArgumentParser::printUsage() const {
    std::cout <<
        "Usage:\n"
        "  rdm [options] [<url> [-o <name>] ...]\n\n"
        "Unfinished jobs from earlier runs are resumed automatically.\n\n"
        "Options:\n"
        "  -o <name>          Target file name of the preceding url (default: name from url)\n"
        "  -t <n>             Max simultaneous fetches and running jobs (default: 4)\n"
        "  -j <n>             Max workers per job (default: 4)\n"
        "  -s <bytes>         Part size, K/M/G suffix allowed (default: 32M)\n"
        "  --scratch <dir>    Scratch volume directory (default: scratch)\n"
        "  --archive <dir>    Archive volume directory (default: archive)\n"
        "  --manifest <dir>   Manifest directory (default: <scratch>/.manifest)\n"
        "  --retries <n>      Max attempts per part (default: 8)\n"
        "  --log-level <lvl>  debug, info, warn or error (default: info)\n"
        "  --log-file <file>  Also append log lines to <file>\n"
        "  --list             Print known jobs and download history, then exit\n"
        "  --resume <id>      Re-queue a failed job\n"
        "  --discard <id>     Delete a failed job's files and manifest\n\n"
        "Environment: RDM_SCRATCH_DIR, RDM_ARCHIVE_DIR, RDM_MANIFEST_DIR, RDM_PART_SIZE,\n"
        "  RDM_MAX_WORKERS, RDM_JOB_WORKERS, RDM_MAX_RETRIES, RDM_LOG_LEVEL, RDM_LOG_FILE\n";
}
