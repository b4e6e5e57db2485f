#include <iostream>
#include <iomanip>
#include <chrono>
#include <thread>
#include <csignal>
#include <stdexcept>
#include "cli/ArgumentParser.h"
#include "core/Engine.h"
#include "io/StorageTiering.h"
#include "net/HttpFetchClient.h"
#include "monitor/Logger.h"

namespace {
volatile std::sig_atomic_t gStopRequested = 0;

void handleSignal(int) {
    gStopRequested = 1;
}

void printJobs(Engine& engine) {
    auto jobs = engine.listJobs();
    if (jobs.empty())
        std::cout << "No jobs.\n";

    for (const auto& st : jobs) {
        const double pct = st.bytesTotal > 0
            ? static_cast<double>(st.bytesDone) * 100.0 / static_cast<double>(st.bytesTotal)
            : 0.0;
        std::cout << std::left << std::setw(28) << st.id << " "
            << std::setw(12) << toString(st.state) << " "
            << std::right << std::fixed << std::setprecision(1) << std::setw(5) << pct << "%  "
            << st.targetName;
        if (!st.error.empty())
            std::cout << "  (" << st.error << ")";
        std::cout << "\n";
    }

    auto history = engine.history(20);
    if (history.empty())
        return;

    std::cout << "\nRecently completed:\n";
    for (const auto& h : history) {
        std::cout << "  " << h.targetName << "  " << h.size << " bytes in "
            << std::fixed << std::setprecision(1) << h.durationSec << "s -> " << h.archivePath << "\n";
    }
}

int runDownloads(Engine& engine, const CliRequest& request, Logger& logger) {
    if (!engine.start())
        return 1;

    std::vector<std::string> ids;
    if (!request.resumeId.empty()) {
        if (!engine.resume(request.resumeId)) {
            logger.error("cannot resume " + request.resumeId);
            engine.shutdown();
            return 1;
        }
        ids.push_back(request.resumeId);
    }

    for (const auto& d : request.downloads) {
        std::string id = engine.enqueue(d.url, d.output);
        if (id.empty()) {
            engine.shutdown();
            return 1;
        }
        ids.push_back(id);
    }

    while (engine.activeJobs() > 0) {
        if (gStopRequested) {
            logger.info("interrupted, stopping");
            engine.shutdown();
            return 130;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    int rc = 0;
    for (const auto& id : ids) {
        auto st = engine.getStatus(id);
        if (!st || st->state != JobState::Completed)
            rc = 1;
    }

    engine.shutdown();
    return rc;
}
}

int main(int argc, char* argv[]) {
    EngineConfig config;
    CliRequest request;
    ArgumentParser parser;

    if (!parser.parse(argc, argv, config, request))
        return 1;

    if (request.help) {
        parser.printUsage();
        return 0;
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    Logger logger;
    logger.setLevel(request.logLevel);
    if (!request.logFile.empty() && !logger.openFile(request.logFile)) {
        std::cerr << "Cannot open log file " << request.logFile << "\n";
        return 1;
    }
    logger.start();

    int rc = 0;
    try {
        HttpFetchClient client;
        StorageTiering tiering;
        Engine engine(config, client, logger, tiering);

        if (request.list) {
            printJobs(engine);
        }
        else if (!request.discardId.empty()) {
            if (!engine.discard(request.discardId)) {
                logger.error("cannot discard " + request.discardId + ": not a failed job");
                rc = 1;
            }
        }
        else {
            rc = runDownloads(engine, request, logger);
        }
    }
    catch (const std::invalid_argument& e) {
        logger.error(std::string("invalid configuration: ") + e.what());
        rc = 1;
    }

    logger.stop();
    return rc;
}
