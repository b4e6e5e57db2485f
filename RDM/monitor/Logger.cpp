#include "Logger.h"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <chrono>
#include <ctime>

namespace {
const char* levelName(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "?";
}

std::string timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream os;
    os << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return os.str();
}
}

bool parseLogLevel(const std::string& text, LogLevel& out) {
    if (text == "debug" || text == "DEBUG") out = LogLevel::Debug;
    else if (text == "info" || text == "INFO") out = LogLevel::Info;
    else if (text == "warn" || text == "WARN" || text == "warning" || text == "WARNING") out = LogLevel::Warn;
    else if (text == "error" || text == "ERROR") out = LogLevel::Error;
    else return false;
    return true;
}

Logger::Logger(std::ostream& out)
    : sink(out) {
}

Logger::Logger()
    : sink(std::cout) {
}

Logger::~Logger() {
    stop();
}

bool Logger::openFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx);
    file.open(path, std::ios::app);
    return file.is_open();
}

void Logger::start() {
    if (running.exchange(true))
        return;
    worker = std::thread(&Logger::run, this);
}

void Logger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();

    if (worker.joinable())
        worker.join();

    std::unique_lock<std::mutex> lock(mtx);
    drain(lock);
}

void Logger::log(LogLevel level, const std::string& msg) {
    if (level < minLevel.load())
        return;

    std::ostringstream line;
    line << timestamp() << " | " << std::left << std::setw(7) << levelName(level) << " | " << msg;

    {
        std::lock_guard<std::mutex> lock(mtx);
        messages.push(line.str());
    }
    cv.notify_one();
}

void Logger::drain(std::unique_lock<std::mutex>&) {
    while (!messages.empty()) {
        sink << messages.front() << std::endl;
        if (file.is_open())
            file << messages.front() << std::endl;
        messages.pop();
    }
}

void Logger::run() {
    std::unique_lock<std::mutex> lock(mtx);
    while (running.load() || !messages.empty()) {
        cv.wait(lock, [&]() {
            return !messages.empty() || !running.load();
            });

        drain(lock);
    }
}
