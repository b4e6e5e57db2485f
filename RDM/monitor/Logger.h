#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <thread>
#include <fstream>
#include <ostream>
#include <condition_variable>
#include <atomic>

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

bool parseLogLevel(const std::string& text, LogLevel& out);

// Asynchronous line logger; one instance per process, shared by reference.
class Logger {
public:
    explicit Logger(std::ostream& out);
    Logger();
    ~Logger();

    void start();
    void stop();

    void setLevel(LogLevel level) { minLevel.store(level); }
    bool openFile(const std::string& path);

    void log(LogLevel level, const std::string& msg);
    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warn, msg); }
    void error(const std::string& msg) { log(LogLevel::Error, msg); }

private:
    void run();
    void drain(std::unique_lock<std::mutex>& lock);

private:
    std::ostream& sink;
    std::ofstream file;
    std::atomic<LogLevel> minLevel{ LogLevel::Info };

    std::queue<std::string> messages;
    std::mutex mtx;
    std::condition_variable cv;
    std::atomic<bool> running{ false };
    std::thread worker;
};
