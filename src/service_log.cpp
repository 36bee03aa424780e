#include "service_log.hpp"
#include <fstream>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fmt/format.h>

namespace fs = std::filesystem;

ServiceLog::ServiceLog(std::string logFile, std::string errorLogFile, bool echo)
    : logFile_(std::move(logFile)), errorLogFile_(std::move(errorLogFile)), echo_(echo) {
    for (const auto& path : {logFile_, errorLogFile_}) {
        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
        }
    }
}

void ServiceLog::logMessage(const std::string& message) const {
    append(logFile_, fmt::format("[{}] {}", localTimestamp(), message), false);
}

void ServiceLog::logWarning(const std::string& message) const {
    append(logFile_, fmt::format("[{}] WARNING: {}", localTimestamp(), message), false);
}

void ServiceLog::logError(const std::string& message) const {
    append(errorLogFile_, fmt::format("[{}] ERROR: {}", localTimestamp(), message), true);
}

void ServiceLog::append(const std::string& path, const std::string& line, bool toStderr) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (echo_) {
        fmt::print(toStderr ? stderr : stdout, "{}\n", line);
    }

    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << line << '\n';
        log.flush();
    } else if (echo_) {
        fmt::print(stderr, "Error: Cannot write to log file: {}\n", path);
    }
}

std::string localTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tmLocal{};
    localtime_r(&timeT, &tmLocal);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmLocal);
    return timeBuf;
}

std::string isoTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tmUtc{};
    gmtime_r(&timeT, &tmUtc);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%dT%H:%M:%S", &tmUtc);
    return fmt::format("{}.{:03d}Z", timeBuf, static_cast<int>(millis));
}
