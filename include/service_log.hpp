/**
 * @file service_log.hpp
 * @brief Process-level log for the RestoreVault service.
 *
 * Writes timestamped lines to a log file and mirrors them on the console. Per-restore
 * output goes to the Execution record instead; this log records service lifecycle,
 * stage transitions and terminal outcomes.
 */

#ifndef SERVICE_LOG_HPP
#define SERVICE_LOG_HPP

#include <string>
#include <mutex>

/**
 * @brief File-backed service log.
 *
 * Safe to share between worker threads; every call appends one line under a lock.
 */
class ServiceLog {
public:
    /**
     * @brief Constructs a log writing to the given files.
     *
     * @param logFile Path of the informational log.
     * @param errorLogFile Path of the error log.
     * @param echo If true, lines are mirrored to stdout/stderr.
     */
    ServiceLog(std::string logFile, std::string errorLogFile, bool echo = true);

    /**
     * @brief Logs an informational message.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs a warning. Written to the informational log with a WARNING: prefix.
     */
    void logWarning(const std::string& message) const;

    /**
     * @brief Logs an error to the error log with an ERROR: prefix.
     */
    void logError(const std::string& message) const;

    const std::string& logFile() const { return logFile_; }
    const std::string& errorLogFile() const { return errorLogFile_; }

private:
    void append(const std::string& path, const std::string& line, bool toStderr) const;

    std::string logFile_;      ///< Informational log path.
    std::string errorLogFile_; ///< Error log path.
    bool echo_;                ///< Mirror to console.
    mutable std::mutex mutex_; ///< Serializes writers.
};

/**
 * @brief Current local time formatted as "YYYY-MM-DD HH:MM:SS".
 */
std::string localTimestamp();

/**
 * @brief Current UTC time formatted as ISO-8601 with milliseconds ("2024-01-02T03:04:05.678Z").
 */
std::string isoTimestamp();

#endif // SERVICE_LOG_HPP
