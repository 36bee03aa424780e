/**
 * @file execution.hpp
 * @brief Execution records: status, stage, progress and append-only logs of one restore.
 */

#ifndef EXECUTION_HPP
#define EXECUTION_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <expected>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <memory>
#include <map>
#include <chrono>
#include <functional>
#include <json/json.h>
#include "adapter.hpp"
#include "service_log.hpp"

enum class ExecutionStatus {
    Running,
    Success,
    Failed
};

/**
 * @brief Pipeline stage persisted in the execution metadata.
 */
enum class RestoreStage {
    Initializing,
    Downloading,
    Decrypting,
    Decompressing,
    RestoringDatabase,
    Completed,
    Failed
};

std::string_view executionStatusName(ExecutionStatus status);
std::string_view restoreStageName(RestoreStage stage);
ExecutionStatus parseExecutionStatus(std::string_view name);
RestoreStage parseRestoreStage(std::string_view name);

struct LogEntry {
    std::string timestamp; ///< ISO-8601 UTC.
    std::string message;
    LogLevel level = LogLevel::Info;
    LogType type = LogType::General;
    std::string stage;
    std::optional<std::string> details;
};

struct Execution {
    std::string id;
    std::string type = "Restore";
    ExecutionStatus status = ExecutionStatus::Running;
    std::vector<LogEntry> logs;
    RestoreStage stage = RestoreStage::Initializing;
    int progress = 0;
    std::string path; ///< Remote artifact path.
    std::string startedAt;
    std::optional<std::string> endedAt;

    Json::Value toJson() const;
    static Execution fromJson(const Json::Value& root);
};

/**
 * @brief Persistence for execution records.
 */
class ExecutionStore {
public:
    virtual ~ExecutionStore() = default;

    virtual std::expected<void, std::string> save(const Execution& execution) = 0;
    virtual std::optional<Execution> load(const std::string& id) const = 0;
};

/**
 * @brief One JSON file per execution: "<dir>/<id>.json".
 *
 * Files are written to a temporary name and renamed into place, so readers never see a
 * partial record.
 */
class JsonFileExecutionStore : public ExecutionStore {
public:
    explicit JsonFileExecutionStore(std::string directory);

    std::expected<void, std::string> save(const Execution& execution) override;
    std::optional<Execution> load(const std::string& id) const override;

private:
    std::string directory_;
};

/**
 * @brief Process-local store, used when no executions directory is wanted and in tests.
 */
class MemoryExecutionStore : public ExecutionStore {
public:
    std::expected<void, std::string> save(const Execution& execution) override;
    std::optional<Execution> load(const std::string& id) const override;

    std::size_t saveCount() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Execution> executions_;
    std::size_t saves_ = 0;
};

/**
 * @brief Rate limiter for execution flushes.
 *
 * Allows one flush per interval. Forced flushes always pass and restart the interval.
 */
class FlushThrottle {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit FlushThrottle(std::chrono::milliseconds interval = std::chrono::seconds(1),
                           Clock clock = [] { return std::chrono::steady_clock::now(); });

    /**
     * @brief Decides whether a flush may happen now, and records it if so.
     * @param force Bypass the interval (errors, terminal state).
     */
    bool shouldFlush(bool force = false);

    std::chrono::milliseconds interval() const { return interval_; }

private:
    std::chrono::milliseconds interval_;
    Clock clock_;
    std::optional<std::chrono::steady_clock::time_point> lastFlush_;
};

/**
 * @brief Classifies a raw tool output line by substring.
 *
 * "error", "fail" or "fatal" (any case) is an error, "warn" a warning, anything else info.
 */
LogLevel classifyLogLine(std::string_view line);

/**
 * @brief Owner of one Execution while its restore runs.
 *
 * Logs only grow, the status leaves Running exactly once and the record is frozen
 * afterwards. Every mutation goes through the flush throttle; error entries and the
 * terminal transition flush synchronously. An update the throttle holds back is written
 * by a background flusher one interval later, even if nothing else happens meanwhile.
 */
class ExecutionTracker {
public:
    /**
     * @param execution Freshly created record.
     * @param store Persistence target.
     * @param serviceLog Receives persistence failures. May be null.
     * @param throttle Flush rate limiter.
     */
    ExecutionTracker(Execution execution, ExecutionStore& store, const ServiceLog* serviceLog = nullptr,
                     FlushThrottle throttle = FlushThrottle());

    /**
     * @brief Stops the flusher and persists any update still held back.
     */
    ~ExecutionTracker();

    ExecutionTracker(const ExecutionTracker&) = delete;
    ExecutionTracker& operator=(const ExecutionTracker&) = delete;

    /**
     * @brief Appends a log entry tagged with the current stage.
     */
    void log(const std::string& message, LogLevel level = LogLevel::Info,
             LogType type = LogType::General, std::optional<std::string> details = std::nullopt);

    /**
     * @brief Moves to a new stage and persists it.
     */
    void setStage(RestoreStage stage);

    /**
     * @brief Updates progress, clamped to 0-100.
     */
    void setProgress(int percent);

    /**
     * @brief Records Success, stage Completed, progress 100. Ignored if already terminal.
     * @return False if the execution was already terminal.
     */
    bool complete(const std::string& message);

    /**
     * @brief Records Failed, stage Failed, and appends the error. Ignored if already terminal.
     */
    bool fail(const std::string& message);

    bool isTerminal() const;

    /**
     * @brief Copy of the current record.
     */
    Execution snapshot() const;

    const std::string& id() const { return id_; }

private:
    void flush(bool force);
    void save();
    void runTrailingFlushes();
    bool finish(ExecutionStatus status, RestoreStage stage, const std::string& message, LogLevel level);

    std::string id_;
    mutable std::mutex mutex_;
    Execution execution_;
    ExecutionStore& store_;
    const ServiceLog* serviceLog_;
    FlushThrottle throttle_;

    std::condition_variable pending_;
    bool dirty_ = false;
    bool stopping_ = false;
    std::thread flusher_; ///< Started after the initial flush.
};

#endif // EXECUTION_HPP
