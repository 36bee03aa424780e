#include "execution.hpp"
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace fs = std::filesystem;

std::string_view executionStatusName(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Success: return "Success";
        case ExecutionStatus::Failed: return "Failed";
        case ExecutionStatus::Running: break;
    }
    return "Running";
}

std::string_view restoreStageName(RestoreStage stage) {
    switch (stage) {
        case RestoreStage::Initializing: return "Initializing";
        case RestoreStage::Downloading: return "Downloading";
        case RestoreStage::Decrypting: return "Decrypting";
        case RestoreStage::Decompressing: return "Decompressing";
        case RestoreStage::RestoringDatabase: return "Restoring Database";
        case RestoreStage::Completed: return "Completed";
        case RestoreStage::Failed: return "Failed";
    }
    return "Initializing";
}

ExecutionStatus parseExecutionStatus(std::string_view name) {
    if (name == "Success") return ExecutionStatus::Success;
    if (name == "Failed") return ExecutionStatus::Failed;
    return ExecutionStatus::Running;
}

RestoreStage parseRestoreStage(std::string_view name) {
    for (auto stage : {RestoreStage::Downloading, RestoreStage::Decrypting, RestoreStage::Decompressing,
                       RestoreStage::RestoringDatabase, RestoreStage::Completed, RestoreStage::Failed}) {
        if (restoreStageName(stage) == name) {
            return stage;
        }
    }
    return RestoreStage::Initializing;
}

Json::Value Execution::toJson() const {
    Json::Value root(Json::objectValue);
    root["id"] = id;
    root["type"] = type;
    root["status"] = std::string(executionStatusName(status));
    root["path"] = path;
    root["startedAt"] = startedAt;
    if (endedAt) {
        root["endedAt"] = *endedAt;
    }

    Json::Value entries(Json::arrayValue);
    for (const auto& entry : logs) {
        Json::Value item(Json::objectValue);
        item["timestamp"] = entry.timestamp;
        item["message"] = entry.message;
        item["level"] = std::string(logLevelName(entry.level));
        item["type"] = std::string(logTypeName(entry.type));
        item["stage"] = entry.stage;
        if (entry.details) {
            item["details"] = *entry.details;
        }
        entries.append(item);
    }
    root["logs"] = entries;

    Json::Value metadata(Json::objectValue);
    metadata["progress"] = progress;
    metadata["stage"] = std::string(restoreStageName(stage));
    root["metadata"] = metadata;
    return root;
}

Execution Execution::fromJson(const Json::Value& root) {
    Execution execution;
    execution.id = root.get("id", "").asString();
    execution.type = root.get("type", "Restore").asString();
    execution.status = parseExecutionStatus(root.get("status", "Running").asString());
    execution.path = root.get("path", "").asString();
    execution.startedAt = root.get("startedAt", "").asString();
    if (root.isMember("endedAt")) {
        execution.endedAt = root["endedAt"].asString();
    }
    for (const auto& item : root["logs"]) {
        LogEntry entry;
        entry.timestamp = item.get("timestamp", "").asString();
        entry.message = item.get("message", "").asString();
        entry.level = parseLogLevel(item.get("level", "info").asString());
        entry.type = parseLogType(item.get("type", "general").asString());
        entry.stage = item.get("stage", "").asString();
        if (item.isMember("details")) {
            entry.details = item["details"].asString();
        }
        execution.logs.push_back(std::move(entry));
    }
    const Json::Value& metadata = root["metadata"];
    execution.progress = metadata.get("progress", 0).asInt();
    execution.stage = parseRestoreStage(metadata.get("stage", "Initializing").asString());
    return execution;
}

JsonFileExecutionStore::JsonFileExecutionStore(std::string directory)
    : directory_(std::move(directory)) {}

std::expected<void, std::string> JsonFileExecutionStore::save(const Execution& execution) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        return std::unexpected(fmt::format("Failed to create executions directory {}: {}", directory_, ec.message()));
    }

    fs::path target = fs::path(directory_) / (execution.id + ".json");
    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream outFile(temp, std::ios::trunc);
        if (!outFile.is_open()) {
            return std::unexpected(fmt::format("Failed to open execution file for writing: {}", temp.string()));
        }
        Json::StreamWriterBuilder builder;
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(execution.toJson(), &outFile);
        if (!outFile) {
            return std::unexpected(fmt::format("Failed to write execution file: {}", temp.string()));
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        return std::unexpected(fmt::format("Failed to replace execution file {}: {}", target.string(), ec.message()));
    }
    return {};
}

std::optional<Execution> JsonFileExecutionStore::load(const std::string& id) const {
    std::ifstream file(fs::path(directory_) / (id + ".json"));
    if (!file.is_open()) {
        return std::nullopt;
    }
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors)) {
        return std::nullopt;
    }
    return Execution::fromJson(root);
}

std::expected<void, std::string> MemoryExecutionStore::save(const Execution& execution) {
    std::lock_guard lock(mutex_);
    executions_[execution.id] = execution;
    ++saves_;
    return {};
}

std::optional<Execution> MemoryExecutionStore::load(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = executions_.find(id);
    if (it == executions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t MemoryExecutionStore::saveCount() const {
    std::lock_guard lock(mutex_);
    return saves_;
}

FlushThrottle::FlushThrottle(std::chrono::milliseconds interval, Clock clock)
    : interval_(interval), clock_(std::move(clock)) {}

bool FlushThrottle::shouldFlush(bool force) {
    auto now = clock_();
    if (force || !lastFlush_ || now - *lastFlush_ >= interval_) {
        lastFlush_ = now;
        return true;
    }
    return false;
}

LogLevel classifyLogLine(std::string_view line) {
    std::string lower;
    lower.reserve(line.size());
    for (char c : line) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower.find("error") != std::string::npos || lower.find("fail") != std::string::npos ||
        lower.find("fatal") != std::string::npos) {
        return LogLevel::Error;
    }
    if (lower.find("warn") != std::string::npos) {
        return LogLevel::Warning;
    }
    return LogLevel::Info;
}

ExecutionTracker::ExecutionTracker(Execution execution, ExecutionStore& store, const ServiceLog* serviceLog,
                                   FlushThrottle throttle)
    : id_(execution.id),
      execution_(std::move(execution)),
      store_(store),
      serviceLog_(serviceLog),
      throttle_(std::move(throttle)) {
    {
        std::lock_guard lock(mutex_);
        flush(true);
    }
    flusher_ = std::thread(&ExecutionTracker::runTrailingFlushes, this);
}

ExecutionTracker::~ExecutionTracker() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
        if (dirty_) {
            dirty_ = false;
            save();
        }
    }
    pending_.notify_all();
    flusher_.join();
}

void ExecutionTracker::log(const std::string& message, LogLevel level, LogType type, std::optional<std::string> details) {
    std::lock_guard lock(mutex_);
    if (execution_.status != ExecutionStatus::Running) {
        return;
    }
    execution_.logs.push_back(LogEntry{isoTimestamp(), message, level, type,
                                       std::string(restoreStageName(execution_.stage)), std::move(details)});
    flush(level == LogLevel::Error);
}

void ExecutionTracker::setStage(RestoreStage stage) {
    std::lock_guard lock(mutex_);
    if (execution_.status != ExecutionStatus::Running) {
        return;
    }
    execution_.stage = stage;
    flush(true);
}

void ExecutionTracker::setProgress(int percent) {
    std::lock_guard lock(mutex_);
    if (execution_.status != ExecutionStatus::Running) {
        return;
    }
    execution_.progress = std::clamp(percent, 0, 100);
    flush(false);
}

bool ExecutionTracker::complete(const std::string& message) {
    return finish(ExecutionStatus::Success, RestoreStage::Completed, message, LogLevel::Success);
}

bool ExecutionTracker::fail(const std::string& message) {
    return finish(ExecutionStatus::Failed, RestoreStage::Failed, message, LogLevel::Error);
}

bool ExecutionTracker::finish(ExecutionStatus status, RestoreStage stage, const std::string& message, LogLevel level) {
    std::lock_guard lock(mutex_);
    if (execution_.status != ExecutionStatus::Running) {
        return false;
    }
    execution_.logs.push_back(LogEntry{isoTimestamp(), message, level, LogType::General,
                                       std::string(restoreStageName(execution_.stage)), std::nullopt});
    execution_.status = status;
    execution_.stage = stage;
    if (status == ExecutionStatus::Success) {
        execution_.progress = 100;
    }
    execution_.endedAt = isoTimestamp();
    flush(true);
    return true;
}

bool ExecutionTracker::isTerminal() const {
    std::lock_guard lock(mutex_);
    return execution_.status != ExecutionStatus::Running;
}

Execution ExecutionTracker::snapshot() const {
    std::lock_guard lock(mutex_);
    return execution_;
}

void ExecutionTracker::flush(bool force) {
    if (!throttle_.shouldFlush(force)) {
        if (!dirty_) {
            dirty_ = true;
            pending_.notify_one();
        }
        return;
    }
    dirty_ = false;
    save();
}

void ExecutionTracker::runTrailingFlushes() {
    std::unique_lock lock(mutex_);
    while (!stopping_) {
        pending_.wait(lock, [this] { return dirty_ || stopping_; });
        // A flush from a caller within the interval clears dirty_ and makes this one moot.
        pending_.wait_for(lock, throttle_.interval(), [this] { return !dirty_ || stopping_; });
        if (dirty_ && !stopping_) {
            throttle_.shouldFlush(true);
            dirty_ = false;
            save();
        }
    }
}

void ExecutionTracker::save() {
    auto saved = store_.save(execution_);
    if (!saved && serviceLog_) {
        serviceLog_->logError(fmt::format("Failed to persist execution {}: {}", id_, saved.error()));
    }
}
