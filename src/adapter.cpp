#include "adapter.hpp"

std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Success: return "success";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Info: break;
    }
    return "info";
}

std::string_view logTypeName(LogType type) {
    switch (type) {
        case LogType::Command: return "command";
        case LogType::Storage: return "storage";
        case LogType::General: break;
    }
    return "general";
}

LogLevel parseLogLevel(std::string_view name) {
    if (name == "success") return LogLevel::Success;
    if (name == "warning") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

LogType parseLogType(std::string_view name) {
    if (name == "command") return LogType::Command;
    if (name == "storage") return LogType::Storage;
    return LogType::General;
}

DatabaseConfig DatabaseConfig::fromJson(const Json::Value& config) {
    DatabaseConfig db;
    db.host = config.get("host", "localhost").asString();
    db.port = config.get("port", 0).asInt();
    db.user = config.isMember("user") ? config["user"].asString() : config.get("username", "").asString();
    db.password = config.get("password", "").asString();
    db.database = config.get("database", "").asString();
    db.options = config.get("options", Json::Value(Json::objectValue));
    return db;
}

std::expected<DatabaseConfig, std::string> DatabaseConfig::withOverrides(RestoreOverrides restoreOverrides) const {
    if (overridesApplied) {
        return std::unexpected("Restore overrides were already applied to this configuration");
    }

    DatabaseConfig merged = *this;
    if (restoreOverrides.privilegedAuth) {
        merged.user = restoreOverrides.privilegedAuth->user;
        merged.password = restoreOverrides.privilegedAuth->password;
    }
    if (restoreOverrides.targetDatabaseName && !restoreOverrides.targetDatabaseName->empty()) {
        merged.database = *restoreOverrides.targetDatabaseName;
    }
    merged.overrides = std::move(restoreOverrides);
    merged.overridesApplied = true;
    return merged;
}
