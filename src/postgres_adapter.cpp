#include "database_adapters.hpp"
#include "compression.hpp"
#include "process.hpp"
#include <algorithm>
#include <filesystem>
#include <regex>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

const std::regex kConnectLine(R"re(^\\connect\s+"?([^"\s]+)"?\s*$)re");
const std::regex kCreateDatabaseLine(R"re(^CREATE DATABASE\s+"?([^"\s]+)"?(\s.*)?;\s*$)re");

std::string clientArgs(const DatabaseConfig& config) {
    std::string args = fmt::format("-h {} -U {}", shellQuote(config.host), shellQuote(config.user));
    if (config.port > 0) {
        args += fmt::format(" -p {}", config.port);
    }
    return args;
}

std::string passwordEnv(const DatabaseConfig& config) {
    return config.password.empty() ? "" : fmt::format("PGPASSWORD={} ", shellQuote(config.password));
}

std::string maintenanceDatabase(const DatabaseConfig& config) {
    return config.options.get("maintenanceDatabase", "postgres").asString();
}

std::string sqlLiteral(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        quoted += c;
        if (c == '\'') {
            quoted += '\'';
        }
    }
    return quoted + "'";
}

std::string sqlIdentifier(const std::string& value) {
    std::string quoted = "\"";
    for (char c : value) {
        quoted += c;
        if (c == '"') {
            quoted += '"';
        }
    }
    return quoted + "\"";
}

std::string describeFailure(const CommandResult& result) {
    std::string text;
    for (const auto& line : result.output) {
        if (!text.empty()) {
            text += '\n';
        }
        text += line;
    }
    return text.empty() ? fmt::format("psql exited with code {}", result.exitCode) : text;
}

std::string permissionMessage(const DatabaseConfig& config, const std::string& database) {
    return fmt::format("Permission denied: user '{}' cannot create database '{}'. "
                       "Supply privileged credentials to restore it.", config.user, database);
}

std::expected<CommandResult, std::string> query(const DatabaseConfig& config, const std::string& database,
                                                const std::string& sql) {
    return runCommand(fmt::format("{}psql -X {} -d {} -tA -c {}", passwordEnv(config), clientArgs(config),
                                  shellQuote(database), shellQuote(sql)));
}

std::expected<void, std::string> ensureDatabase(const DatabaseConfig& config, const std::string& database,
                                                const LogCallback& onLog) {
    if (!isSafeDatabaseName(database)) {
        return std::unexpected(fmt::format("Invalid database name: {}", database));
    }
    auto exists = query(config, maintenanceDatabase(config),
                        fmt::format("SELECT 1 FROM pg_database WHERE datname = {}", sqlLiteral(database)));
    if (!exists) {
        return std::unexpected(exists.error());
    }
    if (exists->exitCode != 0) {
        return std::unexpected(describeFailure(*exists));
    }
    if (!exists->output.empty() && exists->output.front() == "1") {
        return {};
    }

    auto created = query(config, maintenanceDatabase(config), fmt::format("CREATE DATABASE {}", sqlIdentifier(database)));
    if (!created) {
        return std::unexpected(created.error());
    }
    if (created->exitCode != 0) {
        std::string failure = describeFailure(*created);
        if (failure.find("permission denied") != std::string::npos) {
            return std::unexpected(permissionMessage(config, database));
        }
        return std::unexpected(failure);
    }
    if (onLog) {
        onLog(fmt::format("Created database: {}", database));
    }
    return {};
}

/**
 * @brief Rewrites pg_dumpall cluster dumps for a database mapping.
 *
 * "\connect db" lines switch sections: mapped sections are redirected, unselected ones are
 * dropped. CREATE DATABASE statements of mapped databases are dropped because the targets
 * are created beforehand.
 */
class PostgresDumpFilter {
public:
    explicit PostgresDumpFilter(const std::vector<DatabaseMappingEntry>& mapping) : mapping_(mapping) {}

    std::optional<std::string> apply(const std::string& line) {
        std::smatch match;
        if (std::regex_match(line, match, kConnectLine)) {
            const DatabaseMappingEntry* entry = find(match[1].str());
            if (!entry) {
                skipSection_ = false;
                return line;
            }
            skipSection_ = !entry->selected;
            if (skipSection_) {
                return std::nullopt;
            }
            return "\\connect " + sqlIdentifier(entry->targetName.empty() ? entry->originalName : entry->targetName);
        }
        if (std::regex_match(line, match, kCreateDatabaseLine) && find(match[1].str())) {
            return std::nullopt;
        }
        if (skipSection_) {
            return std::nullopt;
        }
        return line;
    }

private:
    const DatabaseMappingEntry* find(const std::string& name) const {
        auto it = std::ranges::find(mapping_, name, &DatabaseMappingEntry::originalName);
        return it == mapping_.end() ? nullptr : &*it;
    }

    const std::vector<DatabaseMappingEntry>& mapping_;
    bool skipSection_ = false;
};

std::optional<std::string> dropConnect(const std::string& line) {
    if (line.starts_with("\\connect ")) {
        return std::nullopt;
    }
    return line;
}

} // namespace

std::expected<std::string, std::string> PostgresAdapter::dump(const DatabaseConfig& config, const std::string& destinationPath) {
    if (config.user.empty() || config.host.empty()) {
        return std::unexpected("Invalid PostgreSQL credentials: user or host missing");
    }

    fs::path outputFilePath(destinationPath);
    if (outputFilePath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(outputFilePath.parent_path(), ec);
    }

    std::string tempSql = fmt::format("{}.sql", destinationPath);
    std::string command = config.database.empty()
        ? fmt::format("{}pg_dumpall {} -f {}", passwordEnv(config), clientArgs(config), shellQuote(tempSql))
        : fmt::format("{}pg_dump {} -d {} -f {}", passwordEnv(config), clientArgs(config),
                      shellQuote(config.database), shellQuote(tempSql));
    auto result = runCommand(command);
    if (!result) {
        return std::unexpected(result.error());
    }
    std::error_code ec;
    if (result->exitCode != 0) {
        fs::remove(tempSql, ec);
        return std::unexpected(fmt::format("Failed to execute {}: {}", config.database.empty() ? "pg_dumpall" : "pg_dump",
                                           describeFailure(*result)));
    }

    std::string dumpFileGz = fmt::format("{}.sql.gz", destinationPath);
    auto compressed = compressFile(Compression::Gzip, tempSql, dumpFileGz);
    fs::remove(tempSql, ec);
    if (!compressed) {
        return std::unexpected(compressed.error());
    }
    return dumpFileGz;
}

AdapterRestoreResult PostgresAdapter::restore(const DatabaseConfig& config, const std::string& sourcePath,
                                              LogCallback onLog, ProgressCallback onProgress) {
    AdapterRestoreResult restoreResult;
    auto relay = [&](const std::string& line) {
        restoreResult.logs.push_back(line);
        if (onLog) {
            onLog(line);
        }
    };

    const auto& mapping = config.overrides.databaseMapping;
    std::optional<std::string> target = config.overrides.targetDatabaseName && !config.overrides.targetDatabaseName->empty()
        ? config.overrides.targetDatabaseName : std::nullopt;
    if (!target && mapping.empty() && !config.database.empty()) {
        target = config.database;
    }

    std::vector<std::string> databases;
    if (target) {
        databases.push_back(*target);
    } else {
        for (const auto& entry : mapping) {
            if (entry.selected) {
                databases.push_back(entry.targetName.empty() ? entry.originalName : entry.targetName);
            }
        }
    }
    for (const auto& database : databases) {
        if (auto ready = ensureDatabase(config, database, relay); !ready) {
            restoreResult.error = ready.error();
            return restoreResult;
        }
    }

    std::string command;
    LineFilter lineFilter;
    PostgresDumpFilter clusterFilter(mapping);
    if (target) {
        // Everything lands in one database; section switches would escape it.
        command = fmt::format("{}psql -X -q -v ON_ERROR_STOP=1 {} -d {}", passwordEnv(config), clientArgs(config),
                              shellQuote(*target));
        lineFilter = dropConnect;
    } else {
        // Cluster dumps recreate roles that usually exist already, so errors do not stop the run.
        command = fmt::format("{}psql -X -q {} -d {}", passwordEnv(config), clientArgs(config),
                              shellQuote(maintenanceDatabase(config)));
        if (!mapping.empty()) {
            lineFilter = [&clusterFilter](const std::string& line) { return clusterFilter.apply(line); };
        }
    }

    auto result = streamFileToCommand(command, sourcePath, lineFilter, relay, onProgress);
    if (!result) {
        restoreResult.error = result.error();
        return restoreResult;
    }
    if (result->exitCode != 0) {
        restoreResult.error = describeFailure(*result);
        return restoreResult;
    }
    restoreResult.success = true;
    return restoreResult;
}

ConnectionTest PostgresAdapter::test(const DatabaseConfig& config) {
    ConnectionTest test;
    std::string database = config.database.empty() ? maintenanceDatabase(config) : config.database;
    auto result = query(config, database, "SHOW server_version");
    if (!result) {
        test.message = result.error();
        return test;
    }
    if (result->exitCode != 0) {
        test.message = describeFailure(*result);
        return test;
    }
    if (!result->output.empty()) {
        // "16.2 (Debian 16.2-1.pgdg120+2)"
        const std::string& line = result->output.front();
        test.version = line.substr(0, line.find(' '));
    }
    test.success = true;
    test.message = "Connection successful";
    return test;
}

std::expected<void, std::string> PostgresAdapter::prepareRestore(const DatabaseConfig& config,
                                                                 const std::vector<std::string>& databases) {
    for (const auto& database : databases) {
        if (!isSafeDatabaseName(database)) {
            return std::unexpected(fmt::format("Invalid database name: {}", database));
        }
        std::string literal = sqlLiteral(database);
        std::string sql = fmt::format(
            "SELECT CASE WHEN EXISTS (SELECT 1 FROM pg_database WHERE datname = {0}) "
            "THEN has_database_privilege({0}, 'CONNECT') "
            "ELSE (SELECT rolcreatedb OR rolsuper FROM pg_roles WHERE rolname = current_user) END",
            literal);
        auto result = query(config, maintenanceDatabase(config), sql);
        if (!result) {
            return std::unexpected(result.error());
        }
        if (result->exitCode != 0) {
            std::string failure = describeFailure(*result);
            if (failure.find("permission denied") != std::string::npos ||
                failure.find("authentication failed") != std::string::npos) {
                return std::unexpected(permissionMessage(config, database));
            }
            return std::unexpected(fmt::format("Failed to check privileges: {}", failure));
        }
        if (result->output.empty() || result->output.front() != "t") {
            return std::unexpected(permissionMessage(config, database));
        }
    }
    return {};
}

std::expected<void, std::string> PostgresAdapter::restoreDatabase(const DatabaseConfig& config, const std::string& dumpPath,
                                                                  const std::string& sourceName, const std::string& targetName,
                                                                  LogCallback onLog) {
    if (auto ready = ensureDatabase(config, targetName, onLog); !ready) {
        return std::unexpected(ready.error());
    }
    if (onLog && sourceName != targetName) {
        onLog(fmt::format("Restoring {} into {}", sourceName, targetName));
    }

    std::string command = fmt::format("{}psql -X -q -v ON_ERROR_STOP=1 {} -d {}", passwordEnv(config),
                                      clientArgs(config), shellQuote(targetName));
    auto result = streamFileToCommand(command, dumpPath, dropConnect, onLog);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitCode != 0) {
        return std::unexpected(describeFailure(*result));
    }
    return {};
}
