#include "database_adapters.hpp"
#include "compression.hpp"
#include "process.hpp"
#include <algorithm>
#include <filesystem>
#include <regex>
#include <sstream>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

const std::regex kGrantLine(R"(^GRANT (.+) ON (\S+) TO .*$)");

std::string clientArgs(const DatabaseConfig& config) {
    std::string args = fmt::format("-h {} -u {} --protocol=tcp", shellQuote(config.host), shellQuote(config.user));
    if (config.port > 0) {
        args += fmt::format(" -P {}", config.port);
    }
    if (config.options.get("disableSsl", false).asBool()) {
        args += " --skip-ssl";
    }
    return args;
}

std::string passwordEnv(const DatabaseConfig& config) {
    return config.password.empty() ? "" : fmt::format("MYSQL_PWD={} ", shellQuote(config.password));
}

// mysql prints this warning even when the password comes from the environment on some builds.
bool isNoise(const std::string& line) {
    return line.find("Using a password on the command line") != std::string::npos;
}

std::string describeFailure(const CommandResult& result) {
    std::string text;
    for (const auto& line : result.output) {
        if (isNoise(line)) {
            continue;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += line;
    }
    return text.empty() ? fmt::format("mysql exited with code {}", result.exitCode) : text;
}

bool isAccessDenied(const std::string& text) {
    return text.find("Access denied") != std::string::npos || text.find("ERROR 1044") != std::string::npos;
}

std::string accessDeniedMessage(const DatabaseConfig& config, const std::string& database) {
    return fmt::format("Access denied for user '{}' to database '{}'. The user cannot create this database; "
                       "supply privileged credentials to restore it.", config.user, database);
}

std::expected<CommandResult, std::string> query(const DatabaseConfig& config, const std::string& sql) {
    return runCommand(fmt::format("{}mysql {} -N -B -e {}", passwordEnv(config), clientArgs(config), shellQuote(sql)));
}

std::expected<void, std::string> ensureDatabase(const DatabaseConfig& config, const std::string& database,
                                                const LogCallback& onLog) {
    if (!isSafeDatabaseName(database)) {
        return std::unexpected(fmt::format("Invalid database name: {}", database));
    }
    auto result = query(config, fmt::format("CREATE DATABASE IF NOT EXISTS `{}`", database));
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitCode != 0) {
        std::string failure = describeFailure(*result);
        return std::unexpected(isAccessDenied(failure) ? accessDeniedMessage(config, database) : failure);
    }
    if (onLog) {
        onLog(fmt::format("Database ready: {}", database));
    }
    return {};
}

// Target a dump lands in when the request names one database.
std::optional<std::string> singleTarget(const DatabaseConfig& config) {
    if (config.overrides.targetDatabaseName && !config.overrides.targetDatabaseName->empty()) {
        return config.overrides.targetDatabaseName;
    }
    std::vector<const DatabaseMappingEntry*> selected;
    for (const auto& entry : config.overrides.databaseMapping) {
        if (entry.selected) {
            selected.push_back(&entry);
        }
    }
    if (selected.size() == 1) {
        return selected.front()->targetName.empty() ? selected.front()->originalName : selected.front()->targetName;
    }
    return std::nullopt;
}

// Splits "SELECT, INSERT, CREATE" into trimmed privilege names.
std::vector<std::string> privilegeList(const std::string& text) {
    std::vector<std::string> privileges;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        auto first = item.find_first_not_of(' ');
        auto last = item.find_last_not_of(' ');
        if (first != std::string::npos) {
            privileges.push_back(item.substr(first, last - first + 1));
        }
    }
    return privileges;
}

bool grantCoversDatabase(const std::string& scope, const std::string& database) {
    if (scope == "*.*") {
        return true;
    }
    std::string unescaped;
    for (std::size_t i = 0; i < scope.size(); ++i) {
        if (scope[i] == '\\' && i + 1 < scope.size()) {
            continue;
        }
        unescaped += scope[i];
    }
    return unescaped == fmt::format("`{}`.*", database);
}

} // namespace

std::expected<std::string, std::string> MySqlAdapter::dump(const DatabaseConfig& config, const std::string& destinationPath) {
    if (config.user.empty()) {
        return std::unexpected("Invalid MySQL credentials: user missing");
    }

    fs::path outputFilePath(destinationPath);
    if (outputFilePath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(outputFilePath.parent_path(), ec);
    }

    std::string tempSql = fmt::format("{}.sql", destinationPath);
    std::string scope = config.database.empty() ? "--all-databases"
                                                : fmt::format("--databases {}", shellQuote(config.database));
    std::string command = fmt::format("{}mysqldump {} --single-transaction --routines --triggers {} --result-file={}",
                                      passwordEnv(config), clientArgs(config), scope, shellQuote(tempSql));
    auto result = runCommand(command);
    std::error_code ec;
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitCode != 0) {
        fs::remove(tempSql, ec);
        return std::unexpected(fmt::format("Failed to execute mysqldump: {}", describeFailure(*result)));
    }

    std::string dumpFileGz = fmt::format("{}.sql.gz", destinationPath);
    auto compressed = compressFile(Compression::Gzip, tempSql, dumpFileGz);
    fs::remove(tempSql, ec);
    if (!compressed) {
        return std::unexpected(compressed.error());
    }
    return dumpFileGz;
}

AdapterRestoreResult MySqlAdapter::restore(const DatabaseConfig& config, const std::string& sourcePath,
                                           LogCallback onLog, ProgressCallback onProgress) {
    AdapterRestoreResult restoreResult;
    auto relay = [&](const std::string& line) {
        if (isNoise(line)) {
            return;
        }
        restoreResult.logs.push_back(line);
        if (onLog) {
            onLog(line);
        }
    };

    const auto& mapping = config.overrides.databaseMapping;
    std::optional<std::string> target = singleTarget(config);

    std::vector<std::string> databases;
    if (!mapping.empty()) {
        for (const auto& entry : mapping) {
            if (entry.selected) {
                databases.push_back(entry.targetName.empty() ? entry.originalName : entry.targetName);
            }
        }
    } else if (target) {
        databases.push_back(*target);
    }
    for (const auto& database : databases) {
        if (auto ready = ensureDatabase(config, database, relay); !ready) {
            restoreResult.error = ready.error();
            return restoreResult;
        }
    }

    std::optional<std::string> filterTarget = config.overrides.targetDatabaseName && !config.overrides.targetDatabaseName->empty()
        ? config.overrides.targetDatabaseName : std::nullopt;
    MySqlDumpFilter filter(mapping, filterTarget);
    LineFilter lineFilter;
    if (!filter.passthrough()) {
        lineFilter = [&filter](const std::string& line) { return filter.apply(line); };
    }

    std::string defaultDatabase = target ? *target : config.database;
    std::string command = fmt::format("{}mysql {}", passwordEnv(config), clientArgs(config));
    if (!defaultDatabase.empty()) {
        command += " " + shellQuote(defaultDatabase);
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

ConnectionTest MySqlAdapter::test(const DatabaseConfig& config) {
    ConnectionTest test;
    auto result = query(config, "SELECT VERSION()");
    if (!result) {
        test.message = result.error();
        return test;
    }
    if (result->exitCode != 0) {
        test.message = describeFailure(*result);
        return test;
    }
    auto line = std::ranges::find_if(result->output, [](const std::string& l) { return !isNoise(l); });
    if (line != result->output.end()) {
        test.version = *line;
    }
    test.success = true;
    test.message = "Connection successful";
    return test;
}

std::expected<void, std::string> MySqlAdapter::prepareRestore(const DatabaseConfig& config,
                                                              const std::vector<std::string>& databases) {
    for (const auto& database : databases) {
        if (!isSafeDatabaseName(database)) {
            return std::unexpected(fmt::format("Invalid database name: {}", database));
        }
    }
    if (databases.empty()) {
        return {};
    }

    auto result = query(config, "SHOW GRANTS FOR CURRENT_USER()");
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitCode != 0) {
        std::string failure = describeFailure(*result);
        if (isAccessDenied(failure)) {
            return std::unexpected(accessDeniedMessage(config, databases.front()));
        }
        return std::unexpected(fmt::format("Failed to check privileges: {}", failure));
    }

    for (const auto& database : databases) {
        bool allowed = std::ranges::any_of(result->output, [&](const std::string& grant) {
            std::smatch match;
            if (!std::regex_match(grant, match, kGrantLine)) {
                return false;
            }
            auto privileges = privilegeList(match[1].str());
            bool canCreate = std::ranges::any_of(privileges, [](const std::string& p) {
                return p == "ALL PRIVILEGES" || p == "ALL" || p == "CREATE";
            });
            return canCreate && grantCoversDatabase(match[2].str(), database);
        });
        if (!allowed) {
            return std::unexpected(accessDeniedMessage(config, database));
        }
    }
    return {};
}

std::expected<void, std::string> MySqlAdapter::restoreDatabase(const DatabaseConfig& config, const std::string& dumpPath,
                                                               const std::string& sourceName, const std::string& targetName,
                                                               LogCallback onLog) {
    auto logLine = [&](const std::string& line) {
        if (!isNoise(line) && onLog) {
            onLog(line);
        }
    };
    if (auto ready = ensureDatabase(config, targetName, logLine); !ready) {
        return std::unexpected(ready.error());
    }

    MySqlDumpFilter filter({DatabaseMappingEntry{sourceName, targetName, true}}, targetName);
    LineFilter lineFilter = [&filter](const std::string& line) { return filter.apply(line); };
    std::string command = fmt::format("{}mysql {} {}", passwordEnv(config), clientArgs(config), shellQuote(targetName));

    auto result = streamFileToCommand(command, dumpPath, lineFilter, logLine);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitCode != 0) {
        return std::unexpected(describeFailure(*result));
    }
    return {};
}
