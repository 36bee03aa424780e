/**
 * @file adapter.hpp
 * @brief Capability contract between the restore pipeline and concrete backends.
 *
 * Storage adapters move artifacts between a backend and the local scratch area. Database
 * adapters drive an engine's native tooling. Mandatory operations are pure virtual;
 * optional capabilities are separate interfaces reached through accessors that return
 * nullptr when the adapter does not provide them.
 */

#ifndef ADAPTER_HPP
#define ADAPTER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <expected>
#include <functional>
#include <cstdint>
#include <json/json.h>

/**
 * @brief Severity of a log line.
 */
enum class LogLevel {
    Info,
    Success,
    Warning,
    Error
};

/**
 * @brief Origin of a log line.
 */
enum class LogType {
    General,
    Command,
    Storage
};

std::string_view logLevelName(LogLevel level);
std::string_view logTypeName(LogType type);
LogLevel parseLogLevel(std::string_view name);
LogType parseLogType(std::string_view name);

/**
 * @brief Receives one line of adapter output.
 */
using LogCallback = std::function<void(const std::string& message)>;

/**
 * @brief Receives progress in percent (0-100).
 */
using ProgressCallback = std::function<void(int percent)>;

/**
 * @brief Entry returned by StorageAdapter::list.
 */
struct FileInfo {
    std::string name;         ///< Base name.
    std::string path;         ///< Path relative to the storage root.
    std::uint64_t size = 0;   ///< Size in bytes.
    bool isDirectory = false; ///< True for directories.
    std::string lastModified; ///< ISO-8601 modification time, if known.
};

/**
 * @brief Result of a connectivity probe.
 */
struct ConnectionTest {
    bool success = false;
    std::string message;
    std::optional<std::string> version; ///< Live engine version (database adapters).
    std::optional<std::string> edition; ///< Engine edition, for engines that have one.
};

/**
 * @brief Outcome of DatabaseAdapter::restore.
 */
struct AdapterRestoreResult {
    bool success = false;
    std::vector<std::string> logs;    ///< Lines emitted by the engine tool.
    std::optional<std::string> error; ///< Engine error text, passed through verbatim.
};

/**
 * @brief One entry of a database mapping: restore originalName as targetName when selected.
 */
struct DatabaseMappingEntry {
    std::string originalName;
    std::string targetName; ///< Empty means "keep the original name".
    bool selected = true;
};

/**
 * @brief Credentials with enough privilege to create databases.
 */
struct PrivilegedAuth {
    std::string user;
    std::string password;
};

/**
 * @brief Per-request adjustments to a database connection.
 */
struct RestoreOverrides {
    std::optional<std::string> targetDatabaseName;
    std::vector<DatabaseMappingEntry> databaseMapping;
    std::optional<PrivilegedAuth> privilegedAuth;
    std::optional<std::string> detectedVersion; ///< Live server version probed before restore.
};

/**
 * @brief Connection parameters of a database adapter.
 *
 * Built once from the decrypted adapter configuration. Request-level overrides are kept in
 * a separate sub-struct and merged by withOverrides(), which may be called only once.
 */
struct DatabaseConfig {
    std::string host = "localhost";
    int port = 0;
    std::string user;
    std::string password;
    std::string database;     ///< Default or target database.
    Json::Value options;      ///< Engine-specific options, passed through untouched.
    RestoreOverrides overrides;
    bool overridesApplied = false;

    /**
     * @brief Builds a configuration from a decrypted adapter config object.
     *
     * Accepts "host", "port", "user" (or "username"), "password", "database" and "options".
     */
    static DatabaseConfig fromJson(const Json::Value& config);

    /**
     * @brief Returns a copy with the overrides merged in.
     *
     * Privileged credentials replace user and password, a target name replaces database.
     *
     * @return The merged configuration, or an error if overrides were already applied.
     */
    std::expected<DatabaseConfig, std::string> withOverrides(RestoreOverrides restoreOverrides) const;
};

/**
 * @brief Optional storage capability: reads small text files such as sidecar metadata.
 */
class SidecarReader {
public:
    virtual ~SidecarReader() = default;

    /**
     * @return File content, or std::nullopt if the file does not exist or cannot be read.
     */
    virtual std::optional<std::string> read(const Json::Value& config, const std::string& path) = 0;
};

/**
 * @brief Storage backend contract.
 */
class StorageAdapter {
public:
    virtual ~StorageAdapter() = default;

    virtual std::string id() const = 0;
    virtual std::string name() const = 0;

    /**
     * @brief Lists the entries of a directory.
     */
    virtual std::expected<std::vector<FileInfo>, std::string> list(const Json::Value& config,
                                                                   const std::string& dir) = 0;

    /**
     * @brief Downloads remotePath into localPath.
     */
    virtual std::expected<void, std::string> download(const Json::Value& config,
                                                      const std::string& remotePath,
                                                      const std::string& localPath,
                                                      ProgressCallback onProgress = {}) = 0;

    /**
     * @brief Uploads localPath to remotePath.
     */
    virtual std::expected<void, std::string> upload(const Json::Value& config,
                                                    const std::string& localPath,
                                                    const std::string& remotePath,
                                                    ProgressCallback onProgress = {}) = 0;

    /**
     * @brief Removes a file. Removing a path that does not exist succeeds.
     */
    virtual std::expected<void, std::string> remove(const Json::Value& config, const std::string& path) = 0;

    virtual ConnectionTest test(const Json::Value& config) = 0;

    /**
     * @return The sidecar capability, or nullptr if unsupported.
     */
    virtual SidecarReader* sidecarReader() { return nullptr; }
};

/**
 * @brief Optional database capability: privilege probe before any data is touched.
 */
class RestorePreflight {
public:
    virtual ~RestorePreflight() = default;

    /**
     * @brief Verifies the configured user may create or overwrite the named databases.
     *
     * @return Success, or a descriptive error. Must not modify existing data.
     */
    virtual std::expected<void, std::string> prepareRestore(const DatabaseConfig& config,
                                                            const std::vector<std::string>& databases) = 0;
};

/**
 * @brief Optional database capability: restore one dump under a possibly different name.
 */
class SingleDatabaseRestore {
public:
    virtual ~SingleDatabaseRestore() = default;

    virtual std::expected<void, std::string> restoreDatabase(const DatabaseConfig& config,
                                                             const std::string& dumpPath,
                                                             const std::string& sourceName,
                                                             const std::string& targetName,
                                                             LogCallback onLog = {}) = 0;
};

/**
 * @brief Database engine contract.
 */
class DatabaseAdapter {
public:
    virtual ~DatabaseAdapter() = default;

    virtual std::string id() const = 0;
    virtual std::string name() const = 0;

    /**
     * @brief Dumps the configured databases.
     * @return Path of the produced file, or an error message.
     */
    virtual std::expected<std::string, std::string> dump(const DatabaseConfig& config,
                                                         const std::string& destinationPath) = 0;

    /**
     * @brief Restores a plain dump file into the engine.
     */
    virtual AdapterRestoreResult restore(const DatabaseConfig& config,
                                         const std::string& sourcePath,
                                         LogCallback onLog = {},
                                         ProgressCallback onProgress = {}) = 0;

    /**
     * @brief Probes connectivity and reports the live version (and edition).
     */
    virtual ConnectionTest test(const DatabaseConfig& config) = 0;

    virtual RestorePreflight* preflight() { return nullptr; }
    virtual SingleDatabaseRestore* singleDatabaseRestore() { return nullptr; }
};

#endif // ADAPTER_HPP
