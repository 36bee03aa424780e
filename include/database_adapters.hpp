/**
 * @file database_adapters.hpp
 * @brief Database adapters shipped with RestoreVault: MySQL and PostgreSQL.
 *
 * Both drive the engines' command line clients (mysql/mysqldump, psql/pg_dump/pg_dumpall),
 * which must be in the system PATH. Passwords are handed over through the MYSQL_PWD and
 * PGPASSWORD environment variables, never as arguments.
 */

#ifndef DATABASE_ADAPTERS_HPP
#define DATABASE_ADAPTERS_HPP

#include <string>
#include <vector>
#include <optional>
#include "adapter.hpp"

/**
 * @brief True for names made of letters, digits, '_', '$' and '-'.
 */
bool isSafeDatabaseName(const std::string& name);

/**
 * @brief Line filter applied to mysqldump output before it reaches the mysql client.
 *
 * With a mapping, "USE `db`;" and CREATE DATABASE lines are renamed to the mapped target and
 * unselected sections are dropped. Databases missing from the mapping pass unchanged. With a
 * target database and no mapping, USE and CREATE DATABASE lines are dropped so everything
 * lands in the target. Without either, lines pass through untouched.
 */
class MySqlDumpFilter {
public:
    MySqlDumpFilter(std::vector<DatabaseMappingEntry> mapping, std::optional<std::string> targetDatabase);

    /**
     * @return The line to forward (possibly rewritten), or std::nullopt to drop it.
     */
    std::optional<std::string> apply(const std::string& line);

    /**
     * @brief True if lines pass through unchanged.
     */
    bool passthrough() const { return passthrough_; }

private:
    std::vector<DatabaseMappingEntry> mapping_;
    std::optional<std::string> targetDatabase_;
    bool passthrough_ = false;
    bool skipSection_ = false;
};

/**
 * @brief MySQL and MariaDB through the mysql client.
 */
class MySqlAdapter : public DatabaseAdapter, public RestorePreflight, public SingleDatabaseRestore {
public:
    std::string id() const override { return "mysql"; }
    std::string name() const override { return "MySQL"; }

    /**
     * @brief Runs mysqldump and gzips the output to destinationPath + ".sql.gz".
     */
    std::expected<std::string, std::string> dump(const DatabaseConfig& config, const std::string& destinationPath) override;

    AdapterRestoreResult restore(const DatabaseConfig& config, const std::string& sourcePath,
                                 LogCallback onLog = {}, ProgressCallback onProgress = {}) override;

    ConnectionTest test(const DatabaseConfig& config) override;

    RestorePreflight* preflight() override { return this; }
    SingleDatabaseRestore* singleDatabaseRestore() override { return this; }

    /**
     * @brief Checks the CREATE privilege for each database without creating anything.
     */
    std::expected<void, std::string> prepareRestore(const DatabaseConfig& config,
                                                    const std::vector<std::string>& databases) override;

    std::expected<void, std::string> restoreDatabase(const DatabaseConfig& config, const std::string& dumpPath,
                                                     const std::string& sourceName, const std::string& targetName,
                                                     LogCallback onLog = {}) override;
};

/**
 * @brief PostgreSQL through psql.
 */
class PostgresAdapter : public DatabaseAdapter, public RestorePreflight, public SingleDatabaseRestore {
public:
    std::string id() const override { return "postgres"; }
    std::string name() const override { return "PostgreSQL"; }

    /**
     * @brief Runs pg_dump (one database) or pg_dumpall and gzips the output.
     */
    std::expected<std::string, std::string> dump(const DatabaseConfig& config, const std::string& destinationPath) override;

    AdapterRestoreResult restore(const DatabaseConfig& config, const std::string& sourcePath,
                                 LogCallback onLog = {}, ProgressCallback onProgress = {}) override;

    ConnectionTest test(const DatabaseConfig& config) override;

    RestorePreflight* preflight() override { return this; }
    SingleDatabaseRestore* singleDatabaseRestore() override { return this; }

    std::expected<void, std::string> prepareRestore(const DatabaseConfig& config,
                                                    const std::vector<std::string>& databases) override;

    std::expected<void, std::string> restoreDatabase(const DatabaseConfig& config, const std::string& dumpPath,
                                                     const std::string& sourceName, const std::string& targetName,
                                                     LogCallback onLog = {}) override;
};

#endif // DATABASE_ADAPTERS_HPP
