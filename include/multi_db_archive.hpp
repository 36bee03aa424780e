/**
 * @file multi_db_archive.hpp
 * @brief Composite backups: one tar archive holding several database dumps.
 *
 * The archive carries a "manifest.json" entry listing each database and the file that
 * holds its dump. Restores extract the archive into an isolated scratch directory, then
 * hand each selected dump to the adapter's SingleDatabaseRestore capability, possibly
 * under a new name.
 *
 * @note Requires libarchive.
 */

#ifndef MULTI_DB_ARCHIVE_HPP
#define MULTI_DB_ARCHIVE_HPP

#include <string>
#include <vector>
#include <optional>
#include <expected>
#include <cstdint>
#include <json/json.h>
#include "adapter.hpp"
#include "restore_error.hpp"

inline constexpr const char* kManifestFilename = "manifest.json";

/**
 * @brief One database inside a composite archive.
 */
struct ManifestDatabase {
    std::string name;     ///< Database name at backup time.
    std::string filename; ///< Archive entry holding the dump.
    std::optional<std::uint64_t> size;
    std::optional<std::string> format;
};

/**
 * @brief Index of a composite archive.
 */
struct Manifest {
    int version = 1;
    std::string createdAt;
    std::string sourceType;
    std::optional<std::string> engineVersion;
    std::vector<ManifestDatabase> databases;
    std::uint64_t totalSize = 0;

    static std::expected<Manifest, std::string> fromJson(const Json::Value& root);
    Json::Value toJson() const;
};

/**
 * @brief A file to pack into a composite archive.
 */
struct ArchiveMember {
    std::string path;     ///< Local dump file.
    std::string filename; ///< Entry name inside the archive.
    std::string database; ///< Database the dump belongs to.
    std::optional<std::string> format;
};

/**
 * @brief Content of an extracted archive.
 */
struct ExtractedArchive {
    Manifest manifest;
    std::vector<std::string> files; ///< Extracted dump paths.
};

/**
 * @brief Outcome of a composite restore.
 */
struct ArchiveRestoreReport {
    std::size_t restored = 0;
    std::size_t skipped = 0;
};

/**
 * @brief True if the file is a tar archive that carries a readable manifest.
 *
 * The first header block must either hold the ustar magic at offset 257 or name
 * manifest.json.
 */
bool isMultiDbArchive(const std::string& path);

/**
 * @brief Reads only the manifest entry of an archive.
 */
std::optional<Manifest> readManifest(const std::string& archivePath);

/**
 * @brief Extracts all entries into destDir.
 *
 * Entry paths are reduced to their base name, so an entry cannot escape destDir.
 *
 * @return The manifest and extracted files, or an error if the archive is unreadable,
 * has no manifest, or holds two entries with the same base name.
 */
std::expected<ExtractedArchive, std::string> extractArchive(const std::string& archivePath,
                                                            const std::string& destDir);

/**
 * @brief Writes a composite archive with the manifest as first entry.
 */
std::expected<Manifest, std::string> createArchive(const std::vector<ArchiveMember>& members,
                                                   const std::string& destinationPath,
                                                   const std::string& sourceType,
                                                   const std::optional<std::string>& engineVersion = std::nullopt);

/**
 * @brief True if the database should be restored under the given mapping.
 *
 * An empty mapping selects everything. With a mapping, databases not listed are skipped.
 */
bool shouldRestoreDatabase(const std::string& name, const std::vector<DatabaseMappingEntry>& mapping);

/**
 * @brief Target name for a database: the mapped name, or the original when unmapped or empty.
 */
std::string targetDatabaseName(const std::string& name, const std::vector<DatabaseMappingEntry>& mapping);

/**
 * @brief Restores a composite archive through the adapter's single-database primitive.
 */
class MultiDbArchiveHandler {
public:
    /**
     * @param scratchRoot Directory under which extraction directories are created.
     */
    explicit MultiDbArchiveHandler(std::string scratchRoot);

    /**
     * @brief Extracts the archive and restores each selected database.
     *
     * The mapping comes from config.overrides. prepareRestore runs against all selected
     * target names before any data is written. Skipped entries are logged. Progress is
     * reported as processed/total. The extraction directory is always removed.
     *
     * @param archivePath Composite archive.
     * @param scratchName Name of the extraction directory under the scratch root.
     * @param config Target connection with overrides applied.
     * @param adapter Target adapter. Must provide SingleDatabaseRestore.
     */
    std::expected<ArchiveRestoreReport, RestoreError> restore(const std::string& archivePath,
                                                              const std::string& scratchName,
                                                              const DatabaseConfig& config,
                                                              DatabaseAdapter& adapter,
                                                              const LogCallback& onLog = {},
                                                              const ProgressCallback& onProgress = {}) const;

private:
    std::string scratchRoot_;
};

#endif // MULTI_DB_ARCHIVE_HPP
