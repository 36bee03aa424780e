#include "multi_db_archive.hpp"
#include "scratch.hpp"
#include "service_log.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <algorithm>
#include <cstring>
#include <unordered_set>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

using ArchiveReader = std::unique_ptr<struct archive, decltype(&archive_read_free)>;
using ArchiveWriter = std::unique_ptr<struct archive, decltype(&archive_write_free)>;
using ArchiveEntry = std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)>;

constexpr std::size_t kHeaderBlock = 512;
constexpr std::size_t kUstarMagicOffset = 257;

ArchiveReader openReader(const std::string& path, std::string& error) {
    ArchiveReader reader(archive_read_new(), &archive_read_free);
    if (!reader) {
        error = "Failed to allocate archive reader";
        return reader;
    }
    archive_read_support_filter_all(reader.get());
    archive_read_support_format_tar(reader.get());
    if (archive_read_open_filename(reader.get(), path.c_str(), 10240) != ARCHIVE_OK) {
        error = fmt::format("Failed to open archive: {} (error: {})", path, archive_error_string(reader.get()));
        return ArchiveReader(nullptr, &archive_read_free);
    }
    return reader;
}

std::string entryBasename(struct archive_entry* entry) {
    const char* pathname = archive_entry_pathname(entry);
    if (!pathname) {
        return {};
    }
    std::string name = fs::path(pathname).filename().string();
    if (name == "." || name == "..") {
        return {};
    }
    return name;
}

std::expected<std::string, std::string> readEntryData(struct archive* reader) {
    std::string content;
    std::vector<char> buf(8192);
    la_ssize_t got = 0;
    while ((got = archive_read_data(reader, buf.data(), buf.size())) > 0) {
        content.append(buf.data(), static_cast<std::size_t>(got));
    }
    if (got < 0) {
        return std::unexpected(fmt::format("Failed to read archive entry: {}", archive_error_string(reader)));
    }
    return content;
}

std::expected<void, std::string> writeEntryData(struct archive* reader, const std::string& outputPath) {
    std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(fmt::format("Failed to create extracted file: {}", outputPath));
    }
    std::vector<char> buf(64 * 1024);
    la_ssize_t got = 0;
    while ((got = archive_read_data(reader, buf.data(), buf.size())) > 0) {
        out.write(buf.data(), got);
    }
    if (got < 0) {
        return std::unexpected(fmt::format("Failed to extract {}: {}", outputPath, archive_error_string(reader)));
    }
    if (!out) {
        return std::unexpected(fmt::format("Failed to write extracted file: {}", outputPath));
    }
    return {};
}

std::expected<Manifest, std::string> parseManifest(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(text);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        return std::unexpected(fmt::format("Failed to parse manifest: {}", errors));
    }
    return Manifest::fromJson(root);
}

const DatabaseMappingEntry* findMapping(const std::string& name, const std::vector<DatabaseMappingEntry>& mapping) {
    auto it = std::ranges::find(mapping, name, &DatabaseMappingEntry::originalName);
    return it == mapping.end() ? nullptr : &*it;
}

std::expected<void, std::string> addEntry(struct archive* writer, const std::string& name,
                                          const std::string& sourcePath, std::uint64_t size) {
    ArchiveEntry entry(archive_entry_new(), &archive_entry_free);
    archive_entry_set_pathname(entry.get(), name.c_str());
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    if (archive_write_header(writer, entry.get()) != ARCHIVE_OK) {
        return std::unexpected(fmt::format("Failed to write archive header for {}: {}", name, archive_error_string(writer)));
    }

    std::ifstream in(sourcePath, std::ios::binary);
    if (!in) {
        return std::unexpected(fmt::format("Failed to open {} for archiving", sourcePath));
    }
    std::vector<char> buf(64 * 1024);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto got = in.gcount();
        if (got > 0 && archive_write_data(writer, buf.data(), static_cast<std::size_t>(got)) < 0) {
            return std::unexpected(fmt::format("Failed to write archive data for {}: {}", name, archive_error_string(writer)));
        }
    }
    return {};
}

} // namespace

std::expected<Manifest, std::string> Manifest::fromJson(const Json::Value& root) {
    if (!root.isObject() || !root["databases"].isArray()) {
        return std::unexpected("Invalid manifest: missing databases list");
    }
    Manifest manifest;
    manifest.version = root.get("version", 1).asInt();
    manifest.createdAt = root.get("createdAt", "").asString();
    manifest.sourceType = root.get("sourceType", "").asString();
    if (root.isMember("engineVersion") && root["engineVersion"].isString()) {
        manifest.engineVersion = root["engineVersion"].asString();
    }
    for (const auto& db : root["databases"]) {
        ManifestDatabase entry;
        entry.name = db.get("name", "").asString();
        entry.filename = db.get("filename", "").asString();
        if (entry.name.empty() || entry.filename.empty()) {
            return std::unexpected("Invalid manifest: database entry without name or filename");
        }
        if (db.isMember("size")) entry.size = db["size"].asUInt64();
        if (db.isMember("format")) entry.format = db["format"].asString();
        manifest.databases.push_back(std::move(entry));
    }
    manifest.totalSize = root.get("totalSize", 0).asUInt64();
    return manifest;
}

Json::Value Manifest::toJson() const {
    Json::Value root(Json::objectValue);
    root["version"] = version;
    root["createdAt"] = createdAt;
    root["sourceType"] = sourceType;
    if (engineVersion) root["engineVersion"] = *engineVersion;
    Json::Value list(Json::arrayValue);
    for (const auto& db : databases) {
        Json::Value item(Json::objectValue);
        item["name"] = db.name;
        item["filename"] = db.filename;
        if (db.size) item["size"] = static_cast<Json::UInt64>(*db.size);
        if (db.format) item["format"] = *db.format;
        list.append(item);
    }
    root["databases"] = list;
    root["totalSize"] = static_cast<Json::UInt64>(totalSize);
    return root;
}

bool isMultiDbArchive(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    std::vector<char> header(kHeaderBlock, '\0');
    file.read(header.data(), static_cast<std::streamsize>(header.size()));
    if (static_cast<std::size_t>(file.gcount()) < kHeaderBlock) {
        return false;
    }

    std::string magic(header.data() + kUstarMagicOffset, 5);
    if (magic != "ustar") {
        std::string firstName(header.data(), strnlen(header.data(), 100));
        if (firstName != kManifestFilename) {
            return false;
        }
    }
    return readManifest(path).has_value();
}

std::optional<Manifest> readManifest(const std::string& archivePath) {
    std::string error;
    ArchiveReader reader = openReader(archivePath, error);
    if (!reader) {
        return std::nullopt;
    }

    struct archive_entry* entry = nullptr;
    while (archive_read_next_header(reader.get(), &entry) == ARCHIVE_OK) {
        if (entryBasename(entry) != kManifestFilename) {
            archive_read_data_skip(reader.get());
            continue;
        }
        auto content = readEntryData(reader.get());
        if (!content) {
            return std::nullopt;
        }
        auto manifest = parseManifest(*content);
        if (!manifest) {
            return std::nullopt;
        }
        return std::move(*manifest);
    }
    return std::nullopt;
}

std::expected<ExtractedArchive, std::string> extractArchive(const std::string& archivePath,
                                                            const std::string& destDir) {
    std::error_code ec;
    fs::create_directories(destDir, ec);
    if (ec) {
        return std::unexpected(fmt::format("Failed to create extraction directory {}: {}", destDir, ec.message()));
    }

    std::string error;
    ArchiveReader reader = openReader(archivePath, error);
    if (!reader) {
        return std::unexpected(error);
    }

    std::optional<Manifest> manifest;
    ExtractedArchive result;
    std::unordered_set<std::string> seen;
    struct archive_entry* entry = nullptr;
    int status = ARCHIVE_OK;
    while ((status = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK) {
        std::string name = entryBasename(entry);
        if (name.empty() || archive_entry_filetype(entry) != AE_IFREG) {
            archive_read_data_skip(reader.get());
            continue;
        }
        if (!seen.insert(name).second) {
            return std::unexpected(fmt::format("Archive {} contains more than one entry named {}", archivePath, name));
        }

        if (name == kManifestFilename) {
            auto content = readEntryData(reader.get());
            if (!content) {
                return std::unexpected(content.error());
            }
            auto parsed = parseManifest(*content);
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            manifest = std::move(*parsed);
            continue;
        }

        std::string outputPath = (fs::path(destDir) / name).string();
        auto written = writeEntryData(reader.get(), outputPath);
        if (!written) {
            return std::unexpected(written.error());
        }
        result.files.push_back(outputPath);
    }

    if (status != ARCHIVE_EOF) {
        return std::unexpected(fmt::format("Corrupt archive {}: {}", archivePath, archive_error_string(reader.get())));
    }
    if (!manifest) {
        return std::unexpected("TAR archive does not contain a manifest.json");
    }
    result.manifest = std::move(*manifest);
    return result;
}

std::expected<Manifest, std::string> createArchive(const std::vector<ArchiveMember>& members,
                                                   const std::string& destinationPath,
                                                   const std::string& sourceType,
                                                   const std::optional<std::string>& engineVersion) {
    Manifest manifest;
    manifest.createdAt = isoTimestamp();
    manifest.sourceType = sourceType;
    manifest.engineVersion = engineVersion;
    for (const auto& member : members) {
        std::error_code ec;
        auto size = fs::file_size(member.path, ec);
        if (ec) {
            return std::unexpected(fmt::format("Failed to stat {}: {}", member.path, ec.message()));
        }
        manifest.databases.push_back({member.database, member.filename, size, member.format});
        manifest.totalSize += size;
    }

    ArchiveWriter writer(archive_write_new(), &archive_write_free);
    if (!writer) {
        return std::unexpected("Failed to allocate archive writer");
    }
    archive_write_set_format_ustar(writer.get());
    if (archive_write_open_filename(writer.get(), destinationPath.c_str()) != ARCHIVE_OK) {
        return std::unexpected(fmt::format("Failed to create archive {}: {}", destinationPath, archive_error_string(writer.get())));
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::string manifestJson = Json::writeString(builder, manifest.toJson());

    ArchiveEntry entry(archive_entry_new(), &archive_entry_free);
    archive_entry_set_pathname(entry.get(), kManifestFilename);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(manifestJson.size()));
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    if (archive_write_header(writer.get(), entry.get()) != ARCHIVE_OK ||
        archive_write_data(writer.get(), manifestJson.data(), manifestJson.size()) < 0) {
        return std::unexpected(fmt::format("Failed to write manifest: {}", archive_error_string(writer.get())));
    }

    for (std::size_t i = 0; i < members.size(); ++i) {
        auto added = addEntry(writer.get(), members[i].filename, members[i].path, *manifest.databases[i].size);
        if (!added) {
            return std::unexpected(added.error());
        }
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        return std::unexpected(fmt::format("Failed to finalize archive: {}", archive_error_string(writer.get())));
    }
    return manifest;
}

bool shouldRestoreDatabase(const std::string& name, const std::vector<DatabaseMappingEntry>& mapping) {
    if (mapping.empty()) {
        return true;
    }
    const DatabaseMappingEntry* entry = findMapping(name, mapping);
    return entry && entry->selected;
}

std::string targetDatabaseName(const std::string& name, const std::vector<DatabaseMappingEntry>& mapping) {
    const DatabaseMappingEntry* entry = findMapping(name, mapping);
    if (!entry || entry->targetName.empty()) {
        return name;
    }
    return entry->targetName;
}

MultiDbArchiveHandler::MultiDbArchiveHandler(std::string scratchRoot)
    : scratchRoot_(std::move(scratchRoot)) {}

std::expected<ArchiveRestoreReport, RestoreError> MultiDbArchiveHandler::restore(const std::string& archivePath,
                                                                                 const std::string& scratchName,
                                                                                 const DatabaseConfig& config,
                                                                                 DatabaseAdapter& adapter,
                                                                                 const LogCallback& onLog,
                                                                                 const ProgressCallback& onProgress) const {
    auto log = [&onLog](const std::string& message) {
        if (onLog) onLog(message);
    };

    SingleDatabaseRestore* single = adapter.singleDatabaseRestore();
    if (!single) {
        return restoreFailure(ErrorKind::AdapterRestore,
            fmt::format("Adapter {} cannot restore individual databases from a composite archive", adapter.id()));
    }

    try {
        ScratchDirectory workDir(scratchRoot_, scratchName);
        auto extracted = extractArchive(archivePath, workDir.path());
        if (!extracted) {
            return restoreFailure(ErrorKind::AdapterRestore, extracted.error());
        }

        const auto& mapping = config.overrides.databaseMapping;
        const auto& databases = extracted->manifest.databases;
        log(fmt::format("Archive contains {} database(s)", databases.size()));

        std::vector<std::string> targets;
        for (const auto& db : databases) {
            if (shouldRestoreDatabase(db.name, mapping)) {
                targets.push_back(targetDatabaseName(db.name, mapping));
            }
        }

        if (RestorePreflight* preflight = adapter.preflight(); preflight && !targets.empty()) {
            auto prepared = preflight->prepareRestore(config, targets);
            if (!prepared) {
                return restoreFailure(ErrorKind::Preflight, prepared.error());
            }
        }

        ArchiveRestoreReport report;
        std::size_t processed = 0;
        for (const auto& db : databases) {
            if (!shouldRestoreDatabase(db.name, mapping)) {
                log(fmt::format("Skipping database: {}", db.name));
                ++report.skipped;
            } else {
                std::string target = targetDatabaseName(db.name, mapping);
                std::string dumpPath = (fs::path(workDir.path()) / fs::path(db.filename).filename()).string();
                log(target == db.name
                        ? fmt::format("Restoring database: {}", db.name)
                        : fmt::format("Restoring database: {} -> {}", db.name, target));
                auto restored = single->restoreDatabase(config, dumpPath, db.name, target, onLog);
                if (!restored) {
                    return restoreFailure(ErrorKind::AdapterRestore, restored.error());
                }
                ++report.restored;
            }
            ++processed;
            if (onProgress) {
                onProgress(static_cast<int>(processed * 100 / databases.size()));
            }
        }
        return report;
    } catch (const std::runtime_error& e) {
        return restoreFailure(ErrorKind::Internal, e.what());
    }
}
