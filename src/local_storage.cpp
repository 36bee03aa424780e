#include "storage_adapters.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <ctime>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

fs::path resolve(const Json::Value& config, const std::string& path) {
    fs::path base(config.get("basePath", ".").asString());
    fs::path relative(path);
    return relative.is_absolute() ? base / relative.relative_path() : base / relative;
}

std::string modificationTime(const fs::path& path) {
    std::error_code ec;
    auto lastWrite = fs::last_write_time(path, ec);
    if (ec) {
        return {};
    }
    auto sysTime = std::chrono::file_clock::to_sys(lastWrite);
    auto timeT = std::chrono::system_clock::to_time_t(std::chrono::time_point_cast<std::chrono::system_clock::duration>(sysTime));
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%dT%H:%M:%SZ", std::gmtime(&timeT));
    return timeBuf;
}

std::expected<void, std::string> copyWithProgress(const fs::path& from, const fs::path& to, const ProgressCallback& onProgress) {
    std::ifstream input(from, std::ios::binary);
    if (!input) {
        return std::unexpected(fmt::format("Failed to open {}", from.string()));
    }
    std::error_code ec;
    if (to.has_parent_path()) {
        fs::create_directories(to.parent_path(), ec);
    }
    std::ofstream output(to, std::ios::binary | std::ios::trunc);
    if (!output) {
        return std::unexpected(fmt::format("Failed to create {}", to.string()));
    }

    std::uintmax_t total = fs::file_size(from, ec);
    std::uintmax_t copied = 0;
    int lastPercent = -1;
    char buf[64 * 1024];
    while (input) {
        input.read(buf, sizeof(buf));
        auto got = input.gcount();
        if (got <= 0) break;
        output.write(buf, got);
        copied += static_cast<std::uintmax_t>(got);
        if (onProgress && total > 0) {
            int percent = static_cast<int>(copied * 100 / total);
            if (percent != lastPercent) {
                onProgress(percent);
                lastPercent = percent;
            }
        }
    }
    if (!output) {
        return std::unexpected(fmt::format("Failed to write {}", to.string()));
    }
    return {};
}

} // namespace

std::expected<std::vector<FileInfo>, std::string> LocalStorageAdapter::list(const Json::Value& config, const std::string& dir) {
    fs::path root = resolve(config, dir);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return std::unexpected(fmt::format("Not a directory: {}", root.string()));
    }

    std::vector<FileInfo> files;
    for (const auto& entry : fs::directory_iterator(root, fs::directory_options::skip_permission_denied, ec)) {
        FileInfo info;
        info.name = entry.path().filename().string();
        info.path = (fs::path(dir) / info.name).generic_string();
        info.isDirectory = entry.is_directory(ec);
        info.size = info.isDirectory ? 0 : entry.file_size(ec);
        info.lastModified = modificationTime(entry.path());
        files.push_back(std::move(info));
    }
    if (ec) {
        return std::unexpected(fmt::format("Failed to list {}: {}", root.string(), ec.message()));
    }
    return files;
}

std::expected<void, std::string> LocalStorageAdapter::download(const Json::Value& config, const std::string& remotePath,
                                                               const std::string& localPath, ProgressCallback onProgress) {
    fs::path source = resolve(config, remotePath);
    if (!fs::is_regular_file(source)) {
        return std::unexpected(fmt::format("File not found: {}", source.string()));
    }
    return copyWithProgress(source, localPath, onProgress);
}

std::expected<void, std::string> LocalStorageAdapter::upload(const Json::Value& config, const std::string& localPath,
                                                             const std::string& remotePath, ProgressCallback onProgress) {
    return copyWithProgress(localPath, resolve(config, remotePath), onProgress);
}

std::expected<void, std::string> LocalStorageAdapter::remove(const Json::Value& config, const std::string& path) {
    std::error_code ec;
    fs::path target = resolve(config, path);
    fs::remove(target, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return std::unexpected(fmt::format("Failed to remove {}: {}", target.string(), ec.message()));
    }
    return {};
}

ConnectionTest LocalStorageAdapter::test(const Json::Value& config) {
    fs::path base(config.get("basePath", ".").asString());
    std::error_code ec;
    if (!fs::is_directory(base, ec)) {
        return {false, fmt::format("Base path does not exist: {}", base.string()), std::nullopt, std::nullopt};
    }
    fs::path probe = base / ".restorevault-write-test";
    {
        std::ofstream out(probe);
        if (!out) {
            return {false, fmt::format("Base path is not writable: {}", base.string()), std::nullopt, std::nullopt};
        }
    }
    fs::remove(probe, ec);
    return {true, "Local storage is accessible", std::nullopt, std::nullopt};
}

std::optional<std::string> LocalStorageAdapter::read(const Json::Value& config, const std::string& path) {
    std::ifstream file(resolve(config, path), std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}
