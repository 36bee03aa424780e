/**
 * @file storage_adapters.hpp
 * @brief Storage adapters shipped with RestoreVault: local filesystem and SFTP.
 *
 * @note The SFTP adapter requires libssh.
 */

#ifndef STORAGE_ADAPTERS_HPP
#define STORAGE_ADAPTERS_HPP

#include <string>
#include "adapter.hpp"

/**
 * @brief Files under a base directory on the local machine.
 *
 * Config: {"basePath": "/var/backups"}. Remote paths are relative to basePath.
 */
class LocalStorageAdapter : public StorageAdapter, public SidecarReader {
public:
    std::string id() const override { return "local-filesystem"; }
    std::string name() const override { return "Local Filesystem"; }

    std::expected<std::vector<FileInfo>, std::string> list(const Json::Value& config, const std::string& dir) override;
    std::expected<void, std::string> download(const Json::Value& config, const std::string& remotePath,
                                              const std::string& localPath, ProgressCallback onProgress = {}) override;
    std::expected<void, std::string> upload(const Json::Value& config, const std::string& localPath,
                                            const std::string& remotePath, ProgressCallback onProgress = {}) override;
    std::expected<void, std::string> remove(const Json::Value& config, const std::string& path) override;
    ConnectionTest test(const Json::Value& config) override;

    SidecarReader* sidecarReader() override { return this; }
    std::optional<std::string> read(const Json::Value& config, const std::string& path) override;
};

/**
 * @brief Files on a remote host reached over SFTP.
 *
 * Config: host, port (22), username, and either password or privateKey (PEM, with optional
 * passphrase). Without either, agent and default key authentication is attempted.
 * Remote paths are relative to "pathPrefix" when set.
 */
class SftpStorageAdapter : public StorageAdapter, public SidecarReader {
public:
    std::string id() const override { return "sftp"; }
    std::string name() const override { return "SFTP"; }

    std::expected<std::vector<FileInfo>, std::string> list(const Json::Value& config, const std::string& dir) override;
    std::expected<void, std::string> download(const Json::Value& config, const std::string& remotePath,
                                              const std::string& localPath, ProgressCallback onProgress = {}) override;
    std::expected<void, std::string> upload(const Json::Value& config, const std::string& localPath,
                                            const std::string& remotePath, ProgressCallback onProgress = {}) override;
    std::expected<void, std::string> remove(const Json::Value& config, const std::string& path) override;
    ConnectionTest test(const Json::Value& config) override;

    SidecarReader* sidecarReader() override { return this; }
    std::optional<std::string> read(const Json::Value& config, const std::string& path) override;
};

#endif // STORAGE_ADAPTERS_HPP
