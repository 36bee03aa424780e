#include "storage_adapters.hpp"
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <ctime>
#include <fcntl.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kTransferChunk = 32 * 1024;
constexpr std::size_t kSidecarLimit = 1024 * 1024;

struct SessionDeleter {
    void operator()(ssh_session_struct* ssh) const {
        ssh_disconnect(ssh);
        ssh_free(ssh);
    }
};

using SshSession = std::unique_ptr<ssh_session_struct, SessionDeleter>;
using SftpSession = std::unique_ptr<sftp_session_struct, decltype(&sftp_free)>;
using SftpFile = std::unique_ptr<sftp_file_struct, decltype(&sftp_close)>;
using SftpDir = std::unique_ptr<sftp_dir_struct, decltype(&sftp_closedir)>;
using SshKey = std::unique_ptr<ssh_key_struct, decltype(&ssh_key_free)>;

/**
 * @brief Connected and authenticated SFTP channel. Members are destroyed in reverse order,
 * so the SFTP session is freed before the SSH session disconnects.
 */
struct SftpConnection {
    SshSession ssh;
    SftpSession sftp{nullptr, &sftp_free};
};

std::string remotePath(const Json::Value& config, const std::string& path) {
    std::string prefix = config.get("pathPrefix", "").asString();
    if (prefix.empty()) {
        return path;
    }
    if (!path.empty() && path.front() == '/') {
        return prefix + path;
    }
    return prefix + "/" + path;
}

std::expected<void, std::string> authenticate(ssh_session ssh, const Json::Value& config) {
    std::string password = config.get("password", "").asString();
    std::string privateKey = config.get("privateKey", "").asString();

    if (!privateKey.empty()) {
        std::string passphrase = config.get("passphrase", "").asString();
        ssh_key rawKey = nullptr;
        if (ssh_pki_import_privkey_base64(privateKey.c_str(), passphrase.empty() ? nullptr : passphrase.c_str(),
                                          nullptr, nullptr, &rawKey) != SSH_OK) {
            return std::unexpected("Failed to load SSH private key");
        }
        SshKey key(rawKey, &ssh_key_free);
        if (ssh_userauth_publickey(ssh, nullptr, key.get()) != SSH_AUTH_SUCCESS) {
            return std::unexpected(fmt::format("SSH key authentication failed: {}", ssh_get_error(ssh)));
        }
        return {};
    }

    if (password.empty()) {
        if (ssh_userauth_publickey_auto(ssh, nullptr, nullptr) != SSH_AUTH_SUCCESS) {
            return std::unexpected("SSH authentication failed");
        }
    } else {
        if (ssh_userauth_password(ssh, nullptr, password.c_str()) != SSH_AUTH_SUCCESS) {
            return std::unexpected("SSH password authentication failed");
        }
    }
    return {};
}

std::expected<SftpConnection, std::string> connect(const Json::Value& config) {
    std::string host = config.get("host", "").asString();
    std::string user = config.isMember("username") ? config["username"].asString() : config.get("user", "").asString();
    int port = config.get("port", 22).asInt();
    if (host.empty() || user.empty()) {
        return std::unexpected("SFTP configuration requires host and username");
    }

    SftpConnection conn{SshSession(ssh_new())};
    if (!conn.ssh) {
        return std::unexpected("Failed to create SSH session");
    }
    ssh_options_set(conn.ssh.get(), SSH_OPTIONS_HOST, host.c_str());
    ssh_options_set(conn.ssh.get(), SSH_OPTIONS_PORT, &port);
    ssh_options_set(conn.ssh.get(), SSH_OPTIONS_USER, user.c_str());
    if (ssh_connect(conn.ssh.get()) != SSH_OK) {
        return std::unexpected(fmt::format("SSH connection failed: {}", ssh_get_error(conn.ssh.get())));
    }

    auto authenticated = authenticate(conn.ssh.get(), config);
    if (!authenticated) {
        return std::unexpected(authenticated.error());
    }

    conn.sftp.reset(sftp_new(conn.ssh.get()));
    if (!conn.sftp || sftp_init(conn.sftp.get()) != SSH_OK) {
        return std::unexpected("SFTP initialization failed");
    }
    return conn;
}

std::string isoTime(std::uint32_t seconds) {
    std::time_t timeT = static_cast<std::time_t>(seconds);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%dT%H:%M:%SZ", std::gmtime(&timeT));
    return timeBuf;
}

} // namespace

std::expected<std::vector<FileInfo>, std::string> SftpStorageAdapter::list(const Json::Value& config, const std::string& dir) {
    auto conn = connect(config);
    if (!conn) {
        return std::unexpected(conn.error());
    }

    std::string target = remotePath(config, dir);
    SftpDir handle(sftp_opendir(conn->sftp.get(), target.c_str()), &sftp_closedir);
    if (!handle) {
        return std::unexpected(fmt::format("Failed to open remote directory {}: {}", target, ssh_get_error(conn->ssh.get())));
    }

    std::vector<FileInfo> files;
    while (sftp_attributes attrs = sftp_readdir(conn->sftp.get(), handle.get())) {
        std::string entryName = attrs->name ? attrs->name : "";
        if (entryName != "." && entryName != "..") {
            FileInfo info;
            info.name = entryName;
            info.path = (fs::path(dir) / entryName).generic_string();
            info.isDirectory = attrs->type == SSH_FILEXFER_TYPE_DIRECTORY;
            info.size = attrs->size;
            info.lastModified = isoTime(attrs->mtime);
            files.push_back(std::move(info));
        }
        sftp_attributes_free(attrs);
    }
    if (!sftp_dir_eof(handle.get())) {
        return std::unexpected(fmt::format("Failed to read remote directory {}", target));
    }
    return files;
}

std::expected<void, std::string> SftpStorageAdapter::download(const Json::Value& config, const std::string& remote,
                                                              const std::string& localPath, ProgressCallback onProgress) {
    auto conn = connect(config);
    if (!conn) {
        return std::unexpected(conn.error());
    }

    std::string target = remotePath(config, remote);
    std::uint64_t total = 0;
    if (sftp_attributes attrs = sftp_stat(conn->sftp.get(), target.c_str())) {
        total = attrs->size;
        sftp_attributes_free(attrs);
    }

    SftpFile file(sftp_open(conn->sftp.get(), target.c_str(), O_RDONLY, 0), &sftp_close);
    if (!file) {
        return std::unexpected(fmt::format("Failed to open remote file {}: {}", target, ssh_get_error(conn->ssh.get())));
    }

    std::ofstream output(localPath, std::ios::binary | std::ios::trunc);
    if (!output) {
        return std::unexpected(fmt::format("Failed to open local file {}", localPath));
    }

    char buf[kTransferChunk];
    std::uint64_t received = 0;
    int lastPercent = -1;
    ssize_t got = 0;
    while ((got = sftp_read(file.get(), buf, sizeof(buf))) > 0) {
        output.write(buf, got);
        received += static_cast<std::uint64_t>(got);
        if (onProgress && total > 0) {
            int percent = static_cast<int>(received * 100 / total);
            if (percent != lastPercent) {
                onProgress(percent);
                lastPercent = percent;
            }
        }
    }
    if (got < 0) {
        return std::unexpected(fmt::format("Failed to read remote file {}: {}", target, ssh_get_error(conn->ssh.get())));
    }
    if (!output) {
        return std::unexpected(fmt::format("Failed to write local file {}", localPath));
    }
    return {};
}

std::expected<void, std::string> SftpStorageAdapter::upload(const Json::Value& config, const std::string& localPath,
                                                            const std::string& remote, ProgressCallback onProgress) {
    auto conn = connect(config);
    if (!conn) {
        return std::unexpected(conn.error());
    }

    std::ifstream input(localPath, std::ios::binary);
    if (!input) {
        return std::unexpected("Failed to open local file");
    }

    std::string target = remotePath(config, remote);
    SftpFile file(sftp_open(conn->sftp.get(), target.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644), &sftp_close);
    if (!file) {
        return std::unexpected("Failed to open remote file");
    }

    std::error_code ec;
    std::uintmax_t total = fs::file_size(localPath, ec);
    std::uintmax_t sent = 0;
    char buf[kTransferChunk];
    while (input) {
        input.read(buf, sizeof(buf));
        auto got = input.gcount();
        if (got <= 0) break;
        if (sftp_write(file.get(), buf, static_cast<size_t>(got)) != got) {
            return std::unexpected(fmt::format("Failed to write remote file {}: {}", target, ssh_get_error(conn->ssh.get())));
        }
        sent += static_cast<std::uintmax_t>(got);
        if (onProgress && total > 0) {
            onProgress(static_cast<int>(sent * 100 / total));
        }
    }
    return {};
}

std::expected<void, std::string> SftpStorageAdapter::remove(const Json::Value& config, const std::string& path) {
    auto conn = connect(config);
    if (!conn) {
        return std::unexpected(conn.error());
    }
    std::string target = remotePath(config, path);
    if (sftp_unlink(conn->sftp.get(), target.c_str()) != SSH_OK) {
        if (sftp_get_error(conn->sftp.get()) == SSH_FX_NO_SUCH_FILE) {
            return {};
        }
        return std::unexpected(fmt::format("Failed to remove remote file {}: {}", target, ssh_get_error(conn->ssh.get())));
    }
    return {};
}

ConnectionTest SftpStorageAdapter::test(const Json::Value& config) {
    auto conn = connect(config);
    if (!conn) {
        return {false, conn.error(), std::nullopt, std::nullopt};
    }
    return {true, "SFTP connection successful", std::nullopt, std::nullopt};
}

std::optional<std::string> SftpStorageAdapter::read(const Json::Value& config, const std::string& path) {
    auto conn = connect(config);
    if (!conn) {
        return std::nullopt;
    }
    std::string target = remotePath(config, path);
    SftpFile file(sftp_open(conn->sftp.get(), target.c_str(), O_RDONLY, 0), &sftp_close);
    if (!file) {
        return std::nullopt;
    }

    std::string content;
    char buf[kTransferChunk];
    ssize_t got = 0;
    while ((got = sftp_read(file.get(), buf, sizeof(buf))) > 0) {
        content.append(buf, static_cast<std::size_t>(got));
        if (content.size() > kSidecarLimit) {
            return std::nullopt;
        }
    }
    if (got < 0) {
        return std::nullopt;
    }
    return content;
}
