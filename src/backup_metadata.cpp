#include "backup_metadata.hpp"
#include <sstream>
#include <memory>
#include <fmt/format.h>

namespace {

bool endsWith(const std::string& text, std::string_view suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<std::string> optionalString(const Json::Value& node, const char* key) {
    if (!node.isMember(key) || !node[key].isString() || node[key].asString().empty()) {
        return std::nullopt;
    }
    return node[key].asString();
}

} // namespace

std::expected<BackupMetadata, std::string> BackupMetadata::parse(const std::string& json) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(json);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        return std::unexpected(fmt::format("Invalid sidecar metadata: {}", errors));
    }
    return fromJson(root);
}

std::expected<BackupMetadata, std::string> BackupMetadata::fromJson(const Json::Value& root) {
    if (!root.isObject()) {
        return std::unexpected("Invalid sidecar metadata: expected a JSON object");
    }

    BackupMetadata meta;
    meta.sourceType = root.get("sourceType", "").asString();
    meta.sourceName = root.get("sourceName", "").asString();
    meta.jobName = root.get("jobName", "").asString();
    meta.engineVersion = optionalString(root, "engineVersion");
    meta.engineEdition = optionalString(root, "engineEdition");
    meta.locked = root.get("locked", false).asBool();

    const Json::Value& databases = root["databases"];
    if (databases.isNumeric()) {
        meta.databaseCount = databases.asUInt();
    } else if (databases.isObject()) {
        meta.databaseCount = databases.get("count", 0).asUInt();
        for (const auto& name : databases["names"]) {
            meta.databaseNames.push_back(name.asString());
        }
    }

    if (root.isMember("compression") && root["compression"].isString()) {
        auto compression = parseCompression(root["compression"].asString());
        if (!compression) {
            return std::unexpected(fmt::format("Unsupported compression in sidecar: {}", root["compression"].asString()));
        }
        meta.compression = *compression;
        meta.compressionRecorded = true;
    }

    const Json::Value& encryption = root["encryption"];
    if (encryption.isObject()) {
        meta.encryption.enabled = encryption.get("enabled", false).asBool();
        meta.encryption.profileId = optionalString(encryption, "profileId");
        meta.encryption.iv = optionalString(encryption, "iv");
        meta.encryption.authTag = optionalString(encryption, "authTag");
    } else {
        // flat layout
        meta.encryption.iv = optionalString(root, "iv");
        meta.encryption.authTag = optionalString(root, "authTag");
        meta.encryption.profileId = optionalString(root, "encryptionProfileId");
        bool declared = encryption.isString() && encryption.asString() != "NONE" && !encryption.asString().empty();
        meta.encryption.enabled = declared || meta.encryption.iv.has_value() || meta.encryption.authTag.has_value();
    }
    return meta;
}

Json::Value BackupMetadata::toJson() const {
    Json::Value root(Json::objectValue);
    root["sourceType"] = sourceType;
    root["sourceName"] = sourceName;
    root["jobName"] = jobName;
    if (engineVersion) root["engineVersion"] = *engineVersion;
    if (engineEdition) root["engineEdition"] = *engineEdition;

    Json::Value databases(Json::objectValue);
    databases["count"] = static_cast<Json::UInt64>(databaseCount);
    if (!databaseNames.empty()) {
        Json::Value names(Json::arrayValue);
        for (const auto& name : databaseNames) {
            names.append(name);
        }
        databases["names"] = names;
    }
    root["databases"] = databases;
    root["compression"] = std::string(compressionName(compression));

    Json::Value enc(Json::objectValue);
    enc["enabled"] = encryption.enabled;
    if (encryption.profileId) enc["profileId"] = *encryption.profileId;
    if (encryption.iv) enc["iv"] = *encryption.iv;
    if (encryption.authTag) enc["authTag"] = *encryption.authTag;
    root["encryption"] = enc;
    root["locked"] = locked;
    return root;
}

std::string sidecarPath(const std::string& artifactPath) {
    return artifactPath + ".meta.json";
}

BackupMetadata inferFromExtension(const std::string& artifactPath) {
    BackupMetadata meta;
    std::string path = artifactPath;
    if (endsWith(path, ".enc")) {
        meta.encryption.enabled = true;
        path.resize(path.size() - 4);
    }
    if (endsWith(path, ".gz")) {
        meta.compression = Compression::Gzip;
    } else if (endsWith(path, ".br")) {
        meta.compression = Compression::Brotli;
    }
    return meta;
}

BackupMetadata withExtensionFallback(BackupMetadata sidecar, const std::string& artifactPath) {
    BackupMetadata inferred = inferFromExtension(artifactPath);
    sidecar.encryption.enabled = sidecar.encryption.enabled || inferred.encryption.enabled;
    if (!sidecar.compressionRecorded) {
        sidecar.compression = inferred.compression;
    }
    return sidecar;
}

std::expected<GcmParameters, RestoreError> gcmParameters(const EncryptionInfo& encryption) {
    if (!encryption.iv || !encryption.authTag) {
        return restoreFailure(ErrorKind::Crypto,
            "Encrypted backup detected but metadata missing (IV or auth tag). Upload the .meta.json file as well.");
    }
    auto iv = fromHex(*encryption.iv);
    if (!iv || iv->empty()) {
        return restoreFailure(ErrorKind::Crypto, "Encryption metadata is corrupt: IV is not valid hex");
    }
    auto tag = fromHex(*encryption.authTag);
    if (!tag || tag->size() != kGcmTagSize) {
        return restoreFailure(ErrorKind::Crypto, "Encryption metadata is corrupt: auth tag is not a 16-byte hex value");
    }
    return GcmParameters{std::move(*iv), std::move(*tag)};
}
