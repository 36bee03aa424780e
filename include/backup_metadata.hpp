/**
 * @file backup_metadata.hpp
 * @brief Sidecar metadata stored next to each backup artifact.
 *
 * The sidecar lives at "<artifact>.meta.json". Two encryption layouts are accepted: the
 * nested "encryption" block and the older flat layout with "iv", "authTag" and
 * "encryptionProfileId" at the top level.
 */

#ifndef BACKUP_METADATA_HPP
#define BACKUP_METADATA_HPP

#include <string>
#include <vector>
#include <optional>
#include <expected>
#include <json/json.h>
#include "compression.hpp"
#include "crypto.hpp"
#include "restore_error.hpp"

/**
 * @brief Encryption parameters recorded in the sidecar.
 */
struct EncryptionInfo {
    bool enabled = false;
    std::optional<std::string> profileId;
    std::optional<std::string> iv;      ///< Hex.
    std::optional<std::string> authTag; ///< Hex.
};

/**
 * @brief Parsed sidecar document.
 */
struct BackupMetadata {
    std::string sourceType;                 ///< Adapter id of the engine that produced the backup.
    std::string sourceName;
    std::string jobName;
    std::optional<std::string> engineVersion;
    std::optional<std::string> engineEdition;
    std::size_t databaseCount = 0;
    std::vector<std::string> databaseNames;
    Compression compression = Compression::None;
    bool compressionRecorded = false;       ///< The document carried a "compression" key.
    EncryptionInfo encryption;
    bool locked = false;

    /**
     * @brief Parses a sidecar document.
     * @return The metadata, or an error for invalid JSON or an unknown compression name.
     */
    static std::expected<BackupMetadata, std::string> parse(const std::string& json);

    static std::expected<BackupMetadata, std::string> fromJson(const Json::Value& root);

    /**
     * @brief Serializes in the nested layout.
     */
    Json::Value toJson() const;
};

/**
 * @brief Path of the sidecar for an artifact.
 */
std::string sidecarPath(const std::string& artifactPath);

/**
 * @brief Guesses encryption and compression from the artifact's extensions.
 *
 * ".enc" marks the file as encrypted (without IV or tag), an inner ".gz" or ".br" sets the
 * compression. Used alone when no sidecar exists.
 */
BackupMetadata inferFromExtension(const std::string& artifactPath);

/**
 * @brief Completes a sidecar with what the artifact's extensions imply.
 *
 * The artifact counts as encrypted if either source says so. Compression comes from the
 * extension only when the sidecar does not record it.
 */
BackupMetadata withExtensionFallback(BackupMetadata sidecar, const std::string& artifactPath);

/**
 * @brief Decodes the IV and tag of an encrypted artifact.
 *
 * @return The parameters, or a Crypto error if either is missing or not valid hex.
 */
std::expected<GcmParameters, RestoreError> gcmParameters(const EncryptionInfo& encryption);

#endif // BACKUP_METADATA_HPP
