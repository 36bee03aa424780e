/**
 * @file restore_config.hpp
 * @brief Configuration management for the RestoreVault service.
 *
 * Loads service settings, adapter configurations, encryption profiles and notification
 * channels from one JSON file. Adapter connection parameters may hold secrets wrapped with
 * the system key; they are unwrapped only when an adapter config is resolved for use.
 *
 * @note The system key comes from "system_key" or, when absent, the ENCRYPTION_KEY
 * environment variable.
 */

#ifndef RESTORE_CONFIG_HPP
#define RESTORE_CONFIG_HPP

#include <string>
#include <vector>
#include <optional>
#include <expected>
#include <json/json.h>
#include "crypto.hpp"
#include "encryption_profiles.hpp"
#include "key_recovery.hpp"
#include "restore_error.hpp"

enum class AdapterKind {
    Storage,
    Database
};

/**
 * @brief A configured storage or database endpoint.
 */
struct AdapterConfig {
    std::string id;        ///< Configuration id referenced by requests.
    AdapterKind kind = AdapterKind::Storage;
    std::string adapterId; ///< Implementation id in the registry ("local-filesystem", "mysql", ...).
    std::string name;      ///< Display name.
    Json::Value config;    ///< Connection parameters, possibly with wrapped secrets.
};

/**
 * @brief Service configuration.
 */
class RestoreConfig {
public:
    /**
     * @brief Loads the configuration from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is unreadable or invalid.
     */
    explicit RestoreConfig(const std::string& configFile);

    /**
     * @brief Builds the configuration from an already parsed document.
     * @throws std::runtime_error If the document is invalid.
     */
    explicit RestoreConfig(const Json::Value& configJson);

    /**
     * @brief Finds an adapter configuration and checks its kind.
     * @return The configuration, or a Configuration error.
     */
    std::expected<AdapterConfig, RestoreError> findAdapterConfig(const std::string& id, AdapterKind kind) const;

    /**
     * @brief Connection parameters with sensitive fields unwrapped.
     */
    std::expected<Json::Value, RestoreError> connectionParameters(const AdapterConfig& adapter) const;

    /**
     * @brief Keyring over the configured encryption profiles.
     */
    EncryptionProfiles encryptionKeyring() const;

    std::string scratchDir;                             ///< Directory for downloaded and intermediate files.
    std::string executionsDir;                          ///< Directory of execution records.
    std::string logFile;                                ///< Path to the log file.
    std::string errorLogFile;                           ///< Path to the error log file.
    std::size_t workers = 2;                            ///< Concurrent restores.
    RecoveryThresholds recovery;                        ///< Smart key recovery limits.
    std::vector<std::string> editionSensitiveEngines;   ///< Engines requiring matching editions.
    std::vector<AdapterConfig> adapters;                ///< Configured endpoints.
    std::vector<EncryptionProfile> encryptionProfiles;  ///< Configured profiles.
    std::optional<SecretCipher> systemCipher;           ///< Cipher for wrapped secrets.
    Json::Value telegramConfig;                         ///< Telegram notification settings.
    Json::Value webhookConfig;                          ///< Webhook notification settings.

private:
    void load(const Json::Value& configJson);
};

#endif // RESTORE_CONFIG_HPP
