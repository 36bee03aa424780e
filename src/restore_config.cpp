#include "restore_config.hpp"
#include <fstream>
#include <cstdlib>
#include <stdexcept>
#include <fmt/format.h>

namespace {

std::string defaultScratchDir() {
    const char* tmp = std::getenv("TMPDIR");
    return tmp && *tmp ? std::string(tmp) : std::string("/tmp");
}

} // namespace

RestoreConfig::RestoreConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &configJson, &errors)) {
        throw std::runtime_error(fmt::format("Failed to parse config file: {} ({})", configFile, errors));
    }
    load(configJson);
}

RestoreConfig::RestoreConfig(const Json::Value& configJson) {
    load(configJson);
}

void RestoreConfig::load(const Json::Value& configJson) {
    if (!configJson.isObject()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }

    scratchDir = configJson.get("scratch_dir", defaultScratchDir()).asString();
    executionsDir = configJson.get("executions_dir", "./executions/").asString();
    logFile = configJson.get("log_file", "./restorevault.log").asString();
    errorLogFile = configJson.get("error_log_file", "./restorevault-errors.log").asString();
    int workerCount = configJson.get("workers", 2).asInt();
    if (workerCount < 1) {
        throw std::runtime_error(fmt::format("Invalid worker count: {}", workerCount));
    }
    workers = static_cast<std::size_t>(workerCount);

    const Json::Value& recoveryJson = configJson["recovery"];
    recovery.sampleBytes = recoveryJson.get("sample_bytes", 1024).asUInt();
    recovery.printableRatio = recoveryJson.get("printable_ratio", 0.7).asDouble();
    if (recovery.sampleBytes == 0 || recovery.printableRatio <= 0.0 || recovery.printableRatio >= 1.0) {
        throw std::runtime_error("Invalid recovery thresholds: sample_bytes must be positive, printable_ratio in (0, 1)");
    }

    if (configJson.isMember("edition_sensitive_engines")) {
        for (const auto& engine : configJson["edition_sensitive_engines"]) {
            editionSensitiveEngines.push_back(engine.asString());
        }
    } else {
        editionSensitiveEngines = {"mssql"};
    }

    for (const auto& item : configJson["adapters"]) {
        AdapterConfig adapter;
        adapter.id = item.get("id", "").asString();
        std::string type = item.get("type", "").asString();
        if (type == "storage") {
            adapter.kind = AdapterKind::Storage;
        } else if (type == "database") {
            adapter.kind = AdapterKind::Database;
        } else {
            throw std::runtime_error(fmt::format("Adapter config {} has invalid type: '{}'", adapter.id, type));
        }
        adapter.adapterId = item.get("adapter", "").asString();
        adapter.name = item.get("name", adapter.id).asString();
        adapter.config = item.get("config", Json::Value(Json::objectValue));
        if (adapter.id.empty() || adapter.adapterId.empty()) {
            throw std::runtime_error("Adapter config requires 'id' and 'adapter'");
        }
        adapters.push_back(std::move(adapter));
    }

    for (const auto& item : configJson["encryption_profiles"]) {
        EncryptionProfile profile;
        profile.id = item.get("id", "").asString();
        profile.name = item.get("name", profile.id).asString();
        profile.secretKey = item.get("secret_key", "").asString();
        profile.createdAt = item.get("created_at", "").asString();
        if (profile.id.empty()) {
            throw std::runtime_error("Encryption profile requires 'id'");
        }
        encryptionProfiles.push_back(std::move(profile));
    }

    std::string systemKey = configJson.get("system_key", "").asString();
    if (systemKey.empty()) {
        const char* env = std::getenv("ENCRYPTION_KEY");
        systemKey = env ? env : "";
    }
    if (!systemKey.empty()) {
        auto cipher = SecretCipher::fromHexKey(systemKey);
        if (!cipher) {
            throw std::runtime_error(fmt::format("Invalid system key: {}", cipher.error()));
        }
        systemCipher = std::move(*cipher);
    }

    const Json::Value& notifications = configJson["notifications"];
    telegramConfig = notifications["telegram"];
    webhookConfig = notifications["webhook"];
}

std::expected<AdapterConfig, RestoreError> RestoreConfig::findAdapterConfig(const std::string& id, AdapterKind kind) const {
    for (const auto& adapter : adapters) {
        if (adapter.id != id) {
            continue;
        }
        if (adapter.kind != kind) {
            return restoreFailure(ErrorKind::Configuration,
                fmt::format("Adapter config {} is not a {} adapter", id, kind == AdapterKind::Storage ? "storage" : "database"));
        }
        return adapter;
    }
    return restoreFailure(ErrorKind::Configuration,
        fmt::format("{} adapter config not found: {}", kind == AdapterKind::Storage ? "Storage" : "Database", id));
}

std::expected<Json::Value, RestoreError> RestoreConfig::connectionParameters(const AdapterConfig& adapter) const {
    if (!systemCipher) {
        return adapter.config;
    }
    auto decrypted = systemCipher->decryptConfig(adapter.config);
    if (!decrypted) {
        return restoreFailure(ErrorKind::Configuration,
            fmt::format("Failed to decrypt configuration of adapter {}: {}", adapter.id, decrypted.error()));
    }
    return std::move(*decrypted);
}

EncryptionProfiles RestoreConfig::encryptionKeyring() const {
    return EncryptionProfiles(encryptionProfiles, systemCipher);
}
