#include "restore_api.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace {

std::expected<std::string, RestoreError> requiredString(const Json::Value& root, const char* key) {
    const Json::Value& value = root[key];
    if (!value.isString() || value.asString().empty()) {
        return restoreFailure(ErrorKind::Configuration, fmt::format("Missing or invalid '{}' in restore request", key));
    }
    return value.asString();
}

} // namespace

std::expected<RestoreRequest, RestoreError> parseRestoreRequest(const Json::Value& root) {
    if (!root.isObject()) {
        return restoreFailure(ErrorKind::Configuration, "Restore request must be a JSON object");
    }

    RestoreRequest request;
    for (auto [key, field] : {std::pair{"storageConfigId", &request.storageConfigId},
                              std::pair{"file", &request.file},
                              std::pair{"targetSourceId", &request.targetSourceId}}) {
        auto value = requiredString(root, key);
        if (!value) {
            return std::unexpected(value.error());
        }
        *field = std::move(*value);
    }

    if (root.isMember("targetDatabaseName") && !root["targetDatabaseName"].isNull()) {
        request.targetDatabaseName = root["targetDatabaseName"].asString();
    }

    const Json::Value& mapping = root["databaseMapping"];
    if (mapping.isArray()) {
        for (const auto& item : mapping) {
            DatabaseMappingEntry entry;
            entry.originalName = item.get("originalName", "").asString();
            entry.targetName = item.get("targetName", "").asString();
            entry.selected = item.get("selected", true).asBool();
            if (entry.originalName.empty()) {
                return restoreFailure(ErrorKind::Configuration, "databaseMapping entry requires 'originalName'");
            }
            request.databaseMapping.push_back(std::move(entry));
        }
    } else if (mapping.isObject()) {
        for (const auto& name : mapping.getMemberNames()) {
            request.databaseMapping.push_back(DatabaseMappingEntry{name, mapping[name].asString(), true});
        }
    } else if (!mapping.isNull()) {
        return restoreFailure(ErrorKind::Configuration, "databaseMapping must be a list or an object");
    }

    const Json::Value& auth = root["privilegedAuth"];
    if (auth.isObject()) {
        PrivilegedAuth privileged;
        privileged.user = auth.isMember("user") ? auth["user"].asString() : auth.get("username", "").asString();
        privileged.password = auth.get("password", "").asString();
        if (!privileged.user.empty()) {
            request.privilegedAuth = std::move(privileged);
        }
    }
    return request;
}

Json::Value restoreRequestToJson(const RestoreRequest& request) {
    Json::Value root(Json::objectValue);
    root["storageConfigId"] = request.storageConfigId;
    root["file"] = request.file;
    root["targetSourceId"] = request.targetSourceId;
    if (request.targetDatabaseName) {
        root["targetDatabaseName"] = *request.targetDatabaseName;
    }
    if (!request.databaseMapping.empty()) {
        Json::Value mapping(Json::arrayValue);
        for (const auto& entry : request.databaseMapping) {
            Json::Value item;
            item["originalName"] = entry.originalName;
            item["targetName"] = entry.targetName;
            item["selected"] = entry.selected;
            mapping.append(item);
        }
        root["databaseMapping"] = mapping;
    }
    if (request.privilegedAuth) {
        root["privilegedAuth"]["user"] = request.privilegedAuth->user;
    }
    return root;
}

RestoreAPI::RestoreAPI(const std::string& configFile)
    : RestoreAPI(RestoreConfig(configFile), makeDefaultRegistry()) {}

RestoreAPI::RestoreAPI(RestoreConfig config, AdapterRegistry registry, std::unique_ptr<ExecutionStore> store)
    : config_(std::move(config)),
      registry_(std::move(registry)),
      serviceLog_(config_.logFile, config_.errorLogFile),
      store_(std::move(store)) {
    if (!store_) {
        store_ = std::make_unique<JsonFileExecutionStore>(config_.executionsDir);
    }
    notifier_ = RestoreNotifier::fromConfig(config_.telegramConfig, config_.webhookConfig, serviceLog_);
    orchestrator_ = std::make_unique<RestoreOrchestrator>(config_, registry_, *store_, serviceLog_, notifier_.get());
}

// Joins the orchestrator's workers before the objects they use are destroyed.
RestoreAPI::~RestoreAPI() {
    orchestrator_.reset();
}

std::expected<std::string, RestoreError> RestoreAPI::startRestore(const RestoreRequest& request) {
    try {
        return orchestrator_->startRestore(request);
    } catch (const std::exception& e) {
        return restoreFailure(ErrorKind::Internal, fmt::format("Failed to start restore: {}", e.what()));
    }
}

std::expected<std::string, RestoreError> RestoreAPI::startRestore(const Json::Value& requestJson) {
    auto request = parseRestoreRequest(requestJson);
    if (!request) {
        return std::unexpected(request.error());
    }
    return startRestore(*request);
}

std::optional<Execution> RestoreAPI::wait(const std::string& executionId) {
    return orchestrator_->wait(executionId);
}

std::optional<Execution> RestoreAPI::status(const std::string& executionId) const {
    return orchestrator_->status(executionId);
}

std::size_t RestoreAPI::activeRestores() const {
    return orchestrator_->activeCount();
}

std::expected<ConnectionTest, RestoreError> RestoreAPI::testAdapter(const std::string& adapterConfigId) {
    auto found = std::ranges::find(config_.adapters, adapterConfigId, &AdapterConfig::id);
    if (found == config_.adapters.end()) {
        return restoreFailure(ErrorKind::Configuration, fmt::format("Adapter config not found: {}", adapterConfigId));
    }
    auto params = config_.connectionParameters(*found);
    if (!params) {
        return std::unexpected(params.error());
    }

    if (found->kind == AdapterKind::Storage) {
        auto storage = registry_.storage(found->adapterId);
        if (!storage) {
            return std::unexpected(storage.error());
        }
        return (*storage)->test(*params);
    }
    auto database = registry_.database(found->adapterId);
    if (!database) {
        return std::unexpected(database.error());
    }
    return (*database)->test(DatabaseConfig::fromJson(*params));
}

std::expected<std::vector<FileInfo>, RestoreError> RestoreAPI::listFiles(const std::string& storageConfigId,
                                                                         const std::string& dir) {
    auto adapterConfig = config_.findAdapterConfig(storageConfigId, AdapterKind::Storage);
    if (!adapterConfig) {
        return std::unexpected(adapterConfig.error());
    }
    auto storage = registry_.storage(adapterConfig->adapterId);
    if (!storage) {
        return std::unexpected(storage.error());
    }
    auto params = config_.connectionParameters(*adapterConfig);
    if (!params) {
        return std::unexpected(params.error());
    }
    auto files = (*storage)->list(*params, dir);
    if (!files) {
        return restoreFailure(ErrorKind::Transfer, files.error());
    }
    return std::move(*files);
}
