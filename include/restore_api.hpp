/**
 * @file restore_api.hpp
 * @brief High-level API for interacting with the RestoreVault service.
 *
 * Wires the configuration, adapter registry, execution store, notifier and orchestrator
 * together behind one object, and converts restore requests from and to JSON. This is the
 * entry point used by the command line tool.
 */

#ifndef RESTORE_API_HPP
#define RESTORE_API_HPP

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <expected>
#include <json/json.h>
#include "adapter_registry.hpp"
#include "execution.hpp"
#include "notification.hpp"
#include "restore_config.hpp"
#include "restore_orchestrator.hpp"
#include "service_log.hpp"

/**
 * @brief Parses a restore request.
 *
 * "databaseMapping" may be a list of {originalName, targetName, selected} objects or an
 * object mapping original names to target names (all selected). "privilegedAuth" accepts
 * "user" or "username".
 *
 * @return The request, or a Configuration error for a malformed document.
 */
std::expected<RestoreRequest, RestoreError> parseRestoreRequest(const Json::Value& root);

/**
 * @brief Serializes a request in the list form of "databaseMapping". The password is omitted.
 */
Json::Value restoreRequestToJson(const RestoreRequest& request);

/**
 * @brief API for running restores in RestoreVault.
 */
class RestoreAPI {
public:
    /**
     * @brief Loads the configuration and builds the service.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the configuration is unreadable or invalid.
     */
    explicit RestoreAPI(const std::string& configFile);

    /**
     * @brief Builds the service from a loaded configuration and a custom registry.
     *
     * @param store Execution store; null selects JSON files under the configured executions_dir.
     */
    RestoreAPI(RestoreConfig config, AdapterRegistry registry, std::unique_ptr<ExecutionStore> store = nullptr);

    ~RestoreAPI();

    RestoreAPI(const RestoreAPI&) = delete;
    RestoreAPI& operator=(const RestoreAPI&) = delete;

    std::expected<std::string, RestoreError> startRestore(const RestoreRequest& request);

    /**
     * @brief Starts a restore from its JSON form.
     */
    std::expected<std::string, RestoreError> startRestore(const Json::Value& requestJson);

    std::optional<Execution> wait(const std::string& executionId);
    std::optional<Execution> status(const std::string& executionId) const;
    std::size_t activeRestores() const;

    /**
     * @brief Probes a configured storage or database endpoint.
     */
    std::expected<ConnectionTest, RestoreError> testAdapter(const std::string& adapterConfigId);

    /**
     * @brief Lists a directory of a configured storage endpoint.
     */
    std::expected<std::vector<FileInfo>, RestoreError> listFiles(const std::string& storageConfigId,
                                                                 const std::string& dir);

    const ServiceLog& serviceLog() const { return serviceLog_; }

private:
    RestoreConfig config_;
    AdapterRegistry registry_;
    ServiceLog serviceLog_;
    std::unique_ptr<ExecutionStore> store_;
    std::unique_ptr<RestoreNotifier> notifier_;
    std::unique_ptr<RestoreOrchestrator> orchestrator_;
};

#endif // RESTORE_API_HPP
