/**
 * @file adapter_registry.hpp
 * @brief Immutable lookup from adapter id to implementation.
 */

#ifndef ADAPTER_REGISTRY_HPP
#define ADAPTER_REGISTRY_HPP

#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <expected>
#include "adapter.hpp"
#include "restore_error.hpp"

/**
 * @brief Adapter registry built once at startup.
 *
 * The registry is handed to the orchestrator by reference and never modified afterwards,
 * so concurrent lookups need no locking.
 */
class AdapterRegistry {
public:
    /**
     * @brief Builds the registry.
     *
     * @param storage Storage adapter implementations.
     * @param databases Database adapter implementations.
     * @throws std::runtime_error If two adapters of the same family share an id, or an entry is null.
     */
    AdapterRegistry(std::vector<std::shared_ptr<StorageAdapter>> storage,
                    std::vector<std::shared_ptr<DatabaseAdapter>> databases);

    /**
     * @brief Returns the storage adapter with the given id.
     * @return The adapter, or a Configuration error naming the unknown id.
     */
    std::expected<std::shared_ptr<StorageAdapter>, RestoreError> storage(const std::string& id) const;

    /**
     * @brief Returns the database adapter with the given id.
     */
    std::expected<std::shared_ptr<DatabaseAdapter>, RestoreError> database(const std::string& id) const;

    std::vector<std::string> storageIds() const;
    std::vector<std::string> databaseIds() const;

private:
    std::unordered_map<std::string, std::shared_ptr<StorageAdapter>> storage_;
    std::unordered_map<std::string, std::shared_ptr<DatabaseAdapter>> databases_;
};

/**
 * @brief Registry with the adapters shipped in this repository (local-filesystem, sftp, mysql, postgres).
 */
AdapterRegistry makeDefaultRegistry();

#endif // ADAPTER_REGISTRY_HPP
