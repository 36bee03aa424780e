#include "adapter_registry.hpp"
#include "storage_adapters.hpp"
#include "database_adapters.hpp"
#include <stdexcept>
#include <algorithm>
#include <fmt/format.h>

namespace {

template <typename Adapter>
std::unordered_map<std::string, std::shared_ptr<Adapter>> indexById(std::vector<std::shared_ptr<Adapter>> adapters,
                                                                    const char* family) {
    std::unordered_map<std::string, std::shared_ptr<Adapter>> index;
    for (auto& adapter : adapters) {
        if (!adapter) {
            throw std::runtime_error(fmt::format("Null {} adapter in registry", family));
        }
        std::string id = adapter->id();
        if (!index.emplace(id, std::move(adapter)).second) {
            throw std::runtime_error(fmt::format("Duplicate {} adapter id: {}", family, id));
        }
    }
    return index;
}

template <typename Map>
std::vector<std::string> sortedKeys(const Map& map) {
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& [key, value] : map) {
        keys.push_back(key);
    }
    std::ranges::sort(keys);
    return keys;
}

} // namespace

AdapterRegistry::AdapterRegistry(std::vector<std::shared_ptr<StorageAdapter>> storage,
                                 std::vector<std::shared_ptr<DatabaseAdapter>> databases)
    : storage_(indexById(std::move(storage), "storage")),
      databases_(indexById(std::move(databases), "database")) {}

std::expected<std::shared_ptr<StorageAdapter>, RestoreError> AdapterRegistry::storage(const std::string& id) const {
    auto it = storage_.find(id);
    if (it == storage_.end()) {
        return restoreFailure(ErrorKind::Configuration, fmt::format("Storage adapter not found: {}", id));
    }
    return it->second;
}

std::expected<std::shared_ptr<DatabaseAdapter>, RestoreError> AdapterRegistry::database(const std::string& id) const {
    auto it = databases_.find(id);
    if (it == databases_.end()) {
        return restoreFailure(ErrorKind::Configuration, fmt::format("Database adapter not found: {}", id));
    }
    return it->second;
}

std::vector<std::string> AdapterRegistry::storageIds() const {
    return sortedKeys(storage_);
}

std::vector<std::string> AdapterRegistry::databaseIds() const {
    return sortedKeys(databases_);
}

AdapterRegistry makeDefaultRegistry() {
    return AdapterRegistry(
        {std::make_shared<LocalStorageAdapter>(), std::make_shared<SftpStorageAdapter>()},
        {std::make_shared<MySqlAdapter>(), std::make_shared<PostgresAdapter>()});
}
