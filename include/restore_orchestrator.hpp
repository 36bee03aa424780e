/**
 * @file restore_orchestrator.hpp
 * @brief Entry point of a restore: validation, preflight and the background pipeline.
 *
 * startRestore() resolves adapters and runs every check that can reject a request before
 * an Execution exists. Accepted requests run on the worker pool:
 * download, decrypt, decompress, restore, cleanup, notify. Each stage is recorded in the
 * Execution, which is the only channel through which the pipeline reports back.
 */

#ifndef RESTORE_ORCHESTRATOR_HPP
#define RESTORE_ORCHESTRATOR_HPP

#include <string>
#include <vector>
#include <optional>
#include <expected>
#include <memory>
#include <mutex>
#include <future>
#include <unordered_map>
#include "adapter.hpp"
#include "adapter_registry.hpp"
#include "backup_metadata.hpp"
#include "execution.hpp"
#include "notification.hpp"
#include "restore_config.hpp"
#include "restore_error.hpp"
#include "scratch.hpp"
#include "service_log.hpp"
#include "worker_pool.hpp"

/**
 * @brief A restore as requested by a caller.
 */
struct RestoreRequest {
    std::string storageConfigId;                     ///< Storage adapter configuration holding the artifact.
    std::string file;                                ///< Artifact path on that storage.
    std::string targetSourceId;                      ///< Database adapter configuration to restore into.
    std::optional<std::string> targetDatabaseName;
    std::vector<DatabaseMappingEntry> databaseMapping;
    std::optional<PrivilegedAuth> privilegedAuth;
};

class RestoreOrchestrator {
public:
    /**
     * @param config Service configuration. Must outlive the orchestrator.
     * @param registry Adapter implementations. Must outlive the orchestrator.
     * @param store Execution persistence.
     * @param serviceLog Service log for stage transitions and outcomes.
     * @param notifier Notification dispatcher, or null to disable notifications.
     */
    RestoreOrchestrator(const RestoreConfig& config, const AdapterRegistry& registry, ExecutionStore& store,
                        const ServiceLog& serviceLog, RestoreNotifier* notifier = nullptr);

    /**
     * @brief Waits for every running restore.
     */
    ~RestoreOrchestrator();

    RestoreOrchestrator(const RestoreOrchestrator&) = delete;
    RestoreOrchestrator& operator=(const RestoreOrchestrator&) = delete;

    /**
     * @brief Validates a request and starts its pipeline in the background.
     *
     * Configuration and Preflight errors are returned here, before an Execution exists.
     *
     * @return The Execution id.
     */
    std::expected<std::string, RestoreError> startRestore(const RestoreRequest& request);

    /**
     * @brief Blocks until the given restore has finished.
     * @return The final record, or std::nullopt for an unknown id.
     */
    std::optional<Execution> wait(const std::string& executionId);

    /**
     * @brief Current record of a restore started by this orchestrator or found in the store.
     *
     * Running restores answer from memory, finished ones from the store.
     */
    std::optional<Execution> status(const std::string& executionId) const;

    /**
     * @brief Number of restores that have not finished yet.
     */
    std::size_t activeCount() const;

private:
    struct Job;

    std::optional<BackupMetadata> readSidecar(StorageAdapter& storage, const Json::Value& storageParams,
                                              const std::string& file) const;
    void run(const Job& job, ExecutionTracker& tracker);
    std::expected<void, RestoreError> pipeline(const Job& job, ExecutionTracker& tracker, ScratchFiles& scratch);
    void notify(const Job& job, const Execution& execution, const std::optional<std::string>& error);

    const RestoreConfig& config_;
    const AdapterRegistry& registry_;
    ExecutionStore& store_;
    const ServiceLog& serviceLog_;
    RestoreNotifier* notifier_;

    mutable std::mutex mutex_;
    // Restores still in flight; run() removes its entries once the record is terminal.
    std::unordered_map<std::string, std::shared_ptr<ExecutionTracker>> trackers_;
    std::unordered_map<std::string, std::shared_future<void>> running_;

    WorkerPool pool_; ///< Declared last: joined before the trackers it references go away.
};

/**
 * @brief Random execution id in UUID layout.
 */
std::string newExecutionId();

#endif // RESTORE_ORCHESTRATOR_HPP
