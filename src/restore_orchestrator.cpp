#include "restore_orchestrator.hpp"
#include "compatibility_guard.hpp"
#include "compression.hpp"
#include "crypto.hpp"
#include "encryption_profiles.hpp"
#include "key_recovery.hpp"
#include "multi_db_archive.hpp"
#include <chrono>
#include <filesystem>
#include <fmt/format.h>

namespace fs = std::filesystem;

struct RestoreOrchestrator::Job {
    RestoreRequest request;
    std::shared_ptr<StorageAdapter> storage;
    std::shared_ptr<DatabaseAdapter> database;
    Json::Value storageParams;
    DatabaseConfig databaseConfig; ///< Without request overrides.
    std::string targetName;        ///< Display name of the target configuration.
    std::optional<BackupMetadata> sidecar;
    std::chrono::steady_clock::time_point startedAt;
};

namespace {

// Databases the preflight must be allowed to create or overwrite.
std::vector<std::string> preflightTargets(const RestoreRequest& request, const std::optional<BackupMetadata>& sidecar,
                                          const DatabaseConfig& config) {
    std::vector<std::string> names;
    if (!request.databaseMapping.empty()) {
        for (const auto& entry : request.databaseMapping) {
            if (entry.selected) {
                names.push_back(targetDatabaseName(entry.originalName, request.databaseMapping));
            }
        }
    } else if (request.targetDatabaseName && !request.targetDatabaseName->empty()) {
        names.push_back(*request.targetDatabaseName);
    } else if (sidecar && !sidecar->databaseNames.empty()) {
        names = sidecar->databaseNames;
    } else if (!config.database.empty()) {
        names.push_back(config.database);
    }
    return names;
}

RestoreOverrides overridesFor(const RestoreRequest& request) {
    RestoreOverrides overrides;
    overrides.targetDatabaseName = request.targetDatabaseName;
    overrides.databaseMapping = request.databaseMapping;
    overrides.privilegedAuth = request.privilegedAuth;
    return overrides;
}

} // namespace

std::string newExecutionId() {
    Bytes raw = randomBytes(16);
    raw[6] = static_cast<unsigned char>((raw[6] & 0x0F) | 0x40);
    raw[8] = static_cast<unsigned char>((raw[8] & 0x3F) | 0x80);
    std::string hex = toHex(raw);
    return fmt::format("{}-{}-{}-{}-{}", hex.substr(0, 8), hex.substr(8, 4), hex.substr(12, 4),
                       hex.substr(16, 4), hex.substr(20));
}

RestoreOrchestrator::RestoreOrchestrator(const RestoreConfig& config, const AdapterRegistry& registry,
                                         ExecutionStore& store, const ServiceLog& serviceLog, RestoreNotifier* notifier)
    : config_(config), registry_(registry), store_(store), serviceLog_(serviceLog), notifier_(notifier),
      pool_(config.workers) {
    std::error_code ec;
    fs::create_directories(config_.scratchDir, ec);
    if (ec) {
        serviceLog_.logWarning(fmt::format("Cannot create scratch directory {}: {}", config_.scratchDir, ec.message()));
    }
}

RestoreOrchestrator::~RestoreOrchestrator() = default;

std::optional<BackupMetadata> RestoreOrchestrator::readSidecar(StorageAdapter& storage, const Json::Value& storageParams,
                                                               const std::string& file) const {
    SidecarReader* reader = storage.sidecarReader();
    if (!reader) {
        return std::nullopt;
    }
    std::optional<std::string> content = reader->read(storageParams, sidecarPath(file));
    if (!content) {
        return std::nullopt;
    }
    auto metadata = BackupMetadata::parse(*content);
    if (!metadata) {
        serviceLog_.logWarning(fmt::format("Ignoring unreadable sidecar for {}: {}", file, metadata.error()));
        return std::nullopt;
    }
    return *metadata;
}

std::expected<std::string, RestoreError> RestoreOrchestrator::startRestore(const RestoreRequest& request) {
    if (request.storageConfigId.empty()) {
        return restoreFailure(ErrorKind::Configuration, "Missing storageConfigId");
    }
    if (request.file.empty() || request.targetSourceId.empty()) {
        return restoreFailure(ErrorKind::Configuration, "Missing file or targetSourceId");
    }

    auto storageConfig = config_.findAdapterConfig(request.storageConfigId, AdapterKind::Storage);
    if (!storageConfig) {
        return std::unexpected(storageConfig.error());
    }
    auto storage = registry_.storage(storageConfig->adapterId);
    if (!storage) {
        return std::unexpected(storage.error());
    }
    auto targetConfig = config_.findAdapterConfig(request.targetSourceId, AdapterKind::Database);
    if (!targetConfig) {
        return std::unexpected(targetConfig.error());
    }
    auto database = registry_.database(targetConfig->adapterId);
    if (!database) {
        return std::unexpected(database.error());
    }

    auto storageParams = config_.connectionParameters(*storageConfig);
    if (!storageParams) {
        return std::unexpected(storageParams.error());
    }
    auto databaseParams = config_.connectionParameters(*targetConfig);
    if (!databaseParams) {
        return std::unexpected(databaseParams.error());
    }

    auto job = std::make_shared<Job>();
    job->request = request;
    job->storage = *storage;
    job->database = *database;
    job->storageParams = *storageParams;
    job->databaseConfig = DatabaseConfig::fromJson(*databaseParams);
    job->targetName = targetConfig->name.empty() ? targetConfig->id : targetConfig->name;
    job->sidecar = readSidecar(*job->storage, job->storageParams, request.file);

    CompatibilityGuard guard(config_.editionSensitiveEngines);
    if (auto compatible = guard.check(job->sidecar, *job->database, job->databaseConfig); !compatible) {
        serviceLog_.logWarning(fmt::format("Restore of {} rejected: {}", request.file, compatible.error().message));
        return std::unexpected(compatible.error());
    }

    if (RestorePreflight* preflight = job->database->preflight()) {
        std::vector<std::string> targets = preflightTargets(request, job->sidecar, job->databaseConfig);
        if (!targets.empty()) {
            auto preview = job->databaseConfig.withOverrides(overridesFor(request));
            if (!preview) {
                return restoreFailure(ErrorKind::Internal, preview.error());
            }
            if (auto allowed = preflight->prepareRestore(*preview, targets); !allowed) {
                serviceLog_.logWarning(fmt::format("Restore of {} rejected: {}", request.file, allowed.error()));
                return restoreFailure(ErrorKind::Preflight, allowed.error());
            }
        }
    }

    Execution execution;
    execution.id = newExecutionId();
    execution.path = request.file;
    execution.startedAt = isoTimestamp();
    job->startedAt = std::chrono::steady_clock::now();

    auto tracker = std::make_shared<ExecutionTracker>(std::move(execution), store_, &serviceLog_);
    std::string id = tracker->id();
    tracker->log(fmt::format("Starting restore for {}", request.file));

    std::lock_guard<std::mutex> lock(mutex_);
    trackers_[id] = tracker;
    running_[id] = pool_.submit([this, job, tracker] { run(*job, *tracker); }).share();
    serviceLog_.logMessage(fmt::format("Restore {} started: {} -> {}", id, request.file, job->targetName));
    return id;
}

void RestoreOrchestrator::run(const Job& job, ExecutionTracker& tracker) {
    std::optional<std::string> error;
    {
        ScratchFiles scratch(config_.scratchDir, tracker.id(), fs::path(job.request.file).filename().string());
        try {
            auto result = pipeline(job, tracker, scratch);
            if (!result) {
                error = result.error().message;
                serviceLog_.logError(fmt::format("Restore {} failed ({}): {}", tracker.id(),
                                                 errorKindName(result.error().kind), result.error().message));
            }
        } catch (const std::exception& e) {
            error = fmt::format("Unexpected error: {}", e.what());
            serviceLog_.logError(fmt::format("Restore {} failed ({}): {}", tracker.id(),
                                             errorKindName(ErrorKind::Internal), e.what()));
        }

        for (const auto& leftover : scratch.cleanup()) {
            tracker.log(fmt::format("Failed to remove scratch file {}", leftover), LogLevel::Warning);
        }
    }

    if (error) {
        tracker.fail(*error);
    } else {
        tracker.complete("Restore completed successfully");
        serviceLog_.logMessage(fmt::format("Restore {} completed", tracker.id()));
    }
    notify(job, tracker.snapshot(), error);

    // The store holds the terminal record from here on.
    std::lock_guard<std::mutex> lock(mutex_);
    trackers_.erase(tracker.id());
    running_.erase(tracker.id());
}

std::expected<void, RestoreError> RestoreOrchestrator::pipeline(const Job& job, ExecutionTracker& tracker,
                                                                ScratchFiles& scratch) {
    const RestoreRequest& request = job.request;
    auto relayProgress = [&tracker](int percent) { tracker.setProgress(percent); };
    auto relayLog = [&tracker](const std::string& line) {
        tracker.log(line, classifyLogLine(line), LogType::Command);
    };

    tracker.setStage(RestoreStage::Downloading);
    std::string current = scratch.path();
    tracker.log(fmt::format("Downloading {} via {}", request.file, job.storage->name()), LogLevel::Info, LogType::Storage);
    auto downloaded = job.storage->download(job.storageParams, request.file, current, relayProgress);
    if (!downloaded) {
        return restoreFailure(ErrorKind::Transfer, fmt::format("Failed to download file from storage: {}", downloaded.error()));
    }
    tracker.log("Download complete", LogLevel::Success, LogType::Storage);

    BackupMetadata metadata;
    if (job.sidecar) {
        metadata = withExtensionFallback(*job.sidecar, request.file);
    } else {
        metadata = inferFromExtension(request.file);
        tracker.log("No sidecar metadata found, using the file extension", LogLevel::Warning);
    }

    if (metadata.encryption.enabled) {
        auto params = gcmParameters(metadata.encryption);
        if (!params) {
            return std::unexpected(params.error());
        }
        tracker.setStage(RestoreStage::Decrypting);

        EncryptionProfiles keyring = config_.encryptionKeyring();
        std::optional<Bytes> key;
        if (metadata.encryption.profileId) {
            auto resolved = keyring.keyFor(*metadata.encryption.profileId);
            if (resolved) {
                key = std::move(*resolved);
            } else {
                tracker.log(fmt::format("{}. Trying smart key recovery", resolved.error().message), LogLevel::Warning);
            }
        }
        if (!key) {
            SmartKeyRecovery recovery(keyring, config_.recovery);
            auto recovered = recovery.recover(current, *params, metadata.compression,
                                              [&tracker](const std::string& message) { tracker.log(message); });
            if (!recovered) {
                return std::unexpected(recovered.error());
            }
            tracker.log(fmt::format("Recovered key from profile {}", recovered->profileId), LogLevel::Success);
            key = std::move(recovered->key);
        }

        std::string plain = scratch.path(".dec");
        if (auto decrypted = decryptFile(*key, *params, current, plain); !decrypted) {
            return restoreFailure(ErrorKind::Crypto, decrypted.error());
        }
        removeScratchPath(current);
        current = plain;
        tracker.log("Decryption complete", LogLevel::Success);
    }

    if (metadata.compression != Compression::None) {
        tracker.setStage(RestoreStage::Decompressing);
        std::string raw = scratch.path(".raw");
        if (auto inflated = decompressFile(metadata.compression, current, raw); !inflated) {
            return restoreFailure(ErrorKind::Compression, inflated.error());
        }
        removeScratchPath(current);
        current = raw;
        tracker.log(fmt::format("Decompressed {} stream", compressionName(metadata.compression)), LogLevel::Success);
    }

    tracker.setStage(RestoreStage::RestoringDatabase);
    RestoreOverrides overrides = overridesFor(request);
    ConnectionTest probe = job.database->test(job.databaseConfig);
    if (probe.success) {
        overrides.detectedVersion = probe.version;
        if (probe.version) {
            tracker.log(fmt::format("Target server version {}", *probe.version));
        }
    } else {
        tracker.log(fmt::format("Could not probe target server version: {}", probe.message), LogLevel::Warning);
    }
    auto config = job.databaseConfig.withOverrides(std::move(overrides));
    if (!config) {
        return restoreFailure(ErrorKind::Internal, config.error());
    }

    if (job.database->singleDatabaseRestore() && isMultiDbArchive(current)) {
        tracker.log("Multi-database archive detected");
        MultiDbArchiveHandler handler(config_.scratchDir);
        auto report = handler.restore(current, fmt::format("restore-{}-extract", tracker.id()), *config,
                                      *job.database, relayLog, relayProgress);
        if (!report) {
            return std::unexpected(report.error());
        }
        tracker.log(fmt::format("Restored {} database(s), skipped {}", report->restored, report->skipped),
                    LogLevel::Success);
        return {};
    }

    tracker.log(fmt::format("Restoring into {} ({})", job.targetName, job.database->name()));
    AdapterRestoreResult result = job.database->restore(*config, current, relayLog, relayProgress);
    if (!result.success) {
        return restoreFailure(ErrorKind::AdapterRestore, result.error.value_or("Restore failed"));
    }
    return {};
}

void RestoreOrchestrator::notify(const Job& job, const Execution& execution, const std::optional<std::string>& error) {
    if (!notifier_) {
        return;
    }
    RestoreEvent event;
    event.type = error ? RestoreEventType::RestoreFailure : RestoreEventType::RestoreComplete;
    event.executionId = execution.id;
    event.sourceName = job.request.file;
    event.targetDatabase = job.request.targetDatabaseName && !job.request.targetDatabaseName->empty()
        ? *job.request.targetDatabaseName : job.targetName;
    event.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - job.startedAt).count();
    event.error = error;
    event.timestamp = execution.endedAt.value_or(isoTimestamp());
    notifier_->dispatch(event);
}

std::optional<Execution> RestoreOrchestrator::wait(const std::string& executionId) {
    std::shared_future<void> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = running_.find(executionId);
        if (it != running_.end()) {
            pending = it->second;
        }
    }
    if (pending.valid()) {
        pending.wait();
    }
    return status(executionId);
}

std::optional<Execution> RestoreOrchestrator::status(const std::string& executionId) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = trackers_.find(executionId);
        if (it != trackers_.end()) {
            return it->second->snapshot();
        }
    }
    return store_.load(executionId);
}

std::size_t RestoreOrchestrator::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trackers_.size();
}
