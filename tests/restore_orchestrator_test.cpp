#include "multi_db_archive.hpp"
#include "restore_api.hpp"
#include "storage_adapters.hpp"

#include <algorithm>
#include <cstdlib>
#include <tuple>

#include <gtest/gtest.h>

#include "test_support.hpp"

using testing_support::FakeDatabaseAdapter;
using testing_support::TempDir;
using testing_support::writeFile;

namespace {

const std::string kDump =
    "-- MySQL dump 10.13\n"
    "CREATE TABLE `orders` (`id` int);\n"
    "INSERT INTO `orders` VALUES (1),(2),(3);\n";

bool hasLog(const Execution& execution, const std::string& fragment) {
    return std::ranges::any_of(execution.logs, [&fragment](const LogEntry& entry) {
        return entry.message.find(fragment) != std::string::npos;
    });
}

} // namespace

class RestoreOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("ENCRYPTION_KEY");
        key_ = randomBytes(kAesKeySize);
        database_ = std::make_shared<FakeDatabaseAdapter>("mysql");
    }

    Json::Value configJson() const {
        Json::Value root(Json::objectValue);
        root["scratch_dir"] = dir_.file("scratch");
        root["executions_dir"] = dir_.file("executions");
        root["log_file"] = dir_.file("logs/service.log");
        root["error_log_file"] = dir_.file("logs/errors.log");

        Json::Value storage(Json::objectValue);
        storage["id"] = "backups";
        storage["type"] = "storage";
        storage["adapter"] = "local-filesystem";
        storage["config"]["basePath"] = dir_.file("storage");
        root["adapters"].append(storage);

        Json::Value target(Json::objectValue);
        target["id"] = "target";
        target["type"] = "database";
        target["adapter"] = "mysql";
        target["name"] = "Staging MySQL";
        target["config"]["user"] = "app";
        target["config"]["database"] = "shop";
        root["adapters"].append(target);

        for (const auto& [id, key, createdAt] : profiles_) {
            Json::Value profile(Json::objectValue);
            profile["id"] = id;
            profile["secret_key"] = toHex(key);
            profile["created_at"] = createdAt;
            root["encryption_profiles"].append(profile);
        }
        return root;
    }

    RestoreAPI& api() {
        if (!api_) {
            AdapterRegistry registry({std::make_shared<LocalStorageAdapter>()}, {database_});
            api_ = std::make_unique<RestoreAPI>(RestoreConfig(configJson()), std::move(registry),
                                                std::make_unique<MemoryExecutionStore>());
        }
        return *api_;
    }

    // Writes kDump gzipped and encrypted under storage/<name>, returns the GCM parameters.
    GcmParameters storeEncryptedBackup(const std::string& name) {
        writeFile(dir_.file("work/dump.sql"), kDump);
        EXPECT_TRUE(compressFile(Compression::Gzip, dir_.file("work/dump.sql"), dir_.file("work/dump.sql.gz")).has_value());
        std::filesystem::create_directories(dir_.file("storage"));
        auto params = encryptFile(key_, randomBytes(12), dir_.file("work/dump.sql.gz"), dir_.file("storage/" + name));
        EXPECT_TRUE(params.has_value());
        return *params;
    }

    void writeSidecar(const std::string& name, const Json::Value& sidecar) {
        Json::StreamWriterBuilder builder;
        writeFile(dir_.file("storage/" + name + ".meta.json"), Json::writeString(builder, sidecar));
    }

    Json::Value encryptedSidecar(const GcmParameters& params, const std::string& profileId) const {
        Json::Value sidecar(Json::objectValue);
        sidecar["sourceType"] = "mysql";
        sidecar["engineVersion"] = "8.0.35";
        sidecar["compression"] = "GZIP";
        sidecar["encryption"]["enabled"] = true;
        sidecar["encryption"]["profileId"] = profileId;
        sidecar["encryption"]["iv"] = toHex(params.iv);
        sidecar["encryption"]["authTag"] = toHex(params.authTag);
        return sidecar;
    }

    RestoreRequest request(const std::string& file) const {
        RestoreRequest req;
        req.storageConfigId = "backups";
        req.file = file;
        req.targetSourceId = "target";
        return req;
    }

    std::size_t scratchEntries() const {
        std::error_code ec;
        if (!std::filesystem::exists(dir_.file("scratch"), ec)) {
            return 0;
        }
        return static_cast<std::size_t>(std::distance(std::filesystem::directory_iterator(dir_.file("scratch")),
                                                      std::filesystem::directory_iterator()));
    }

    Execution runToEnd(const RestoreRequest& req) {
        auto id = api().startRestore(req);
        EXPECT_TRUE(id.has_value()) << (id ? "" : id.error().message);
        if (!id) {
            return Execution{};
        }
        auto finished = api().wait(*id);
        EXPECT_TRUE(finished.has_value());
        return finished.value_or(Execution{});
    }

    TempDir dir_;
    Bytes key_;
    std::vector<std::tuple<std::string, Bytes, std::string>> profiles_;
    std::shared_ptr<FakeDatabaseAdapter> database_;
    std::unique_ptr<RestoreAPI> api_;
};

TEST_F(RestoreOrchestratorTest, DecryptsDecompressesAndRestores) {
    profiles_.emplace_back("p1", key_, "2024-01-01T00:00:00Z");
    GcmParameters params = storeEncryptedBackup("x.json.gz.enc");
    writeSidecar("x.json.gz.enc", encryptedSidecar(params, "p1"));

    Execution execution = runToEnd(request("x.json.gz.enc"));
    EXPECT_EQ(execution.status, ExecutionStatus::Success);
    EXPECT_EQ(execution.stage, RestoreStage::Completed);
    EXPECT_EQ(execution.progress, 100);
    EXPECT_TRUE(execution.endedAt.has_value());
    EXPECT_EQ(execution.path, "x.json.gz.enc");

    EXPECT_EQ(database_->restoreCalls, 1);
    EXPECT_EQ(database_->restoredPayload, kDump);
    EXPECT_EQ(database_->preflightDatabases, (std::vector<std::string>{"shop"}));
    EXPECT_EQ(database_->lastConfig.overrides.detectedVersion, "8.0.35");
    EXPECT_TRUE(database_->lastConfig.overridesApplied);

    std::vector<std::string> stages;
    for (const auto& entry : execution.logs) {
        if (stages.empty() || stages.back() != entry.stage) {
            stages.push_back(entry.stage);
        }
    }
    EXPECT_EQ(stages, (std::vector<std::string>{"Initializing", "Downloading", "Decrypting", "Decompressing",
                                                "Restoring Database"}));
    EXPECT_EQ(scratchEntries(), 0u);
}

TEST_F(RestoreOrchestratorTest, MissingAuthTagFailsTheExecution) {
    profiles_.emplace_back("p1", key_, "2024-01-01T00:00:00Z");
    GcmParameters params = storeEncryptedBackup("x.sql.gz.enc");
    Json::Value sidecar = encryptedSidecar(params, "p1");
    sidecar["encryption"].removeMember("authTag");
    writeSidecar("x.sql.gz.enc", sidecar);

    Execution execution = runToEnd(request("x.sql.gz.enc"));
    EXPECT_EQ(execution.status, ExecutionStatus::Failed);
    EXPECT_EQ(execution.stage, RestoreStage::Failed);
    ASSERT_FALSE(execution.logs.empty());
    EXPECT_NE(execution.logs.back().message.find("metadata missing"), std::string::npos);
    EXPECT_EQ(database_->restoreCalls, 0);
    EXPECT_EQ(scratchEntries(), 0u);
}

TEST_F(RestoreOrchestratorTest, EncryptedFileWithoutSidecarFails) {
    profiles_.emplace_back("p1", key_, "2024-01-01T00:00:00Z");
    storeEncryptedBackup("x.sql.gz.enc");

    Execution execution = runToEnd(request("x.sql.gz.enc"));
    EXPECT_EQ(execution.status, ExecutionStatus::Failed);
    EXPECT_TRUE(hasLog(execution, "No sidecar metadata found"));
    EXPECT_NE(execution.logs.back().message.find("metadata missing"), std::string::npos);
}

TEST_F(RestoreOrchestratorTest, PartialSidecarStillHonoursTheEncryptedExtension) {
    profiles_.emplace_back("p1", key_, "2024-01-01T00:00:00Z");
    storeEncryptedBackup("dump.sql.gz.enc");
    Json::Value sidecar(Json::objectValue);
    sidecar["sourceType"] = "mysql";
    sidecar["engineVersion"] = "8.0.35";
    writeSidecar("dump.sql.gz.enc", sidecar);

    Execution execution = runToEnd(request("dump.sql.gz.enc"));
    EXPECT_EQ(execution.status, ExecutionStatus::Failed);
    EXPECT_NE(execution.logs.back().message.find("metadata missing"), std::string::npos);
    EXPECT_EQ(database_->restoreCalls, 0);
    EXPECT_EQ(scratchEntries(), 0u);
}

TEST_F(RestoreOrchestratorTest, PartialSidecarTakesCompressionFromTheExtension) {
    writeFile(dir_.file("work/dump.sql"), kDump);
    std::filesystem::create_directories(dir_.file("storage"));
    ASSERT_TRUE(compressFile(Compression::Gzip, dir_.file("work/dump.sql"), dir_.file("storage/dump.sql.gz")).has_value());
    Json::Value sidecar(Json::objectValue);
    sidecar["sourceType"] = "mysql";
    writeSidecar("dump.sql.gz", sidecar);

    Execution execution = runToEnd(request("dump.sql.gz"));
    EXPECT_EQ(execution.status, ExecutionStatus::Success);
    EXPECT_EQ(database_->restoredPayload, kDump);
}

TEST_F(RestoreOrchestratorTest, RecoversTheKeyOfAStaleProfileReference) {
    profiles_.emplace_back("newest-wrong", randomBytes(kAesKeySize), "2025-06-01T00:00:00Z");
    profiles_.emplace_back("rotated", key_, "2024-01-01T00:00:00Z");
    GcmParameters params = storeEncryptedBackup("x.sql.gz.enc");
    writeSidecar("x.sql.gz.enc", encryptedSidecar(params, "deleted-profile"));

    Execution execution = runToEnd(request("x.sql.gz.enc"));
    EXPECT_EQ(execution.status, ExecutionStatus::Success);
    EXPECT_TRUE(hasLog(execution, "Encryption profile deleted-profile not found"));
    EXPECT_TRUE(hasLog(execution, "Recovered key from profile rotated"));
    EXPECT_EQ(database_->restoredPayload, kDump);
}

TEST_F(RestoreOrchestratorTest, UnrecoverableKeyFailsWithACryptoMessage) {
    profiles_.emplace_back("other", randomBytes(kAesKeySize), "2025-06-01T00:00:00Z");
    GcmParameters params = storeEncryptedBackup("x.sql.gz.enc");
    writeSidecar("x.sql.gz.enc", encryptedSidecar(params, "deleted-profile"));

    Execution execution = runToEnd(request("x.sql.gz.enc"));
    EXPECT_EQ(execution.status, ExecutionStatus::Failed);
    EXPECT_EQ(execution.logs.back().message, "No candidate profile decrypts this backup");
    EXPECT_EQ(database_->restoreCalls, 0);
}

TEST_F(RestoreOrchestratorTest, VendorMismatchIsRejectedBeforeDownload) {
    writeFile(dir_.file("storage/pg.sql"), kDump);
    Json::Value sidecar(Json::objectValue);
    sidecar["sourceType"] = "postgres";
    sidecar["engineVersion"] = "16.2";
    writeSidecar("pg.sql", sidecar);

    auto id = api().startRestore(request("pg.sql"));
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().kind, ErrorKind::Preflight);
    EXPECT_EQ(database_->testCalls, 0);
    EXPECT_EQ(database_->restoreCalls, 0);
    EXPECT_EQ(scratchEntries(), 0u);
}

TEST_F(RestoreOrchestratorTest, DowngradeIsRejectedBeforeRestore) {
    writeFile(dir_.file("storage/new.sql"), kDump);
    Json::Value sidecar(Json::objectValue);
    sidecar["sourceType"] = "mysql";
    sidecar["engineVersion"] = "9.1.0";
    writeSidecar("new.sql", sidecar);

    auto id = api().startRestore(request("new.sql"));
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().kind, ErrorKind::Preflight);
    EXPECT_NE(id.error().message.find("Version mismatch"), std::string::npos);
    EXPECT_EQ(database_->restoreCalls, 0);
}

TEST_F(RestoreOrchestratorTest, PreflightErrorIsReturnedSynchronously) {
    writeFile(dir_.file("storage/plain.sql"), kDump);
    database_->preflightError = "Access denied for user 'app' to database 'shop_copy'";

    RestoreRequest req = request("plain.sql");
    req.targetDatabaseName = "shop_copy";
    auto id = api().startRestore(req);
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().kind, ErrorKind::Preflight);
    EXPECT_EQ(id.error().message, "Access denied for user 'app' to database 'shop_copy'");
    EXPECT_EQ(database_->preflightDatabases, (std::vector<std::string>{"shop_copy"}));
}

TEST_F(RestoreOrchestratorTest, PlainDumpWithoutSidecarUsesTheExtension) {
    writeFile(dir_.file("storage/plain.sql"), kDump);

    RestoreRequest req = request("plain.sql");
    req.privilegedAuth = PrivilegedAuth{"root", "rootpw"};
    Execution execution = runToEnd(req);
    EXPECT_EQ(execution.status, ExecutionStatus::Success);
    EXPECT_TRUE(hasLog(execution, "No sidecar metadata found"));
    EXPECT_EQ(database_->restoredPayload, kDump);
    EXPECT_EQ(database_->lastConfig.user, "root");
}

TEST_F(RestoreOrchestratorTest, EngineErrorsArePassedThrough) {
    writeFile(dir_.file("storage/plain.sql"), kDump);
    database_->outputLines = {"ERROR 1064 (42000) at line 2: You have an error in your SQL syntax"};
    database_->restoreError = "ERROR 1064 (42000) at line 2: You have an error in your SQL syntax";

    Execution execution = runToEnd(request("plain.sql"));
    EXPECT_EQ(execution.status, ExecutionStatus::Failed);
    EXPECT_EQ(execution.logs.back().message, "ERROR 1064 (42000) at line 2: You have an error in your SQL syntax");
    auto commandLine = std::ranges::find(execution.logs, LogType::Command, &LogEntry::type);
    ASSERT_NE(commandLine, execution.logs.end());
    EXPECT_EQ(commandLine->level, LogLevel::Error);
    EXPECT_EQ(scratchEntries(), 0u);
}

TEST_F(RestoreOrchestratorTest, MissingFileIsATransferFailure) {
    Execution execution = runToEnd(request("absent.sql"));
    EXPECT_EQ(execution.status, ExecutionStatus::Failed);
    EXPECT_NE(execution.logs.back().message.find("Failed to download file from storage"), std::string::npos);
}

TEST_F(RestoreOrchestratorTest, UnknownAdapterConfigsAreConfigurationErrors) {
    RestoreRequest req = request("plain.sql");
    req.storageConfigId = "s3-bucket";
    auto id = api().startRestore(req);
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().kind, ErrorKind::Configuration);

    RestoreRequest noTarget = request("plain.sql");
    noTarget.targetSourceId.clear();
    auto missing = api().startRestore(noTarget);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().message, "Missing file or targetSourceId");
}

TEST_F(RestoreOrchestratorTest, ConcurrentRestoresUseSeparateScratchFiles) {
    writeFile(dir_.file("storage/a.sql"), kDump);
    writeFile(dir_.file("storage/b.sql"), kDump);

    auto first = api().startRestore(request("a.sql"));
    auto second = api().startRestore(request("b.sql"));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*first, *second);

    EXPECT_EQ(api().wait(*first)->status, ExecutionStatus::Success);
    EXPECT_EQ(api().wait(*second)->status, ExecutionStatus::Success);
    EXPECT_EQ(database_->restoreCalls, 2);
    EXPECT_EQ(scratchEntries(), 0u);
}

TEST_F(RestoreOrchestratorTest, RestoresSelectedDatabasesOfAnEncryptedArchive) {
    profiles_.emplace_back("p1", key_, "2024-01-01T00:00:00Z");
    writeFile(dir_.file("work/a.sql"), "CREATE TABLE a (id INT);\n");
    writeFile(dir_.file("work/b.sql"), "CREATE TABLE b (id INT);\n");
    auto manifest = createArchive({{dir_.file("work/a.sql"), "a.sql", "a", "sql"},
                                   {dir_.file("work/b.sql"), "b.sql", "b", "sql"}},
                                  dir_.file("work/all.tar"), "mysql", "8.0.35");
    ASSERT_TRUE(manifest.has_value()) << manifest.error();
    ASSERT_TRUE(compressFile(Compression::Gzip, dir_.file("work/all.tar"), dir_.file("work/all.tar.gz")).has_value());
    std::filesystem::create_directories(dir_.file("storage"));
    auto params = encryptFile(key_, randomBytes(12), dir_.file("work/all.tar.gz"), dir_.file("storage/all.tar.gz.enc"));
    ASSERT_TRUE(params.has_value());
    writeSidecar("all.tar.gz.enc", encryptedSidecar(*params, "p1"));

    RestoreRequest req = request("all.tar.gz.enc");
    req.databaseMapping = {{"a", "a2", true}, {"b", "b", false}};
    Execution execution = runToEnd(req);
    EXPECT_EQ(execution.status, ExecutionStatus::Success);

    ASSERT_EQ(database_->singleRestores.size(), 1u);
    EXPECT_EQ(database_->singleRestores[0].source, "a");
    EXPECT_EQ(database_->singleRestores[0].target, "a2");
    EXPECT_EQ(database_->singleRestores[0].payload, "CREATE TABLE a (id INT);\n");
    EXPECT_EQ(database_->restoreCalls, 0);
    EXPECT_EQ(database_->preflightDatabases, (std::vector<std::string>{"a2"}));
    EXPECT_TRUE(hasLog(execution, "Multi-database archive detected"));
    EXPECT_TRUE(hasLog(execution, "Skipping database: b"));
    EXPECT_EQ(scratchEntries(), 0u);
}

TEST_F(RestoreOrchestratorTest, FinishedRestoresAreServedFromTheStore) {
    writeFile(dir_.file("storage/plain.sql"), kDump);

    auto id = api().startRestore(request("plain.sql"));
    ASSERT_TRUE(id.has_value());
    ASSERT_EQ(api().wait(*id)->status, ExecutionStatus::Success);
    EXPECT_EQ(api().activeRestores(), 0u);

    auto finished = api().status(*id);
    ASSERT_TRUE(finished.has_value());
    EXPECT_EQ(finished->status, ExecutionStatus::Success);
    EXPECT_EQ(finished->progress, 100);
    EXPECT_EQ(api().wait(*id)->status, ExecutionStatus::Success);
}

TEST_F(RestoreOrchestratorTest, StatusOfAnUnknownIdIsEmpty) {
    EXPECT_FALSE(api().status("no-such-execution").has_value());
    EXPECT_FALSE(api().wait("no-such-execution").has_value());
}
