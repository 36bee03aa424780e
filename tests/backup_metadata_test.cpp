#include "backup_metadata.hpp"

#include <gtest/gtest.h>

TEST(BackupMetadataTest, ParsesNestedEncryptionBlock) {
    auto meta = BackupMetadata::parse(R"({
        "sourceType": "mysql",
        "sourceName": "Production MySQL",
        "jobName": "nightly",
        "engineVersion": "8.0.35",
        "databases": {"count": 2, "names": ["shop", "crm"]},
        "compression": "GZIP",
        "encryption": {
            "enabled": true,
            "profileId": "profile-1",
            "iv": "000102030405060708090a0b",
            "authTag": "00112233445566778899aabbccddeeff"
        }
    })");
    ASSERT_TRUE(meta.has_value()) << meta.error();

    EXPECT_EQ(meta->sourceType, "mysql");
    EXPECT_EQ(meta->engineVersion, "8.0.35");
    EXPECT_EQ(meta->databaseCount, 2u);
    EXPECT_EQ(meta->databaseNames, (std::vector<std::string>{"shop", "crm"}));
    EXPECT_EQ(meta->compression, Compression::Gzip);
    EXPECT_TRUE(meta->encryption.enabled);
    EXPECT_EQ(meta->encryption.profileId, "profile-1");
    EXPECT_FALSE(meta->locked);
}

TEST(BackupMetadataTest, ParsesFlatEncryptionFields) {
    auto meta = BackupMetadata::parse(R"({
        "sourceType": "postgres",
        "databases": 1,
        "compression": "brotli",
        "iv": "000102030405060708090a0b",
        "authTag": "00112233445566778899aabbccddeeff",
        "encryptionProfileId": "legacy"
    })");
    ASSERT_TRUE(meta.has_value()) << meta.error();

    EXPECT_EQ(meta->databaseCount, 1u);
    EXPECT_EQ(meta->compression, Compression::Brotli);
    EXPECT_TRUE(meta->encryption.enabled);
    EXPECT_EQ(meta->encryption.profileId, "legacy");
    EXPECT_EQ(meta->encryption.iv, "000102030405060708090a0b");
}

TEST(BackupMetadataTest, FlatLayoutWithoutIvIsUnencrypted) {
    auto meta = BackupMetadata::parse(R"({"sourceType": "mysql", "encryption": "NONE"})");
    ASSERT_TRUE(meta.has_value());
    EXPECT_FALSE(meta->encryption.enabled);
    EXPECT_EQ(meta->compression, Compression::None);
}

TEST(BackupMetadataTest, RejectsUnknownCompressionAndInvalidJson) {
    EXPECT_FALSE(BackupMetadata::parse(R"({"compression": "LZMA"})").has_value());
    EXPECT_FALSE(BackupMetadata::parse("{not json").has_value());
    EXPECT_FALSE(BackupMetadata::parse("[1, 2]").has_value());
}

TEST(BackupMetadataTest, SerializesNestedLayout) {
    BackupMetadata meta;
    meta.sourceType = "mysql";
    meta.compression = Compression::Gzip;
    meta.encryption.enabled = true;
    meta.encryption.iv = "aa";
    meta.encryption.authTag = "bb";

    Json::Value json = meta.toJson();
    EXPECT_EQ(json["compression"].asString(), "GZIP");
    EXPECT_TRUE(json["encryption"]["enabled"].asBool());
    EXPECT_EQ(json["encryption"]["iv"].asString(), "aa");
    EXPECT_FALSE(json.isMember("iv"));
}

TEST(SidecarTest, PathAndExtensionInference) {
    EXPECT_EQ(sidecarPath("backups/x.sql.gz.enc"), "backups/x.sql.gz.enc.meta.json");

    BackupMetadata guessed = inferFromExtension("backups/x.json.gz.enc");
    EXPECT_TRUE(guessed.encryption.enabled);
    EXPECT_EQ(guessed.compression, Compression::Gzip);
    EXPECT_FALSE(guessed.encryption.iv.has_value());

    BackupMetadata plain = inferFromExtension("backups/x.sql.br");
    EXPECT_FALSE(plain.encryption.enabled);
    EXPECT_EQ(plain.compression, Compression::Brotli);
}

TEST(SidecarTest, PartialSidecarIsCompletedFromTheExtension) {
    auto partial = BackupMetadata::parse(R"({"sourceType":"mysql","engineVersion":"8.0.35"})");
    ASSERT_TRUE(partial.has_value());
    EXPECT_FALSE(partial->compressionRecorded);

    BackupMetadata merged = withExtensionFallback(*partial, "dump.sql.gz.enc");
    EXPECT_TRUE(merged.encryption.enabled);
    EXPECT_EQ(merged.compression, Compression::Gzip);
    EXPECT_EQ(merged.sourceType, "mysql");
    EXPECT_FALSE(gcmParameters(merged.encryption).has_value());
}

TEST(SidecarTest, RecordedCompressionWinsOverTheExtension) {
    auto recorded = BackupMetadata::parse(R"({"sourceType":"mysql","compression":"NONE"})");
    ASSERT_TRUE(recorded.has_value());
    EXPECT_EQ(withExtensionFallback(*recorded, "dump.sql.gz").compression, Compression::None);

    auto brotli = BackupMetadata::parse(R"({"compression":"BROTLI"})");
    ASSERT_TRUE(brotli.has_value());
    EXPECT_EQ(withExtensionFallback(*brotli, "dump.sql").compression, Compression::Brotli);
}

TEST(SidecarTest, MissingIvOrTagIsACryptoError) {
    EncryptionInfo info;
    info.enabled = true;
    info.iv = "000102030405060708090a0b";

    auto params = gcmParameters(info);
    ASSERT_FALSE(params.has_value());
    EXPECT_EQ(params.error().kind, ErrorKind::Crypto);
    EXPECT_NE(params.error().message.find("metadata missing"), std::string::npos);
}

TEST(SidecarTest, TagMustBeSixteenBytes) {
    EncryptionInfo info;
    info.enabled = true;
    info.iv = "000102030405060708090a0b";
    info.authTag = "0011";
    EXPECT_FALSE(gcmParameters(info).has_value());

    info.authTag = "00112233445566778899aabbccddeeff";
    auto params = gcmParameters(info);
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->iv.size(), 12u);
}
