#include "key_recovery.hpp"

#include <gtest/gtest.h>

#include "test_support.hpp"

using testing_support::TempDir;
using testing_support::writeFile;

namespace {

EncryptionProfile profile(const std::string& id, const Bytes& key, const std::string& createdAt) {
    return EncryptionProfile{id, "Profile " + id, toHex(key), createdAt};
}

std::string dumpText() {
    std::string text = "-- MySQL dump 10.13  Distrib 8.0.35\n";
    for (int i = 0; i < 200; ++i) {
        text += fmt::format("INSERT INTO `users` VALUES ({},'user{}@example.com');\n", i, i);
    }
    return text;
}

} // namespace

TEST(PlaintextHeuristicTest, PrintableRatio) {
    EXPECT_DOUBLE_EQ(printableRatio(Bytes{}), 0.0);
    std::string text = "SELECT 1;\n\t";
    EXPECT_DOUBLE_EQ(printableRatio(Bytes(text.begin(), text.end())), 1.0);
    EXPECT_DOUBLE_EQ(printableRatio(Bytes{0x00, 0x01, 'a', 'b'}), 0.5);
}

TEST(PlaintextHeuristicTest, ThresholdIsStrict) {
    RecoveryThresholds thresholds;
    thresholds.printableRatio = 0.5;
    EXPECT_FALSE(plausiblePlaintext(Bytes{0x00, 0x01, 'a', 'b'}, Compression::None, thresholds));
    EXPECT_TRUE(plausiblePlaintext(Bytes{0x00, 'a', 'b', 'c'}, Compression::None, thresholds));
}

TEST(EncryptionProfilesTest, RecoveryOrderIsNewestFirstThenById) {
    Bytes key = randomBytes(kAesKeySize);
    EncryptionProfiles keyring({profile("b", key, "2024-01-01T00:00:00Z"),
                                profile("a", key, "2024-01-01T00:00:00Z"),
                                profile("c", key, "2025-06-01T00:00:00Z")},
                               std::nullopt);
    auto order = keyring.recoveryOrder();
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0]->id, "c");
    EXPECT_EQ(order[1]->id, "a");
    EXPECT_EQ(order[2]->id, "b");
}

TEST(EncryptionProfilesTest, KeyForReportsUnknownAndBrokenProfiles) {
    EncryptionProfiles keyring({EncryptionProfile{"short", "Short", "abcd", ""}}, std::nullopt);

    auto unknown = keyring.keyFor("missing");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().kind, ErrorKind::Configuration);

    auto broken = keyring.keyFor("short");
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error().kind, ErrorKind::Crypto);
}

TEST(EncryptionProfilesTest, UnwrapsKeysWithTheSystemCipher) {
    auto systemCipher = SecretCipher::fromHexKey(toHex(randomBytes(kAesKeySize)));
    ASSERT_TRUE(systemCipher.has_value());
    Bytes key = randomBytes(kAesKeySize);

    EncryptionProfiles keyring({EncryptionProfile{"p1", "P1", systemCipher->encrypt(toHex(key)), ""}}, *systemCipher);
    auto resolved = keyring.keyFor("p1");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, key);
}

class SmartKeyRecoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        rightKey_ = randomBytes(kAesKeySize);
        wrongKey_ = randomBytes(kAesKeySize);
    }

    Bytes rightKey_;
    Bytes wrongKey_;
    TempDir dir_;
};

TEST_F(SmartKeyRecoveryTest, FindsTheProfileThatDecryptsPlainDumps) {
    writeFile(dir_.file("dump.sql"), dumpText());
    auto params = encryptFile(rightKey_, randomBytes(16), dir_.file("dump.sql"), dir_.file("dump.sql.enc"));
    ASSERT_TRUE(params.has_value());

    EncryptionProfiles keyring({profile("newest-wrong", wrongKey_, "2025-01-01T00:00:00Z"),
                                profile("older-right", rightKey_, "2023-01-01T00:00:00Z")},
                               std::nullopt);
    std::vector<std::string> logs;
    SmartKeyRecovery recovery(keyring);
    auto recovered = recovery.recover(dir_.file("dump.sql.enc"), *params, Compression::None,
                                      [&logs](const std::string& line) { logs.push_back(line); });

    ASSERT_TRUE(recovered.has_value()) << recovered.error().message;
    EXPECT_EQ(recovered->profileId, "older-right");
    EXPECT_EQ(recovered->key, rightKey_);
    EXPECT_FALSE(logs.empty());
}

TEST_F(SmartKeyRecoveryTest, FindsTheProfileForCompressedDumps) {
    writeFile(dir_.file("dump.sql"), dumpText());
    ASSERT_TRUE(compressFile(Compression::Gzip, dir_.file("dump.sql"), dir_.file("dump.sql.gz")).has_value());
    auto params = encryptFile(rightKey_, randomBytes(16), dir_.file("dump.sql.gz"), dir_.file("dump.sql.gz.enc"));
    ASSERT_TRUE(params.has_value());

    EncryptionProfiles keyring({profile("wrong", wrongKey_, "2025-01-01T00:00:00Z"),
                                profile("right", rightKey_, "2024-01-01T00:00:00Z")},
                               std::nullopt);
    auto recovered = SmartKeyRecovery(keyring).recover(dir_.file("dump.sql.gz.enc"), *params, Compression::Gzip);
    ASSERT_TRUE(recovered.has_value()) << recovered.error().message;
    EXPECT_EQ(recovered->profileId, "right");
}

TEST_F(SmartKeyRecoveryTest, SkipsUnderivableProfiles) {
    writeFile(dir_.file("dump.sql"), dumpText());
    auto params = encryptFile(rightKey_, randomBytes(16), dir_.file("dump.sql"), dir_.file("dump.sql.enc"));
    ASSERT_TRUE(params.has_value());

    EncryptionProfiles keyring({EncryptionProfile{"broken", "Broken", "not-hex", "2026-01-01T00:00:00Z"},
                                profile("right", rightKey_, "2020-01-01T00:00:00Z")},
                               std::nullopt);
    auto recovered = SmartKeyRecovery(keyring).recover(dir_.file("dump.sql.enc"), *params, Compression::None);
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(recovered->profileId, "right");
}

TEST_F(SmartKeyRecoveryTest, FailsWhenNoProfileMatches) {
    writeFile(dir_.file("dump.sql"), dumpText());
    auto params = encryptFile(rightKey_, randomBytes(16), dir_.file("dump.sql"), dir_.file("dump.sql.enc"));
    ASSERT_TRUE(params.has_value());

    EncryptionProfiles keyring({profile("wrong", wrongKey_, "2025-01-01T00:00:00Z")}, std::nullopt);
    auto recovered = SmartKeyRecovery(keyring).recover(dir_.file("dump.sql.enc"), *params, Compression::None);
    ASSERT_FALSE(recovered.has_value());
    EXPECT_EQ(recovered.error().kind, ErrorKind::Crypto);
    EXPECT_EQ(recovered.error().message, "No candidate profile decrypts this backup");
}
