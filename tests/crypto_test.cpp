#include "crypto.hpp"

#include <algorithm>
#include <filesystem>

#include <gtest/gtest.h>

#include "test_support.hpp"

using testing_support::TempDir;
using testing_support::readFile;
using testing_support::writeFile;

namespace {

const std::string kSystemKeyHex = "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff";

} // namespace

TEST(HexTest, DecodesAndEncodes) {
    auto bytes = fromHex("00ff10Ab");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, (Bytes{0x00, 0xff, 0x10, 0xab}));
    EXPECT_EQ(toHex(*bytes), "00ff10ab");
}

TEST(HexTest, RejectsOddLengthAndBadDigits) {
    EXPECT_FALSE(fromHex("abc").has_value());
    EXPECT_FALSE(fromHex("zz").has_value());
}

TEST(FileCipherTest, DecryptsWhatWasEncrypted) {
    TempDir dir;
    std::string plain = dir.file("dump.sql");
    std::string sealed = dir.file("dump.sql.enc");
    std::string opened = dir.file("dump.out");
    std::string payload(200000, 'x');
    payload += "CREATE TABLE t (id INT);\n";
    writeFile(plain, payload);

    Bytes key = randomBytes(kAesKeySize);
    auto params = encryptFile(key, randomBytes(16), plain, sealed);
    ASSERT_TRUE(params.has_value()) << params.error();
    EXPECT_EQ(params->authTag.size(), kGcmTagSize);

    auto result = decryptFile(key, *params, sealed, opened);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(readFile(opened), payload);
}

TEST(FileCipherTest, WrongKeyFailsAuthenticationAndLeavesNoOutput) {
    TempDir dir;
    std::string plain = dir.file("dump.sql");
    std::string sealed = dir.file("dump.sql.enc");
    std::string opened = dir.file("dump.out");
    writeFile(plain, "SELECT 1;\n");

    auto params = encryptFile(randomBytes(kAesKeySize), randomBytes(16), plain, sealed);
    ASSERT_TRUE(params.has_value());

    auto result = decryptFile(randomBytes(kAesKeySize), *params, sealed, opened);
    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(std::filesystem::exists(opened));
}

TEST(FileCipherTest, PrefixDecryptionMatchesPlaintextStart) {
    TempDir dir;
    std::string plain = dir.file("dump.sql");
    std::string sealed = dir.file("dump.sql.enc");
    writeFile(plain, "-- MySQL dump 10.13\nCREATE DATABASE shop;\n");

    Bytes key = randomBytes(kAesKeySize);
    auto params = encryptFile(key, randomBytes(16), plain, sealed);
    ASSERT_TRUE(params.has_value());

    std::string ciphertext = readFile(sealed);
    Bytes prefix(ciphertext.begin(), ciphertext.begin() + 10);
    auto candidate = decryptPrefix(key, *params, prefix);
    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(std::string(candidate->begin(), candidate->end()), "-- MySQL d");
}

TEST(SecretCipherTest, RoundTripsSecrets) {
    auto cipher = SecretCipher::fromHexKey(kSystemKeyHex);
    ASSERT_TRUE(cipher.has_value());

    std::string wrapped = cipher->encrypt("s3cr3t");
    EXPECT_NE(wrapped, "s3cr3t");
    EXPECT_EQ(std::count(wrapped.begin(), wrapped.end(), ':'), 2);

    auto plain = cipher->decrypt(wrapped);
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(*plain, "s3cr3t");
}

TEST(SecretCipherTest, PassesThroughPlainValues) {
    auto cipher = SecretCipher::fromHexKey(kSystemKeyHex);
    ASSERT_TRUE(cipher.has_value());

    EXPECT_EQ(cipher->decrypt("plain-password").value(), "plain-password");
    EXPECT_EQ(cipher->decrypt("a:b").value(), "a:b");
    EXPECT_EQ(cipher->decrypt("").value(), "");
}

TEST(SecretCipherTest, TamperedSecretIsAnError) {
    auto cipher = SecretCipher::fromHexKey(kSystemKeyHex);
    ASSERT_TRUE(cipher.has_value());

    std::string wrapped = cipher->encrypt("s3cr3t");
    wrapped.back() = wrapped.back() == '0' ? '1' : '0';
    EXPECT_FALSE(cipher->decrypt(wrapped).has_value());
}

TEST(SecretCipherTest, RejectsShortKeys) {
    EXPECT_FALSE(SecretCipher::fromHexKey("0011").has_value());
}

TEST(SecretCipherTest, ConfigEncryptionTouchesOnlySensitiveFields) {
    auto cipher = SecretCipher::fromHexKey(kSystemKeyHex);
    ASSERT_TRUE(cipher.has_value());

    Json::Value config;
    config["host"] = "db.internal";
    config["password"] = "hunter2";
    config["nested"]["privateKey"] = "-----BEGIN KEY-----";

    Json::Value wrapped = cipher->encryptConfig(config);
    EXPECT_EQ(wrapped["host"].asString(), "db.internal");
    EXPECT_NE(wrapped["password"].asString(), "hunter2");
    EXPECT_NE(wrapped["nested"]["privateKey"].asString(), "-----BEGIN KEY-----");

    auto unwrapped = cipher->decryptConfig(wrapped);
    ASSERT_TRUE(unwrapped.has_value());
    EXPECT_EQ(*unwrapped, config);
}

TEST(SecretCipherTest, SensitiveKeyNames) {
    EXPECT_TRUE(isSensitiveKey("password"));
    EXPECT_TRUE(isSensitiveKey("passphrase"));
    EXPECT_FALSE(isSensitiveKey("host"));
}
