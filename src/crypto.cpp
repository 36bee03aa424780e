#include "crypto.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <fstream>
#include <filesystem>
#include <memory>
#include <array>
#include <algorithm>
#include <stdexcept>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

constexpr std::size_t kChunkSize = 64 * 1024;

constexpr std::array<std::string_view, 12> kSensitiveKeys = {
    "password", "token", "secret", "secretKey", "secretAccessKey", "accessKey",
    "accessKeyId", "apiKey", "webhookUrl", "uri", "passphrase", "privateKey"
};

std::string opensslError(std::string_view what) {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return std::string(what);
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return fmt::format("{} ({})", what, buf);
}

std::expected<CipherContext, std::string> initGcm(bool encrypt, const Bytes& key, const Bytes& iv) {
    if (key.size() != kAesKeySize) {
        return std::unexpected(fmt::format("Invalid key length: {} bytes (expected {})", key.size(), kAesKeySize));
    }
    if (iv.empty()) {
        return std::unexpected("Missing IV");
    }

    CipherContext ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        return std::unexpected("Failed to allocate cipher context");
    }

    int ok = encrypt ? EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr)
                     : EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr);
    if (ok != 1) {
        return std::unexpected(opensslError("Failed to initialize AES-256-GCM"));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1) {
        return std::unexpected(opensslError("Failed to set GCM IV length"));
    }
    ok = encrypt ? EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data())
                 : EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data());
    if (ok != 1) {
        return std::unexpected(opensslError("Failed to set GCM key/IV"));
    }
    return ctx;
}

std::expected<void, std::string> setExpectedTag(EVP_CIPHER_CTX* ctx, const Bytes& authTag) {
    if (authTag.empty() || authTag.size() > kGcmTagSize) {
        return std::unexpected(fmt::format("Invalid authentication tag length: {} bytes", authTag.size()));
    }
    Bytes tag = authTag;
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1) {
        return std::unexpected(opensslError("Failed to set GCM authentication tag"));
    }
    return {};
}

struct SealedSecret {
    Bytes iv;
    Bytes authTag;
    Bytes ciphertext;
};

std::expected<SealedSecret, std::string> sealBuffer(const Bytes& key, const std::string& plaintext) {
    SealedSecret sealed;
    sealed.iv = randomBytes(kSecretIvSize);
    auto ctx = initGcm(true, key, sealed.iv);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }

    sealed.ciphertext.resize(plaintext.size());
    int outLen = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx->get(), sealed.ciphertext.data(), &outLen,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        return std::unexpected(opensslError("Encryption failed"));
    }
    int finalLen = 0;
    if (EVP_EncryptFinal_ex(ctx->get(), sealed.ciphertext.data() + outLen, &finalLen) != 1) {
        return std::unexpected(opensslError("Encryption finalization failed"));
    }
    sealed.ciphertext.resize(static_cast<std::size_t>(outLen + finalLen));

    sealed.authTag.resize(kGcmTagSize);
    if (EVP_CIPHER_CTX_ctrl(ctx->get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kGcmTagSize), sealed.authTag.data()) != 1) {
        return std::unexpected(opensslError("Failed to read GCM authentication tag"));
    }
    return sealed;
}

std::expected<std::string, std::string> openBuffer(const Bytes& key, const SealedSecret& sealed) {
    auto ctx = initGcm(false, key, sealed.iv);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }
    if (auto tagResult = setExpectedTag(ctx->get(), sealed.authTag); !tagResult) {
        return std::unexpected(tagResult.error());
    }

    std::string plaintext(sealed.ciphertext.size(), '\0');
    int outLen = 0;
    if (!sealed.ciphertext.empty() &&
        EVP_DecryptUpdate(ctx->get(), reinterpret_cast<unsigned char*>(plaintext.data()), &outLen,
                          sealed.ciphertext.data(), static_cast<int>(sealed.ciphertext.size())) != 1) {
        return std::unexpected(opensslError("Decryption failed"));
    }
    int finalLen = 0;
    if (EVP_DecryptFinal_ex(ctx->get(), reinterpret_cast<unsigned char*>(plaintext.data()) + outLen, &finalLen) <= 0) {
        return std::unexpected("Authentication failed: wrong key or corrupted data");
    }
    plaintext.resize(static_cast<std::size_t>(outLen + finalLen));
    return plaintext;
}

} // namespace

std::expected<Bytes, std::string> fromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::unexpected(fmt::format("Invalid hex string length: {}", hex.size()));
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::unexpected(fmt::format("Invalid hex character at offset {}", i));
        }
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return out;
}

std::string toHex(const Bytes& bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

Bytes randomBytes(std::size_t n) {
    Bytes out(n);
    if (n > 0 && RAND_bytes(out.data(), static_cast<int>(n)) != 1) {
        throw std::runtime_error(opensslError("Random number generation failed"));
    }
    return out;
}

std::expected<GcmParameters, std::string> encryptFile(const Bytes& key, const Bytes& iv,
                                                      const std::string& inputPath,
                                                      const std::string& outputPath) {
    auto ctx = initGcm(true, key, iv);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }

    std::ifstream in(inputPath, std::ios::binary);
    if (!in) {
        return std::unexpected(fmt::format("Failed to open file for encryption: {}", inputPath));
    }
    std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(fmt::format("Failed to open encryption output: {}", outputPath));
    }

    std::vector<unsigned char> inBuf(kChunkSize);
    std::vector<unsigned char> outBuf(kChunkSize + EVP_MAX_BLOCK_LENGTH);
    while (in) {
        in.read(reinterpret_cast<char*>(inBuf.data()), static_cast<std::streamsize>(inBuf.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) break;
        int outLen = 0;
        if (EVP_EncryptUpdate(ctx->get(), outBuf.data(), &outLen, inBuf.data(), static_cast<int>(got)) != 1) {
            return std::unexpected(opensslError("Encryption failed"));
        }
        out.write(reinterpret_cast<const char*>(outBuf.data()), outLen);
    }

    int finalLen = 0;
    if (EVP_EncryptFinal_ex(ctx->get(), outBuf.data(), &finalLen) != 1) {
        return std::unexpected(opensslError("Encryption finalization failed"));
    }
    out.write(reinterpret_cast<const char*>(outBuf.data()), finalLen);
    out.close();
    if (!out) {
        return std::unexpected(fmt::format("Failed to write encrypted file: {}", outputPath));
    }

    GcmParameters params;
    params.iv = iv;
    params.authTag.resize(kGcmTagSize);
    if (EVP_CIPHER_CTX_ctrl(ctx->get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kGcmTagSize), params.authTag.data()) != 1) {
        return std::unexpected(opensslError("Failed to read GCM authentication tag"));
    }
    return params;
}

std::expected<void, std::string> decryptFile(const Bytes& key, const GcmParameters& params,
                                             const std::string& inputPath,
                                             const std::string& outputPath) {
    auto ctx = initGcm(false, key, params.iv);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }
    if (auto tagResult = setExpectedTag(ctx->get(), params.authTag); !tagResult) {
        return std::unexpected(tagResult.error());
    }

    std::ifstream in(inputPath, std::ios::binary);
    if (!in) {
        return std::unexpected(fmt::format("Failed to open encrypted file: {}", inputPath));
    }
    std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(fmt::format("Failed to open decryption output: {}", outputPath));
    }

    auto discardOutput = [&out, &outputPath]() {
        out.close();
        std::error_code ec;
        fs::remove(outputPath, ec);
    };

    std::vector<unsigned char> inBuf(kChunkSize);
    std::vector<unsigned char> outBuf(kChunkSize + EVP_MAX_BLOCK_LENGTH);
    while (in) {
        in.read(reinterpret_cast<char*>(inBuf.data()), static_cast<std::streamsize>(inBuf.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) break;
        int outLen = 0;
        if (EVP_DecryptUpdate(ctx->get(), outBuf.data(), &outLen, inBuf.data(), static_cast<int>(got)) != 1) {
            discardOutput();
            return std::unexpected(opensslError("Decryption failed"));
        }
        out.write(reinterpret_cast<const char*>(outBuf.data()), outLen);
    }

    int finalLen = 0;
    if (EVP_DecryptFinal_ex(ctx->get(), outBuf.data(), &finalLen) <= 0) {
        discardOutput();
        return std::unexpected("Authentication failed: wrong key or corrupted backup");
    }
    out.write(reinterpret_cast<const char*>(outBuf.data()), finalLen);
    out.close();
    if (!out) {
        return std::unexpected(fmt::format("Failed to write decrypted file: {}", outputPath));
    }
    return {};
}

std::expected<Bytes, std::string> decryptPrefix(const Bytes& key, const GcmParameters& params,
                                                const Bytes& ciphertext) {
    auto ctx = initGcm(false, key, params.iv);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }
    if (auto tagResult = setExpectedTag(ctx->get(), params.authTag); !tagResult) {
        return std::unexpected(tagResult.error());
    }

    Bytes plaintext(ciphertext.size() + EVP_MAX_BLOCK_LENGTH);
    int outLen = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx->get(), plaintext.data(), &outLen, ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
        return std::unexpected(opensslError("Decryption failed"));
    }
    plaintext.resize(static_cast<std::size_t>(outLen));
    return plaintext;
}

SecretCipher::SecretCipher(Bytes key) : key_(std::move(key)) {
    if (key_.size() != kAesKeySize) {
        throw std::runtime_error(fmt::format("System key must be {} bytes, got {}", kAesKeySize, key_.size()));
    }
}

std::expected<SecretCipher, std::string> SecretCipher::fromHexKey(std::string_view hexKey) {
    if (hexKey.size() != kAesKeySize * 2) {
        return std::unexpected("System key must be a 64-character hex string (32 bytes)");
    }
    auto key = fromHex(hexKey);
    if (!key) {
        return std::unexpected(fmt::format("Invalid system key: {}", key.error()));
    }
    return SecretCipher(std::move(*key));
}

std::string SecretCipher::encrypt(const std::string& plaintext) const {
    if (plaintext.empty()) {
        return plaintext;
    }
    auto sealed = sealBuffer(key_, plaintext);
    if (!sealed) {
        throw std::runtime_error(fmt::format("Failed to encrypt secret: {}", sealed.error()));
    }
    return fmt::format("{}:{}:{}", toHex(sealed->iv), toHex(sealed->authTag), toHex(sealed->ciphertext));
}

std::expected<std::string, std::string> SecretCipher::decrypt(const std::string& text) const {
    if (text.empty() || std::ranges::count(text, ':') != 2) {
        return text;
    }

    auto first = text.find(':');
    auto second = text.find(':', first + 1);
    auto iv = fromHex(std::string_view(text).substr(0, first));
    auto tag = fromHex(std::string_view(text).substr(first + 1, second - first - 1));
    auto body = fromHex(std::string_view(text).substr(second + 1));
    if (!iv || !tag || !body) {
        return std::unexpected("Invalid encrypted secret format");
    }

    auto plain = openBuffer(key_, SealedSecret{std::move(*iv), std::move(*tag), std::move(*body)});
    if (!plain) {
        return std::unexpected(fmt::format("Failed to decrypt secret: {}", plain.error()));
    }
    return plain;
}

std::expected<Json::Value, std::string> SecretCipher::decryptConfig(const Json::Value& config) const {
    Json::Value result = config;
    if (config.isObject()) {
        for (const auto& name : config.getMemberNames()) {
            const Json::Value& value = config[name];
            if (value.isObject() || value.isArray()) {
                auto nested = decryptConfig(value);
                if (!nested) return nested;
                result[name] = std::move(*nested);
            } else if (value.isString() && isSensitiveKey(name)) {
                auto plain = decrypt(value.asString());
                if (!plain) {
                    return std::unexpected(fmt::format("Field '{}': {}", name, plain.error()));
                }
                result[name] = *plain;
            }
        }
    } else if (config.isArray()) {
        for (Json::ArrayIndex i = 0; i < config.size(); ++i) {
            auto nested = decryptConfig(config[i]);
            if (!nested) return nested;
            result[i] = std::move(*nested);
        }
    }
    return result;
}

Json::Value SecretCipher::encryptConfig(const Json::Value& config) const {
    Json::Value result = config;
    if (config.isObject()) {
        for (const auto& name : config.getMemberNames()) {
            const Json::Value& value = config[name];
            if (value.isObject() || value.isArray()) {
                result[name] = encryptConfig(value);
            } else if (value.isString() && isSensitiveKey(name)) {
                result[name] = encrypt(value.asString());
            }
        }
    } else if (config.isArray()) {
        for (Json::ArrayIndex i = 0; i < config.size(); ++i) {
            result[i] = encryptConfig(config[i]);
        }
    }
    return result;
}

bool isSensitiveKey(std::string_view name) {
    return std::ranges::find(kSensitiveKeys, name) != kSensitiveKeys.end();
}
