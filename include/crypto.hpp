/**
 * @file crypto.hpp
 * @brief AES-256-GCM primitives used for backup artifacts and stored secrets.
 *
 * Backup artifacts are encrypted as a single GCM stream; the IV and authentication tag
 * live in the sidecar metadata, never in the artifact. Stored secrets (adapter passwords,
 * encryption profile keys) use the compact "iv:authTag:ciphertext" hex format under the
 * process-level system key.
 *
 * @note Requires OpenSSL 3 (libcrypto).
 */

#ifndef CRYPTO_HPP
#define CRYPTO_HPP

#include <string>
#include <string_view>
#include <vector>
#include <expected>
#include <cstddef>
#include <json/json.h>

using Bytes = std::vector<unsigned char>;

constexpr std::size_t kAesKeySize = 32;  ///< AES-256 key length in bytes.
constexpr std::size_t kGcmTagSize = 16;  ///< GCM authentication tag length.
constexpr std::size_t kSecretIvSize = 16; ///< IV length used for stored secrets.

/**
 * @brief IV and authentication tag of one GCM stream.
 */
struct GcmParameters {
    Bytes iv;      ///< Initialization vector.
    Bytes authTag; ///< Authentication tag produced by encryption.
};

/**
 * @brief Decodes a hex string. Fails on odd length or non-hex characters.
 */
std::expected<Bytes, std::string> fromHex(std::string_view hex);

/**
 * @brief Encodes bytes as lowercase hex.
 */
std::string toHex(const Bytes& bytes);

/**
 * @brief Returns n cryptographically secure random bytes.
 * @throws std::runtime_error If the OpenSSL RNG fails.
 */
Bytes randomBytes(std::size_t n);

/**
 * @brief Encrypts a file with AES-256-GCM.
 *
 * @param key 32-byte key.
 * @param iv Initialization vector (any non-empty length).
 * @param inputPath Plaintext file.
 * @param outputPath Ciphertext file (created or truncated).
 * @return The IV and the authentication tag, or an error message.
 */
std::expected<GcmParameters, std::string> encryptFile(const Bytes& key, const Bytes& iv,
                                                      const std::string& inputPath,
                                                      const std::string& outputPath);

/**
 * @brief Stream-decrypts a file with AES-256-GCM and verifies the tag.
 *
 * The output file is removed when authentication fails.
 *
 * @param key 32-byte key.
 * @param params IV and authentication tag from the sidecar.
 * @param inputPath Ciphertext file.
 * @param outputPath Plaintext file.
 * @return Success or an error message.
 */
std::expected<void, std::string> decryptFile(const Bytes& key, const GcmParameters& params,
                                             const std::string& inputPath,
                                             const std::string& outputPath);

/**
 * @brief Decrypts a ciphertext prefix without authenticating it.
 *
 * GCM is a stream mode, so the first N plaintext bytes only depend on the first N
 * ciphertext bytes. The tag is set on the context but never checked; the result is a
 * candidate plaintext that callers must validate by other means.
 */
std::expected<Bytes, std::string> decryptPrefix(const Bytes& key, const GcmParameters& params,
                                                const Bytes& ciphertext);

/**
 * @brief Encrypts and decrypts stored secrets with the system key.
 */
class SecretCipher {
public:
    /**
     * @brief Constructs a cipher from a raw 32-byte key.
     * @throws std::runtime_error If the key has the wrong length.
     */
    explicit SecretCipher(Bytes key);

    /**
     * @brief Constructs a cipher from a 64-character hex key.
     */
    static std::expected<SecretCipher, std::string> fromHexKey(std::string_view hexKey);

    /**
     * @brief Encrypts text into "iv:authTag:ciphertext". Empty input stays empty.
     */
    std::string encrypt(const std::string& plaintext) const;

    /**
     * @brief Decrypts "iv:authTag:ciphertext".
     *
     * Text that does not have three colon-separated parts is returned unchanged, so
     * secrets stored in plain form keep working. Text in the encrypted format that fails
     * authentication is an error.
     */
    std::expected<std::string, std::string> decrypt(const std::string& text) const;

    /**
     * @brief Recursively decrypts sensitive string fields of a JSON object.
     */
    std::expected<Json::Value, std::string> decryptConfig(const Json::Value& config) const;

    /**
     * @brief Recursively encrypts sensitive string fields of a JSON object.
     */
    Json::Value encryptConfig(const Json::Value& config) const;

private:
    Bytes key_;
};

/**
 * @brief True for configuration field names that hold secrets (password, token, ...).
 */
bool isSensitiveKey(std::string_view name);

#endif // CRYPTO_HPP
