/**
 * @file encryption_profiles.hpp
 * @brief Keyring of configured encryption profiles.
 */

#ifndef ENCRYPTION_PROFILES_HPP
#define ENCRYPTION_PROFILES_HPP

#include <string>
#include <vector>
#include <optional>
#include <expected>
#include "crypto.hpp"
#include "restore_error.hpp"

/**
 * @brief One encryption profile as stored in the configuration.
 */
struct EncryptionProfile {
    std::string id;
    std::string name;
    std::string secretKey; ///< 64-char hex key, usually wrapped by the system key.
    std::string createdAt; ///< ISO-8601 creation time.
};

/**
 * @brief Resolves profile ids to usable AES-256 keys.
 */
class EncryptionProfiles {
public:
    /**
     * @param profiles Configured profiles.
     * @param systemCipher Cipher for wrapped secret keys. Without it keys must be stored in plain hex.
     */
    EncryptionProfiles(std::vector<EncryptionProfile> profiles, std::optional<SecretCipher> systemCipher);

    /**
     * @return The profile, or nullptr if no profile has this id.
     */
    const EncryptionProfile* find(const std::string& id) const;

    /**
     * @brief Unwraps a profile's secret and checks it is a 32-byte key.
     */
    std::expected<Bytes, std::string> deriveKey(const EncryptionProfile& profile) const;

    /**
     * @brief Key of the profile with the given id.
     * @return The key, a Configuration error for an unknown id, or a Crypto error for a bad key.
     */
    std::expected<Bytes, RestoreError> keyFor(const std::string& id) const;

    /**
     * @brief Profiles in recovery order: newest first, ties broken by id.
     */
    std::vector<const EncryptionProfile*> recoveryOrder() const;

    std::size_t size() const { return profiles_.size(); }

private:
    std::vector<EncryptionProfile> profiles_;
    std::optional<SecretCipher> systemCipher_;
};

#endif // ENCRYPTION_PROFILES_HPP
