/**
 * @file key_recovery.hpp
 * @brief Finds the key of an encrypted artifact whose profile reference is stale.
 *
 * Every configured profile is tried in recovery order. For each usable key the first bytes
 * of the ciphertext are decrypted without authentication and the candidate plaintext is
 * judged: through the decompressor when the artifact is compressed, by printable-byte
 * ratio otherwise. The first candidate that passes wins.
 */

#ifndef KEY_RECOVERY_HPP
#define KEY_RECOVERY_HPP

#include <string>
#include <cstddef>
#include <expected>
#include <functional>
#include "crypto.hpp"
#include "compression.hpp"
#include "encryption_profiles.hpp"
#include "restore_error.hpp"

/**
 * @brief Tunable limits of the plaintext heuristic.
 */
struct RecoveryThresholds {
    std::size_t sampleBytes = 1024; ///< Ciphertext prefix decrypted per candidate.
    double printableRatio = 0.7;    ///< Minimum share of printable bytes for uncompressed data.
};

/**
 * @brief A key that passed the heuristic.
 */
struct RecoveredKey {
    std::string profileId;
    Bytes key;
};

/**
 * @brief Share of bytes in 0x20..0x7E, tab, LF or CR. Zero for an empty sample.
 */
double printableRatio(const Bytes& sample);

/**
 * @brief Applies the plaintext heuristic to one decrypted sample.
 */
bool plausiblePlaintext(const Bytes& candidate, Compression compression, const RecoveryThresholds& thresholds);

class SmartKeyRecovery {
public:
    SmartKeyRecovery(const EncryptionProfiles& profiles, RecoveryThresholds thresholds = {});

    /**
     * @brief Tries all profiles against the start of an encrypted file.
     *
     * @param encryptedPath Ciphertext file.
     * @param params IV and tag from the sidecar.
     * @param compression Declared compression of the plaintext.
     * @param onLog Optional receiver for per-candidate diagnostics.
     * @return The first matching key, or a Crypto error when no profile decrypts the file.
     */
    std::expected<RecoveredKey, RestoreError> recover(const std::string& encryptedPath,
                                                      const GcmParameters& params,
                                                      Compression compression,
                                                      const std::function<void(const std::string&)>& onLog = {}) const;

    /**
     * @brief Same as recover(), on an in-memory ciphertext prefix.
     */
    std::expected<RecoveredKey, RestoreError> recoverFromSample(const Bytes& ciphertextSample,
                                                                const GcmParameters& params,
                                                                Compression compression,
                                                                const std::function<void(const std::string&)>& onLog = {}) const;

private:
    const EncryptionProfiles& profiles_;
    RecoveryThresholds thresholds_;
};

#endif // KEY_RECOVERY_HPP
