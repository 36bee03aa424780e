#include "key_recovery.hpp"
#include <fstream>
#include <fmt/format.h>

double printableRatio(const Bytes& sample) {
    if (sample.empty()) {
        return 0.0;
    }
    std::size_t printable = 0;
    for (unsigned char c : sample) {
        if ((c >= 0x20 && c <= 0x7E) || c == '\t' || c == '\n' || c == '\r') {
            ++printable;
        }
    }
    return static_cast<double>(printable) / static_cast<double>(sample.size());
}

bool plausiblePlaintext(const Bytes& candidate, Compression compression, const RecoveryThresholds& thresholds) {
    if (compression != Compression::None) {
        return decompressesCleanly(compression, candidate);
    }
    return printableRatio(candidate) > thresholds.printableRatio;
}

SmartKeyRecovery::SmartKeyRecovery(const EncryptionProfiles& profiles, RecoveryThresholds thresholds)
    : profiles_(profiles), thresholds_(thresholds) {}

std::expected<RecoveredKey, RestoreError> SmartKeyRecovery::recover(const std::string& encryptedPath,
                                                                    const GcmParameters& params,
                                                                    Compression compression,
                                                                    const std::function<void(const std::string&)>& onLog) const {
    std::ifstream file(encryptedPath, std::ios::binary);
    if (!file) {
        return restoreFailure(ErrorKind::Transfer, fmt::format("Failed to open encrypted file: {}", encryptedPath));
    }
    Bytes sample(thresholds_.sampleBytes);
    file.read(reinterpret_cast<char*>(sample.data()), static_cast<std::streamsize>(sample.size()));
    sample.resize(static_cast<std::size_t>(file.gcount()));
    if (sample.empty()) {
        return restoreFailure(ErrorKind::Crypto, "Encrypted file is empty");
    }
    return recoverFromSample(sample, params, compression, onLog);
}

std::expected<RecoveredKey, RestoreError> SmartKeyRecovery::recoverFromSample(const Bytes& ciphertextSample,
                                                                              const GcmParameters& params,
                                                                              Compression compression,
                                                                              const std::function<void(const std::string&)>& onLog) const {
    auto log = [&onLog](const std::string& message) {
        if (onLog) onLog(message);
    };

    Bytes sample = ciphertextSample;
    if (sample.size() > thresholds_.sampleBytes) {
        sample.resize(thresholds_.sampleBytes);
    }

    for (const EncryptionProfile* profile : profiles_.recoveryOrder()) {
        auto key = profiles_.deriveKey(*profile);
        if (!key) {
            log(fmt::format("Skipping profile {}: {}", profile->id, key.error()));
            continue;
        }
        auto candidate = decryptPrefix(*key, params, sample);
        if (!candidate) {
            log(fmt::format("Skipping profile {}: {}", profile->id, candidate.error()));
            continue;
        }
        if (plausiblePlaintext(*candidate, compression, thresholds_)) {
            log(fmt::format("Profile {} ({}) decrypts this backup", profile->id, profile->name));
            return RecoveredKey{profile->id, std::move(*key)};
        }
    }
    return restoreFailure(ErrorKind::Crypto, "No candidate profile decrypts this backup");
}
