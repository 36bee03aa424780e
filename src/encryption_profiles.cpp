#include "encryption_profiles.hpp"
#include <algorithm>
#include <fmt/format.h>

EncryptionProfiles::EncryptionProfiles(std::vector<EncryptionProfile> profiles, std::optional<SecretCipher> systemCipher)
    : profiles_(std::move(profiles)), systemCipher_(std::move(systemCipher)) {}

const EncryptionProfile* EncryptionProfiles::find(const std::string& id) const {
    auto it = std::ranges::find(profiles_, id, &EncryptionProfile::id);
    return it == profiles_.end() ? nullptr : &*it;
}

std::expected<Bytes, std::string> EncryptionProfiles::deriveKey(const EncryptionProfile& profile) const {
    std::string hexKey = profile.secretKey;
    if (systemCipher_) {
        auto unwrapped = systemCipher_->decrypt(profile.secretKey);
        if (!unwrapped) {
            return std::unexpected(fmt::format("Failed to unwrap key of profile {}: {}", profile.id, unwrapped.error()));
        }
        hexKey = std::move(*unwrapped);
    }

    if (hexKey.size() != kAesKeySize * 2) {
        return std::unexpected(fmt::format("Invalid key length for profile {}: expected {} hex characters, got {}",
                                           profile.id, kAesKeySize * 2, hexKey.size()));
    }
    auto key = fromHex(hexKey);
    if (!key) {
        return std::unexpected(fmt::format("Invalid key for profile {}: {}", profile.id, key.error()));
    }
    return key;
}

std::expected<Bytes, RestoreError> EncryptionProfiles::keyFor(const std::string& id) const {
    const EncryptionProfile* profile = find(id);
    if (!profile) {
        return restoreFailure(ErrorKind::Configuration, fmt::format("Encryption profile {} not found", id));
    }
    auto key = deriveKey(*profile);
    if (!key) {
        return restoreFailure(ErrorKind::Crypto, key.error());
    }
    return std::move(*key);
}

std::vector<const EncryptionProfile*> EncryptionProfiles::recoveryOrder() const {
    std::vector<const EncryptionProfile*> ordered;
    ordered.reserve(profiles_.size());
    for (const auto& profile : profiles_) {
        ordered.push_back(&profile);
    }
    std::ranges::stable_sort(ordered, [](const EncryptionProfile* a, const EncryptionProfile* b) {
        if (a->createdAt != b->createdAt) {
            return a->createdAt > b->createdAt;
        }
        return a->id < b->id;
    });
    return ordered;
}
