#include "compatibility_guard.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace {

std::vector<long long> versionComponents(std::string_view version) {
    std::vector<long long> parts;
    std::size_t pos = 0;
    while (pos <= version.size()) {
        std::size_t dot = version.find('.', pos);
        std::string_view part = version.substr(pos, dot == std::string_view::npos ? std::string_view::npos : dot - pos);
        long long value = 0;
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) break;
            value = value * 10 + (c - '0');
        }
        parts.push_back(value);
        if (dot == std::string_view::npos) break;
        pos = dot + 1;
    }
    return parts;
}

} // namespace

int compareVersions(std::string_view a, std::string_view b) {
    auto left = versionComponents(a);
    auto right = versionComponents(b);
    std::size_t count = std::max(left.size(), right.size());
    for (std::size_t i = 0; i < count; ++i) {
        long long l = i < left.size() ? left[i] : 0;
        long long r = i < right.size() ? right[i] : 0;
        if (l != r) {
            return l < r ? -1 : 1;
        }
    }
    return 0;
}

CompatibilityGuard::CompatibilityGuard(std::vector<std::string> editionSensitiveEngines)
    : editionSensitiveEngines_(std::move(editionSensitiveEngines)) {}

bool CompatibilityGuard::isEditionSensitive(const std::string& adapterId) const {
    return std::ranges::find(editionSensitiveEngines_, adapterId) != editionSensitiveEngines_.end();
}

std::expected<void, RestoreError> CompatibilityGuard::check(const std::optional<BackupMetadata>& sidecar,
                                                            DatabaseAdapter& target,
                                                            const DatabaseConfig& config) const {
    if (!sidecar) {
        return {};
    }

    const std::string targetId = target.id();
    if (!sidecar->sourceType.empty() && sidecar->sourceType != targetId) {
        return restoreFailure(ErrorKind::Preflight,
            fmt::format("Incompatible backup: it was created from a '{}' source but the target is '{}'",
                        sidecar->sourceType, targetId));
    }

    bool editionSensitive = isEditionSensitive(targetId) && sidecar->engineEdition.has_value();
    if (!sidecar->engineVersion && !editionSensitive) {
        return {};
    }

    ConnectionTest live = target.test(config);
    if (!live.success) {
        return restoreFailure(ErrorKind::Preflight,
            fmt::format("Cannot verify target compatibility, connection test failed: {}", live.message));
    }

    if (sidecar->engineVersion && live.version &&
        compareVersions(*sidecar->engineVersion, *live.version) > 0) {
        return restoreFailure(ErrorKind::Preflight,
            fmt::format("Version mismatch: backup engine version {} is newer than target server version {}. "
                        "Restoring would be a downgrade.",
                        *sidecar->engineVersion, *live.version));
    }

    if (editionSensitive && live.edition && *live.edition != *sidecar->engineEdition) {
        return restoreFailure(ErrorKind::Preflight,
            fmt::format("Edition mismatch: backup was taken from edition '{}' but the target runs '{}'",
                        *sidecar->engineEdition, *live.edition));
    }
    return {};
}
