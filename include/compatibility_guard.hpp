/**
 * @file compatibility_guard.hpp
 * @brief Vendor, version and edition checks run before a restore is accepted.
 */

#ifndef COMPATIBILITY_GUARD_HPP
#define COMPATIBILITY_GUARD_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <expected>
#include "adapter.hpp"
#include "backup_metadata.hpp"
#include "restore_error.hpp"

/**
 * @brief Compares dotted version strings numerically.
 *
 * Each component contributes its leading digits ("35-log" counts as 35); missing
 * components are zero, so "14" equals "14.0.0".
 *
 * @return Negative if a < b, zero if equal, positive if a > b.
 */
int compareVersions(std::string_view a, std::string_view b);

class CompatibilityGuard {
public:
    /**
     * @param editionSensitiveEngines Adapter ids whose backups only restore onto the same edition.
     */
    explicit CompatibilityGuard(std::vector<std::string> editionSensitiveEngines = {"mssql"});

    /**
     * @brief Checks that a backup may be restored onto the target.
     *
     * With no sidecar every check is skipped. The target's live version is probed only when
     * the sidecar records an engine version or the engine is edition sensitive.
     *
     * @param sidecar Parsed sidecar, if one exists.
     * @param target Target adapter.
     * @param config Target connection.
     * @return Success or a Preflight error. Never has side effects.
     */
    std::expected<void, RestoreError> check(const std::optional<BackupMetadata>& sidecar,
                                            DatabaseAdapter& target,
                                            const DatabaseConfig& config) const;

    bool isEditionSensitive(const std::string& adapterId) const;

private:
    std::vector<std::string> editionSensitiveEngines_;
};

#endif // COMPATIBILITY_GUARD_HPP
