/**
 * @file restore_error.hpp
 * @brief Error taxonomy shared by the RestoreVault restore pipeline.
 *
 * Operations that can fail return std::expected<T, RestoreError>. The kind tells the
 * caller which stage rejected the request; the message is meant for operators and is
 * copied verbatim into execution logs.
 */

#ifndef RESTORE_ERROR_HPP
#define RESTORE_ERROR_HPP

#include <string>
#include <string_view>
#include <expected>

/**
 * @brief Classification of restore failures.
 */
enum class ErrorKind {
    Configuration,  ///< Adapter, adapter config or encryption profile not found.
    Preflight,      ///< Permission denied, vendor/version/edition mismatch.
    Transfer,       ///< Storage download/upload failure.
    Crypto,         ///< Missing IV/tag, wrong key, no key candidate matches.
    Compression,    ///< Corrupt or unsupported compressed stream.
    AdapterRestore, ///< Underlying engine tool failed.
    Internal        ///< Unexpected exception inside the pipeline.
};

/**
 * @brief Error value carried through std::expected.
 */
struct RestoreError {
    ErrorKind kind;      ///< Failure class.
    std::string message; ///< Human-readable description.
};

/**
 * @brief Returns the stable name of an error kind (e.g. "PreflightError").
 */
std::string_view errorKindName(ErrorKind kind);

/**
 * @brief Convenience constructor for std::unexpected<RestoreError>.
 */
inline std::unexpected<RestoreError> restoreFailure(ErrorKind kind, std::string message) {
    return std::unexpected(RestoreError{kind, std::move(message)});
}

#endif // RESTORE_ERROR_HPP
