#include "restore_error.hpp"

std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "ConfigurationError";
        case ErrorKind::Preflight: return "PreflightError";
        case ErrorKind::Transfer: return "TransferError";
        case ErrorKind::Crypto: return "CryptoError";
        case ErrorKind::Compression: return "CompressionError";
        case ErrorKind::AdapterRestore: return "AdapterRestoreError";
        case ErrorKind::Internal: return "InternalError";
    }
    return "InternalError";
}
