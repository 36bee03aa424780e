/**
 * @file compression.hpp
 * @brief Streaming compression codecs for backup artifacts.
 *
 * GZIP is handled with zlib, BROTLI with the reference brotli library. All file
 * operations stream in fixed-size chunks so artifact size is not bounded by memory.
 */

#ifndef COMPRESSION_HPP
#define COMPRESSION_HPP

#include <string>
#include <string_view>
#include <optional>
#include <expected>
#include "crypto.hpp"

/**
 * @brief Compression algorithm declared in sidecar metadata.
 */
enum class Compression {
    None,
    Gzip,
    Brotli
};

/**
 * @brief Parses "NONE", "GZIP" or "BROTLI" (case-insensitive).
 * @return The algorithm, or std::nullopt for unknown names.
 */
std::optional<Compression> parseCompression(std::string_view name);

/**
 * @brief Canonical upper-case name ("NONE", "GZIP", "BROTLI").
 */
std::string_view compressionName(Compression compression);

/**
 * @brief File extension for the algorithm (".gz", ".br" or "").
 */
std::string_view compressionExtension(Compression compression);

/**
 * @brief Decompresses a whole file.
 *
 * @param compression Algorithm of the input. Compression::None copies the file.
 * @param inputPath Compressed file.
 * @param outputPath Destination (created or truncated).
 * @return Success or an error message. A truncated stream is an error.
 */
std::expected<void, std::string> decompressFile(Compression compression,
                                                const std::string& inputPath,
                                                const std::string& outputPath);

/**
 * @brief Compresses a whole file.
 */
std::expected<void, std::string> compressFile(Compression compression,
                                              const std::string& inputPath,
                                              const std::string& outputPath);

/**
 * @brief Feeds a sample through the decompressor.
 *
 * @return True if the decoder produced at least one byte and reported no error for the
 * whole sample. A valid header is strong evidence that the sample is the start of a
 * real compressed stream.
 */
bool decompressesCleanly(Compression compression, const Bytes& sample);

#endif // COMPRESSION_HPP
