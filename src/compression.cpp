#include "compression.hpp"
#include <zlib.h>
#include <brotli/decode.h>
#include <brotli/encode.h>
#include <fstream>
#include <filesystem>
#include <memory>
#include <vector>
#include <cctype>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;

using BrotliDecoder = std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)>;
using BrotliEncoder = std::unique_ptr<BrotliEncoderState, decltype(&BrotliEncoderDestroyInstance)>;

void discard(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

std::expected<void, std::string> gunzipFile(const std::string& inputPath, const std::string& outputPath) {
    gzFile inFile = gzopen(inputPath.c_str(), "rb");
    if (!inFile) {
        return std::unexpected(fmt::format("Failed to open gzip file: {}", inputPath));
    }
    if (gzdirect(inFile)) {
        gzclose(inFile);
        return std::unexpected(fmt::format("Not a gzip stream: {}", inputPath));
    }

    std::ofstream outFile(outputPath, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        gzclose(inFile);
        return std::unexpected(fmt::format("Failed to open decompression output: {}", outputPath));
    }

    std::vector<char> buf(kChunkSize);
    int got = 0;
    while ((got = gzread(inFile, buf.data(), static_cast<unsigned>(buf.size()))) > 0) {
        outFile.write(buf.data(), got);
    }
    if (got < 0) {
        int errnum = 0;
        std::string message = gzerror(inFile, &errnum);
        gzclose(inFile);
        outFile.close();
        discard(outputPath);
        return std::unexpected(fmt::format("Gzip decompression failed: {}", message));
    }

    int closeResult = gzclose(inFile);
    outFile.close();
    if (closeResult == Z_BUF_ERROR) {
        discard(outputPath);
        return std::unexpected("Gzip decompression failed: truncated stream");
    }
    if (!outFile) {
        return std::unexpected(fmt::format("Failed to write decompressed file: {}", outputPath));
    }
    return {};
}

std::expected<void, std::string> gzipFile(const std::string& inputPath, const std::string& outputPath) {
    std::ifstream inFile(inputPath, std::ios::binary);
    if (!inFile) {
        return std::unexpected(fmt::format("Failed to open file for compression: {}", inputPath));
    }
    gzFile outFile = gzopen(outputPath.c_str(), "wb");
    if (!outFile) {
        return std::unexpected("Failed to open gzip file for writing");
    }

    std::vector<char> buf(kChunkSize);
    while (inFile) {
        inFile.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto got = inFile.gcount();
        if (got > 0 && gzwrite(outFile, buf.data(), static_cast<unsigned>(got)) == 0) {
            int errnum = 0;
            std::string message = gzerror(outFile, &errnum);
            gzclose(outFile);
            discard(outputPath);
            return std::unexpected(fmt::format("Gzip compression failed: {}", message));
        }
    }

    if (gzclose(outFile) != Z_OK) {
        discard(outputPath);
        return std::unexpected("Gzip compression failed while closing the stream");
    }
    return {};
}

std::expected<void, std::string> unbrotliFile(const std::string& inputPath, const std::string& outputPath) {
    BrotliDecoder decoder(BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), &BrotliDecoderDestroyInstance);
    if (!decoder) {
        return std::unexpected("Failed to create brotli decoder");
    }

    std::ifstream inFile(inputPath, std::ios::binary);
    if (!inFile) {
        return std::unexpected(fmt::format("Failed to open brotli file: {}", inputPath));
    }
    std::ofstream outFile(outputPath, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        return std::unexpected(fmt::format("Failed to open decompression output: {}", outputPath));
    }

    std::vector<uint8_t> inBuf(kChunkSize);
    std::vector<uint8_t> outBuf(kChunkSize);
    BrotliDecoderResult result = BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT;

    while (result != BROTLI_DECODER_RESULT_SUCCESS) {
        if (result == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT && !inFile) {
            break;
        }
        inFile.read(reinterpret_cast<char*>(inBuf.data()), static_cast<std::streamsize>(inBuf.size()));
        size_t availableIn = static_cast<size_t>(inFile.gcount());
        const uint8_t* nextIn = inBuf.data();
        if (availableIn == 0 && !inFile) {
            break;
        }

        do {
            size_t availableOut = outBuf.size();
            uint8_t* nextOut = outBuf.data();
            result = BrotliDecoderDecompressStream(decoder.get(), &availableIn, &nextIn, &availableOut, &nextOut, nullptr);
            if (result == BROTLI_DECODER_RESULT_ERROR) {
                std::string message = BrotliDecoderErrorString(BrotliDecoderGetErrorCode(decoder.get()));
                outFile.close();
                discard(outputPath);
                return std::unexpected(fmt::format("Brotli decompression failed: {}", message));
            }
            outFile.write(reinterpret_cast<const char*>(outBuf.data()),
                          static_cast<std::streamsize>(outBuf.size() - availableOut));
        } while (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT);
    }

    outFile.close();
    if (result != BROTLI_DECODER_RESULT_SUCCESS) {
        discard(outputPath);
        return std::unexpected("Brotli decompression failed: truncated stream");
    }
    if (!outFile) {
        return std::unexpected(fmt::format("Failed to write decompressed file: {}", outputPath));
    }
    return {};
}

std::expected<void, std::string> brotliFile(const std::string& inputPath, const std::string& outputPath) {
    BrotliEncoder encoder(BrotliEncoderCreateInstance(nullptr, nullptr, nullptr), &BrotliEncoderDestroyInstance);
    if (!encoder) {
        return std::unexpected("Failed to create brotli encoder");
    }
    BrotliEncoderSetParameter(encoder.get(), BROTLI_PARAM_QUALITY, 6);

    std::ifstream inFile(inputPath, std::ios::binary);
    if (!inFile) {
        return std::unexpected(fmt::format("Failed to open file for compression: {}", inputPath));
    }
    std::ofstream outFile(outputPath, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        return std::unexpected(fmt::format("Failed to open compression output: {}", outputPath));
    }

    std::vector<uint8_t> inBuf(kChunkSize);
    std::vector<uint8_t> outBuf(kChunkSize);
    bool finished = false;
    while (!finished) {
        inFile.read(reinterpret_cast<char*>(inBuf.data()), static_cast<std::streamsize>(inBuf.size()));
        size_t availableIn = static_cast<size_t>(inFile.gcount());
        const uint8_t* nextIn = inBuf.data();
        BrotliEncoderOperation op = inFile ? BROTLI_OPERATION_PROCESS : BROTLI_OPERATION_FINISH;

        do {
            size_t availableOut = outBuf.size();
            uint8_t* nextOut = outBuf.data();
            if (!BrotliEncoderCompressStream(encoder.get(), op, &availableIn, &nextIn, &availableOut, &nextOut, nullptr)) {
                outFile.close();
                discard(outputPath);
                return std::unexpected("Brotli compression failed");
            }
            outFile.write(reinterpret_cast<const char*>(outBuf.data()),
                          static_cast<std::streamsize>(outBuf.size() - availableOut));
        } while (availableIn > 0 || BrotliEncoderHasMoreOutput(encoder.get()));

        finished = op == BROTLI_OPERATION_FINISH && BrotliEncoderIsFinished(encoder.get());
    }

    outFile.close();
    if (!outFile) {
        return std::unexpected(fmt::format("Failed to write compressed file: {}", outputPath));
    }
    return {};
}

bool gzipSampleInflates(const Bytes& sample) {
    z_stream strm{};
    // 16 + MAX_WBITS: expect a gzip wrapper, not raw zlib
    if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
        return false;
    }

    std::vector<unsigned char> out(kChunkSize);
    strm.next_in = const_cast<Bytef*>(sample.data());
    strm.avail_in = static_cast<uInt>(sample.size());
    std::size_t produced = 0;
    int ret = Z_OK;
    while (strm.avail_in > 0 && ret == Z_OK) {
        strm.next_out = out.data();
        strm.avail_out = static_cast<uInt>(out.size());
        ret = inflate(&strm, Z_SYNC_FLUSH);
        produced += out.size() - strm.avail_out;
        if (ret == Z_BUF_ERROR && strm.avail_out != 0) {
            break;
        }
    }
    inflateEnd(&strm);

    bool clean = ret == Z_OK || ret == Z_STREAM_END || ret == Z_BUF_ERROR;
    return clean && produced > 0;
}

bool brotliSampleDecodes(const Bytes& sample) {
    BrotliDecoder decoder(BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), &BrotliDecoderDestroyInstance);
    if (!decoder) {
        return false;
    }

    std::vector<uint8_t> out(kChunkSize);
    size_t availableIn = sample.size();
    const uint8_t* nextIn = sample.data();
    std::size_t produced = 0;
    BrotliDecoderResult result = BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT;
    while (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
        size_t availableOut = out.size();
        uint8_t* nextOut = out.data();
        result = BrotliDecoderDecompressStream(decoder.get(), &availableIn, &nextIn, &availableOut, &nextOut, nullptr);
        produced += out.size() - availableOut;
    }
    return result != BROTLI_DECODER_RESULT_ERROR && produced > 0;
}

} // namespace

std::optional<Compression> parseCompression(std::string_view name) {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (upper == "NONE" || upper.empty()) return Compression::None;
    if (upper == "GZIP") return Compression::Gzip;
    if (upper == "BROTLI") return Compression::Brotli;
    return std::nullopt;
}

std::string_view compressionName(Compression compression) {
    switch (compression) {
        case Compression::Gzip: return "GZIP";
        case Compression::Brotli: return "BROTLI";
        case Compression::None: break;
    }
    return "NONE";
}

std::string_view compressionExtension(Compression compression) {
    switch (compression) {
        case Compression::Gzip: return ".gz";
        case Compression::Brotli: return ".br";
        case Compression::None: break;
    }
    return "";
}

std::expected<void, std::string> decompressFile(Compression compression,
                                                const std::string& inputPath,
                                                const std::string& outputPath) {
    switch (compression) {
        case Compression::Gzip: return gunzipFile(inputPath, outputPath);
        case Compression::Brotli: return unbrotliFile(inputPath, outputPath);
        case Compression::None: break;
    }
    std::error_code ec;
    fs::copy_file(inputPath, outputPath, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return std::unexpected(fmt::format("Failed to copy {}: {}", inputPath, ec.message()));
    }
    return {};
}

std::expected<void, std::string> compressFile(Compression compression,
                                              const std::string& inputPath,
                                              const std::string& outputPath) {
    switch (compression) {
        case Compression::Gzip: return gzipFile(inputPath, outputPath);
        case Compression::Brotli: return brotliFile(inputPath, outputPath);
        case Compression::None: break;
    }
    std::error_code ec;
    fs::copy_file(inputPath, outputPath, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return std::unexpected(fmt::format("Failed to copy {}: {}", inputPath, ec.message()));
    }
    return {};
}

bool decompressesCleanly(Compression compression, const Bytes& sample) {
    switch (compression) {
        case Compression::Gzip: return gzipSampleInflates(sample);
        case Compression::Brotli: return brotliSampleDecodes(sample);
        case Compression::None: break;
    }
    return !sample.empty();
}
