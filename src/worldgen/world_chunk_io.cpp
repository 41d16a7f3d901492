/**
 * @file world_chunk_io.cpp
 * @brief Elevation chunk CBOR serialization and LZ4-compressed file I/O
 */

#include "tectogen/worldgen/world_chunk_io.hpp"
#include "tectogen/core/cbor.hpp"
#include "tectogen/worldgen/world_data.hpp"

#include <lz4.h>

#include <array>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>

namespace tectogen::worldgen {

namespace {

constexpr std::array<char, 4> CHUNK_MAGIC = {'T', 'G', 'C', 'K'};
constexpr size_t HEADER_SIZE = 12;
constexpr int64_t CHUNK_VERSION = 1;

// Largest payload we agree to decompress (also bounds LZ4's int sizes)
constexpr uint32_t MAX_PAYLOAD = 1u << 30;

void putU32(std::array<char, HEADER_SIZE>& header, size_t offset, uint32_t value) {
    for (size_t i = 0; i < 4; ++i) {
        header[offset + i] = static_cast<char>((value >> (i * 8)) & 0xFF);
    }
}

uint32_t getU32(const std::array<char, HEADER_SIZE>& header, size_t offset) {
    uint32_t value = 0;
    for (size_t i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(static_cast<uint8_t>(header[offset + i])) << (i * 8);
    }
    return value;
}

std::vector<uint8_t> encodeElevation(const Grid2D<float>& grid) {
    std::vector<uint8_t> bytes;
    bytes.reserve(grid.size() * 4);
    for (float cell : grid) {
        uint32_t bits;
        std::memcpy(&bits, &cell, sizeof(bits));
        for (int i = 0; i < 4; ++i) {
            bytes.push_back(static_cast<uint8_t>(bits >> (i * 8)));
        }
    }
    return bytes;
}

Grid2D<float> decodeElevation(const std::vector<uint8_t>& bytes, int32_t width, int32_t height) {
    uint64_t expected = static_cast<uint64_t>(width) * static_cast<uint64_t>(height) * 4;
    if (bytes.size() != expected) {
        throw std::runtime_error("Invalid world chunk: elevation payload is " +
                                 std::to_string(bytes.size()) + " bytes, expected " +
                                 std::to_string(expected));
    }

    Grid2D<float> grid(width, height, 0.0f);

    float* cells = grid.data();
    for (size_t i = 0; i < grid.size(); ++i) {
        uint32_t bits = 0;
        for (size_t b = 0; b < 4; ++b) {
            bits |= static_cast<uint32_t>(bytes[i * 4 + b]) << (b * 8);
        }
        std::memcpy(&cells[i], &bits, sizeof(bits));
    }
    return grid;
}

}  // namespace

// ============================================================================
// CBOR serialization
// ============================================================================

WorldChunk makeWorldChunk(const WorldData& world) {
    return WorldChunk{world.seed(), world.elevation(), gridChecksum(world.elevation())};
}

std::vector<uint8_t> serializeWorldChunk(const WorldChunk& chunk) {
    std::vector<uint8_t> out;

    cbor::encodeMapHeader(out, 6);

    cbor::encodeString(out, "version");
    cbor::encodeInt(out, CHUNK_VERSION);

    cbor::encodeString(out, "seed");
    cbor::encodeUInt(out, chunk.seed);

    cbor::encodeString(out, "width");
    cbor::encodeInt(out, chunk.elevation.width());

    cbor::encodeString(out, "height");
    cbor::encodeInt(out, chunk.elevation.height());

    cbor::encodeString(out, "elevation");
    cbor::encodeBytes(out, encodeElevation(chunk.elevation));

    cbor::encodeString(out, "checksum");
    cbor::encodeUInt(out, chunk.elevationChecksum);

    return out;
}

WorldChunk deserializeWorldChunk(std::span<const uint8_t> data) {
    cbor::Decoder dec(data);

    auto [majorType, count] = dec.readHeader();
    if (dec.failed() || majorType != cbor::MAP) {
        throw std::runtime_error("Invalid world chunk CBOR: expected map");
    }

    int64_t version = -1;
    uint64_t seed = 0;
    int64_t width = -1;
    int64_t height = -1;
    uint64_t checksum = 0;
    bool haveSeed = false;
    bool haveChecksum = false;
    std::vector<uint8_t> elevationBytes;
    bool haveElevation = false;

    for (uint64_t i = 0; i < count && !dec.failed(); ++i) {
        auto [keyType, keyLen] = dec.readHeader();
        if (keyType != cbor::TEXT_STRING) {
            throw std::runtime_error("Invalid world chunk CBOR: non-string key");
        }
        std::string key = dec.readString(keyLen);

        if (key == "version") {
            version = dec.readInt();
        } else if (key == "seed") {
            seed = dec.readUInt();
            haveSeed = true;
        } else if (key == "width") {
            width = dec.readInt();
        } else if (key == "height") {
            height = dec.readInt();
        } else if (key == "elevation") {
            auto [type, len] = dec.readHeader();
            if (type != cbor::BYTE_STRING) {
                throw std::runtime_error("Invalid world chunk CBOR: elevation is not a byte string");
            }
            elevationBytes = dec.readBytes(len);
            haveElevation = true;
        } else if (key == "checksum") {
            checksum = dec.readUInt();
            haveChecksum = true;
        } else {
            dec.skipValue();
        }
    }

    if (dec.failed()) {
        throw std::runtime_error("Invalid world chunk CBOR: truncated or malformed");
    }
    if (version != CHUNK_VERSION) {
        throw std::runtime_error("Unsupported world chunk version " + std::to_string(version));
    }
    if (!haveSeed || !haveElevation || !haveChecksum) {
        throw std::runtime_error("Invalid world chunk: missing fields");
    }
    if (width <= 0 || height <= 0 || width > INT32_MAX || height > INT32_MAX) {
        throw std::runtime_error("Invalid world chunk: bad dimensions");
    }

    WorldChunk chunk;
    chunk.seed = seed;
    chunk.elevation = decodeElevation(elevationBytes, static_cast<int32_t>(width),
                                      static_cast<int32_t>(height));
    chunk.elevationChecksum = checksum;

    uint64_t actual = gridChecksum(chunk.elevation);
    if (actual != checksum) {
        throw std::runtime_error("World chunk checksum mismatch: stored " + toHex64(checksum) +
                                 ", computed " + toHex64(actual));
    }
    return chunk;
}

// ============================================================================
// File I/O
// ============================================================================

void saveWorldChunk(const WorldChunk& chunk, const std::filesystem::path& path) {
    auto cborData = serializeWorldChunk(chunk);
    if (cborData.size() > MAX_PAYLOAD) {
        throw std::runtime_error("World chunk too large to save: " +
                                 std::to_string(cborData.size()) + " bytes");
    }

    int maxCompressed = LZ4_compressBound(static_cast<int>(cborData.size()));
    std::vector<uint8_t> compressed(static_cast<size_t>(maxCompressed));

    int compressedSize = LZ4_compress_default(
        reinterpret_cast<const char*>(cborData.data()),
        reinterpret_cast<char*>(compressed.data()),
        static_cast<int>(cborData.size()),
        maxCompressed);

    if (compressedSize <= 0) {
        throw std::runtime_error("LZ4 compression failed");
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }

    std::array<char, HEADER_SIZE> header{};
    std::memcpy(header.data(), CHUNK_MAGIC.data(), CHUNK_MAGIC.size());
    putU32(header, 4, static_cast<uint32_t>(cborData.size()));
    putU32(header, 8, static_cast<uint32_t>(compressedSize));

    file.write(header.data(), static_cast<std::streamsize>(header.size()));
    file.write(reinterpret_cast<const char*>(compressed.data()), compressedSize);

    if (!file) {
        throw std::runtime_error("Failed to write world chunk: " + path.string());
    }
}

void saveWorldChunk(const WorldData& world, const std::filesystem::path& path) {
    saveWorldChunk(makeWorldChunk(world), path);
}

WorldChunk loadWorldChunk(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("Failed to open world chunk file: " + path.string());
    }

    auto fileSize = static_cast<int64_t>(file.tellg());
    file.seekg(0);

    if (fileSize < static_cast<int64_t>(HEADER_SIZE)) {
        throw std::runtime_error("World chunk file too small");
    }

    std::array<char, HEADER_SIZE> header{};
    file.read(header.data(), static_cast<std::streamsize>(header.size()));
    if (!file || std::memcmp(header.data(), CHUNK_MAGIC.data(), CHUNK_MAGIC.size()) != 0) {
        throw std::runtime_error("Invalid world chunk file magic");
    }

    uint32_t uncompressedSize = getU32(header, 4);
    uint32_t compressedSize = getU32(header, 8);

    if (static_cast<int64_t>(compressedSize) != fileSize - static_cast<int64_t>(HEADER_SIZE)) {
        throw std::runtime_error("World chunk size mismatch: header says " +
                                 std::to_string(compressedSize) + " compressed bytes, file has " +
                                 std::to_string(fileSize - static_cast<int64_t>(HEADER_SIZE)));
    }
    if (uncompressedSize == 0 || uncompressedSize > MAX_PAYLOAD) {
        throw std::runtime_error("World chunk has invalid uncompressed size");
    }

    std::vector<uint8_t> compressed(compressedSize);
    file.read(reinterpret_cast<char*>(compressed.data()), compressedSize);
    if (!file) {
        throw std::runtime_error("Failed to read world chunk payload");
    }

    std::vector<uint8_t> cborData(uncompressedSize);
    int result = LZ4_decompress_safe(
        reinterpret_cast<const char*>(compressed.data()),
        reinterpret_cast<char*>(cborData.data()),
        static_cast<int>(compressedSize),
        static_cast<int>(uncompressedSize));

    if (result < 0 || static_cast<uint32_t>(result) != uncompressedSize) {
        throw std::runtime_error("LZ4 decompression failed");
    }

    return deserializeWorldChunk(cborData);
}

}  // namespace tectogen::worldgen
