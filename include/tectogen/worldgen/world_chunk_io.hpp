/**
 * @file world_chunk_io.hpp
 * @brief Elevation chunk serialization and file I/O
 *
 * File format: 4-byte magic "TGCK", 4-byte uncompressed size (LE),
 * 4-byte compressed size (LE), LZ4-compressed CBOR map:
 *
 *   { "version": 1, "seed": uint, "width": int, "height": int,
 *     "elevation": bytes (row-major float32 LE), "checksum": uint }
 *
 * The checksum is gridChecksum() of the elevation grid and is verified on load.
 */

#pragma once

#include "tectogen/core/grid.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace tectogen::worldgen {

class WorldData;

/// The persisted subset of a world
struct WorldChunk {
    uint64_t seed = 0;
    Grid2D<float> elevation;
    uint64_t elevationChecksum = 0;
};

/// Extract the elevation chunk of a generated world
[[nodiscard]] WorldChunk makeWorldChunk(const WorldData& world);

/// Serialize a chunk to CBOR bytes
[[nodiscard]] std::vector<uint8_t> serializeWorldChunk(const WorldChunk& chunk);

/// Deserialize a chunk from CBOR bytes. Throws std::runtime_error if malformed
/// or if the stored checksum does not match the elevation payload.
[[nodiscard]] WorldChunk deserializeWorldChunk(std::span<const uint8_t> data);

/// Save a chunk to file (with LZ4 compression)
void saveWorldChunk(const WorldChunk& chunk, const std::filesystem::path& path);

/// Save the elevation chunk of a world to file
void saveWorldChunk(const WorldData& world, const std::filesystem::path& path);

/// Load a chunk from file. Throws std::runtime_error on any mismatch.
[[nodiscard]] WorldChunk loadWorldChunk(const std::filesystem::path& path);

}  // namespace tectogen::worldgen
