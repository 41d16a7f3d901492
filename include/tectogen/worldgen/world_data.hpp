/**
 * @file world_data.hpp
 * @brief Immutable result of a world generation run
 */

#pragma once

#include "tectogen/core/grid.hpp"
#include "tectogen/worldgen/biome.hpp"
#include "tectogen/worldgen/plate_field.hpp"
#include "tectogen/worldgen/regional_feature.hpp"
#include "tectogen/worldgen/river.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace tectogen::worldgen {

// ============================================================================
// Checksums
// ============================================================================

constexpr uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
constexpr uint64_t kFnvPrime = 0x100000001b3ULL;

/// 64-bit FNV-1a over raw bytes, continuing from `hash`
[[nodiscard]] uint64_t fnv1a64(std::span<const uint8_t> bytes, uint64_t hash = kFnvOffsetBasis);

/// 16 lowercase hex digits
[[nodiscard]] std::string toHex64(uint64_t value);

/// FNV-1a over dimensions and the little-endian bit patterns of every cell
[[nodiscard]] uint64_t gridChecksum(const Grid2D<float>& grid, uint64_t hash = kFnvOffsetBasis);

// ============================================================================
// WorldData
// ============================================================================

/**
 * @brief Everything one run produces for (seed, width, height, params)
 *
 * Grids are indexed (x, y). Nothing is mutable after construction.
 */
class WorldData {
public:
    WorldData(uint64_t seed, PlateField plates,
              Grid2D<float> elevation, Grid2D<float> temperature, Grid2D<float> moisture,
              Grid2D<Biome> biomes, std::vector<River> rivers,
              std::vector<RegionalFeature> features);

    [[nodiscard]] uint64_t seed() const { return seed_; }
    [[nodiscard]] int32_t width() const { return elevation_.width(); }
    [[nodiscard]] int32_t height() const { return elevation_.height(); }

    [[nodiscard]] const PlateField& plateField() const { return plates_; }
    [[nodiscard]] const std::vector<Plate>& plates() const { return plates_.plates(); }
    [[nodiscard]] const Grid2D<int32_t>& plateIds() const { return plates_.plateIds(); }

    [[nodiscard]] const Grid2D<float>& elevation() const { return elevation_; }
    [[nodiscard]] const Grid2D<float>& temperature() const { return temperature_; }
    [[nodiscard]] const Grid2D<float>& moisture() const { return moisture_; }
    [[nodiscard]] const Grid2D<Biome>& biomes() const { return biomes_; }

    [[nodiscard]] float elevationAt(int32_t x, int32_t y) const { return elevation_.at(x, y); }
    [[nodiscard]] float temperatureAt(int32_t x, int32_t y) const { return temperature_.at(x, y); }
    [[nodiscard]] float moistureAt(int32_t x, int32_t y) const { return moisture_.at(x, y); }
    [[nodiscard]] Biome biomeAt(int32_t x, int32_t y) const { return biomes_.at(x, y); }

    [[nodiscard]] const std::vector<River>& rivers() const { return rivers_; }
    [[nodiscard]] const std::vector<RegionalFeature>& features() const { return features_; }

    /// FNV-1a digest of dimensions plus elevation, temperature, moisture and biome cells
    [[nodiscard]] uint64_t checksumValue() const;

    /// checksumValue() as 16 lowercase hex digits
    [[nodiscard]] std::string checksum() const;

private:
    uint64_t seed_;
    PlateField plates_;
    Grid2D<float> elevation_;
    Grid2D<float> temperature_;
    Grid2D<float> moisture_;
    Grid2D<Biome> biomes_;
    std::vector<River> rivers_;
    std::vector<RegionalFeature> features_;
};

}  // namespace tectogen::worldgen
