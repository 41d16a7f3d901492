/**
 * @file biome.hpp
 * @brief Biome tags, their static properties and the climate classifier
 *
 * Biome properties live in an immutable table indexed by tag; there is no
 * runtime registry. The classifier is a pure function of
 * (elevation, temperature, moisture) and is safe to call from any thread.
 */

#pragma once

#include "tectogen/core/grid.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tectogen::worldgen {

// ============================================================================
// Biome
// ============================================================================

/// Biome tag. Values are stable: they feed the world checksum.
enum class Biome : uint8_t {
    Ocean,
    DeepOcean,
    Lake,
    Tundra,
    Taiga,
    Ice,
    Glacier,
    Grassland,
    Forest,
    Swamp,
    Desert,
    Savanna,
    Jungle,
    Rainforest,
    Hills,
    Mountain,
    Highland,
    Badlands,
    Volcanic,
    Magical,
};

constexpr size_t kBiomeCount = static_cast<size_t>(Biome::Magical) + 1;

// ============================================================================
// BiomeProperties
// ============================================================================

/// Static biome definition consumed by the economy and settlement layers
struct BiomeProperties {
    Biome biome;
    std::string_view displayName;

    float minElevation;
    float maxElevation;
    int32_t minTemperature;      ///< Celsius
    int32_t maxTemperature;
    float moisturePreference;    ///< 0 = dry, 1 = wet
    float resourceAbundance;     ///< Multiplier, 1 = baseline

    char mapSymbol;              ///< Glyph used by ASCII map dumps
};

inline constexpr std::array<BiomeProperties, kBiomeCount> kBiomeTable = {{
    // Water
    {Biome::Ocean,      "Ocean",      0.0f,  0.15f, -20, 30, 1.0f, 0.6f, '~'},
    {Biome::DeepOcean,  "Deep Ocean", 0.0f,  0.1f,  -20, 15, 1.0f, 0.4f, '='},
    {Biome::Lake,       "Lake",       0.15f, 0.2f,  -10, 25, 0.8f, 0.7f, 'o'},
    // Cold
    {Biome::Tundra,     "Tundra",     0.0f,  1.0f,  -10, 5,  0.3f, 0.2f, '_'},
    {Biome::Taiga,      "Taiga",      0.2f,  0.7f,  0,   10, 0.5f, 0.6f, 't'},
    {Biome::Ice,        "Ice",        0.0f,  0.3f,  -40, -5, 0.1f, 0.1f, '#'},
    {Biome::Glacier,    "Glacier",    0.5f,  1.0f,  -30, 0,  0.3f, 0.2f, 'G'},
    // Temperate
    {Biome::Grassland,  "Grassland",  0.2f,  0.7f,  5,   22, 0.4f, 0.9f, '.'},
    {Biome::Forest,     "Forest",     0.2f,  0.7f,  5,   25, 0.7f, 0.8f, 'f'},
    {Biome::Swamp,      "Swamp",      0.2f,  0.5f,  10,  30, 0.9f, 0.7f, '%'},
    // Warm and dry
    {Biome::Desert,     "Desert",     0.2f,  0.7f,  25,  45, 0.1f, 0.1f, 'd'},
    {Biome::Savanna,    "Savanna",    0.2f,  0.6f,  22,  35, 0.5f, 0.7f, 's'},
    // Hot and wet
    {Biome::Jungle,     "Jungle",     0.2f,  0.5f,  22,  35, 0.8f, 0.9f, 'J'},
    {Biome::Rainforest, "Rainforest", 0.2f,  0.5f,  20,  32, 0.9f, 1.0f, 'R'},
    // Elevated
    {Biome::Hills,      "Hills",      0.6f,  0.8f,  0,   20, 0.4f, 0.6f, 'h'},
    {Biome::Mountain,   "Mountain",   0.8f,  1.0f,  -10, 10, 0.5f, 0.5f, '^'},
    {Biome::Highland,   "Highland",   0.5f,  0.8f,  -5,  15, 0.5f, 0.6f, 'H'},
    {Biome::Badlands,   "Badlands",   0.3f,  0.6f,  25,  40, 0.2f, 0.3f, 'b'},
    // Special
    {Biome::Volcanic,   "Volcanic",   0.6f,  0.9f,  25,  50, 0.6f, 1.2f, 'V'},
    {Biome::Magical,    "Magical",    0.3f,  0.7f,  5,   25, 0.6f, 1.0f, '*'},
}};

[[nodiscard]] constexpr const BiomeProperties& biomeProperties(Biome biome) {
    return kBiomeTable[static_cast<size_t>(biome)];
}

[[nodiscard]] constexpr std::string_view biomeName(Biome biome) {
    return biomeProperties(biome).displayName;
}

/// Ocean, DeepOcean and Lake
[[nodiscard]] constexpr bool isWater(Biome biome) {
    return biome == Biome::Ocean || biome == Biome::DeepOcean || biome == Biome::Lake;
}

/// Land that settlements can occupy (not water, not Mountain)
[[nodiscard]] constexpr bool isHabitable(Biome biome) {
    return !isWater(biome) && biome != Biome::Mountain;
}

// ============================================================================
// Classification
// ============================================================================

/**
 * @brief Classify a tile, first matching rule wins
 *
 *   elevation < 0.15                       Ocean
 *   elevation < 0.2                        Lake
 *   e > 0.6, t > 25, m > 0.6               Volcanic
 *   elevation > 0.8                        Mountain
 *   elevation >= 0.6                       Hills
 *   t < 0                                  Tundra
 *   t < 10                                 Taiga
 *   t > 25, m < 0.3                        Desert
 *   t > 22                                 Jungle (m > 0.7) or Savanna
 *   m > 0.8                                Swamp
 *   m > 0.6                                Forest
 *   otherwise                              Grassland
 */
[[nodiscard]] Biome classifyBiome(float elevation, float temperature, float moisture);

/// Classify every tile, row-parallel over `threads` workers (0 = hardware).
/// Throws std::invalid_argument if the grids differ in size.
[[nodiscard]] Grid2D<Biome> classifyBiomes(const Grid2D<float>& elevation,
                                           const Grid2D<float>& temperature,
                                           const Grid2D<float>& moisture,
                                           size_t threads = 1);

}  // namespace tectogen::worldgen
