/**
 * @file regional_feature.hpp
 * @brief Regional points of interest and their placement
 *
 * Features are rare landmarks (volcanoes, ruins, ...) placed after biomes.
 * Each placement attempt draws a weighted type, a tile and an intensity from
 * the feature stage stream; the attempt is kept only if the tile suits the
 * type and lies at least minSeparation from every accepted feature.
 */

#pragma once

#include "tectogen/core/grid.hpp"
#include "tectogen/worldgen/biome.hpp"
#include "tectogen/worldgen/generation_params.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace tectogen {
class Logger;
}

namespace tectogen::worldgen {

// ============================================================================
// FeatureType
// ============================================================================

enum class FeatureType : uint8_t {
    Volcano,
    MagicZone,
    SubmergedCity,
    AncientRuins,
    CrystalCave,
};

constexpr size_t kFeatureTypeCount = static_cast<size_t>(FeatureType::CrystalCave) + 1;

/// Static descriptor for a feature type
struct FeatureTypeInfo {
    FeatureType type;
    std::string_view displayName;
    int32_t weight;                  ///< Relative placement weight
    float minElevation;              ///< Nominal elevation window
    float maxElevation;
    std::string_view effectDescription;
};

inline constexpr std::array<FeatureTypeInfo, kFeatureTypeCount> kFeatureTypeTable = {{
    {FeatureType::Volcano, "Volcano", 2, 0.7f, 1.0f,
     "Increased fire damage, obsidian resources, risk of eruption"},
    {FeatureType::MagicZone, "Magic Zone", 3, 0.2f, 0.8f,
     "Enhanced magical abilities, rare spell components, mana regeneration"},
    {FeatureType::SubmergedCity, "Submerged City", 1, 0.0f, 0.2f,
     "Ancient artifacts, treasure, underwater exploration required"},
    {FeatureType::AncientRuins, "Ancient Ruins", 4, 0.2f, 0.9f,
     "Historical lore, rare items, possible guardian enemies"},
    {FeatureType::CrystalCave, "Crystal Cave", 2, 0.5f, 1.0f,
     "Crystal resources, light magic boost, gem mining"},
}};

[[nodiscard]] constexpr const FeatureTypeInfo& featureTypeInfo(FeatureType type) {
    return kFeatureTypeTable[static_cast<size_t>(type)];
}

[[nodiscard]] constexpr std::string_view featureTypeName(FeatureType type) {
    return featureTypeInfo(type).displayName;
}

// ============================================================================
// RegionalFeature
// ============================================================================

struct RegionalFeature {
    int32_t id = 0;
    FeatureType type = FeatureType::Volcano;
    int32_t x = 0;
    int32_t y = 0;
    float intensity = 0.0f;          ///< [0, 1]

    [[nodiscard]] std::string_view effectDescription() const {
        return featureTypeInfo(type).effectDescription;
    }

    [[nodiscard]] bool operator==(const RegionalFeature& other) const = default;
};

// ============================================================================
// FeaturePlacer
// ============================================================================

/// Outcome of a single placement attempt
enum class PlacementResult {
    Placed,
    OutOfBounds,
    Incompatible,   ///< Tile elevation or biome does not suit the type
    TooClose,       ///< Within minSeparation of an accepted feature
};

class FeaturePlacer {
public:
    explicit FeaturePlacer(const FeatureConfig& config);

    /**
     * @brief Place up to featureCount features
     *
     * Makes at most featureCount * attemptsPerFeature attempts and never
     * returns more than featureCount features.
     *
     * @param seed World seed; the feature stage seed is derived from it
     * @throws std::invalid_argument if featureCount is negative or the grids differ in size
     */
    [[nodiscard]] std::vector<RegionalFeature> place(const Grid2D<float>& elevation,
                                                     const Grid2D<Biome>& biomes,
                                                     uint64_t seed, int32_t featureCount,
                                                     const Logger* logger = nullptr) const;

    /// Whether a feature of `type` may sit on a tile with this elevation and biome
    [[nodiscard]] bool isCompatible(FeatureType type, float elevation, Biome biome) const;

    /// Check one candidate against bounds, compatibility and separation
    [[nodiscard]] PlacementResult evaluate(FeatureType type, int32_t x, int32_t y,
                                           const Grid2D<float>& elevation,
                                           const Grid2D<Biome>& biomes,
                                           const std::vector<RegionalFeature>& accepted) const;

    /// Weighted type draw from a value in [0, total weight)
    [[nodiscard]] static FeatureType typeForRoll(int32_t roll);

    [[nodiscard]] static int32_t totalWeight();

    [[nodiscard]] const FeatureConfig& config() const { return config_; }

private:
    FeatureConfig config_;
};

}  // namespace tectogen::worldgen
