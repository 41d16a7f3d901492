#include "tectogen/worldgen/regional_feature.hpp"
#include "tectogen/core/log.hpp"
#include "tectogen/worldgen/noise.hpp"

#include <stdexcept>
#include <string>

namespace tectogen::worldgen {

static_assert(kFeatureTypeTable[static_cast<size_t>(FeatureType::CrystalCave)].type ==
              FeatureType::CrystalCave);

FeaturePlacer::FeaturePlacer(const FeatureConfig& config)
    : config_(config) {
}

int32_t FeaturePlacer::totalWeight() {
    int32_t total = 0;
    for (const auto& info : kFeatureTypeTable) {
        total += info.weight;
    }
    return total;
}

FeatureType FeaturePlacer::typeForRoll(int32_t roll) {
    for (const auto& info : kFeatureTypeTable) {
        if (roll < info.weight) {
            return info.type;
        }
        roll -= info.weight;
    }
    return kFeatureTypeTable.back().type;
}

bool FeaturePlacer::isCompatible(FeatureType type, float elevation, Biome biome) const {
    switch (type) {
        case FeatureType::Volcano:
            return elevation > config_.volcanoMinElevation && !isWater(biome);

        case FeatureType::SubmergedCity:
            return elevation < config_.submergedMaxElevation && isWater(biome);

        case FeatureType::MagicZone:
        case FeatureType::AncientRuins:
            return elevation >= config_.landThreshold && !isWater(biome) && isHabitable(biome);

        case FeatureType::CrystalCave:
            return elevation >= config_.landThreshold && !isWater(biome) &&
                   elevation > config_.crystalMinElevation;
    }
    return false;
}

PlacementResult FeaturePlacer::evaluate(FeatureType type, int32_t x, int32_t y,
                                        const Grid2D<float>& elevation,
                                        const Grid2D<Biome>& biomes,
                                        const std::vector<RegionalFeature>& accepted) const {
    if (!elevation.inBounds(x, y)) {
        return PlacementResult::OutOfBounds;
    }
    if (!isCompatible(type, elevation(x, y), biomes(x, y))) {
        return PlacementResult::Incompatible;
    }

    const float minSq = config_.minSeparation * config_.minSeparation;
    for (const auto& other : accepted) {
        float dx = static_cast<float>(x - other.x);
        float dy = static_cast<float>(y - other.y);
        if (dx * dx + dy * dy < minSq) {
            return PlacementResult::TooClose;
        }
    }
    return PlacementResult::Placed;
}

std::vector<RegionalFeature> FeaturePlacer::place(const Grid2D<float>& elevation,
                                                  const Grid2D<Biome>& biomes,
                                                  uint64_t seed, int32_t featureCount,
                                                  const Logger* logger) const {
    if (featureCount < 0) {
        throw std::invalid_argument("FeaturePlacer: feature count must be non-negative, got " +
                                    std::to_string(featureCount));
    }
    if (biomes.width() != elevation.width() || biomes.height() != elevation.height()) {
        throw std::invalid_argument("FeaturePlacer: elevation and biome grids differ in size");
    }

    std::vector<RegionalFeature> features;
    if (featureCount == 0 || elevation.empty()) {
        return features;
    }

    SeedStream stream(NoiseHash::deriveSeed(seed, StageSalt::Features));
    const int32_t weightTotal = totalWeight();
    const int64_t maxAttempts = static_cast<int64_t>(featureCount) * config_.attemptsPerFeature;

    size_t incompatible = 0;
    size_t tooClose = 0;
    int64_t attempts = 0;

    while (features.size() < static_cast<size_t>(featureCount) && attempts < maxAttempts) {
        ++attempts;

        // Fixed draw order per attempt: type, x, y, intensity
        FeatureType type = typeForRoll(stream.nextInt(weightTotal));
        int32_t x = stream.nextInt(elevation.width());
        int32_t y = stream.nextInt(elevation.height());
        float intensity = stream.nextRange(config_.minIntensity, 1.0f);

        switch (evaluate(type, x, y, elevation, biomes, features)) {
            case PlacementResult::Placed:
                features.push_back(RegionalFeature{
                    static_cast<int32_t>(features.size()), type, x, y, intensity});
                break;
            case PlacementResult::Incompatible:
                ++incompatible;
                break;
            case PlacementResult::TooClose:
                ++tooClose;
                break;
            case PlacementResult::OutOfBounds:
                break;
        }
    }

    if (logger) {
        logger->log("placed " + std::to_string(features.size()) + " of " +
                    std::to_string(featureCount) + " features in " + std::to_string(attempts) +
                    " attempts (" + std::to_string(incompatible) + " incompatible, " +
                    std::to_string(tooClose) + " too close)");
    }

    return features;
}

}  // namespace tectogen::worldgen
