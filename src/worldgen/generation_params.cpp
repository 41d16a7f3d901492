#include "tectogen/worldgen/generation_params.hpp"
#include "tectogen/core/config_parser.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace tectogen::worldgen {

namespace {

int64_t area(int32_t width, int32_t height) {
    return static_cast<int64_t>(width) * static_cast<int64_t>(height);
}

int32_t clampCount(int64_t value) {
    return static_cast<int32_t>(std::min<int64_t>(value, std::numeric_limits<int32_t>::max()));
}

void require(bool condition, const char* message) {
    if (!condition) {
        throw std::invalid_argument(message);
    }
}

// Count keys override only when present and parseable
std::optional<int32_t> readCount(const ConfigDocument& doc, std::string_view key,
                                 std::optional<int32_t> current) {
    constexpr int kUnset = std::numeric_limits<int>::min();
    int value = doc.getInt(key, kUnset);
    if (value == kUnset) {
        return current;
    }
    return value;
}

}  // namespace

// ============================================================================
// Count resolution
// ============================================================================

int32_t GenerationParams::resolvePlateCount(int32_t width, int32_t height) const {
    if (plateCount) return *plateCount;
    return clampCount(std::max<int64_t>(4, area(width, height) / 10000));
}

int32_t GenerationParams::resolveRiverCount(int32_t width, int32_t height) const {
    if (riverCount) return *riverCount;
    return clampCount(std::max<int64_t>(3, area(width, height) / 8000));
}

int32_t GenerationParams::resolveFeatureCount(int32_t width, int32_t height) const {
    if (featureCount) return *featureCount;
    double base = static_cast<double>(std::max<int64_t>(3, area(width, height) / 5000));
    return clampCount(static_cast<int64_t>(base * static_cast<double>(featureDensity)));
}

// ============================================================================
// Validation
// ============================================================================

void GenerationParams::validate(int32_t width, int32_t height) const {
    require(width > 0, "world width must be positive");
    require(height > 0, "world height must be positive");

    require(!plateCount || *plateCount > 0, "plate count must be positive");
    require(!riverCount || *riverCount > 0, "river count must be positive");
    require(!featureCount || *featureCount > 0, "feature count must be positive");
    require(std::isfinite(featureDensity) && featureDensity >= 0.0f,
            "feature density must be non-negative");

    require(elevation.octaves >= 1, "elevation octaves must be at least 1");
    require(elevation.boundaryRadius >= 0, "elevation boundary radius must be non-negative");
    require(elevation.noiseScale > 0.0f, "elevation noise scale must be positive");

    require(climate.waterSearchRadius >= 1, "climate water search radius must be at least 1");
    require(climate.noiseScale > 0.0f, "climate noise scale must be positive");

    require(river.oceanThreshold < river.sourceThreshold,
            "river ocean threshold must be below the source threshold");
    require(river.sourceThreshold < river.sourceCeiling,
            "river source threshold must be below the source ceiling");
    require(river.climbTolerance >= 0.0f && river.climbTolerance <= 0.002f,
            "river climb tolerance must lie in [0, 0.002]");
    require(river.tieBreakJitter == 0.0f ||
                (river.tieBreakJitter > 0.0f && river.tieBreakJitter < river.climbTolerance),
            "river tie-break jitter must be below the climb tolerance");
    require(river.maxPathLength >= 0, "river maximum path length must be non-negative");

    require(feature.attemptsPerFeature >= 1, "feature attempts per feature must be at least 1");
    require(feature.minSeparation >= 0.0f, "feature separation must be non-negative");
    require(feature.minIntensity >= 0.0f && feature.minIntensity < 1.0f,
            "feature minimum intensity must lie in [0, 1)");
}

// ============================================================================
// Config loading
// ============================================================================

GenerationParams loadGenerationParams(const ConfigDocument& doc, GenerationParams base) {
    GenerationParams params = std::move(base);

    params.plateCount = readCount(doc, "plates", params.plateCount);
    params.riverCount = readCount(doc, "rivers", params.riverCount);
    params.featureCount = readCount(doc, "features", params.featureCount);
    params.featureDensity = doc.getFloat("feature_density", params.featureDensity);
    params.threads = static_cast<size_t>(
        std::max(0, doc.getInt("threads", static_cast<int>(params.threads))));
    params.verbose = doc.getBool("verbose", params.verbose);

    auto& e = params.elevation;
    e.continentalBase = doc.getFloat("elevation", "continental_base", e.continentalBase);
    e.oceanicBase = doc.getFloat("elevation", "oceanic_base", e.oceanicBase);
    e.noiseAmplitude = doc.getFloat("elevation", "noise_amplitude", e.noiseAmplitude);
    e.octaves = doc.getInt("elevation", "octaves", e.octaves);
    e.lacunarity = doc.getFloat("elevation", "lacunarity", e.lacunarity);
    e.persistence = doc.getFloat("elevation", "persistence", e.persistence);
    e.noiseScale = doc.getFloat("elevation", "noise_scale", e.noiseScale);
    e.boundaryRadius = doc.getInt("elevation", "boundary_radius", e.boundaryRadius);
    e.upliftScale = doc.getFloat("elevation", "uplift_scale", e.upliftScale);

    auto& c = params.climate;
    c.equatorTemperature = doc.getFloat("climate", "equator_temperature", c.equatorTemperature);
    c.poleTemperature = doc.getFloat("climate", "pole_temperature", c.poleTemperature);
    c.lapseRate = doc.getFloat("climate", "lapse_rate", c.lapseRate);
    c.lapseBase = doc.getFloat("climate", "lapse_base", c.lapseBase);
    c.temperatureNoise = doc.getFloat("climate", "temperature_noise", c.temperatureNoise);
    c.noiseScale = doc.getFloat("climate", "noise_scale", c.noiseScale);
    c.moistureContrast = doc.getFloat("climate", "moisture_contrast", c.moistureContrast);
    c.moistureNoiseWeight = doc.getFloat("climate", "moisture_noise_weight", c.moistureNoiseWeight);
    c.waterProximityWeight = doc.getFloat("climate", "water_proximity_weight", c.waterProximityWeight);
    c.waterSearchRadius = doc.getInt("climate", "water_search_radius", c.waterSearchRadius);
    c.minWaterProximity = doc.getFloat("climate", "min_water_proximity", c.minWaterProximity);
    c.waterThreshold = doc.getFloat("climate", "water_threshold", c.waterThreshold);

    auto& r = params.river;
    r.sourceThreshold = doc.getFloat("river", "source_threshold", r.sourceThreshold);
    r.sourceCeiling = doc.getFloat("river", "source_ceiling", r.sourceCeiling);
    r.oceanThreshold = doc.getFloat("river", "ocean_threshold", r.oceanThreshold);
    r.climbTolerance = doc.getFloat("river", "climb_tolerance", r.climbTolerance);
    r.tieBreakJitter = doc.getFloat("river", "tie_break_jitter", r.tieBreakJitter);
    r.maxPathLength = doc.getInt("river", "max_path_length", r.maxPathLength);

    auto& f = params.feature;
    f.attemptsPerFeature = doc.getInt("feature", "attempts_per_feature", f.attemptsPerFeature);
    f.minSeparation = doc.getFloat("feature", "min_separation", f.minSeparation);
    f.landThreshold = doc.getFloat("feature", "land_threshold", f.landThreshold);
    f.volcanoMinElevation = doc.getFloat("feature", "volcano_min_elevation", f.volcanoMinElevation);
    f.submergedMaxElevation = doc.getFloat("feature", "submerged_max_elevation", f.submergedMaxElevation);
    f.crystalMinElevation = doc.getFloat("feature", "crystal_min_elevation", f.crystalMinElevation);
    f.minIntensity = doc.getFloat("feature", "min_intensity", f.minIntensity);

    return params;
}

std::optional<GenerationParams> loadGenerationParamsFile(const std::string& path) {
    ConfigParser parser;
    auto doc = parser.parseFile(path);
    if (!doc) {
        return std::nullopt;
    }
    return loadGenerationParams(*doc);
}

}  // namespace tectogen::worldgen
