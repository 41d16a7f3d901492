/**
 * @file generation_params.hpp
 * @brief Tunable parameters for world generation
 *
 * Every constant a stage uses lives here with its default, so a config file
 * can retune the pipeline without code changes. Counts left unset are
 * derived from the world area.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace tectogen {
class ConfigDocument;
}

namespace tectogen::worldgen {

// ============================================================================
// Stage salts
// ============================================================================

/// Salts for deriving per-stage seeds: deriveSeed(worldSeed, salt)
namespace StageSalt {
constexpr uint64_t Plates = 0x706c61746573ULL;
constexpr uint64_t Elevation = 0x656c6576ULL;
constexpr uint64_t Temperature = 0x74656d70ULL;
constexpr uint64_t Moisture = 0x6d6f6973ULL;
constexpr uint64_t Rivers = 0x72697665ULL;
constexpr uint64_t Features = 0x66656174ULL;
}  // namespace StageSalt

// ============================================================================
// Per-stage configuration
// ============================================================================

struct ElevationConfig {
    float continentalBase = 0.5f;
    float oceanicBase = 0.1f;
    float noiseAmplitude = 0.5f;
    int octaves = 4;
    float lacunarity = 2.0f;
    float persistence = 0.5f;
    float noiseScale = 1.0f / 48.0f;   ///< Noise frequency per tile
    int boundaryRadius = 1;            ///< Manhattan radius of the uplift band
    float upliftScale = 0.3f;
};

struct ClimateConfig {
    float equatorTemperature = 32.0f;
    float poleTemperature = -12.0f;
    float lapseRate = 15.0f;           ///< Degrees lost per unit of elevation above lapseBase
    float lapseBase = 0.2f;
    float temperatureNoise = 4.0f;     ///< Amplitude in degrees
    float noiseScale = 1.0f / 32.0f;
    float moistureContrast = 1.5f;     ///< Stretch of moisture noise around 0.5
    float moistureNoiseWeight = 0.6f;
    float waterProximityWeight = 0.4f;
    int waterSearchRadius = 10;
    float minWaterProximity = 0.1f;
    float waterThreshold = 0.2f;       ///< Tiles below this elevation count as water
};

struct RiverConfig {
    float sourceThreshold = 0.6f;
    float sourceCeiling = 0.95f;
    float oceanThreshold = 0.2f;
    float climbTolerance = 0.001f;     ///< Max rise allowed per search step
    float tieBreakJitter = 0.00005f;   ///< Half-width of the priority perturbation
    int maxPathLength = 0;             ///< 0 = 2 * min(width, height)
};

struct FeatureConfig {
    int attemptsPerFeature = 10;
    float minSeparation = 10.0f;
    float landThreshold = 0.2f;
    float volcanoMinElevation = 0.7f;
    float submergedMaxElevation = 0.2f;
    float crystalMinElevation = 0.5f;
    float minIntensity = 0.3f;
};

// ============================================================================
// GenerationParams
// ============================================================================

/**
 * @brief Caller-facing generation options
 *
 * Counts are optional overrides; unset counts fall back to area-based
 * defaults. validate() rejects impossible values with std::invalid_argument
 * before any stage runs.
 */
struct GenerationParams {
    std::optional<int32_t> plateCount;
    std::optional<int32_t> riverCount;
    std::optional<int32_t> featureCount;
    float featureDensity = 1.0f;
    size_t threads = 0;                ///< 0 = hardware concurrency
    bool verbose = false;

    ElevationConfig elevation;
    ClimateConfig climate;
    RiverConfig river;
    FeatureConfig feature;

    /// max(4, width*height/10000) unless overridden
    [[nodiscard]] int32_t resolvePlateCount(int32_t width, int32_t height) const;

    /// max(3, width*height/8000) unless overridden
    [[nodiscard]] int32_t resolveRiverCount(int32_t width, int32_t height) const;

    /// max(3, width*height/5000) * featureDensity unless overridden
    [[nodiscard]] int32_t resolveFeatureCount(int32_t width, int32_t height) const;

    /// Throws std::invalid_argument describing the first bad value
    void validate(int32_t width, int32_t height) const;
};

// ============================================================================
// Config loading
// ============================================================================

/**
 * @brief Map a parsed config document onto GenerationParams
 *
 * Recognized keys:
 *   plates, rivers, features, feature_density, threads, verbose
 *   elevation:<name>, climate:<name>, river:<name>, feature:<name>
 *
 * Missing keys keep their defaults; unparseable values fall back to defaults.
 */
[[nodiscard]] GenerationParams loadGenerationParams(const ConfigDocument& doc,
                                                    GenerationParams base = {});

/// Parse a config file and map it. Returns nullopt if the file cannot be opened.
[[nodiscard]] std::optional<GenerationParams> loadGenerationParamsFile(const std::string& path);

}  // namespace tectogen::worldgen
