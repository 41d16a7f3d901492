/**
 * @file noise_ops.cpp
 * @brief Composable noise operations and convenience factories
 */

#include "tectogen/worldgen/noise_ops.hpp"

#include <algorithm>
#include <utility>

namespace tectogen::worldgen {

// ============================================================================
// FBM (Fractal Brownian Motion)
// ============================================================================

FBMNoise2D::FBMNoise2D(std::unique_ptr<Noise2D> base, int octaves,
                       float lacunarity, float persistence)
    : base_(std::move(base)), octaves_(std::max(1, octaves)),
      lacunarity_(lacunarity), persistence_(persistence) {
}

float FBMNoise2D::evaluate(float x, float y) const {
    float value = 0.0f;
    float amplitude = 1.0f;
    float frequency = 1.0f;
    float maxAmplitude = 0.0f;

    for (int i = 0; i < octaves_; ++i) {
        value += base_->evaluate(x * frequency, y * frequency) * amplitude;
        maxAmplitude += amplitude;
        amplitude *= persistence_;
        frequency *= lacunarity_;
    }

    return value / maxAmplitude;
}

// ============================================================================
// Utility adapters
// ============================================================================

ScaledNoise2D::ScaledNoise2D(std::unique_ptr<Noise2D> source,
                             float frequencyX, float frequencyY,
                             float amplitude, float offset)
    : source_(std::move(source)), freqX_(frequencyX), freqY_(frequencyY),
      amplitude_(amplitude), offset_(offset) {
}

float ScaledNoise2D::evaluate(float x, float y) const {
    return source_->evaluate(x * freqX_, y * freqY_) * amplitude_ + offset_;
}

// ============================================================================
// NoiseFactory convenience functions
// ============================================================================

namespace NoiseFactory {

std::unique_ptr<Noise2D> perlinFBM(uint64_t seed, int octaves, float frequency,
                                   float lacunarity, float persistence) {
    auto base = std::make_unique<PerlinNoise2D>(seed);
    auto fbm = std::make_unique<FBMNoise2D>(std::move(base), octaves, lacunarity, persistence);
    return std::make_unique<ScaledNoise2D>(std::move(fbm), frequency, frequency);
}

}  // namespace NoiseFactory

}  // namespace tectogen::worldgen
