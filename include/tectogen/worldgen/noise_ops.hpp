/**
 * @file noise_ops.hpp
 * @brief Composable noise operations: fractal stacking and scaling
 *
 * Operations wrap Noise2D via unique_ptr so they compose:
 *
 *   auto terrain = std::make_unique<FBMNoise2D>(
 *       std::make_unique<PerlinNoise2D>(seed), 4);
 */

#pragma once

#include "tectogen/worldgen/noise.hpp"

#include <cstdint>
#include <memory>

namespace tectogen::worldgen {

// ============================================================================
// Fractal noise (octave stacking)
// ============================================================================

/// Fractal Brownian Motion: stacks octaves of noise for natural detail
class FBMNoise2D : public Noise2D {
public:
    /// @param base Base noise source (takes ownership)
    /// @param octaves Number of octaves to stack (at least 1)
    /// @param lacunarity Frequency multiplier per octave
    /// @param persistence Amplitude multiplier per octave
    FBMNoise2D(std::unique_ptr<Noise2D> base, int octaves = 4,
               float lacunarity = 2.0f, float persistence = 0.5f);

    [[nodiscard]] float evaluate(float x, float y) const override;

private:
    std::unique_ptr<Noise2D> base_;
    int octaves_;
    float lacunarity_;
    float persistence_;
};

// ============================================================================
// Utility adapters
// ============================================================================

/// Scale frequency and amplitude of a noise source
class ScaledNoise2D : public Noise2D {
public:
    /// @param source Base noise
    /// @param frequencyX X frequency multiplier
    /// @param frequencyY Y frequency multiplier
    /// @param amplitude Output multiplier
    /// @param offset Added to output after amplitude scaling
    ScaledNoise2D(std::unique_ptr<Noise2D> source,
                  float frequencyX, float frequencyY,
                  float amplitude = 1.0f, float offset = 0.0f);

    [[nodiscard]] float evaluate(float x, float y) const override;

private:
    std::unique_ptr<Noise2D> source_;
    float freqX_, freqY_;
    float amplitude_, offset_;
};

// ============================================================================
// Convenience factories
// ============================================================================

namespace NoiseFactory {

/// Perlin noise with FBM octave stacking, sampled at `frequency` per tile
[[nodiscard]] std::unique_ptr<Noise2D> perlinFBM(
    uint64_t seed, int octaves = 4, float frequency = 1.0f / 48.0f,
    float lacunarity = 2.0f, float persistence = 0.5f);

}  // namespace NoiseFactory

}  // namespace tectogen::worldgen
