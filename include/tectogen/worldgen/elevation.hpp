/**
 * @file elevation.hpp
 * @brief Elevation synthesis from plate kind, fractal noise and boundary uplift
 *
 * elevation(x, y) = clamp(plateBase + noiseAmplitude * fbm(x, y) + uplift, 0, 1)
 *
 * Uplift is the largest collisionIntensity * upliftScale over neighbours in
 * the boundary band that sit on a plate the tile's own plate collides with.
 */

#pragma once

#include "tectogen/core/grid.hpp"
#include "tectogen/worldgen/generation_params.hpp"
#include "tectogen/worldgen/noise.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace tectogen::worldgen {

class PlateField;

class ElevationSynthesizer {
public:
    /// @param seed World seed; the elevation stage seed is derived from it
    ElevationSynthesizer(uint64_t seed, const ElevationConfig& config);

    /// Produce the full grid, row-parallel over `threads` workers (0 = hardware)
    [[nodiscard]] Grid2D<float> synthesize(const PlateField& plates, size_t threads = 1) const;

    /// Elevation of a single tile
    [[nodiscard]] float sample(const PlateField& plates, int32_t x, int32_t y) const;

    /// Boundary uplift contribution for a single tile
    [[nodiscard]] float upliftAt(const PlateField& plates, int32_t x, int32_t y) const;

    [[nodiscard]] const ElevationConfig& config() const { return config_; }

private:
    ElevationConfig config_;
    std::unique_ptr<Noise2D> noise_;
};

}  // namespace tectogen::worldgen
