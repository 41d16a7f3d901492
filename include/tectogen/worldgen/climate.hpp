/**
 * @file climate.hpp
 * @brief Temperature and moisture fields
 *
 * Temperature (degrees C) falls from the equator (middle row) to the poles
 * (top and bottom rows), cools with elevation above a lapse base and is
 * perturbed by low-frequency noise.
 *
 * Moisture in [0, 1] blends noise with proximity to water: tiles below the
 * water threshold score 1, land scores 1 - distance / radius to the nearest
 * water tile within the search radius, floored at minWaterProximity.
 */

#pragma once

#include "tectogen/core/grid.hpp"
#include "tectogen/worldgen/generation_params.hpp"
#include "tectogen/worldgen/noise.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace tectogen::worldgen {

struct ClimateFields {
    Grid2D<float> temperature;
    Grid2D<float> moisture;
};

class ClimateModel {
public:
    /// @param seed World seed; temperature and moisture stage seeds derive from it
    ClimateModel(uint64_t seed, const ClimateConfig& config);

    /// Compute both fields, row-parallel over `threads` workers (0 = hardware)
    [[nodiscard]] ClimateFields compute(const Grid2D<float>& elevation, size_t threads = 1) const;

    [[nodiscard]] float temperatureAt(const Grid2D<float>& elevation, int32_t x, int32_t y) const;
    [[nodiscard]] float moistureAt(const Grid2D<float>& elevation, int32_t x, int32_t y) const;

    /// 1 on water, decaying with distance to the nearest water tile
    [[nodiscard]] float waterProximity(const Grid2D<float>& elevation, int32_t x, int32_t y) const;

    /// 0 at the equator row, 1 at the outermost rows
    [[nodiscard]] static float latitude(int32_t y, int32_t height);

    [[nodiscard]] const ClimateConfig& config() const { return config_; }

private:
    ClimateConfig config_;
    std::unique_ptr<Noise2D> temperatureNoise_;
    std::unique_ptr<Noise2D> moistureNoise_;
};

}  // namespace tectogen::worldgen
