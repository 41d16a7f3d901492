#include "tectogen/worldgen/elevation.hpp"
#include "tectogen/core/parallel.hpp"
#include "tectogen/worldgen/noise_ops.hpp"
#include "tectogen/worldgen/plate_field.hpp"

#include <algorithm>
#include <cstdlib>

namespace tectogen::worldgen {

ElevationSynthesizer::ElevationSynthesizer(uint64_t seed, const ElevationConfig& config)
    : config_(config),
      noise_(NoiseFactory::perlinFBM(NoiseHash::deriveSeed(seed, StageSalt::Elevation),
                                     config.octaves, config.noiseScale,
                                     config.lacunarity, config.persistence)) {
}

Grid2D<float> ElevationSynthesizer::synthesize(const PlateField& plates, size_t threads) const {
    Grid2D<float> elevation(plates.width(), plates.height(), 0.0f);

    // Each band writes a disjoint set of rows
    parallelRows(plates.height(), threads, [&](int32_t rowBegin, int32_t rowEnd) {
        for (int32_t y = rowBegin; y < rowEnd; ++y) {
            for (int32_t x = 0; x < plates.width(); ++x) {
                elevation(x, y) = sample(plates, x, y);
            }
        }
    });

    return elevation;
}

float ElevationSynthesizer::sample(const PlateField& plates, int32_t x, int32_t y) const {
    const Plate& plate = plates.plateAt(x, y);
    float base = plate.kind() == PlateKind::Continental ? config_.continentalBase
                                                        : config_.oceanicBase;

    // Sample at tile centres so integer lattice points never land on a tile
    float n = noise_->evaluate(static_cast<float>(x) + 0.5f, static_cast<float>(y) + 0.5f);

    float value = base + config_.noiseAmplitude * n + upliftAt(plates, x, y);
    return std::clamp(value, 0.0f, 1.0f);
}

float ElevationSynthesizer::upliftAt(const PlateField& plates, int32_t x, int32_t y) const {
    const int32_t radius = config_.boundaryRadius;
    const Plate& own = plates.plateAt(x, y);
    const auto& ids = plates.plateIds();

    float uplift = 0.0f;
    for (int32_t dy = -radius; dy <= radius; ++dy) {
        int32_t span = radius - std::abs(dy);
        for (int32_t dx = -span; dx <= span; ++dx) {
            if (dx == 0 && dy == 0) continue;

            int32_t nx = x + dx;
            int32_t ny = y + dy;
            if (!ids.inBounds(nx, ny)) continue;

            int32_t neighborId = ids(nx, ny);
            if (neighborId == own.id()) continue;

            const Plate& neighbor = plates.plate(neighborId);
            if (own.isColliding(neighbor)) {
                uplift = std::max(uplift, own.collisionIntensity(neighbor) * config_.upliftScale);
            }
        }
    }
    return uplift;
}

}  // namespace tectogen::worldgen
