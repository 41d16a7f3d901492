#include "tectogen/worldgen/climate.hpp"
#include "tectogen/core/parallel.hpp"
#include "tectogen/worldgen/noise_ops.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tectogen::worldgen {

ClimateModel::ClimateModel(uint64_t seed, const ClimateConfig& config)
    : config_(config),
      temperatureNoise_(NoiseFactory::perlinFBM(NoiseHash::deriveSeed(seed, StageSalt::Temperature),
                                                3, config.noiseScale)),
      moistureNoise_(NoiseFactory::perlinFBM(NoiseHash::deriveSeed(seed, StageSalt::Moisture),
                                             4, config.noiseScale)) {
}

ClimateFields ClimateModel::compute(const Grid2D<float>& elevation, size_t threads) const {
    ClimateFields fields{
        Grid2D<float>(elevation.width(), elevation.height(), 0.0f),
        Grid2D<float>(elevation.width(), elevation.height(), 0.0f),
    };

    parallelRows(elevation.height(), threads, [&](int32_t rowBegin, int32_t rowEnd) {
        for (int32_t y = rowBegin; y < rowEnd; ++y) {
            for (int32_t x = 0; x < elevation.width(); ++x) {
                fields.temperature(x, y) = temperatureAt(elevation, x, y);
                fields.moisture(x, y) = moistureAt(elevation, x, y);
            }
        }
    });

    return fields;
}

float ClimateModel::latitude(int32_t y, int32_t height) {
    if (height <= 0) return 0.0f;
    float t = (static_cast<float>(y) + 0.5f) / static_cast<float>(height);
    return std::abs(t * 2.0f - 1.0f);
}

float ClimateModel::temperatureAt(const Grid2D<float>& elevation, int32_t x, int32_t y) const {
    float lat = latitude(y, elevation.height());
    float base = config_.equatorTemperature +
                 (config_.poleTemperature - config_.equatorTemperature) * lat;

    float e = elevation.at(x, y);
    float lapse = config_.lapseRate * std::max(0.0f, e - config_.lapseBase);

    float n = temperatureNoise_->evaluate(static_cast<float>(x) + 0.5f, static_cast<float>(y) + 0.5f);
    return base - lapse + config_.temperatureNoise * n;
}

float ClimateModel::moistureAt(const Grid2D<float>& elevation, int32_t x, int32_t y) const {
    float n = moistureNoise_->evaluate(static_cast<float>(x) + 0.5f, static_cast<float>(y) + 0.5f);
    float noise01 = std::clamp(0.5f + 0.5f * config_.moistureContrast * n, 0.0f, 1.0f);

    float value = config_.moistureNoiseWeight * noise01 +
                  config_.waterProximityWeight * waterProximity(elevation, x, y);
    return std::clamp(value, 0.0f, 1.0f);
}

float ClimateModel::waterProximity(const Grid2D<float>& elevation, int32_t x, int32_t y) const {
    if (elevation.at(x, y) < config_.waterThreshold) {
        return 1.0f;
    }

    const int32_t radius = config_.waterSearchRadius;
    int32_t bestSq = std::numeric_limits<int32_t>::max();

    int32_t yMin = std::max(0, y - radius);
    int32_t yMax = std::min(elevation.height() - 1, y + radius);
    int32_t xMin = std::max(0, x - radius);
    int32_t xMax = std::min(elevation.width() - 1, x + radius);

    for (int32_t ny = yMin; ny <= yMax; ++ny) {
        for (int32_t nx = xMin; nx <= xMax; ++nx) {
            if (elevation(nx, ny) < config_.waterThreshold) {
                int32_t dx = nx - x;
                int32_t dy = ny - y;
                bestSq = std::min(bestSq, dx * dx + dy * dy);
            }
        }
    }

    if (bestSq == std::numeric_limits<int32_t>::max()) {
        return config_.minWaterProximity;
    }

    float dist = std::sqrt(static_cast<float>(bestSq));
    return std::max(config_.minWaterProximity, 1.0f - dist / static_cast<float>(radius));
}

}  // namespace tectogen::worldgen
