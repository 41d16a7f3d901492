#include "tectogen/worldgen/biome.hpp"
#include "tectogen/core/parallel.hpp"

#include <stdexcept>

namespace tectogen::worldgen {

// Table rows must line up with the enum
static_assert(kBiomeTable[static_cast<size_t>(Biome::Ocean)].biome == Biome::Ocean);
static_assert(kBiomeTable[static_cast<size_t>(Biome::Hills)].biome == Biome::Hills);
static_assert(kBiomeTable[static_cast<size_t>(Biome::Magical)].biome == Biome::Magical);

Biome classifyBiome(float elevation, float temperature, float moisture) {
    if (elevation < 0.15f) return Biome::Ocean;
    if (elevation < 0.2f) return Biome::Lake;

    if (elevation > 0.6f && temperature > 25.0f && moisture > 0.6f) {
        return Biome::Volcanic;
    }

    if (elevation > 0.8f) return Biome::Mountain;
    if (elevation >= 0.6f) return Biome::Hills;

    if (temperature < 0.0f) return Biome::Tundra;
    if (temperature < 10.0f) return Biome::Taiga;

    if (temperature > 25.0f && moisture < 0.3f) return Biome::Desert;

    if (temperature > 22.0f) {
        return moisture > 0.7f ? Biome::Jungle : Biome::Savanna;
    }

    if (moisture > 0.8f) return Biome::Swamp;
    if (moisture > 0.6f) return Biome::Forest;

    return Biome::Grassland;
}

Grid2D<Biome> classifyBiomes(const Grid2D<float>& elevation,
                             const Grid2D<float>& temperature,
                             const Grid2D<float>& moisture,
                             size_t threads) {
    const int32_t width = elevation.width();
    const int32_t height = elevation.height();
    if (temperature.width() != width || temperature.height() != height ||
        moisture.width() != width || moisture.height() != height) {
        throw std::invalid_argument("classifyBiomes: grid dimensions differ");
    }

    Grid2D<Biome> biomes(width, height, Biome::Ocean);

    parallelRows(height, threads, [&](int32_t rowBegin, int32_t rowEnd) {
        for (int32_t y = rowBegin; y < rowEnd; ++y) {
            for (int32_t x = 0; x < width; ++x) {
                biomes(x, y) = classifyBiome(elevation(x, y), temperature(x, y), moisture(x, y));
            }
        }
    });

    return biomes;
}

}  // namespace tectogen::worldgen
