#include "tectogen/worldgen/world_data.hpp"

#include <array>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace tectogen::worldgen {

namespace {

uint64_t hashU32(uint32_t value, uint64_t hash) {
    std::array<uint8_t, 4> bytes{
        static_cast<uint8_t>(value),
        static_cast<uint8_t>(value >> 8),
        static_cast<uint8_t>(value >> 16),
        static_cast<uint8_t>(value >> 24),
    };
    return fnv1a64(bytes, hash);
}

uint64_t hashFloatCells(const Grid2D<float>& grid, uint64_t hash) {
    for (float cell : grid) {
        uint32_t bits;
        std::memcpy(&bits, &cell, sizeof(bits));
        hash = hashU32(bits, hash);
    }
    return hash;
}

uint64_t hashDimensions(int32_t width, int32_t height, uint64_t hash) {
    hash = hashU32(static_cast<uint32_t>(width), hash);
    return hashU32(static_cast<uint32_t>(height), hash);
}

}  // namespace

// ============================================================================
// Checksums
// ============================================================================

uint64_t fnv1a64(std::span<const uint8_t> bytes, uint64_t hash) {
    for (uint8_t b : bytes) {
        hash ^= b;
        hash *= kFnvPrime;
    }
    return hash;
}

std::string toHex64(uint64_t value) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<size_t>(i)] = kDigits[value & 0xF];
        value >>= 4;
    }
    return out;
}

uint64_t gridChecksum(const Grid2D<float>& grid, uint64_t hash) {
    hash = hashDimensions(grid.width(), grid.height(), hash);
    return hashFloatCells(grid, hash);
}

// ============================================================================
// WorldData
// ============================================================================

WorldData::WorldData(uint64_t seed, PlateField plates,
                     Grid2D<float> elevation, Grid2D<float> temperature, Grid2D<float> moisture,
                     Grid2D<Biome> biomes, std::vector<River> rivers,
                     std::vector<RegionalFeature> features)
    : seed_(seed), plates_(std::move(plates)),
      elevation_(std::move(elevation)), temperature_(std::move(temperature)),
      moisture_(std::move(moisture)), biomes_(std::move(biomes)),
      rivers_(std::move(rivers)), features_(std::move(features)) {
    const int32_t w = elevation_.width();
    const int32_t h = elevation_.height();
    auto sameShape = [&](int32_t gw, int32_t gh) { return gw == w && gh == h; };

    if (!sameShape(plates_.width(), plates_.height()) ||
        !sameShape(temperature_.width(), temperature_.height()) ||
        !sameShape(moisture_.width(), moisture_.height()) ||
        !sameShape(biomes_.width(), biomes_.height())) {
        throw std::invalid_argument("WorldData: grid dimensions differ");
    }
}

uint64_t WorldData::checksumValue() const {
    uint64_t hash = hashDimensions(width(), height(), kFnvOffsetBasis);
    hash = hashFloatCells(elevation_, hash);
    hash = hashFloatCells(temperature_, hash);
    hash = hashFloatCells(moisture_, hash);
    for (Biome biome : biomes_) {
        uint8_t tag = static_cast<uint8_t>(biome);
        hash = fnv1a64(std::span<const uint8_t>(&tag, 1), hash);
    }
    return hash;
}

std::string WorldData::checksum() const {
    return toHex64(checksumValue());
}

}  // namespace tectogen::worldgen
