/**
 * @file noise_perlin.cpp
 * @brief Seed hashing, SplitMix64 streams and 2D Perlin gradient noise
 *
 * Perlin noise follows Ken Perlin's improved noise (2002) with a
 * permutation table shuffled from the seed.
 */

#include "tectogen/worldgen/noise.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace tectogen::worldgen {

// ============================================================================
// NoiseHash
// ============================================================================

uint32_t NoiseHash::hash2D(int32_t x, int32_t y, uint64_t seed) {
    // FNV-1a inspired hash
    uint64_t h = seed ^ 0x517cc1b727220a95ULL;
    h ^= static_cast<uint64_t>(static_cast<uint32_t>(x));
    h *= 0x9e3779b97f4a7c15ULL;
    h ^= static_cast<uint64_t>(static_cast<uint32_t>(y));
    h *= 0x9e3779b97f4a7c15ULL;
    h ^= h >> 32;
    return static_cast<uint32_t>(h);
}

uint64_t NoiseHash::deriveSeed(uint64_t baseSeed, uint64_t salt) {
    uint64_t h = baseSeed;
    h ^= (salt + 1) * 0x9e3779b97f4a7c15ULL;
    h *= 0xbf58476d1ce4e5b9ULL;
    h ^= h >> 31;
    h *= 0x94d049bb133111ebULL;
    h ^= h >> 31;
    return h;
}

float NoiseHash::toUnitFloat(uint32_t hash) {
    return static_cast<float>(hash >> 8) * (1.0f / 16777216.0f);
}

// ============================================================================
// SeedStream
// ============================================================================

SeedStream SeedStream::forEntity(uint64_t seed, uint64_t stage, uint64_t index) {
    return SeedStream(NoiseHash::deriveSeed(NoiseHash::deriveSeed(seed, stage), index));
}

uint64_t SeedStream::nextU64() {
    uint64_t z = (state_ += 0x9e3779b97f4a7c15ULL);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

float SeedStream::nextFloat() {
    return static_cast<float>(nextU64() >> 40) * (1.0f / 16777216.0f);
}

double SeedStream::nextDouble() {
    return static_cast<double>(nextU64() >> 11) * (1.0 / 9007199254740992.0);
}

int32_t SeedStream::nextInt(int32_t bound) {
    if (bound <= 0) {
        throw std::invalid_argument("SeedStream::nextInt: bound must be positive");
    }
    // Multiply-shift range reduction on the high 32 bits
    uint64_t r = nextU64() >> 32;
    return static_cast<int32_t>((r * static_cast<uint64_t>(bound)) >> 32);
}

float SeedStream::nextRange(float lo, float hi) {
    return lo + nextFloat() * (hi - lo);
}

// ============================================================================
// Perlin helper functions
// ============================================================================

namespace {

/// Improved Perlin fade curve: 6t^5 - 15t^4 + 10t^3
inline float fade(float t) {
    return t * t * t * (t * (t * 6.0f - 15.0f) + 10.0f);
}

inline float lerp(float t, float a, float b) {
    return a + t * (b - a);
}

}  // namespace

// ============================================================================
// PerlinNoise2D
// ============================================================================

PerlinNoise2D::PerlinNoise2D(uint64_t seed) {
    buildPermutation(seed);
}

void PerlinNoise2D::buildPermutation(uint64_t seed) {
    for (int i = 0; i < 256; ++i) {
        perm_[static_cast<size_t>(i)] = static_cast<uint8_t>(i);
    }

    // Fisher-Yates driven by the seeded stream
    SeedStream stream(seed);
    for (int i = 255; i > 0; --i) {
        int j = stream.nextInt(i + 1);
        std::swap(perm_[static_cast<size_t>(i)], perm_[static_cast<size_t>(j)]);
    }

    // Duplicate to avoid overflow
    for (int i = 0; i < 256; ++i) {
        perm_[static_cast<size_t>(i + 256)] = perm_[static_cast<size_t>(i)];
    }
}

float PerlinNoise2D::grad(int hash, float x, float y) const {
    // Eight gradient directions: the axes and the diagonals
    switch (hash & 7) {
        case 0: return x + y;
        case 1: return -x + y;
        case 2: return x - y;
        case 3: return -x - y;
        case 4: return x;
        case 5: return -x;
        case 6: return y;
        default: return -y;
    }
}

float PerlinNoise2D::evaluate(float x, float y) const {
    // Find unit grid cell
    int xi = static_cast<int>(std::floor(x));
    int yi = static_cast<int>(std::floor(y));

    // Relative position within cell
    float xf = x - static_cast<float>(xi);
    float yf = y - static_cast<float>(yi);

    // Wrap to 0..255
    xi &= 255;
    yi &= 255;

    float u = fade(xf);
    float v = fade(yf);

    // Hash corners
    int aa = perm_[static_cast<size_t>(perm_[static_cast<size_t>(xi)] + yi)];
    int ab = perm_[static_cast<size_t>(perm_[static_cast<size_t>(xi)] + yi + 1)];
    int ba = perm_[static_cast<size_t>(perm_[static_cast<size_t>(xi + 1)] + yi)];
    int bb = perm_[static_cast<size_t>(perm_[static_cast<size_t>(xi + 1)] + yi + 1)];

    float x1 = lerp(u, grad(aa, xf, yf), grad(ba, xf - 1.0f, yf));
    float x2 = lerp(u, grad(ab, xf, yf - 1.0f), grad(bb, xf - 1.0f, yf - 1.0f));

    return lerp(v, x1, x2);
}

}  // namespace tectogen::worldgen
