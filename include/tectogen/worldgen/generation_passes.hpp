/**
 * @file generation_passes.hpp
 * @brief Standard generation passes: plates, elevation, climate, rivers, biomes, features
 *
 * Each pass reads earlier products from the GenerationContext and writes
 * only its own. A pass that finds a required product missing throws
 * std::logic_error naming it.
 */

#pragma once

#include "tectogen/worldgen/world_generator.hpp"

namespace tectogen::worldgen {

// ============================================================================
// PlatePass: draws plates and partitions the map
// ============================================================================

class PlatePass : public GenerationPass {
public:
    [[nodiscard]] std::string_view name() const override { return "core:plates"; }
    [[nodiscard]] int32_t priority() const override {
        return static_cast<int32_t>(GenerationPriority::Plates);
    }
    void generate(GenerationContext& ctx) override;
};

// ============================================================================
// ElevationPass: plate base + fractal noise + boundary uplift
// ============================================================================

class ElevationPass : public GenerationPass {
public:
    [[nodiscard]] std::string_view name() const override { return "core:elevation"; }
    [[nodiscard]] int32_t priority() const override {
        return static_cast<int32_t>(GenerationPriority::Elevation);
    }
    void generate(GenerationContext& ctx) override;
};

// ============================================================================
// ClimatePass: temperature and moisture
// ============================================================================

class ClimatePass : public GenerationPass {
public:
    [[nodiscard]] std::string_view name() const override { return "core:climate"; }
    [[nodiscard]] int32_t priority() const override {
        return static_cast<int32_t>(GenerationPriority::Climate);
    }
    void generate(GenerationContext& ctx) override;
};

// ============================================================================
// RiverPass: downhill rivers from highland sources
// ============================================================================

class RiverPass : public GenerationPass {
public:
    [[nodiscard]] std::string_view name() const override { return "core:rivers"; }
    [[nodiscard]] int32_t priority() const override {
        return static_cast<int32_t>(GenerationPriority::Rivers);
    }
    void generate(GenerationContext& ctx) override;
};

// ============================================================================
// BiomePass: classifies every tile
// ============================================================================

class BiomePass : public GenerationPass {
public:
    [[nodiscard]] std::string_view name() const override { return "core:biomes"; }
    [[nodiscard]] int32_t priority() const override {
        return static_cast<int32_t>(GenerationPriority::Biomes);
    }
    void generate(GenerationContext& ctx) override;
};

// ============================================================================
// FeaturePass: places regional points of interest
// ============================================================================

class FeaturePass : public GenerationPass {
public:
    [[nodiscard]] std::string_view name() const override { return "core:features"; }
    [[nodiscard]] int32_t priority() const override {
        return static_cast<int32_t>(GenerationPriority::Features);
    }
    void generate(GenerationContext& ctx) override;
};

}  // namespace tectogen::worldgen
