/**
 * @file generation_passes.cpp
 * @brief Standard generation pass implementations
 */

#include "tectogen/worldgen/generation_passes.hpp"
#include "tectogen/worldgen/climate.hpp"
#include "tectogen/worldgen/elevation.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace tectogen::worldgen {

namespace {

void requireGrid(const Grid2D<float>& grid, const GenerationContext& ctx, const char* what) {
    if (grid.width() != ctx.width || grid.height() != ctx.height) {
        throw std::logic_error(std::string("generation pass requires ") + what);
    }
}

const PlateField& requirePlates(const GenerationContext& ctx) {
    if (!ctx.plates) {
        throw std::logic_error("generation pass requires plates");
    }
    return *ctx.plates;
}

}  // namespace

// ============================================================================
// PlatePass
// ============================================================================

void PlatePass::generate(GenerationContext& ctx) {
    int32_t count = ctx.params.resolvePlateCount(ctx.width, ctx.height);
    ctx.plates.emplace(PlateField::generate(ctx.worldSeed, ctx.width, ctx.height, count));

    size_t continental = 0;
    for (const auto& plate : ctx.plates->plates()) {
        if (plate.kind() == PlateKind::Continental) ++continental;
    }
    ctx.logger.log(std::to_string(count) + " plates (" + std::to_string(continental) +
                   " continental)");
}

// ============================================================================
// ElevationPass
// ============================================================================

void ElevationPass::generate(GenerationContext& ctx) {
    const PlateField& plates = requirePlates(ctx);

    ElevationSynthesizer synthesizer(ctx.worldSeed, ctx.params.elevation);
    ctx.elevation = synthesizer.synthesize(plates, ctx.params.threads);
}

// ============================================================================
// ClimatePass
// ============================================================================

void ClimatePass::generate(GenerationContext& ctx) {
    requireGrid(ctx.elevation, ctx, "elevation");

    ClimateModel climate(ctx.worldSeed, ctx.params.climate);
    ClimateFields fields = climate.compute(ctx.elevation, ctx.params.threads);
    ctx.temperature = std::move(fields.temperature);
    ctx.moisture = std::move(fields.moisture);
}

// ============================================================================
// RiverPass
// ============================================================================

void RiverPass::generate(GenerationContext& ctx) {
    requireGrid(ctx.elevation, ctx, "elevation");

    int32_t count = ctx.params.resolveRiverCount(ctx.width, ctx.height);
    RiverPathfinder pathfinder(ctx.params.river);
    ctx.rivers = pathfinder.generate(ctx.elevation, ctx.worldSeed, count, &ctx.logger);

    if (ctx.rivers.size() < static_cast<size_t>(count)) {
        ctx.logger.log("river shortfall: " + std::to_string(ctx.rivers.size()) + " of " +
                       std::to_string(count) + " requested");
    }
}

// ============================================================================
// BiomePass
// ============================================================================

void BiomePass::generate(GenerationContext& ctx) {
    requireGrid(ctx.elevation, ctx, "elevation");
    requireGrid(ctx.temperature, ctx, "temperature");
    requireGrid(ctx.moisture, ctx, "moisture");

    ctx.biomes = classifyBiomes(ctx.elevation, ctx.temperature, ctx.moisture, ctx.params.threads);
}

// ============================================================================
// FeaturePass
// ============================================================================

void FeaturePass::generate(GenerationContext& ctx) {
    requireGrid(ctx.elevation, ctx, "elevation");
    if (ctx.biomes.width() != ctx.width || ctx.biomes.height() != ctx.height) {
        throw std::logic_error("generation pass requires biomes");
    }

    int32_t count = ctx.params.resolveFeatureCount(ctx.width, ctx.height);
    FeaturePlacer placer(ctx.params.feature);
    ctx.features = placer.place(ctx.elevation, ctx.biomes, ctx.worldSeed, count, &ctx.logger);
}

}  // namespace tectogen::worldgen
