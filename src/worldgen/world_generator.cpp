/**
 * @file world_generator.cpp
 * @brief GenerationPipeline and WorldGenerator implementation
 */

#include "tectogen/worldgen/world_generator.hpp"
#include "tectogen/worldgen/generation_passes.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace tectogen::worldgen {

// ============================================================================
// GenerationPipeline
// ============================================================================

void GenerationPipeline::addPass(std::unique_ptr<GenerationPass> pass) {
    if (!pass) return;
    passes_.push_back(std::move(pass));
    sortPasses();
}

bool GenerationPipeline::removePass(std::string_view name) {
    auto it = std::find_if(passes_.begin(), passes_.end(),
        [&](const auto& p) { return p->name() == name; });
    if (it == passes_.end()) return false;
    passes_.erase(it);
    return true;
}

bool GenerationPipeline::replacePass(std::unique_ptr<GenerationPass> pass) {
    if (!pass) return false;
    auto name = pass->name();
    auto it = std::find_if(passes_.begin(), passes_.end(),
        [&](const auto& p) { return p->name() == name; });
    if (it == passes_.end()) return false;
    *it = std::move(pass);
    sortPasses();
    return true;
}

void GenerationPipeline::run(GenerationContext& ctx) {
    for (auto& pass : passes_) {
        ctx.logger.log("running " + std::string(pass->name()));
        pass->generate(ctx);
    }
}

GenerationPass* GenerationPipeline::getPass(std::string_view name) const {
    auto it = std::find_if(passes_.begin(), passes_.end(),
        [&](const auto& p) { return p->name() == name; });
    return (it != passes_.end()) ? it->get() : nullptr;
}

std::vector<std::string_view> GenerationPipeline::passNames() const {
    std::vector<std::string_view> names;
    names.reserve(passes_.size());
    for (const auto& pass : passes_) {
        names.push_back(pass->name());
    }
    return names;
}

void GenerationPipeline::sortPasses() {
    std::stable_sort(passes_.begin(), passes_.end(),
        [](const auto& a, const auto& b) {
            return a->priority() < b->priority();
        });
}

// ============================================================================
// WorldGenerator
// ============================================================================

WorldGenerator::WorldGenerator(GenerationParams params)
    : params_(std::move(params)) {
    pipeline_.addPass(std::make_unique<PlatePass>());
    pipeline_.addPass(std::make_unique<ElevationPass>());
    pipeline_.addPass(std::make_unique<ClimatePass>());
    pipeline_.addPass(std::make_unique<RiverPass>());
    pipeline_.addPass(std::make_unique<BiomePass>());
    pipeline_.addPass(std::make_unique<FeaturePass>());
}

WorldData WorldGenerator::run(uint64_t seed, int32_t width, int32_t height) {
    params_.validate(width, height);

    Logger logger("worldgen", params_.verbose);
    logger.log("generating " + std::to_string(width) + "x" + std::to_string(height) +
               " world, seed " + std::to_string(seed));

    GenerationContext ctx{seed, width, height, params_, logger, std::nullopt,
                          {}, {}, {}, {}, {}, {}};
    pipeline_.run(ctx);

    if (!ctx.plates) {
        throw std::logic_error("WorldGenerator: no pass produced a plate field");
    }

    WorldData world(seed, std::move(*ctx.plates), std::move(ctx.elevation),
                    std::move(ctx.temperature), std::move(ctx.moisture), std::move(ctx.biomes),
                    std::move(ctx.rivers), std::move(ctx.features));

    logger.log("checksum " + world.checksum());
    return world;
}

WorldData WorldGenerator::generate(uint64_t seed, int32_t width, int32_t height,
                                   const GenerationParams& params) {
    WorldGenerator generator(params);
    return generator.run(seed, width, height);
}

}  // namespace tectogen::worldgen
