/**
 * @file world_generator.hpp
 * @brief Generation pipeline: passes, context, and the WorldGenerator entry point
 *
 * The pipeline runs an ordered sequence of GenerationPasses over one shared
 * GenerationContext. Each standard pass fills exactly one product of the
 * context (plates, elevation, climate, rivers, biomes, features); later
 * passes read earlier products and never modify them. Callers may add,
 * replace, or remove passes to customize generation.
 */

#pragma once

#include "tectogen/core/grid.hpp"
#include "tectogen/core/log.hpp"
#include "tectogen/worldgen/biome.hpp"
#include "tectogen/worldgen/generation_params.hpp"
#include "tectogen/worldgen/plate_field.hpp"
#include "tectogen/worldgen/regional_feature.hpp"
#include "tectogen/worldgen/river.hpp"
#include "tectogen/worldgen/world_data.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace tectogen::worldgen {

// ============================================================================
// GenerationPriority
// ============================================================================

/// Standard priority levels for generation passes
enum class GenerationPriority : int32_t {
    Plates     = 1000,
    Elevation  = 2000,
    Climate    = 3000,
    Rivers     = 4000,
    Biomes     = 5000,
    Features   = 6000,
};

// ============================================================================
// GenerationContext
// ============================================================================

/// Shared state passed through all passes of one run
struct GenerationContext {
    uint64_t worldSeed;
    int32_t width;
    int32_t height;
    const GenerationParams& params;
    const Logger& logger;

    std::optional<PlateField> plates;   ///< Plate pass
    Grid2D<float> elevation;            ///< Elevation pass
    Grid2D<float> temperature;          ///< Climate pass
    Grid2D<float> moisture;             ///< Climate pass
    Grid2D<Biome> biomes;               ///< Biome pass
    std::vector<River> rivers;          ///< River pass
    std::vector<RegionalFeature> features;  ///< Feature pass
};

// ============================================================================
// GenerationPass
// ============================================================================

/// Abstract base for a single generation pass
class GenerationPass {
public:
    virtual ~GenerationPass() = default;

    /// Unique name for this pass (e.g., "core:rivers")
    [[nodiscard]] virtual std::string_view name() const = 0;

    /// Priority determines execution order (lower runs first)
    [[nodiscard]] virtual int32_t priority() const = 0;

    /// Execute this pass on the given context
    virtual void generate(GenerationContext& ctx) = 0;
};

// ============================================================================
// GenerationPipeline
// ============================================================================

/// Orchestrates ordered generation passes over a context
class GenerationPipeline {
public:
    GenerationPipeline() = default;

    /// Add a pass (sorted by priority on insertion)
    void addPass(std::unique_ptr<GenerationPass> pass);

    /// Remove a pass by name (returns true if found)
    bool removePass(std::string_view name);

    /// Replace a pass with the same name (returns true if found and replaced)
    bool replacePass(std::unique_ptr<GenerationPass> pass);

    /// Run all passes in priority order
    void run(GenerationContext& ctx);

    /// Number of registered passes
    [[nodiscard]] size_t passCount() const { return passes_.size(); }

    /// Get pass by name
    [[nodiscard]] GenerationPass* getPass(std::string_view name) const;

    /// Pass names in execution order
    [[nodiscard]] std::vector<std::string_view> passNames() const;

private:
    std::vector<std::unique_ptr<GenerationPass>> passes_;

    void sortPasses();
};

// ============================================================================
// WorldGenerator
// ============================================================================

/**
 * @brief Synchronous world generation entry point
 *
 * Holds the standard six-pass pipeline. The generator keeps no per-run
 * state, so one instance can generate any number of worlds.
 */
class WorldGenerator {
public:
    explicit WorldGenerator(GenerationParams params = {});

    /**
     * @brief Generate a complete world
     * @throws std::invalid_argument on bad dimensions or params, before any work
     * @throws std::logic_error if a pass finds a required product missing
     *         or a river breaks its invariants
     */
    [[nodiscard]] WorldData run(uint64_t seed, int32_t width, int32_t height);

    /// One-shot convenience: WorldGenerator(params).run(seed, width, height)
    [[nodiscard]] static WorldData generate(uint64_t seed, int32_t width, int32_t height,
                                            const GenerationParams& params = {});

    [[nodiscard]] GenerationPipeline& pipeline() { return pipeline_; }
    [[nodiscard]] const GenerationParams& params() const { return params_; }

private:
    GenerationParams params_;
    GenerationPipeline pipeline_;
};

}  // namespace tectogen::worldgen
