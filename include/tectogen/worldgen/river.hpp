/**
 * @file river.hpp
 * @brief Rivers and the downhill best-first river pathfinder
 *
 * Sources are highland tiles (sourceThreshold <= e < sourceCeiling) tried in
 * a seed-shuffled order. Each source runs a best-first search over
 * 4-connected neighbours that never climb more than climbTolerance, ending
 * at the first tile below the ocean threshold, at the maximum path length,
 * or (when the frontier runs dry) at the lowest tile it explored.
 */

#pragma once

#include "tectogen/core/grid.hpp"
#include "tectogen/worldgen/generation_params.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace tectogen {
class Logger;
}

namespace tectogen::worldgen {

/// A map tile with the elevation it had when the river was traced
struct Tile {
    int32_t x = 0;
    int32_t y = 0;
    float elevation = 0.0f;

    [[nodiscard]] bool operator==(const Tile& other) const = default;
};

// ============================================================================
// River
// ============================================================================

class River {
public:
    /// Max rise between consecutive path tiles
    static constexpr float kDownhillTolerance = 0.002f;

    /// Paths must be strictly longer than this
    static constexpr size_t kMinPathLength = 5;

    /**
     * @brief Construct a river from an ordered source-to-terminus path
     * @throws std::logic_error if the path is too short or climbs
     */
    River(int32_t id, std::vector<Tile> path, bool isLake);

    [[nodiscard]] int32_t id() const { return id_; }
    [[nodiscard]] const Tile& source() const { return path_.front(); }
    [[nodiscard]] const Tile& terminus() const { return path_.back(); }
    [[nodiscard]] const std::vector<Tile>& path() const { return path_; }
    [[nodiscard]] size_t length() const { return path_.size(); }

    /// True when the river ends in an enclosed basin instead of the ocean
    [[nodiscard]] bool isLake() const { return isLake_; }

private:
    int32_t id_;
    std::vector<Tile> path_;
    bool isLake_;
};

// ============================================================================
// RiverPathfinder
// ============================================================================

class RiverPathfinder {
public:
    explicit RiverPathfinder(const RiverConfig& config);

    /**
     * @brief Trace up to riverCount rivers over an elevation grid
     *
     * Fewer rivers than requested is not an error. Identical inputs give an
     * identical, identically ordered list.
     *
     * @param seed World seed; the river stage seed is derived from it
     * @param logger Optional sink for shortfall and budget messages
     * @throws std::invalid_argument if riverCount is not positive
     */
    [[nodiscard]] std::vector<River> generate(const Grid2D<float>& elevation, uint64_t seed,
                                              int32_t riverCount,
                                              const Logger* logger = nullptr) const;

    /// Source candidates in the order they will be tried
    [[nodiscard]] std::vector<Tile> sourceCandidates(const Grid2D<float>& elevation,
                                                     uint64_t seed) const;

    /**
     * @brief Best-first search from one source
     *
     * @param occupied Non-zero for tiles claimed by accepted rivers
     * @return Source-to-terminus path, or nullopt if the exploration budget ran out
     *         or the search dead-ends against a tile claimed by another river
     */
    [[nodiscard]] std::optional<std::vector<Tile>> tracePath(const Grid2D<float>& elevation,
                                                             const Tile& source,
                                                             const Grid2D<uint8_t>& occupied,
                                                             uint64_t tieSeed) const;

    [[nodiscard]] const RiverConfig& config() const { return config_; }

private:
    [[nodiscard]] float tieBreak(int32_t x, int32_t y, uint64_t tieSeed) const;

    RiverConfig config_;
};

}  // namespace tectogen::worldgen
