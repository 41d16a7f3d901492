#include "tectogen/worldgen/river.hpp"
#include "tectogen/core/log.hpp"
#include "tectogen/worldgen/noise.hpp"

#include <algorithm>
#include <queue>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

namespace tectogen::worldgen {

namespace {

constexpr int32_t kNeighborOffsets[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};

// Salts within the river stage
constexpr uint64_t kShuffleSalt = 0;
constexpr uint64_t kTieBreakSalt = 1;

/// Search node: the stored elevation drives eligibility, goal tests and the
/// output path; the priority only orders the frontier.
struct SearchNode {
    Tile tile;
    float priority;
    int32_t depth;
    int32_t parent;   ///< Arena index, -1 for the source
};

struct QueueEntry {
    float priority;
    uint64_t sequence;
    int32_t node;
};

// Min-heap on (priority, insertion sequence)
struct QueueOrder {
    bool operator()(const QueueEntry& a, const QueueEntry& b) const {
        if (a.priority != b.priority) return a.priority > b.priority;
        return a.sequence > b.sequence;
    }
};

int32_t maxPathLengthFor(const RiverConfig& config, int32_t width, int32_t height) {
    if (config.maxPathLength > 0) return config.maxPathLength;
    return 2 * std::min(width, height);
}

}  // namespace

// ============================================================================
// River
// ============================================================================

River::River(int32_t id, std::vector<Tile> path, bool isLake)
    : id_(id), path_(std::move(path)), isLake_(isLake) {
    if (path_.size() <= kMinPathLength) {
        throw std::logic_error("River " + std::to_string(id_) + ": path length " +
                               std::to_string(path_.size()) + " is not greater than " +
                               std::to_string(kMinPathLength));
    }
    for (size_t i = 1; i < path_.size(); ++i) {
        if (path_[i].elevation > path_[i - 1].elevation + kDownhillTolerance) {
            throw std::logic_error("River " + std::to_string(id_) + ": path climbs at step " +
                                   std::to_string(i) + " (" + std::to_string(path_[i - 1].elevation) +
                                   " -> " + std::to_string(path_[i].elevation) + ")");
        }
    }
}

// ============================================================================
// RiverPathfinder
// ============================================================================

RiverPathfinder::RiverPathfinder(const RiverConfig& config)
    : config_(config) {
}

std::vector<River> RiverPathfinder::generate(const Grid2D<float>& elevation, uint64_t seed,
                                             int32_t riverCount, const Logger* logger) const {
    if (riverCount <= 0) {
        throw std::invalid_argument("RiverPathfinder: river count must be positive, got " +
                                    std::to_string(riverCount));
    }

    const uint64_t tieSeed = NoiseHash::deriveSeed(
        NoiseHash::deriveSeed(seed, StageSalt::Rivers), kTieBreakSalt);

    std::vector<Tile> candidates = sourceCandidates(elevation, seed);

    // Tiles claimed by accepted rivers; owned by this call only
    Grid2D<uint8_t> occupied(elevation.width(), elevation.height(), 0);

    std::vector<River> rivers;
    size_t exhausted = 0;
    size_t tooShort = 0;

    for (const Tile& source : candidates) {
        if (rivers.size() >= static_cast<size_t>(riverCount)) break;
        if (occupied(source.x, source.y)) continue;

        auto path = tracePath(elevation, source, occupied, tieSeed);
        if (!path) {
            ++exhausted;
            continue;
        }
        if (path->size() <= River::kMinPathLength) {
            ++tooShort;
            continue;
        }

        for (const Tile& tile : *path) {
            occupied(tile.x, tile.y) = 1;
        }

        bool isLake = path->back().elevation >= config_.oceanThreshold;
        rivers.emplace_back(static_cast<int32_t>(rivers.size()), std::move(*path), isLake);
    }

    if (logger) {
        logger->log("traced " + std::to_string(rivers.size()) + " of " +
                    std::to_string(riverCount) + " rivers from " +
                    std::to_string(candidates.size()) + " source candidates (" +
                    std::to_string(exhausted) + " without outlet, " +
                    std::to_string(tooShort) + " too short)");
    }

    return rivers;
}

std::vector<Tile> RiverPathfinder::sourceCandidates(const Grid2D<float>& elevation,
                                                    uint64_t seed) const {
    std::vector<Tile> candidates;
    for (int32_t y = 0; y < elevation.height(); ++y) {
        for (int32_t x = 0; x < elevation.width(); ++x) {
            float e = elevation(x, y);
            if (e >= config_.sourceThreshold && e < config_.sourceCeiling) {
                candidates.push_back(Tile{x, y, e});
            }
        }
    }

    // Fisher-Yates driven by the river stage stream
    SeedStream stream(NoiseHash::deriveSeed(NoiseHash::deriveSeed(seed, StageSalt::Rivers),
                                            kShuffleSalt));
    for (size_t i = candidates.size(); i > 1; --i) {
        size_t j = static_cast<size_t>(stream.nextInt(static_cast<int32_t>(i)));
        std::swap(candidates[i - 1], candidates[j]);
    }

    return candidates;
}

std::optional<std::vector<Tile>> RiverPathfinder::tracePath(const Grid2D<float>& elevation,
                                                            const Tile& source,
                                                            const Grid2D<uint8_t>& occupied,
                                                            uint64_t tieSeed) const {
    const int32_t maxLength = maxPathLengthFor(config_, elevation.width(), elevation.height());
    const int64_t budget = std::min<int64_t>(
        static_cast<int64_t>(maxLength) * 4,
        static_cast<int64_t>(elevation.width()) * elevation.height() / 4);

    std::vector<SearchNode> arena;
    std::unordered_set<size_t> visited;
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, QueueOrder> open;
    uint64_t sequence = 0;

    auto push = [&](const Tile& tile, int32_t depth, int32_t parent) {
        auto index = static_cast<int32_t>(arena.size());
        float priority = tile.elevation + tieBreak(tile.x, tile.y, tieSeed);
        arena.push_back(SearchNode{tile, priority, depth, parent});
        visited.insert(elevation.index(tile.x, tile.y));
        open.push(QueueEntry{priority, sequence++, index});
    };

    push(source, 0, -1);

    int32_t lowest = 0;
    int32_t goal = -1;
    int64_t pops = 0;

    while (!open.empty()) {
        if (pops >= budget) {
            return std::nullopt;
        }

        QueueEntry entry = open.top();
        open.pop();
        ++pops;

        // Copy: pushing below may reallocate the arena
        const SearchNode node = arena[static_cast<size_t>(entry.node)];

        if (node.tile.elevation < arena[static_cast<size_t>(lowest)].tile.elevation) {
            lowest = entry.node;
        }
        if (node.tile.elevation < config_.oceanThreshold) {
            goal = entry.node;
            break;
        }
        if (node.depth + 1 >= maxLength) {
            goal = entry.node;
            break;
        }

        for (const auto& offset : kNeighborOffsets) {
            int32_t nx = node.tile.x + offset[0];
            int32_t ny = node.tile.y + offset[1];
            if (!elevation.inBounds(nx, ny)) continue;
            if (visited.count(elevation.index(nx, ny)) != 0) continue;
            if (occupied(nx, ny)) continue;

            float ne = elevation(nx, ny);
            if (ne > node.tile.elevation + config_.climbTolerance) continue;

            push(Tile{nx, ny, ne}, node.depth + 1, entry.node);
        }
    }

    // Frontier ran dry without reaching the ocean
    if (goal < 0) {
        const Tile& bottom = arena[static_cast<size_t>(lowest)].tile;
        // Blocked only by another river's tile it would have flowed into: not a basin
        for (const auto& offset : kNeighborOffsets) {
            int32_t nx = bottom.x + offset[0];
            int32_t ny = bottom.y + offset[1];
            if (elevation.inBounds(nx, ny) && occupied(nx, ny) &&
                elevation(nx, ny) <= bottom.elevation + config_.climbTolerance) {
                return std::nullopt;
            }
        }
        goal = lowest;
    }

    std::vector<Tile> path;
    for (int32_t i = goal; i >= 0; i = arena[static_cast<size_t>(i)].parent) {
        path.push_back(arena[static_cast<size_t>(i)].tile);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

float RiverPathfinder::tieBreak(int32_t x, int32_t y, uint64_t tieSeed) const {
    float unit = NoiseHash::toUnitFloat(NoiseHash::hash2D(x, y, tieSeed));
    return (unit * 2.0f - 1.0f) * config_.tieBreakJitter;
}

}  // namespace tectogen::worldgen
