/**
 * @file test_river.cpp
 * @brief Tests for river construction and the downhill pathfinder
 */

#include "tectogen/worldgen/river.hpp"
#include "tectogen/core/log.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <string>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tectogen {
namespace worldgen {
namespace {

// Cone peaking at the centre: 0.9 at the middle, falling to 0 at radius 32
Grid2D<float> radialTerrain(int32_t size) {
    Grid2D<float> grid(size, size, 0.0f);
    float centre = static_cast<float>(size) / 2.0f;
    for (int32_t y = 0; y < size; ++y) {
        for (int32_t x = 0; x < size; ++x) {
            float dx = static_cast<float>(x) - centre;
            float dy = static_cast<float>(y) - centre;
            float d = std::sqrt(dx * dx + dy * dy);
            grid(x, y) = std::max(0.0f, 0.9f * (1.0f - d / 32.0f));
        }
    }
    return grid;
}

// A single descending channel walled in by high ground with no outlet
Grid2D<float> enclosedChannel() {
    Grid2D<float> grid(40, 3, 1.0f);
    for (int32_t x = 0; x < 10; ++x) {
        grid(x, 1) = 0.8f - 0.05f * static_cast<float>(x);
    }
    return grid;
}

// Row 0 descends from 0.7 by `step` per tile; the rows below are a wall
Grid2D<float> slopeRow(float step) {
    Grid2D<float> grid(12, 8, 1.0f);
    for (int32_t x = 0; x < 12; ++x) {
        grid(x, 0) = 0.7f - step * static_cast<float>(x);
    }
    return grid;
}

std::vector<Tile> straightPath(size_t length, float start, float step) {
    std::vector<Tile> path;
    for (size_t i = 0; i < length; ++i) {
        path.push_back(Tile{static_cast<int32_t>(i), 0, start - step * static_cast<float>(i)});
    }
    return path;
}

class RiverPathfinderTest : public ::testing::Test {
protected:
    RiverConfig config;
    RiverPathfinder pathfinder{config};
};

// ============================================================================
// River construction
// ============================================================================

TEST(RiverTest, ValidPathAccepted) {
    River river(3, straightPath(6, 0.8f, 0.1f), false);

    EXPECT_EQ(river.id(), 3);
    EXPECT_EQ(river.length(), 6u);
    EXPECT_EQ(river.source().x, 0);
    EXPECT_EQ(river.terminus().x, 5);
    EXPECT_FALSE(river.isLake());
}

TEST(RiverTest, ShortPathRejected) {
    EXPECT_THROW(River(0, straightPath(5, 0.8f, 0.1f), false), std::logic_error);
    EXPECT_THROW(River(0, {}, false), std::logic_error);
}

TEST(RiverTest, ClimbingPathRejected) {
    auto path = straightPath(8, 0.8f, 0.05f);
    path[4].elevation = path[3].elevation + 0.01f;
    EXPECT_THROW(River(0, path, false), std::logic_error);
}

TEST(RiverTest, SmallRiseWithinToleranceAccepted) {
    auto path = straightPath(8, 0.8f, 0.05f);
    path[4].elevation = path[3].elevation + 0.0015f;
    path[5].elevation = path[4].elevation - 0.05f;
    path[6].elevation = path[5].elevation - 0.05f;
    path[7].elevation = path[6].elevation - 0.05f;
    EXPECT_NO_THROW(River(0, path, true));
}

// ============================================================================
// Source selection
// ============================================================================

TEST_F(RiverPathfinderTest, SourceCandidatesWithinBand) {
    auto elevation = radialTerrain(64);
    auto candidates = pathfinder.sourceCandidates(elevation, 12345);

    ASSERT_FALSE(candidates.empty());
    std::set<std::pair<int32_t, int32_t>> unique;
    for (const auto& tile : candidates) {
        EXPECT_GE(tile.elevation, 0.6f);
        EXPECT_LT(tile.elevation, 0.95f);
        EXPECT_FLOAT_EQ(tile.elevation, elevation(tile.x, tile.y));
        unique.insert({tile.x, tile.y});
    }
    EXPECT_EQ(unique.size(), candidates.size());

    size_t expected = 0;
    for (float e : elevation) {
        if (e >= 0.6f && e < 0.95f) ++expected;
    }
    EXPECT_EQ(candidates.size(), expected);
}

TEST_F(RiverPathfinderTest, SourceOrderDependsOnSeed) {
    auto elevation = radialTerrain(64);
    auto a = pathfinder.sourceCandidates(elevation, 1);
    auto b = pathfinder.sourceCandidates(elevation, 1);
    auto c = pathfinder.sourceCandidates(elevation, 2);

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

// ============================================================================
// Generation
// ============================================================================

TEST_F(RiverPathfinderTest, FlatLowlandHasNoRivers) {
    Grid2D<float> elevation(32, 32, 0.1f);
    auto rivers = pathfinder.generate(elevation, 1, 10);
    EXPECT_TRUE(rivers.empty());
}

TEST_F(RiverPathfinderTest, RadialTerrainProducesRequestedRivers) {
    auto elevation = radialTerrain(64);
    auto rivers = pathfinder.generate(elevation, 12345, 3);

    ASSERT_EQ(rivers.size(), 3u);
    for (size_t i = 0; i < rivers.size(); ++i) {
        const River& river = rivers[i];
        EXPECT_EQ(river.id(), static_cast<int32_t>(i));
        EXPECT_GT(river.length(), River::kMinPathLength);
        EXPECT_GE(river.source().elevation, 0.6f);
        EXPECT_LT(river.source().elevation, 0.95f);
        EXPECT_TRUE(river.terminus().elevation < 0.2f || river.isLake());

        const auto& path = river.path();
        for (size_t s = 1; s < path.size(); ++s) {
            EXPECT_LE(path[s].elevation, path[s - 1].elevation + River::kDownhillTolerance);
            // 4-connected steps
            int32_t manhattan = std::abs(path[s].x - path[s - 1].x) +
                                std::abs(path[s].y - path[s - 1].y);
            EXPECT_EQ(manhattan, 1);
        }
    }
}

TEST_F(RiverPathfinderTest, RiversDoNotShareTiles) {
    auto elevation = radialTerrain(64);
    auto rivers = pathfinder.generate(elevation, 777, 8);

    std::set<std::pair<int32_t, int32_t>> claimed;
    for (const auto& river : rivers) {
        for (const auto& tile : river.path()) {
            EXPECT_TRUE(claimed.insert({tile.x, tile.y}).second)
                << "tile (" << tile.x << ", " << tile.y << ") reused";
        }
    }
}

TEST_F(RiverPathfinderTest, NeverMoreThanRequested) {
    auto elevation = radialTerrain(64);
    EXPECT_LE(pathfinder.generate(elevation, 5, 1).size(), 1u);
    EXPECT_LE(pathfinder.generate(elevation, 5, 4).size(), 4u);
}

TEST_F(RiverPathfinderTest, Deterministic) {
    auto elevation = radialTerrain(64);
    auto a = pathfinder.generate(elevation, 42, 5);
    auto b = pathfinder.generate(elevation, 42, 5);

    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].path(), b[i].path());
        EXPECT_EQ(a[i].isLake(), b[i].isLake());
    }
}

TEST_F(RiverPathfinderTest, RejectsNonPositiveCount) {
    Grid2D<float> elevation(8, 8, 0.7f);
    EXPECT_THROW((void)pathfinder.generate(elevation, 1, 0), std::invalid_argument);
    EXPECT_THROW((void)pathfinder.generate(elevation, 1, -4), std::invalid_argument);
}

TEST_F(RiverPathfinderTest, LogsSummaryWhenVerbose) {
    auto elevation = radialTerrain(64);
    Logger logger("rivers", true);

    testing::internal::CaptureStdout();
    auto rivers = pathfinder.generate(elevation, 9, 2, &logger);
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("[rivers] traced " + std::to_string(rivers.size()) + " of 2 rivers"),
              std::string::npos);
}

// ============================================================================
// Path tracing
// ============================================================================

TEST_F(RiverPathfinderTest, EnclosedBasinEndsInLake) {
    config.maxPathLength = 100;
    RiverPathfinder finder(config);
    auto elevation = enclosedChannel();
    Grid2D<uint8_t> occupied(elevation.width(), elevation.height(), 0);

    auto path = finder.tracePath(elevation, Tile{0, 1, 0.8f}, occupied, 1);
    ASSERT_TRUE(path.has_value());
    ASSERT_EQ(path->size(), 10u);
    EXPECT_EQ(path->back().x, 9);
    EXPECT_EQ(path->back().y, 1);

    auto rivers = finder.generate(elevation, 3, 1);
    ASSERT_EQ(rivers.size(), 1u);
    EXPECT_TRUE(rivers[0].isLake());
    EXPECT_EQ(rivers[0].terminus().x, 9);
    EXPECT_GE(rivers[0].terminus().elevation, config.oceanThreshold);
}

TEST_F(RiverPathfinderTest, StopsAtFirstOceanTile) {
    config.maxPathLength = 100;
    RiverPathfinder finder(config);
    auto elevation = slopeRow(0.06f);
    Grid2D<uint8_t> occupied(elevation.width(), elevation.height(), 0);

    auto path = finder.tracePath(elevation, Tile{0, 0, 0.7f}, occupied, 1);
    ASSERT_TRUE(path.has_value());
    // x = 9 is the first tile below 0.2
    EXPECT_EQ(path->back().x, 9);
    EXPECT_LT(path->back().elevation, 0.2f);
}

TEST_F(RiverPathfinderTest, RespectsMaxPathLength) {
    config.maxPathLength = 4;
    RiverPathfinder finder(config);
    auto elevation = slopeRow(0.04f);
    Grid2D<uint8_t> occupied(elevation.width(), elevation.height(), 0);

    auto path = finder.tracePath(elevation, Tile{0, 0, 0.7f}, occupied, 1);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->size(), 4u);
}

TEST_F(RiverPathfinderTest, DeadEndAgainstClaimedTileIsDiscarded) {
    auto elevation = enclosedChannel();
    Grid2D<uint8_t> occupied(elevation.width(), elevation.height(), 0);
    occupied(5, 1) = 1;

    config.maxPathLength = 100;
    RiverPathfinder finder(config);
    // (4,1) is not a basin: its only way down is the claimed tile
    auto path = finder.tracePath(elevation, Tile{0, 1, 0.8f}, occupied, 1);
    EXPECT_FALSE(path.has_value());
}

TEST_F(RiverPathfinderTest, ClaimedTileAboveDeadEndStillAllowsLake) {
    auto elevation = enclosedChannel();
    Grid2D<uint8_t> occupied(elevation.width(), elevation.height(), 0);
    // Higher ground beside the channel floor is claimed; the floor is still a basin
    occupied(9, 0) = 1;

    config.maxPathLength = 100;
    RiverPathfinder finder(config);
    auto path = finder.tracePath(elevation, Tile{0, 1, 0.8f}, occupied, 1);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->back().x, 9);
}

TEST_F(RiverPathfinderTest, TributaryIsNotMistakenForLake) {
    // Main channel on row 1 drains into a basin at (11,1). A tributary along
    // row 4 turns up column 7 and joins the channel at (7,1).
    Grid2D<float> elevation(20, 6, 1.0f);
    for (int32_t x = 0; x < 12; ++x) {
        elevation(x, 1) = 0.85f - 0.05f * static_cast<float>(x);
    }
    for (int32_t x = 0; x < 8; ++x) {
        elevation(x, 4) = 0.84f - 0.03f * static_cast<float>(x);
    }
    elevation(7, 3) = 0.62f;
    elevation(7, 2) = 0.61f;

    config.maxPathLength = 100;
    RiverPathfinder finder(config);

    for (uint64_t seed : {1ULL, 2ULL, 3ULL, 4ULL, 5ULL}) {
        auto rivers = finder.generate(elevation, seed, 10);

        // Whichever arm is traced first owns the basin; the other one ends
        // on that river and is dropped
        ASSERT_EQ(rivers.size(), 1u) << "seed " << seed;
        EXPECT_TRUE(rivers[0].isLake());
        EXPECT_EQ(rivers[0].terminus().x, 11);
        EXPECT_EQ(rivers[0].terminus().y, 1);
    }
}

TEST_F(RiverPathfinderTest, LakeTerminusHasNoLowerNeighbour) {
    auto elevation = radialTerrain(64);
    // Pits on the slopes give the searches somewhere to pool
    for (int32_t i = 0; i < 6; ++i) {
        int32_t x = 20 + i * 4;
        elevation(x, 24) = std::max(0.0f, elevation(x, 24) - 0.2f);
    }

    auto rivers = pathfinder.generate(elevation, 31, 20);
    for (const auto& river : rivers) {
        if (!river.isLake()) continue;
        const Tile& end = river.terminus();
        for (auto [dx, dy] : {std::pair{1, 0}, std::pair{-1, 0}, std::pair{0, 1}, std::pair{0, -1}}) {
            int32_t nx = end.x + dx;
            int32_t ny = end.y + dy;
            if (!elevation.inBounds(nx, ny)) continue;
            EXPECT_GE(elevation(nx, ny), end.elevation)
                << "lake " << river.id() << " ends beside lower tile (" << nx << ", " << ny << ")";
        }
    }
}

TEST_F(RiverPathfinderTest, ExplorationBudgetGivesUp) {
    config.maxPathLength = 1000;
    RiverPathfinder finder(config);
    Grid2D<float> plateau(8, 8, 0.5f);
    Grid2D<uint8_t> occupied(8, 8, 0);

    auto path = finder.tracePath(plateau, Tile{4, 4, 0.5f}, occupied, 1);
    EXPECT_FALSE(path.has_value());
}

}  // namespace
}  // namespace worldgen
}  // namespace tectogen
