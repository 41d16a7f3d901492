/**
 * @file test_regional_feature.cpp
 * @brief Tests for regional feature compatibility and placement
 */

#include "tectogen/worldgen/regional_feature.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <stdexcept>

using namespace tectogen;
using namespace tectogen::worldgen;

namespace {

// Left half ocean, right half rising land
struct MixedTerrain {
    Grid2D<float> elevation{64, 64, 0.0f};
    Grid2D<Biome> biomes{64, 64, Biome::Ocean};

    MixedTerrain() {
        for (int32_t y = 0; y < 64; ++y) {
            for (int32_t x = 0; x < 64; ++x) {
                if (x < 24) {
                    elevation(x, y) = 0.05f;
                    biomes(x, y) = Biome::Ocean;
                } else {
                    float e = 0.3f + 0.65f * static_cast<float>(x - 24) / 39.0f;
                    elevation(x, y) = e;
                    biomes(x, y) = e > 0.8f ? Biome::Mountain
                                 : e >= 0.6f ? Biome::Hills
                                             : Biome::Grassland;
                }
            }
        }
    }
};

class FeaturePlacerTest : public ::testing::Test {
protected:
    FeatureConfig config;
    FeaturePlacer placer{config};
    MixedTerrain terrain;
};

}  // namespace

// ============================================================================
// Type table and weighted draw
// ============================================================================

TEST(FeatureTypeTest, TableMatchesTags) {
    for (size_t i = 0; i < kFeatureTypeCount; ++i) {
        EXPECT_EQ(static_cast<size_t>(kFeatureTypeTable[i].type), i);
        EXPECT_FALSE(kFeatureTypeTable[i].effectDescription.empty());
    }
    EXPECT_EQ(featureTypeName(FeatureType::SubmergedCity), "Submerged City");
}

TEST(FeatureTypeTest, TotalWeight) {
    EXPECT_EQ(FeaturePlacer::totalWeight(), 12);
}

TEST(FeatureTypeTest, RollMapsToWeightedBuckets) {
    std::array<int, kFeatureTypeCount> counts{};
    for (int32_t roll = 0; roll < FeaturePlacer::totalWeight(); ++roll) {
        ++counts[static_cast<size_t>(FeaturePlacer::typeForRoll(roll))];
    }
    EXPECT_EQ(counts[static_cast<size_t>(FeatureType::Volcano)], 2);
    EXPECT_EQ(counts[static_cast<size_t>(FeatureType::MagicZone)], 3);
    EXPECT_EQ(counts[static_cast<size_t>(FeatureType::SubmergedCity)], 1);
    EXPECT_EQ(counts[static_cast<size_t>(FeatureType::AncientRuins)], 4);
    EXPECT_EQ(counts[static_cast<size_t>(FeatureType::CrystalCave)], 2);

    EXPECT_EQ(FeaturePlacer::typeForRoll(0), FeatureType::Volcano);
    EXPECT_EQ(FeaturePlacer::typeForRoll(5), FeatureType::SubmergedCity);
    EXPECT_EQ(FeaturePlacer::typeForRoll(11), FeatureType::CrystalCave);
}

TEST(RegionalFeatureTest, EffectDescriptionFollowsType) {
    RegionalFeature feature{0, FeatureType::Volcano, 1, 2, 0.5f};
    EXPECT_EQ(feature.effectDescription(), featureTypeInfo(FeatureType::Volcano).effectDescription);
}

// ============================================================================
// Compatibility
// ============================================================================

TEST_F(FeaturePlacerTest, VolcanoNeedsHighLand) {
    EXPECT_TRUE(placer.isCompatible(FeatureType::Volcano, 0.75f, Biome::Hills));
    EXPECT_FALSE(placer.isCompatible(FeatureType::Volcano, 0.7f, Biome::Hills));
    EXPECT_FALSE(placer.isCompatible(FeatureType::Volcano, 0.9f, Biome::Lake));
}

TEST_F(FeaturePlacerTest, SubmergedCityNeedsWater) {
    EXPECT_TRUE(placer.isCompatible(FeatureType::SubmergedCity, 0.1f, Biome::Ocean));
    EXPECT_FALSE(placer.isCompatible(FeatureType::SubmergedCity, 0.1f, Biome::Swamp));
    EXPECT_FALSE(placer.isCompatible(FeatureType::SubmergedCity, 0.2f, Biome::Ocean));
}

TEST_F(FeaturePlacerTest, RuinsAndMagicNeedHabitableLand) {
    for (FeatureType type : {FeatureType::AncientRuins, FeatureType::MagicZone}) {
        EXPECT_TRUE(placer.isCompatible(type, 0.4f, Biome::Grassland));
        EXPECT_FALSE(placer.isCompatible(type, 0.9f, Biome::Mountain));
        EXPECT_FALSE(placer.isCompatible(type, 0.1f, Biome::Grassland));
        EXPECT_FALSE(placer.isCompatible(type, 0.4f, Biome::Ocean));
    }
}

TEST_F(FeaturePlacerTest, CrystalCaveNeedsUplands) {
    EXPECT_TRUE(placer.isCompatible(FeatureType::CrystalCave, 0.55f, Biome::Grassland));
    EXPECT_TRUE(placer.isCompatible(FeatureType::CrystalCave, 0.9f, Biome::Mountain));
    EXPECT_FALSE(placer.isCompatible(FeatureType::CrystalCave, 0.5f, Biome::Grassland));
    EXPECT_FALSE(placer.isCompatible(FeatureType::CrystalCave, 0.6f, Biome::Lake));
}

TEST_F(FeaturePlacerTest, EvaluateReportsReason) {
    std::vector<RegionalFeature> accepted = {{0, FeatureType::AncientRuins, 30, 30, 0.5f}};

    EXPECT_EQ(placer.evaluate(FeatureType::AncientRuins, 64, 0, terrain.elevation, terrain.biomes, accepted),
              PlacementResult::OutOfBounds);
    EXPECT_EQ(placer.evaluate(FeatureType::AncientRuins, 5, 5, terrain.elevation, terrain.biomes, accepted),
              PlacementResult::Incompatible);
    EXPECT_EQ(placer.evaluate(FeatureType::AncientRuins, 33, 34, terrain.elevation, terrain.biomes, accepted),
              PlacementResult::TooClose);
    // Exactly minSeparation away is allowed
    EXPECT_EQ(placer.evaluate(FeatureType::AncientRuins, 36, 38, terrain.elevation, terrain.biomes, accepted),
              PlacementResult::Placed);
}

// ============================================================================
// Placement
// ============================================================================

TEST_F(FeaturePlacerTest, PlacedFeaturesSatisfyConstraints) {
    auto features = placer.place(terrain.elevation, terrain.biomes, 12345, 12);

    EXPECT_LE(features.size(), 12u);
    EXPECT_FALSE(features.empty());
    for (size_t i = 0; i < features.size(); ++i) {
        const auto& f = features[i];
        EXPECT_EQ(f.id, static_cast<int32_t>(i));
        EXPECT_TRUE(terrain.elevation.inBounds(f.x, f.y));
        EXPECT_TRUE(placer.isCompatible(f.type, terrain.elevation(f.x, f.y), terrain.biomes(f.x, f.y)));
        EXPECT_GE(f.intensity, 0.3f);
        EXPECT_LE(f.intensity, 1.0f);

        for (size_t j = 0; j < i; ++j) {
            float dx = static_cast<float>(f.x - features[j].x);
            float dy = static_cast<float>(f.y - features[j].y);
            EXPECT_GE(std::sqrt(dx * dx + dy * dy), 10.0f);
        }
    }
}

TEST_F(FeaturePlacerTest, Deterministic) {
    auto a = placer.place(terrain.elevation, terrain.biomes, 99, 8);
    auto b = placer.place(terrain.elevation, terrain.biomes, 99, 8);
    EXPECT_EQ(a, b);
}

TEST_F(FeaturePlacerTest, ZeroCountPlacesNothing) {
    EXPECT_TRUE(placer.place(terrain.elevation, terrain.biomes, 1, 0).empty());
}

TEST_F(FeaturePlacerTest, CrowdedMapStopsAtAttemptBudget) {
    // A 5x5 map fits one feature at separation 10
    Grid2D<float> elevation(5, 5, 0.4f);
    Grid2D<Biome> biomes(5, 5, Biome::Grassland);

    auto features = placer.place(elevation, biomes, 7, 20);
    EXPECT_LE(features.size(), 1u);
}

TEST_F(FeaturePlacerTest, HostileMapPlacesNothing) {
    // Water biomes above the submerged ceiling suit no feature type
    Grid2D<float> elevation(32, 32, 0.3f);
    Grid2D<Biome> biomes(32, 32, Biome::Ocean);

    EXPECT_TRUE(placer.place(elevation, biomes, 3, 10).empty());
}

TEST_F(FeaturePlacerTest, RejectsBadInput) {
    EXPECT_THROW((void)placer.place(terrain.elevation, terrain.biomes, 1, -1), std::invalid_argument);

    Grid2D<Biome> small(8, 8, Biome::Ocean);
    EXPECT_THROW((void)placer.place(terrain.elevation, small, 1, 3), std::invalid_argument);
}
