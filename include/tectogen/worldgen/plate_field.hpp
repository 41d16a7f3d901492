/**
 * @file plate_field.hpp
 * @brief Tectonic plates and the discrete Voronoi partition of the map
 *
 * Each plate has an integer centre, a drift vector in [-0.5, 0.5]^2 and a
 * kind. Every tile belongs to the plate with the nearest centre (squared
 * Euclidean distance, ties to the lower id).
 */

#pragma once

#include "tectogen/core/grid.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace tectogen::worldgen {

enum class PlateKind : uint8_t {
    Continental,
    Oceanic,
};

[[nodiscard]] std::string_view plateKindName(PlateKind kind);

// ============================================================================
// Plate
// ============================================================================

class Plate {
public:
    Plate(int32_t id, glm::ivec2 center, glm::vec2 drift, PlateKind kind);

    [[nodiscard]] int32_t id() const { return id_; }
    [[nodiscard]] glm::ivec2 center() const { return center_; }
    [[nodiscard]] glm::vec2 drift() const { return drift_; }
    [[nodiscard]] PlateKind kind() const { return kind_; }

    /// Member tiles in row-major order
    [[nodiscard]] const std::vector<glm::ivec2>& tiles() const { return tiles_; }

    /// True if this plate drifts toward the other plate's centre
    [[nodiscard]] bool isColliding(const Plate& other) const;

    /// |drift_a - drift_b|^2 / 4, symmetric, in [0, 0.5]
    [[nodiscard]] float collisionIntensity(const Plate& other) const;

private:
    friend class PlateField;

    int32_t id_;
    glm::ivec2 center_;
    glm::vec2 drift_;
    PlateKind kind_;
    std::vector<glm::ivec2> tiles_;
};

// ============================================================================
// PlateField
// ============================================================================

class PlateField {
public:
    /**
     * @brief Draw plateCount plates from the plate stage of `seed` and partition
     *
     * Plate i draws, in order, centre x, centre y, drift x, drift y and kind
     * from its own stream (seed, plates, i).
     *
     * @throws std::invalid_argument if plateCount or a dimension is not positive
     */
    [[nodiscard]] static PlateField generate(uint64_t seed, int32_t width, int32_t height,
                                             int32_t plateCount);

    /// Partition the map among caller-supplied plates. Plate ids must equal
    /// their index. Any tiles already on the plates are replaced.
    PlateField(int32_t width, int32_t height, std::vector<Plate> plates);

    [[nodiscard]] int32_t width() const { return plateIds_.width(); }
    [[nodiscard]] int32_t height() const { return plateIds_.height(); }

    [[nodiscard]] const std::vector<Plate>& plates() const { return plates_; }
    [[nodiscard]] const Plate& plate(int32_t id) const { return plates_.at(static_cast<size_t>(id)); }

    [[nodiscard]] int32_t plateIdAt(int32_t x, int32_t y) const { return plateIds_.at(x, y); }
    [[nodiscard]] const Plate& plateAt(int32_t x, int32_t y) const { return plate(plateIdAt(x, y)); }
    [[nodiscard]] const Grid2D<int32_t>& plateIds() const { return plateIds_; }

private:
    void partition();

    std::vector<Plate> plates_;
    Grid2D<int32_t> plateIds_;
};

}  // namespace tectogen::worldgen
