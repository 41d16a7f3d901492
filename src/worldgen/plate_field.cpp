#include "tectogen/worldgen/plate_field.hpp"
#include "tectogen/worldgen/generation_params.hpp"
#include "tectogen/worldgen/noise.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace tectogen::worldgen {

std::string_view plateKindName(PlateKind kind) {
    switch (kind) {
        case PlateKind::Continental: return "continental";
        case PlateKind::Oceanic: return "oceanic";
    }
    return "unknown";
}

// ============================================================================
// Plate
// ============================================================================

Plate::Plate(int32_t id, glm::ivec2 center, glm::vec2 drift, PlateKind kind)
    : id_(id), center_(center), drift_(drift), kind_(kind) {
}

bool Plate::isColliding(const Plate& other) const {
    glm::vec2 toOther = glm::vec2(other.center_ - center_);
    return glm::dot(drift_, toOther) > 0.0f;
}

float Plate::collisionIntensity(const Plate& other) const {
    glm::vec2 relative = drift_ - other.drift_;
    return glm::dot(relative, relative) / 4.0f;
}

// ============================================================================
// PlateField
// ============================================================================

PlateField PlateField::generate(uint64_t seed, int32_t width, int32_t height, int32_t plateCount) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("PlateField: dimensions must be positive");
    }
    if (plateCount <= 0) {
        throw std::invalid_argument("PlateField: plate count must be positive, got " +
                                    std::to_string(plateCount));
    }

    std::vector<Plate> plates;
    plates.reserve(static_cast<size_t>(plateCount));

    for (int32_t i = 0; i < plateCount; ++i) {
        auto stream = SeedStream::forEntity(seed, StageSalt::Plates, static_cast<uint64_t>(i));

        int32_t cx = stream.nextInt(width);
        int32_t cy = stream.nextInt(height);
        float dx = stream.nextFloat() - 0.5f;
        float dy = stream.nextFloat() - 0.5f;
        PlateKind kind = stream.nextFloat() < 0.7f ? PlateKind::Continental : PlateKind::Oceanic;

        plates.emplace_back(i, glm::ivec2(cx, cy), glm::vec2(dx, dy), kind);
    }

    return PlateField(width, height, std::move(plates));
}

PlateField::PlateField(int32_t width, int32_t height, std::vector<Plate> plates)
    : plates_(std::move(plates)) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("PlateField: dimensions must be positive");
    }
    if (plates_.empty()) {
        throw std::invalid_argument("PlateField: at least one plate is required");
    }
    for (size_t i = 0; i < plates_.size(); ++i) {
        if (plates_[i].id() != static_cast<int32_t>(i)) {
            throw std::invalid_argument("PlateField: plate ids must match their index");
        }
        plates_[i].tiles_.clear();
    }

    plateIds_ = Grid2D<int32_t>(width, height, 0);
    partition();
}

void PlateField::partition() {
    for (int32_t y = 0; y < plateIds_.height(); ++y) {
        for (int32_t x = 0; x < plateIds_.width(); ++x) {
            int32_t nearest = 0;
            int64_t bestDist = std::numeric_limits<int64_t>::max();

            for (const auto& plate : plates_) {
                int64_t dx = static_cast<int64_t>(x) - plate.center_.x;
                int64_t dy = static_cast<int64_t>(y) - plate.center_.y;
                int64_t dist = dx * dx + dy * dy;
                // Strict compare keeps the lower id on ties
                if (dist < bestDist) {
                    bestDist = dist;
                    nearest = plate.id_;
                }
            }

            plateIds_(x, y) = nearest;
            plates_[static_cast<size_t>(nearest)].tiles_.emplace_back(x, y);
        }
    }
}

}  // namespace tectogen::worldgen
