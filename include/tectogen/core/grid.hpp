/**
 * @file grid.hpp
 * @brief Dense row-major 2D tile grid
 *
 * Every per-tile product of world generation (elevation, climate, biome,
 * plate ownership) is stored in a Grid2D indexed by (x, y).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace tectogen {

template<typename T>
class Grid2D {
public:
    Grid2D() = default;

    Grid2D(int32_t width, int32_t height, T fill = T{})
        : width_(width), height_(height) {
        if (width < 0 || height < 0) {
            throw std::invalid_argument("Grid2D dimensions must be non-negative");
        }
        cells_.assign(static_cast<size_t>(width) * static_cast<size_t>(height), fill);
    }

    [[nodiscard]] int32_t width() const { return width_; }
    [[nodiscard]] int32_t height() const { return height_; }
    [[nodiscard]] size_t size() const { return cells_.size(); }
    [[nodiscard]] bool empty() const { return cells_.empty(); }

    [[nodiscard]] bool inBounds(int32_t x, int32_t y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    /// Row-major cell index
    [[nodiscard]] size_t index(int32_t x, int32_t y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x);
    }

    // Unchecked access
    [[nodiscard]] T& operator()(int32_t x, int32_t y) { return cells_[index(x, y)]; }
    [[nodiscard]] const T& operator()(int32_t x, int32_t y) const { return cells_[index(x, y)]; }

    // Checked access
    [[nodiscard]] T& at(int32_t x, int32_t y) {
        checkBounds(x, y);
        return cells_[index(x, y)];
    }
    [[nodiscard]] const T& at(int32_t x, int32_t y) const {
        checkBounds(x, y);
        return cells_[index(x, y)];
    }

    void fill(const T& value) { cells_.assign(cells_.size(), value); }

    [[nodiscard]] const T* data() const { return cells_.data(); }
    [[nodiscard]] T* data() { return cells_.data(); }
    [[nodiscard]] const std::vector<T>& cells() const { return cells_; }

    [[nodiscard]] auto begin() const { return cells_.begin(); }
    [[nodiscard]] auto end() const { return cells_.end(); }

    [[nodiscard]] bool operator==(const Grid2D& other) const = default;

private:
    int32_t width_ = 0;
    int32_t height_ = 0;
    std::vector<T> cells_;

    void checkBounds(int32_t x, int32_t y) const {
        if (!inBounds(x, y)) {
            throw std::out_of_range("Grid2D::at (" + std::to_string(x) + ", " +
                                    std::to_string(y) + ") out of bounds");
        }
    }
};

}  // namespace tectogen
