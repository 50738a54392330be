// filename: grid.hpp
// part of Equipotential Surface Mesher
// MIT License

#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

#include "equipot/types.hpp"

namespace equipot {

/**
 * @brief Regular cubic lattice of sample points shared by the field and the extractor.
 *
 * Points are stored flattened with x fastest: idx(i, j, k) = i + size*j + size*size*k.
 * The lattice is immutable after construction.
 */
struct Grid3D {
    std::size_t size{0};
    double axisMin{0.0};
    double axisMax{0.0};
    std::vector<Vec3> points;

    Grid3D() = default;

    Grid3D(std::size_t sizeIn, double axisMinIn, double axisMaxIn);

    [[nodiscard]] inline std::size_t idx(std::size_t i, std::size_t j, std::size_t k) const {
        return i + size * j + size * size * k;
    }

    [[nodiscard]] inline bool inBounds(std::size_t i, std::size_t j, std::size_t k) const {
        return i < size && j < size && k < size;
    }

    [[nodiscard]] inline const Vec3& point(std::size_t i, std::size_t j, std::size_t k) const {
        if (!inBounds(i, j, k)) {
            throw std::out_of_range("Grid3D::point index out of range");
        }
        return points[idx(i, j, k)];
    }

    [[nodiscard]] inline std::size_t pointCount() const { return size * size * size; }

    [[nodiscard]] inline std::size_t cubeCount() const {
        return size < 2 ? 0 : (size - 1) * (size - 1) * (size - 1);
    }

    [[nodiscard]] inline double spacing() const {
        return size < 2 ? 0.0 : (axisMax - axisMin) / static_cast<double>(size - 1);
    }
};

// Largest per-axis size whose size^3 points still fit in one std::vector<Vec3>.
[[nodiscard]] std::size_t maxGridSize();

/**
 * @brief Build a size^3 lattice spanning [axisMin, axisMax] on every axis, endpoints included.
 * @throws std::invalid_argument when size < 2 or size > maxGridSize().
 */
Grid3D buildGrid(std::size_t size, double axisMin, double axisMax);

}  // namespace equipot
