// filename: marching_cubes.hpp
// part of Equipotential Surface Mesher
// MIT License

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "equipot/grid.hpp"
#include "equipot/mesh.hpp"

namespace equipot {

struct ExtractOptions {
    bool mergeVertices{true};
    double mergeTolerance{1e-4};
    std::size_t threads{1};
};

struct ExtractStats {
    std::size_t cubesVisited{0};
    std::size_t activeCubes{0};
    std::size_t rawVertexCount{0};
    std::size_t nonFiniteVertices{0};
    std::size_t workerCount{0};
};

/**
 * @brief Classify the 8 corners of one cube against the isolevel.
 *
 * cornerValues follow grid order: (0,0,0), (1,0,0), (0,1,0), (1,1,0), then the same four
 * at z + 1. A corner is inside when its value is strictly below the isolevel. Corners map
 * to bits 1, 2, 8, 4, 16, 32, 128, 64 so the result indexes the standard tables directly.
 */
[[nodiscard]] std::uint8_t cubeConfiguration(const std::array<double, 8>& cornerValues, double isolevel);

/**
 * @brief Triangulate the level set values == isolevel over every cube of the grid.
 *
 * Cubes are visited x fastest, then y, then z, and the triangle order follows that visit
 * order for any thread count. The surface is clipped at the grid boundary. Non-finite
 * samples are not an error; they propagate into the affected vertices.
 * @throws std::invalid_argument when values.size() != grid.pointCount().
 */
[[nodiscard]] Mesh extractMesh(const Grid3D& grid,
                               const std::vector<double>& values,
                               double isolevel,
                               const ExtractOptions& options = {},
                               ExtractStats* stats = nullptr);

}  // namespace equipot
