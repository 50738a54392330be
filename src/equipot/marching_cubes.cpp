// filename: marching_cubes.cpp
// part of Equipotential Surface Mesher
// MIT License

#include "equipot/marching_cubes.hpp"

#include "equipot/mc_tables.hpp"
#include "parallel.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace equipot {
namespace {

// Grid-order corner c -> standard corner bit.
constexpr std::array<std::uint8_t, 8> kCornerBits{1, 2, 8, 4, 16, 32, 128, 64};

// Standard edge e -> its two corners in grid order, lower grid index first.
constexpr std::array<std::array<int, 2>, 12> kGridEdgeCorners{{
    {{0, 1}}, {{1, 3}}, {{2, 3}}, {{0, 2}},
    {{4, 5}}, {{5, 7}}, {{6, 7}}, {{4, 6}},
    {{0, 4}}, {{1, 5}}, {{3, 7}}, {{2, 6}},
}};

struct SlabSoup {
    std::vector<Vec3> vertices;
    std::size_t cubesVisited{0};
    std::size_t activeCubes{0};
};

void marchSlab(const Grid3D& grid,
               const std::vector<double>& values,
               double isolevel,
               std::size_t zBegin,
               std::size_t zEnd,
               SlabSoup& soup) {
    const std::size_t size = grid.size;
    const std::size_t size2 = size * size;
    const std::array<std::size_t, 8> offsets{0, 1, size, size + 1, size2, 1 + size2, size + size2,
                                             1 + size + size2};

    std::array<double, 8> cornerValues{};
    for (std::size_t z = zBegin; z < zEnd; ++z) {
        for (std::size_t y = 0; y + 1 < size; ++y) {
            for (std::size_t x = 0; x + 1 < size; ++x) {
                ++soup.cubesVisited;
                const std::size_t p = grid.idx(x, y, z);
                for (std::size_t c = 0; c < 8; ++c) {
                    cornerValues[c] = values[p + offsets[c]];
                }

                const std::uint8_t cubeindex = cubeConfiguration(cornerValues, isolevel);
                const int bits = kEdgeTable[cubeindex];
                if (bits == 0) {
                    continue;
                }
                ++soup.activeCubes;

                std::array<Vec3, 12> vlist{};
                for (std::size_t e = 0; e < 12; ++e) {
                    if ((bits & (1 << e)) == 0) {
                        continue;
                    }
                    const int a = kGridEdgeCorners[e][0];
                    const int b = kGridEdgeCorners[e][1];
                    const double mu = (isolevel - cornerValues[a]) / (cornerValues[b] - cornerValues[a]);
                    vlist[e] = lerp(grid.points[p + offsets[a]], grid.points[p + offsets[b]], mu);
                }

                const int* row = kTriTable[cubeindex];
                for (int i = 0; row[i] != -1; i += 3) {
                    soup.vertices.push_back(vlist[row[i]]);
                    soup.vertices.push_back(vlist[row[i + 1]]);
                    soup.vertices.push_back(vlist[row[i + 2]]);
                }
            }
        }
    }
}

}  // namespace

std::uint8_t cubeConfiguration(const std::array<double, 8>& cornerValues, double isolevel) {
    std::uint8_t cubeindex = 0;
    for (std::size_t c = 0; c < 8; ++c) {
        if (cornerValues[c] < isolevel) {
            cubeindex |= kCornerBits[c];
        }
    }
    return cubeindex;
}

Mesh extractMesh(const Grid3D& grid,
                 const std::vector<double>& values,
                 double isolevel,
                 const ExtractOptions& options,
                 ExtractStats* stats) {
    if (values.size() != grid.pointCount()) {
        throw std::invalid_argument("extractMesh: field has " + std::to_string(values.size()) +
                                    " samples but grid has " + std::to_string(grid.pointCount()));
    }

    const std::size_t slabCount = grid.size < 2 ? 0 : grid.size - 1;
    const std::size_t threads = options.threads == 0 ? 1 : options.threads;
    std::vector<SlabSoup> soups(std::max<std::size_t>(1, std::min(threads, slabCount)));
    const std::size_t workers =
        parallelChunks(slabCount, threads, [&](std::size_t chunk, std::size_t zBegin, std::size_t zEnd) {
            marchSlab(grid, values, isolevel, zBegin, zEnd, soups[chunk]);
        });

    Mesh mesh;
    std::size_t total = 0;
    for (const auto& soup : soups) {
        total += soup.vertices.size();
    }
    mesh.vertices.reserve(total);
    mesh.triangles.reserve(total / 3);
    for (const auto& soup : soups) {
        mesh.vertices.insert(mesh.vertices.end(), soup.vertices.begin(), soup.vertices.end());
    }
    for (std::size_t v = 0; v + 2 < mesh.vertices.size(); v += 3) {
        mesh.triangles.push_back({v, v + 1, v + 2});
    }

    if (stats != nullptr) {
        *stats = ExtractStats{};
        for (const auto& soup : soups) {
            stats->cubesVisited += soup.cubesVisited;
            stats->activeCubes += soup.activeCubes;
        }
        stats->rawVertexCount = mesh.vertices.size();
        stats->workerCount = workers;
    }

    if (options.mergeVertices) {
        mergeVertices(mesh, options.mergeTolerance);
    }
    computeFaceNormals(mesh);
    computeVertexNormals(mesh);
    assignFaceUvs(mesh);

    if (stats != nullptr) {
        stats->nonFiniteVertices = countNonFiniteVertices(mesh);
    }
    return mesh;
}

}  // namespace equipot
