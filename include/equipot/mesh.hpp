// filename: mesh.hpp
// part of Equipotential Surface Mesher
// MIT License

#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include "equipot/types.hpp"

namespace equipot {

struct TexCoord {
    double u{0.0};
    double v{0.0};
};

/**
 * @brief Indexed triangle mesh produced by one extraction call.
 *
 * faceNormals and faceUvs run parallel to triangles; vertexNormals runs parallel to
 * vertices. Any of the derived arrays may be empty until the matching pass has run.
 */
struct Mesh {
    std::vector<Vec3> vertices;
    std::vector<std::array<std::size_t, 3>> triangles;
    std::vector<Vec3> faceNormals;
    std::vector<Vec3> vertexNormals;
    std::vector<std::array<TexCoord, 3>> faceUvs;

    [[nodiscard]] std::size_t vertexCount() const { return vertices.size(); }
    [[nodiscard]] std::size_t triangleCount() const { return triangles.size(); }
    [[nodiscard]] bool empty() const { return triangles.empty(); }
};

/**
 * @brief Collapse vertices whose positions quantize to the same tolerance cell.
 *
 * Vertices keep the order of their first occurrence. Triangles that end up referencing
 * the same vertex twice are removed. Non-finite vertices are never merged. Derived
 * per-face and per-vertex arrays are cleared since they no longer line up.
 * @return number of vertices removed.
 * @throws std::invalid_argument when tolerance is not positive.
 */
std::size_t mergeVertices(Mesh& mesh, double tolerance);

// Unit (b - a) x (c - a) per triangle; degenerate triangles get a zero normal.
void computeFaceNormals(Mesh& mesh);

// Normalized mean of the finite face normals around each vertex. Requires face normals.
void computeVertexNormals(Mesh& mesh);

// Fixed (0,0), (0,1), (1,1) per triangle.
void assignFaceUvs(Mesh& mesh);

struct MeshBounds {
    Vec3 min;
    Vec3 max;
    bool valid{false};
};

// Bounds over finite vertices only.
[[nodiscard]] MeshBounds computeBounds(const Mesh& mesh);

[[nodiscard]] std::size_t countNonFiniteVertices(const Mesh& mesh);

}  // namespace equipot
