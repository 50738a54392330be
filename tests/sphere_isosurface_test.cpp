#include "equipot/field.hpp"
#include "equipot/grid.hpp"
#include "equipot/marching_cubes.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

// Coincident equal sources give 2/r, so the level set at I is a sphere of radius 2/I.
int main() {
    using namespace equipot;

    const Grid3D grid = buildGrid(40, -6.0, 6.0);
    const PotentialParams params{1.0, 0.0, 0.0};
    const double isolevel = 0.7;
    const double expectedRadius = 2.0 / isolevel;
    const double tolerance = grid.spacing();

    const auto field = sampleField(grid.points, params);
    ExtractStats stats{};
    const Mesh mesh = extractMesh(grid, field, isolevel, {}, &stats);

    if (mesh.empty()) {
        std::cerr << "Sphere extraction produced no triangles\n";
        return 1;
    }
    if (stats.nonFiniteVertices != 0) {
        std::cerr << "Sphere mesh should be entirely finite\n";
        return 1;
    }
    if (!(mesh.vertexCount() < mesh.triangleCount())) {
        std::cerr << "Merged closed surface should have fewer vertices (" << mesh.vertexCount()
                  << ") than triangles (" << mesh.triangleCount() << ")\n";
        return 1;
    }

    double maxError = 0.0;
    double sumRadius = 0.0;
    for (const auto& v : mesh.vertices) {
        const double r = length(v);
        maxError = std::max(maxError, std::abs(r - expectedRadius));
        sumRadius += r;
    }
    if (maxError > tolerance) {
        std::cerr << "Vertex radius deviates by " << maxError << " from " << expectedRadius << " (limit " << tolerance
                  << ")\n";
        return 1;
    }
    const double meanRadius = sumRadius / static_cast<double>(mesh.vertexCount());
    if (std::abs(meanRadius - expectedRadius) > 0.25 * tolerance) {
        std::cerr << "Mean radius " << meanRadius << " is too far from " << expectedRadius << "\n";
        return 1;
    }

    // Normals face the low-potential side, which is away from the centre here.
    std::size_t outward = 0;
    for (std::size_t i = 0; i < mesh.vertexCount(); ++i) {
        const Vec3& n = mesh.vertexNormals[i];
        if (std::abs(length(n) - 1.0) > 1e-9) {
            std::cerr << "Vertex normal " << i << " is not unit length\n";
            return 1;
        }
        if (dot(n, mesh.vertices[i]) > 0.0) {
            ++outward;
        }
    }
    if (outward * 100 < mesh.vertexCount() * 99) {
        std::cerr << "Only " << outward << " of " << mesh.vertexCount() << " vertex normals point outward\n";
        return 1;
    }

    const MeshBounds bounds = computeBounds(mesh);
    if (!bounds.valid || bounds.min.x < -expectedRadius - tolerance || bounds.max.x > expectedRadius + tolerance) {
        std::cerr << "Sphere bounds are off\n";
        return 1;
    }
    if (mesh.faceUvs.size() != mesh.triangleCount() || mesh.faceNormals.size() != mesh.triangleCount()) {
        std::cerr << "Per-face arrays must match the triangle count\n";
        return 1;
    }

    return 0;
}
