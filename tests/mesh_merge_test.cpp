#include "equipot/mesh.hpp"

#include <array>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace {

bool near(const equipot::Vec3& a, const equipot::Vec3& b, double tol = 1e-12) {
    return std::abs(a.x - b.x) <= tol && std::abs(a.y - b.y) <= tol && std::abs(a.z - b.z) <= tol;
}

}  // namespace

int main() {
    using namespace equipot;

    // Two triangles of a folded quad emitted as a soup: the shared edge welds together.
    {
        Mesh mesh;
        mesh.vertices = {Vec3{0.1, 0.1, 0.1}, Vec3{1.1, 0.1, 0.1}, Vec3{0.1, 1.1, 0.1},
                         Vec3{1.1, 0.1, 0.1}, Vec3{0.1, 0.1, 0.1}, Vec3{0.1, 0.1, -0.9}};
        mesh.triangles = {{0, 1, 2}, {3, 4, 5}};
        computeFaceNormals(mesh);
        computeVertexNormals(mesh);
        assignFaceUvs(mesh);

        const std::size_t removed = mergeVertices(mesh, 1e-4);
        if (removed != 2 || mesh.vertexCount() != 4 || mesh.triangleCount() != 2) {
            std::cerr << "Expected 2 vertices removed leaving 4, got " << removed << " removed and "
                      << mesh.vertexCount() << " kept\n";
            return 1;
        }
        if (!mesh.faceNormals.empty() || !mesh.vertexNormals.empty() || !mesh.faceUvs.empty()) {
            std::cerr << "Merging must clear derived arrays\n";
            return 1;
        }
        // First occurrence order is preserved.
        if (mesh.triangles[0] != std::array<std::size_t, 3>{0, 1, 2} ||
            mesh.triangles[1] != std::array<std::size_t, 3>{1, 0, 3}) {
            std::cerr << "Triangle indices were not remapped onto first occurrences\n";
            return 1;
        }

        computeFaceNormals(mesh);
        if (!near(mesh.faceNormals[0], Vec3{0.0, 0.0, 1.0}) || !near(mesh.faceNormals[1], Vec3{0.0, -1.0, 0.0})) {
            std::cerr << "Face normals should be unit (b - a) x (c - a)\n";
            return 1;
        }
        computeVertexNormals(mesh);
        const double h = 1.0 / std::sqrt(2.0);
        if (!near(mesh.vertexNormals[0], Vec3{0.0, -h, h}, 1e-12) || !near(mesh.vertexNormals[2], Vec3{0.0, 0.0, 1.0})) {
            std::cerr << "Shared vertices should average the adjacent face normals\n";
            return 1;
        }
        assignFaceUvs(mesh);
        for (const auto& uv : mesh.faceUvs) {
            if (uv[0].u != 0.0 || uv[0].v != 0.0 || uv[1].u != 0.0 || uv[1].v != 1.0 || uv[2].u != 1.0 ||
                uv[2].v != 1.0) {
                std::cerr << "Face UVs should be (0,0), (0,1), (1,1)\n";
                return 1;
            }
        }
    }

    // A sliver whose two corners collapse is dropped.
    {
        Mesh mesh;
        mesh.vertices = {Vec3{0.2, 0.2, 0.2}, Vec3{0.2, 0.2, 0.2000000001}, Vec3{1.2, 0.2, 0.2}, Vec3{0.2, 1.2, 0.2},
                         Vec3{1.2, 1.2, 0.2}};
        mesh.triangles = {{0, 1, 2}, {0, 2, 3}, {3, 2, 4}};
        mergeVertices(mesh, 1e-4);
        if (mesh.vertexCount() != 4 || mesh.triangleCount() != 2) {
            std::cerr << "Collapsed triangle should be removed, leaving 2 triangles over 4 vertices\n";
            return 1;
        }
    }

    // Non-finite vertices are never merged with anything, including each other.
    {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        Mesh mesh;
        mesh.vertices = {Vec3{nan, 0.0, 0.0}, Vec3{nan, 0.0, 0.0}, Vec3{0.3, 0.3, 0.3}};
        mesh.triangles = {{0, 1, 2}};
        const std::size_t removed = mergeVertices(mesh, 1e-4);
        if (removed != 0 || mesh.triangleCount() != 1 || countNonFiniteVertices(mesh) != 2) {
            std::cerr << "NaN vertices must survive merging unchanged\n";
            return 1;
        }
        computeFaceNormals(mesh);
        computeVertexNormals(mesh);
        if (mesh.vertexNormals[2] != Vec3{}) {
            std::cerr << "A vertex touching only a NaN face should get a zero normal\n";
            return 1;
        }
        const MeshBounds bounds = computeBounds(mesh);
        if (!bounds.valid || bounds.min != Vec3{0.3, 0.3, 0.3} || bounds.max != Vec3{0.3, 0.3, 0.3}) {
            std::cerr << "Bounds should ignore non-finite vertices\n";
            return 1;
        }
    }

    {
        Mesh mesh;
        for (const double bad : {0.0, -1e-4}) {
            bool threw = false;
            try {
                mergeVertices(mesh, bad);
            } catch (const std::invalid_argument&) {
                threw = true;
            }
            if (!threw) {
                std::cerr << "mergeVertices accepted tolerance " << bad << "\n";
                return 1;
            }
        }
        mesh.vertices = {Vec3{}, Vec3{1.0, 0.0, 0.0}, Vec3{0.0, 1.0, 0.0}};
        mesh.triangles = {{0, 1, 2}};
        bool threw = false;
        try {
            computeVertexNormals(mesh);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "computeVertexNormals should refuse to run without face normals\n";
            return 1;
        }
    }

    return 0;
}
