#include "equipot/field.hpp"
#include "equipot/grid.hpp"
#include "equipot/marching_cubes.hpp"

#include <cmath>
#include <iostream>
#include <vector>

namespace {

bool identical(const equipot::Mesh& a, const equipot::Mesh& b) {
    if (a.vertexCount() != b.vertexCount() || a.triangleCount() != b.triangleCount()) {
        return false;
    }
    for (std::size_t i = 0; i < a.vertexCount(); ++i) {
        if (a.vertices[i] != b.vertices[i]) {
            return false;
        }
    }
    for (std::size_t t = 0; t < a.triangleCount(); ++t) {
        if (a.triangles[t] != b.triangles[t]) {
            return false;
        }
    }
    return true;
}

}  // namespace

// Equal sources 3 apart on a coarse 10^3 grid spanning [-6, 6]: two separate lobes at 0.7.
int main() {
    using namespace equipot;

    const Grid3D grid = buildGrid(10, -6.0, 6.0);
    const PotentialParams params{1.0, 3.0, 0.0};
    const double isolevel = 0.7;

    const auto field = sampleField(grid.points, params);
    const FieldRange range = computeFieldRange(field);
    if (range.nonFinite != 0) {
        std::cerr << "No lattice point coincides with a source, yet the field has non-finite samples\n";
        return 1;
    }
    if (!(range.min < isolevel && isolevel < range.max)) {
        std::cerr << "Isolevel " << isolevel << " should lie inside the sampled range [" << range.min << ", "
                  << range.max << "]\n";
        return 1;
    }

    ExtractStats stats{};
    const Mesh mesh = extractMesh(grid, field, isolevel, {}, &stats);
    if (mesh.empty()) {
        std::cerr << "Scenario produced an empty mesh\n";
        return 1;
    }
    if (countNonFiniteVertices(mesh) != 0 || stats.nonFiniteVertices != 0) {
        std::cerr << "Scenario mesh contains non-finite vertices\n";
        return 1;
    }
    for (const auto& tri : mesh.triangles) {
        for (const std::size_t v : tri) {
            if (v >= mesh.vertexCount()) {
                std::cerr << "Triangle references vertex " << v << " past the end\n";
                return 1;
            }
        }
        if (tri[0] == tri[1] || tri[1] == tri[2] || tri[0] == tri[2]) {
            std::cerr << "Degenerate triangle survived the merge\n";
            return 1;
        }
    }

    // Both lobes sit well inside the domain and straddle the x = 0 plane.
    const MeshBounds bounds = computeBounds(mesh);
    if (!bounds.valid || bounds.min.x > -1.0 || bounds.max.x < 1.0) {
        std::cerr << "Expected geometry around both sources\n";
        return 1;
    }
    if (bounds.min.x <= grid.axisMin || bounds.max.x >= grid.axisMax || bounds.min.z <= grid.axisMin ||
        bounds.max.z >= grid.axisMax) {
        std::cerr << "Lobes should not touch the domain boundary\n";
        return 1;
    }
    std::size_t nearOrigin = 0;
    for (const auto& v : mesh.vertices) {
        if (std::abs(v.x) < 0.5 && std::abs(v.y) < 0.5 && std::abs(v.z) < 0.5) {
            ++nearOrigin;
        }
    }
    if (nearOrigin != 0) {
        std::cerr << "The midpoint potential is below 0.7, so the lobes must stay apart\n";
        return 1;
    }

    // Re-running, with or without threads, gives the same mesh bit for bit.
    const Mesh again = extractMesh(grid, field, isolevel);
    if (!identical(mesh, again)) {
        std::cerr << "Repeated extraction differs\n";
        return 1;
    }
    for (const std::size_t threads : {2u, 4u, 9u, 32u}) {
        ExtractOptions options{};
        options.threads = threads;
        SampleOptions sampleOptions{};
        sampleOptions.threads = threads;
        const Mesh threaded = extractMesh(grid, sampleField(grid.points, params, sampleOptions), isolevel, options);
        if (!identical(mesh, threaded)) {
            std::cerr << "Extraction with " << threads << " threads differs from the sequential mesh\n";
            return 1;
        }
    }

    // Heavier source B: the lobe opposite A grows.
    const auto skewed = sampleField(grid.points, PotentialParams{4.0, 3.0, 0.0});
    const Mesh skewedMesh = extractMesh(grid, skewed, isolevel);
    const MeshBounds skewedBounds = computeBounds(skewedMesh);
    if (!skewedBounds.valid || !(-skewedBounds.min.x > skewedBounds.max.x)) {
        std::cerr << "The stronger source at -x should own the larger lobe\n";
        return 1;
    }

    return 0;
}
