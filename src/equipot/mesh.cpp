// filename: mesh.cpp
// part of Equipotential Surface Mesher
// MIT License

#include "equipot/mesh.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace equipot {
namespace {

struct QuantizedKey {
    std::int64_t x{0};
    std::int64_t y{0};
    std::int64_t z{0};

    bool operator==(const QuantizedKey& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
};

struct QuantizedKeyHash {
    std::size_t operator()(const QuantizedKey& key) const {
        std::size_t seed = std::hash<std::int64_t>{}(key.x);
        seed ^= std::hash<std::int64_t>{}(key.y) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        seed ^= std::hash<std::int64_t>{}(key.z) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }
};

QuantizedKey quantize(const Vec3& p, double invTolerance) {
    return QuantizedKey{static_cast<std::int64_t>(std::llround(p.x * invTolerance)),
                        static_cast<std::int64_t>(std::llround(p.y * invTolerance)),
                        static_cast<std::int64_t>(std::llround(p.z * invTolerance))};
}

// llround is undefined past the int64 range, so very large coordinates stay unmerged too.
bool quantizable(const Vec3& p, double invTolerance) {
    constexpr double kLimit = 9.0e18;
    return isFinite(p) && std::abs(p.x * invTolerance) < kLimit &&
           std::abs(p.y * invTolerance) < kLimit && std::abs(p.z * invTolerance) < kLimit;
}

}  // namespace

std::size_t mergeVertices(Mesh& mesh, double tolerance) {
    if (!(tolerance > 0.0)) {
        throw std::invalid_argument("mergeVertices: tolerance must be positive");
    }
    const double invTolerance = 1.0 / tolerance;

    std::unordered_map<QuantizedKey, std::size_t, QuantizedKeyHash> lookup;
    lookup.reserve(mesh.vertices.size());
    std::vector<Vec3> unique;
    unique.reserve(mesh.vertices.size());
    std::vector<std::size_t> remap(mesh.vertices.size());

    for (std::size_t i = 0; i < mesh.vertices.size(); ++i) {
        const Vec3& v = mesh.vertices[i];
        if (!quantizable(v, invTolerance)) {
            remap[i] = unique.size();
            unique.push_back(v);
            continue;
        }
        const auto [it, inserted] = lookup.emplace(quantize(v, invTolerance), unique.size());
        if (inserted) {
            unique.push_back(v);
        }
        remap[i] = it->second;
    }

    std::vector<std::array<std::size_t, 3>> kept;
    kept.reserve(mesh.triangles.size());
    for (const auto& tri : mesh.triangles) {
        const std::array<std::size_t, 3> mapped{remap[tri[0]], remap[tri[1]], remap[tri[2]]};
        if (mapped[0] == mapped[1] || mapped[1] == mapped[2] || mapped[0] == mapped[2]) {
            continue;
        }
        kept.push_back(mapped);
    }

    const std::size_t removed = mesh.vertices.size() - unique.size();
    mesh.vertices = std::move(unique);
    mesh.triangles = std::move(kept);
    mesh.faceNormals.clear();
    mesh.vertexNormals.clear();
    mesh.faceUvs.clear();
    return removed;
}

void computeFaceNormals(Mesh& mesh) {
    mesh.faceNormals.resize(mesh.triangles.size());
    for (std::size_t t = 0; t < mesh.triangles.size(); ++t) {
        const auto& tri = mesh.triangles[t];
        const Vec3& a = mesh.vertices[tri[0]];
        const Vec3& b = mesh.vertices[tri[1]];
        const Vec3& c = mesh.vertices[tri[2]];
        const Vec3 n = cross(b - a, c - a);
        // keep NaN visible so vertex normals can skip it
        mesh.faceNormals[t] = isFinite(n) ? normalized(n) : n;
    }
}

void computeVertexNormals(Mesh& mesh) {
    if (mesh.faceNormals.size() != mesh.triangles.size()) {
        throw std::invalid_argument("computeVertexNormals: face normals are missing or stale");
    }
    mesh.vertexNormals.assign(mesh.vertices.size(), Vec3{});
    for (std::size_t t = 0; t < mesh.triangles.size(); ++t) {
        const Vec3& n = mesh.faceNormals[t];
        if (!isFinite(n)) {
            continue;
        }
        for (const std::size_t v : mesh.triangles[t]) {
            mesh.vertexNormals[v] = mesh.vertexNormals[v] + n;
        }
    }
    for (auto& n : mesh.vertexNormals) {
        n = normalized(n);
    }
}

void assignFaceUvs(Mesh& mesh) {
    const std::array<TexCoord, 3> uvs{TexCoord{0.0, 0.0}, TexCoord{0.0, 1.0}, TexCoord{1.0, 1.0}};
    mesh.faceUvs.assign(mesh.triangles.size(), uvs);
}

MeshBounds computeBounds(const Mesh& mesh) {
    MeshBounds bounds{};
    for (const auto& v : mesh.vertices) {
        if (!isFinite(v)) {
            continue;
        }
        if (!bounds.valid) {
            bounds.min = v;
            bounds.max = v;
            bounds.valid = true;
            continue;
        }
        bounds.min = Vec3{std::min(bounds.min.x, v.x), std::min(bounds.min.y, v.y), std::min(bounds.min.z, v.z)};
        bounds.max = Vec3{std::max(bounds.max.x, v.x), std::max(bounds.max.y, v.y), std::max(bounds.max.z, v.z)};
    }
    return bounds;
}

std::size_t countNonFiniteVertices(const Mesh& mesh) {
    return static_cast<std::size_t>(
        std::count_if(mesh.vertices.begin(), mesh.vertices.end(), [](const Vec3& v) { return !isFinite(v); }));
}

}  // namespace equipot
