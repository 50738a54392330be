// filename: mc_tables.hpp
// part of Equipotential Surface Mesher
// MIT License

#pragma once

#include <array>

namespace equipot {

// Canonical marching cubes tables (standard corner and edge numbering).
//
// Corner c of the standard cube sets bit c of the configuration index; corners 0-3 run
// counter-clockwise around the bottom face starting at the origin and 4-7 repeat that
// order on the top face. kEdgeCornerPairs lists the two standard corners of each edge.

// 12-bit mask of the edges crossed by the surface, per configuration.
extern const int kEdgeTable[256];

// Up to five triangles per configuration as edge triples, terminated by -1.
extern const int kTriTable[256][16];

constexpr int kMaxTrianglesPerCube = 5;

constexpr std::array<std::array<int, 2>, 12> kEdgeCornerPairs{{
    {{0, 1}}, {{1, 2}}, {{2, 3}}, {{3, 0}},
    {{4, 5}}, {{5, 6}}, {{6, 7}}, {{7, 4}},
    {{0, 4}}, {{1, 5}}, {{2, 6}}, {{3, 7}},
}};

}  // namespace equipot
