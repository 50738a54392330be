#include "equipot/marching_cubes.hpp"
#include "equipot/mc_tables.hpp"

#include <array>
#include <iostream>
#include <set>

int main() {
    using namespace equipot;

    for (int cubeindex = 0; cubeindex < 256; ++cubeindex) {
        // An edge is crossed exactly when its two corners disagree about being inside.
        int expectedMask = 0;
        for (int e = 0; e < 12; ++e) {
            const bool a = (cubeindex >> kEdgeCornerPairs[e][0]) & 1;
            const bool b = (cubeindex >> kEdgeCornerPairs[e][1]) & 1;
            if (a != b) {
                expectedMask |= 1 << e;
            }
        }
        if (kEdgeTable[cubeindex] != expectedMask) {
            std::cerr << "Edge mask mismatch for configuration " << cubeindex << ": table " << kEdgeTable[cubeindex]
                      << ", corners say " << expectedMask << "\n";
            return 1;
        }

        const int* row = kTriTable[cubeindex];
        int used = 0;
        std::set<int> edgesInRow;
        while (used < 16 && row[used] != -1) {
            if (row[used] < 0 || row[used] > 11) {
                std::cerr << "Configuration " << cubeindex << " references invalid edge " << row[used] << "\n";
                return 1;
            }
            edgesInRow.insert(row[used]);
            ++used;
        }
        if (used % 3 != 0) {
            std::cerr << "Configuration " << cubeindex << " has a partial triangle\n";
            return 1;
        }
        if (used / 3 > kMaxTrianglesPerCube) {
            std::cerr << "Configuration " << cubeindex << " emits " << used / 3 << " triangles\n";
            return 1;
        }
        for (int i = used; i < 16; ++i) {
            if (row[i] != -1) {
                std::cerr << "Configuration " << cubeindex << " has data after its terminator\n";
                return 1;
            }
        }

        std::set<int> edgesInMask;
        for (int e = 0; e < 12; ++e) {
            if (expectedMask & (1 << e)) {
                edgesInMask.insert(e);
            }
        }
        if (edgesInRow != edgesInMask) {
            std::cerr << "Triangles of configuration " << cubeindex << " do not use exactly the crossed edges\n";
            return 1;
        }
    }

    if (kEdgeTable[0] != 0 || kEdgeTable[255] != 0 || kTriTable[0][0] != -1 || kTriTable[255][0] != -1) {
        std::cerr << "Uniform cubes must produce nothing\n";
        return 1;
    }

    // Grid-order corners light the standard bits 1, 2, 8, 4, 16, 32, 128, 64.
    const std::array<int, 8> expectedBits{1, 2, 8, 4, 16, 32, 128, 64};
    for (std::size_t c = 0; c < 8; ++c) {
        std::array<double, 8> values{};
        values.fill(1.0);
        values[c] = 0.0;
        const int got = cubeConfiguration(values, 0.5);
        if (got != expectedBits[c]) {
            std::cerr << "Grid corner " << c << " maps to bit " << got << ", expected " << expectedBits[c] << "\n";
            return 1;
        }
    }

    std::array<double, 8> all{};
    all.fill(0.5);
    if (cubeConfiguration(all, 0.5) != 0) {
        std::cerr << "Values equal to the isolevel must count as outside\n";
        return 1;
    }
    all.fill(0.25);
    if (cubeConfiguration(all, 0.5) != 255) {
        std::cerr << "All corners below the isolevel must give configuration 255\n";
        return 1;
    }

    return 0;
}
