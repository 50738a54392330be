// filename: io_csv.hpp
// part of Equipotential Surface Mesher
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "equipot/grid.hpp"

namespace equipot {

struct FrameSummary {
    std::size_t index{0};
    double time{0.0};
    double massRatio{1.0};
    double separation{0.0};
    double orbitDegrees{0.0};
    double isolevel{0.0};
    std::size_t triangles{0};
    std::size_t vertices{0};
    std::size_t nonFiniteVertices{0};
    double sampleSeconds{0.0};
    double extractSeconds{0.0};
};

void write_csv_frame_summary(const std::string& path, const std::vector<FrameSummary>& frames);

// One row per grid point: x,y,z,value.
void write_csv_field_samples(const std::string& path, const Grid3D& grid, const std::vector<double>& values);

}  // namespace equipot
