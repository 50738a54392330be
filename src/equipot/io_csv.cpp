// filename: io_csv.cpp
// part of Equipotential Surface Mesher
// MIT License

#include "equipot/io_csv.hpp"

#include <fstream>
#include <stdexcept>

namespace equipot {

void write_csv_frame_summary(const std::string& path, const std::vector<FrameSummary>& frames) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open CSV output: " + path);
    }

    ofs << "frame,time,mass_ratio,separation,orbit_degrees,isolevel,triangles,vertices,non_finite_vertices,"
           "sample_seconds,extract_seconds\n";
    for (const auto& frame : frames) {
        ofs << frame.index << ',' << frame.time << ',' << frame.massRatio << ',' << frame.separation << ','
            << frame.orbitDegrees << ',' << frame.isolevel << ',' << frame.triangles << ',' << frame.vertices
            << ',' << frame.nonFiniteVertices << ',' << frame.sampleSeconds << ',' << frame.extractSeconds
            << '\n';
    }
    if (!ofs) {
        throw std::runtime_error("Failed while writing CSV output: " + path);
    }
}

void write_csv_field_samples(const std::string& path, const Grid3D& grid, const std::vector<double>& values) {
    if (values.size() != grid.points.size()) {
        throw std::invalid_argument("write_csv_field_samples: mismatched vector sizes");
    }

    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open CSV output: " + path);
    }

    ofs << "x,y,z,value\n";
    for (std::size_t i = 0; i < values.size(); ++i) {
        const Vec3& p = grid.points[i];
        ofs << p.x << ',' << p.y << ',' << p.z << ',' << values[i] << '\n';
    }
    if (!ofs) {
        throw std::runtime_error("Failed while writing CSV output: " + path);
    }
}

}  // namespace equipot
