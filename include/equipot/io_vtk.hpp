#pragma once

#include <string>
#include <vector>

#include "equipot/grid.hpp"
#include "equipot/mesh.hpp"

namespace equipot {

// Writes the mesh as VTK PolyData (.vtp) with raw appended Float64/Int64 arrays.
// Vertex normals are stored as point data and face normals as cell data when present.
void write_vtp_mesh(const std::string& path, const Mesh& mesh);

// Writes the sampled potential as VTK ImageData (.vti) point data named "potential".
// values must hold grid.pointCount() samples in grid index order.
void write_vti_scalar_field(const std::string& path, const Grid3D& grid, const std::vector<double>& values);

struct PvdDataSet {
    double time{0.0};
    std::string file;
};

void write_pvd_series(const std::string& path, const std::vector<PvdDataSet>& datasets);

}  // namespace equipot
