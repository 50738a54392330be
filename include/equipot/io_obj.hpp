// filename: io_obj.hpp
// part of Equipotential Surface Mesher
// MIT License

#pragma once

#include <string>

#include "equipot/mesh.hpp"

namespace equipot {

// Wavefront OBJ with 1-based indices. Writes vt records (one per triangle corner) when
// the mesh carries face UVs, and vn records when it carries one vertex normal per vertex.
// Every index is checked before the file is opened; triangle winding is kept as extracted.
void write_obj_mesh(const std::string& path, const Mesh& mesh);

}  // namespace equipot
