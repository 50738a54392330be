// filename: io_obj.cpp
// part of Equipotential Surface Mesher
// MIT License

#include "equipot/io_obj.hpp"

#include <fstream>
#include <iomanip>
#include <limits>
#include <locale>
#include <stdexcept>
#include <string>

namespace equipot {

void write_obj_mesh(const std::string& path, const Mesh& mesh) {
    for (const auto& tri : mesh.triangles) {
        for (const std::size_t v : tri) {
            if (v >= mesh.vertices.size()) {
                throw std::invalid_argument("OBJ export: triangle references vertex " + std::to_string(v) +
                                            " beyond " + std::to_string(mesh.vertices.size()) + " vertices");
            }
        }
    }
    const bool writeNormals = !mesh.vertexNormals.empty() && mesh.vertexNormals.size() == mesh.vertices.size();
    const bool writeUvs = !mesh.faceUvs.empty() && mesh.faceUvs.size() == mesh.triangles.size();

    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open OBJ output: " + path);
    }
    ofs.imbue(std::locale::classic());
    ofs << std::setprecision(std::numeric_limits<double>::max_digits10);

    ofs << "# equipotential surface\n";
    ofs << "# vertices " << mesh.vertices.size() << "\n";
    ofs << "# triangles " << mesh.triangles.size() << "\n";
    for (const auto& v : mesh.vertices) {
        ofs << "v " << v.x << ' ' << v.y << ' ' << v.z << '\n';
    }
    // One vt per triangle corner, in triangle order.
    if (writeUvs) {
        for (const auto& uvs : mesh.faceUvs) {
            for (const auto& uv : uvs) {
                ofs << "vt " << uv.u << ' ' << uv.v << '\n';
            }
        }
    }
    if (writeNormals) {
        for (const auto& n : mesh.vertexNormals) {
            ofs << "vn " << n.x << ' ' << n.y << ' ' << n.z << '\n';
        }
    }
    for (std::size_t t = 0; t < mesh.triangles.size(); ++t) {
        ofs << 'f';
        for (std::size_t c = 0; c < 3; ++c) {
            const std::size_t oneBased = mesh.triangles[t][c] + 1;
            ofs << ' ' << oneBased;
            if (writeUvs) {
                ofs << '/' << 3 * t + c + 1;
                if (writeNormals) {
                    ofs << '/' << oneBased;
                }
            } else if (writeNormals) {
                ofs << "//" << oneBased;
            }
        }
        ofs << '\n';
    }

    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed while writing OBJ output: " + path);
    }
}

}  // namespace equipot
