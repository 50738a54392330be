#include "equipot/io_vtk.hpp"

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace equipot {
namespace {

bool isLittleEndian() {
    const std::uint16_t value = 1;
    return reinterpret_cast<const std::uint8_t*>(&value)[0] == 1;
}

struct AppendedArray {
    std::string section;  // "Points", "Polys", "PointData", "CellData"
    std::string type;     // "Float64" or "Int64"
    std::string name;
    int components{1};
    const char* data{nullptr};
    std::uint64_t bytes{0};
};

void writeArrayHeaders(std::ofstream& ofs,
                       const std::vector<AppendedArray>& arrays,
                       const std::vector<std::uint64_t>& offsets,
                       const std::string& section) {
    for (std::size_t i = 0; i < arrays.size(); ++i) {
        const auto& array = arrays[i];
        if (array.section != section) {
            continue;
        }
        ofs << "        <DataArray type=\"" << array.type << "\" Name=\"" << array.name << "\"";
        if (array.components > 1) {
            ofs << " NumberOfComponents=\"" << array.components << "\"";
        }
        ofs << " format=\"appended\" offset=\"" << offsets[i] << "\"/>\n";
    }
}

void writeAppendedBlock(std::ofstream& ofs, const std::vector<AppendedArray>& arrays) {
    ofs << "  <AppendedData encoding=\"raw\">\n";
    ofs << '_';
    for (const auto& array : arrays) {
        ofs.write(reinterpret_cast<const char*>(&array.bytes), sizeof(array.bytes));
        if (array.bytes > 0) {
            ofs.write(array.data, static_cast<std::streamsize>(array.bytes));
        }
    }
    ofs << "\n";
    ofs << "  </AppendedData>\n";
}

std::vector<std::uint64_t> computeOffsets(const std::vector<AppendedArray>& arrays) {
    std::vector<std::uint64_t> offsets;
    offsets.reserve(arrays.size());
    std::uint64_t offset = 0;
    for (const auto& array : arrays) {
        offsets.push_back(offset);
        offset += sizeof(std::uint64_t) + array.bytes;
    }
    return offsets;
}

std::vector<double> flatten(const std::vector<Vec3>& values) {
    std::vector<double> flat;
    flat.reserve(values.size() * 3);
    for (const auto& v : values) {
        flat.push_back(v.x);
        flat.push_back(v.y);
        flat.push_back(v.z);
    }
    return flat;
}

}  // namespace

void write_vtp_mesh(const std::string& path, const Mesh& mesh) {
    for (const auto& tri : mesh.triangles) {
        for (const std::size_t v : tri) {
            if (v >= mesh.vertices.size()) {
                throw std::invalid_argument("VTP export: triangle references vertex " + std::to_string(v) +
                                            " beyond " + std::to_string(mesh.vertices.size()) + " vertices");
            }
        }
    }
    const bool hasVertexNormals = !mesh.vertexNormals.empty();
    const bool hasFaceNormals = !mesh.faceNormals.empty();
    if (hasVertexNormals && mesh.vertexNormals.size() != mesh.vertices.size()) {
        throw std::invalid_argument("VTP export requires one vertex normal per vertex");
    }
    if (hasFaceNormals && mesh.faceNormals.size() != mesh.triangles.size()) {
        throw std::invalid_argument("VTP export requires one face normal per triangle");
    }

    const std::vector<double> points = flatten(mesh.vertices);
    std::vector<std::int64_t> connectivity;
    std::vector<std::int64_t> cellOffsets;
    connectivity.reserve(mesh.triangles.size() * 3);
    cellOffsets.reserve(mesh.triangles.size());
    for (const auto& tri : mesh.triangles) {
        connectivity.push_back(static_cast<std::int64_t>(tri[0]));
        connectivity.push_back(static_cast<std::int64_t>(tri[1]));
        connectivity.push_back(static_cast<std::int64_t>(tri[2]));
        cellOffsets.push_back(static_cast<std::int64_t>(connectivity.size()));
    }
    const std::vector<double> vertexNormals = flatten(mesh.vertexNormals);
    const std::vector<double> faceNormals = flatten(mesh.faceNormals);

    std::vector<AppendedArray> arrays;
    arrays.push_back({"Points", "Float64", "Points", 3, reinterpret_cast<const char*>(points.data()),
                      points.size() * sizeof(double)});
    arrays.push_back({"Polys", "Int64", "connectivity", 1, reinterpret_cast<const char*>(connectivity.data()),
                      connectivity.size() * sizeof(std::int64_t)});
    arrays.push_back({"Polys", "Int64", "offsets", 1, reinterpret_cast<const char*>(cellOffsets.data()),
                      cellOffsets.size() * sizeof(std::int64_t)});
    if (hasVertexNormals) {
        arrays.push_back({"PointData", "Float64", "Normals", 3,
                          reinterpret_cast<const char*>(vertexNormals.data()),
                          vertexNormals.size() * sizeof(double)});
    }
    if (hasFaceNormals) {
        arrays.push_back({"CellData", "Float64", "FaceNormals", 3,
                          reinterpret_cast<const char*>(faceNormals.data()), faceNormals.size() * sizeof(double)});
    }
    const std::vector<std::uint64_t> offsets = computeOffsets(arrays);

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open VTP output: " + path);
    }

    ofs << "<?xml version=\"1.0\"?>\n";
    ofs << "<VTKFile type=\"PolyData\" version=\"1.0\" byte_order=\""
        << (isLittleEndian() ? "LittleEndian" : "BigEndian") << "\" header_type=\"UInt64\">\n";
    ofs << "  <PolyData>\n";
    ofs << "    <Piece NumberOfPoints=\"" << mesh.vertices.size() << "\" NumberOfVerts=\"0\""
        << " NumberOfLines=\"0\" NumberOfStrips=\"0\" NumberOfPolys=\"" << mesh.triangles.size() << "\">\n";
    if (hasVertexNormals) {
        ofs << "      <PointData Normals=\"Normals\">\n";
        writeArrayHeaders(ofs, arrays, offsets, "PointData");
        ofs << "      </PointData>\n";
    }
    if (hasFaceNormals) {
        ofs << "      <CellData Normals=\"FaceNormals\">\n";
        writeArrayHeaders(ofs, arrays, offsets, "CellData");
        ofs << "      </CellData>\n";
    }
    ofs << "      <Points>\n";
    writeArrayHeaders(ofs, arrays, offsets, "Points");
    ofs << "      </Points>\n";
    ofs << "      <Polys>\n";
    writeArrayHeaders(ofs, arrays, offsets, "Polys");
    ofs << "      </Polys>\n";
    ofs << "    </Piece>\n";
    ofs << "  </PolyData>\n";
    writeAppendedBlock(ofs, arrays);
    ofs << "</VTKFile>\n";
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed while writing VTP output: " + path);
    }
}

void write_vti_scalar_field(const std::string& path, const Grid3D& grid, const std::vector<double>& values) {
    if (grid.size < 2) {
        throw std::invalid_argument("VTI export requires at least a 2x2x2 grid");
    }
    if (values.size() != grid.pointCount()) {
        throw std::invalid_argument("VTI export requires one sample per grid point");
    }

    std::vector<AppendedArray> arrays;
    arrays.push_back({"PointData", "Float64", "potential", 1, reinterpret_cast<const char*>(values.data()),
                      values.size() * sizeof(double)});
    const std::vector<std::uint64_t> offsets = computeOffsets(arrays);

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open VTK output: " + path);
    }

    const std::size_t last = grid.size - 1;
    const double spacing = grid.spacing();
    ofs << std::setprecision(std::numeric_limits<double>::max_digits10);
    ofs << "<?xml version=\"1.0\"?>\n";
    ofs << "<VTKFile type=\"ImageData\" version=\"0.1\" byte_order=\""
        << (isLittleEndian() ? "LittleEndian" : "BigEndian") << "\" header_type=\"UInt64\">\n";
    ofs << "  <ImageData WholeExtent=\"0 " << last << " 0 " << last << " 0 " << last << "\""
        << " Origin=\"" << grid.axisMin << ' ' << grid.axisMin << ' ' << grid.axisMin << "\""
        << " Spacing=\"" << spacing << ' ' << spacing << ' ' << spacing << "\">\n";
    ofs << "    <Piece Extent=\"0 " << last << " 0 " << last << " 0 " << last << "\">\n";
    ofs << "      <PointData Scalars=\"potential\">\n";
    writeArrayHeaders(ofs, arrays, offsets, "PointData");
    ofs << "      </PointData>\n";
    ofs << "    </Piece>\n";
    ofs << "  </ImageData>\n";
    writeAppendedBlock(ofs, arrays);
    ofs << "</VTKFile>\n";
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed while writing VTK output: " + path);
    }
}

void write_pvd_series(const std::string& path, const std::vector<PvdDataSet>& datasets) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open PVD output: " + path);
    }

    ofs << std::setprecision(std::numeric_limits<double>::max_digits10);
    ofs << "<?xml version=\"1.0\"?>\n";
    ofs << "<VTKFile type=\"Collection\" version=\"0.1\">\n";
    ofs << "  <Collection>\n";
    for (const auto& dataset : datasets) {
        ofs << "    <DataSet timestep=\"" << dataset.time << "\" group=\"\" part=\"0\" file=\"" << dataset.file
            << "\"/>\n";
    }
    ofs << "  </Collection>\n";
    ofs << "</VTKFile>\n";
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed while writing PVD output: " + path);
    }
}

}  // namespace equipot
