#include "equipot/equipot.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {

using Clock = std::chrono::steady_clock;

void printUsage() {
    std::cout << "Usage: equipot_mesh [--scene PATH] [--frames N] [--dt SEC] [--omega DEG_S]"
                 " [--orbit-anim] [--no-orbit-anim] [--isolevel V] [--mass-ratio V]"
                 " [--separation V] [--orbit DEG] [--size N] [--threads N] [--merge-tol V]"
                 " [--no-merge] [--obj PATH] [--vtp-dir DIR] [--pvd PATH] [--field-vti PATH]"
                 " [--field-csv PATH] [--summary-csv PATH] [--quiet] [--no-quiet]\n";
}

void ensureParentDirectory(const std::filesystem::path& path) {
    const std::filesystem::path parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
}

bool parseDouble(const std::string& flag, const char* text, double& out) {
    try {
        std::size_t consumed = 0;
        const std::string value(text);
        out = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        std::cerr << flag << " requires a valid floating-point argument\n";
        return false;
    }
    if (!std::isfinite(out)) {
        std::cerr << flag << " requires a finite value\n";
        return false;
    }
    return true;
}

bool parseCount(const std::string& flag, const char* text, std::size_t& out) {
    long long value = 0;
    try {
        std::size_t consumed = 0;
        const std::string raw(text);
        value = std::stoll(raw, &consumed);
        if (consumed != raw.size()) {
            throw std::invalid_argument(raw);
        }
    } catch (const std::exception&) {
        std::cerr << flag << " requires a valid integer argument\n";
        return false;
    }
    if (value <= 0) {
        std::cerr << flag << " must be positive\n";
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

std::string frameFileName(const std::string& basename, std::size_t index, std::size_t digits) {
    std::ostringstream name;
    name << basename << '_' << std::setw(static_cast<int>(digits)) << std::setfill('0') << index << ".vtp";
    return name.str();
}

}  // namespace

int main(int argc, char** argv) {
    using namespace equipot;

    std::optional<std::string> scenePath;
    std::optional<std::size_t> framesOverride;
    std::optional<double> dtOverride;
    std::optional<double> omegaOverride;
    std::optional<bool> orbitAnimOverride;
    std::optional<double> isolevelOverride;
    std::optional<double> massRatioOverride;
    std::optional<double> separationOverride;
    std::optional<double> orbitOverride;
    std::optional<std::size_t> sizeOverride;
    std::optional<std::size_t> threadsOverride;
    std::optional<double> mergeTolOverride;
    bool noMerge = false;
    std::optional<std::string> objPath;
    std::optional<std::string> vtpDir;
    std::optional<std::string> pvdPath;
    std::optional<std::string> fieldVtiPath;
    std::optional<std::string> fieldCsvPath;
    std::optional<std::string> summaryCsvPath;
    std::optional<bool> quietOverride;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto needsValue = [&](const char* what) {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires " << what << "\n";
                printUsage();
                return false;
            }
            return true;
        };

        if (arg == "--scene") {
            if (!needsValue("a path argument")) {
                return 1;
            }
            scenePath = std::string(argv[++i]);
        } else if (arg == "--frames" || arg == "--size" || arg == "--threads") {
            if (!needsValue("an integer argument")) {
                return 1;
            }
            std::size_t value = 0;
            if (!parseCount(arg, argv[++i], value)) {
                return 1;
            }
            if (arg == "--frames") {
                framesOverride = value;
            } else if (arg == "--size") {
                sizeOverride = value;
            } else {
                threadsOverride = value;
            }
        } else if (arg == "--dt" || arg == "--omega" || arg == "--isolevel" || arg == "--mass-ratio" ||
                   arg == "--separation" || arg == "--orbit" || arg == "--merge-tol") {
            if (!needsValue("a floating-point argument")) {
                return 1;
            }
            double value = 0.0;
            if (!parseDouble(arg, argv[++i], value)) {
                return 1;
            }
            if (arg == "--dt") {
                dtOverride = value;
            } else if (arg == "--omega") {
                omegaOverride = value;
            } else if (arg == "--isolevel") {
                isolevelOverride = value;
            } else if (arg == "--mass-ratio") {
                massRatioOverride = value;
            } else if (arg == "--separation") {
                separationOverride = value;
            } else if (arg == "--orbit") {
                orbitOverride = value;
            } else {
                mergeTolOverride = value;
            }
        } else if (arg == "--orbit-anim") {
            orbitAnimOverride = true;
        } else if (arg == "--no-orbit-anim") {
            orbitAnimOverride = false;
        } else if (arg == "--no-merge") {
            noMerge = true;
        } else if (arg == "--obj" || arg == "--vtp-dir" || arg == "--pvd" || arg == "--field-vti" ||
                   arg == "--field-csv" || arg == "--summary-csv") {
            if (!needsValue("a path argument")) {
                return 1;
            }
            const std::string value = argv[++i];
            if (value.empty()) {
                std::cerr << arg << " requires a non-empty path\n";
                return 1;
            }
            if (arg == "--obj") {
                objPath = value;
            } else if (arg == "--vtp-dir") {
                vtpDir = value;
            } else if (arg == "--pvd") {
                pvdPath = value;
            } else if (arg == "--field-vti") {
                fieldVtiPath = value;
            } else if (arg == "--field-csv") {
                fieldCsvPath = value;
            } else {
                summaryCsvPath = value;
            }
        } else if (arg == "--quiet") {
            quietOverride = true;
        } else if (arg == "--no-quiet") {
            quietOverride = false;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    SceneSpec scene{};
    if (scenePath) {
        try {
            scene = loadSceneFromJson(*scenePath);
        } catch (const std::exception& ex) {
            std::cerr << "Failed to load scene: " << ex.what() << "\n";
            return 1;
        }
    }

    if (framesOverride) {
        scene.animation.frames = *framesOverride;
        scene.timeline.clear();
    }
    scene.animation.dt = dtOverride.value_or(scene.animation.dt);
    scene.animation.omegaDegPerSec = omegaOverride.value_or(scene.animation.omegaDegPerSec);
    scene.animation.orbit = orbitAnimOverride.value_or(scene.animation.orbit);
    scene.isolevel = isolevelOverride.value_or(scene.isolevel);
    scene.potential.massRatio = massRatioOverride.value_or(scene.potential.massRatio);
    scene.potential.separation = separationOverride.value_or(scene.potential.separation);
    scene.potential.orbitDegrees = orbitOverride.value_or(scene.potential.orbitDegrees);
    scene.grid.size = sizeOverride.value_or(scene.grid.size);
    scene.extraction.threads = threadsOverride.value_or(scene.extraction.threads);
    scene.extraction.mergeTolerance = mergeTolOverride.value_or(scene.extraction.mergeTolerance);
    if (noMerge) {
        scene.extraction.mergeVertices = false;
    }
    if (vtpDir) {
        SceneSpec::Outputs::MeshSeries series = scene.outputs.meshSeries.value_or(SceneSpec::Outputs::MeshSeries{});
        series.directory = *vtpDir;
        scene.outputs.meshSeries = series;
    }
    if (pvdPath) {
        if (!scene.outputs.meshSeries) {
            std::cerr << "--pvd requires a mesh series directory (--vtp-dir or outputs.mesh_series)\n";
            return 1;
        }
        scene.outputs.meshSeries->pvdPath = *pvdPath;
    }
    scene.outputs.objPath = objPath.value_or(scene.outputs.objPath);
    scene.outputs.fieldVtiPath = fieldVtiPath.value_or(scene.outputs.fieldVtiPath);
    scene.outputs.fieldCsvPath = fieldCsvPath.value_or(scene.outputs.fieldCsvPath);
    scene.outputs.summaryCsvPath = summaryCsvPath.value_or(scene.outputs.summaryCsvPath);
    const bool quiet = quietOverride.value_or(scene.extraction.quiet);

    try {
        validateScene(scene);
    } catch (const std::exception& ex) {
        std::cerr << "Invalid parameters: " << ex.what() << "\n";
        return 1;
    }

    std::vector<SceneFrame> frames;
    try {
        frames = expandSceneAnimation(scene);
    } catch (const std::exception& ex) {
        std::cerr << "Failed to expand animation: " << ex.what() << "\n";
        return 1;
    }
    if (frames.empty()) {
        std::cerr << "Scene expansion produced no frames\n";
        return 1;
    }

    Grid3D grid;
    try {
        grid = buildGrid(scene.grid.size, scene.grid.axisMin, scene.grid.axisMax);
    } catch (const std::exception& ex) {
        std::cerr << "Grid error: " << ex.what() << "\n";
        return 1;
    }

    if (!quiet) {
        std::cout << "Grid " << grid.size << "^3 over [" << grid.axisMin << ", " << grid.axisMax << "] ("
                  << grid.pointCount() << " samples, " << grid.cubeCount() << " cubes), " << frames.size()
                  << " frame(s), " << scene.extraction.threads << " thread(s)\n";
    }

    SampleOptions sampleOptions{};
    sampleOptions.threads = scene.extraction.threads;
    ExtractOptions extractOptions{};
    extractOptions.mergeVertices = scene.extraction.mergeVertices;
    extractOptions.mergeTolerance = scene.extraction.mergeTolerance;
    extractOptions.threads = scene.extraction.threads;

    const auto& meshSeries = scene.outputs.meshSeries;
    if (meshSeries) {
        std::error_code ec;
        std::filesystem::create_directories(meshSeries->directory, ec);
        if (ec) {
            std::cerr << "Failed to create mesh series directory " << meshSeries->directory << ": "
                      << ec.message() << "\n";
            return 1;
        }
    }
    const std::size_t frameDigits = std::max<std::size_t>(4, std::to_string(frames.size() - 1).size());

    std::vector<double> field;
    std::optional<PotentialParams> sampledParams;
    std::vector<FrameSummary> summaries;
    std::vector<PvdDataSet> seriesEntries;
    Mesh mesh;
    bool outputFailure = false;

    for (const auto& frame : frames) {
        FrameSummary summary{};
        summary.index = frame.index;
        summary.time = frame.time;
        summary.massRatio = frame.potential.massRatio;
        summary.separation = frame.potential.separation;
        summary.orbitDegrees = frame.potential.orbitDegrees;
        summary.isolevel = frame.isolevel;

        const bool potentialChanged = !sampledParams || sampledParams->massRatio != frame.potential.massRatio ||
                                      sampledParams->separation != frame.potential.separation ||
                                      sampledParams->orbitDegrees != frame.potential.orbitDegrees;
        if (potentialChanged) {
            const auto start = Clock::now();
            try {
                resetAndAccumulate(grid.points, frame.potential, field, sampleOptions);
            } catch (const std::exception& ex) {
                std::cerr << "Frame " << frame.index << " sampling failed: " << ex.what() << "\n";
                return 1;
            }
            summary.sampleSeconds = std::chrono::duration<double>(Clock::now() - start).count();
            sampledParams = frame.potential;
        }

        ExtractStats stats{};
        const auto extractStart = Clock::now();
        try {
            mesh = extractMesh(grid, field, frame.isolevel, extractOptions, &stats);
        } catch (const std::exception& ex) {
            std::cerr << "Frame " << frame.index << " extraction failed: " << ex.what() << "\n";
            return 1;
        }
        summary.extractSeconds = std::chrono::duration<double>(Clock::now() - extractStart).count();
        summary.triangles = mesh.triangleCount();
        summary.vertices = mesh.vertexCount();
        summary.nonFiniteVertices = stats.nonFiniteVertices;

        if (!quiet) {
            std::cout << "Frame " << frame.index << " t=" << frame.time << " orbit=" << frame.potential.orbitDegrees
                      << " iso=" << frame.isolevel << ": " << summary.triangles << " triangles, "
                      << summary.vertices << " vertices (" << stats.rawVertexCount << " raw, "
                      << stats.activeCubes << " active cubes)";
            if (stats.nonFiniteVertices > 0) {
                std::cout << ", " << stats.nonFiniteVertices << " non-finite";
            }
            std::cout << ", sample " << summary.sampleSeconds << " s, extract " << summary.extractSeconds
                      << " s\n";
        }
        if (stats.nonFiniteVertices > 0) {
            std::cerr << "Frame " << frame.index << ": " << stats.nonFiniteVertices
                      << " vertices are non-finite (a source sits on a grid point)\n";
        }

        if (meshSeries) {
            const std::filesystem::path framePath =
                std::filesystem::path(meshSeries->directory) /
                frameFileName(meshSeries->basename, frame.index, frameDigits);
            try {
                write_vtp_mesh(framePath.string(), mesh);
                seriesEntries.push_back(PvdDataSet{frame.time, framePath.string()});
            } catch (const std::exception& ex) {
                std::cerr << "Failed to write frame mesh: " << ex.what() << "\n";
                outputFailure = true;
            }
        }
        summaries.push_back(summary);
    }

    if (meshSeries && !meshSeries->pvdPath.empty() && !seriesEntries.empty()) {
        const std::filesystem::path pvd(meshSeries->pvdPath);
        ensureParentDirectory(pvd);
        const std::filesystem::path baseDir = pvd.parent_path();
        for (auto& entry : seriesEntries) {
            const std::filesystem::path filePath(entry.file);
            std::error_code ec;
            const std::filesystem::path relative = std::filesystem::relative(filePath, baseDir, ec);
            if (!ec && !relative.empty()) {
                entry.file = relative.string();
            }
        }
        try {
            write_pvd_series(pvd.string(), seriesEntries);
            if (!quiet) {
                std::cout << "Mesh series wrote " << seriesEntries.size() << " frame(s) to " << pvd << "\n";
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to write mesh series index: " << ex.what() << "\n";
            outputFailure = true;
        }
    }

    if (!scene.outputs.objPath.empty()) {
        const std::filesystem::path objOut(scene.outputs.objPath);
        ensureParentDirectory(objOut);
        try {
            write_obj_mesh(objOut.string(), mesh);
            if (!quiet) {
                std::cout << "Wrote OBJ mesh to " << objOut << "\n";
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to write OBJ mesh: " << ex.what() << "\n";
            outputFailure = true;
        }
    }

    if (!scene.outputs.fieldVtiPath.empty()) {
        const std::filesystem::path vtiOut(scene.outputs.fieldVtiPath);
        ensureParentDirectory(vtiOut);
        try {
            write_vti_scalar_field(vtiOut.string(), grid, field);
            if (!quiet) {
                std::cout << "Wrote potential field to " << vtiOut << "\n";
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to write potential field: " << ex.what() << "\n";
            outputFailure = true;
        }
    }

    if (!scene.outputs.fieldCsvPath.empty()) {
        const std::filesystem::path csvOut(scene.outputs.fieldCsvPath);
        ensureParentDirectory(csvOut);
        try {
            write_csv_field_samples(csvOut.string(), grid, field);
        } catch (const std::exception& ex) {
            std::cerr << "Failed to write field samples: " << ex.what() << "\n";
            outputFailure = true;
        }
    }

    if (!scene.outputs.summaryCsvPath.empty()) {
        const std::filesystem::path summaryOut(scene.outputs.summaryCsvPath);
        ensureParentDirectory(summaryOut);
        try {
            write_csv_frame_summary(summaryOut.string(), summaries);
        } catch (const std::exception& ex) {
            std::cerr << "Failed to write frame summary: " << ex.what() << "\n";
            outputFailure = true;
        }
    }

    if (outputFailure) {
        return 1;
    }
    return 0;
}
