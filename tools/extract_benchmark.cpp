// filename: extract_benchmark.cpp
// part of Equipotential Surface Mesher
// MIT License

#include "equipot/field.hpp"
#include "equipot/grid.hpp"
#include "equipot/marching_cubes.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct BenchmarkConfig {
    std::size_t size{40};
    double axisExtent{10.0};
    double massRatio{1.0};
    double separation{3.0};
    double orbitDegrees{0.0};
    double isolevel{0.5};
    std::size_t repeats{5};
    std::size_t threads{1};
    bool merge{true};
    bool verbose{false};
    bool writeCsv{false};
    std::string csvPath{};
};

void printUsage() {
    std::cout << "extract_benchmark options:\n"
              << "  --size <int>           Grid points per axis (default 40)\n"
              << "  --axis <float>         Half extent of the cubic domain (default 10)\n"
              << "  --mass-ratio <float>   Ratio of source strengths, >= 1 (default 1)\n"
              << "  --separation <float>   Source offset from the origin (default 3)\n"
              << "  --orbit <float>        Orbit angle in degrees (default 0)\n"
              << "  --isolevel <float>     Surface threshold (default 0.5)\n"
              << "  --repeats <int>        Number of benchmark repeats (default 5)\n"
              << "  --threads <int>        Worker threads for sampling and extraction (default 1)\n"
              << "  --no-merge             Skip the vertex merge pass\n"
              << "  --verbose              Print per-repeat timings\n"
              << "  --csv <path>           Append benchmark results to CSV file\n"
              << "  --help                 Show this message\n";
}

bool parseArgs(int argc, char** argv, BenchmarkConfig& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--help") {
                printUsage();
                return false;
            } else if (arg == "--size" && i + 1 < argc) {
                cfg.size = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--axis" && i + 1 < argc) {
                cfg.axisExtent = std::stod(argv[++i]);
            } else if (arg == "--mass-ratio" && i + 1 < argc) {
                cfg.massRatio = std::stod(argv[++i]);
            } else if (arg == "--separation" && i + 1 < argc) {
                cfg.separation = std::stod(argv[++i]);
            } else if (arg == "--orbit" && i + 1 < argc) {
                cfg.orbitDegrees = std::stod(argv[++i]);
            } else if (arg == "--isolevel" && i + 1 < argc) {
                cfg.isolevel = std::stod(argv[++i]);
            } else if (arg == "--repeats" && i + 1 < argc) {
                cfg.repeats = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--threads" && i + 1 < argc) {
                cfg.threads = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--no-merge") {
                cfg.merge = false;
            } else if (arg == "--verbose") {
                cfg.verbose = true;
            } else if (arg == "--csv" && i + 1 < argc) {
                cfg.writeCsv = true;
                cfg.csvPath = argv[++i];
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                return false;
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to parse argument " << arg << ": " << ex.what() << "\n";
            return false;
        }
    }
    return true;
}

struct TimingSummary {
    double avgMs{0.0};
    double minMs{0.0};
    double maxMs{0.0};
};

TimingSummary summarize(const std::vector<double>& durationsMs) {
    TimingSummary summary{};
    summary.avgMs = std::accumulate(durationsMs.begin(), durationsMs.end(), 0.0) /
                    static_cast<double>(durationsMs.size());
    const auto [minIt, maxIt] = std::minmax_element(durationsMs.begin(), durationsMs.end());
    summary.minMs = *minIt;
    summary.maxMs = *maxIt;
    return summary;
}

void writeCsvResult(const BenchmarkConfig& cfg,
                    const TimingSummary& sample,
                    const TimingSummary& extract,
                    std::size_t triangles,
                    std::size_t vertices) {
    namespace fs = std::filesystem;
    const fs::path csvPath{cfg.csvPath};
    const bool newFile = !fs::exists(csvPath);
    std::ofstream csv(csvPath, std::ios::app);
    if (!csv) {
        throw std::runtime_error("Failed to open CSV file: " + cfg.csvPath);
    }
    if (newFile) {
        csv << "size,axis,mass_ratio,separation,orbit_degrees,isolevel,threads,merge,"
               "sample_avg_ms,sample_min_ms,extract_avg_ms,extract_min_ms,extract_max_ms,triangles,vertices\n";
    }
    csv << cfg.size << ',' << cfg.axisExtent << ',' << cfg.massRatio << ',' << cfg.separation << ','
        << cfg.orbitDegrees << ',' << cfg.isolevel << ',' << cfg.threads << ',' << (cfg.merge ? 1 : 0) << ','
        << sample.avgMs << ',' << sample.minMs << ',' << extract.avgMs << ',' << extract.minMs << ','
        << extract.maxMs << ',' << triangles << ',' << vertices << '\n';
}

}  // namespace

int main(int argc, char** argv) {
    BenchmarkConfig cfg{};
    if (!parseArgs(argc, argv, cfg)) {
        return 1;
    }

    if (cfg.repeats == 0 || cfg.threads == 0) {
        std::cerr << "--repeats and --threads must be positive.\n";
        return 1;
    }
    if (!(cfg.axisExtent > 0.0)) {
        std::cerr << "--axis must be positive.\n";
        return 1;
    }

    equipot::Grid3D grid;
    try {
        grid = equipot::buildGrid(cfg.size, -cfg.axisExtent, cfg.axisExtent);
    } catch (const std::exception& ex) {
        std::cerr << "Grid error: " << ex.what() << "\n";
        return 1;
    }

    equipot::PotentialParams params{};
    params.massRatio = cfg.massRatio;
    params.separation = cfg.separation;
    params.orbitDegrees = cfg.orbitDegrees;

    equipot::SampleOptions sampleOptions{};
    sampleOptions.threads = cfg.threads;
    equipot::ExtractOptions extractOptions{};
    extractOptions.mergeVertices = cfg.merge;
    extractOptions.threads = cfg.threads;

    std::vector<double> sampleMs;
    std::vector<double> extractMs;
    sampleMs.reserve(cfg.repeats);
    extractMs.reserve(cfg.repeats);
    std::vector<double> field;
    equipot::Mesh mesh;
    equipot::ExtractStats stats{};

    for (std::size_t repeat = 0; repeat < cfg.repeats; ++repeat) {
        const auto sampleStart = std::chrono::steady_clock::now();
        auto sampleEnd = sampleStart;
        try {
            equipot::resetAndAccumulate(grid.points, params, field, sampleOptions);
            sampleEnd = std::chrono::steady_clock::now();
            mesh = equipot::extractMesh(grid, field, cfg.isolevel, extractOptions, &stats);
        } catch (const std::exception& ex) {
            std::cerr << "Benchmark repeat " << repeat << " failed: " << ex.what() << "\n";
            return 1;
        }
        const auto extractEnd = std::chrono::steady_clock::now();

        sampleMs.push_back(std::chrono::duration<double, std::milli>(sampleEnd - sampleStart).count());
        extractMs.push_back(std::chrono::duration<double, std::milli>(extractEnd - sampleEnd).count());
        if (cfg.verbose) {
            std::cout << "repeat " << repeat << ": sample " << sampleMs.back() << " ms, extract "
                      << extractMs.back() << " ms\n";
        }
    }

    const TimingSummary sample = summarize(sampleMs);
    const TimingSummary extract = summarize(extractMs);
    const double cubesPerSecond = static_cast<double>(grid.cubeCount()) / (extract.avgMs / 1000.0);

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Grid: " << grid.size << "^3 (" << grid.pointCount() << " samples, " << grid.cubeCount()
              << " cubes), threads=" << stats.workerCount << "\n";
    std::cout << "Average sample time: " << sample.avgMs << " ms (min=" << sample.minMs
              << " ms, max=" << sample.maxMs << " ms)\n";
    std::cout << "Average extract time: " << extract.avgMs << " ms (min=" << extract.minMs
              << " ms, max=" << extract.maxMs << " ms)\n";
    std::cout << "Throughput: " << cubesPerSecond / 1.0e6 << "e6 cubes/s\n";
    std::cout << "Mesh: " << mesh.triangleCount() << " triangles, " << mesh.vertexCount() << " vertices ("
              << stats.rawVertexCount << " before merge, " << stats.activeCubes << " active cubes)\n";

    if (cfg.writeCsv) {
        try {
            writeCsvResult(cfg, sample, extract, mesh.triangleCount(), mesh.vertexCount());
        } catch (const std::exception& ex) {
            std::cerr << "Warning: " << ex.what() << "\n";
        }
    }

    return 0;
}
