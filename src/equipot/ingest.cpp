// filename: ingest.cpp
// part of Equipotential Surface Mesher
// MIT License

#include "equipot/ingest.hpp"

#include "equipot/grid.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

namespace equipot {
namespace {

double requireFinite(const std::string& field, double value) {
    if (!std::isfinite(value)) {
        throw std::runtime_error(field + " must be a finite number");
    }
    return value;
}

double requirePositive(const std::string& field, double value) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw std::runtime_error(field + " must be positive");
    }
    return value;
}

double readNumber(const nlohmann::json& node, const std::string& key, const std::string& field) {
    const auto& value = node.at(key);
    if (!value.is_number()) {
        throw std::runtime_error(field + " must be a number");
    }
    return value.get<double>();
}

std::size_t readCount(const nlohmann::json& node, const std::string& key, const std::string& field) {
    const auto& value = node.at(key);
    if (!value.is_number_integer()) {
        throw std::runtime_error(field + " must be an integer");
    }
    const long long raw = value.get<long long>();
    if (raw < 0) {
        throw std::runtime_error(field + " must not be negative");
    }
    return static_cast<std::size_t>(raw);
}

bool readFlag(const nlohmann::json& node, const std::string& key, const std::string& field) {
    const auto& value = node.at(key);
    if (!value.is_boolean()) {
        throw std::runtime_error(field + " must be true or false");
    }
    return value.get<bool>();
}

std::string readPath(const nlohmann::json& node, const std::string& key, const std::string& field) {
    const auto& value = node.at(key);
    if (!value.is_string() || value.get<std::string>().empty()) {
        throw std::runtime_error(field + " must be a non-empty string");
    }
    return value.get<std::string>();
}

void rejectUnknownKeys(const nlohmann::json& node,
                       const std::unordered_set<std::string>& allowed,
                       const std::string& section) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        if (allowed.count(it.key()) == 0) {
            throw std::runtime_error("Unsupported key in " + section + ": " + it.key());
        }
    }
}

void parseGrid(const nlohmann::json& node, SceneSpec::GridSettings& grid) {
    if (!node.is_object()) {
        throw std::runtime_error("grid must be an object");
    }
    rejectUnknownKeys(node, {"size", "axis_min", "axis_max"}, "grid");
    if (node.contains("size")) {
        grid.size = readCount(node, "size", "grid.size");
    }
    if (node.contains("axis_min")) {
        grid.axisMin = readNumber(node, "axis_min", "grid.axis_min");
    }
    if (node.contains("axis_max")) {
        grid.axisMax = readNumber(node, "axis_max", "grid.axis_max");
    }
}

void parsePotential(const nlohmann::json& node, PotentialParams& potential) {
    if (!node.is_object()) {
        throw std::runtime_error("potential must be an object");
    }
    rejectUnknownKeys(node, {"mass_ratio", "separation", "orbit_degrees"}, "potential");
    if (node.contains("mass_ratio")) {
        potential.massRatio = readNumber(node, "mass_ratio", "potential.mass_ratio");
    }
    if (node.contains("separation")) {
        potential.separation = readNumber(node, "separation", "potential.separation");
    }
    if (node.contains("orbit_degrees")) {
        potential.orbitDegrees = readNumber(node, "orbit_degrees", "potential.orbit_degrees");
    }
}

void parseAnimation(const nlohmann::json& node, SceneSpec::Animation& animation) {
    if (!node.is_object()) {
        throw std::runtime_error("animation must be an object");
    }
    rejectUnknownKeys(node, {"orbit", "omega", "frames", "dt"}, "animation");
    if (node.contains("orbit")) {
        animation.orbit = readFlag(node, "orbit", "animation.orbit");
    }
    if (node.contains("omega")) {
        animation.omegaDegPerSec = readNumber(node, "omega", "animation.omega");
    }
    if (node.contains("frames")) {
        animation.frames = readCount(node, "frames", "animation.frames");
    }
    if (node.contains("dt")) {
        animation.dt = readNumber(node, "dt", "animation.dt");
    }
}

void parseExtraction(const nlohmann::json& node, SceneSpec::Extraction& extraction) {
    if (!node.is_object()) {
        throw std::runtime_error("extraction must be an object");
    }
    rejectUnknownKeys(node, {"merge_vertices", "merge_tolerance", "threads", "quiet"}, "extraction");
    if (node.contains("merge_vertices")) {
        extraction.mergeVertices = readFlag(node, "merge_vertices", "extraction.merge_vertices");
    }
    if (node.contains("merge_tolerance")) {
        extraction.mergeTolerance = readNumber(node, "merge_tolerance", "extraction.merge_tolerance");
    }
    if (node.contains("threads")) {
        extraction.threads = readCount(node, "threads", "extraction.threads");
    }
    if (node.contains("quiet")) {
        extraction.quiet = readFlag(node, "quiet", "extraction.quiet");
    }
}

void parseOutputs(const nlohmann::json& node, SceneSpec::Outputs& outputs) {
    if (!node.is_object()) {
        throw std::runtime_error("outputs must be an object");
    }
    rejectUnknownKeys(node, {"mesh_series", "obj", "field_vti", "field_csv", "summary_csv"}, "outputs");

    if (node.contains("mesh_series")) {
        const auto& series = node.at("mesh_series");
        if (!series.is_object()) {
            throw std::runtime_error("outputs.mesh_series must be an object");
        }
        rejectUnknownKeys(series, {"directory", "basename", "pvd"}, "outputs.mesh_series");
        SceneSpec::Outputs::MeshSeries meshSeries{};
        meshSeries.directory = readPath(series, "directory", "outputs.mesh_series.directory");
        if (series.contains("basename")) {
            meshSeries.basename = readPath(series, "basename", "outputs.mesh_series.basename");
        }
        if (series.contains("pvd")) {
            meshSeries.pvdPath = readPath(series, "pvd", "outputs.mesh_series.pvd");
        }
        outputs.meshSeries = meshSeries;
    }
    if (node.contains("obj")) {
        outputs.objPath = readPath(node, "obj", "outputs.obj");
    }
    if (node.contains("field_vti")) {
        outputs.fieldVtiPath = readPath(node, "field_vti", "outputs.field_vti");
    }
    if (node.contains("field_csv")) {
        outputs.fieldCsvPath = readPath(node, "field_csv", "outputs.field_csv");
    }
    if (node.contains("summary_csv")) {
        outputs.summaryCsvPath = readPath(node, "summary_csv", "outputs.summary_csv");
    }
}

void parseTimeline(const nlohmann::json& node, std::vector<SceneSpec::TimelineFrame>& timeline) {
    if (!node.is_array()) {
        throw std::runtime_error("timeline must be an array");
    }
    for (std::size_t i = 0; i < node.size(); ++i) {
        const auto& entry = node.at(i);
        const std::string prefix = "timeline[" + std::to_string(i) + "]";
        if (!entry.is_object()) {
            throw std::runtime_error(prefix + " must be an object");
        }
        rejectUnknownKeys(entry, {"time", "isolevel", "mass_ratio", "separation", "orbit_degrees"}, prefix);

        SceneSpec::TimelineFrame frame{};
        frame.time = readNumber(entry, "time", prefix + ".time");
        if (entry.contains("isolevel")) {
            frame.isolevel = readNumber(entry, "isolevel", prefix + ".isolevel");
        }
        if (entry.contains("mass_ratio")) {
            frame.massRatio = readNumber(entry, "mass_ratio", prefix + ".mass_ratio");
        }
        if (entry.contains("separation")) {
            frame.separation = readNumber(entry, "separation", prefix + ".separation");
        }
        if (entry.contains("orbit_degrees")) {
            frame.orbitDegrees = readNumber(entry, "orbit_degrees", prefix + ".orbit_degrees");
        }
        timeline.push_back(frame);
    }
}

void validatePotential(const std::string& prefix, const PotentialParams& potential) {
    requireFinite(prefix + ".mass_ratio", potential.massRatio);
    if (potential.massRatio < 1.0) {
        throw std::runtime_error(prefix + ".mass_ratio must be at least 1");
    }
    requireFinite(prefix + ".separation", potential.separation);
    if (potential.separation < 0.0) {
        throw std::runtime_error(prefix + ".separation must not be negative");
    }
    requireFinite(prefix + ".orbit_degrees", potential.orbitDegrees);
}

}  // namespace

void validateScene(const SceneSpec& scene) {
    if (scene.version != "0.1") {
        throw std::runtime_error("Unsupported scene version: " + scene.version);
    }

    if (scene.grid.size < 2) {
        throw std::runtime_error("grid.size must be at least 2");
    }
    if (scene.grid.size > maxGridSize()) {
        throw std::runtime_error("grid.size must not exceed " + std::to_string(maxGridSize()));
    }
    requireFinite("grid.axis_min", scene.grid.axisMin);
    requireFinite("grid.axis_max", scene.grid.axisMax);
    if (!(scene.grid.axisMax > scene.grid.axisMin)) {
        throw std::runtime_error("grid.axis_max must be greater than grid.axis_min");
    }

    validatePotential("potential", scene.potential);
    requireFinite("isolevel", scene.isolevel);

    if (scene.animation.frames < 1) {
        throw std::runtime_error("animation.frames must be at least 1");
    }
    requirePositive("animation.dt", scene.animation.dt);
    requireFinite("animation.omega", scene.animation.omegaDegPerSec);

    if (scene.extraction.threads < 1) {
        throw std::runtime_error("extraction.threads must be at least 1");
    }
    requirePositive("extraction.merge_tolerance", scene.extraction.mergeTolerance);

    double previousTime = 0.0;
    for (std::size_t i = 0; i < scene.timeline.size(); ++i) {
        const auto& entry = scene.timeline[i];
        const std::string prefix = "timeline[" + std::to_string(i) + "]";
        requireFinite(prefix + ".time", entry.time);
        if (i > 0 && entry.time < previousTime) {
            throw std::runtime_error(prefix + ".time must not decrease");
        }
        previousTime = entry.time;

        PotentialParams merged = scene.potential;
        merged.massRatio = entry.massRatio.value_or(merged.massRatio);
        merged.separation = entry.separation.value_or(merged.separation);
        merged.orbitDegrees = entry.orbitDegrees.value_or(merged.orbitDegrees);
        validatePotential(prefix, merged);
        if (entry.isolevel) {
            requireFinite(prefix + ".isolevel", *entry.isolevel);
        }
    }
}

SceneSpec loadSceneFromJson(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open scene JSON: " + path);
    }

    SceneSpec scene{};
    try {
        nlohmann::json json;
        input >> json;
        if (!json.is_object()) {
            throw std::runtime_error("Scene JSON must be an object");
        }

        rejectUnknownKeys(json,
                          {"version", "grid", "potential", "isolevel", "animation", "timeline", "extraction",
                           "outputs"},
                          "scene");

        scene.version = json.value("version", std::string{});
        if (scene.version.empty()) {
            throw std::runtime_error("Scene JSON missing required field: version");
        }
        if (json.contains("grid")) {
            parseGrid(json.at("grid"), scene.grid);
        }
        if (json.contains("potential")) {
            parsePotential(json.at("potential"), scene.potential);
        }
        if (json.contains("isolevel")) {
            scene.isolevel = readNumber(json, "isolevel", "isolevel");
        }
        if (json.contains("animation")) {
            parseAnimation(json.at("animation"), scene.animation);
        }
        if (json.contains("timeline")) {
            parseTimeline(json.at("timeline"), scene.timeline);
        }
        if (json.contains("extraction")) {
            parseExtraction(json.at("extraction"), scene.extraction);
        }
        if (json.contains("outputs")) {
            parseOutputs(json.at("outputs"), scene.outputs);
        }
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("Malformed scene JSON " + path + ": " + ex.what());
    }

    validateScene(scene);
    return scene;
}

std::vector<SceneFrame> expandSceneAnimation(const SceneSpec& scene) {
    const auto animatedOrbit = [&](double baseDegrees, double time) {
        if (!scene.animation.orbit) {
            return normalizeOrbitDegrees(baseDegrees);
        }
        return normalizeOrbitDegrees(baseDegrees + scene.animation.omegaDegPerSec * time);
    };

    std::vector<SceneFrame> frames;
    if (scene.timeline.empty()) {
        frames.reserve(scene.animation.frames);
        for (std::size_t idx = 0; idx < scene.animation.frames; ++idx) {
            SceneFrame frame{};
            frame.index = idx;
            frame.time = static_cast<double>(idx) * scene.animation.dt;
            frame.potential = scene.potential;
            frame.potential.orbitDegrees = animatedOrbit(scene.potential.orbitDegrees, frame.time);
            frame.isolevel = scene.isolevel;
            frames.push_back(frame);
        }
        return frames;
    }

    frames.reserve(scene.timeline.size());
    for (std::size_t idx = 0; idx < scene.timeline.size(); ++idx) {
        const auto& entry = scene.timeline[idx];
        SceneFrame frame{};
        frame.index = idx;
        frame.time = entry.time;
        frame.potential.massRatio = entry.massRatio.value_or(scene.potential.massRatio);
        frame.potential.separation = entry.separation.value_or(scene.potential.separation);
        frame.potential.orbitDegrees =
            animatedOrbit(entry.orbitDegrees.value_or(scene.potential.orbitDegrees), frame.time);
        frame.isolevel = entry.isolevel.value_or(scene.isolevel);
        frames.push_back(frame);
    }
    return frames;
}

}  // namespace equipot
