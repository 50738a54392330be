#include "equipot/ingest.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

bool approxEqual(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}

std::filesystem::path fixture(const std::string& name) {
    return (std::filesystem::path(__FILE__).parent_path() / "../inputs/tests" / name).lexically_normal();
}

bool rejects(const std::string& name) {
    try {
        (void)equipot::loadSceneFromJson(fixture(name).string());
    } catch (const std::runtime_error& ex) {
        std::cout << name << " rejected: " << ex.what() << '\n';
        return true;
    }
    return false;
}

}  // namespace

int main() {
    using namespace equipot;

    SceneSpec scene;
    try {
        scene = loadSceneFromJson(fixture("scene_ingest_test.json").string());
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load scene: " << ex.what() << '\n';
        return 1;
    }

    if (scene.grid.size != 24 || !approxEqual(scene.grid.axisMin, -8.0) || !approxEqual(scene.grid.axisMax, 8.0)) {
        std::cerr << "Grid settings were not parsed\n";
        return 1;
    }
    if (!approxEqual(scene.potential.massRatio, 2.0) || !approxEqual(scene.potential.separation, 2.5) ||
        !approxEqual(scene.potential.orbitDegrees, 300.0) || !approxEqual(scene.isolevel, 0.6)) {
        std::cerr << "Potential or isolevel were not parsed\n";
        return 1;
    }
    if (scene.extraction.mergeVertices || !approxEqual(scene.extraction.mergeTolerance, 1e-3) ||
        scene.extraction.threads != 3 || !scene.extraction.quiet) {
        std::cerr << "Extraction settings were not parsed\n";
        return 1;
    }
    if (!scene.outputs.meshSeries || scene.outputs.meshSeries->basename != "lobe" ||
        scene.outputs.meshSeries->directory != "outputs/scene_ingest_test" ||
        scene.outputs.meshSeries->pvdPath != "outputs/scene_ingest_test/lobe.pvd") {
        std::cerr << "Mesh series output was not parsed\n";
        return 1;
    }
    if (scene.outputs.objPath != "outputs/scene_ingest_test/last.obj" || !scene.outputs.fieldVtiPath.empty() ||
        scene.outputs.summaryCsvPath != "outputs/scene_ingest_test/summary.csv") {
        std::cerr << "File outputs were not parsed\n";
        return 1;
    }

    // Orbit animation: 300 + 90 t, wrapped into [0, 360).
    const std::vector<SceneFrame> frames = expandSceneAnimation(scene);
    const std::vector<double> expectedOrbit{300.0, 30.0, 120.0, 210.0, 300.0};
    if (frames.size() != expectedOrbit.size()) {
        std::cerr << "Expected " << expectedOrbit.size() << " frames, got " << frames.size() << '\n';
        return 1;
    }
    for (std::size_t i = 0; i < frames.size(); ++i) {
        if (frames[i].index != i || !approxEqual(frames[i].time, static_cast<double>(i)) ||
            !approxEqual(frames[i].potential.orbitDegrees, expectedOrbit[i]) ||
            !approxEqual(frames[i].potential.massRatio, 2.0) || !approxEqual(frames[i].isolevel, 0.6)) {
            std::cerr << "Frame " << i << " has orbit " << frames[i].potential.orbitDegrees << ", expected "
                      << expectedOrbit[i] << '\n';
            return 1;
        }
    }

    // Without orbit animation every frame keeps the base orbit.
    scene.animation.orbit = false;
    for (const auto& frame : expandSceneAnimation(scene)) {
        if (!approxEqual(frame.potential.orbitDegrees, 300.0)) {
            std::cerr << "Static frames must keep the base orbit\n";
            return 1;
        }
    }

    // Explicit timeline: per-frame overrides fall back to the base scene.
    SceneSpec timelineScene;
    try {
        timelineScene = loadSceneFromJson(fixture("timeline_scene_test.json").string());
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load timeline scene: " << ex.what() << '\n';
        return 1;
    }
    const auto timelineFrames = expandSceneAnimation(timelineScene);
    if (timelineFrames.size() != 3) {
        std::cerr << "Timeline should replace the generated frames, got " << timelineFrames.size() << '\n';
        return 1;
    }
    if (!approxEqual(timelineFrames[0].isolevel, 0.8) || !approxEqual(timelineFrames[0].potential.orbitDegrees, 10.0) ||
        !approxEqual(timelineFrames[0].potential.separation, 1.5)) {
        std::cerr << "First timeline frame should inherit the base scene\n";
        return 1;
    }
    if (!approxEqual(timelineFrames[1].time, 0.5) || !approxEqual(timelineFrames[1].isolevel, 0.9) ||
        !approxEqual(timelineFrames[1].potential.orbitDegrees, 10.0)) {
        std::cerr << "Second timeline frame overrides were not applied\n";
        return 1;
    }
    if (!approxEqual(timelineFrames[2].potential.massRatio, 3.0) ||
        !approxEqual(timelineFrames[2].potential.separation, 0.0) || !approxEqual(timelineFrames[2].isolevel, 0.8)) {
        std::cerr << "Third timeline frame overrides were not applied\n";
        return 1;
    }

    // Invalid scenes fail loudly.
    for (const std::string name : {"invalid_mass_ratio_test.json", "invalid_unknown_key_test.json",
                                   "invalid_timeline_order_test.json", "does_not_exist.json"}) {
        if (!rejects(name)) {
            std::cerr << name << " should have been rejected\n";
            return 1;
        }
    }

    // Values changed after loading are checked again.
    SceneSpec edited = scene;
    edited.grid.size = 1;
    bool threw = false;
    try {
        validateScene(edited);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "validateScene accepted a one-point grid\n";
        return 1;
    }
    edited = scene;
    edited.grid.size = 4194304;
    threw = false;
    try {
        validateScene(edited);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "validateScene accepted a grid whose point count overflows\n";
        return 1;
    }
    edited = scene;
    edited.extraction.threads = 0;
    threw = false;
    try {
        validateScene(edited);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "validateScene accepted zero threads\n";
        return 1;
    }

    return 0;
}
