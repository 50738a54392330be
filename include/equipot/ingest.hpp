// filename: ingest.hpp
// part of Equipotential Surface Mesher
// MIT License

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "equipot/field.hpp"

namespace equipot {

struct SceneSpec {
    struct GridSettings {
        std::size_t size{40};
        double axisMin{-10.0};
        double axisMax{10.0};
    };

    struct Animation {
        bool orbit{false};
        double omegaDegPerSec{45.0};
        std::size_t frames{1};
        double dt{0.1};
    };

    struct Extraction {
        bool mergeVertices{true};
        double mergeTolerance{1e-4};
        std::size_t threads{1};
        bool quiet{false};
    };

    struct Outputs {
        struct MeshSeries {
            std::string directory;
            std::string basename{"surface"};
            std::string pvdPath;
        };

        std::optional<MeshSeries> meshSeries;
        std::string objPath;
        std::string fieldVtiPath;
        std::string fieldCsvPath;
        std::string summaryCsvPath;
    };

    // Explicit frame list; when present it replaces the frames generated from animation.
    struct TimelineFrame {
        double time{0.0};
        std::optional<double> isolevel;
        std::optional<double> massRatio;
        std::optional<double> separation;
        std::optional<double> orbitDegrees;
    };

    std::string version{"0.1"};
    GridSettings grid;
    PotentialParams potential{1.0, 3.0, 0.0};
    double isolevel{0.5};
    Animation animation;
    Extraction extraction;
    Outputs outputs;
    std::vector<TimelineFrame> timeline;
};

struct SceneFrame {
    std::size_t index{0};
    double time{0.0};
    PotentialParams potential;
    double isolevel{0.0};
};

/**
 * @brief Parse and validate a scene description.
 * @throws std::runtime_error naming the offending field when the file is unreadable or invalid.
 */
SceneSpec loadSceneFromJson(const std::string& path);

/**
 * @brief Check every range constraint of a scene, including values set after loading.
 * @throws std::runtime_error on the first violation.
 */
void validateScene(const SceneSpec& scene);

/**
 * @brief Expand animation settings or the explicit timeline into concrete frames.
 *
 * With orbit animation enabled, each frame's orbit is base + omega * time, reduced into
 * [0, 360). Timeline overrides of orbit_degrees replace the base before animation applies.
 */
std::vector<SceneFrame> expandSceneAnimation(const SceneSpec& scene);

}  // namespace equipot
