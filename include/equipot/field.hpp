// filename: field.hpp
// part of Equipotential Surface Mesher
// MIT License

#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include "equipot/grid.hpp"
#include "equipot/types.hpp"

namespace equipot {

/**
 * @brief Inputs that shape the two-source potential.
 *
 * massRatio is expected to be >= 1 and separation >= 0; the ingest layer enforces both.
 * orbitDegrees may be any finite angle and is reduced modulo 360 before use.
 */
struct PotentialParams {
    double massRatio{1.0};
    double separation{0.0};
    double orbitDegrees{0.0};
};

struct PointSource {
    Vec3 center;
    double strength{0.0};
};

struct SampleOptions {
    std::size_t threads{1};
};

/**
 * @brief Reduce an angle in degrees into [0, 360).
 */
[[nodiscard]] double normalizeOrbitDegrees(double degrees);

/**
 * @brief Place the two sources on the x/z orbit plane around the origin.
 *
 * Source A sits at (d cos t, 0, d sin t) with strength 1/sqrt(massRatio); source B sits
 * opposite with strength sqrt(massRatio). The rotation centre is the origin, not the
 * centre of mass.
 */
[[nodiscard]] std::array<PointSource, 2> placeSources(const PotentialParams& params);

/**
 * @brief Add strength / distance for every source to every sample. Does not reset the field.
 *
 * A sample that coincides with a source receives +inf (or NaN for a zero-strength source).
 * @throws std::invalid_argument when field.size() != points.size().
 */
void accumulatePointSources(const std::vector<Vec3>& points,
                            const std::vector<PointSource>& sources,
                            std::vector<double>& field,
                            const SampleOptions& options = {});

/**
 * @brief Resize the field to points.size(), zero it, then accumulate both sources.
 */
void resetAndAccumulate(const std::vector<Vec3>& points,
                        const PotentialParams& params,
                        std::vector<double>& field,
                        const SampleOptions& options = {});

[[nodiscard]] std::vector<double> sampleField(const std::vector<Vec3>& points,
                                              const PotentialParams& params,
                                              const SampleOptions& options = {});

struct FieldRange {
    double min{0.0};
    double max{0.0};
    std::size_t nonFinite{0};
};

// Range over finite samples only; min == max == 0 when no sample is finite.
[[nodiscard]] FieldRange computeFieldRange(const std::vector<double>& field);

}  // namespace equipot
