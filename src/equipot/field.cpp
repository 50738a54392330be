// filename: field.cpp
// part of Equipotential Surface Mesher
// MIT License

#include "equipot/field.hpp"

#include "parallel.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace equipot {

double normalizeOrbitDegrees(double degrees) {
    double wrapped = std::fmod(degrees, 360.0);
    if (wrapped < 0.0) {
        wrapped += 360.0;
    }
    // -1e-17 + 360.0 rounds to 360.0
    if (wrapped >= 360.0) {
        wrapped = 0.0;
    }
    return wrapped;
}

std::array<PointSource, 2> placeSources(const PotentialParams& params) {
    const double theta = normalizeOrbitDegrees(params.orbitDegrees) * kPi / 180.0;
    const double alpha = std::sqrt(params.massRatio);
    const double d = params.separation;
    const double cx = d * std::cos(theta);
    const double cz = d * std::sin(theta);

    std::array<PointSource, 2> sources{};
    sources[0].center = Vec3{cx, 0.0, cz};
    sources[0].strength = 1.0 / alpha;
    sources[1].center = Vec3{-cx, 0.0, -cz};
    sources[1].strength = alpha;
    return sources;
}

void accumulatePointSources(const std::vector<Vec3>& points,
                            const std::vector<PointSource>& sources,
                            std::vector<double>& field,
                            const SampleOptions& options) {
    if (field.size() != points.size()) {
        throw std::invalid_argument("accumulatePointSources: field has " + std::to_string(field.size()) +
                                    " samples but grid has " + std::to_string(points.size()));
    }

    parallelChunks(points.size(), options.threads,
                   [&](std::size_t /*chunk*/, std::size_t begin, std::size_t end) {
                       for (const auto& source : sources) {
                           for (std::size_t i = begin; i < end; ++i) {
                               field[i] += source.strength / distance(points[i], source.center);
                           }
                       }
                   });
}

void resetAndAccumulate(const std::vector<Vec3>& points,
                        const PotentialParams& params,
                        std::vector<double>& field,
                        const SampleOptions& options) {
    field.assign(points.size(), 0.0);
    const auto placed = placeSources(params);
    const std::vector<PointSource> sources(placed.begin(), placed.end());
    accumulatePointSources(points, sources, field, options);
}

std::vector<double> sampleField(const std::vector<Vec3>& points,
                                const PotentialParams& params,
                                const SampleOptions& options) {
    std::vector<double> field;
    resetAndAccumulate(points, params, field, options);
    return field;
}

FieldRange computeFieldRange(const std::vector<double>& field) {
    FieldRange range{};
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    for (const double value : field) {
        if (!std::isfinite(value)) {
            ++range.nonFinite;
            continue;
        }
        lo = std::min(lo, value);
        hi = std::max(hi, value);
    }
    if (lo <= hi) {
        range.min = lo;
        range.max = hi;
    }
    return range;
}

}  // namespace equipot
