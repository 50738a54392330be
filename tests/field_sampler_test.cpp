#include "equipot/field.hpp"
#include "equipot/grid.hpp"
#include "equipot/types.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {

bool approxEqual(double a, double b, double tol = 1e-12) {
    return std::abs(a - b) <= tol * std::max(1.0, std::abs(b));
}

bool sameSamples(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!(a[i] == b[i]) && !(std::isnan(a[i]) && std::isnan(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

int main() {
    using namespace equipot;

    // Placement and strengths.
    {
        PotentialParams params{};
        params.massRatio = 4.0;
        params.separation = 2.0;
        params.orbitDegrees = 90.0;
        const auto sources = placeSources(params);
        if (!approxEqual(sources[0].strength, 0.5) || !approxEqual(sources[1].strength, 2.0)) {
            std::cerr << "Strengths should be 1/sqrt(ratio) and sqrt(ratio)\n";
            return 1;
        }
        if (!approxEqual(sources[1].strength / sources[0].strength, params.massRatio) ||
            !approxEqual(sources[0].strength * sources[1].strength, 1.0)) {
            std::cerr << "Strength ratio or geometric mean is off\n";
            return 1;
        }
        if (std::abs(sources[0].center.x) > 1e-12 || sources[0].center.y != 0.0 ||
            !approxEqual(sources[0].center.z, 2.0)) {
            std::cerr << "Source A should sit at (0, 0, d) for a 90 degree orbit\n";
            return 1;
        }
        if (std::abs(sources[1].center.x) > 1e-12 || !approxEqual(sources[1].center.z, -2.0)) {
            std::cerr << "Source B should mirror source A through the origin\n";
            return 1;
        }
    }

    // Orbit angles reduce modulo 360.
    {
        const double cases[][2] = {{0.0, 0.0}, {360.0, 0.0}, {720.0, 0.0}, {-90.0, 270.0}, {450.0, 90.0}, {359.5, 359.5}};
        for (const auto& c : cases) {
            const double wrapped = normalizeOrbitDegrees(c[0]);
            if (!approxEqual(wrapped, c[1]) || wrapped < 0.0 || wrapped >= 360.0) {
                std::cerr << "normalizeOrbitDegrees(" << c[0] << ") = " << wrapped << ", expected " << c[1] << "\n";
                return 1;
            }
        }
    }

    const Grid3D grid = buildGrid(12, -6.0, 6.0);

    // 360 degrees samples identically to 0 degrees.
    {
        PotentialParams at0{1.0, 3.0, 0.0};
        PotentialParams at360{1.0, 3.0, 360.0};
        if (!sameSamples(sampleField(grid.points, at0), sampleField(grid.points, at360))) {
            std::cerr << "Orbit 360 must sample the same field as orbit 0\n";
            return 1;
        }
        PotentialParams at30{2.5, 1.5, 30.0};
        PotentialParams atMinus330{2.5, 1.5, -330.0};
        const auto a = sampleField(grid.points, at30);
        const auto b = sampleField(grid.points, atMinus330);
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!approxEqual(a[i], b[i], 1e-12)) {
                std::cerr << "Orbit -330 should match orbit 30 at sample " << i << "\n";
                return 1;
            }
        }
    }

    // Equal masses, orbit 0: swapping the two sources leaves the field unchanged.
    {
        PotentialParams params{1.0, 2.0, 0.0};
        const auto placed = placeSources(params);
        if (placed[0].strength != 1.0 || placed[1].strength != 1.0) {
            std::cerr << "Equal masses should give unit strengths\n";
            return 1;
        }
        std::vector<double> forward(grid.points.size(), 0.0);
        std::vector<double> swapped(grid.points.size(), 0.0);
        accumulatePointSources(grid.points, {placed[0], placed[1]}, forward);
        accumulatePointSources(grid.points, {placed[1], placed[0]}, swapped);
        if (!sameSamples(forward, swapped)) {
            std::cerr << "Swapping equal sources changed the field\n";
            return 1;
        }
        if (!sameSamples(forward, sampleField(grid.points, params))) {
            std::cerr << "sampleField should equal accumulation of the placed sources\n";
            return 1;
        }

        // Mirror check through the origin on the lattice itself.
        for (std::size_t k = 0; k < grid.size; ++k) {
            for (std::size_t j = 0; j < grid.size; ++j) {
                for (std::size_t i = 0; i < grid.size; ++i) {
                    const double v = forward[grid.idx(i, j, k)];
                    const double m = forward[grid.idx(grid.size - 1 - i, j, grid.size - 1 - k)];
                    if (!approxEqual(v, m, 1e-9)) {
                        std::cerr << "Field is not symmetric under source exchange at (" << i << ',' << j << ','
                                  << k << ")\n";
                        return 1;
                    }
                }
            }
        }
    }

    // Reset semantics: a second call overwrites rather than accumulates.
    {
        PotentialParams params{3.0, 1.0, 45.0};
        std::vector<double> field(7, 42.0);
        resetAndAccumulate(grid.points, params, field);
        const auto fresh = sampleField(grid.points, params);
        resetAndAccumulate(grid.points, params, field);
        if (!sameSamples(field, fresh)) {
            std::cerr << "resetAndAccumulate must zero the buffer before accumulating\n";
            return 1;
        }
        const auto sources = placeSources(params);
        const std::size_t probe = grid.idx(3, 7, 2);
        const double expected = sources[0].strength / distance(grid.points[probe], sources[0].center) +
                                sources[1].strength / distance(grid.points[probe], sources[1].center);
        if (!approxEqual(field[probe], expected)) {
            std::cerr << "Sample " << probe << " = " << field[probe] << ", expected " << expected << "\n";
            return 1;
        }
    }

    // Zero separation: both sources at the origin give (1/a + a)/r.
    {
        const Grid3D even = buildGrid(8, -3.5, 3.5);
        PotentialParams params{4.0, 0.0, 0.0};
        const auto field = sampleField(even.points, params);
        for (std::size_t i = 0; i < field.size(); ++i) {
            const double r = length(even.points[i]);
            if (!approxEqual(field[i], 2.5 / r, 1e-12)) {
                std::cerr << "Coincident sources should reduce to 2.5/r at sample " << i << "\n";
                return 1;
            }
        }
    }

    // A source exactly on a grid point yields +inf without throwing.
    {
        const Grid3D odd = buildGrid(5, -2.0, 2.0);
        PotentialParams params{1.0, 0.0, 0.0};
        std::vector<double> field;
        try {
            resetAndAccumulate(odd.points, params, field);
        } catch (const std::exception& ex) {
            std::cerr << "Sampling a source on a grid point threw: " << ex.what() << "\n";
            return 1;
        }
        const double centre = field[odd.idx(2, 2, 2)];
        if (!std::isinf(centre) || centre < 0.0) {
            std::cerr << "Centre sample should be +inf, got " << centre << "\n";
            return 1;
        }
        const FieldRange range = computeFieldRange(field);
        if (range.nonFinite != 1) {
            std::cerr << "Expected exactly one non-finite sample, got " << range.nonFinite << "\n";
            return 1;
        }
        if (!(range.max > range.min) || !std::isfinite(range.max)) {
            std::cerr << "Field range should ignore the infinite sample\n";
            return 1;
        }
    }

    // Threaded sampling is bit-identical to the single-threaded pass.
    {
        PotentialParams params{7.0, 2.2, 133.0};
        SampleOptions threaded{};
        threaded.threads = 5;
        if (!sameSamples(sampleField(grid.points, params), sampleField(grid.points, params, threaded))) {
            std::cerr << "Threaded sampling differs from the sequential result\n";
            return 1;
        }
    }

    // Mismatched buffers are rejected.
    {
        std::vector<double> shortField(3, 0.0);
        bool threw = false;
        try {
            accumulatePointSources(grid.points, {PointSource{Vec3{}, 1.0}}, shortField);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "accumulatePointSources accepted a field of the wrong length\n";
            return 1;
        }
    }

    return 0;
}
