#include "equipot/grid.hpp"

#include <cmath>
#include <string>

namespace equipot {

std::size_t maxGridSize() {
    const std::size_t limit = std::vector<Vec3>().max_size();
    auto n = static_cast<std::size_t>(std::cbrt(static_cast<double>(limit)));
    // cbrt of a rounded double can land one off either way
    while (n > 0 && n > limit / n / n) {
        --n;
    }
    while ((n + 1) <= limit / (n + 1) / (n + 1)) {
        ++n;
    }
    return n;
}

Grid3D::Grid3D(std::size_t sizeIn, double axisMinIn, double axisMaxIn) {
    if (sizeIn < 2) {
        throw std::invalid_argument("Grid3D requires at least 2 points per axis, got " +
                                    std::to_string(sizeIn));
    }
    if (sizeIn > maxGridSize()) {
        throw std::invalid_argument("Grid3D size " + std::to_string(sizeIn) + " exceeds the limit of " +
                                    std::to_string(maxGridSize()) + " points per axis");
    }

    size = sizeIn;
    axisMin = axisMinIn;
    axisMax = axisMaxIn;

    const double axisRange = axisMax - axisMin;
    const double denom = static_cast<double>(size - 1);
    std::vector<double> axis(size);
    for (std::size_t i = 0; i < size; ++i) {
        axis[i] = axisMin + axisRange * static_cast<double>(i) / denom;
    }

    points.resize(size * size * size);
    for (std::size_t k = 0; k < size; ++k) {
        for (std::size_t j = 0; j < size; ++j) {
            for (std::size_t i = 0; i < size; ++i) {
                points[idx(i, j, k)] = Vec3{axis[i], axis[j], axis[k]};
            }
        }
    }
}

Grid3D buildGrid(std::size_t size, double axisMin, double axisMax) {
    return Grid3D(size, axisMin, axisMax);
}

}  // namespace equipot
