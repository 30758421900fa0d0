#pragma once

#include "AlignTypes.h"

#include <cstddef>
#include <vector>

namespace tipalign {

// Power on a regular voltage grid. Row-major: index = j * nx + i, j along y.
struct GridSurface {
    int nx = 0;
    int ny = 0;
    double x0_V = 0.0;
    double dx_V = 0.0;
    double y0_V = 0.0;
    double dy_V = 0.0;

    std::vector<double> power_mW{};
    // Samples binned into each node (0 = value interpolated).
    std::vector<int> hits{};

    std::size_t index(int i, int j) const {
        return static_cast<std::size_t>(j) * static_cast<std::size_t>(nx) + static_cast<std::size_t>(i);
    }
    double at(int i, int j) const { return power_mW[index(i, j)]; }
    VoltagePair node(int i, int j) const {
        return VoltagePair{x0_V + dx_V * static_cast<double>(i), y0_V + dy_V * static_cast<double>(j)};
    }
    bool empty() const { return power_mW.empty(); }
};

} // namespace tipalign
