// SPDX-License-Identifier: MIT
#include "src/resolve/grid_sampler.hpp"

#include <algorithm>

namespace sash {

namespace {

/// Bracketing interval [lo, hi] and the weight of hi
struct Bracket {
    size_t lo;
    size_t hi;
    double t;
};

Bracket bracket(std::span<const double> axis, double value) noexcept {
    if (axis.size() == 1 || value <= axis.front()) {
        return {0, 0, 0.0};
    }
    if (value >= axis.back()) {
        const size_t last = axis.size() - 1;
        return {last, last, 0.0};
    }
    // First breakpoint strictly greater than value; value > front() so hi >= 1
    auto it = std::upper_bound(axis.begin(), axis.end(), value);
    const size_t hi = static_cast<size_t>(it - axis.begin());
    const size_t lo = hi - 1;
    const double t = (value - axis[lo]) / (axis[hi] - axis[lo]);
    return {lo, hi, t};
}

}  // namespace

size_t ceiling_index(std::span<const double> axis,
                     double value,
                     double tolerance) noexcept {
    auto it = std::lower_bound(axis.begin(), axis.end(), value - tolerance);
    if (it == axis.end()) {
        return axis.size() - 1;
    }
    return static_cast<size_t>(it - axis.begin());
}

double CeilingSampler::sample(const Grid& grid, double width, double height) const {
    const size_t i = ceiling_index(grid.widths(), width, tolerance_);
    const size_t j = ceiling_index(grid.heights(), height, tolerance_);
    return grid.value(i, j);
}

double BilinearSampler::sample(const Grid& grid, double width, double height) const {
    const Bracket w = bracket(grid.widths(), width);
    const Bracket h = bracket(grid.heights(), height);

    const double q11 = grid.value(w.lo, h.lo);
    const double q12 = grid.value(w.lo, h.hi);
    const double q21 = grid.value(w.hi, h.lo);
    const double q22 = grid.value(w.hi, h.hi);

    const double r1 = (1.0 - w.t) * q11 + w.t * q21;
    const double r2 = (1.0 - w.t) * q12 + w.t * q22;
    return (1.0 - h.t) * r1 + h.t * r2;
}

std::shared_ptr<const GridSampler> make_sampler(SamplingMode mode, double tolerance) {
    switch (mode) {
        case SamplingMode::Ceiling:
            return std::make_shared<CeilingSampler>(tolerance);
        case SamplingMode::Bilinear:
            return std::make_shared<BilinearSampler>();
    }
    return std::make_shared<CeilingSampler>(tolerance);
}

}  // namespace sash
