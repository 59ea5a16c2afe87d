// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include "src/resolve/resolver_config.hpp"
#include "src/table/grid.hpp"

namespace sash {

/// Strategy that reads a coefficient from a grid at an in-range point
///
/// The Resolver clamps both dimensions to the grid before calling sample(),
/// so implementations may assume
/// widths().front() <= width <= widths().back() (and likewise for height).
class GridSampler {
public:
    virtual ~GridSampler() = default;

    [[nodiscard]] virtual const char* name() const noexcept = 0;

    [[nodiscard]] virtual double sample(const Grid& grid,
                                        double width,
                                        double height) const = 0;
};

/// Index of the smallest breakpoint >= value (within tolerance)
///
/// @pre value <= axis.back() + tolerance
[[nodiscard]] size_t ceiling_index(std::span<const double> axis,
                                   double value,
                                   double tolerance) noexcept;

/// Ceiling bucketing: a unit is costed against the next-larger measured size
class CeilingSampler final : public GridSampler {
public:
    explicit CeilingSampler(double tolerance = 1e-9) : tolerance_(tolerance) {}

    [[nodiscard]] const char* name() const noexcept override { return "ceiling"; }

    [[nodiscard]] double sample(const Grid& grid,
                                double width,
                                double height) const override;

private:
    double tolerance_;
};

/// Bilinear interpolation between the four bracketing breakpoints.
/// Exact at breakpoints; degenerates to linear on single-point axes.
class BilinearSampler final : public GridSampler {
public:
    [[nodiscard]] const char* name() const noexcept override { return "bilinear"; }

    [[nodiscard]] double sample(const Grid& grid,
                                double width,
                                double height) const override;
};

[[nodiscard]] std::shared_ptr<const GridSampler>
make_sampler(SamplingMode mode, double tolerance = 1e-9);

}  // namespace sash
