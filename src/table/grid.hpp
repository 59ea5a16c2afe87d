// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <expected>
#include <span>
#include <vector>
#include "src/support/error_types.hpp"

namespace sash {

/// Closed interval covered by one axis
struct AxisRange {
    double min = 0.0;
    double max = 0.0;
};

/// Measured extent of a grid on both axes
struct GridRanges {
    AxisRange width;
    AxisRange height;
};

/// Axis positions used in ValidationError::index for axis-level failures
enum class GridAxis : size_t {
    Width = 0,
    Height = 1
};

/// Validate one breakpoint axis: non-empty, finite, strictly increasing
///
/// EmptyAxis errors carry the GridAxis in `index`; the other codes carry the
/// offending position within the axis.
[[nodiscard]] std::expected<void, ValidationError>
validate_axis(std::span<const double> axis, GridAxis which);

/// Two-dimensional table of measured coefficients for one (system, category)
///
/// Values are stored width-major: value(i, j) is the coefficient measured at
/// (widths()[i], heights()[j]). Instances can only be obtained through
/// create(), so every Grid in the program satisfies the axis and shape
/// invariants.
class Grid {
public:
    /// Build a grid from flattened width-major values
    ///
    /// @param widths Width breakpoints in meters, strictly increasing
    /// @param heights Height breakpoints in meters, strictly increasing
    /// @param values widths.size() * heights.size() finite coefficients
    [[nodiscard]] static std::expected<Grid, ValidationError>
    create(std::vector<double> widths,
           std::vector<double> heights,
           std::vector<double> values);

    /// Build a grid from one row per width breakpoint
    [[nodiscard]] static std::expected<Grid, ValidationError>
    from_rows(std::vector<double> widths,
              std::vector<double> heights,
              const std::vector<std::vector<double>>& rows);

    [[nodiscard]] const std::vector<double>& widths() const noexcept { return widths_; }
    [[nodiscard]] const std::vector<double>& heights() const noexcept { return heights_; }

    /// Flattened width-major values
    [[nodiscard]] std::span<const double> values() const noexcept { return values_; }

    [[nodiscard]] double value(size_t width_index, size_t height_index) const noexcept {
        return values_[width_index * heights_.size() + height_index];
    }

    [[nodiscard]] size_t width_count() const noexcept { return widths_.size(); }
    [[nodiscard]] size_t height_count() const noexcept { return heights_.size(); }

    [[nodiscard]] GridRanges ranges() const noexcept {
        return GridRanges{
            .width = {widths_.front(), widths_.back()},
            .height = {heights_.front(), heights_.back()},
        };
    }

    /// One row of values (all heights) for a width breakpoint
    [[nodiscard]] std::span<const double> row(size_t width_index) const noexcept {
        return std::span<const double>(values_).subspan(
            width_index * heights_.size(), heights_.size());
    }

private:
    Grid(std::vector<double> widths,
         std::vector<double> heights,
         std::vector<double> values)
        : widths_(std::move(widths))
        , heights_(std::move(heights))
        , values_(std::move(values)) {}

    std::vector<double> widths_;
    std::vector<double> heights_;
    std::vector<double> values_;
};

}  // namespace sash
