// SPDX-License-Identifier: MIT
#include "src/table/grid.hpp"

#include <cmath>

namespace sash {

std::expected<void, ValidationError>
validate_axis(std::span<const double> axis, GridAxis which) {
    if (axis.empty()) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::EmptyAxis, 0.0, static_cast<size_t>(which)));
    }

    for (size_t i = 0; i < axis.size(); ++i) {
        if (!std::isfinite(axis[i])) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::NonFiniteValue, axis[i], i));
        }
        if (i > 0 && axis[i] <= axis[i - 1]) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::UnsortedAxis, axis[i], i));
        }
    }
    return {};
}

std::expected<Grid, ValidationError>
Grid::create(std::vector<double> widths,
             std::vector<double> heights,
             std::vector<double> values) {
    if (auto ok = validate_axis(widths, GridAxis::Width); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = validate_axis(heights, GridAxis::Height); !ok) {
        return std::unexpected(ok.error());
    }

    const size_t expected = widths.size() * heights.size();
    if (values.size() != expected) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::ShapeMismatch,
            static_cast<double>(expected),
            values.size()));
    }

    for (size_t k = 0; k < values.size(); ++k) {
        if (!std::isfinite(values[k])) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::NonFiniteValue, values[k], k));
        }
    }

    return Grid(std::move(widths), std::move(heights), std::move(values));
}

std::expected<Grid, ValidationError>
Grid::from_rows(std::vector<double> widths,
                std::vector<double> heights,
                const std::vector<std::vector<double>>& rows) {
    if (rows.size() != widths.size()) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::ShapeMismatch,
            static_cast<double>(widths.size()),
            rows.size()));
    }

    std::vector<double> flat;
    flat.reserve(widths.size() * heights.size());
    for (const auto& row : rows) {
        if (row.size() != heights.size()) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::ShapeMismatch,
                static_cast<double>(heights.size()),
                row.size()));
        }
        flat.insert(flat.end(), row.begin(), row.end());
    }

    return create(std::move(widths), std::move(heights), std::move(flat));
}

}  // namespace sash
