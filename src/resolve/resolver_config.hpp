// SPDX-License-Identifier: MIT
#pragma once

#include <cmath>
#include <expected>
#include "src/support/error_types.hpp"

namespace sash {

/// How a (width, height) inside the grid is turned into a coefficient
enum class SamplingMode {
    Ceiling,   ///< Smallest breakpoint >= value on each axis
    Bilinear,  ///< Interpolate between the four bracketing breakpoints
};

/// Which category substitutes for one the system does not define
enum class FallbackMode {
    FirstCategory,  ///< Lexicographically first category of the system
};

/// How system keys and category names are matched against the table
enum class KeyMatching {
    Exact,
    CaseInsensitive,  ///< ASCII case folding; an exact match always wins
};

struct ResolverConfig {
    SamplingMode sampling = SamplingMode::Ceiling;
    FallbackMode fallback = FallbackMode::FirstCategory;
    KeyMatching key_matching = KeyMatching::Exact;

    /// A value within this distance of a breakpoint counts as that breakpoint
    double breakpoint_tolerance = 1e-9;

    [[nodiscard]] std::expected<void, ValidationError> validate() const {
        if (!std::isfinite(breakpoint_tolerance) || breakpoint_tolerance < 0.0) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::InvalidConfiguration, breakpoint_tolerance));
        }
        return {};
    }
};

}  // namespace sash
