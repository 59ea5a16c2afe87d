// SPDX-License-Identifier: MIT
#pragma once

#include <optional>
#include <string>

namespace sash {

/// One coefficient lookup for one sash. Dimensions are in meters.
struct ResolutionRequest {
    std::string system_key;
    std::string category;
    double width = 0.0;
    double height = 0.0;

    bool operator==(const ResolutionRequest&) const = default;
};

/// Outcome of a successful lookup
///
/// A fallback category or a clamped dimension is not an error: the result is
/// still usable and `warning` says what was substituted.
struct ResolutionResult {
    double coefficient = 0.0;
    bool is_fallback_category = false;
    std::optional<std::string> warning;

    std::string resolved_system;    ///< System key as stored in the table
    std::string resolved_category;  ///< Category whose grid was read
    double effective_width = 0.0;   ///< Width after clamping to the grid
    double effective_height = 0.0;  ///< Height after clamping to the grid

    bool operator==(const ResolutionResult&) const = default;
};

/// Cache key: "<len>:system|<len>:category|width|height" with dimensions at
/// 3 decimals, e.g. "10:uni1_zebra|1:E|1.200|1.600"
[[nodiscard]] std::string fingerprint(const ResolutionRequest& request);

}  // namespace sash
