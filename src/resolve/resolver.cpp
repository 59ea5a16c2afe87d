// SPDX-License-Identifier: MIT
#include "src/resolve/resolver.hpp"
#include "src/support/parallel.hpp"
#include "src/support/sash_trace.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <string>
#include <string_view>

namespace sash {

namespace {

/// Below this size a batch is resolved serially
constexpr size_t PARALLEL_MIN_BATCH = 256;

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

/// Exact lookup first, then (optionally) ASCII case-insensitive scan
template <typename Map>
auto find_key(const Map& map, std::string_view key, KeyMatching matching)
    -> const typename Map::value_type* {
    if (auto it = map.find(key); it != map.end()) {
        return &*it;
    }
    if (matching == KeyMatching::CaseInsensitive) {
        for (const auto& entry : map) {
            if (iequals(entry.first, key)) return &entry;
        }
    }
    return nullptr;
}

struct Clamp {
    double value;
    bool clamped;
};

Clamp clamp_to(const AxisRange& range, double value) noexcept {
    if (value < range.min) return {range.min, true};
    if (value > range.max) return {range.max, true};
    return {value, false};
}

void append_warning(std::optional<std::string>& warning, std::string note) {
    if (warning) {
        *warning += "; ";
        *warning += note;
    } else {
        warning = std::move(note);
    }
}

ResolveError invalid_dimension(const char* axis, double value) {
    return ResolveError{
        .code = ResolveErrorCode::InvalidDimensions,
        .value = value,
        .message = std::format("{} must be a positive finite number of meters, got {}",
                               axis, value),
    };
}

}  // namespace

std::expected<Resolver, ValidationError>
Resolver::create(std::shared_ptr<const CoefficientTable> table,
                 const ResolverConfig& config) {
    return create(std::move(table),
                  make_sampler(config.sampling, config.breakpoint_tolerance),
                  make_fallback_policy(config.fallback),
                  config);
}

std::expected<Resolver, ValidationError>
Resolver::create(std::shared_ptr<const CoefficientTable> table,
                 std::shared_ptr<const GridSampler> sampler,
                 std::shared_ptr<const CategoryFallbackPolicy> fallback,
                 const ResolverConfig& config) {
    if (auto ok = config.validate(); !ok) {
        return std::unexpected(ok.error());
    }
    if (!table || !sampler || !fallback) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidConfiguration));
    }
    return Resolver(std::move(table), std::move(sampler), std::move(fallback), config);
}

std::expected<ResolutionResult, ResolveError>
Resolver::resolve(const ResolutionRequest& request) const {
    SASH_TRACE_RESOLVE_START(request.system_key.c_str(), request.category.c_str(),
                             request.width, request.height);

    if (!std::isfinite(request.width) || request.width <= 0.0) {
        SASH_TRACE_REQUEST_FAILED(SASH_MODULE_RESOLVER,
                                  static_cast<int>(ResolveErrorCode::InvalidDimensions),
                                  request.width);
        return std::unexpected(invalid_dimension("width", request.width));
    }
    if (!std::isfinite(request.height) || request.height <= 0.0) {
        SASH_TRACE_REQUEST_FAILED(SASH_MODULE_RESOLVER,
                                  static_cast<int>(ResolveErrorCode::InvalidDimensions),
                                  request.height);
        return std::unexpected(invalid_dimension("height", request.height));
    }

    // ---- System: no substitution, a missing system is a configuration defect ----
    const auto* system = find_key(table_->systems_view(), request.system_key,
                                  config_.key_matching);
    if (!system) {
        SASH_TRACE_REQUEST_FAILED(SASH_MODULE_RESOLVER,
                                  static_cast<int>(ResolveErrorCode::UnknownSystem), 0.0);
        return std::unexpected(ResolveError{
            .code = ResolveErrorCode::UnknownSystem,
            .value = 0.0,
            .message = std::format("system '{}' is not present in the coefficient table",
                                   request.system_key),
        });
    }

    ResolutionResult result;
    result.resolved_system = system->first;

    // ---- Category ----
    const auto* category = find_key(system->second, request.category, config_.key_matching);
    if (!category) {
        category = fallback_->select(system->second, request.category);
        if (!category) {
            // The policy refused to substitute; treat like an unknown system entry
            SASH_TRACE_REQUEST_FAILED(SASH_MODULE_RESOLVER,
                                      static_cast<int>(ResolveErrorCode::UnknownSystem), 0.0);
            return std::unexpected(ResolveError{
                .code = ResolveErrorCode::UnknownSystem,
                .value = 0.0,
                .message = std::format("category '{}' is not configured for system '{}'",
                                       request.category, system->first),
            });
        }
        result.is_fallback_category = true;
        append_warning(result.warning,
                       std::format("category '{}' is not configured for system '{}'; using '{}'",
                                   request.category, system->first, category->first));
        SASH_TRACE_CATEGORY_FALLBACK(request.category.c_str(), category->first.c_str());
    }
    result.resolved_category = category->first;

    // ---- Out-of-range policy: clamp and warn ----
    const Grid& grid = category->second;
    const GridRanges ranges = grid.ranges();
    const Clamp w = clamp_to(ranges.width, request.width);
    const Clamp h = clamp_to(ranges.height, request.height);
    if (w.clamped) {
        append_warning(result.warning,
                       std::format("width {} m is outside the measured range [{}, {}] m; using {} m",
                                   request.width, ranges.width.min, ranges.width.max, w.value));
        SASH_TRACE_AXIS_CLAMP(SASH_AXIS_WIDTH, request.width, w.value);
    }
    if (h.clamped) {
        append_warning(result.warning,
                       std::format("height {} m is outside the measured range [{}, {}] m; using {} m",
                                   request.height, ranges.height.min, ranges.height.max, h.value));
        SASH_TRACE_AXIS_CLAMP(SASH_AXIS_HEIGHT, request.height, h.value);
    }
    result.effective_width = w.value;
    result.effective_height = h.value;

    result.coefficient = sampler_->sample(grid, w.value, h.value);

    SASH_TRACE_RESOLVE_DONE(result.coefficient, result.is_fallback_category ? 1 : 0,
                            (w.clamped ? 1 : 0) | (h.clamped ? 2 : 0));
    return result;
}

std::vector<std::expected<ResolutionResult, ResolveError>>
Resolver::resolve_batch(std::span<const ResolutionRequest> requests) const {
    const size_t n = requests.size();
    std::vector<std::expected<ResolutionResult, ResolveError>> results(n);

    if (n < PARALLEL_MIN_BATCH) {
        for (size_t i = 0; i < n; ++i) {
            results[i] = resolve(requests[i]);
        }
        return results;
    }

    SASH_PRAGMA_PARALLEL_FOR_DYNAMIC
    for (size_t i = 0; i < n; ++i) {
        results[i] = resolve(requests[i]);
    }
    return results;
}

}  // namespace sash
