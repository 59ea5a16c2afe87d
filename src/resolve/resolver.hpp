// SPDX-License-Identifier: MIT
#pragma once

#include <expected>
#include <memory>
#include <span>
#include <vector>
#include "src/resolve/category_fallback.hpp"
#include "src/resolve/grid_sampler.hpp"
#include "src/resolve/resolution_types.hpp"
#include "src/resolve/resolver_config.hpp"
#include "src/support/error_types.hpp"
#include "src/table/coefficient_table.hpp"

namespace sash {

/// Maps (system, category, width, height) onto a coefficient
///
/// Steps, in order:
///  1. reject non-positive or non-finite dimensions (InvalidDimensions)
///  2. find the system (UnknownSystem when absent; never substituted)
///  3. find the category, or substitute one through the fallback policy
///  4. clamp each dimension into the grid's measured range
///  5. sample the grid through the sampling strategy
///
/// A Resolver holds no mutable state. resolve() may be called concurrently
/// from any number of threads; copies share the table and strategies.
class Resolver {
public:
    /// Build a resolver with the strategies named by `config`
    [[nodiscard]] static std::expected<Resolver, ValidationError>
    create(std::shared_ptr<const CoefficientTable> table,
           const ResolverConfig& config = {});

    /// Build a resolver with caller-supplied strategies
    [[nodiscard]] static std::expected<Resolver, ValidationError>
    create(std::shared_ptr<const CoefficientTable> table,
           std::shared_ptr<const GridSampler> sampler,
           std::shared_ptr<const CategoryFallbackPolicy> fallback,
           const ResolverConfig& config = {});

    [[nodiscard]] std::expected<ResolutionResult, ResolveError>
    resolve(const ResolutionRequest& request) const;

    /// Resolve an entire order; element i answers requests[i]
    [[nodiscard]] std::vector<std::expected<ResolutionResult, ResolveError>>
    resolve_batch(std::span<const ResolutionRequest> requests) const;

    [[nodiscard]] const CoefficientTable& table() const noexcept { return *table_; }
    [[nodiscard]] const std::shared_ptr<const CoefficientTable>& shared_table() const noexcept {
        return table_;
    }
    [[nodiscard]] const ResolverConfig& config() const noexcept { return config_; }
    [[nodiscard]] const GridSampler& sampler() const noexcept { return *sampler_; }

private:
    Resolver(std::shared_ptr<const CoefficientTable> table,
             std::shared_ptr<const GridSampler> sampler,
             std::shared_ptr<const CategoryFallbackPolicy> fallback,
             const ResolverConfig& config)
        : table_(std::move(table))
        , sampler_(std::move(sampler))
        , fallback_(std::move(fallback))
        , config_(config) {}

    std::shared_ptr<const CoefficientTable> table_;
    std::shared_ptr<const GridSampler> sampler_;
    std::shared_ptr<const CategoryFallbackPolicy> fallback_;
    ResolverConfig config_;
};

}  // namespace sash
