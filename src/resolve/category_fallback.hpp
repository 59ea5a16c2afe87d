// SPDX-License-Identifier: MIT
#pragma once

#include <memory>
#include <string_view>
#include "src/resolve/resolver_config.hpp"
#include "src/table/coefficient_table.hpp"

namespace sash {

/// Strategy choosing a substitute when a system lacks the requested category
class CategoryFallbackPolicy {
public:
    virtual ~CategoryFallbackPolicy() = default;

    [[nodiscard]] virtual const char* name() const noexcept = 0;

    /// @param system Categories of the system (never empty)
    /// @param requested Category the caller asked for
    /// @return Entry to use instead, or nullptr to refuse substitution
    [[nodiscard]] virtual const SystemEntry::value_type*
    select(const SystemEntry& system, std::string_view requested) const = 0;
};

/// Deterministically picks the lexicographically first category name
class FirstCategoryFallback final : public CategoryFallbackPolicy {
public:
    [[nodiscard]] const char* name() const noexcept override { return "first-category"; }

    [[nodiscard]] const SystemEntry::value_type*
    select(const SystemEntry& system, std::string_view) const override {
        return system.empty() ? nullptr : &*system.begin();
    }
};

[[nodiscard]] std::shared_ptr<const CategoryFallbackPolicy>
make_fallback_policy(FallbackMode mode);

}  // namespace sash
