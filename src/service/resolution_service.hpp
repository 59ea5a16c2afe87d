// SPDX-License-Identifier: MIT
#pragma once

#include <string_view>
#include "src/resolve/resolver.hpp"
#include "src/service/wire_codec.hpp"

namespace sash {

/// Server-side execution point of the Resolver
///
/// Every endpoint takes and returns JSON bodies with an HTTP-like status, so
/// a network front end only has to move bytes. The service is stateless
/// apart from the shared read-only table; one instance can serve concurrent
/// requests.
class ResolutionService {
public:
    explicit ResolutionService(Resolver resolver) : resolver_(std::move(resolver)) {}

    /// Resolve one coefficient
    ///
    /// 200 with the result, 400 for a malformed body or InvalidDimensions,
    /// 404 for UnknownSystem.
    [[nodiscard]] ServiceResponse calculate(std::string_view body) const;

    /// 200 `{ "systems": [...] }`, exactly CoefficientTable::systems()
    [[nodiscard]] ServiceResponse systems() const;

    /// 200 `{ "systemKey": s, "categories": [...] }` or 404
    [[nodiscard]] ServiceResponse categories(std::string_view system_key) const;

    /// 200 `{ "systemKey": s, "category": s, "width": {min,max}, "height": {min,max} }` or 404
    [[nodiscard]] ServiceResponse ranges(std::string_view system_key,
                                         std::string_view category) const;

    [[nodiscard]] const Resolver& resolver() const noexcept { return resolver_; }

private:
    Resolver resolver_;
};

}  // namespace sash
