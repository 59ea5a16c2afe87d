// SPDX-License-Identifier: MIT
#include "src/resolve/category_fallback.hpp"

namespace sash {

std::shared_ptr<const CategoryFallbackPolicy> make_fallback_policy(FallbackMode mode) {
    switch (mode) {
        case FallbackMode::FirstCategory:
            return std::make_shared<FirstCategoryFallback>();
    }
    return std::make_shared<FirstCategoryFallback>();
}

}  // namespace sash
