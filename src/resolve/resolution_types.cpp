// SPDX-License-Identifier: MIT
#include "src/resolve/resolution_types.hpp"

#include <format>

namespace sash {

std::string fingerprint(const ResolutionRequest& request) {
    // Length prefixes keep keys containing '|' from colliding
    return std::format("{}:{}|{}:{}|{:.3f}|{:.3f}",
                       request.system_key.size(), request.system_key,
                       request.category.size(), request.category,
                       request.width, request.height);
}

}  // namespace sash
