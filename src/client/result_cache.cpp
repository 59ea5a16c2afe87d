// SPDX-License-Identifier: MIT
#include "src/client/result_cache.hpp"

namespace sash {

const ResolutionResult* ResultCache::find(std::string_view fingerprint) const {
    auto it = entries_.find(fingerprint);
    return it == entries_.end() ? nullptr : &it->second;
}

bool ResultCache::insert(std::string fingerprint, ResolutionResult result) {
    return entries_.try_emplace(std::move(fingerprint), std::move(result)).second;
}

}  // namespace sash
