// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include "src/resolve/resolution_types.hpp"

namespace sash {

/// Session-wide memo of completed resolutions, keyed by fingerprint()
///
/// Append-only: entries are never replaced or evicted, only dropped all at
/// once by clear(). Pointers returned by find() stay valid until clear().
/// Confined to the scheduler thread like the rest of the client.
class ResultCache {
public:
    [[nodiscard]] const ResolutionResult* find(std::string_view fingerprint) const;

    /// Store a result; a fingerprint already present keeps its first value.
    /// @return true when the entry was added
    bool insert(std::string fingerprint, ResolutionResult result);

    [[nodiscard]] bool contains(std::string_view fingerprint) const {
        return find(fingerprint) != nullptr;
    }

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    void clear() noexcept { entries_.clear(); }

private:
    struct Hash {
        using is_transparent = void;
        size_t operator()(std::string_view key) const noexcept {
            return std::hash<std::string_view>{}(key);
        }
    };

    std::unordered_map<std::string, ResolutionResult, Hash, std::equal_to<>> entries_;
};

}  // namespace sash
