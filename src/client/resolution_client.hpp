// SPDX-License-Identifier: MIT
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include "src/client/result_cache.hpp"
#include "src/client/scheduler.hpp"
#include "src/client/transport.hpp"
#include "src/resolve/resolution_types.hpp"
#include "src/support/error_types.hpp"

namespace sash {

/// Identity of one order line item for the duration of an editing session
using SashId = std::uint64_t;

using SuccessCallback = std::function<void(const ResolutionResult&)>;
using ErrorCallback = std::function<void(const ClientError&)>;

struct ClientConfig {
    /// Quiet period after the last change before a request goes out.
    /// Negative values are treated as zero.
    std::chrono::milliseconds debounce{500};
};

/// Per-sash request orchestration for an order editing session
///
/// Each sash resolves independently. For one sash, at most one resolution is
/// live at a time: a newer request cancels the pending debounce timer and
/// aborts the in-flight call of the previous one, so callbacks arrive in
/// request order and a superseded result is never delivered. Completed
/// results are memoised in a session-wide ResultCache; a cache hit is
/// delivered synchronously without touching the transport.
///
/// Runs entirely on `scheduler`'s thread. Destruction releases every sash,
/// so no task scheduled by the client runs after it is gone.
///
/// Example:
/// @code
///   ResolutionClient client(loop, transport);
///   client.request_resolution(
///       line_id, {"uni1_zebra", "E", 1.2, 1.6},
///       [&](const ResolutionResult& r) { line.coefficient = r.coefficient; },
///       [&](const ClientError& e) { show_error(describe(e)); });
///   ...
///   client.release_sash(line_id);  // line removed from the order
/// @endcode
class ResolutionClient {
public:
    ResolutionClient(Scheduler& scheduler, Transport& transport, ClientConfig config = {})
        : scheduler_(scheduler), transport_(transport), config_(config) {}

    ~ResolutionClient();

    ResolutionClient(const ResolutionClient&) = delete;
    ResolutionClient& operator=(const ResolutionClient&) = delete;

    /// Ask for a coefficient on behalf of `sash_id`
    ///
    /// @param debounce Overrides ClientConfig::debounce; negative means zero
    /// @param on_error Optional; invoked for non-cancelled failures only
    void request_resolution(SashId sash_id,
                            ResolutionRequest request,
                            SuccessCallback on_success,
                            ErrorCallback on_error = {},
                            std::optional<std::chrono::milliseconds> debounce = std::nullopt);

    /// Forget a sash: its pending timer and in-flight call are cancelled and
    /// none of its callbacks will run afterwards.
    void release_sash(SashId sash_id);

    /// Release every sash and clear the result cache
    void reset_all();

    /// True while a debounce timer or a call is outstanding for the sash
    [[nodiscard]] bool is_pending(SashId sash_id) const;

    [[nodiscard]] bool is_tracked(SashId sash_id) const {
        return states_.contains(sash_id);
    }

    [[nodiscard]] size_t tracked_sashes() const noexcept { return states_.size(); }

    [[nodiscard]] const ResultCache& cache() const noexcept { return cache_; }
    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }

private:
    /// Lifetime: the line item's lifetime in the editing session
    struct SashResolutionState {
        std::optional<TimerId> timer;
        std::optional<std::stop_source> in_flight;
        std::string fingerprint;   ///< Cache key of the live request
        uint64_t generation = 0;   ///< Bumped by every request for this sash
    };

    struct Pending {
        SashId sash_id;
        uint64_t generation;
        ResolutionRequest request;
        SuccessCallback on_success;
        ErrorCallback on_error;
    };

    /// Cancel the pending timer and abort the in-flight call, if any
    void supersede(SashId sash_id, SashResolutionState& state);

    void dispatch(Pending pending);
    void complete(const Pending& pending, TransportOutcome outcome);

    Scheduler& scheduler_;
    Transport& transport_;
    ClientConfig config_;
    ResultCache cache_;
    std::unordered_map<SashId, SashResolutionState> states_;
};

}  // namespace sash
