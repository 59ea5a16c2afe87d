// SPDX-License-Identifier: MIT
#include "src/client/resolution_client.hpp"
#include "src/support/sash_trace.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <memory>
#include <utility>

namespace sash {

namespace {

bool valid_dimension(double meters) noexcept {
    return std::isfinite(meters) && meters > 0.0;
}

}  // namespace

ResolutionClient::~ResolutionClient() {
    for (auto& [id, state] : states_) {
        supersede(id, state);
    }
}

void ResolutionClient::supersede(SashId sash_id, SashResolutionState& state) {
    const bool had_timer = state.timer.has_value();
    const bool had_call = state.in_flight.has_value();
    if (!had_timer && !had_call) return;

    if (state.timer) {
        scheduler_.cancel(*state.timer);
        state.timer.reset();
    }
    if (state.in_flight) {
        // Move out first: request_stop() runs transport callbacks synchronously
        std::stop_source source = std::move(*state.in_flight);
        state.in_flight.reset();
        source.request_stop();
    }
    SASH_TRACE_CLIENT_SUPERSEDED(sash_id, had_timer ? 1 : 0, had_call ? 1 : 0);
}

void ResolutionClient::request_resolution(SashId sash_id,
                                          ResolutionRequest request,
                                          SuccessCallback on_success,
                                          ErrorCallback on_error,
                                          std::optional<std::chrono::milliseconds> debounce) {
    if (!valid_dimension(request.width) || !valid_dimension(request.height)) {
        // Newest wins even when the newest request is unusable
        if (auto it = states_.find(sash_id); it != states_.end()) {
            supersede(sash_id, it->second);
            ++it->second.generation;
            it->second.fingerprint.clear();
        }
        SASH_TRACE_CLIENT_FAILED(sash_id, static_cast<int>(ClientErrorCode::InvalidDimensions));
        if (on_error) {
            on_error(ClientError{
                ClientErrorCode::InvalidDimensions,
                std::format("width and height must be positive finite numbers of meters, "
                            "got {} x {}", request.width, request.height),
            });
        }
        return;
    }

    std::string key = fingerprint(request);

    if (const ResolutionResult* cached = cache_.find(key)) {
        // A cached answer is the newest answer for this sash: anything older
        // still pending must not overwrite it later.
        if (auto it = states_.find(sash_id); it != states_.end()) {
            supersede(sash_id, it->second);
            ++it->second.generation;
            it->second.fingerprint = key;
        }
        SASH_TRACE_CLIENT_CACHE_HIT(sash_id);
        const ResolutionResult result = *cached;  // callback may reset the cache
        if (on_success) on_success(result);
        return;
    }

    SashResolutionState& state = states_[sash_id];
    supersede(sash_id, state);
    state.fingerprint = std::move(key);
    const uint64_t generation = ++state.generation;

    const auto delay = std::max(debounce.value_or(config_.debounce),
                                std::chrono::milliseconds{0});

    auto pending = std::make_shared<Pending>(Pending{
        .sash_id = sash_id,
        .generation = generation,
        .request = std::move(request),
        .on_success = std::move(on_success),
        .on_error = std::move(on_error),
    });
    state.timer = scheduler_.schedule_after(delay, [this, pending] {
        dispatch(std::move(*pending));
    });
    SASH_TRACE_CLIENT_SCHEDULED(sash_id, delay.count());
}

void ResolutionClient::dispatch(Pending pending) {
    auto it = states_.find(pending.sash_id);
    if (it == states_.end() || it->second.generation != pending.generation) {
        return;
    }
    SashResolutionState& state = it->second;
    state.timer.reset();

    std::stop_source source;
    std::stop_token token = source.get_token();
    state.in_flight = std::move(source);

    SASH_TRACE_CLIENT_DISPATCHED(pending.sash_id);

    auto shared = std::make_shared<Pending>(std::move(pending));
    const ResolutionRequest& request = shared->request;
    // `state` may be gone once send() returns: a synchronous transport can
    // complete, and the callback may release this sash.
    transport_.send(request, token, [this, shared, token](TransportOutcome outcome) {
        if (token.stop_requested()) {
            return;  // superseded or released: deliver nothing
        }
        complete(*shared, std::move(outcome));
    });
}

void ResolutionClient::complete(const Pending& pending, TransportOutcome outcome) {
    auto it = states_.find(pending.sash_id);
    if (it == states_.end() || it->second.generation != pending.generation) {
        return;
    }
    it->second.in_flight.reset();

    if (outcome) {
        cache_.insert(it->second.fingerprint, *outcome);
        SASH_TRACE_CLIENT_DELIVERED(pending.sash_id, outcome->coefficient);
        if (pending.on_success) pending.on_success(*outcome);
        return;
    }

    SASH_TRACE_CLIENT_FAILED(pending.sash_id, static_cast<int>(outcome.error().code));
    if (pending.on_error) pending.on_error(outcome.error());
}

void ResolutionClient::release_sash(SashId sash_id) {
    auto it = states_.find(sash_id);
    if (it == states_.end()) return;
    supersede(sash_id, it->second);
    states_.erase(it);
    SASH_TRACE_CLIENT_RELEASED(sash_id);
}

void ResolutionClient::reset_all() {
    const size_t n_sashes = states_.size();
    for (auto& [id, state] : states_) {
        supersede(id, state);
    }
    states_.clear();

    const size_t n_cached = cache_.size();
    cache_.clear();
    SASH_TRACE_CLIENT_RESET(n_sashes, n_cached);
}

bool ResolutionClient::is_pending(SashId sash_id) const {
    auto it = states_.find(sash_id);
    if (it == states_.end()) return false;
    return it->second.timer.has_value() || it->second.in_flight.has_value();
}

}  // namespace sash
