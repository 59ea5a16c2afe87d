// SPDX-License-Identifier: MIT
#include "src/client/local_transport.hpp"
#include "src/service/wire_codec.hpp"
#include "src/support/sash_trace.h"

#include <string>

namespace sash {

LocalTransport::~LocalTransport() {
    for (auto& [id, call] : calls_) {
        call->on_stop.reset();
        scheduler_.cancel(call->timer);
    }
}

void LocalTransport::send(const ResolutionRequest& request,
                          std::stop_token token,
                          TransportCompletion completion) {
    retired_.clear();
    if (token.stop_requested()) {
        ++aborted_;
        SASH_TRACE_TRANSPORT_ABORTED();
        return;
    }

    std::string body = encode_request(request);
    ++sent_;
    SASH_TRACE_TRANSPORT_SENT(body.size());

    const uint64_t call_id = next_call_id_++;
    auto call = std::make_unique<Call>();
    call->token = token;
    call->completion = std::move(completion);
    call->timer = scheduler_.schedule_after(
        config_.latency,
        [this, call_id, body = std::move(body)] { deliver(call_id, body); });

    Call& registered = *calls_.emplace(call_id, std::move(call)).first->second;

    // Registered last: if stop is requested concurrently with registration the
    // callback runs right here and finds the call in place.
    registered.on_stop.emplace(token, std::function<void()>([this, call_id] { abort(call_id); }));
}

void LocalTransport::abort(uint64_t call_id) {
    auto it = calls_.find(call_id);
    if (it == calls_.end()) return;

    if (scheduler_.cancel(it->second->timer)) {
        ++aborted_;
        SASH_TRACE_TRANSPORT_ABORTED();
    }
    // This runs inside the Call's own stop_callback, which must not be
    // destroyed here; park it until the next send() or delivery.
    retired_.push_back(std::move(it->second));
    calls_.erase(it);
}

void LocalTransport::deliver(uint64_t call_id, const std::string& body) {
    retired_.clear();
    auto node = calls_.extract(call_id);
    if (node.empty()) return;

    std::unique_ptr<Call> call = std::move(node.mapped());
    call->on_stop.reset();
    if (call->token.stop_requested()) {
        ++aborted_;
        SASH_TRACE_TRANSPORT_ABORTED();
        return;
    }

    ServiceResponse response = service_.calculate(body);
    ++served_;
    SASH_TRACE_TRANSPORT_RECEIVED(response.status, response.body.size());

    auto completion = std::move(call->completion);
    call.reset();
    completion(decode_response(response));
}

}  // namespace sash
