// SPDX-License-Identifier: MIT
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <unordered_map>
#include <vector>
#include "src/client/scheduler.hpp"
#include "src/client/transport.hpp"
#include "src/service/resolution_service.hpp"

namespace sash {

struct LocalTransportConfig {
    /// Simulated round-trip time before the service sees the request
    std::chrono::milliseconds latency{0};
};

/// Loopback transport: encodes the request with the wire codec, hands it to
/// an in-process ResolutionService on the scheduler after `latency`, and
/// decodes the response.
///
/// Stopping a call's token cancels its scheduled exchange, so an aborted
/// call never reaches the service. Must outlive the tasks it schedules.
class LocalTransport final : public Transport {
public:
    LocalTransport(Scheduler& scheduler,
                   const ResolutionService& service,
                   LocalTransportConfig config = {})
        : scheduler_(scheduler), service_(service), config_(config) {}

    ~LocalTransport() override;

    LocalTransport(const LocalTransport&) = delete;
    LocalTransport& operator=(const LocalTransport&) = delete;

    void send(const ResolutionRequest& request,
              std::stop_token token,
              TransportCompletion completion) override;

    /// Exchanges started
    [[nodiscard]] size_t calls_sent() const noexcept { return sent_; }
    /// Exchanges that reached the service
    [[nodiscard]] size_t calls_served() const noexcept { return served_; }
    /// Exchanges aborted before reaching the service
    [[nodiscard]] size_t calls_aborted() const noexcept { return aborted_; }
    /// Exchanges neither served nor cleaned up yet
    [[nodiscard]] size_t calls_in_flight() const noexcept { return calls_.size(); }

private:
    struct Call {
        TimerId timer = 0;
        std::stop_token token;
        TransportCompletion completion;
        std::optional<std::stop_callback<std::function<void()>>> on_stop;
    };

    void deliver(uint64_t call_id, const std::string& body);
    void abort(uint64_t call_id);

    Scheduler& scheduler_;
    const ResolutionService& service_;
    LocalTransportConfig config_;

    std::unordered_map<uint64_t, std::unique_ptr<Call>> calls_;
    std::vector<std::unique_ptr<Call>> retired_;
    uint64_t next_call_id_ = 1;
    size_t sent_ = 0;
    size_t served_ = 0;
    size_t aborted_ = 0;
};

}  // namespace sash
