// SPDX-License-Identifier: MIT
#pragma once

#include <expected>
#include <functional>
#include <stop_token>
#include "src/resolve/resolution_types.hpp"
#include "src/support/error_types.hpp"

namespace sash {

using TransportOutcome = std::expected<ResolutionResult, ClientError>;
using TransportCompletion = std::function<void(TransportOutcome)>;

/// Request/response exchange between a ResolutionClient and a remote
/// execution of the Resolver
///
/// Contract for implementations:
///  - `completion` is invoked at most once, on the client's scheduler thread;
///  - once stop has been requested on `token`, `completion` is never invoked
///    (abort must not produce a delivered response);
///  - transport-level failures and undecodable responses are reported as
///    ClientError through `completion`, never thrown.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void send(const ResolutionRequest& request,
                      std::stop_token token,
                      TransportCompletion completion) = 0;
};

}  // namespace sash
