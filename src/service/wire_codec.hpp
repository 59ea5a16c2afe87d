// SPDX-License-Identifier: MIT
#pragma once

#include <expected>
#include <string>
#include <string_view>
#include "src/resolve/resolution_types.hpp"
#include "src/support/error_types.hpp"

namespace sash {

/// Status codes used on the request/response exchange (HTTP semantics)
namespace status {
inline constexpr int OK = 200;
inline constexpr int BAD_REQUEST = 400;
inline constexpr int NOT_FOUND = 404;
inline constexpr int INTERNAL_ERROR = 500;
}  // namespace status

/// One response of the resolution endpoint
struct ServiceResponse {
    int status = status::OK;
    std::string body;
};

// ============================================================================
// Requests: { "systemKey": s, "category": s, "width": n, "height": n }
// ============================================================================

[[nodiscard]] std::string encode_request(const ResolutionRequest& request);

/// @return The request, or a message naming the first malformed field
[[nodiscard]] std::expected<ResolutionRequest, std::string>
decode_request(std::string_view body);

// ============================================================================
// Responses
//   success: { "coefficient": n, "isFallbackCategory": b, "warning"?: s,
//              "usedSystemKey": s, "usedCategory": s, "width": n, "height": n }
//   failure: { "error": { "code": s, "message": s } }
// ============================================================================

[[nodiscard]] std::string encode_result(const ResolutionResult& result);

[[nodiscard]] std::string encode_error(std::string_view code, std::string_view message);

/// Decode a response into the client-side outcome
///
/// Non-200 statuses become the error named in the body (UnknownSystem,
/// InvalidDimensions) or TransportFailure; an undecodable body becomes
/// MalformedResponse.
[[nodiscard]] std::expected<ResolutionResult, ClientError>
decode_response(const ServiceResponse& response);

}  // namespace sash
