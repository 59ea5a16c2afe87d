// SPDX-License-Identifier: MIT
#include "src/service/resolution_service.hpp"
#include "src/support/json_document.hpp"
#include "src/support/sash_trace.h"

#include <json/json.h>

#include <format>
#include <string>
#include <vector>

namespace sash {

namespace {

ServiceResponse error_response(int code, std::string_view error_code, std::string_view message) {
    return ServiceResponse{code, encode_error(error_code, message)};
}

Json::Value range_json(const AxisRange& range) {
    Json::Value out(Json::objectValue);
    out["min"] = range.min;
    out["max"] = range.max;
    return out;
}

Json::Value string_array(const std::vector<std::string>& items) {
    Json::Value out(Json::arrayValue);
    for (const auto& item : items) {
        out.append(item);
    }
    return out;
}

}  // namespace

ServiceResponse ResolutionService::calculate(std::string_view body) const {
    auto request = decode_request(body);
    if (!request) {
        SASH_TRACE_REQUEST_FAILED(SASH_MODULE_SERVICE, status::BAD_REQUEST, 0.0);
        return error_response(status::BAD_REQUEST, "BadRequest", request.error());
    }

    auto result = resolver_.resolve(*request);
    if (!result) {
        const ResolveError& err = result.error();
        const int code = err.code == ResolveErrorCode::UnknownSystem
            ? status::NOT_FOUND
            : status::BAD_REQUEST;
        return error_response(code, to_string(err.code), err.message);
    }
    return ServiceResponse{status::OK, encode_result(*result)};
}

ServiceResponse ResolutionService::systems() const {
    Json::Value body(Json::objectValue);
    body["systems"] = string_array(resolver_.table().systems());
    return ServiceResponse{status::OK, write_json(body)};
}

ServiceResponse ResolutionService::categories(std::string_view system_key) const {
    if (!resolver_.table().find_system(system_key)) {
        return error_response(status::NOT_FOUND, "UnknownSystem",
                              std::format("system '{}' is not present in the coefficient table",
                                          system_key));
    }
    Json::Value body(Json::objectValue);
    body["systemKey"] = std::string(system_key);
    body["categories"] = string_array(resolver_.table().categories(system_key));
    return ServiceResponse{status::OK, write_json(body)};
}

ServiceResponse ResolutionService::ranges(std::string_view system_key,
                                          std::string_view category) const {
    auto found = resolver_.table().ranges(system_key, category);
    if (!found) {
        return error_response(status::NOT_FOUND, "NotFound",
                              std::format("no grid for system '{}', category '{}'",
                                          system_key, category));
    }
    Json::Value body(Json::objectValue);
    body["systemKey"] = std::string(system_key);
    body["category"] = std::string(category);
    body["width"] = range_json(found->width);
    body["height"] = range_json(found->height);
    return ServiceResponse{status::OK, write_json(body)};
}

}  // namespace sash
