// SPDX-License-Identifier: MIT
#include "src/service/wire_codec.hpp"
#include "src/support/json_document.hpp"

#include <json/json.h>

#include <format>

namespace sash {

namespace {

ClientError malformed(std::string message) {
    return ClientError{ClientErrorCode::MalformedResponse, std::move(message)};
}

/// Optional string member; absent or wrong-typed members leave `out` alone
void read_string(const Json::Value& doc, const char* key, std::string& out) {
    if (const Json::Value* v = find_member(doc, key); v && v->isString()) {
        out = v->asString();
    }
}

void read_number(const Json::Value& doc, const char* key, double& out) {
    if (const Json::Value* v = find_member(doc, key); v && v->isNumeric()) {
        out = v->asDouble();
    }
}

}  // namespace

std::string encode_request(const ResolutionRequest& request) {
    Json::Value body(Json::objectValue);
    body["systemKey"] = request.system_key;
    body["category"] = request.category;
    body["width"] = request.width;
    body["height"] = request.height;
    return write_json(body);
}

std::expected<ResolutionRequest, std::string>
decode_request(std::string_view body) {
    auto doc = parse_json(body);
    if (!doc || !doc->isObject()) {
        return std::unexpected("request body must be a JSON object");
    }

    for (const char* field : {"systemKey", "category"}) {
        const Json::Value* v = find_member(*doc, field);
        if (!v || !v->isString()) {
            return std::unexpected(std::format("'{}' must be a string", field));
        }
    }
    for (const char* field : {"width", "height"}) {
        const Json::Value* v = find_member(*doc, field);
        if (!v || !v->isNumeric()) {
            return std::unexpected(std::format("'{}' must be a number", field));
        }
    }

    ResolutionRequest request;
    read_string(*doc, "systemKey", request.system_key);
    read_string(*doc, "category", request.category);
    read_number(*doc, "width", request.width);
    read_number(*doc, "height", request.height);
    return request;
}

std::string encode_result(const ResolutionResult& result) {
    Json::Value body(Json::objectValue);
    body["coefficient"] = result.coefficient;
    body["isFallbackCategory"] = result.is_fallback_category;
    body["usedSystemKey"] = result.resolved_system;
    body["usedCategory"] = result.resolved_category;
    body["width"] = result.effective_width;
    body["height"] = result.effective_height;
    if (result.warning) {
        body["warning"] = *result.warning;
    }
    return write_json(body);
}

std::string encode_error(std::string_view code, std::string_view message) {
    Json::Value error(Json::objectValue);
    error["code"] = std::string(code);
    error["message"] = std::string(message);

    Json::Value body(Json::objectValue);
    body["error"] = std::move(error);
    return write_json(body);
}

std::expected<ResolutionResult, ClientError>
decode_response(const ServiceResponse& response) {
    auto doc = parse_json(response.body);

    if (response.status != status::OK) {
        std::string code;
        std::string message = std::format("status {}", response.status);
        if (doc) {
            if (const Json::Value* err = find_member(*doc, "error")) {
                read_string(*err, "code", code);
                read_string(*err, "message", message);
            }
        }
        if (code == "UnknownSystem") {
            return std::unexpected(ClientError{ClientErrorCode::UnknownSystem, message});
        }
        if (code == "InvalidDimensions") {
            return std::unexpected(ClientError{ClientErrorCode::InvalidDimensions, message});
        }
        return std::unexpected(ClientError{ClientErrorCode::TransportFailure, message});
    }

    if (!doc || !doc->isObject()) {
        return std::unexpected(malformed("response body is not a JSON object"));
    }
    const Json::Value* coefficient = find_member(*doc, "coefficient");
    if (!coefficient || !coefficient->isNumeric()) {
        return std::unexpected(malformed("'coefficient' missing or not a number"));
    }

    ResolutionResult result;
    result.coefficient = coefficient->asDouble();

    if (const Json::Value* flag = find_member(*doc, "isFallbackCategory")) {
        if (!flag->isBool()) {
            return std::unexpected(malformed("'isFallbackCategory' must be a boolean"));
        }
        result.is_fallback_category = flag->asBool();
    }
    if (const Json::Value* warning = find_member(*doc, "warning"); warning && !warning->isNull()) {
        if (!warning->isString()) {
            return std::unexpected(malformed("'warning' must be a string"));
        }
        result.warning = warning->asString();
    }
    read_string(*doc, "usedSystemKey", result.resolved_system);
    read_string(*doc, "usedCategory", result.resolved_category);
    read_number(*doc, "width", result.effective_width);
    read_number(*doc, "height", result.effective_height);
    return result;
}

}  // namespace sash
