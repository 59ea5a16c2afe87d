// SPDX-License-Identifier: MIT
#include "src/support/json_document.hpp"

#include <memory>

namespace sash {

std::expected<Json::Value, std::string> parse_json(std::string_view text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["rejectDupKeys"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return std::unexpected(errors.empty() ? std::string("invalid JSON") : errors);
    }
    return root;
}

std::string write_json(const Json::Value& value, int indent) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = indent > 0 ? std::string(static_cast<size_t>(indent), ' ') : "";
    builder["precision"] = 17;
    return Json::writeString(builder, value);
}

const Json::Value* find_member(const Json::Value& object, const char* key) {
    if (!object.isObject()) {
        return nullptr;
    }
    return object.find(key, key + std::char_traits<char>::length(key));
}

}  // namespace sash
