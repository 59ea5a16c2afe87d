// SPDX-License-Identifier: MIT
#pragma once

#include <json/json.h>

#include <expected>
#include <string>
#include <string_view>

namespace sash {

/// Parse a JSON document without throwing. An object that repeats a key is
/// rejected rather than keeping the last value.
/// @return The root value, or the reader's error text
[[nodiscard]] std::expected<Json::Value, std::string>
parse_json(std::string_view text);

/// Serialize a value; indent <= 0 gives the compact single-line form
[[nodiscard]] std::string write_json(const Json::Value& value, int indent = 0);

/// Member of an object, or nullptr when `object` is not an object or lacks `key`
[[nodiscard]] const Json::Value* find_member(const Json::Value& object, const char* key);

}  // namespace sash
