// SPDX-License-Identifier: MIT
#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include "src/support/error_types.hpp"
#include "src/table/serialization/coefficient_table_data.hpp"

namespace sash {

/// Parse a JSON coefficient dataset
///
/// Two layouts are accepted:
/// @code
///   { "products": { "<system>": { "categories": { "<category>": GRID } } } }
///   { "<system>": { "<category>": GRID } }
/// @endcode
/// where GRID is `{ "widths": [..], "heights": [..], "values": [[..], ..] }`
/// and values[i][j] belongs to (widths[i], heights[j]).
///
/// Structural problems (wrong types, ragged rows) are reported here; grid
/// invariants are checked later by CoefficientTable::create().
[[nodiscard]] std::expected<CoefficientTableData, TableError>
parse_coefficient_json(std::string_view text);

/// Read and parse a JSON dataset file
[[nodiscard]] std::expected<CoefficientTableData, TableError>
read_coefficient_json(const std::filesystem::path& path);

/// Render table data in the "products" layout
[[nodiscard]] std::string to_coefficient_json(const CoefficientTableData& data,
                                              int indent = 2);

}  // namespace sash
