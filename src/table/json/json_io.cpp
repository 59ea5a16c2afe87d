// SPDX-License-Identifier: MIT
#include "src/table/json/json_io.hpp"
#include "src/support/json_document.hpp"
#include "src/support/sash_trace.h"

#include <json/json.h>

#include <fstream>
#include <span>
#include <sstream>
#include <vector>

namespace sash {

namespace {

TableError parse_error(std::string detail,
                       std::string system_key = {},
                       std::string category = {}) {
    return TableError{
        .code = TableErrorCode::ParseFailed,
        .system_key = std::move(system_key),
        .category = std::move(category),
        .validation = std::nullopt,
        .detail = std::move(detail),
    };
}

std::expected<std::vector<double>, std::string>
read_numbers(const Json::Value& node, const char* field) {
    if (!node.isArray()) {
        return std::unexpected(std::string("'") + field + "' must be an array of numbers");
    }
    std::vector<double> out;
    out.reserve(node.size());
    for (const auto& v : node) {
        if (!v.isNumeric()) {
            return std::unexpected(std::string("'") + field + "' contains a non-numeric entry");
        }
        out.push_back(v.asDouble());
    }
    return out;
}

std::expected<CoefficientTableData::Entry, TableError>
read_grid(const std::string& system_key, const std::string& category, const Json::Value& node) {
    if (!node.isObject()) {
        return std::unexpected(parse_error("grid must be an object", system_key, category));
    }
    for (const char* field : {"widths", "heights", "values"}) {
        if (!node.isMember(field)) {
            return std::unexpected(parse_error(std::string("missing '") + field + "'",
                                               system_key, category));
        }
    }

    auto widths = read_numbers(node["widths"], "widths");
    if (!widths) return std::unexpected(parse_error(widths.error(), system_key, category));
    auto heights = read_numbers(node["heights"], "heights");
    if (!heights) return std::unexpected(parse_error(heights.error(), system_key, category));

    const Json::Value& rows = node["values"];
    if (!rows.isArray()) {
        return std::unexpected(parse_error("'values' must be an array of rows",
                                           system_key, category));
    }

    CoefficientTableData::Entry entry{
        .system_key = system_key,
        .category = category,
        .widths = std::move(*widths),
        .heights = std::move(*heights),
        .values = {},
    };

    // Ragged or short rows are a shape violation, not a syntax error
    if (rows.size() != entry.widths.size()) {
        return std::unexpected(TableError{
            .code = TableErrorCode::InvalidGrid,
            .system_key = system_key,
            .category = category,
            .validation = ValidationError(ValidationErrorCode::ShapeMismatch,
                                          static_cast<double>(entry.widths.size()),
                                          rows.size()),
            .detail = "one row of values per width breakpoint",
        });
    }
    entry.values.reserve(entry.widths.size() * entry.heights.size());
    for (const auto& row : rows) {
        auto numbers = read_numbers(row, "values");
        if (!numbers) return std::unexpected(parse_error(numbers.error(), system_key, category));
        if (numbers->size() != entry.heights.size()) {
            return std::unexpected(TableError{
                .code = TableErrorCode::InvalidGrid,
                .system_key = system_key,
                .category = category,
                .validation = ValidationError(ValidationErrorCode::ShapeMismatch,
                                              static_cast<double>(entry.heights.size()),
                                              numbers->size()),
                .detail = "one value per height breakpoint in every row",
            });
        }
        entry.values.insert(entry.values.end(), numbers->begin(), numbers->end());
    }
    return entry;
}

}  // namespace

std::expected<CoefficientTableData, TableError>
parse_coefficient_json(std::string_view text) {
    SASH_TRACE_TABLE_LOAD_START(SASH_SOURCE_JSON);

    auto parsed = parse_json(text);
    if (!parsed) {
        return std::unexpected(parse_error("document is not valid JSON: " + parsed.error()));
    }
    const Json::Value& root = *parsed;
    if (!root.isObject()) {
        return std::unexpected(parse_error("document root must be an object"));
    }

    const Json::Value* products = find_member(root, "products");
    const bool enveloped = products != nullptr;
    if (!enveloped) {
        products = &root;
    }
    if (!products->isObject()) {
        return std::unexpected(parse_error("'products' must be an object"));
    }

    CoefficientTableData data;
    for (auto it = products->begin(); it != products->end(); ++it) {
        const std::string system_key = it.name();
        const Json::Value& product = *it;
        if (!product.isObject()) {
            return std::unexpected(parse_error("system entry must be an object", system_key));
        }
        const Json::Value* categories = &product;
        if (enveloped) {
            categories = find_member(product, "categories");
            if (!categories || !categories->isObject()) {
                return std::unexpected(parse_error("missing 'categories' object", system_key));
            }
        }
        if (categories->empty()) {
            return std::unexpected(TableError{
                .code = TableErrorCode::InvalidGrid,
                .system_key = system_key,
                .category = {},
                .validation = ValidationError(ValidationErrorCode::EmptySystem),
                .detail = {},
            });
        }
        for (auto cat = categories->begin(); cat != categories->end(); ++cat) {
            auto entry = read_grid(system_key, cat.name(), *cat);
            if (!entry) return std::unexpected(entry.error());
            data.entries.push_back(std::move(*entry));
        }
    }
    return data;
}

std::expected<CoefficientTableData, TableError>
read_coefficient_json(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(TableError{
            .code = TableErrorCode::FileNotFound,
            .system_key = {},
            .category = {},
            .validation = std::nullopt,
            .detail = path.string(),
        });
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_coefficient_json(buffer.str());
}

namespace {

Json::Value number_array(std::span<const double> values) {
    Json::Value out(Json::arrayValue);
    for (double v : values) {
        out.append(v);
    }
    return out;
}

}  // namespace

std::string to_coefficient_json(const CoefficientTableData& data, int indent) {
    Json::Value products(Json::objectValue);
    for (const auto& entry : data.entries) {
        Json::Value rows(Json::arrayValue);
        const size_t n_h = entry.heights.size();
        for (size_t i = 0; i < entry.widths.size(); ++i) {
            rows.append(number_array(std::span<const double>(entry.values).subspan(i * n_h, n_h)));
        }
        Json::Value grid(Json::objectValue);
        grid["widths"] = number_array(entry.widths);
        grid["heights"] = number_array(entry.heights);
        grid["values"] = std::move(rows);
        products[entry.system_key]["categories"][entry.category] = std::move(grid);
    }
    Json::Value root(Json::objectValue);
    root["products"] = std::move(products);
    return write_json(root, indent);
}

}  // namespace sash
