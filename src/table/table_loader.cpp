// SPDX-License-Identifier: MIT
#include "src/table/table_loader.hpp"
#include "src/table/json/json_io.hpp"
#include "src/table/parquet/parquet_io.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace sash {

std::expected<std::shared_ptr<const CoefficientTable>, TableError>
load_coefficient_table(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::expected<CoefficientTableData, TableError> data;
    if (ext == ".json") {
        data = read_coefficient_json(path);
    } else if (ext == ".parquet") {
        data = read_parquet(path);
    } else {
        return std::unexpected(TableError{
            .code = TableErrorCode::UnsupportedFormat,
            .system_key = {},
            .category = {},
            .validation = std::nullopt,
            .detail = path.string(),
        });
    }

    return std::move(data).and_then([](CoefficientTableData d) {
        return CoefficientTable::create(std::move(d));
    });
}

}  // namespace sash
