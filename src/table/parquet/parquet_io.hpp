// SPDX-License-Identifier: MIT
#pragma once

#include "src/support/error_types.hpp"
#include "src/table/serialization/coefficient_table_data.hpp"

#include <expected>
#include <filesystem>

namespace sash {

enum class ParquetCompression {
    NONE,
    SNAPPY,
    ZSTD,
};

struct ParquetWriteOptions {
    ParquetCompression compression = ParquetCompression::ZSTD;
};

/// Write coefficient table data to a Parquet file, one row per grid.
[[nodiscard]] std::expected<void, TableError>
write_parquet(const CoefficientTableData& data,
              const std::filesystem::path& path,
              const ParquetWriteOptions& opts = {});

/// Read coefficient table data from a Parquet file.
/// Rejects files with an unknown format version or a values checksum that
/// does not match.
[[nodiscard]] std::expected<CoefficientTableData, TableError>
read_parquet(const std::filesystem::path& path);

}  // namespace sash
