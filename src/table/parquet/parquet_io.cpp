// SPDX-License-Identifier: MIT
#include "src/table/parquet/parquet_io.hpp"
#include "src/support/crc64.hpp"
#include "src/support/sash_trace.h"

#include <arrow/api.h>
#include <arrow/builder.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sash {

namespace {

// ============================================================================
// Constants
// ============================================================================

constexpr const char* FORMAT_VERSION = "1.0";

// ============================================================================
// Helpers
// ============================================================================

TableError serialization_error(std::string detail = {}) {
    return TableError{
        .code = TableErrorCode::SerializationFailed,
        .system_key = {},
        .category = {},
        .validation = std::nullopt,
        .detail = std::move(detail),
    };
}

/// Check an Arrow Status and return TableError on failure.
#define SASH_ARROW_CHECK(expr)                    \
    do {                                          \
        auto _s = (expr);                         \
        if (!_s.ok()) {                           \
            return std::unexpected(               \
                serialization_error(_s.ToString())); \
        }                                         \
    } while (0)

/// Check an Arrow Result and assign; return TableError on failure.
#define SASH_ARROW_ASSIGN(var, expr)              \
    auto _result_##var = (expr);                  \
    if (!_result_##var.ok()) {                    \
        return std::unexpected(                   \
            serialization_error(_result_##var.status().ToString())); \
    }                                             \
    auto var = std::move(_result_##var).ValueUnsafe()

std::shared_ptr<arrow::Schema> make_parquet_schema(
    const std::shared_ptr<arrow::KeyValueMetadata>& metadata) {

    auto list_double = arrow::list(arrow::float64());

    auto fields = arrow::FieldVector{
        arrow::field("system_key", arrow::utf8()),
        arrow::field("category", arrow::utf8()),
        arrow::field("widths", list_double),
        arrow::field("heights", list_double),
        arrow::field("values", list_double),
        arrow::field("checksum_values", arrow::int64()),
    };

    return arrow::schema(fields, metadata);
}

arrow::Status append_double_list(
    arrow::ListBuilder& list_builder,
    const std::vector<double>& vec) {

    ARROW_RETURN_NOT_OK(list_builder.Append());
    auto& value_builder =
        static_cast<arrow::DoubleBuilder&>(*list_builder.value_builder());
    return value_builder.AppendValues(vec);
}

std::vector<double> read_double_list(
    const std::shared_ptr<arrow::ListArray>& list_arr, int64_t row) {

    auto values_arr =
        std::static_pointer_cast<arrow::DoubleArray>(list_arr->values());

    int32_t start = list_arr->value_offset(row);
    int32_t end = list_arr->value_offset(row + 1);

    std::vector<double> result;
    result.reserve(static_cast<size_t>(end - start));
    for (int32_t j = start; j < end; ++j) {
        result.push_back(values_arr->Value(j));
    }
    return result;
}

}  // anonymous namespace

// ============================================================================
// write_parquet
// ============================================================================

std::expected<void, TableError>
write_parquet(const CoefficientTableData& data,
              const std::filesystem::path& path,
              const ParquetWriteOptions& opts) {

    auto pool = arrow::default_memory_pool();

    auto metadata = std::make_shared<arrow::KeyValueMetadata>();
    metadata->Append("sash.format_version", FORMAT_VERSION);
    metadata->Append("sash.n_grids", std::to_string(data.entries.size()));

    auto schema = make_parquet_schema(metadata);

    arrow::StringBuilder system_key_b(pool);
    arrow::StringBuilder category_b(pool);
    arrow::ListBuilder widths_b(pool,
        std::make_shared<arrow::DoubleBuilder>(pool));
    arrow::ListBuilder heights_b(pool,
        std::make_shared<arrow::DoubleBuilder>(pool));
    arrow::ListBuilder values_b(pool,
        std::make_shared<arrow::DoubleBuilder>(pool));
    arrow::Int64Builder checksum_b(pool);

    for (const auto& entry : data.entries) {
        SASH_ARROW_CHECK(system_key_b.Append(entry.system_key));
        SASH_ARROW_CHECK(category_b.Append(entry.category));
        SASH_ARROW_CHECK(append_double_list(widths_b, entry.widths));
        SASH_ARROW_CHECK(append_double_list(heights_b, entry.heights));
        SASH_ARROW_CHECK(append_double_list(values_b, entry.values));

        uint64_t crc = CRC64::compute(entry.values);
        SASH_ARROW_CHECK(checksum_b.Append(static_cast<int64_t>(crc)));
    }

    std::shared_ptr<arrow::Array> system_key_a, category_a, widths_a,
        heights_a, values_a, checksum_a;

    SASH_ARROW_CHECK(system_key_b.Finish(&system_key_a));
    SASH_ARROW_CHECK(category_b.Finish(&category_a));
    SASH_ARROW_CHECK(widths_b.Finish(&widths_a));
    SASH_ARROW_CHECK(heights_b.Finish(&heights_a));
    SASH_ARROW_CHECK(values_b.Finish(&values_a));
    SASH_ARROW_CHECK(checksum_b.Finish(&checksum_a));

    auto table = arrow::Table::Make(schema, {
        system_key_a, category_a, widths_a, heights_a, values_a, checksum_a,
    });

    auto props_builder = parquet::WriterProperties::Builder();
    switch (opts.compression) {
        case ParquetCompression::NONE:
            props_builder.compression(arrow::Compression::UNCOMPRESSED);
            break;
        case ParquetCompression::SNAPPY:
            props_builder.compression(arrow::Compression::SNAPPY);
            break;
        case ParquetCompression::ZSTD:
            props_builder.compression(arrow::Compression::ZSTD);
            break;
    }
    auto writer_props = props_builder.build();

    auto arrow_props = parquet::ArrowWriterProperties::Builder()
        .store_schema()->build();

    SASH_ARROW_ASSIGN(outfile,
        arrow::io::FileOutputStream::Open(path.string()));

    SASH_ARROW_CHECK(parquet::arrow::WriteTable(
        *table, pool, outfile, /*chunk_size=*/1024,
        writer_props, arrow_props));

    SASH_ARROW_CHECK(outfile->Close());
    return {};
}

// ============================================================================
// read_parquet
// ============================================================================

std::expected<CoefficientTableData, TableError>
read_parquet(const std::filesystem::path& path) {
    SASH_TRACE_TABLE_LOAD_START(SASH_SOURCE_PARQUET);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(TableError{
            .code = TableErrorCode::FileNotFound,
            .system_key = {},
            .category = {},
            .validation = std::nullopt,
            .detail = path.string(),
        });
    }

    auto pool = arrow::default_memory_pool();

    SASH_ARROW_ASSIGN(infile,
        arrow::io::ReadableFile::Open(path.string()));

    SASH_ARROW_ASSIGN(reader,
        parquet::arrow::OpenFile(infile, pool));

    std::shared_ptr<arrow::Table> table;
    SASH_ARROW_CHECK(reader->ReadTable(&table));

    // ---- File-level metadata ----
    auto kv = table->schema()->metadata();
    if (!kv) {
        return std::unexpected(serialization_error("missing file metadata"));
    }
    {
        auto idx = kv->FindKey("sash.format_version");
        if (idx < 0 || kv->value(idx) != FORMAT_VERSION) {
            return std::unexpected(serialization_error("unsupported format version"));
        }
    }

    CoefficientTableData data;
    if (table->num_rows() == 0) {
        return data;
    }

    // Combine chunks into a single array per column and check its type
    auto get_array = [&](const std::string& name, arrow::Type::type type)
        -> std::expected<std::shared_ptr<arrow::Array>, TableError> {
        auto col = table->GetColumnByName(name);
        if (!col) {
            return std::unexpected(serialization_error("missing column " + name));
        }
        std::shared_ptr<arrow::Array> arr;
        if (col->num_chunks() == 1) {
            arr = col->chunk(0);
        } else {
            auto combined = arrow::Concatenate(col->chunks(), pool);
            if (!combined.ok()) {
                return std::unexpected(serialization_error(combined.status().ToString()));
            }
            arr = *combined;
        }
        if (arr->type_id() != type) {
            return std::unexpected(serialization_error("unexpected type for column " + name));
        }
        return arr;
    };

    auto system_key_res = get_array("system_key", arrow::Type::STRING);
    if (!system_key_res) return std::unexpected(system_key_res.error());
    auto category_res = get_array("category", arrow::Type::STRING);
    if (!category_res) return std::unexpected(category_res.error());
    auto widths_res = get_array("widths", arrow::Type::LIST);
    if (!widths_res) return std::unexpected(widths_res.error());
    auto heights_res = get_array("heights", arrow::Type::LIST);
    if (!heights_res) return std::unexpected(heights_res.error());
    auto values_res = get_array("values", arrow::Type::LIST);
    if (!values_res) return std::unexpected(values_res.error());
    auto checksum_res = get_array("checksum_values", arrow::Type::INT64);
    if (!checksum_res) return std::unexpected(checksum_res.error());

    auto system_key_a = std::static_pointer_cast<arrow::StringArray>(*system_key_res);
    auto category_a = std::static_pointer_cast<arrow::StringArray>(*category_res);
    auto widths_a = std::static_pointer_cast<arrow::ListArray>(*widths_res);
    auto heights_a = std::static_pointer_cast<arrow::ListArray>(*heights_res);
    auto values_a = std::static_pointer_cast<arrow::ListArray>(*values_res);
    auto checksum_a = std::static_pointer_cast<arrow::Int64Array>(*checksum_res);

    int64_t n_rows = table->num_rows();
    data.entries.reserve(static_cast<size_t>(n_rows));

    for (int64_t i = 0; i < n_rows; ++i) {
        CoefficientTableData::Entry entry{
            .system_key = system_key_a->GetString(i),
            .category = category_a->GetString(i),
            .widths = read_double_list(widths_a, i),
            .heights = read_double_list(heights_a, i),
            .values = read_double_list(values_a, i),
        };

        uint64_t stored = static_cast<uint64_t>(checksum_a->Value(i));
        if (CRC64::compute(entry.values) != stored) {
            return std::unexpected(TableError{
                .code = TableErrorCode::ChecksumMismatch,
                .system_key = entry.system_key,
                .category = entry.category,
                .validation = std::nullopt,
                .detail = {},
            });
        }
        data.entries.push_back(std::move(entry));
    }

    return data;
}

}  // namespace sash
