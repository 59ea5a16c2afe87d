// SPDX-License-Identifier: MIT

// Parquet persistence tests: write_parquet -> read_parquet -> CoefficientTable,
// checksum verification and compression variants.

#include <gtest/gtest.h>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "src/table/coefficient_table.hpp"
#include "src/table/parquet/parquet_io.hpp"
#include "src/table/table_loader.hpp"
#include "tests/common/coefficient_fixtures.hpp"

namespace sash {
namespace {

// ===========================================================================
// Test fixture: manages temp file creation and cleanup
// ===========================================================================

class ParquetIOTest : public ::testing::Test {
protected:
    std::filesystem::path temp_path_;

    void SetUp() override {
        temp_path_ = std::filesystem::temp_directory_path() /
                     ("sash_parquet_test_" +
                      std::to_string(::testing::UnitTest::GetInstance()
                                         ->current_test_info()->line()) +
                      ".parquet");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(temp_path_, ec);
    }
};

void expect_same_data(const CoefficientTableData& a, const CoefficientTableData& b) {
    ASSERT_EQ(a.entries.size(), b.entries.size());
    for (size_t i = 0; i < a.entries.size(); ++i) {
        SCOPED_TRACE(a.entries[i].system_key + "/" + a.entries[i].category);
        EXPECT_EQ(a.entries[i].system_key, b.entries[i].system_key);
        EXPECT_EQ(a.entries[i].category, b.entries[i].category);
        EXPECT_EQ(a.entries[i].widths, b.entries[i].widths);
        EXPECT_EQ(a.entries[i].heights, b.entries[i].heights);
        EXPECT_EQ(a.entries[i].values, b.entries[i].values);
    }
}

// ===========================================================================
// Write / read
// ===========================================================================

TEST_F(ParquetIOTest, WrittenTableReadsBackIdentically) {
    auto table = testing::sample_table();
    ASSERT_NE(table, nullptr);
    auto data = table->to_data();

    auto written = write_parquet(data, temp_path_);
    ASSERT_TRUE(written.has_value()) << written.error();

    auto loaded = read_parquet(temp_path_);
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    expect_same_data(data, *loaded);
}

TEST_F(ParquetIOTest, CompressionVariants) {
    auto data = testing::sample_data();
    for (auto compression : {ParquetCompression::NONE,
                             ParquetCompression::SNAPPY,
                             ParquetCompression::ZSTD}) {
        SCOPED_TRACE(static_cast<int>(compression));
        auto written = write_parquet(data, temp_path_, {.compression = compression});
        ASSERT_TRUE(written.has_value()) << written.error();

        auto loaded = read_parquet(temp_path_);
        ASSERT_TRUE(loaded.has_value()) << loaded.error();
        expect_same_data(data, *loaded);
    }
}

TEST_F(ParquetIOTest, EmptyDatasetRoundTrips) {
    auto written = write_parquet(CoefficientTableData{}, temp_path_);
    ASSERT_TRUE(written.has_value()) << written.error();

    auto loaded = read_parquet(temp_path_);
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    EXPECT_TRUE(loaded->entries.empty());
}

TEST_F(ParquetIOTest, LoaderPicksParquetByExtension) {
    auto written = write_parquet(testing::sample_data(), temp_path_);
    ASSERT_TRUE(written.has_value()) << written.error();

    auto table = load_coefficient_table(temp_path_);
    ASSERT_TRUE(table.has_value()) << table.error();
    EXPECT_EQ((*table)->grid_count(), 4u);

    const Grid* grid = (*table)->find_grid("roll_std", "B");
    ASSERT_NE(grid, nullptr);
    EXPECT_DOUBLE_EQ(grid->value(1, 1), 4.0);
}

// ===========================================================================
// Failure cases
// ===========================================================================

TEST_F(ParquetIOTest, MissingFile) {
    auto loaded = read_parquet(temp_path_.parent_path() / "sash_does_not_exist.parquet");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, TableErrorCode::FileNotFound);
}

TEST_F(ParquetIOTest, ChecksumMismatchIsDetected) {
    // Hand-build a file whose stored checksum does not match its values
    auto pool = arrow::default_memory_pool();
    auto metadata = std::make_shared<arrow::KeyValueMetadata>();
    metadata->Append("sash.format_version", "1.0");

    auto list_double = arrow::list(arrow::float64());
    auto schema = arrow::schema({
        arrow::field("system_key", arrow::utf8()),
        arrow::field("category", arrow::utf8()),
        arrow::field("widths", list_double),
        arrow::field("heights", list_double),
        arrow::field("values", list_double),
        arrow::field("checksum_values", arrow::int64()),
    }, metadata);

    arrow::StringBuilder system_b(pool), category_b(pool);
    arrow::ListBuilder widths_b(pool, std::make_shared<arrow::DoubleBuilder>(pool));
    arrow::ListBuilder heights_b(pool, std::make_shared<arrow::DoubleBuilder>(pool));
    arrow::ListBuilder values_b(pool, std::make_shared<arrow::DoubleBuilder>(pool));
    arrow::Int64Builder checksum_b(pool);

    auto append_list = [](arrow::ListBuilder& b, const std::vector<double>& v) {
        ASSERT_TRUE(b.Append().ok());
        ASSERT_TRUE(static_cast<arrow::DoubleBuilder&>(*b.value_builder()).AppendValues(v).ok());
    };

    ASSERT_TRUE(system_b.Append("sys").ok());
    ASSERT_TRUE(category_b.Append("A").ok());
    append_list(widths_b, {1.0});
    append_list(heights_b, {1.0});
    append_list(values_b, {42.0});
    ASSERT_TRUE(checksum_b.Append(12345).ok());

    std::shared_ptr<arrow::Array> a0, a1, a2, a3, a4, a5;
    ASSERT_TRUE(system_b.Finish(&a0).ok());
    ASSERT_TRUE(category_b.Finish(&a1).ok());
    ASSERT_TRUE(widths_b.Finish(&a2).ok());
    ASSERT_TRUE(heights_b.Finish(&a3).ok());
    ASSERT_TRUE(values_b.Finish(&a4).ok());
    ASSERT_TRUE(checksum_b.Finish(&a5).ok());

    auto table = arrow::Table::Make(schema, {a0, a1, a2, a3, a4, a5});
    auto outfile = arrow::io::FileOutputStream::Open(temp_path_.string());
    ASSERT_TRUE(outfile.ok());
    auto arrow_props = parquet::ArrowWriterProperties::Builder().store_schema()->build();
    ASSERT_TRUE(parquet::arrow::WriteTable(*table, pool, *outfile, 1024,
                                           parquet::default_writer_properties(),
                                           arrow_props).ok());
    ASSERT_TRUE((*outfile)->Close().ok());

    auto loaded = read_parquet(temp_path_);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, TableErrorCode::ChecksumMismatch);
    EXPECT_EQ(loaded.error().system_key, "sys");
    EXPECT_EQ(loaded.error().category, "A");
}

TEST_F(ParquetIOTest, InvalidGridIsRejectedAtTableBuild) {
    CoefficientTableData data;
    auto entry = testing::small_entry("sys", "A");
    entry.heights = {2.0, 1.0};
    data.entries.push_back(entry);

    ASSERT_TRUE(write_parquet(data, temp_path_).has_value());

    auto table = load_coefficient_table(temp_path_);
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, TableErrorCode::InvalidGrid);
}

}  // namespace
}  // namespace sash
