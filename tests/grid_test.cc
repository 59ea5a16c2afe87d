// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include "src/table/grid.hpp"

using namespace sash;

TEST(GridTest, StoresValuesWidthMajor) {
    auto grid = Grid::create({1.0, 2.0, 3.0}, {1.0, 2.0},
                             {10.0, 11.0, 20.0, 21.0, 30.0, 31.0});
    ASSERT_TRUE(grid.has_value());

    EXPECT_EQ(grid->width_count(), 3u);
    EXPECT_EQ(grid->height_count(), 2u);
    EXPECT_DOUBLE_EQ(grid->value(0, 0), 10.0);
    EXPECT_DOUBLE_EQ(grid->value(1, 0), 20.0);
    EXPECT_DOUBLE_EQ(grid->value(2, 1), 31.0);

    auto row = grid->row(1);
    ASSERT_EQ(row.size(), 2u);
    EXPECT_DOUBLE_EQ(row[0], 20.0);
    EXPECT_DOUBLE_EQ(row[1], 21.0);
}

TEST(GridTest, FromRowsMatchesFlatLayout) {
    auto grid = Grid::from_rows({1.0, 2.0}, {0.5, 1.0, 1.5},
                                {{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}});
    ASSERT_TRUE(grid.has_value());
    EXPECT_DOUBLE_EQ(grid->value(1, 2), 6.0);
    EXPECT_DOUBLE_EQ(grid->value(0, 1), 2.0);
}

TEST(GridTest, SinglePointAxesAreValid) {
    auto grid = Grid::create({1.2}, {2.0}, {7.5});
    ASSERT_TRUE(grid.has_value());
    EXPECT_DOUBLE_EQ(grid->value(0, 0), 7.5);
}

TEST(GridTest, ReportsRanges) {
    auto grid = Grid::create({0.4, 1.0, 2.2}, {0.8, 3.0}, {1, 2, 3, 4, 5, 6});
    ASSERT_TRUE(grid.has_value());
    auto ranges = grid->ranges();
    EXPECT_DOUBLE_EQ(ranges.width.min, 0.4);
    EXPECT_DOUBLE_EQ(ranges.width.max, 2.2);
    EXPECT_DOUBLE_EQ(ranges.height.min, 0.8);
    EXPECT_DOUBLE_EQ(ranges.height.max, 3.0);
}

// ===========================================================================
// Invariant violations
// ===========================================================================

TEST(GridTest, RejectsEmptyWidthAxis) {
    auto grid = Grid::create({}, {1.0}, {});
    ASSERT_FALSE(grid.has_value());
    EXPECT_EQ(grid.error().code, ValidationErrorCode::EmptyAxis);
    EXPECT_EQ(grid.error().index, static_cast<size_t>(GridAxis::Width));
}

TEST(GridTest, RejectsEmptyHeightAxis) {
    auto grid = Grid::create({1.0}, {}, {});
    ASSERT_FALSE(grid.has_value());
    EXPECT_EQ(grid.error().code, ValidationErrorCode::EmptyAxis);
    EXPECT_EQ(grid.error().index, static_cast<size_t>(GridAxis::Height));
}

TEST(GridTest, RejectsRepeatedBreakpoint) {
    auto grid = Grid::create({1.0, 2.0, 2.0}, {1.0}, {1, 2, 3});
    ASSERT_FALSE(grid.has_value());
    EXPECT_EQ(grid.error().code, ValidationErrorCode::UnsortedAxis);
    EXPECT_EQ(grid.error().index, 2u);
}

TEST(GridTest, RejectsDecreasingAxis) {
    auto grid = Grid::create({1.0, 2.0}, {3.0, 1.0}, {1, 2, 3, 4});
    ASSERT_FALSE(grid.has_value());
    EXPECT_EQ(grid.error().code, ValidationErrorCode::UnsortedAxis);
    EXPECT_DOUBLE_EQ(grid.error().value, 1.0);
}

TEST(GridTest, RejectsShapeMismatch) {
    auto grid = Grid::create({1.0, 2.0}, {1.0, 2.0}, {1, 2, 3});
    ASSERT_FALSE(grid.has_value());
    EXPECT_EQ(grid.error().code, ValidationErrorCode::ShapeMismatch);
    EXPECT_EQ(grid.error().index, 3u);
    EXPECT_DOUBLE_EQ(grid.error().value, 4.0);
}

TEST(GridTest, RejectsRaggedRows) {
    auto grid = Grid::from_rows({1.0, 2.0}, {1.0, 2.0}, {{1.0, 2.0}, {3.0}});
    ASSERT_FALSE(grid.has_value());
    EXPECT_EQ(grid.error().code, ValidationErrorCode::ShapeMismatch);
}

TEST(GridTest, RejectsNonFiniteBreakpoint) {
    auto grid = Grid::create({1.0, std::numeric_limits<double>::quiet_NaN()}, {1.0}, {1, 2});
    ASSERT_FALSE(grid.has_value());
    EXPECT_EQ(grid.error().code, ValidationErrorCode::NonFiniteValue);
}

TEST(GridTest, RejectsNonFiniteValue) {
    auto grid = Grid::create({1.0, 2.0}, {1.0},
                             {1.0, std::numeric_limits<double>::infinity()});
    ASSERT_FALSE(grid.has_value());
    EXPECT_EQ(grid.error().code, ValidationErrorCode::NonFiniteValue);
    EXPECT_EQ(grid.error().index, 1u);
}
