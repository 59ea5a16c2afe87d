// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "src/support/error_types.hpp"
#include "src/table/grid.hpp"
#include "src/table/serialization/coefficient_table_data.hpp"

namespace sash {

/// Categories of one product system, ordered by name
using SystemEntry = std::map<std::string, Grid, std::less<>>;

/// All systems, ordered by key
using SystemMap = std::map<std::string, SystemEntry, std::less<>>;

/// Immutable, process-wide lookup table: system key -> category -> Grid
///
/// Built once through create(); there is no way to mutate a table after
/// construction, a changed dataset means building a new table. Instances
/// are shared as std::shared_ptr<const CoefficientTable> and are safe to
/// read from any number of threads.
///
/// Example:
/// @code
///   auto table = load_coefficient_table("coefficients.json");
///   if (!table) {
///       std::cerr << describe(table.error()) << "\n";
///       return 1;
///   }
///   const Grid* grid = (*table)->find_grid("uni1_zebra", "E");
/// @endcode
class CoefficientTable {
public:
    /// Validate every entry and build the table
    ///
    /// Fails on the first violated invariant: empty or non-monotonic axis,
    /// non-finite value, values/axes shape mismatch, empty key, or a
    /// (system, category) pair defined twice.
    [[nodiscard]] static std::expected<std::shared_ptr<const CoefficientTable>, TableError>
    create(CoefficientTableData data);

    /// Known system keys, sorted
    [[nodiscard]] std::vector<std::string> systems() const;

    /// Category names of a system, sorted; empty when the system is unknown
    [[nodiscard]] std::vector<std::string> categories(std::string_view system_key) const;

    [[nodiscard]] const SystemEntry* find_system(std::string_view system_key) const;

    /// Read-only view of the whole table
    [[nodiscard]] const SystemMap& systems_view() const noexcept { return systems_; }

    /// Grid for (system, category), or nullptr when either is absent
    [[nodiscard]] const Grid* find_grid(std::string_view system_key,
                                        std::string_view category) const;

    /// Width/height extent of a grid
    [[nodiscard]] std::optional<GridRanges> ranges(std::string_view system_key,
                                                   std::string_view category) const;

    [[nodiscard]] size_t system_count() const noexcept { return systems_.size(); }
    [[nodiscard]] size_t grid_count() const noexcept { return grid_count_; }

    /// Flatten back into serializable records (system, then category order)
    [[nodiscard]] CoefficientTableData to_data() const;

private:
    CoefficientTable() = default;

    SystemMap systems_;
    size_t grid_count_ = 0;
};

}  // namespace sash
