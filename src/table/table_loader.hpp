// SPDX-License-Identifier: MIT
#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include "src/support/error_types.hpp"
#include "src/table/coefficient_table.hpp"

namespace sash {

/// Load and validate a coefficient dataset, picking the reader by extension
/// (".json" or ".parquet").
///
/// This is the startup integrity check: any error means the process must not
/// serve coefficients from this dataset.
[[nodiscard]] std::expected<std::shared_ptr<const CoefficientTable>, TableError>
load_coefficient_table(const std::filesystem::path& path);

}  // namespace sash
