// SPDX-License-Identifier: MIT
#include "src/table/coefficient_table.hpp"
#include "src/support/sash_trace.h"

namespace sash {

namespace {

TableError invalid_entry(const CoefficientTableData::Entry& entry,
                         ValidationError validation) {
    return TableError{
        .code = TableErrorCode::InvalidGrid,
        .system_key = entry.system_key,
        .category = entry.category,
        .validation = validation,
        .detail = {},
    };
}

}  // namespace

std::expected<std::shared_ptr<const CoefficientTable>, TableError>
CoefficientTable::create(CoefficientTableData data) {
    // Private constructor: std::make_shared cannot reach it
    std::shared_ptr<CoefficientTable> table(new CoefficientTable());

    for (auto& entry : data.entries) {
        if (entry.system_key.empty() || entry.category.empty()) {
            auto err = invalid_entry(entry, ValidationError(ValidationErrorCode::EmptyKey));
            SASH_TRACE_TABLE_LOAD_FAILED(static_cast<int>(err.code),
                                         entry.system_key.c_str(), entry.category.c_str());
            return std::unexpected(std::move(err));
        }

        auto grid = Grid::create(std::move(entry.widths),
                                 std::move(entry.heights),
                                 std::move(entry.values));
        if (!grid) {
            auto err = invalid_entry(entry, grid.error());
            SASH_TRACE_TABLE_LOAD_FAILED(static_cast<int>(err.code),
                                         entry.system_key.c_str(), entry.category.c_str());
            return std::unexpected(std::move(err));
        }

        auto& system = table->systems_[entry.system_key];
        auto [it, inserted] = system.emplace(entry.category, std::move(*grid));
        if (!inserted) {
            auto err = invalid_entry(entry, ValidationError(ValidationErrorCode::DuplicateEntry));
            SASH_TRACE_TABLE_LOAD_FAILED(static_cast<int>(err.code),
                                         entry.system_key.c_str(), entry.category.c_str());
            return std::unexpected(std::move(err));
        }
        ++table->grid_count_;
    }

    SASH_TRACE_TABLE_LOAD_DONE(table->systems_.size(), table->grid_count_);
    return std::shared_ptr<const CoefficientTable>(std::move(table));
}

std::vector<std::string> CoefficientTable::systems() const {
    std::vector<std::string> keys;
    keys.reserve(systems_.size());
    for (const auto& [key, entry] : systems_) {
        keys.push_back(key);
    }
    return keys;
}

std::vector<std::string> CoefficientTable::categories(std::string_view system_key) const {
    std::vector<std::string> names;
    if (const auto* system = find_system(system_key)) {
        names.reserve(system->size());
        for (const auto& [name, grid] : *system) {
            names.push_back(name);
        }
    }
    return names;
}

const SystemEntry* CoefficientTable::find_system(std::string_view system_key) const {
    auto it = systems_.find(system_key);
    return it == systems_.end() ? nullptr : &it->second;
}

const Grid* CoefficientTable::find_grid(std::string_view system_key,
                                        std::string_view category) const {
    const auto* system = find_system(system_key);
    if (!system) return nullptr;
    auto it = system->find(category);
    return it == system->end() ? nullptr : &it->second;
}

std::optional<GridRanges> CoefficientTable::ranges(std::string_view system_key,
                                                   std::string_view category) const {
    if (const auto* grid = find_grid(system_key, category)) {
        return grid->ranges();
    }
    return std::nullopt;
}

CoefficientTableData CoefficientTable::to_data() const {
    CoefficientTableData data;
    data.entries.reserve(grid_count_);
    for (const auto& [key, system] : systems_) {
        for (const auto& [name, grid] : system) {
            data.entries.push_back(CoefficientTableData::Entry{
                .system_key = key,
                .category = name,
                .widths = grid.widths(),
                .heights = grid.heights(),
                .values = {grid.values().begin(), grid.values().end()},
            });
        }
    }
    return data;
}

}  // namespace sash
