// SPDX-License-Identifier: MIT
#pragma once

#include <string>
#include <vector>

namespace sash {

/// Serializable representation of a coefficient table.
/// Plain vectors, no I/O dependencies and no validation: every loader
/// produces this and hands it to CoefficientTable::create().
struct CoefficientTableData {
    struct Entry {
        std::string system_key;
        std::string category;
        std::vector<double> widths;
        std::vector<double> heights;
        std::vector<double> values;  // width-major, widths.size() * heights.size()
    };
    std::vector<Entry> entries;
};

}  // namespace sash
