// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace sash {

/// CRC64-ECMA-182 checksum (reflected polynomial 0xC96C5795D7870F42,
/// initial value 0, no final XOR). Guards persisted coefficient grids.
class CRC64 {
public:
    /// Checksum of the in-memory representation of a double sequence
    static uint64_t compute(std::span<const double> values);

    /// Checksum of a raw byte sequence
    static uint64_t compute_bytes(std::span<const uint8_t> bytes);

    /// Continue a running checksum with more bytes
    static uint64_t update(uint64_t crc, std::span<const uint8_t> bytes);
};

}  // namespace sash
