// SPDX-License-Identifier: MIT
#include "src/support/crc64.hpp"

#include <array>

namespace sash {

namespace {

constexpr uint64_t POLY = 0xC96C5795D7870F42ULL;

constexpr std::array<uint64_t, 256> make_table() {
    std::array<uint64_t, 256> table{};
    for (size_t i = 0; i < table.size(); ++i) {
        uint64_t crc = i;
        for (size_t j = 0; j < 8; ++j) {
            crc = (crc & 1) ? (crc >> 1) ^ POLY : crc >> 1;
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto TABLE = make_table();

}  // namespace

uint64_t CRC64::update(uint64_t crc, std::span<const uint8_t> bytes) {
    for (uint8_t b : bytes) {
        crc = (crc >> 8) ^ TABLE[static_cast<uint8_t>(crc ^ b)];
    }
    return crc;
}

uint64_t CRC64::compute_bytes(std::span<const uint8_t> bytes) {
    return update(0x0ULL, bytes);
}

uint64_t CRC64::compute(std::span<const double> values) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(values.data());
    return compute_bytes({bytes, values.size_bytes()});
}

}  // namespace sash
