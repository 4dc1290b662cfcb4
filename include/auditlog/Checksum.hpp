#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace auditlog {

namespace detail {

constexpr std::array<uint32_t, 256> makeCrcTable() {
    std::array<uint32_t, 256> table{};
    for (uint32_t n = 0; n < 256; ++n) {
        uint32_t c = n;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1u) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
        }
        table[n] = c;
    }
    return table;
}

inline constexpr std::array<uint32_t, 256> kCrcTable = makeCrcTable();

} // namespace detail

// IEEE CRC-32 of one store record payload.
inline uint32_t crc32(std::string_view data) {
    uint32_t crc = 0xFFFFFFFFu;
    for (unsigned char b : data) {
        crc = detail::kCrcTable[(crc ^ b) & 0xFFu] ^ (crc >> 8);
    }
    return ~crc;
}

} // namespace auditlog
