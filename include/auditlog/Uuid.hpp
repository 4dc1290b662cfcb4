#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace auditlog {

// 128-bit identifier in canonical 8-4-4-4-12 hex form.
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    // The all-zero tag written for entries that have no actor.
    static Uuid nil() { return Uuid{}; }

    // Random version-4 UUID.
    static Uuid random();

    static std::optional<Uuid> parse(std::string_view text);

    std::string str() const;
    bool isNil() const;

    bool operator==(const Uuid& other) const { return bytes == other.bytes; }
    bool operator!=(const Uuid& other) const { return bytes != other.bytes; }
};

} // namespace auditlog
