#include "auditlog/Uuid.hpp"

#include <mutex>
#include <random>

namespace auditlog {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Uuid Uuid::random() {
    static std::mutex mtx;
    static std::mt19937_64 rng{std::random_device{}()};

    Uuid id;
    {
        std::lock_guard<std::mutex> lk(mtx);
        for (size_t i = 0; i < id.bytes.size(); i += 8) {
            uint64_t word = rng();
            for (size_t b = 0; b < 8; ++b) {
                id.bytes[i + b] = static_cast<uint8_t>((word >> (8 * b)) & 0xFFu);
            }
        }
    }
    id.bytes[6] = static_cast<uint8_t>((id.bytes[6] & 0x0Fu) | 0x40u);
    id.bytes[8] = static_cast<uint8_t>((id.bytes[8] & 0x3Fu) | 0x80u);
    return id;
}

std::optional<Uuid> Uuid::parse(std::string_view text) {
    if (text.size() != 36) return std::nullopt;
    Uuid id;
    size_t out = 0;
    for (size_t i = 0; i < text.size();) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') return std::nullopt;
            ++i;
            continue;
        }
        int hi = hexValue(text[i]);
        int lo = hexValue(text[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        id.bytes[out++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return id;
}

std::string Uuid::str() const {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(digits[bytes[i] >> 4]);
        out.push_back(digits[bytes[i] & 0x0Fu]);
    }
    return out;
}

bool Uuid::isNil() const {
    for (auto b : bytes) {
        if (b != 0) return false;
    }
    return true;
}

} // namespace auditlog
