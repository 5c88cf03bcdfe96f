#include "core/types.hpp"

#include <sodium.h>

namespace lanlog {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Uuid Uuid::generate() {
    Bytes bytes;
    randombytes_buf(bytes.data(), bytes.size());

    // Version 4, RFC 4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    return Uuid(bytes);
}

std::optional<Uuid> Uuid::parse(std::string_view str) {
    std::string clean;
    clean.reserve(32);
    for (char c : str) {
        if (c != '-') clean += c;
    }
    if (clean.size() != 32) return std::nullopt;

    Bytes bytes;
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        const int hi = hex_value(clean[i * 2]);
        const int lo = hex_value(clean[i * 2 + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out += '-';
        }
        out += kDigits[bytes_[i] >> 4];
        out += kDigits[bytes_[i] & 0x0F];
    }
    return out;
}

} // namespace lanlog
