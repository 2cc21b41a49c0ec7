// =============================================================================
// types.cpp - Address, Hash and Amount conversions
// =============================================================================

#include "zap/types.hpp"
#include <stdexcept>

namespace zap {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

template <size_t N>
std::string bytes_to_hex(const std::array<uint8_t, N>& bytes) {
    std::string out = "0x";
    out.reserve(2 + N * 2);
    for (uint8_t b : bytes) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

template <size_t N>
std::array<uint8_t, N> bytes_from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != N * 2) {
        throw std::invalid_argument("expected " + std::to_string(N * 2) +
                                    " hex digits, got " + std::to_string(hex.size()));
    }

    std::array<uint8_t, N> out{};
    for (size_t i = 0; i < N; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in: " + std::string(hex));
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

} // namespace

std::string to_hex(const Address& addr) {
    return bytes_to_hex(addr);
}

std::string to_hex(const Hash& hash) {
    return bytes_to_hex(hash);
}

Address address_from_hex(std::string_view hex) {
    return bytes_from_hex<20>(hex);
}

Hash hash_from_hex(std::string_view hex) {
    return bytes_from_hex<32>(hex);
}

Amount amount_from_string(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("empty amount");
    }
    bool hex = text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
    for (size_t i = hex ? 2 : 0; i < text.size(); ++i) {
        bool ok = hex ? hex_value(text[i]) >= 0 : (text[i] >= '0' && text[i] <= '9');
        if (!ok) {
            throw std::invalid_argument("invalid amount: " + std::string(text));
        }
    }
    // cpp_int parses both decimal and 0x-prefixed strings; out of range raises
    const std::string digits(text);
    return Amount(digits.c_str());
}

} // namespace zap
