#ifndef ZAP_TYPES_HPP
#define ZAP_TYPES_HPP

#include <cstdint>
#include <array>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace zap {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

// 32-byte digest (salts, init code hashes)
using Hash = std::array<uint8_t, 32>;

// Null address (pool not found, burn target for locked liquidity)
inline constexpr Address NULL_ADDRESS{};

namespace addresses {

// Build an address whose low 8 bytes hold `n` (big-endian)
constexpr Address from_index(uint64_t n) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_null(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

} // namespace addresses

// Hex helpers ("0x" prefixed, lower case)
std::string to_hex(const Address& addr);
std::string to_hex(const Hash& hash);

// Parse "0x..." (prefix optional). Throws std::invalid_argument on bad length or digit.
Address address_from_hex(std::string_view hex);
Hash hash_from_hex(std::string_view hex);

// =============================================================================
// Amounts (unsigned 256-bit, checked)
// =============================================================================

// Overflow and underflow raise std::overflow_error / std::range_error
// instead of wrapping.
using Amount = boost::multiprecision::checked_uint256_t;

// Unlimited allowance marker
inline const Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

// Parse a decimal (or 0x-prefixed hex) amount string
Amount amount_from_string(std::string_view text);

inline std::string to_string(const Amount& amount) { return amount.str(); }

// Seconds since epoch, as seen by the execution environment
using Timestamp = uint64_t;

// =============================================================================
// Pool Constants
// =============================================================================

namespace bps {
constexpr uint32_t DENOMINATOR = 10000;  // 100%
}

namespace pool_fee {
// Fixed 0.3% exchange fee, expressed per mille
constexpr uint32_t NUMERATOR = 997;
constexpr uint32_t DENOMINATOR = 1000;
}

// Liquidity units locked forever on a pool's first mint
constexpr uint64_t MINIMUM_LIQUIDITY = 1000;

// =============================================================================
// Pool State (read-only to the zap core)
// =============================================================================

struct Reserves {
    Amount reserve0;
    Amount reserve1;
};

// Path of asset addresses for router swaps
using Path = std::vector<Address>;

} // namespace zap

#endif // ZAP_TYPES_HPP
