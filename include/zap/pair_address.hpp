#ifndef ZAP_PAIR_ADDRESS_HPP
#define ZAP_PAIR_ADDRESS_HPP

#include <utility>
#include <vector>

#include "interfaces.hpp"

namespace zap {

// Uniswap V2 pair init code hash
extern const Hash DEFAULT_INIT_CODE_HASH;

// Keccak-256 (pre-FIPS padding, as used by the EVM)
Hash keccak256(const uint8_t* data, size_t len);
Hash keccak256(const std::vector<uint8_t>& data);

// Canonical ordering (token0 < token1). Throws std::invalid_argument for
// identical or null assets.
std::pair<Address, Address> sort_assets(const Address& asset_a, const Address& asset_b);

// CREATE2-style derivation:
//   salt    = keccak256(token0 || token1)
//   address = last 20 bytes of keccak256(0xff || factory || salt || init_code_hash)
Address compute_pair_address(const Address& factory, const Hash& init_code_hash,
                             const Address& asset_a, const Address& asset_b);

// =============================================================================
// PairAddressResolver
// =============================================================================

class PairAddressResolver {
public:
    PairAddressResolver(const IPoolRegistry& registry, const Address& factory,
                        const Hash& init_code_hash = DEFAULT_INIT_CODE_HASH);

    // Authoritative lookup through the registry; NULL_ADDRESS if absent
    Address resolve_live(const Address& asset_a, const Address& asset_b) const;

    // Local recomputation, no external query
    Address derive_deterministic(const Address& asset_a, const Address& asset_b) const;

    const Address& factory() const { return factory_; }
    const Hash& init_code_hash() const { return init_code_hash_; }

private:
    const IPoolRegistry& registry_;
    const Address factory_;
    const Hash init_code_hash_;
};

} // namespace zap

#endif // ZAP_PAIR_ADDRESS_HPP
