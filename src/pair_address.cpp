// =============================================================================
// pair_address.cpp - Deterministic pool address derivation and lookup
// =============================================================================

#include "zap/pair_address.hpp"
#include <ethash/keccak.hpp>
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace zap {

const Hash DEFAULT_INIT_CODE_HASH = hash_from_hex(
    "0x96e8ac4277198ff8b6f785478aa9a39f403cb768dd02cbee326c3e7da348845f");

Hash keccak256(const uint8_t* data, size_t len) {
    const ethash::hash256 digest = ethash::keccak256(data, len);
    Hash out{};
    std::copy(std::begin(digest.bytes), std::end(digest.bytes), out.begin());
    return out;
}

Hash keccak256(const std::vector<uint8_t>& data) {
    return keccak256(data.data(), data.size());
}

std::pair<Address, Address> sort_assets(const Address& asset_a, const Address& asset_b) {
    if (asset_a == asset_b) {
        throw std::invalid_argument("identical assets: " + to_hex(asset_a));
    }
    auto sorted = asset_a < asset_b ? std::make_pair(asset_a, asset_b)
                                    : std::make_pair(asset_b, asset_a);
    if (addresses::is_null(sorted.first)) {
        throw std::invalid_argument("null asset address");
    }
    return sorted;
}

Address compute_pair_address(const Address& factory, const Hash& init_code_hash,
                             const Address& asset_a, const Address& asset_b) {
    const auto [token0, token1] = sort_assets(asset_a, asset_b);

    std::vector<uint8_t> packed;
    packed.reserve(token0.size() + token1.size());
    packed.insert(packed.end(), token0.begin(), token0.end());
    packed.insert(packed.end(), token1.begin(), token1.end());
    const Hash salt = keccak256(packed);

    std::vector<uint8_t> preimage;
    preimage.reserve(1 + factory.size() + salt.size() + init_code_hash.size());
    preimage.push_back(0xff);
    preimage.insert(preimage.end(), factory.begin(), factory.end());
    preimage.insert(preimage.end(), salt.begin(), salt.end());
    preimage.insert(preimage.end(), init_code_hash.begin(), init_code_hash.end());
    const Hash digest = keccak256(preimage);

    Address addr{};
    std::copy(digest.end() - addr.size(), digest.end(), addr.begin());
    return addr;
}

// =============================================================================
// PairAddressResolver
// =============================================================================

PairAddressResolver::PairAddressResolver(const IPoolRegistry& registry, const Address& factory,
                                         const Hash& init_code_hash)
    : registry_(registry), factory_(factory), init_code_hash_(init_code_hash) {}

Address PairAddressResolver::resolve_live(const Address& asset_a, const Address& asset_b) const {
    return registry_.get_pool(asset_a, asset_b);
}

Address PairAddressResolver::derive_deterministic(const Address& asset_a,
                                                  const Address& asset_b) const {
    return compute_pair_address(factory_, init_code_hash_, asset_a, asset_b);
}

} // namespace zap
