// =============================================================================
// factory.cpp - Pool registry for the reference market
// =============================================================================

#include "zap/sim/factory.hpp"
#include "zap/errors.hpp"
#include "zap/log.hpp"
#include "zap/sim/pair.hpp"

namespace zap {
namespace sim {

Factory::Factory(const Address& addr, Chain& chain, const Hash& init_code_hash)
    : Contract(addr), chain_(chain), init_code_hash_(init_code_hash) {}

Address Factory::get_pool(const Address& asset_a, const Address& asset_b) const {
    const auto key = asset_a < asset_b ? std::make_pair(asset_a, asset_b)
                                       : std::make_pair(asset_b, asset_a);
    auto it = pools_.find(key);
    return it == pools_.end() ? NULL_ADDRESS : it->second;
}

Pair& Factory::create_pair(const Address& asset_a, const Address& asset_b) {
    std::pair<Address, Address> sorted;
    try {
        sorted = sort_assets(asset_a, asset_b);
    } catch (const std::invalid_argument& e) {
        throw CollaboratorError(std::string("Factory: ") + e.what());
    }
    if (pools_.count(sorted) != 0) {
        throw CollaboratorError("Factory: PAIR_EXISTS");
    }

    const Address addr = compute_pair_address(contract_address(), init_code_hash_,
                                              sorted.first, sorted.second);
    Pair& pair = chain_.deploy<Pair>(addr, chain_, sorted.first, sorted.second);

    pools_[sorted] = addr;
    all_pairs_.push_back(addr);
    log::debug("pair created " + to_hex(addr));
    return pair;
}

std::function<void()> Factory::checkpoint() {
    return [this, saved_pools = pools_, saved_all = all_pairs_]() {
        pools_ = saved_pools;
        all_pairs_ = saved_all;
    };
}

} // namespace sim
} // namespace zap
