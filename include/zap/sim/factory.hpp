#ifndef ZAP_SIM_FACTORY_HPP
#define ZAP_SIM_FACTORY_HPP

#include <map>
#include <utility>
#include <vector>

#include "zap/pair_address.hpp"
#include "zap/sim/chain.hpp"

namespace zap {
namespace sim {

class Pair;

// =============================================================================
// Factory - pool registry; deploys each pair at its derived address
// =============================================================================

class Factory : public Contract, public IPoolRegistry {
public:
    Factory(const Address& addr, Chain& chain,
            const Hash& init_code_hash = DEFAULT_INIT_CODE_HASH);

    // IPoolRegistry
    Address get_pool(const Address& asset_a, const Address& asset_b) const override;

    // Deploy the pool for (asset_a, asset_b). Throws CollaboratorError if it
    // already exists or the assets are identical or null.
    Pair& create_pair(const Address& asset_a, const Address& asset_b);

    const Hash& init_code_hash() const { return init_code_hash_; }
    size_t all_pairs_length() const { return all_pairs_.size(); }
    const std::vector<Address>& all_pairs() const { return all_pairs_; }

    std::function<void()> checkpoint() override;

private:
    Chain& chain_;
    const Hash init_code_hash_;

    std::map<std::pair<Address, Address>, Address> pools_;  // sorted pair -> pool
    std::vector<Address> all_pairs_;
};

} // namespace sim
} // namespace zap

#endif // ZAP_SIM_FACTORY_HPP
