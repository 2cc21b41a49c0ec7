#ifndef ZAP_SIM_ROUTER_HPP
#define ZAP_SIM_ROUTER_HPP

#include <utility>
#include <vector>

#include "zap/sim/chain.hpp"
#include "zap/sim/factory.hpp"

namespace zap {
namespace sim {

// =============================================================================
// Router - user-facing entry to the reference pools
// =============================================================================

class Router : public Contract, public IRouter {
public:
    Router(const Address& addr, Chain& chain, Factory& factory);

    Address address() const override { return contract_address(); }
    const Address& factory() const { return factory_.contract_address(); }

    // =========================================================================
    // Swaps
    // =========================================================================

    std::vector<Amount> swap_exact(const Address& caller, const Amount& amount_in,
                                   const Amount& min_out, const Path& path,
                                   const Address& recipient, Timestamp deadline) override;

    void swap_exact_supporting_fee(const Address& caller, const Amount& amount_in,
                                   const Amount& min_out, const Path& path,
                                   const Address& recipient, Timestamp deadline) override;

    // =========================================================================
    // Liquidity
    // =========================================================================

    // Creates the pair on first use, then deposits at the current ratio
    AddLiquidityResult add_liquidity(const Address& caller,
                                     const Address& asset_a, const Address& asset_b,
                                     const Amount& amount_a, const Amount& amount_b,
                                     const Amount& min_a, const Amount& min_b,
                                     const Address& recipient, Timestamp deadline) override;

    RemoveLiquidityResult remove_liquidity(const Address& caller,
                                           const Address& asset_a, const Address& asset_b,
                                           const Amount& liquidity,
                                           const Amount& min_a, const Amount& min_b,
                                           const Address& recipient, Timestamp deadline) override;

    // =========================================================================
    // Quotes
    // =========================================================================

    std::vector<Amount> quote_amounts_out(const Amount& amount_in, const Path& path) const override;

    // Reserves ordered as (asset_a, asset_b)
    std::pair<Amount, Amount> get_reserves(const Address& asset_a, const Address& asset_b) const;

    // Stateless
    std::function<void()> checkpoint() override { return [] {}; }

private:
    Chain& chain_;
    Factory& factory_;

    void ensure_deadline(Timestamp deadline) const;
    Address require_pair(const Address& asset_a, const Address& asset_b) const;

    // Execute hops whose inputs already sit in the first pair
    void swap_hops(const std::vector<Amount>& amounts, const Path& path, const Address& to);
    void swap_hops_supporting_fee(const Path& path, const Address& to);
};

} // namespace sim
} // namespace zap

#endif // ZAP_SIM_ROUTER_HPP
