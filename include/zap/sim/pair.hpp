#ifndef ZAP_SIM_PAIR_HPP
#define ZAP_SIM_PAIR_HPP

#include <utility>

#include "zap/reentrancy.hpp"
#include "zap/sim/token.hpp"

namespace zap {
namespace sim {

// =============================================================================
// Pair - constant-product pool (0.3% fee) whose ledger is the LP unit
//
// Low-level interface: callers transfer assets in first, then call mint,
// burn or swap, which reconcile against the pair's actual balances.
// =============================================================================

class Pair : public Ledger, public IPair {
public:
    Pair(const Address& addr, IContractDirectory& contracts,
         const Address& token0, const Address& token1);

    // IPair
    Address token0() const override { return token0_; }
    Address token1() const override { return token1_; }
    Reserves get_reserves() const override { return reserves_; }

    // Mint LP units for assets transferred in since the last update.
    // The first mint locks MINIMUM_LIQUIDITY units at the null address.
    Amount mint(const Address& to);

    // Burn the LP units held by the pair itself; returns (amount0, amount1)
    std::pair<Amount, Amount> burn(const Address& to);

    // Send the requested outputs, then require the fee-adjusted
    // constant-product invariant to hold against the inputs received.
    void swap(const Amount& amount0_out, const Amount& amount1_out, const Address& to);

    std::function<void()> checkpoint() override;

private:
    IContractDirectory& contracts_;
    const Address token0_;
    const Address token1_;

    Reserves reserves_;
    ReentrancyLock lock_;

    void update(const Amount& balance0, const Amount& balance1);
};

} // namespace sim
} // namespace zap

#endif // ZAP_SIM_PAIR_HPP
