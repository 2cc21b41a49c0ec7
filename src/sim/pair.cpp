// =============================================================================
// pair.cpp - Constant-product pool with LP ledger
// =============================================================================

#include "zap/sim/pair.hpp"
#include "zap/errors.hpp"
#include "zap/math.hpp"
#include <algorithm>

namespace zap {
namespace sim {

Pair::Pair(const Address& addr, IContractDirectory& contracts,
           const Address& token0, const Address& token1)
    : Ledger(addr, "LP"),
      contracts_(contracts),
      token0_(token0),
      token1_(token1),
      reserves_{0, 0} {}

// =============================================================================
// Liquidity
// =============================================================================

Amount Pair::mint(const Address& to) {
    ReentrancyGuard guard(lock_, "Pair::mint");

    const Amount balance0 = contracts_.asset(token0_).balance_of(address());
    const Amount balance1 = contracts_.asset(token1_).balance_of(address());
    const Amount amount0 = balance0 - reserves_.reserve0;
    const Amount amount1 = balance1 - reserves_.reserve1;

    Amount liquidity = 0;
    if (total_supply() == 0) {
        const Amount root = math::isqrt(amount0 * amount1);
        if (root <= MINIMUM_LIQUIDITY) {
            throw CollaboratorError("Pair: INSUFFICIENT_LIQUIDITY_MINTED");
        }
        liquidity = root - MINIMUM_LIQUIDITY;
        mint_units(NULL_ADDRESS, MINIMUM_LIQUIDITY);
    } else {
        liquidity = std::min<Amount>(amount0 * total_supply() / reserves_.reserve0,
                             amount1 * total_supply() / reserves_.reserve1);
    }

    if (liquidity == 0) {
        throw CollaboratorError("Pair: INSUFFICIENT_LIQUIDITY_MINTED");
    }
    mint_units(to, liquidity);

    update(balance0, balance1);
    return liquidity;
}

std::pair<Amount, Amount> Pair::burn(const Address& to) {
    ReentrancyGuard guard(lock_, "Pair::burn");

    IFungibleAsset& asset0 = contracts_.asset(token0_);
    IFungibleAsset& asset1 = contracts_.asset(token1_);

    const Amount balance0 = asset0.balance_of(address());
    const Amount balance1 = asset1.balance_of(address());
    const Amount liquidity = balance_of(address());

    const Amount amount0 = liquidity * balance0 / total_supply();
    const Amount amount1 = liquidity * balance1 / total_supply();
    if (amount0 == 0 || amount1 == 0) {
        throw CollaboratorError("Pair: INSUFFICIENT_LIQUIDITY_BURNED");
    }

    burn_units(address(), liquidity);
    asset0.transfer(address(), to, amount0);
    asset1.transfer(address(), to, amount1);

    update(asset0.balance_of(address()), asset1.balance_of(address()));
    return {amount0, amount1};
}

// =============================================================================
// Swap
// =============================================================================

void Pair::swap(const Amount& amount0_out, const Amount& amount1_out, const Address& to) {
    ReentrancyGuard guard(lock_, "Pair::swap");

    if (amount0_out == 0 && amount1_out == 0) {
        throw CollaboratorError("Pair: INSUFFICIENT_OUTPUT_AMOUNT");
    }
    if (amount0_out >= reserves_.reserve0 || amount1_out >= reserves_.reserve1) {
        throw CollaboratorError("Pair: INSUFFICIENT_LIQUIDITY");
    }
    if (to == token0_ || to == token1_) {
        throw CollaboratorError("Pair: INVALID_TO");
    }

    IFungibleAsset& asset0 = contracts_.asset(token0_);
    IFungibleAsset& asset1 = contracts_.asset(token1_);

    // Optimistic transfer out
    if (amount0_out > 0) asset0.transfer(address(), to, amount0_out);
    if (amount1_out > 0) asset1.transfer(address(), to, amount1_out);

    const Amount balance0 = asset0.balance_of(address());
    const Amount balance1 = asset1.balance_of(address());

    const Amount floor0 = reserves_.reserve0 - amount0_out;
    const Amount floor1 = reserves_.reserve1 - amount1_out;
    const Amount amount0_in = balance0 > floor0 ? balance0 - floor0 : Amount(0);
    const Amount amount1_in = balance1 > floor1 ? balance1 - floor1 : Amount(0);
    if (amount0_in == 0 && amount1_in == 0) {
        throw CollaboratorError("Pair: INSUFFICIENT_INPUT_AMOUNT");
    }

    // 0.3% of every input stays in the pool
    const Amount fee_scale = pool_fee::DENOMINATOR;
    const Amount fee_cut = pool_fee::DENOMINATOR - pool_fee::NUMERATOR;
    const Amount adjusted0 = balance0 * fee_scale - amount0_in * fee_cut;
    const Amount adjusted1 = balance1 * fee_scale - amount1_in * fee_cut;
    if (adjusted0 * adjusted1 < reserves_.reserve0 * reserves_.reserve1 * fee_scale * fee_scale) {
        throw CollaboratorError("Pair: K");
    }

    update(balance0, balance1);
}

void Pair::update(const Amount& balance0, const Amount& balance1) {
    reserves_.reserve0 = balance0;
    reserves_.reserve1 = balance1;
}

// =============================================================================
// Checkpoint
// =============================================================================

std::function<void()> Pair::checkpoint() {
    auto restore_ledger = Ledger::checkpoint();
    return [this, restore_ledger, saved = reserves_]() {
        restore_ledger();
        reserves_ = saved;
    };
}

} // namespace sim
} // namespace zap
