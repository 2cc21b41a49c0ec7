// =============================================================================
// router.cpp - Router for the reference constant-product market
// =============================================================================

#include "zap/sim/router.hpp"
#include "zap/errors.hpp"
#include "zap/math.hpp"
#include "zap/sim/pair.hpp"

namespace zap {
namespace sim {

Router::Router(const Address& addr, Chain& chain, Factory& factory)
    : Contract(addr), chain_(chain), factory_(factory) {}

// =============================================================================
// Internal Helpers
// =============================================================================

void Router::ensure_deadline(Timestamp deadline) const {
    if (deadline < chain_.timestamp()) {
        throw CollaboratorError("Router: EXPIRED");
    }
}

Address Router::require_pair(const Address& asset_a, const Address& asset_b) const {
    const Address pool = factory_.get_pool(asset_a, asset_b);
    if (addresses::is_null(pool)) {
        throw CollaboratorError("Router: PAIR_NOT_FOUND");
    }
    return pool;
}

std::pair<Amount, Amount> Router::get_reserves(const Address& asset_a,
                                               const Address& asset_b) const {
    const IPair& pair = chain_.pair(require_pair(asset_a, asset_b));
    const Reserves reserves = pair.get_reserves();
    if (pair.token0() == asset_a) {
        return {reserves.reserve0, reserves.reserve1};
    }
    return {reserves.reserve1, reserves.reserve0};
}

// =============================================================================
// Quotes
// =============================================================================

std::vector<Amount> Router::quote_amounts_out(const Amount& amount_in, const Path& path) const {
    if (path.size() < 2) {
        throw CollaboratorError("Router: INVALID_PATH");
    }

    std::vector<Amount> amounts(path.size());
    amounts[0] = amount_in;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        if (amounts[i] == 0) {
            throw CollaboratorError("Router: INSUFFICIENT_INPUT_AMOUNT");
        }
        const auto [reserve_in, reserve_out] = get_reserves(path[i], path[i + 1]);
        if (reserve_in == 0 || reserve_out == 0) {
            throw CollaboratorError("Router: INSUFFICIENT_LIQUIDITY");
        }
        amounts[i + 1] = math::get_amount_out(amounts[i], reserve_in, reserve_out);
    }
    return amounts;
}

// =============================================================================
// Swaps
// =============================================================================

std::vector<Amount> Router::swap_exact(const Address& caller, const Amount& amount_in,
                                       const Amount& min_out, const Path& path,
                                       const Address& recipient, Timestamp deadline) {
    ensure_deadline(deadline);

    std::vector<Amount> amounts = quote_amounts_out(amount_in, path);
    if (amounts.back() < min_out) {
        throw CollaboratorError("Router: INSUFFICIENT_OUTPUT_AMOUNT");
    }

    chain_.asset(path[0]).transfer_from(address(), caller, require_pair(path[0], path[1]),
                                        amounts[0]);
    swap_hops(amounts, path, recipient);
    return amounts;
}

void Router::swap_exact_supporting_fee(const Address& caller, const Amount& amount_in,
                                       const Amount& min_out, const Path& path,
                                       const Address& recipient, Timestamp deadline) {
    ensure_deadline(deadline);
    if (path.size() < 2) {
        throw CollaboratorError("Router: INVALID_PATH");
    }

    chain_.asset(path[0]).transfer_from(address(), caller, require_pair(path[0], path[1]),
                                        amount_in);

    IFungibleAsset& output = chain_.asset(path.back());
    const Amount before = output.balance_of(recipient);
    swap_hops_supporting_fee(path, recipient);
    const Amount after = output.balance_of(recipient);

    if (after < before || after - before < min_out) {
        throw CollaboratorError("Router: INSUFFICIENT_OUTPUT_AMOUNT");
    }
}

void Router::swap_hops(const std::vector<Amount>& amounts, const Path& path, const Address& to) {
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        const Address& input = path[i];
        Pair& pair = chain_.contract_at<Pair>(require_pair(input, path[i + 1]));

        const Amount& amount_out = amounts[i + 1];
        const bool input_is_token0 = pair.token0() == input;
        const Address hop_to = i + 2 < path.size() ? require_pair(path[i + 1], path[i + 2]) : to;

        pair.swap(input_is_token0 ? Amount(0) : amount_out,
                  input_is_token0 ? amount_out : Amount(0),
                  hop_to);
    }
}

void Router::swap_hops_supporting_fee(const Path& path, const Address& to) {
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        const Address& input = path[i];
        Pair& pair = chain_.contract_at<Pair>(require_pair(input, path[i + 1]));

        const bool input_is_token0 = pair.token0() == input;
        const Reserves reserves = pair.get_reserves();
        const Amount& reserve_in = input_is_token0 ? reserves.reserve0 : reserves.reserve1;
        const Amount& reserve_out = input_is_token0 ? reserves.reserve1 : reserves.reserve0;

        // Input is whatever actually arrived, after any transfer fee
        const Amount balance = chain_.asset(input).balance_of(pair.address());
        if (balance <= reserve_in) {
            throw CollaboratorError("Router: INSUFFICIENT_INPUT_AMOUNT");
        }
        if (reserve_out == 0) {
            throw CollaboratorError("Router: INSUFFICIENT_LIQUIDITY");
        }
        const Amount amount_out = math::get_amount_out(balance - reserve_in, reserve_in, reserve_out);

        const Address hop_to = i + 2 < path.size() ? require_pair(path[i + 1], path[i + 2]) : to;
        pair.swap(input_is_token0 ? Amount(0) : amount_out,
                  input_is_token0 ? amount_out : Amount(0),
                  hop_to);
    }
}

// =============================================================================
// Liquidity
// =============================================================================

AddLiquidityResult Router::add_liquidity(const Address& caller,
                                         const Address& asset_a, const Address& asset_b,
                                         const Amount& amount_a, const Amount& amount_b,
                                         const Amount& min_a, const Amount& min_b,
                                         const Address& recipient, Timestamp deadline) {
    ensure_deadline(deadline);

    if (addresses::is_null(factory_.get_pool(asset_a, asset_b))) {
        factory_.create_pair(asset_a, asset_b);
    }

    AddLiquidityResult result;
    const auto [reserve_a, reserve_b] = get_reserves(asset_a, asset_b);
    if (reserve_a == 0 && reserve_b == 0) {
        result.used_a = amount_a;
        result.used_b = amount_b;
    } else {
        if (reserve_a == 0 || reserve_b == 0) {
            throw CollaboratorError("Router: INSUFFICIENT_LIQUIDITY");
        }
        if (amount_a == 0 || amount_b == 0) {
            throw CollaboratorError("Router: INSUFFICIENT_AMOUNT");
        }

        const Amount b_optimal = math::quote(amount_a, reserve_a, reserve_b);
        if (b_optimal <= amount_b) {
            if (b_optimal < min_b) {
                throw CollaboratorError("Router: INSUFFICIENT_B_AMOUNT");
            }
            result.used_a = amount_a;
            result.used_b = b_optimal;
        } else {
            const Amount a_optimal = math::quote(amount_b, reserve_b, reserve_a);
            if (a_optimal > amount_a) {
                throw CollaboratorError("Router: EXCESSIVE_A_AMOUNT");
            }
            if (a_optimal < min_a) {
                throw CollaboratorError("Router: INSUFFICIENT_A_AMOUNT");
            }
            result.used_a = a_optimal;
            result.used_b = amount_b;
        }
    }

    Pair& pair = chain_.contract_at<Pair>(require_pair(asset_a, asset_b));
    chain_.asset(asset_a).transfer_from(address(), caller, pair.address(), result.used_a);
    chain_.asset(asset_b).transfer_from(address(), caller, pair.address(), result.used_b);
    result.liquidity = pair.mint(recipient);
    return result;
}

RemoveLiquidityResult Router::remove_liquidity(const Address& caller,
                                               const Address& asset_a, const Address& asset_b,
                                               const Amount& liquidity,
                                               const Amount& min_a, const Amount& min_b,
                                               const Address& recipient, Timestamp deadline) {
    ensure_deadline(deadline);

    Pair& pair = chain_.contract_at<Pair>(require_pair(asset_a, asset_b));
    pair.transfer_from(address(), caller, pair.address(), liquidity);
    const auto [amount0, amount1] = pair.burn(recipient);

    RemoveLiquidityResult result;
    result.amount_a = pair.token0() == asset_a ? amount0 : amount1;
    result.amount_b = pair.token0() == asset_a ? amount1 : amount0;
    if (result.amount_a < min_a) {
        throw CollaboratorError("Router: INSUFFICIENT_A_AMOUNT");
    }
    if (result.amount_b < min_b) {
        throw CollaboratorError("Router: INSUFFICIENT_B_AMOUNT");
    }
    return result;
}

} // namespace sim
} // namespace zap
