// =============================================================================
// zapper.cpp - Atomic single-asset zap-in / zap-out orchestration
//
// Both entry points run under one ReentrancyLock and follow
//   FundsAcquired -> Sized/Quoted -> Executed(swap) -> Executed(liquidity)
//   -> Verified -> Committed
// Any throw aborts the call; rolling back collaborator state is the host
// environment's all-or-nothing guarantee.
// =============================================================================

#include "zap/zapper.hpp"
#include "zap/allowance.hpp"
#include "zap/balance_snapshot.hpp"
#include "zap/errors.hpp"
#include "zap/log.hpp"

namespace zap {

Zapper::Zapper(IRouter& router, const PairAddressResolver& resolver,
               IContractDirectory& contracts, const Address& self,
               ZapOptions options, IZapObserver* observer)
    : router_(router),
      resolver_(resolver),
      contracts_(contracts),
      self_(self),
      options_(options),
      observer_(observer) {}

// =============================================================================
// Zap-In
// =============================================================================

Amount Zapper::zap_in_single_token(const Address& caller, const ZapInRequest& request) {
    ReentrancyGuard guard(lock_, "zap_in_single_token");

    if (request.input_amount == 0) {
        throw ZapError(ErrorCode::ZERO_AMOUNT, "input amount is zero");
    }
    math::check_slippage(request.max_slippage_bps);
    if (request.input_asset != request.pair_asset_a &&
        request.input_asset != request.pair_asset_b) {
        throw ZapError(ErrorCode::UNSUPPORTED_INPUT_TOKEN,
                       to_hex(request.input_asset) + " is not a pair asset");
    }
    const Address other_asset = request.input_asset == request.pair_asset_a
                                    ? request.pair_asset_b
                                    : request.pair_asset_a;

    // Funds acquired
    IFungibleAsset& input = contracts_.asset(request.input_asset);
    const Amount amount = pull(input, caller, request.input_amount, request.fee_on_transfer);
    if (amount == 0) {
        throw ZapError(ErrorCode::ZERO_AMOUNT, "nothing credited after transfer fee");
    }
    ensure_allowance(input, self_, router_.address(), amount);

    const Address pool = require_pool(request.pair_asset_a, request.pair_asset_b);
    const IPair& pair = contracts_.pair(pool);
    const Reserves reserves = pair.get_reserves();
    const Amount reserve_in = pair.token0() == request.input_asset ? reserves.reserve0
                                                                   : reserves.reserve1;
    if (reserve_in == 0) {
        throw ZapError(ErrorCode::SWAP_BOUNDS_VIOLATED, "pool " + to_hex(pool) + " has no reserves");
    }

    // Sized
    const Amount to_swap = math::optimal_swap(amount, reserve_in, options_.swap_rounding);
    if (to_swap == 0 || to_swap >= amount) {
        throw ZapError(ErrorCode::SWAP_BOUNDS_VIOLATED,
                       "pre-swap " + to_string(to_swap) + " not within (0, " +
                       to_string(amount) + ")");
    }
    log::debug("zap-in: amount=" + to_string(amount) + " reserve_in=" + to_string(reserve_in) +
               " to_swap=" + to_string(to_swap));

    // Executed (swap)
    const SwapPlan swap = plan_swap(request.input_asset, other_asset, to_swap,
                                    request.max_slippage_bps);
    const Amount received = execute_swap(swap, request.deadline, request.fee_on_transfer);

    // Executed (liquidity)
    LiquidityPlan plan;
    plan.amount_a = amount - to_swap;
    plan.amount_b = received;
    plan.minimum_a = math::min_out(plan.amount_a, request.max_slippage_bps);
    plan.minimum_b = math::min_out(plan.amount_b, request.max_slippage_bps);

    IFungibleAsset& other = contracts_.asset(other_asset);
    ensure_allowance(input, self_, router_.address(), plan.amount_a);
    ensure_allowance(other, self_, router_.address(), plan.amount_b);

    const AddLiquidityResult added = router_.add_liquidity(
        self_, request.input_asset, other_asset,
        plan.amount_a, plan.amount_b, plan.minimum_a, plan.minimum_b,
        caller, request.deadline);
    log::debug("zap-in: deposited " + to_string(added.used_a) + "/" + to_string(added.used_b) +
               " minted " + to_string(added.liquidity));

    // Verified
    if (added.liquidity < request.minimum_liquidity_out) {
        throw ZapError(ErrorCode::SLIPPAGE_EXCEEDED,
                       "minted " + to_string(added.liquidity) + " below minimum " +
                       to_string(request.minimum_liquidity_out));
    }

    ZapInEvent event;
    event.caller = caller;
    event.input_asset = request.input_asset;
    event.pair_asset_a = request.pair_asset_a;
    event.pair_asset_b = request.pair_asset_b;
    event.input_amount = request.input_amount;
    event.liquidity_minted = added.liquidity;
    event.amount_swapped = to_swap;
    event.amount_received = received;

    if (options_.refund_dust) {
        event.refund_input = plan.amount_a - added.used_a;
        event.refund_other = plan.amount_b - added.used_b;
        if (event.refund_input > 0) input.transfer(self_, caller, event.refund_input);
        if (event.refund_other > 0) other.transfer(self_, caller, event.refund_other);
    }

    // Committed
    log::info("zap-in " + to_hex(caller) + " " + to_string(request.input_amount) + " of " +
              to_hex(request.input_asset) + " -> " + to_string(added.liquidity) + " LP");
    if (observer_) {
        observer_->on_zap_in(event);
    }
    return added.liquidity;
}

// =============================================================================
// Zap-Out
// =============================================================================

Amount Zapper::zap_out_single_token(const Address& caller, const ZapOutRequest& request) {
    ReentrancyGuard guard(lock_, "zap_out_single_token");

    if (request.liquidity_in == 0) {
        throw ZapError(ErrorCode::ZERO_AMOUNT, "liquidity amount is zero");
    }
    math::check_slippage(request.max_slippage_bps);
    if (request.output_asset != request.pair_asset_a &&
        request.output_asset != request.pair_asset_b) {
        throw ZapError(ErrorCode::UNSUPPORTED_OUTPUT_TOKEN,
                       to_hex(request.output_asset) + " is not a pair asset");
    }
    const Address other_asset = request.output_asset == request.pair_asset_a
                                    ? request.pair_asset_b
                                    : request.pair_asset_a;

    // Funds acquired
    const Address pool = require_pool(request.pair_asset_a, request.pair_asset_b);
    IFungibleAsset& lp_units = contracts_.asset(pool);
    const Amount liquidity = pull(lp_units, caller, request.liquidity_in, false);
    ensure_allowance(lp_units, self_, router_.address(), liquidity);

    // Executed (liquidity)
    IFungibleAsset& output = contracts_.asset(request.output_asset);
    IFungibleAsset& other = contracts_.asset(other_asset);

    Amount kept = 0;
    Amount other_amount = 0;
    if (request.fee_on_transfer) {
        kept = measure_received(output, self_, [&] {
            other_amount = measure_received(other, self_, [&] {
                router_.remove_liquidity(self_, request.output_asset, other_asset,
                                         liquidity, 0, 0, self_, request.deadline);
            });
        });
    } else {
        const RemoveLiquidityResult removed = router_.remove_liquidity(
            self_, request.output_asset, other_asset, liquidity, 0, 0, self_, request.deadline);
        kept = removed.amount_a;
        other_amount = removed.amount_b;
    }
    log::debug("zap-out: withdrew " + to_string(kept) + "/" + to_string(other_amount));

    // Quoted, executed (swap)
    Amount amount_out = kept;
    if (other_amount > 0) {
        const SwapPlan swap = plan_swap(other_asset, request.output_asset, other_amount,
                                        request.max_slippage_bps);
        amount_out += execute_swap(swap, request.deadline, request.fee_on_transfer);
    }

    // Verified
    if (amount_out < request.minimum_output_amount) {
        throw ZapError(ErrorCode::SLIPPAGE_EXCEEDED,
                       "output " + to_string(amount_out) + " below minimum " +
                       to_string(request.minimum_output_amount));
    }

    // Committed
    output.transfer(self_, caller, amount_out);

    log::info("zap-out " + to_hex(caller) + " " + to_string(liquidity) + " LP -> " +
              to_string(amount_out) + " of " + to_hex(request.output_asset));
    if (observer_) {
        ZapOutEvent event;
        event.caller = caller;
        event.output_asset = request.output_asset;
        event.pair_asset_a = request.pair_asset_a;
        event.pair_asset_b = request.pair_asset_b;
        event.liquidity_in = request.liquidity_in;
        event.amount_out = amount_out;
        observer_->on_zap_out(event);
    }
    return amount_out;
}

// =============================================================================
// Queries
// =============================================================================

Address Zapper::resolve_pool(const Address& asset_a, const Address& asset_b) const {
    return resolver_.resolve_live(asset_a, asset_b);
}

// =============================================================================
// Internal Helpers
// =============================================================================

Address Zapper::require_pool(const Address& asset_a, const Address& asset_b) const {
    const Address pool = resolver_.resolve_live(asset_a, asset_b);
    if (addresses::is_null(pool)) {
        throw ZapError(ErrorCode::PAIR_NOT_FOUND,
                       "no pool for " + to_hex(asset_a) + "/" + to_hex(asset_b));
    }

    if (options_.verify_pair_address) {
        const Address derived = resolver_.derive_deterministic(asset_a, asset_b);
        if (derived != pool) {
            log::warn("registry pool " + to_hex(pool) + " differs from derived " + to_hex(derived));
        }
    }
    return pool;
}

Amount Zapper::pull(IFungibleAsset& asset, const Address& from, const Amount& amount,
                    bool fee_on_transfer) {
    if (!fee_on_transfer) {
        asset.transfer_from(self_, from, self_, amount);
        return amount;
    }
    return measure_received(asset, self_, [&] {
        asset.transfer_from(self_, from, self_, amount);
    });
}

SwapPlan Zapper::plan_swap(const Address& from, const Address& to, const Amount& amount_in,
                           uint32_t max_slippage_bps) const {
    SwapPlan plan;
    plan.path = {from, to};
    plan.amount_in = amount_in;

    const std::vector<Amount> quoted = router_.quote_amounts_out(amount_in, Path{from, to});
    if (quoted.empty()) {
        throw CollaboratorError("router returned an empty quote");
    }
    plan.min_out = math::min_out(quoted.back(), max_slippage_bps);
    return plan;
}

Amount Zapper::execute_swap(const SwapPlan& plan, Timestamp deadline, bool fee_on_transfer) {
    IFungibleAsset& from = contracts_.asset(plan.path[0]);
    ensure_allowance(from, self_, router_.address(), plan.amount_in);

    const Path path(plan.path.begin(), plan.path.end());
    if (fee_on_transfer) {
        IFungibleAsset& to = contracts_.asset(plan.path[1]);
        return measure_received(to, self_, [&] {
            router_.swap_exact_supporting_fee(self_, plan.amount_in, plan.min_out, path,
                                              self_, deadline);
        });
    }

    const std::vector<Amount> amounts =
        router_.swap_exact(self_, plan.amount_in, plan.min_out, path, self_, deadline);
    if (amounts.empty()) {
        throw CollaboratorError("router returned no swap amounts");
    }
    return amounts.back();
}

} // namespace zap
