#ifndef ZAP_ZAPPER_HPP
#define ZAP_ZAPPER_HPP

#include <array>

#include "types.hpp"
#include "math.hpp"
#include "events.hpp"
#include "interfaces.hpp"
#include "pair_address.hpp"
#include "reentrancy.hpp"

namespace zap {

// =============================================================================
// Requests
// =============================================================================

struct ZapInRequest {
    Address input_asset;
    Address pair_asset_a;
    Address pair_asset_b;
    Amount input_amount;
    uint32_t max_slippage_bps;
    Amount minimum_liquidity_out;
    Timestamp deadline;
    bool fee_on_transfer;
};

struct ZapOutRequest {
    Address output_asset;
    Address pair_asset_a;
    Address pair_asset_b;
    Amount liquidity_in;
    uint32_t max_slippage_bps;
    Amount minimum_output_amount;
    Timestamp deadline;
    bool fee_on_transfer;
};

// =============================================================================
// Plans (transient, one invocation)
// =============================================================================

struct SwapPlan {
    std::array<Address, 2> path;
    Amount amount_in;
    Amount min_out;
};

struct LiquidityPlan {
    Amount amount_a;
    Amount amount_b;
    Amount minimum_a;
    Amount minimum_b;
};

// =============================================================================
// Options
// =============================================================================

struct ZapOptions {
    math::SwapRounding swap_rounding = math::SwapRounding::Down;
    bool refund_dust = true;          // return deposit leftovers to the caller
    bool verify_pair_address = true;  // warn when registry and derivation disagree
};

// =============================================================================
// Zapper - single-asset entry into and exit from a constant-product pool
// =============================================================================

class Zapper {
public:
    // `self` is the custody address the zapper holds funds under
    Zapper(IRouter& router, const PairAddressResolver& resolver,
           IContractDirectory& contracts, const Address& self,
           ZapOptions options = {}, IZapObserver* observer = nullptr);
    ~Zapper() = default;

    // Non-copyable
    Zapper(const Zapper&) = delete;
    Zapper& operator=(const Zapper&) = delete;

    // Pull `input_amount` of one pair asset, pre-swap the optimal share into
    // the other, deposit both legs. Liquidity is minted to `caller`.
    // Returns: liquidity minted
    Amount zap_in_single_token(const Address& caller, const ZapInRequest& request);

    // Pull `liquidity_in` LP units, withdraw both legs, convert the other leg
    // into `output_asset` and send the total to `caller`.
    // Returns: amount of output_asset sent
    Amount zap_out_single_token(const Address& caller, const ZapOutRequest& request);

    // Read-only pool lookup (NULL_ADDRESS if absent)
    Address resolve_pool(const Address& asset_a, const Address& asset_b) const;

    const Address& address() const { return self_; }
    const ZapOptions& options() const { return options_; }

private:
    IRouter& router_;
    const PairAddressResolver& resolver_;
    IContractDirectory& contracts_;
    const Address self_;
    const ZapOptions options_;
    IZapObserver* observer_;

    ReentrancyLock lock_;

    // Pool for the pair, PAIR_NOT_FOUND if absent
    Address require_pool(const Address& asset_a, const Address& asset_b) const;

    // Pull from caller into custody; returns the amount credited
    Amount pull(IFungibleAsset& asset, const Address& from, const Amount& amount,
                bool fee_on_transfer);

    // Execute a planned swap into custody; returns the amount credited
    Amount execute_swap(const SwapPlan& plan, Timestamp deadline, bool fee_on_transfer);

    // Quote and bound a swap of `amount_in` along `path`
    SwapPlan plan_swap(const Address& from, const Address& to, const Amount& amount_in,
                       uint32_t max_slippage_bps) const;
};

} // namespace zap

#endif // ZAP_ZAPPER_HPP
