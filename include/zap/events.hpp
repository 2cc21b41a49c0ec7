#ifndef ZAP_EVENTS_HPP
#define ZAP_EVENTS_HPP

#include "types.hpp"

namespace zap {

// =============================================================================
// Zap Notifications
// =============================================================================

struct ZapInEvent {
    Address caller;
    Address input_asset;
    Address pair_asset_a;
    Address pair_asset_b;
    Amount input_amount;
    Amount liquidity_minted;

    Amount amount_swapped;   // input units sent through the pre-swap
    Amount amount_received;  // paired-asset units credited by the swap
    Amount refund_input;     // dust returned to the caller, input asset
    Amount refund_other;     // dust returned to the caller, paired asset
};

struct ZapOutEvent {
    Address caller;
    Address output_asset;
    Address pair_asset_a;
    Address pair_asset_b;
    Amount liquidity_in;
    Amount amount_out;
};

// Observer interface. Called after a zap has passed every bound, before
// the orchestrator returns.
class IZapObserver {
public:
    virtual ~IZapObserver() = default;

    virtual void on_zap_in(const ZapInEvent& event) {}
    virtual void on_zap_out(const ZapOutEvent& event) {}
};

} // namespace zap

#endif // ZAP_EVENTS_HPP
