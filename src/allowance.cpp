#include "zap/allowance.hpp"
#include "zap/log.hpp"

namespace zap {

bool ensure_allowance(IFungibleAsset& asset, const Address& owner,
                      const Address& spender, const Amount& required) {
    if (asset.allowance(owner, spender) >= required) {
        return false;
    }

    asset.approve(owner, spender, MAX_AMOUNT);
    log::debug("approved unlimited " + to_hex(asset.address()) + " for " + to_hex(spender));
    return true;
}

} // namespace zap
