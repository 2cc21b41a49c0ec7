#ifndef ZAP_BALANCE_SNAPSHOT_HPP
#define ZAP_BALANCE_SNAPSHOT_HPP

#include <utility>

#include "errors.hpp"
#include "interfaces.hpp"

namespace zap {

// Observed-effect accounting: read `holder`'s balance, run `call`, read it
// again and return the increase. Use wherever a collaborator's declared
// amount cannot be trusted (fee-on-transfer assets).
template <typename Call>
Amount measure_received(const IFungibleAsset& asset, const Address& holder, Call&& call) {
    const Amount before = asset.balance_of(holder);
    std::forward<Call>(call)();
    const Amount after = asset.balance_of(holder);

    if (after < before) {
        throw CollaboratorError("balance of " + to_hex(holder) + " in " +
                                to_hex(asset.address()) + " decreased during call");
    }
    return after - before;
}

} // namespace zap

#endif // ZAP_BALANCE_SNAPSHOT_HPP
