#ifndef ZAP_ALLOWANCE_HPP
#define ZAP_ALLOWANCE_HPP

#include "interfaces.hpp"

namespace zap {

// Grant `spender` an unlimited allowance over `owner`'s balance of `asset`
// when the current allowance is below `required`. Returns true if an
// approval was issued.
//
// The spender (the router) is trusted with unlimited future pulls; repeated
// zaps then skip the approval entirely.
bool ensure_allowance(IFungibleAsset& asset, const Address& owner,
                      const Address& spender, const Amount& required);

} // namespace zap

#endif // ZAP_ALLOWANCE_HPP
