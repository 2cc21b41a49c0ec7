#ifndef ZAP_INTERFACES_HPP
#define ZAP_INTERFACES_HPP

#include <vector>

#include "types.hpp"

namespace zap {

// =============================================================================
// Collaborator Interfaces
//
// Every call that reaches a collaborator may hand control to foreign code.
// Rejections are raised as CollaboratorError (see errors.hpp).
// =============================================================================

// Fungible asset ledger. `caller` parameters identify the account on whose
// behalf the call is made.
class IFungibleAsset {
public:
    virtual ~IFungibleAsset() = default;

    virtual Address address() const = 0;

    virtual Amount balance_of(const Address& owner) const = 0;
    virtual Amount allowance(const Address& owner, const Address& spender) const = 0;

    virtual void approve(const Address& owner, const Address& spender, const Amount& amount) = 0;

    // Moves `amount` out of `from`. Fee-on-transfer assets may credit `to`
    // with less than `amount`.
    virtual void transfer(const Address& from, const Address& to, const Amount& amount) = 0;
    virtual void transfer_from(const Address& spender, const Address& from,
                               const Address& to, const Amount& amount) = 0;
};

// Two-asset constant-product pool
class IPair {
public:
    virtual ~IPair() = default;

    virtual Address token0() const = 0;
    virtual Address token1() const = 0;
    virtual Reserves get_reserves() const = 0;
};

// Pool registry (factory): null address if the pool does not exist
class IPoolRegistry {
public:
    virtual ~IPoolRegistry() = default;

    virtual Address get_pool(const Address& asset_a, const Address& asset_b) const = 0;
};

struct AddLiquidityResult {
    Amount used_a;
    Amount used_b;
    Amount liquidity;
};

struct RemoveLiquidityResult {
    Amount amount_a;
    Amount amount_b;
};

// Router over constant-product pools. Every mutating call pulls funds from
// `caller` through transfer_from, so `caller` must have approved the router.
class IRouter {
public:
    virtual ~IRouter() = default;

    virtual Address address() const = 0;

    // Exact-input swap along `path`; returns the amount at every hop
    virtual std::vector<Amount> swap_exact(const Address& caller, const Amount& amount_in,
                                           const Amount& min_out, const Path& path,
                                           const Address& recipient, Timestamp deadline) = 0;

    // Same, for fee-on-transfer assets. Nothing is returned because nominal
    // amounts cannot be trusted; callers measure balances instead.
    virtual void swap_exact_supporting_fee(const Address& caller, const Amount& amount_in,
                                           const Amount& min_out, const Path& path,
                                           const Address& recipient, Timestamp deadline) = 0;

    virtual AddLiquidityResult add_liquidity(const Address& caller,
                                             const Address& asset_a, const Address& asset_b,
                                             const Amount& amount_a, const Amount& amount_b,
                                             const Amount& min_a, const Amount& min_b,
                                             const Address& recipient, Timestamp deadline) = 0;

    virtual RemoveLiquidityResult remove_liquidity(const Address& caller,
                                                   const Address& asset_a, const Address& asset_b,
                                                   const Amount& liquidity,
                                                   const Amount& min_a, const Amount& min_b,
                                                   const Address& recipient, Timestamp deadline) = 0;

    virtual std::vector<Amount> quote_amounts_out(const Amount& amount_in, const Path& path) const = 0;
};

// Resolves contract addresses to collaborator objects (the host's
// "call at address"). Unknown addresses raise CollaboratorError.
class IContractDirectory {
public:
    virtual ~IContractDirectory() = default;

    virtual IFungibleAsset& asset(const Address& addr) = 0;
    virtual IPair& pair(const Address& addr) = 0;
};

} // namespace zap

#endif // ZAP_INTERFACES_HPP
