#ifndef ZAP_SIM_TOKEN_HPP
#define ZAP_SIM_TOKEN_HPP

#include <functional>
#include <map>
#include <string>
#include <utility>

#include "zap/sim/chain.hpp"

namespace zap {
namespace sim {

// =============================================================================
// Ledger - fungible balances and allowances
// =============================================================================

class Ledger : public Contract, public IFungibleAsset {
public:
    // Called after every balance move, with the nominal amount. May re-enter.
    using TransferHook = std::function<void(const Address& from, const Address& to,
                                            const Amount& amount)>;

    Ledger(const Address& addr, std::string symbol, uint32_t transfer_fee_bps = 0);

    // IFungibleAsset
    Address address() const override { return contract_address(); }
    Amount balance_of(const Address& owner) const override;
    Amount allowance(const Address& owner, const Address& spender) const override;
    void approve(const Address& owner, const Address& spender, const Amount& amount) override;
    void transfer(const Address& from, const Address& to, const Amount& amount) override;
    void transfer_from(const Address& spender, const Address& from,
                       const Address& to, const Amount& amount) override;

    Amount total_supply() const { return state_.total_supply; }
    const std::string& symbol() const { return symbol_; }

    // Fee deducted from the credited side of every transfer and burned
    uint32_t transfer_fee_bps() const { return transfer_fee_bps_; }
    void set_transfer_fee_bps(uint32_t fee_bps);

    void set_transfer_hook(TransferHook hook) { hook_ = std::move(hook); }

    std::function<void()> checkpoint() override;

protected:
    struct State {
        std::map<Address, Amount> balances;
        std::map<std::pair<Address, Address>, Amount> allowances;  // (owner, spender)
        Amount total_supply;
    };
    State state_;

    void mint_units(const Address& to, const Amount& amount);
    void burn_units(const Address& from, const Amount& amount);

private:
    std::string symbol_;
    uint32_t transfer_fee_bps_;
    TransferHook hook_;

    void move(const Address& from, const Address& to, const Amount& amount);
};

// =============================================================================
// Token - plain (or fee-on-transfer) asset with an open faucet
// =============================================================================

class Token : public Ledger {
public:
    Token(const Address& addr, std::string symbol, uint32_t transfer_fee_bps = 0)
        : Ledger(addr, std::move(symbol), transfer_fee_bps) {}

    void mint(const Address& to, const Amount& amount) { mint_units(to, amount); }
    void burn(const Address& from, const Amount& amount) { burn_units(from, amount); }
};

} // namespace sim
} // namespace zap

#endif // ZAP_SIM_TOKEN_HPP
