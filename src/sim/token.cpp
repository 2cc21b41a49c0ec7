// =============================================================================
// token.cpp - Fungible ledger (balances, allowances, transfer fee)
// =============================================================================

#include "zap/sim/token.hpp"
#include "zap/errors.hpp"

namespace zap {
namespace sim {

Ledger::Ledger(const Address& addr, std::string symbol, uint32_t transfer_fee_bps)
    : Contract(addr), symbol_(std::move(symbol)), transfer_fee_bps_(0) {
    set_transfer_fee_bps(transfer_fee_bps);
}

void Ledger::set_transfer_fee_bps(uint32_t fee_bps) {
    if (fee_bps >= bps::DENOMINATOR) {
        throw std::invalid_argument(symbol_ + ": transfer fee must be below 10000 bps");
    }
    transfer_fee_bps_ = fee_bps;
}

// =============================================================================
// Queries
// =============================================================================

Amount Ledger::balance_of(const Address& owner) const {
    auto it = state_.balances.find(owner);
    return it == state_.balances.end() ? Amount(0) : it->second;
}

Amount Ledger::allowance(const Address& owner, const Address& spender) const {
    auto it = state_.allowances.find({owner, spender});
    return it == state_.allowances.end() ? Amount(0) : it->second;
}

// =============================================================================
// Transfers
// =============================================================================

void Ledger::approve(const Address& owner, const Address& spender, const Amount& amount) {
    if (addresses::is_null(spender)) {
        throw CollaboratorError(symbol_ + ": approve to the zero address");
    }
    state_.allowances[{owner, spender}] = amount;
}

void Ledger::transfer(const Address& from, const Address& to, const Amount& amount) {
    move(from, to, amount);
}

void Ledger::transfer_from(const Address& spender, const Address& from,
                           const Address& to, const Amount& amount) {
    if (spender != from) {
        auto it = state_.allowances.find({from, spender});
        if (it == state_.allowances.end() || it->second < amount) {
            throw CollaboratorError(symbol_ + ": insufficient allowance");
        }
        // Unlimited allowances are never decremented
        if (it->second != MAX_AMOUNT) {
            it->second -= amount;
        }
    }
    move(from, to, amount);
}

void Ledger::move(const Address& from, const Address& to, const Amount& amount) {
    if (addresses::is_null(to)) {
        throw CollaboratorError(symbol_ + ": transfer to the zero address");
    }

    auto it = state_.balances.find(from);
    if (it == state_.balances.end() || it->second < amount) {
        throw CollaboratorError(symbol_ + ": transfer amount exceeds balance");
    }

    const Amount fee = amount * transfer_fee_bps_ / bps::DENOMINATOR;
    it->second -= amount;
    state_.balances[to] += amount - fee;
    state_.total_supply -= fee;

    if (hook_) {
        hook_(from, to, amount);
    }
}

void Ledger::mint_units(const Address& to, const Amount& amount) {
    state_.total_supply += amount;
    state_.balances[to] += amount;
}

void Ledger::burn_units(const Address& from, const Amount& amount) {
    auto it = state_.balances.find(from);
    if (it == state_.balances.end() || it->second < amount) {
        throw CollaboratorError(symbol_ + ": burn amount exceeds balance");
    }
    it->second -= amount;
    state_.total_supply -= amount;
}

// =============================================================================
// Checkpoint
// =============================================================================

std::function<void()> Ledger::checkpoint() {
    return [this, saved = state_]() { state_ = saved; };
}

} // namespace sim
} // namespace zap
