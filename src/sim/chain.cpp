// =============================================================================
// chain.cpp - In-memory execution environment for the reference market
// =============================================================================

#include "zap/sim/chain.hpp"
#include "zap/errors.hpp"

namespace zap {
namespace sim {

Chain::Chain(Timestamp genesis_time) : timestamp_(genesis_time) {}

Address Chain::allocate_address() {
    // Skip anything already taken (pairs live at derived addresses)
    Address addr;
    do {
        addr = addresses::from_index(0x10000 + next_index_++);
    } while (by_address_.count(addr) != 0);
    return addr;
}

void Chain::register_contract(std::unique_ptr<Contract> contract, IFungibleAsset* asset, IPair* pair) {
    const Address addr = contract->contract_address();
    if (addresses::is_null(addr) || by_address_.count(addr) != 0) {
        throw CollaboratorError("address already in use: " + to_hex(addr));
    }

    by_address_[addr] = contract.get();
    if (asset) assets_[addr] = asset;
    if (pair) pairs_[addr] = pair;
    contracts_.push_back(std::move(contract));
    stats_.contracts = contracts_.size();
}

bool Chain::has_contract(const Address& addr) const {
    return by_address_.find(addr) != by_address_.end();
}

Contract* Chain::find_contract(const Address& addr) const {
    auto it = by_address_.find(addr);
    return it == by_address_.end() ? nullptr : it->second;
}

void Chain::throw_no_contract(const Address& addr) {
    throw CollaboratorError("no matching contract at " + to_hex(addr));
}

IFungibleAsset& Chain::asset(const Address& addr) {
    auto it = assets_.find(addr);
    if (it == assets_.end()) {
        throw CollaboratorError("no asset contract at " + to_hex(addr));
    }
    return *it->second;
}

IPair& Chain::pair(const Address& addr) {
    auto it = pairs_.find(addr);
    if (it == pairs_.end()) {
        throw CollaboratorError("no pair contract at " + to_hex(addr));
    }
    return *it->second;
}

std::vector<std::function<void()>> Chain::checkpoint_all() {
    std::vector<std::function<void()>> restore;
    restore.reserve(contracts_.size());
    for (auto& contract : contracts_) {
        restore.push_back(contract->checkpoint());
    }
    return restore;
}

void Chain::undeploy_after(size_t count) {
    while (contracts_.size() > count) {
        const Address addr = contracts_.back()->contract_address();
        by_address_.erase(addr);
        assets_.erase(addr);
        pairs_.erase(addr);
        contracts_.pop_back();
    }
    stats_.contracts = contracts_.size();
}

} // namespace sim
} // namespace zap
