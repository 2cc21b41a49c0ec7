#ifndef ZAP_SIM_CHAIN_HPP
#define ZAP_SIM_CHAIN_HPP

#include <functional>
#include <map>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include "zap/interfaces.hpp"

namespace zap {
namespace sim {

// =============================================================================
// Contract - base for every object deployed on the reference chain
// =============================================================================

class Contract {
public:
    explicit Contract(const Address& addr) : address_(addr) {}
    virtual ~Contract() = default;

    Contract(const Contract&) = delete;
    Contract& operator=(const Contract&) = delete;

    const Address& contract_address() const { return address_; }

    // Capture current state; the returned closure restores it
    virtual std::function<void()> checkpoint() = 0;

private:
    Address address_;
};

// =============================================================================
// Chain - in-memory execution environment
//
// Owns deployed contracts, resolves addresses for the zap core, keeps the
// block timestamp and runs transactions all-or-nothing.
// =============================================================================

class Chain : public IContractDirectory {
public:
    explicit Chain(Timestamp genesis_time = 1700000000);
    ~Chain() override = default;

    // Non-copyable
    Chain(const Chain&) = delete;
    Chain& operator=(const Chain&) = delete;

    // =========================================================================
    // Deployment
    // =========================================================================

    // Fresh externally-owned or contract address
    Address allocate_address();

    // Construct T at `addr`; T's constructor receives (addr, args...)
    template <typename T, typename... Args>
    T& deploy(const Address& addr, Args&&... args) {
        auto contract = std::make_unique<T>(addr, std::forward<Args>(args)...);
        T& ref = *contract;
        register_contract(std::move(contract), as_asset(ref), as_pair(ref));
        return ref;
    }

    template <typename T, typename... Args>
    T& deploy_new(Args&&... args) {
        return deploy<T>(allocate_address(), std::forward<Args>(args)...);
    }

    bool has_contract(const Address& addr) const;

    // Typed lookup; CollaboratorError if absent or of another type
    template <typename T>
    T& contract_at(const Address& addr) {
        T* typed = dynamic_cast<T*>(find_contract(addr));
        if (!typed) {
            throw_no_contract(addr);
        }
        return *typed;
    }

    // =========================================================================
    // IContractDirectory
    // =========================================================================

    IFungibleAsset& asset(const Address& addr) override;
    IPair& pair(const Address& addr) override;

    // =========================================================================
    // Clock
    // =========================================================================

    Timestamp timestamp() const { return timestamp_; }
    void advance_time(uint64_t seconds) { timestamp_ += seconds; }

    // =========================================================================
    // Transactions
    // =========================================================================

    // Run `fn` atomically: if it throws, every contract is restored to its
    // state before the call, contracts deployed inside it are removed and
    // the exception propagates.
    template <typename Fn>
    auto transact(Fn&& fn) -> decltype(fn()) {
        auto restore = checkpoint_all();
        const size_t deployed = contracts_.size();
        ++stats_.transactions;
        try {
            return fn();
        } catch (...) {
            ++stats_.reverted;
            undeploy_after(deployed);
            for (auto& r : restore) r();
            throw;
        }
    }

    // Statistics
    struct Stats {
        uint64_t contracts;
        uint64_t transactions;
        uint64_t reverted;
    };
    Stats get_stats() const { return stats_; }

private:
    std::vector<std::unique_ptr<Contract>> contracts_;
    std::map<Address, Contract*> by_address_;
    std::map<Address, IFungibleAsset*> assets_;
    std::map<Address, IPair*> pairs_;

    Timestamp timestamp_;
    uint64_t next_index_{1};
    Stats stats_{0, 0, 0};

    void register_contract(std::unique_ptr<Contract> contract, IFungibleAsset* asset, IPair* pair);
    Contract* find_contract(const Address& addr) const;
    [[noreturn]] static void throw_no_contract(const Address& addr);
    std::vector<std::function<void()>> checkpoint_all();
    void undeploy_after(size_t count);

    template <typename T>
    static IFungibleAsset* as_asset(T& ref) {
        if constexpr (std::is_base_of_v<IFungibleAsset, T>) return &ref;
        else return nullptr;
    }

    template <typename T>
    static IPair* as_pair(T& ref) {
        if constexpr (std::is_base_of_v<IPair, T>) return &ref;
        else return nullptr;
    }
};

} // namespace sim
} // namespace zap

#endif // ZAP_SIM_CHAIN_HPP
