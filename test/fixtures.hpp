// Zap - Shared test fixtures
// A reference market with three plain tokens, one fee-on-transfer token and
// a zapper wired to the market's router and factory.

#ifndef ZAP_TEST_FIXTURES_HPP
#define ZAP_TEST_FIXTURES_HPP

#include <zap/errors.hpp>
#include <zap/pair_address.hpp>
#include <zap/sim/chain.hpp>
#include <zap/sim/factory.hpp>
#include <zap/sim/pair.hpp>
#include <zap/sim/router.hpp>
#include <zap/sim/token.hpp>
#include <zap/zapper.hpp>

#include <vector>

namespace zap::testing {

// Code of the ZapError thrown by `fn`, or OK if nothing was thrown
template <typename Fn>
ErrorCode error_code_of(Fn&& fn) {
    try {
        fn();
    } catch (const ZapError& e) {
        return e.code();
    }
    return ErrorCode::OK;
}

struct Market {
    sim::Chain chain;
    sim::Factory& factory;
    sim::Router& router;
    sim::Token& x;
    sim::Token& y;
    sim::Token& z;
    sim::Token& tax;  // 1% transfer fee
    PairAddressResolver resolver;
    Address provider;
    Address alice;
    Address bob;

    Market()
        : factory(chain.deploy_new<sim::Factory>(chain)),
          router(chain.deploy_new<sim::Router>(chain, factory)),
          x(chain.deploy_new<sim::Token>("X")),
          y(chain.deploy_new<sim::Token>("Y")),
          z(chain.deploy_new<sim::Token>("Z")),
          tax(chain.deploy_new<sim::Token>("TAX", 100u)),
          resolver(factory, factory.contract_address()),
          provider(chain.allocate_address()),
          alice(chain.allocate_address()),
          bob(chain.allocate_address()) {}

    Timestamp deadline() const { return chain.timestamp() + 1200; }

    // Create the a/b pool with the given initial reserves (as sent by the provider)
    Address seed_pool(sim::Token& a, sim::Token& b, const Amount& amount_a, const Amount& amount_b) {
        a.mint(provider, amount_a);
        b.mint(provider, amount_b);
        a.approve(provider, router.address(), MAX_AMOUNT);
        b.approve(provider, router.address(), MAX_AMOUNT);
        router.add_liquidity(provider, a.address(), b.address(), amount_a, amount_b, 0, 0,
                             provider, deadline());
        return factory.get_pool(a.address(), b.address());
    }

    sim::Pair& pair_at(const Address& pool) { return chain.contract_at<sim::Pair>(pool); }

    Amount lp_balance(const Address& pool, const Address& owner) {
        return chain.asset(pool).balance_of(owner);
    }
};

// Records every notification
struct EventLog : IZapObserver {
    std::vector<ZapInEvent> zap_ins;
    std::vector<ZapOutEvent> zap_outs;

    void on_zap_in(const ZapInEvent& event) override { zap_ins.push_back(event); }
    void on_zap_out(const ZapOutEvent& event) override { zap_outs.push_back(event); }
};

struct ZapMarket : Market {
    EventLog events;
    Zapper zapper;

    explicit ZapMarket(ZapOptions options = {})
        : zapper(router, resolver, chain, chain.allocate_address(), options, &events) {}

    ZapInRequest zap_in_request(const sim::Token& input, const sim::Token& a, const sim::Token& b,
                                const Amount& amount) const {
        ZapInRequest request;
        request.input_asset = input.address();
        request.pair_asset_a = a.address();
        request.pair_asset_b = b.address();
        request.input_amount = amount;
        request.max_slippage_bps = 50;
        request.minimum_liquidity_out = 0;
        request.deadline = deadline();
        request.fee_on_transfer = false;
        return request;
    }

    ZapOutRequest zap_out_request(const sim::Token& output, const sim::Token& a, const sim::Token& b,
                                  const Amount& liquidity) const {
        ZapOutRequest request;
        request.output_asset = output.address();
        request.pair_asset_a = a.address();
        request.pair_asset_b = b.address();
        request.liquidity_in = liquidity;
        request.max_slippage_bps = 50;
        request.minimum_output_amount = 0;
        request.deadline = deadline();
        request.fee_on_transfer = false;
        return request;
    }

    // Fund `who` and approve the zapper, then zap in atomically
    Amount fund_and_zap_in(const Address& who, sim::Token& input, const ZapInRequest& request) {
        input.mint(who, request.input_amount);
        input.approve(who, zapper.address(), request.input_amount);
        return chain.transact([&] { return zapper.zap_in_single_token(who, request); });
    }

    Amount approve_and_zap_out(const Address& who, const ZapOutRequest& request) {
        const Address pool = factory.get_pool(request.pair_asset_a, request.pair_asset_b);
        chain.asset(pool).approve(who, zapper.address(), request.liquidity_in);
        return chain.transact([&] { return zapper.zap_out_single_token(who, request); });
    }
};

} // namespace zap::testing

#endif // ZAP_TEST_FIXTURES_HPP
