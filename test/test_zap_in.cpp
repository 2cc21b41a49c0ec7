// Zap - Zap-In Tests

#include <catch2/catch_test_macros.hpp>

#include "fixtures.hpp"

using namespace zap;
using namespace zap::testing;

TEST_CASE("Zap in sizes the swap optimally", "[zap_in]") {
    ZapMarket m;
    const Address pool = m.seed_pool(m.x, m.y, 1000000, 1000000);

    SECTION("Pool 1e6/1e6, 1e4 in") {
        const Amount minted = m.fund_and_zap_in(m.alice, m.x, m.zap_in_request(m.x, m.x, m.y, 10000));

        REQUIRE(minted == 4979);
        REQUIRE(m.lp_balance(pool, m.alice) == 4979);
        REQUIRE(m.x.balance_of(m.alice) == 0);
        REQUIRE(m.y.balance_of(m.alice) == 0);

        // Nothing left in custody
        REQUIRE(m.x.balance_of(m.zapper.address()) == 0);
        REQUIRE(m.y.balance_of(m.zapper.address()) == 0);
        REQUIRE(m.lp_balance(pool, m.zapper.address()) == 0);

        REQUIRE(m.events.zap_ins.size() == 1);
        const ZapInEvent& event = m.events.zap_ins.front();
        REQUIRE(event.caller == m.alice);
        REQUIRE(event.input_asset == m.x.address());
        REQUIRE(event.pair_asset_a == m.x.address());
        REQUIRE(event.pair_asset_b == m.y.address());
        REQUIRE(event.input_amount == 10000);
        REQUIRE(event.liquidity_minted == 4979);
        REQUIRE(event.amount_swapped == 4995);
        REQUIRE(event.amount_received == 4955);
        REQUIRE(event.refund_input == 0);
        REQUIRE(event.refund_other == 0);
    }

    SECTION("Input may be either pair asset") {
        const Amount minted = m.fund_and_zap_in(m.bob, m.y, m.zap_in_request(m.y, m.x, m.y, 10000));
        REQUIRE(minted == 4979);
        REQUIRE(m.lp_balance(pool, m.bob) == 4979);
    }

    SECTION("Beats swapping half and depositing") {
        Market naive;
        const Address naive_pool = naive.seed_pool(naive.x, naive.y, 1000000, 1000000);
        naive.x.mint(naive.alice, 10000);
        naive.x.approve(naive.alice, naive.router.address(), MAX_AMOUNT);
        naive.y.approve(naive.alice, naive.router.address(), MAX_AMOUNT);

        const auto swapped = naive.router.swap_exact(naive.alice, 5000, 0,
                                                     {naive.x.address(), naive.y.address()},
                                                     naive.alice, naive.deadline());
        const AddLiquidityResult added = naive.router.add_liquidity(
            naive.alice, naive.x.address(), naive.y.address(), 5000, swapped.back(), 0, 0,
            naive.alice, naive.deadline());
        REQUIRE(added.liquidity == 4974);
        REQUIRE(naive.lp_balance(naive_pool, naive.alice) == 4974);

        const Amount minted = m.fund_and_zap_in(m.alice, m.x, m.zap_in_request(m.x, m.x, m.y, 10000));
        REQUIRE(minted > added.liquidity);
    }

    SECTION("Dust from the ratio-matching deposit is refunded") {
        const Amount minted = m.fund_and_zap_in(m.alice, m.x, m.zap_in_request(m.x, m.x, m.y, 1000));
        REQUIRE(minted == 497);
        REQUIRE(m.events.zap_ins.back().refund_input == 2);
        REQUIRE(m.x.balance_of(m.alice) == 2);
        REQUIRE(m.x.balance_of(m.zapper.address()) == 0);
    }
}

TEST_CASE("Zap in options", "[zap_in]") {
    SECTION("Rounding up over-swaps by one unit") {
        ZapOptions options;
        options.swap_rounding = math::SwapRounding::Up;
        ZapMarket m(options);
        m.seed_pool(m.x, m.y, 1000000, 1000000);

        const Amount minted = m.fund_and_zap_in(m.alice, m.x, m.zap_in_request(m.x, m.x, m.y, 10000));
        REQUIRE(m.events.zap_ins.back().amount_swapped == 4996);
        REQUIRE(minted == 4978);
        REQUIRE(m.y.balance_of(m.alice) == 2);
    }

    SECTION("Dust stays in custody when refunds are off") {
        ZapOptions options;
        options.refund_dust = false;
        ZapMarket m(options);
        m.seed_pool(m.x, m.y, 1000000, 1000000);

        m.fund_and_zap_in(m.alice, m.x, m.zap_in_request(m.x, m.x, m.y, 1000));
        REQUIRE(m.x.balance_of(m.alice) == 0);
        REQUIRE(m.x.balance_of(m.zapper.address()) == 2);
        REQUIRE(m.events.zap_ins.back().refund_input == 0);
    }

    SECTION("Registry is authoritative when derivation disagrees") {
        Market m;
        const Address pool = m.seed_pool(m.x, m.y, 1000000, 1000000);
        PairAddressResolver elsewhere(m.factory, addresses::from_index(0xdead));
        Zapper zapper(m.router, elsewhere, m.chain, m.chain.allocate_address());

        ZapInRequest request;
        request.input_asset = m.x.address();
        request.pair_asset_a = m.x.address();
        request.pair_asset_b = m.y.address();
        request.input_amount = 10000;
        request.max_slippage_bps = 50;
        request.minimum_liquidity_out = 0;
        request.deadline = m.deadline();
        request.fee_on_transfer = false;

        m.x.mint(m.alice, 10000);
        m.x.approve(m.alice, zapper.address(), 10000);
        REQUIRE(zapper.zap_in_single_token(m.alice, request) == 4979);
        REQUIRE(zapper.resolve_pool(m.x.address(), m.y.address()) == pool);
    }
}

TEST_CASE("Zap in rejects invalid requests", "[zap_in]") {
    ZapMarket m;
    const Address pool = m.seed_pool(m.x, m.y, 1000000, 1000000);

    auto expect_failure = [&](sim::Token& input, const ZapInRequest& request, ErrorCode expected) {
        const ErrorCode code = error_code_of([&] { m.fund_and_zap_in(m.alice, input, request); });
        REQUIRE(code == expected);

        // All or nothing
        REQUIRE(input.balance_of(m.alice) == request.input_amount);
        REQUIRE(input.balance_of(m.zapper.address()) == 0);
        REQUIRE(m.lp_balance(pool, m.alice) == 0);
        REQUIRE(m.events.zap_ins.empty());
    };

    SECTION("Zero amount") {
        expect_failure(m.x, m.zap_in_request(m.x, m.x, m.y, 0), ErrorCode::ZERO_AMOUNT);
    }

    SECTION("Slippage tolerance above 100%") {
        auto request = m.zap_in_request(m.x, m.x, m.y, 10000);
        request.max_slippage_bps = 10001;
        expect_failure(m.x, request, ErrorCode::INVALID_SLIPPAGE);
    }

    SECTION("Input outside the pair") {
        expect_failure(m.z, m.zap_in_request(m.z, m.x, m.y, 10000), ErrorCode::UNSUPPORTED_INPUT_TOKEN);
    }

    SECTION("Pool does not exist") {
        expect_failure(m.x, m.zap_in_request(m.x, m.x, m.z, 10000), ErrorCode::PAIR_NOT_FOUND);
    }

    SECTION("Pool has no reserves") {
        m.factory.create_pair(m.x.address(), m.z.address());
        expect_failure(m.x, m.zap_in_request(m.x, m.x, m.z, 10000), ErrorCode::SWAP_BOUNDS_VIOLATED);
    }

    SECTION("Input too small to split") {
        expect_failure(m.x, m.zap_in_request(m.x, m.x, m.y, 1), ErrorCode::SWAP_BOUNDS_VIOLATED);
    }

    SECTION("Split whose swap leg yields nothing") {
        // Sized to swap 1 unit, which the pool prices at zero output
        expect_failure(m.x, m.zap_in_request(m.x, m.x, m.y, 2), ErrorCode::EXTERNAL_COLLABORATOR_FAILURE);
    }

    SECTION("Minted liquidity below the caller's floor") {
        auto request = m.zap_in_request(m.x, m.x, m.y, 10000);
        request.minimum_liquidity_out = 4980;
        expect_failure(m.x, request, ErrorCode::SLIPPAGE_EXCEEDED);
    }

    SECTION("Expired deadline is a router rejection") {
        auto request = m.zap_in_request(m.x, m.x, m.y, 10000);
        request.deadline = m.chain.timestamp() - 1;
        expect_failure(m.x, request, ErrorCode::EXTERNAL_COLLABORATOR_FAILURE);
        REQUIRE(m.chain.get_stats().reverted == 1);
    }

    SECTION("Caller without allowance") {
        auto request = m.zap_in_request(m.x, m.x, m.y, 10000);
        m.x.mint(m.alice, 10000);
        const ErrorCode code = error_code_of([&] {
            m.chain.transact([&] { return m.zapper.zap_in_single_token(m.alice, request); });
        });
        REQUIRE(code == ErrorCode::EXTERNAL_COLLABORATOR_FAILURE);
        REQUIRE(m.x.balance_of(m.alice) == 10000);
    }
}

TEST_CASE("Zap in with a fee-on-transfer asset", "[zap_in]") {
    ZapMarket m;
    const Address pool = m.seed_pool(m.tax, m.y, 1000000, 1000000);

    // Seeding paid the 1% fee on the way into the pool
    REQUIRE(m.router.get_reserves(m.tax.address(), m.y.address()).first == 990000);

    SECTION("Accounting follows measured balances") {
        const Amount quoted = m.router.quote_amounts_out(4945, {m.tax.address(), m.y.address()}).back();
        REQUIRE(quoted == 4955);

        auto request = m.zap_in_request(m.tax, m.tax, m.y, 10000);
        request.max_slippage_bps = 300;
        request.fee_on_transfer = true;
        const Amount minted = m.fund_and_zap_in(m.bob, m.tax, request);

        const ZapInEvent& event = m.events.zap_ins.back();
        REQUIRE(event.amount_swapped == 4945);  // sized on the 9900 actually credited
        REQUIRE(event.amount_received == 4906);
        REQUIRE(event.amount_received < quoted);
        REQUIRE(minted == 4856);
        REQUIRE(m.lp_balance(pool, m.bob) == 4856);

        REQUIRE(event.refund_input == 50);
        REQUIRE(m.tax.balance_of(m.bob) == 50);
        REQUIRE(m.tax.balance_of(m.zapper.address()) == 0);
        REQUIRE(m.y.balance_of(m.zapper.address()) == 0);
    }

    SECTION("Trusting nominal amounts fails") {
        auto request = m.zap_in_request(m.tax, m.tax, m.y, 10000);
        request.max_slippage_bps = 300;
        const ErrorCode code = error_code_of([&] { m.fund_and_zap_in(m.bob, m.tax, request); });
        REQUIRE(code == ErrorCode::EXTERNAL_COLLABORATOR_FAILURE);
        REQUIRE(m.tax.balance_of(m.bob) == 10000);
    }
}

TEST_CASE("Zap in is not reentrant", "[zap_in]") {
    ZapMarket m;
    const Address pool = m.seed_pool(m.x, m.y, 1000000, 1000000);
    const auto request = m.zap_in_request(m.x, m.x, m.y, 10000);

    SECTION("Nested zap in from an asset callback") {
        m.x.set_transfer_hook([&](const Address&, const Address&, const Amount&) {
            m.zapper.zap_in_single_token(m.bob, request);
        });
        const ErrorCode code = error_code_of([&] { m.fund_and_zap_in(m.alice, m.x, request); });
        REQUIRE(code == ErrorCode::REENTRANCY_VIOLATION);
        REQUIRE(m.x.balance_of(m.alice) == 10000);
    }

    SECTION("Nested zap out from an asset callback") {
        m.x.set_transfer_hook([&](const Address&, const Address&, const Amount&) {
            m.zapper.zap_out_single_token(m.bob, m.zap_out_request(m.x, m.x, m.y, 1));
        });
        const ErrorCode code = error_code_of([&] { m.fund_and_zap_in(m.alice, m.x, request); });
        REQUIRE(code == ErrorCode::REENTRANCY_VIOLATION);
    }

    // The lock is released after the aborted call
    m.x.set_transfer_hook(nullptr);
    m.x.burn(m.alice, m.x.balance_of(m.alice));
    REQUIRE(m.fund_and_zap_in(m.alice, m.x, request) == 4979);
    REQUIRE(m.lp_balance(pool, m.alice) == 4979);
}
