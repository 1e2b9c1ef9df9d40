// Mercuri - Position Lifecycle Tests

#include <catch2/catch_test_macros.hpp>

#include "fixture.hpp"

using namespace mercuri;
using namespace mercuri::test;

TEST_CASE("Mint opens the vault's single position", "[lifecycle]") {
    World w;
    w.fund(1000, 1000);

    MintResult r = w.vault->mint(MANAGER, w.mint_params(1000, 1000));

    REQUIRE(r.token_id != 0);
    REQUIRE(r.liquidity == 2000);
    REQUIRE(w.vault->position_id() == r.token_id);
    REQUIRE(w.vault->state() == PositionState::ACTIVE);
    REQUIRE(w.engine.positions(r.token_id).owner == VAULT);
    REQUIRE(w.balance0(VAULT) == 0);
    REQUIRE(w.balance1(VAULT) == 0);

    SECTION("Engine allowances are reset afterwards") {
        REQUIRE(w.chain.allowance(w.token0(), VAULT, ENGINE) == 0);
        REQUIRE(w.chain.allowance(w.token1(), VAULT, ENGINE) == 0);
    }

    SECTION("Second mint is rejected while active") {
        w.fund(1000, 1000);
        REQUIRE(error_code_of([&] { w.vault->mint(MANAGER, w.mint_params(1000, 1000)); }) ==
                errors::INVALID_STATE);
        REQUIRE(w.vault->position_id() == r.token_id);
        REQUIRE(w.engine.position_count() == 1);
    }
}

TEST_CASE("Mint validation", "[lifecycle]") {
    World w;
    w.fund(1000, 1000);
    MintParams p = w.mint_params(1000, 1000);

    auto rejected = [&](int32_t code) {
        REQUIRE(error_code_of([&] { w.vault->mint(MANAGER, p); }) == code);
        REQUIRE(w.vault->state() == PositionState::EMPTY);
        REQUIRE(w.engine.position_count() == 0);
        REQUIRE(w.balance0(VAULT) == 1000);
        REQUIRE(w.chain.allowance(w.token0(), VAULT, ENGINE) == 0);
    };

    SECTION("Zero minimum amount") {
        p.amount0_min = 0;
        rejected(errors::SLIPPAGE_VIOLATION);
    }

    SECTION("Both minimums zero") {
        p.amount0_min = 0;
        p.amount1_min = 0;
        rejected(errors::SLIPPAGE_VIOLATION);
    }

    SECTION("Recipient other than the vault") {
        p.recipient = MANAGER;
        rejected(errors::INVALID_REFERENCE);
    }

    SECTION("Different fee tier") {
        p.fee = fees::FEE_030;
        rejected(errors::INVALID_REFERENCE);
    }

    SECTION("Token outside the pair") {
        p.token1 = Currency(OTHER_TOKEN);
        rejected(errors::INVALID_REFERENCE);
    }

    SECTION("Engine slippage check") {
        w.engine.set_fill_ratio_bps(9000);
        rejected(errors::SLIPPAGE_VIOLATION);
    }

    SECTION("Expired deadline") {
        w.chain.advance(3600);
        rejected(errors::DEADLINE_EXPIRED);
    }

    SECTION("Inverted tick range") {
        p.tick_lower = 600;
        p.tick_upper = -600;
        rejected(errors::INVALID_TICK_RANGE);
    }

    SECTION("Stranger") {
        REQUIRE(error_code_of([&] { w.vault->mint(STRANGER, p); }) == errors::UNAUTHORIZED);
    }
}

TEST_CASE("Partial fill leaves the remainder in the vault", "[lifecycle]") {
    World w;
    w.fund(1000, 1000);
    w.engine.set_fill_ratio_bps(9950);

    MintResult r = w.vault->mint(MANAGER, w.mint_params(1000, 1000));

    REQUIRE(r.amount0 == 995);
    REQUIRE(w.balance0(VAULT) == 5);
    REQUIRE(w.chain.allowance(w.token0(), VAULT, ENGINE) == 0);
}

TEST_CASE("Operations on the active position", "[lifecycle]") {
    World w;
    uint64_t id = w.open();
    uint64_t deadline = w.chain.now() + 600;

    SECTION("Increase liquidity") {
        w.fund(500, 500);
        IncreaseLiquidityResult r =
            w.vault->increase_liquidity(MANAGER, {id, 500, 500, 1, 1, deadline});

        REQUIRE(r.liquidity == 1000);
        REQUIRE(w.engine.positions(id).liquidity == 3000);
        REQUIRE(w.chain.allowance(w.token0(), VAULT, ENGINE) == 0);
    }

    SECTION("Wrong position id is rejected") {
        REQUIRE(error_code_of([&] {
            w.vault->increase_liquidity(MANAGER, {id + 1, 10, 10, 0, 0, deadline});
        }) == errors::INVALID_REFERENCE);
        REQUIRE(error_code_of([&] {
            w.vault->decrease_liquidity(MANAGER, {id + 1, 100, 0, 0, deadline});
        }) == errors::INVALID_REFERENCE);
        REQUIRE(error_code_of([&] { w.vault->collect_fees(MANAGER, id + 1); }) ==
                errors::INVALID_REFERENCE);
        REQUIRE(error_code_of([&] { w.vault->close_position(MANAGER, id + 1); }) ==
                errors::INVALID_REFERENCE);
        REQUIRE(error_code_of([&] { w.vault->burn(MANAGER, id + 1); }) ==
                errors::INVALID_REFERENCE);
    }

    SECTION("Burn requires a cleared position") {
        REQUIRE(error_code_of([&] { w.vault->burn(MANAGER, id); }) == errors::INVALID_STATE);
        REQUIRE(w.vault->position_id() == id);
        REQUIRE(w.engine.exists(id));
    }

    SECTION("Manual exit: decrease, collect, burn") {
        TokenAmounts out = w.vault->decrease_liquidity(MANAGER, {id, 2000, 0, 0, deadline});
        REQUIRE(out == TokenAmounts{1000, 1000});
        REQUIRE(w.vault->principal_owed() == TokenAmounts{1000, 1000});

        TokenAmounts income = w.vault->collect_fees(MANAGER, id);
        REQUIRE(income.is_zero());
        REQUIRE(w.balance0(VAULT) == 1000);
        REQUIRE(w.balance0(FEE_RECIPIENT) == 0);

        w.vault->burn(MANAGER, id);
        REQUIRE(w.vault->state() == PositionState::EMPTY);
        REQUIRE(w.vault->principal_owed().is_zero());
        REQUIRE_FALSE(w.engine.exists(id));
    }
}

TEST_CASE("Operations without a position", "[lifecycle]") {
    World w;
    uint64_t deadline = w.chain.now() + 600;

    REQUIRE(error_code_of([&] {
        w.vault->increase_liquidity(MANAGER, {1, 10, 10, 0, 0, deadline});
    }) == errors::INVALID_STATE);
    REQUIRE(error_code_of([&] {
        w.vault->decrease_liquidity(MANAGER, {1, 10, 0, 0, deadline});
    }) == errors::INVALID_STATE);
    REQUIRE(error_code_of([&] { w.vault->collect_fees(MANAGER, 1); }) == errors::INVALID_STATE);
    REQUIRE(error_code_of([&] { w.vault->close_position(MANAGER, 1); }) == errors::INVALID_STATE);
    REQUIRE(error_code_of([&] { w.vault->burn(MANAGER, 1); }) == errors::INVALID_STATE);
}

TEST_CASE("Vault can reopen after closing", "[lifecycle]") {
    World w;
    uint64_t first = w.open();
    w.vault->close_position(MANAGER, first);
    REQUIRE(w.vault->state() == PositionState::EMPTY);

    MintResult r = w.vault->mint(MANAGER, w.mint_params(1000, 1000));
    REQUIRE(r.token_id != first);
    REQUIRE(w.vault->position_id() == r.token_id);
}
