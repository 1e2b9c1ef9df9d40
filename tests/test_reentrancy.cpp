// Mercuri - Reentrancy Tests

#include <catch2/catch_test_macros.hpp>

#include "fixture.hpp"

using namespace mercuri;
using namespace mercuri::test;

TEST_CASE("Callback reentry during teardown", "[reentrancy]") {
    World w;
    uint64_t id = w.open();
    w.engine.accrue_fees(id, 100, 50);

    SECTION("Propagated rejection reverts the outer call") {
        w.fee_config.on_read = [&] { w.vault->withdraw_all(OWNER); };

        REQUIRE(error_code_of([&] { w.vault->close_position(MANAGER, id); }) == errors::REENTRANCY);

        REQUIRE(w.vault->position_id() == id);
        REQUIRE(w.engine.exists(id));
        REQUIRE(w.engine.positions(id).liquidity == 2000);
        REQUIRE(w.engine.pending_fees(id) == TokenAmounts{100, 50});
        REQUIRE(w.balance0(VAULT) == 0);
        REQUIRE(w.balance0(OWNER) == 0);
        REQUIRE(w.balance0(FEE_RECIPIENT) == 0);
        REQUIRE(w.vault->accrued_fees().is_zero());
        REQUIRE(w.events.total() == 0);
        REQUIRE(w.chain.depth() == 0);

        // Guard was released
        w.fee_config.on_read = nullptr;
        w.vault->close_position(MANAGER, id);
        REQUIRE(w.vault->state() == PositionState::EMPTY);
    }

    SECTION("Swallowed rejection lets the outer call finish") {
        int32_t inner = errors::OK;
        w.fee_config.on_read = [&] {
            inner = error_code_of([&] { w.vault->set_manager(OWNER, STRANGER); });
        };

        w.vault->close_position(MANAGER, id);

        REQUIRE(inner == errors::REENTRANCY);
        REQUIRE(w.vault->manager() == MANAGER);
        REQUIRE(w.vault->state() == PositionState::EMPTY);
        REQUIRE(w.balance0(FEE_RECIPIENT) == 10);
        REQUIRE(w.events.managers.empty());
    }
}

TEST_CASE("Native receipt reentry during withdrawal", "[reentrancy][native]") {
    World w;
    w.fund(0, 300);
    w.vault->set_unwrap_native(OWNER, true);

    RejectingReceiver owner_wallet;
    int32_t inner = errors::OK;
    owner_wallet.on_receive = [&] {
        inner = error_code_of([&] { w.vault->withdraw_all(OWNER); });
    };
    w.chain.set_receiver(OWNER, &owner_wallet);

    REQUIRE(error_code_of([&] { w.vault->withdraw_all(OWNER); }) == errors::TRANSFER_FAILURE);
    REQUIRE(inner == errors::REENTRANCY);
    REQUIRE(w.balance1(VAULT) == 300);
    REQUIRE(w.chain.balance_of(OWNER) == 0);
}

TEST_CASE("Every entry point is guarded", "[reentrancy]") {
    World w;
    uint64_t id = w.open();
    w.engine.accrue_fees(id, 10, 10);
    uint64_t deadline = w.chain.now() + 600;

    std::vector<int32_t> codes;
    w.fee_config.on_read = [&] {
        auto probe = [&](auto&& fn) { codes.push_back(error_code_of(fn)); };
        probe([&] { w.vault->set_manager(OWNER, STRANGER); });
        probe([&] { w.vault->set_unwrap_native(OWNER, true); });
        probe([&] { w.vault->deposit(OWNER, w.token0(), 1); });
        probe([&] { w.vault->mint(MANAGER, w.mint_params(10, 10)); });
        probe([&] { w.vault->increase_liquidity(MANAGER, {id, 1, 1, 0, 0, deadline}); });
        probe([&] { w.vault->decrease_liquidity(MANAGER, {id, 1, 0, 0, deadline}); });
        probe([&] { w.vault->burn(MANAGER, id); });
        probe([&] { w.vault->collect_fees(MANAGER, id); });
        probe([&] { w.vault->close_position(MANAGER, id); });
        probe([&] { w.vault->withdraw_all(OWNER); });
        probe([&] {
            w.vault->rebalance(MANAGER, {w.token0(), w.token1(), fees::FEE_005, VAULT, 1, 0, 0});
        });
    };

    w.vault->collect_fees(MANAGER, id);

    REQUIRE(codes.size() == 11);
    for (int32_t code : codes) {
        REQUIRE(code == errors::REENTRANCY);
    }
}
