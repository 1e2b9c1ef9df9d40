// Mercuri - Fee Ledger Tests

#include <catch2/catch_test_macros.hpp>

#include "fixture.hpp"

using namespace mercuri;
using namespace mercuri::test;

TEST_CASE("Basis point arithmetic", "[ledger]") {
    REQUIRE(apply_bps(10000, 2000) == 2000);
    REQUIRE(apply_bps(100, 1000) == 10);

    SECTION("Rounds down") {
        REQUIRE(apply_bps(9999, 1) == 0);
        REQUIRE(apply_bps(7, 1000) == 0);
        REQUIRE(apply_bps(19999, 5000) == 9999);
    }

    SECTION("Zero and negative inputs") {
        REQUIRE(apply_bps(0, 2000) == 0);
        REQUIRE(apply_bps(1000, 0) == 0);
        REQUIRE(apply_bps(-1000, 2000) == 0);
    }

    SECTION("No overflow near the top of the range") {
        REQUIRE(apply_bps(I128_MAX, BPS_DENOMINATOR) == I128_MAX);
        REQUIRE(apply_bps(I128_MAX, 2000) == I128_MAX / 5);
    }
}

TEST_CASE("Fee ledger booking", "[ledger]") {
    FeeLedger ledger;
    REQUIRE(ledger.settled());

    SECTION("Collect with liquidity in place is income") {
        TokenAmounts income = ledger.accrue({100, 50}, 2000);
        REQUIRE(income == TokenAmounts{100, 50});
        REQUIRE(ledger.accrued() == TokenAmounts{100, 50});
        REQUIRE_FALSE(ledger.settled());
        REQUIRE(ledger.performance_fee(1000) == TokenAmounts{10, 5});

        ledger.clear_accrued();
        REQUIRE(ledger.settled());
    }

    SECTION("Collect with zero liquidity books nothing") {
        TokenAmounts income = ledger.accrue({100, 50}, 0);
        REQUIRE(income.is_zero());
        REQUIRE(ledger.settled());
    }

    SECTION("Recorded principal is netted out") {
        ledger.record_principal({500, 500});
        TokenAmounts income = ledger.accrue({600, 450}, 1000);

        REQUIRE(income == TokenAmounts{100, 0});
        REQUIRE(ledger.principal_owed() == TokenAmounts{0, 50});
    }

    SECTION("Negative values are rejected") {
        REQUIRE(error_code_of([&] { ledger.record_principal({-1, 0}); }) == errors::INVALID_AMOUNT);
        REQUIRE(error_code_of([&] { ledger.accrue({0, -1}, 1000); }) == errors::INVALID_AMOUNT);
        REQUIRE(ledger.principal_owed().is_zero());
    }
}
