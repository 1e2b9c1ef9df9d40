// Mercuri - Types Tests

#include <catch2/catch_test_macros.hpp>

#include "fixture.hpp"

using namespace mercuri;
using namespace mercuri::test;

TEST_CASE("Address hex formatting", "[types]") {
    SECTION("Round trip through hex") {
        Address a = address::from_u64(0xDEADBEEF);
        std::string hex = address::to_hex(a);
        REQUIRE(hex == "0x00000000000000000000000000000000deadbeef");
        REQUIRE(address::from_hex(hex) == a);
    }

    SECTION("Prefix is optional and case is ignored") {
        REQUIRE(address::from_hex("00000000000000000000000000000000DEADBEEF") ==
                address::from_u64(0xDEADBEEF));
    }

    SECTION("Malformed input is a configuration error") {
        REQUIRE(error_code_of([] { address::from_hex("0x1234"); }) == errors::CONFIGURATION_ERROR);
        REQUIRE(error_code_of([] {
            address::from_hex("0xzz000000000000000000000000000000deadbeef");
        }) == errors::CONFIGURATION_ERROR);
    }

    SECTION("Zero address") {
        REQUIRE(address::is_zero(address::ZERO));
        REQUIRE_FALSE(address::is_zero(OWNER));
    }
}

TEST_CASE("128-bit amount strings", "[types]") {
    SECTION("Parse and format") {
        I128 big = amount::from_string("1000000000000000000000000");
        REQUIRE(amount::to_string(big) == "1000000000000000000000000");
        REQUIRE(amount::to_string(amount::from_string("-42")) == "-42");
        REQUIRE(amount::to_string(0) == "0");
        REQUIRE(amount::to_string(I128_MAX) == "170141183460469231731687303715884105727");
    }

    SECTION("Rejects garbage and overflow") {
        REQUIRE(error_code_of([] { amount::from_string(""); }) == errors::INVALID_AMOUNT);
        REQUIRE(error_code_of([] { amount::from_string("12a"); }) == errors::INVALID_AMOUNT);
        REQUIRE(error_code_of([] {
            amount::from_string("170141183460469231731687303715884105728");
        }) == errors::INVALID_AMOUNT);
    }
}

TEST_CASE("Pool key and amounts", "[types]") {
    PoolKey key{POOL, Currency(TOKEN), Currency(WETH), fees::FEE_030, 60};

    REQUIRE(key.contains(Currency(TOKEN)));
    REQUIRE(key.contains(Currency(WETH)));
    REQUIRE_FALSE(key.contains(Currency(OTHER_TOKEN)));

    TokenAmounts a{10, 20};
    TokenAmounts b{3, 5};
    REQUIRE((a + b) == TokenAmounts{13, 25});
    REQUIRE((a - b) == TokenAmounts{7, 15});
    REQUIRE(TokenAmounts{}.is_zero());
}

TEST_CASE("Error names", "[types]") {
    REQUIRE(std::string(errors::name(errors::UNAUTHORIZED)) == "Unauthorized");
    REQUIRE(std::string(errors::name(errors::REENTRANCY)) == "Reentrant");
    REQUIRE(std::string(errors::name(12345)) == "Unknown");

    VaultError e(errors::SLIPPAGE_VIOLATION, "too little");
    REQUIRE(e.code() == errors::SLIPPAGE_VIOLATION);
    REQUIRE(std::string(e.what()) == "too little");
}
