#ifndef MERCURI_TYPES_HPP
#define MERCURI_TYPES_HPP

#include <cstdint>
#include <array>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mercuri {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace address {

constexpr Address ZERO = {};

// Build an address whose low 8 bytes hold `n` (big-endian).
constexpr Address from_u64(uint64_t n) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) if (b != 0) return false;
    return true;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts an optional "0x" prefix; throws VaultError(CONFIGURATION_ERROR) on bad input
Address from_hex(std::string_view hex);

} // namespace address

// =============================================================================
// Token Amounts
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 I128_MAX = static_cast<I128>(~U128(0) >> 1);

namespace amount {

std::string to_string(I128 v);

// Decimal integer string, optional leading '-'
I128 from_string(std::string_view s);

} // namespace amount

// Basis points denominator for the performance fee
constexpr uint32_t BPS_DENOMINATOR = 10000;

// Hard ceiling on the protocol performance fee (20%)
constexpr uint32_t MAX_PERFORMANCE_FEE_BPS = 2000;

// Passed to engine calls that must not expire (emergency teardown)
constexpr uint64_t NO_DEADLINE = std::numeric_limits<uint64_t>::max();

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool is_zero() const { return address::is_zero(addr); }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// =============================================================================
// Pool Key (identity of the pool a vault is bound to)
// =============================================================================

struct PoolKey {
    Address pool;            // Pool contract address
    Currency token0;         // Sorted: token0 < token1
    Currency token1;
    uint32_t fee;            // Fee tier in hundredths of a bip (500 = 0.05%)
    int32_t tick_spacing;

    bool contains(const Currency& c) const { return c == token0 || c == token1; }

    bool operator==(const PoolKey& other) const {
        return pool == other.pool &&
               token0 == other.token0 &&
               token1 == other.token1 &&
               fee == other.fee &&
               tick_spacing == other.tick_spacing;
    }
};

// Standard fee tiers (in hundredths of a bip)
namespace fees {
constexpr uint32_t FEE_001 = 100;     // 0.01%
constexpr uint32_t FEE_005 = 500;     // 0.05%
constexpr uint32_t FEE_030 = 3000;    // 0.30%
constexpr uint32_t FEE_100 = 10000;   // 1.00%
}

// =============================================================================
// Token Amount Pair
// =============================================================================

struct TokenAmounts {
    I128 amount0 = 0;
    I128 amount1 = 0;

    bool is_zero() const { return amount0 == 0 && amount1 == 0; }

    TokenAmounts operator+(const TokenAmounts& other) const {
        return {amount0 + other.amount0, amount1 + other.amount1};
    }

    TokenAmounts operator-(const TokenAmounts& other) const {
        return {amount0 - other.amount0, amount1 - other.amount1};
    }

    bool operator==(const TokenAmounts& other) const {
        return amount0 == other.amount0 && amount1 == other.amount1;
    }
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t INVALID_TICK_RANGE = -3;
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t INSUFFICIENT_ALLOWANCE = -11;
constexpr int32_t POSITION_NOT_FOUND = -12;
constexpr int32_t DEADLINE_EXPIRED = -13;
constexpr int32_t INVALID_AMOUNT = -22;
constexpr int32_t REENTRANCY = -30;
constexpr int32_t UNAUTHORIZED = -40;
constexpr int32_t INVALID_STATE = -41;
constexpr int32_t INVALID_REFERENCE = -42;
constexpr int32_t SLIPPAGE_VIOLATION = -43;
constexpr int32_t TRANSFER_FAILURE = -44;
constexpr int32_t CONFIGURATION_ERROR = -45;

const char* name(int32_t code);
}

// Raised for every rejected operation; the in-flight call is reverted
class VaultError : public std::runtime_error {
public:
    VaultError(int32_t code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

} // namespace mercuri

#endif // MERCURI_TYPES_HPP
