// =============================================================================
// types.cpp - Address/amount formatting and error names
// =============================================================================

#include "mercuri/types.hpp"

#include <algorithm>

namespace mercuri {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// =============================================================================
// Addresses
// =============================================================================

std::string address::to_hex(const Address& addr) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Address address::from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) {
        throw VaultError(errors::CONFIGURATION_ERROR,
                         "address must have 40 hex digits: " + std::string(hex));
    }

    Address addr = {};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_digit(hex[2 * i]);
        int lo = hex_digit(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw VaultError(errors::CONFIGURATION_ERROR,
                             "invalid hex digit in address: " + std::string(hex));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

// =============================================================================
// Amounts
// =============================================================================

std::string amount::to_string(I128 v) {
    if (v == 0) return "0";

    bool negative = v < 0;
    U128 u = negative ? U128(0) - static_cast<U128>(v) : static_cast<U128>(v);

    std::string out;
    while (u > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(u % 10)));
        u /= 10;
    }
    if (negative) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

I128 amount::from_string(std::string_view s) {
    bool negative = false;
    if (!s.empty() && s[0] == '-') {
        negative = true;
        s.remove_prefix(1);
    }
    if (s.empty()) {
        throw VaultError(errors::INVALID_AMOUNT, "empty amount");
    }

    I128 v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            throw VaultError(errors::INVALID_AMOUNT, "invalid amount: " + std::string(s));
        }
        if (v > (I128_MAX - (c - '0')) / 10) {
            throw VaultError(errors::INVALID_AMOUNT, "amount overflows 128 bits: " + std::string(s));
        }
        v = v * 10 + (c - '0');
    }
    return negative ? -v : v;
}

// =============================================================================
// Error Names
// =============================================================================

const char* errors::name(int32_t code) {
    switch (code) {
        case OK: return "OK";
        case INVALID_TICK_RANGE: return "InvalidTickRange";
        case INSUFFICIENT_BALANCE: return "InsufficientBalance";
        case INSUFFICIENT_ALLOWANCE: return "InsufficientAllowance";
        case POSITION_NOT_FOUND: return "PositionNotFound";
        case DEADLINE_EXPIRED: return "DeadlineExpired";
        case INVALID_AMOUNT: return "InvalidAmount";
        case REENTRANCY: return "Reentrant";
        case UNAUTHORIZED: return "Unauthorized";
        case INVALID_STATE: return "InvalidState";
        case INVALID_REFERENCE: return "InvalidReference";
        case SLIPPAGE_VIOLATION: return "SlippageViolation";
        case TRANSFER_FAILURE: return "TransferFailure";
        case CONFIGURATION_ERROR: return "ConfigurationError";
        default: return "Unknown";
    }
}

} // namespace mercuri
