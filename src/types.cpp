// =============================================================================
// types.cpp - Address helpers, X18 decimal conversion, error names
// =============================================================================

#include "isolend/types.hpp"

#include <algorithm>

namespace isolend {

// =============================================================================
// Addresses
// =============================================================================

namespace addresses {

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Address parse(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) {
        throw Error(errors::INVALID_PARAMETER, "address must have 40 hex digits");
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = nibble(hex[2 * i]);
        int lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw Error(errors::INVALID_PARAMETER, "invalid hex digit in address");
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// Decimal conversion
// =============================================================================

std::string to_string(I128 v) {
    if (v == 0) return "0";
    bool negative = v < 0;
    U128 u = negative ? static_cast<U128>(-(v + 1)) + 1 : static_cast<U128>(v);
    std::string out;
    while (u != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(u % 10)));
        u /= 10;
    }
    if (negative) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

namespace x18 {

I128 from_string(std::string_view s) {
    if (s.empty()) {
        throw Error(errors::INVALID_PARAMETER, "empty decimal");
    }

    bool negative = false;
    if (s[0] == '-' || s[0] == '+') {
        negative = s[0] == '-';
        s.remove_prefix(1);
    }

    auto dot = s.find('.');
    std::string_view int_part = s.substr(0, dot);
    std::string_view frac_part = dot == std::string_view::npos ? std::string_view{} : s.substr(dot + 1);

    if (int_part.empty() && frac_part.empty()) {
        throw Error(errors::INVALID_PARAMETER, "malformed decimal");
    }
    if (int_part.size() > 19 || frac_part.size() > 18) {
        throw Error(errors::INVALID_PARAMETER, "decimal out of X18 range");
    }

    I128 whole = 0;
    for (char c : int_part) {
        if (c < '0' || c > '9') throw Error(errors::INVALID_PARAMETER, "malformed decimal");
        whole = whole * 10 + (c - '0');
    }

    I128 frac = 0;
    for (size_t i = 0; i < 18; ++i) {
        int digit = 0;
        if (i < frac_part.size()) {
            char c = frac_part[i];
            if (c < '0' || c > '9') throw Error(errors::INVALID_PARAMETER, "malformed decimal");
            digit = c - '0';
        }
        frac = frac * 10 + digit;
    }

    I128 value = whole * X18_ONE + frac;
    return negative ? -value : value;
}

std::string to_string(I128 v) {
    bool negative = v < 0;
    I128 abs = negative ? -v : v;
    std::string out = isolend::to_string(abs / X18_ONE);

    I128 frac = abs % X18_ONE;
    if (frac != 0) {
        std::string digits = isolend::to_string(frac);
        digits.insert(0, 18 - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') digits.pop_back();
        out += "." + digits;
    }
    return negative ? "-" + out : out;
}

} // namespace x18

// =============================================================================
// Errors
// =============================================================================

namespace errors {

const char* name(int32_t code) {
    switch (code) {
        case OK: return "OK";
        case MARKET_NOT_FOUND: return "MARKET_NOT_FOUND";
        case MARKET_ALREADY_EXISTS: return "MARKET_ALREADY_EXISTS";
        case POSITION_NOT_FOUND: return "POSITION_NOT_FOUND";
        case POSITION_ALREADY_EXISTS: return "POSITION_ALREADY_EXISTS";
        case INVALID_POSITION_ADDRESS: return "INVALID_POSITION_ADDRESS";
        case MARKET_PAUSED: return "MARKET_PAUSED";
        case VAULT_PAUSED: return "VAULT_PAUSED";
        case UNKNOWN_RATE_MODEL: return "UNKNOWN_RATE_MODEL";
        case MALFORMED_ACTION: return "MALFORMED_ACTION";
        case INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case INSUFFICIENT_ALLOWANCE: return "INSUFFICIENT_ALLOWANCE";
        case INSUFFICIENT_SHARES: return "INSUFFICIENT_SHARES";
        case INSUFFICIENT_LIQUIDITY: return "INSUFFICIENT_LIQUIDITY";
        case INSUFFICIENT_WITHDRAW_PATH: return "INSUFFICIENT_WITHDRAW_PATH";
        case REPAY_EXCEEDS_DEBT: return "REPAY_EXCEEDS_DEBT";
        case SEIZE_EXCEEDS_BALANCE: return "SEIZE_EXCEEDS_BALANCE";
        case INVALID_DEBT_MARKET: return "INVALID_DEBT_MARKET";
        case NON_ZERO_BALANCE: return "NON_ZERO_BALANCE";
        case NO_ORACLE: return "NO_ORACLE";
        case PRICE_STALE: return "PRICE_STALE";
        case UNSUPPORTED_ASSET: return "UNSUPPORTED_ASSET";
        case ZERO_SHARES: return "ZERO_SHARES";
        case ZERO_ASSETS: return "ZERO_ASSETS";
        case MATH_OVERFLOW: return "MATH_OVERFLOW";
        case MARKET_INSOLVENT: return "MARKET_INSOLVENT";
        case NO_PENDING_UPDATE: return "NO_PENDING_UPDATE";
        case TIMELOCK_NOT_ELAPSED: return "TIMELOCK_NOT_ELAPSED";
        case TIMELOCK_EXPIRED: return "TIMELOCK_EXPIRED";
        case UNAUTHORIZED: return "UNAUTHORIZED";
        case ONLY_POSITION_MANAGER: return "ONLY_POSITION_MANAGER";
        case UNKNOWN_ASSET: return "UNKNOWN_ASSET";
        case UNKNOWN_SPENDER: return "UNKNOWN_SPENDER";
        case UNKNOWN_FUNC: return "UNKNOWN_FUNC";
        case UNKNOWN_EXEC_TARGET: return "UNKNOWN_EXEC_TARGET";
        case INVALID_PARAMETER: return "INVALID_PARAMETER";
        case LTV_OUT_OF_BOUNDS: return "LTV_OUT_OF_BOUNDS";
        case DEPOSIT_CAP_EXCEEDED: return "DEPOSIT_CAP_EXCEEDED";
        case BORROW_CAP_EXCEEDED: return "BORROW_CAP_EXCEEDED";
        case POOL_CAP_EXCEEDED: return "POOL_CAP_EXCEEDED";
        case SUPER_POOL_CAP_EXCEEDED: return "SUPER_POOL_CAP_EXCEEDED";
        case MAX_ASSETS_EXCEEDED: return "MAX_ASSETS_EXCEEDED";
        case MAX_DEBT_MARKETS_EXCEEDED: return "MAX_DEBT_MARKETS_EXCEEDED";
        case MAX_QUEUE_LENGTH_EXCEEDED: return "MAX_QUEUE_LENGTH_EXCEEDED";
        case BORROW_TOO_SMALL: return "BORROW_TOO_SMALL";
        case DEBT_TOO_LOW: return "DEBT_TOO_LOW";
        case NOT_ENOUGH_BURNED_SHARES: return "NOT_ENOUGH_BURNED_SHARES";
        case ASSET_MISMATCH: return "ASSET_MISMATCH";
        case MARKET_ALREADY_ADDED: return "MARKET_ALREADY_ADDED";
        case MARKET_NOT_IN_QUEUE: return "MARKET_NOT_IN_QUEUE";
        case INVALID_QUEUE_REORDER: return "INVALID_QUEUE_REORDER";
        case HEALTH_CHECK_FAILED: return "HEALTH_CHECK_FAILED";
        case LIQUIDATE_HEALTHY_POSITION: return "LIQUIDATE_HEALTHY_POSITION";
        case CLOSE_FACTOR_EXCEEDED: return "CLOSE_FACTOR_EXCEEDED";
        case SEIZED_TOO_MUCH_COLLATERAL: return "SEIZED_TOO_MUCH_COLLATERAL";
        case NO_BAD_DEBT: return "NO_BAD_DEBT";
        case LIQUIDATION_CREATES_BAD_DEBT: return "LIQUIDATION_CREATES_BAD_DEBT";
        default: return "UNKNOWN_ERROR";
    }
}

} // namespace errors

Error::Error(int32_t code, const std::string& detail)
    : std::runtime_error(detail.empty() ? std::string(errors::name(code))
                                        : std::string(errors::name(code)) + ": " + detail),
      code_(code) {}

} // namespace isolend
