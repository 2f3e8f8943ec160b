#ifndef ISOLEND_TYPES_HPP
#define ISOLEND_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <stdexcept>

namespace isolend {

// =============================================================================
// Addresses (EVM-style 20-byte identities)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Shares minted to DEAD can never be redeemed
constexpr Address DEAD = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0xde,0xad};

// Protocol components
constexpr Address LEDGER             = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0x50,0x10};
constexpr Address RISK_ENGINE        = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0x50,0x20};
constexpr Address RISK_MODULE        = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0x50,0x21};
constexpr Address POSITION_MANAGER   = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0x50,0x30};
constexpr Address SUPER_POOL_FACTORY = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0x50,0x40};

// Address whose low 8 bytes hold `id` (test accounts, tokens, keys)
constexpr Address from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) if (b != 0) return false;
    return true;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts with or without "0x"; throws Error(INVALID_PARAMETER) on bad input
Address parse(std::string_view hex);

} // namespace addresses

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18

// Sentinel for "the whole balance" (repay everything, seize everything)
constexpr I128 MAX_AMOUNT = static_cast<I128>(~U128(0) >> 1);

constexpr uint64_t SECONDS_PER_YEAR = 365ULL * 24 * 60 * 60;

namespace x18 {

constexpr I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

inline I128 from_double(double v) {
    return static_cast<I128>(v * static_cast<double>(X18_ONE));
}

inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

// Exact decimal parse ("0.95", "12", "-1.5"); at most 18 fractional digits
I128 from_string(std::string_view s);

// Exact decimal rendering of an X18 value, trailing zeros trimmed
std::string to_string(I128 v);

} // namespace x18

// Decimal rendering of a raw integer amount
std::string to_string(I128 v);

// =============================================================================
// Market Identifier
// =============================================================================

using MarketId = uint64_t;

// Deterministic id for (owner, asset, rate model key)
inline MarketId market_id(const Address& owner, const Address& asset, const Address& rate_model_key) {
    uint64_t h = 0xcbf29ce484222325ULL;  // FNV-1a offset basis
    auto mix = [&h](const Address& a) {
        for (auto b : a) {
            h ^= b;
            h *= 0x100000001b3ULL;
        }
    };
    mix(owner);
    mix(asset);
    mix(rate_model_key);
    return h;
}

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Lookup / state
constexpr int32_t MARKET_NOT_FOUND = -1;
constexpr int32_t MARKET_ALREADY_EXISTS = -2;
constexpr int32_t POSITION_NOT_FOUND = -3;
constexpr int32_t POSITION_ALREADY_EXISTS = -4;
constexpr int32_t INVALID_POSITION_ADDRESS = -5;
constexpr int32_t MARKET_PAUSED = -6;
constexpr int32_t VAULT_PAUSED = -7;
constexpr int32_t UNKNOWN_RATE_MODEL = -8;
constexpr int32_t MALFORMED_ACTION = -9;

// Balances and liquidity
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t INSUFFICIENT_ALLOWANCE = -11;
constexpr int32_t INSUFFICIENT_SHARES = -12;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -13;
constexpr int32_t INSUFFICIENT_WITHDRAW_PATH = -14;
constexpr int32_t REPAY_EXCEEDS_DEBT = -15;
constexpr int32_t SEIZE_EXCEEDS_BALANCE = -16;
constexpr int32_t INVALID_DEBT_MARKET = -17;
constexpr int32_t NON_ZERO_BALANCE = -18;

// Valuation
constexpr int32_t NO_ORACLE = -20;
constexpr int32_t PRICE_STALE = -21;
constexpr int32_t UNSUPPORTED_ASSET = -22;

// Degenerate arithmetic
constexpr int32_t ZERO_SHARES = -25;
constexpr int32_t ZERO_ASSETS = -26;
constexpr int32_t MATH_OVERFLOW = -27;
constexpr int32_t MARKET_INSOLVENT = -28;

// Governance timing
constexpr int32_t NO_PENDING_UPDATE = -30;
constexpr int32_t TIMELOCK_NOT_ELAPSED = -31;
constexpr int32_t TIMELOCK_EXPIRED = -32;

// Authorization
constexpr int32_t UNAUTHORIZED = -40;
constexpr int32_t ONLY_POSITION_MANAGER = -41;
constexpr int32_t UNKNOWN_ASSET = -42;
constexpr int32_t UNKNOWN_SPENDER = -43;
constexpr int32_t UNKNOWN_FUNC = -44;
constexpr int32_t UNKNOWN_EXEC_TARGET = -45;

// Bounds
constexpr int32_t INVALID_PARAMETER = -50;
constexpr int32_t LTV_OUT_OF_BOUNDS = -51;
constexpr int32_t DEPOSIT_CAP_EXCEEDED = -52;
constexpr int32_t BORROW_CAP_EXCEEDED = -53;
constexpr int32_t POOL_CAP_EXCEEDED = -54;
constexpr int32_t SUPER_POOL_CAP_EXCEEDED = -55;
constexpr int32_t MAX_ASSETS_EXCEEDED = -56;
constexpr int32_t MAX_DEBT_MARKETS_EXCEEDED = -57;
constexpr int32_t MAX_QUEUE_LENGTH_EXCEEDED = -58;
constexpr int32_t BORROW_TOO_SMALL = -59;
constexpr int32_t DEBT_TOO_LOW = -60;
constexpr int32_t NOT_ENOUGH_BURNED_SHARES = -61;
constexpr int32_t ASSET_MISMATCH = -62;
constexpr int32_t MARKET_ALREADY_ADDED = -63;
constexpr int32_t MARKET_NOT_IN_QUEUE = -64;
constexpr int32_t INVALID_QUEUE_REORDER = -65;

// Health
constexpr int32_t HEALTH_CHECK_FAILED = -70;
constexpr int32_t LIQUIDATE_HEALTHY_POSITION = -71;
constexpr int32_t CLOSE_FACTOR_EXCEEDED = -72;
constexpr int32_t SEIZED_TOO_MUCH_COLLATERAL = -73;
constexpr int32_t NO_BAD_DEBT = -74;
constexpr int32_t LIQUIDATION_CREATES_BAD_DEBT = -75;

// Symbolic name of a code ("UNKNOWN_ERROR" for unknown codes)
const char* name(int32_t code);
} // namespace errors

// Failure of a protocol call. The enclosing Runtime::atomic call rolls back.
class Error : public std::runtime_error {
public:
    explicit Error(int32_t code, const std::string& detail = {});

    int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

} // namespace isolend

#endif // ISOLEND_TYPES_HPP
