#ifndef ISOLEND_MATH_HPP
#define ISOLEND_MATH_HPP

#include "types.hpp"

namespace isolend {

enum class Rounding : uint8_t {
    Floor = 0,
    Ceil = 1
};

// =============================================================================
// 256-bit Intermediate Arithmetic
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool is_zero() const { return lo == 0 && hi == 0; }
};

// Full 128x128 -> 256 product
U256 mul_wide(U128 a, U128 b);

// a * b / denominator with explicit rounding; all operands non-negative.
// Throws Error(MATH_OVERFLOW) for a zero denominator or a quotient that
// does not fit an I128.
I128 mul_div(I128 a, I128 b, I128 denominator, Rounding rounding = Rounding::Floor);

// a * b / 1e18
inline I128 mul_x18(I128 a, I128 b, Rounding rounding = Rounding::Floor) {
    return mul_div(a, b, X18_ONE, rounding);
}

// a * 1e18 / b
inline I128 div_x18(I128 a, I128 b, Rounding rounding = Rounding::Floor) {
    return mul_div(a, X18_ONE, b, rounding);
}

// Checked addition for non-negative amounts
I128 add_checked(I128 a, I128 b);

// =============================================================================
// Rebasing Share Conversions
// =============================================================================

// shares = assets * total_shares / total_assets, 1:1 on an empty ledger
I128 to_shares(I128 assets, I128 total_assets, I128 total_shares, Rounding rounding);

// assets = shares * total_assets / total_shares, 1:1 on an empty ledger
I128 to_assets(I128 shares, I128 total_assets, I128 total_shares, Rounding rounding);

} // namespace isolend

#endif // ISOLEND_MATH_HPP
