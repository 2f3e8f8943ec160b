// =============================================================================
// math.cpp - 256-bit mul_div and rebasing share conversions
// =============================================================================

#include "isolend/math.hpp"

namespace isolend {

namespace {

constexpr U128 I128_MAX_U = ~U128(0) >> 1;

inline U128 as_unsigned(I128 v, const char* what) {
    if (v < 0) {
        throw Error(errors::INVALID_PARAMETER, std::string("negative ") + what);
    }
    return static_cast<U128>(v);
}

} // namespace

U256 mul_wide(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate the middle column with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

I128 mul_div(I128 a, I128 b, I128 denominator, Rounding rounding) {
    U128 ua = as_unsigned(a, "multiplicand");
    U128 ub = as_unsigned(b, "multiplier");
    if (denominator <= 0) {
        throw Error(errors::MATH_OVERFLOW, "mul_div by zero");
    }
    U128 d = static_cast<U128>(denominator);

    U256 product = mul_wide(ua, ub);

    U128 quotient = 0;
    U128 remainder = 0;
    if (product.hi == 0) {
        quotient = product.lo / d;
        remainder = product.lo % d;
    } else {
        // Quotient must fit 128 bits
        if (product.hi >= d) {
            throw Error(errors::MATH_OVERFLOW, "mul_div quotient overflow");
        }
        // Restoring long division over the low limb; d < 2^127 keeps the
        // shifted remainder inside 128 bits.
        remainder = product.hi;
        for (int i = 127; i >= 0; --i) {
            remainder = (remainder << 1) | ((product.lo >> i) & 1);
            if (remainder >= d) {
                remainder -= d;
                quotient |= (U128(1) << i);
            }
        }
    }

    if (rounding == Rounding::Ceil && remainder != 0) {
        quotient += 1;
    }
    if (quotient > I128_MAX_U) {
        throw Error(errors::MATH_OVERFLOW, "mul_div result exceeds I128");
    }
    return static_cast<I128>(quotient);
}

I128 add_checked(I128 a, I128 b) {
    if (a < 0 || b < 0 || a > MAX_AMOUNT - b) {
        throw Error(errors::MATH_OVERFLOW, "amount overflow");
    }
    return a + b;
}

I128 to_shares(I128 assets, I128 total_assets, I128 total_shares, Rounding rounding) {
    if (total_shares == 0 || total_assets == 0) return assets;
    return mul_div(assets, total_shares, total_assets, rounding);
}

I128 to_assets(I128 shares, I128 total_assets, I128 total_shares, Rounding rounding) {
    if (total_shares == 0) return shares;
    return mul_div(shares, total_assets, total_shares, rounding);
}

} // namespace isolend
