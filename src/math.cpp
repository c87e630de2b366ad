// =============================================================================
// math.cpp - 256-bit intermediate arithmetic for X18 amounts
// =============================================================================

#include "pledge/math.hpp"

namespace pledge {
namespace math {

// =============================================================================
// 256-bit Multiply / Divide
// =============================================================================

U256 mul_u128(U128 a, U128 b) {
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

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

U128 div_u256_u128(const U256& num, U128 denom) {
    if (denom == 0) return 0;
    if (num.hi == 0) return num.lo / denom;

    // Restoring long division, one bit at a time from the top.
    // `top` tracks the bit shifted out of rem so comparisons stay exact.
    U128 rem = 0;
    U128 quot = 0;
    for (int i = 255; i >= 0; --i) {
        bool top = (rem >> 127) != 0;
        U128 bit = (i >= 128) ? (num.hi >> (i - 128)) & 1 : (num.lo >> i) & 1;
        rem = (rem << 1) | bit;
        quot <<= 1;
        if (top || rem >= denom) {
            rem -= denom;  // Wraps correctly when top is set
            quot |= 1;
        }
    }

    return quot;
}

// =============================================================================
// Signed mul_div
// =============================================================================

I128 mul_div(I128 a, I128 b, I128 denom) {
    if (denom == 0) return 0;

    bool neg = (a < 0) ^ (b < 0) ^ (denom < 0);
    U128 ua = static_cast<U128>(abs128(a));
    U128 ub = static_cast<U128>(abs128(b));
    U128 ud = static_cast<U128>(abs128(denom));

    U256 product = mul_u128(ua, ub);
    U128 result = div_u256_u128(product, ud);

    return neg ? -static_cast<I128>(result) : static_cast<I128>(result);
}

int compare_products(I128 a, I128 b, I128 c, I128 d) {
    U256 left = mul_u128(static_cast<U128>(a), static_cast<U128>(b));
    U256 right = mul_u128(static_cast<U128>(c), static_cast<U128>(d));
    if (left < right) return -1;
    if (right < left) return 1;
    return 0;
}

} // namespace math
} // namespace pledge
