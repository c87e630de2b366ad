#ifndef PLEDGE_MATH_HPP
#define PLEDGE_MATH_HPP

#include "types.hpp"

namespace pledge {
namespace math {

// =============================================================================
// 256-bit Intermediate (two U128 limbs)
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
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool operator>(const U256& other) const { return other < *this; }
};

// Full 128x128 -> 256 product
U256 mul_u128(U128 a, U128 b);

// 256/128 division; quotient must fit in 128 bits
U128 div_u256_u128(const U256& num, U128 denom);

inline I128 abs128(I128 x) { return x < 0 ? -x : x; }

// =============================================================================
// Safe mul_div (a * b / denom) with 256-bit intermediate
// =============================================================================

// Rounds toward zero. Returns 0 for a zero denominator.
I128 mul_div(I128 a, I128 b, I128 denom);

// a * b compared against c * d without overflow: returns -1, 0 or 1.
// Operands must be non-negative.
int compare_products(I128 a, I128 b, I128 c, I128 d);

// =============================================================================
// Ratios
// =============================================================================

// value * rate_x18 (rounded down)
inline I128 apply_rate(I128 value_x18, I128 rate_x18) {
    return mul_div(value_x18, rate_x18, X18_ONE);
}

// numerator / denominator as X18 (0 when denominator is 0)
inline I128 ratio(I128 numerator, I128 denominator) {
    if (denominator == 0) return 0;
    return mul_div(numerator, X18_ONE, denominator);
}

} // namespace math
} // namespace pledge

#endif // PLEDGE_MATH_HPP
