// =============================================================================
// math.cpp - Optimal swap sizing, slippage bounds, constant-product formulas
// =============================================================================

#include "zap/math.hpp"
#include "zap/errors.hpp"
#include <stdexcept>

namespace zap {
namespace math {

namespace {

// Coefficients of the closed form for a 0.3% fee:
// (2 - f)^2 = 3988009/1e6, 4(1 - f) = 3988/1e3, 2(1 - f) = 1994/1e3
constexpr uint64_t COEF_AMOUNT = 3988000;
constexpr uint64_t COEF_RESERVE = 3988009;
constexpr uint64_t COEF_ROOT = 1997;
constexpr uint64_t COEF_DIVISOR = 1994;

} // namespace

Amount isqrt(const Amount& x) {
    if (x == 0) return 0;
    if (x <= 3) return 1;

    // Start above the root; the sequence decreases monotonically to floor(sqrt(x))
    Amount z = x;
    Amount y = x / 2 + 1;
    while (y < z) {
        z = y;
        y = (x / y + y) / 2;
    }
    return z;
}

Amount optimal_swap(const Amount& amount_in, const Amount& reserve_in, SwapRounding rounding) {
    if (amount_in == 0 || reserve_in == 0) {
        throw std::invalid_argument("optimal_swap: amount and reserve must be nonzero");
    }

    // r*3988009 == (1997*r)^2 / r, so the root is never below r*1997
    Amount root = isqrt(reserve_in * (amount_in * COEF_AMOUNT + reserve_in * COEF_RESERVE));
    Amount numerator = root - reserve_in * COEF_ROOT;

    if (rounding == SwapRounding::Up) {
        return (numerator + (COEF_DIVISOR - 1)) / COEF_DIVISOR;
    }
    return numerator / COEF_DIVISOR;
}

void check_slippage(uint32_t tolerance_bps) {
    if (tolerance_bps > bps::DENOMINATOR) {
        throw ZapError(ErrorCode::INVALID_SLIPPAGE,
                       "tolerance " + std::to_string(tolerance_bps) + " bps exceeds 10000");
    }
}

Amount min_out(const Amount& amount, uint32_t tolerance_bps) {
    check_slippage(tolerance_bps);
    return amount * (bps::DENOMINATOR - tolerance_bps) / bps::DENOMINATOR;
}

Amount get_amount_out(const Amount& amount_in, const Amount& reserve_in,
                      const Amount& reserve_out) {
    if (amount_in == 0) {
        throw std::invalid_argument("get_amount_out: zero input");
    }
    if (reserve_in == 0 || reserve_out == 0) {
        throw std::invalid_argument("get_amount_out: empty reserves");
    }

    Amount in_with_fee = amount_in * pool_fee::NUMERATOR;
    Amount numerator = in_with_fee * reserve_out;
    Amount denominator = reserve_in * pool_fee::DENOMINATOR + in_with_fee;
    return numerator / denominator;
}

Amount quote(const Amount& amount_a, const Amount& reserve_a, const Amount& reserve_b) {
    if (amount_a == 0) {
        throw std::invalid_argument("quote: zero amount");
    }
    if (reserve_a == 0 || reserve_b == 0) {
        throw std::invalid_argument("quote: empty reserves");
    }
    return amount_a * reserve_b / reserve_a;
}

} // namespace math
} // namespace zap
