#ifndef ZAP_MATH_HPP
#define ZAP_MATH_HPP

#include <cstdint>

#include "types.hpp"

namespace zap {
namespace math {

// =============================================================================
// Integer Square Root
// =============================================================================

// Floor of the square root (Babylonian iteration on unsigned integers).
// Defined for the whole 256-bit range.
Amount isqrt(const Amount& x);

// =============================================================================
// Optimal Swap (OptimalSwapCalculator)
// =============================================================================

// Rounding of the final division by 1994.
// Down is the closed form as derived; Up trades one unit of under-swap for
// a unit of possible over-swap.
enum class SwapRounding : uint8_t {
    Down = 0,
    Up = 1
};

// Portion of `amount_in` to swap into the paired asset so that the remainder
// and the swap output match the pool ratio after the swap (0.3% fee):
//
//   (isqrt(r * (a*3988000 + r*3988009)) - r*1997) / 1994
//
// Both arguments must be nonzero (std::invalid_argument otherwise). Callers
// still have to check 0 < result < amount_in.
Amount optimal_swap(const Amount& amount_in, const Amount& reserve_in,
                    SwapRounding rounding = SwapRounding::Down);

// =============================================================================
// Slippage (SlippageGuard)
// =============================================================================

// amount * (10000 - tolerance_bps) / 10000, floor.
// Throws ZapError(INVALID_SLIPPAGE) when tolerance_bps > 10000.
Amount min_out(const Amount& amount, uint32_t tolerance_bps);

// Throws ZapError(INVALID_SLIPPAGE) when tolerance_bps > 10000
void check_slippage(uint32_t tolerance_bps);

// =============================================================================
// Constant Product (0.3% fee)
// =============================================================================

// Output of an exact-input swap. Requires amount_in and both reserves nonzero.
Amount get_amount_out(const Amount& amount_in, const Amount& reserve_in,
                      const Amount& reserve_out);

// Amount of B matching amount_a at the current ratio. Requires nonzero inputs.
Amount quote(const Amount& amount_a, const Amount& reserve_a, const Amount& reserve_b);

} // namespace math
} // namespace zap

#endif // ZAP_MATH_HPP
