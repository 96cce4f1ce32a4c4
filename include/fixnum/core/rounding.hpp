#ifndef FIXNUM_CORE_ROUNDING_HPP
#define FIXNUM_CORE_ROUNDING_HPP

// Compile-time rounding policy tags. Each names a RoundingMode and
// guard_bits, the number of digits below the target LSB that decide it:
// jamming a value to odd that many digits below the target (truncating
// it, when guard_bits is 0) leaves the rounded result unchanged.
// round() itself reads the digits it needs from the mode at run time;
// guard_bits serves callers that carry a bounded tail.

#include <concepts>

#include "fixnum/core/enums.hpp"

namespace fixnum {

template <typename R>
concept RoundingPolicy = requires {
  { R::mode } -> std::convertible_to<RoundingMode>;
  { R::guard_bits } -> std::convertible_to<int>;
};

namespace rounding {

// Round toward zero (truncation). No guard bits needed.
struct TowardZero {
  static constexpr RoundingMode mode = RoundingMode::TowardZero;
  static constexpr int guard_bits = 0;
};

// Round away from zero. Only needs to know if anything was lost.
struct AwayFromZero {
  static constexpr RoundingMode mode = RoundingMode::AwayFromZero;
  static constexpr int guard_bits = 1;
};

// Round to nearest, ties to even. IEEE 754 default.
// Needs the half digit and a sticky digit.
struct ToNearestTiesToEven {
  static constexpr RoundingMode mode = RoundingMode::ToNearestTiesToEven;
  static constexpr int guard_bits = 2;
};

// Round to nearest, ties away from zero.
struct ToNearestTiesAway {
  static constexpr RoundingMode mode = RoundingMode::ToNearestTiesAway;
  static constexpr int guard_bits = 2;
};

// Round toward positive infinity (ceiling).
struct TowardPositive {
  static constexpr RoundingMode mode = RoundingMode::TowardPositive;
  static constexpr int guard_bits = 1;
};

// Round toward negative infinity (floor).
struct TowardNegative {
  static constexpr RoundingMode mode = RoundingMode::TowardNegative;
  static constexpr int guard_bits = 1;
};

// Round to odd (jamming). If the result is inexact, its LSB is 1.
// Rounding to odd at p + 2 or more digits and then to nearest at p
// gives the same result as rounding to nearest at p directly.
struct ToOdd {
  static constexpr RoundingMode mode = RoundingMode::ToOdd;
  static constexpr int guard_bits = 1; // sticky: was anything lost?
};

using Default = ToNearestTiesToEven;

static_assert(RoundingPolicy<TowardZero>);
static_assert(RoundingPolicy<AwayFromZero>);
static_assert(RoundingPolicy<ToNearestTiesToEven>);
static_assert(RoundingPolicy<ToNearestTiesAway>);
static_assert(RoundingPolicy<TowardPositive>);
static_assert(RoundingPolicy<TowardNegative>);
static_assert(RoundingPolicy<ToOdd>);

} // namespace rounding
} // namespace fixnum

#endif // FIXNUM_CORE_ROUNDING_HPP
