#ifndef FIXNUM_CORE_ROUND_HPP
#define FIXNUM_CORE_ROUND_HPP

// round(X, Ctx): the representable value nearest X under Ctx.
//
// With T the context's target LSB for X:
//   [High, Low] = X.split(T - 1)
//   y1 = High, expressed at T          (toward zero)
//   y2 = y1 + 2^T with X's sign        (away from zero)
// Low == 0 means X is representable and y1 == X. Otherwise the mode
// chooses between y1 and y2 from three digits of information:
//   Half    digit T - 1 of X (Low >= half an ulp)
//   Sticky  any non-zero digit below T - 1
//   Odd     digit T of y1
// The result keeps X's sign, including for a zero result.

#include <cstdint>
#include <optional>

#include "fixnum/core/arith.hpp"
#include "fixnum/core/context.hpp"
#include "fixnum/core/enums.hpp"
#include "fixnum/core/num.hpp"

namespace fixnum {

struct RoundResult {
  Num Value;
  std::uint8_t Flags; // fixnum::flags bits
};

namespace detail {

// Whether an inexact value rounds to y2.
inline bool roundsAway(RoundingMode Mode, bool Negative, bool Half,
                       bool Sticky, bool Odd) {
  switch (Mode) {
  case RoundingMode::TowardZero:
    return false;
  case RoundingMode::AwayFromZero:
    return true;
  case RoundingMode::ToNearestTiesToEven:
    return Half && (Sticky || Odd);
  case RoundingMode::ToNearestTiesAway:
    return Half;
  case RoundingMode::TowardPositive:
    return !Negative;
  case RoundingMode::TowardNegative:
    return Negative;
  case RoundingMode::ToOdd:
    return !Odd;
  }
  return false; // unreachable: contexts only hold valid modes
}

} // namespace detail

inline RoundResult roundWithStatus(const Num &X, const RoundingContext &Ctx) {
  std::optional<exp_t> Target = Ctx.targetExp(X);
  if (!Target)
    return {X, flags::Exact};
  exp_t T = *Target;

  exp_t HalfPos = detail::subPositions(T, 1, "round");
  auto [High, Low] = X.split(HalfPos);
  Num Y1 = High.shiftRight(detail::subPositions(High.exp(), T, "round"));
  if (Low.isZero())
    return {Y1, flags::Exact};

  bool Half = Low.bit(HalfPos);
  bool Sticky =
      !Low.split(detail::subPositions(HalfPos, 1, "round")).second.isZero();
  bool Odd = Y1.bit(T);
  bool Away = detail::roundsAway(Ctx.mode(), X.s(), Half, Sticky, Odd);
  if (!Away)
    return {Y1, flags::Inexact};

  Num Y2 = add(Y1, Num(X.s(), Mpz(1), T));
  // A carry out of the top digit leaves a power of two one digit too
  // wide; its lowest digit is zero and can be dropped.
  if (Ctx.kind() == RoundingContext::Kind::FixedPrecision &&
      Y2.p() > Ctx.precision())
    Y2 = Y2.split(T).first;
  return {Y2, static_cast<std::uint8_t>(flags::Inexact | flags::RoundedUp)};
}

inline Num round(const Num &X, const RoundingContext &Ctx) {
  return roundWithStatus(X, Ctx).Value;
}

} // namespace fixnum

#endif // FIXNUM_CORE_ROUND_HPP
