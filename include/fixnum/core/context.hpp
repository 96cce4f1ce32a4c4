#ifndef FIXNUM_CORE_CONTEXT_HPP
#define FIXNUM_CORE_CONTEXT_HPP

// RoundingContext: which values are representable, and how to pick one.
//
// A context is either
//   FixedExponent   every digit below a fixed position is dropped, or
//   FixedPrecision  at most P digits are kept, counted from the value's
//                   most significant digit; an optional floor N makes
//                   positions <= N unrepresentable as well (a subnormal
//                   range).
// Contexts hold no per-value state and are validated on construction.
// Target positions, floors and precisions are limited to
// position_limit in magnitude, which leaves round() room for the
// positions it derives from them.

#include <algorithm>
#include <optional>
#include <string>

#include "fixnum/core/enums.hpp"
#include "fixnum/core/exceptions.hpp"
#include "fixnum/core/num.hpp"
#include "fixnum/core/rounding.hpp"

namespace fixnum {

class RoundingContext {
public:
  enum class Kind { FixedExponent, FixedPrecision };

  static constexpr exp_t position_limit = exp_t(1) << 60;

  static RoundingContext
  fixedExponent(exp_t Exp,
                RoundingMode Mode = rounding::Default::mode) {
    checkPosition("target exponent", Exp);
    return RoundingContext(Kind::FixedExponent, Exp, 0, std::nullopt, Mode);
  }

  static RoundingContext
  fixedPrecision(prec_t P, RoundingMode Mode = rounding::Default::mode) {
    checkPrecision(P);
    return RoundingContext(Kind::FixedPrecision, 0, P, std::nullopt, Mode);
  }

  static RoundingContext
  fixedPrecision(prec_t P, exp_t N,
                 RoundingMode Mode = rounding::Default::mode) {
    checkPrecision(P);
    checkPosition("floor", N);
    return RoundingContext(Kind::FixedPrecision, 0, P, N, Mode);
  }

  template <RoundingPolicy R> static RoundingContext fixedExponent(exp_t Exp) {
    return fixedExponent(Exp, R::mode);
  }

  template <RoundingPolicy R> static RoundingContext fixedPrecision(prec_t P) {
    return fixedPrecision(P, R::mode);
  }

  template <RoundingPolicy R>
  static RoundingContext fixedPrecision(prec_t P, exp_t N) {
    return fixedPrecision(P, N, R::mode);
  }

  Kind kind() const { return K; }
  RoundingMode mode() const { return Mode; }

  // Target LSB of a fixed-exponent context.
  exp_t exp() const {
    if (K != Kind::FixedExponent)
      detail::raise<UndefinedOperation>(
          "RoundingContext::exp",
          "a fixed-precision context has no fixed target exponent");
    return Exp;
  }

  // Digit budget of a fixed-precision context.
  prec_t precision() const {
    if (K != Kind::FixedPrecision)
      detail::raise<UndefinedOperation>(
          "RoundingContext::precision",
          "a fixed-exponent context has no precision bound");
    return P;
  }

  std::optional<exp_t> floor() const { return N; }

  // The LSB position X is rounded at. For fixed precision this depends
  // on X's most significant digit; a zero X has none, so without a
  // floor there is no target and zero stays as it is.
  std::optional<exp_t> targetExp(const Num &X) const {
    if (K == Kind::FixedExponent)
      return Exp;
    std::optional<exp_t> E = X.e();
    if (!E) {
      if (N)
        return *N + 1;
      return std::nullopt;
    }
    exp_t T = detail::addPositions(
        detail::subPositions(*E, P, "RoundingContext::targetExp"), 1,
        "RoundingContext::targetExp");
    if (N)
      T = std::max(T, *N + 1);
    return T;
  }

private:
  RoundingContext(Kind K, exp_t Exp, prec_t P, std::optional<exp_t> N,
                  RoundingMode Mode)
      : K(K), Exp(Exp), P(P), N(N), Mode(Mode) {
    if (!isValidRoundingMode(Mode))
      detail::raise<InvalidConfiguration>(
          "RoundingContext",
          "unknown rounding mode " +
              std::to_string(static_cast<int>(Mode)));
  }

  static void checkPrecision(prec_t P) {
    if (P < 1)
      detail::raise<InvalidArgument>(
          "RoundingContext",
          "precision must be at least 1, got " + std::to_string(P));
    if (P > position_limit)
      detail::raise<InvalidArgument>(
          "RoundingContext",
          "precision " + std::to_string(P) + " exceeds " +
              std::to_string(position_limit));
  }

  static void checkPosition(const char *What, exp_t Pos) {
    if (Pos < -position_limit || Pos > position_limit)
      detail::raise<InvalidArgument>(
          "RoundingContext", std::string(What) + " " + std::to_string(Pos) +
                                 " is outside [-" +
                                 std::to_string(position_limit) + ", " +
                                 std::to_string(position_limit) + "]");
  }

  Kind K;
  exp_t Exp;
  prec_t P;
  std::optional<exp_t> N;
  RoundingMode Mode;
};

} // namespace fixnum

#endif // FIXNUM_CORE_CONTEXT_HPP
