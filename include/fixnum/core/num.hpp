#ifndef FIXNUM_CORE_NUM_HPP
#define FIXNUM_CORE_NUM_HPP

// Num: an exact fixed-point value (-1)^s * c * 2^exp.
//
// s    sign (true = negative); +0 and -0 are distinct representations
// c    unbounded non-negative magnitude
// exp  absolute position of the least significant digit
//
// The digits of c occupy positions [exp, exp + p). A zero magnitude is
// zero for every exp, but (s, exp) are still carried: the sign of zero,
// and a floor below which later operations place no digits.
//
// Num is immutable. Derived properties are computed on each access.

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include "fixnum/core/exceptions.hpp"
#include "fixnum/core/mpz.hpp"

namespace fixnum {

namespace detail {

// Digit-position arithmetic. A result outside exp_t is reported rather
// than wrapped.
inline exp_t addPositions(exp_t A, exp_t B, const char *Where) {
  if ((B > 0 && A > std::numeric_limits<exp_t>::max() - B) ||
      (B < 0 && A < std::numeric_limits<exp_t>::min() - B))
    raise<PrecisionExceeded>(Where, "digit position " + std::to_string(A) +
                                        " + " + std::to_string(B) +
                                        " is out of range");
  return A + B;
}

inline exp_t subPositions(exp_t A, exp_t B, const char *Where) {
  if ((B < 0 && A > std::numeric_limits<exp_t>::max() + B) ||
      (B > 0 && A < std::numeric_limits<exp_t>::min() + B))
    raise<PrecisionExceeded>(Where, "digit position " + std::to_string(A) +
                                        " - " + std::to_string(B) +
                                        " is out of range");
  return A - B;
}

} // namespace detail

class Num {
public:
  // Zero, +0 * 2^0.
  Num() = default;

  Num(bool Sign, Mpz Mag, exp_t LSB) : S(Sign), C(std::move(Mag)), Exp(LSB) {
    if (C.isNegative())
      detail::raise<InvalidArgument>(
          "Num", "magnitude must be non-negative, got " + C.toString());
  }

  static Num zero(bool Sign = false, exp_t LSB = 0) {
    return Num(Sign, Mpz(), LSB);
  }

  static Num fromInteger(long long I) {
    // |LLONG_MIN| only fits unsigned
    unsigned long long Mag = static_cast<unsigned long long>(I);
    if (I < 0)
      Mag = 0ULL - Mag;
    return Num(I < 0, Mpz::fromWord(Mag), 0);
  }

  static Num fromInteger(const Mpz &I) {
    return Num(I.isNegative(), I.absolute(), 0);
  }

  // Exact value of a finite double.
  static Num fromDouble(double D) {
    if (!std::isfinite(D))
      detail::raise<InvalidArgument>("Num::fromDouble",
                                     "value must be finite");
    bool Negative = std::signbit(D);
    if (D == 0.0)
      return zero(Negative);

    // |D| = Frac * 2^E with Frac in [0.5, 1); Frac * 2^53 is an integer
    int E;
    double Frac = std::frexp(std::fabs(D), &E);
    Mpz Mag;
    mpz_set_d(Mag, std::ldexp(Frac, 53));
    return Num(Negative, std::move(Mag), static_cast<exp_t>(E) - 53);
  }

  bool s() const { return S; }
  const Mpz &c() const { return C; }
  exp_t exp() const { return Exp; }

  // Minimum number of binary digits to encode c. Zero iff c == 0.
  prec_t p() const { return C.bitLength(); }

  // Position of the most significant digit, exp + p - 1.
  // Empty for zero, which has no most significant digit.
  std::optional<exp_t> e() const {
    if (C.isZero())
      return std::nullopt;
    return detail::addPositions(Exp, p() - 1, "Num::e");
  }

  // As e(), but a zero value is an error.
  exp_t requireE() const {
    std::optional<exp_t> E = e();
    if (!E)
      detail::raise<UndefinedOperation>(
          "Num::e", "zero has no most significant digit");
    return *E;
  }

  // Position of the first digit below the significant digits.
  exp_t n() const { return detail::subPositions(Exp, 1, "Num::n"); }

  // Signed significand, (-1)^s * c.
  Mpz m() const { return S ? C.negated() : C; }

  bool isZero() const { return C.isZero(); }

  // True iff no non-zero digit lies strictly below position 0.
  bool isInteger() const {
    if (C.isZero() || Exp >= 0)
      return true;
    return Exp + C.lowestSetBit() >= 0;
  }

  // Digit at absolute position Pos. Nothing is stored below exp.
  bool bit(exp_t Pos) const {
    if (Pos < Exp)
      return false;
    // The distance may not fit exp_t, but always fits its unsigned twin
    std::uint64_t Dist =
        static_cast<std::uint64_t>(Pos) - static_cast<std::uint64_t>(Exp);
    return Dist < static_cast<std::uint64_t>(p()) &&
           C.testBit(static_cast<prec_t>(Dist));
  }

  // Partition into digits strictly above Pos (first) and digits at or
  // below Pos (second). Both shares keep the sign; their sum is *this.
  std::pair<Num, Num> split(exp_t Pos) const {
    if (Pos < Exp)
      return {*this, zero(S, Pos)};
    prec_t K = detail::addPositions(
        detail::subPositions(Pos, Exp, "Num::split"), 1, "Num::split");
    exp_t HighExp = detail::addPositions(Pos, 1, "Num::split");
    return {Num(S, C.shiftedRight(K), HighExp), Num(S, C.lowBits(K), Exp)};
  }

  // Same value with D more digits of significance below the current LSB.
  Num shiftRight(prec_t D) const {
    if (D < 0)
      detail::raise<InvalidArgument>(
          "Num::shiftRight",
          "shift must be non-negative, got " + std::to_string(D));
    exp_t NewExp = detail::subPositions(Exp, D, "Num::shiftRight");
    return Num(S, C.shiftedLeft(D), NewExp);
  }

  // Same value padded to exactly P digits. Zero is returned unchanged.
  Num normalize(prec_t P) const {
    if (P < 0)
      detail::raise<InvalidArgument>(
          "Num::normalize",
          "precision must be non-negative, got " + std::to_string(P));
    prec_t Have = p();
    if (Have > P)
      detail::raise<PrecisionExceeded>(
          "Num::normalize", "value has " + std::to_string(Have) +
                                " digits, cannot fit in " + std::to_string(P));
    if (C.isZero())
      return *this;
    return shiftRight(P - Have);
  }

  // Same real number, regardless of representation.
  bool equiv(const Num &Other) const {
    if (C.isZero() || Other.C.isZero())
      return C.isZero() && Other.C.isZero();
    if (S != Other.S)
      return false;
    exp_t Lo = std::min(Exp, Other.Exp);
    prec_t D = detail::subPositions(Exp, Lo, "Num::equiv");
    prec_t OtherD = detail::subPositions(Other.Exp, Lo, "Num::equiv");
    return C.shiftedLeft(D) == Other.C.shiftedLeft(OtherD);
  }

private:
  bool S = false;
  Mpz C;
  exp_t Exp = 0;
};

// Same (s, c, exp) triple. Stricter than equiv().
inline bool identical(const Num &A, const Num &B) {
  return A.s() == B.s() && A.c() == B.c() && A.exp() == B.exp();
}

// "-0b101p-3" for -5 * 2^-3.
inline std::string toString(const Num &X) {
  std::string R = X.s() ? "-0b" : "0b";
  R += X.c().toString(2);
  R += 'p';
  R += std::to_string(X.exp());
  return R;
}

inline std::ostream &operator<<(std::ostream &OS, const Num &X) {
  return OS << toString(X);
}

} // namespace fixnum

#endif // FIXNUM_CORE_NUM_HPP
