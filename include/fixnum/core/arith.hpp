#ifndef FIXNUM_CORE_ARITH_HPP
#define FIXNUM_CORE_ARITH_HPP

// Exact arithmetic on Num. Nothing here rounds: results carry every
// digit of their operands.

#include <algorithm>

#include "fixnum/core/num.hpp"

namespace fixnum {

inline Num neg(const Num &X) { return Num(!X.s(), X.c(), X.exp()); }

inline Num abs(const Num &X) { return Num(false, X.c(), X.exp()); }

// Exact sum, expressed at the lower of the two exponents. An exact zero
// sum is negative only when both operands are.
inline Num add(const Num &X, const Num &Y) {
  exp_t Lo = std::min(X.exp(), Y.exp());
  Mpz Sum = X.shiftRight(detail::subPositions(X.exp(), Lo, "add")).m() +
            Y.shiftRight(detail::subPositions(Y.exp(), Lo, "add")).m();
  bool Negative = Sum.isZero() ? (X.s() && Y.s()) : Sum.isNegative();
  return Num(Negative, Sum.absolute(), Lo);
}

inline Num sub(const Num &X, const Num &Y) { return add(X, neg(Y)); }

// Three-way numeric comparison: <0, 0 or >0. Both zeros compare equal.
inline int compare(const Num &X, const Num &Y) {
  exp_t Lo = std::min(X.exp(), Y.exp());
  Mpz A = X.shiftRight(detail::subPositions(X.exp(), Lo, "compare")).m();
  Mpz B = Y.shiftRight(detail::subPositions(Y.exp(), Lo, "compare")).m();
  return mpz_cmp(A, B);
}

} // namespace fixnum

#endif // FIXNUM_CORE_ARITH_HPP
