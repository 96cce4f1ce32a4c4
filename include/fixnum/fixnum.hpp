#ifndef FIXNUM_HPP
#define FIXNUM_HPP

#include "fixnum/core/arith.hpp"
#include "fixnum/core/context.hpp"
#include "fixnum/core/enums.hpp"
#include "fixnum/core/exceptions.hpp"
#include "fixnum/core/mpz.hpp"
#include "fixnum/core/num.hpp"
#include "fixnum/core/round.hpp"
#include "fixnum/core/rounding.hpp"

#endif // FIXNUM_HPP
