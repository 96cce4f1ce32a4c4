#ifndef FIXNUM_CORE_EXCEPTIONS_HPP
#define FIXNUM_CORE_EXCEPTIONS_HPP

// Error taxonomy. Every error is a local contract violation reported at
// the call site; none is transient, so all derive from std::logic_error.

#include <stdexcept>
#include <string>

namespace fixnum {

class Error : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

// Negative shift amount, negative or zero precision, negative magnitude,
// non-finite double, a context position beyond position_limit.
class InvalidArgument : public Error {
public:
  using Error::Error;
};

// normalize() asked to fit a value into fewer digits than it has, or a
// derived digit position that does not fit exp_t.
class PrecisionExceeded : public Error {
public:
  using Error::Error;
};

// A partial operation evaluated outside its domain (e.g. the normalized
// exponent of zero).
class UndefinedOperation : public Error {
public:
  using Error::Error;
};

// A rounding context built from an unknown rounding mode.
class InvalidConfiguration : public Error {
public:
  using Error::Error;
};

namespace detail {

template <typename E>
[[noreturn]] inline void raise(const char *Where, const std::string &What) {
  throw E(std::string(Where) + ": " + What);
}

} // namespace detail

} // namespace fixnum

#endif // FIXNUM_CORE_EXCEPTIONS_HPP
