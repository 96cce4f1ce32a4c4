#ifndef FIXNUM_CORE_MPZ_HPP
#define FIXNUM_CORE_MPZ_HPP

// Mpz: RAII value wrapper around GMP's mpz_t.
//
// This is the unbounded integer used for Num magnitudes. Unlike an
// oracle-side scratch value it is a full value type: copies duplicate
// the limb data, moves steal it and leave the source as zero.

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

#include <gmp.h>

namespace fixnum {

// Bit counts and digit positions. Positions are signed (fractional
// digits sit below zero); widths are never negative but share the type
// so that position arithmetic needs no casts.
using exp_t = std::int64_t;
using prec_t = std::int64_t;

class Mpz {
public:
  Mpz() { mpz_init(Val); }

  explicit Mpz(long V) { mpz_init_set_si(Val, V); }

  explicit Mpz(int V) : Mpz(static_cast<long>(V)) {}

  explicit Mpz(unsigned long V) { mpz_init_set_ui(Val, V); }

  explicit Mpz(mpz_srcptr V) { mpz_init_set(Val, V); }

  // Unsigned word of any width, imported byte by byte (long is only
  // 32 bits on LLP64 targets).
  template <typename WordType> static Mpz fromWord(WordType W) {
    static_assert(std::is_unsigned_v<WordType>);
    constexpr int NumBytes = sizeof(WordType);
    unsigned char Bytes[NumBytes];
    for (int I = 0; I < NumBytes; ++I) {
      Bytes[I] = static_cast<unsigned char>(W & WordType{0xFF});
      W >>= 8;
    }
    Mpz R;
    mpz_import(R.Val, NumBytes, -1, 1, 0, 0, Bytes);
    return R;
  }

  ~Mpz() { mpz_clear(Val); }

  Mpz(const Mpz &Other) { mpz_init_set(Val, Other.Val); }

  Mpz &operator=(const Mpz &Other) {
    if (this != &Other)
      mpz_set(Val, Other.Val);
    return *this;
  }

  // Move: steal contents, leave source as a valid zero
  Mpz(Mpz &&Other) noexcept {
    Val[0] = Other.Val[0];
    mpz_init(Other.Val);
  }

  Mpz &operator=(Mpz &&Other) noexcept {
    if (this != &Other) {
      mpz_clear(Val);
      Val[0] = Other.Val[0];
      mpz_init(Other.Val);
    }
    return *this;
  }

  // Parse a string in the given base. Returns false (leaving *this
  // unchanged) if the text is not a valid integer.
  bool parse(const std::string &Text, int Base = 10) {
    Mpz Tmp;
    if (mpz_set_str(Tmp.Val, Text.c_str(), Base) != 0)
      return false;
    *this = std::move(Tmp);
    return true;
  }

  // Access the underlying mpz_t for GMP C API calls
  mpz_ptr get() { return Val; }
  mpz_srcptr get() const { return Val; }
  operator mpz_ptr() { return Val; }
  operator mpz_srcptr() const { return Val; }

  int sign() const { return mpz_sgn(Val); }
  bool isZero() const { return mpz_sgn(Val) == 0; }
  bool isNegative() const { return mpz_sgn(Val) < 0; }

  // Number of binary digits in |*this|; 0 for zero.
  // (mpz_sizeinbase reports 1 for zero, hence the check.)
  prec_t bitLength() const {
    if (isZero())
      return 0;
    return static_cast<prec_t>(mpz_sizeinbase(Val, 2));
  }

  // Index of the lowest set bit of |*this|. Undefined for zero.
  prec_t lowestSetBit() const {
    return static_cast<prec_t>(mpz_scan1(Val, 0));
  }

  bool testBit(prec_t Index) const {
    return mpz_tstbit(Val, static_cast<mp_bitcnt_t>(Index)) != 0;
  }

  Mpz shiftedLeft(prec_t Bits) const {
    Mpz R;
    mpz_mul_2exp(R.Val, Val, static_cast<mp_bitcnt_t>(Bits));
    return R;
  }

  // Truncating shift: for non-negative values, the digits at index
  // Bits and above, moved down to index 0.
  Mpz shiftedRight(prec_t Bits) const {
    Mpz R;
    mpz_tdiv_q_2exp(R.Val, Val, static_cast<mp_bitcnt_t>(Bits));
    return R;
  }

  // The digits below index Bits (sign follows *this).
  Mpz lowBits(prec_t Bits) const {
    Mpz R;
    mpz_tdiv_r_2exp(R.Val, Val, static_cast<mp_bitcnt_t>(Bits));
    return R;
  }

  Mpz negated() const {
    Mpz R;
    mpz_neg(R.Val, Val);
    return R;
  }

  Mpz absolute() const {
    Mpz R;
    mpz_abs(R.Val, Val);
    return R;
  }

  std::string toString(int Base = 10) const {
    // mpz_sizeinbase may overestimate by one; +2 covers sign and NUL
    std::string Buf(mpz_sizeinbase(Val, Base) + 2, '\0');
    mpz_get_str(Buf.data(), Base, Val);
    Buf.resize(std::char_traits<char>::length(Buf.c_str()));
    return Buf;
  }

  friend Mpz operator+(const Mpz &A, const Mpz &B) {
    Mpz R;
    mpz_add(R.Val, A.Val, B.Val);
    return R;
  }

  friend bool operator==(const Mpz &A, const Mpz &B) {
    return mpz_cmp(A.Val, B.Val) == 0;
  }

  friend bool operator==(const Mpz &A, long B) {
    return mpz_cmp_si(A.Val, B) == 0;
  }

private:
  mpz_t Val;
};

} // namespace fixnum

#endif // FIXNUM_CORE_MPZ_HPP
