// Smoke test: verify that SoftFloat builds and links correctly.
//
// f64_roundToInt(2.5) under round_near_even must produce 2.0 and raise
// inexact; 2.5 = 0x4004000000000000, 2.0 = 0x4000000000000000.

#include <cstdint>
#include <cstdio>

extern "C" {
#include "softfloat.h"
}

int main() {
  softfloat_exceptionFlags = 0;

  float64_t a;
  a.v = UINT64_C(0x4004000000000000);

  float64_t result = f64_roundToInt(a, softfloat_round_near_even, true);

  if (result.v != UINT64_C(0x4000000000000000)) {
    std::fprintf(stderr,
                 "FAIL: f64_roundToInt(0x%016llX) = 0x%016llX, expected "
                 "0x4000000000000000\n",
                 (unsigned long long)a.v, (unsigned long long)result.v);
    return 1;
  }

  if (!(softfloat_exceptionFlags & softfloat_flag_inexact)) {
    std::fprintf(stderr, "FAIL: inexact not raised: 0x%02X\n",
                 static_cast<unsigned>(softfloat_exceptionFlags));
    return 1;
  }

  std::printf("PASS: f64_roundToInt(2.5) = 2.0 (0x4000000000000000)\n");
  return 0;
}
