#ifndef FIXNUM_CORE_ENUMS_HPP
#define FIXNUM_CORE_ENUMS_HPP

#include <cstdint>

namespace fixnum {

// How a value between two representable neighbours is resolved.
// y1 is the neighbour nearer zero, y2 the one farther from zero.
enum class RoundingMode : std::uint8_t {
  TowardZero,          // always y1 (truncation)
  AwayFromZero,        // always y2 when inexact
  ToNearestTiesToEven, // nearest; ties pick the even last digit
  ToNearestTiesAway,   // nearest; ties pick y2
  TowardPositive,      // ceiling
  TowardNegative,      // floor
  ToOdd,               // when inexact, pick the odd last digit (jamming)
};

inline constexpr bool isValidRoundingMode(RoundingMode Mode) {
  switch (Mode) {
  case RoundingMode::TowardZero:
  case RoundingMode::AwayFromZero:
  case RoundingMode::ToNearestTiesToEven:
  case RoundingMode::ToNearestTiesAway:
  case RoundingMode::TowardPositive:
  case RoundingMode::TowardNegative:
  case RoundingMode::ToOdd:
    return true;
  }
  return false;
}

inline const char *roundingModeName(RoundingMode Mode) {
  switch (Mode) {
  case RoundingMode::TowardZero:          return "towardZero";
  case RoundingMode::AwayFromZero:        return "awayFromZero";
  case RoundingMode::ToNearestTiesToEven: return "toNearestTiesToEven";
  case RoundingMode::ToNearestTiesAway:   return "toNearestTiesAway";
  case RoundingMode::TowardPositive:      return "towardPositive";
  case RoundingMode::TowardNegative:      return "towardNegative";
  case RoundingMode::ToOdd:               return "toOdd";
  }
  return "???";
}

inline constexpr RoundingMode AllRoundingModes[] = {
    RoundingMode::TowardZero,          RoundingMode::AwayFromZero,
    RoundingMode::ToNearestTiesToEven, RoundingMode::ToNearestTiesAway,
    RoundingMode::TowardPositive,      RoundingMode::TowardNegative,
    RoundingMode::ToOdd,
};

// Status bits reported by roundWithStatus().
namespace flags {
inline constexpr std::uint8_t Exact = 0;
inline constexpr std::uint8_t Inexact = 1 << 0;   // result != input
inline constexpr std::uint8_t RoundedUp = 1 << 1; // magnitude increased
} // namespace flags

} // namespace fixnum

#endif // FIXNUM_CORE_ENUMS_HPP
