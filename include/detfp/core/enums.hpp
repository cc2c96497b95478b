#ifndef DETFP_CORE_ENUMS_HPP
#define DETFP_CORE_ENUMS_HPP

#include <cstdint>

namespace detfp {

enum class RoundingMode : uint8_t {
  TiesToEven,     // to nearest, ties to even (IEEE 754 default)
  TowardZero,
  TowardPositive, // ceiling
  TowardNegative, // floor
  TiesToAway,     // to nearest, ties away from zero
};

// When a nonzero result counts as tiny for the underflow flag.
enum class Tininess : uint8_t { BeforeRounding, AfterRounding };

// IEEE 754 class() result.
enum class FloatClass : uint8_t {
  SignalingNaN,
  QuietNaN,
  NegativeInfinity,
  NegativeNormal,
  NegativeSubnormal,
  NegativeZero,
  PositiveZero,
  PositiveSubnormal,
  PositiveNormal,
  PositiveInfinity,
};

// Architectures with a distinct NaN policy.
enum class Target : uint8_t {
  X86,               // x87: larger-significand NaN wins
  X86Sse,            // SSE: first NaN operand wins
  ArmVfpv2,          // signaling NaN operand wins, then first NaN
  ArmVfpv2DefaultNan,
  RiscV,             // canonical NaN only
};

enum class NanPropagation : uint8_t {
  LargerSignificand,
  FirstOperand,
  SignalingFirst,
  DefaultNan,
};

// Integer produced when a NaN is converted to an integer.
enum class NanToInteger : uint8_t {
  Indefinite, // signed minimum, unsigned maximum
  Maximum,
  Zero,
};

} // namespace detfp

#endif // DETFP_CORE_ENUMS_HPP
