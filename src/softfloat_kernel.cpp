// SoftFloatKernel: binding of the kernel seam to Berkeley SoftFloat 3.

#include "detfp/kernel/softfloat_kernel.hpp"

#include <type_traits>

extern "C" {
#include "softfloat.h"
}

namespace detfp {

namespace {

uint_fast8_t toSoftFloat(RoundingMode M) {
  switch (M) {
  case RoundingMode::TiesToEven:     return softfloat_round_near_even;
  case RoundingMode::TowardZero:     return softfloat_round_minMag;
  case RoundingMode::TowardPositive: return softfloat_round_max;
  case RoundingMode::TowardNegative: return softfloat_round_min;
  case RoundingMode::TiesToAway:     return softfloat_round_near_maxMag;
  }
  return softfloat_round_near_even;
}

ExceptionFlags fromSoftFloat(uint_fast8_t Raised) {
  uint8_t Bits = 0;
  if (Raised & softfloat_flag_invalid)
    Bits |= ExceptionFlags::Invalid;
  if (Raised & softfloat_flag_infinite)
    Bits |= ExceptionFlags::DivideByZero;
  if (Raised & softfloat_flag_overflow)
    Bits |= ExceptionFlags::Overflow;
  if (Raised & softfloat_flag_underflow)
    Bits |= ExceptionFlags::Underflow;
  if (Raised & softfloat_flag_inexact)
    Bits |= ExceptionFlags::Inexact;
  return ExceptionFlags::from_bits(Bits);
}

// Loads a KernelMode into SoftFloat's global state with clear flags.
// raised() reads back whatever the calls since construction raised.
class SoftFloatCall {
public:
  explicit SoftFloatCall(KernelMode M) {
    softfloat_roundingMode = toSoftFloat(M.rounding);
    softfloat_detectTininess = M.tininess == Tininess::BeforeRounding
                                   ? softfloat_tininess_beforeRounding
                                   : softfloat_tininess_afterRounding;
    softfloat_exceptionFlags = 0;
  }

  ExceptionFlags raised() const {
    return fromSoftFloat(softfloat_exceptionFlags);
  }
};

// Flags of a round-to-odd intermediate that survive the final rounding.
// Inexact, underflow and overflow are decided again by the final step;
// intermediate overflow can only happen when the target overflows too.
ExceptionFlags survivingFlags(ExceptionFlags Wide) {
  return ExceptionFlags::from_bits(
      Wide.bits() & (ExceptionFlags::Invalid | ExceptionFlags::DivideByZero |
                     ExceptionFlags::Overflow));
}

// ===================================================================
// Sf<Fmt>: SoftFloat type and routines for each native format
// ===================================================================

template <typename Fmt> struct Sf;

template <> struct Sf<binary16> {
  using Type = float16_t;
  static Type pack(uint16_t B) { Type R; R.v = B; return R; }
  static uint16_t unpack(Type V) { return V.v; }

  static Type add(Type A, Type B) { return f16_add(A, B); }
  static Type sub(Type A, Type B) { return f16_sub(A, B); }
  static Type mul(Type A, Type B) { return f16_mul(A, B); }
  static Type div(Type A, Type B) { return f16_div(A, B); }
  static Type rem(Type A, Type B) { return f16_rem(A, B); }
  static Type mulAdd(Type A, Type B, Type C) { return f16_mulAdd(A, B, C); }
  static Type sqrt(Type A) { return f16_sqrt(A); }
  static Type roundToInt(Type A, uint_fast8_t M, bool X) {
    return f16_roundToInt(A, M, X);
  }
  static int_fast32_t toI32(Type A, uint_fast8_t M, bool X) { return f16_to_i32(A, M, X); }
  static int_fast64_t toI64(Type A, uint_fast8_t M, bool X) { return f16_to_i64(A, M, X); }
  static uint_fast32_t toU32(Type A, uint_fast8_t M, bool X) { return f16_to_ui32(A, M, X); }
  static uint_fast64_t toU64(Type A, uint_fast8_t M, bool X) { return f16_to_ui64(A, M, X); }
  static Type fromI32(int32_t V) { return i32_to_f16(V); }
  static Type fromI64(int64_t V) { return i64_to_f16(V); }
  static Type fromU32(uint32_t V) { return ui32_to_f16(V); }
  static Type fromU64(uint64_t V) { return ui64_to_f16(V); }

  template <typename To> static auto to(Type A) {
    if constexpr (std::is_same_v<To, binary16>) return A;
    else if constexpr (std::is_same_v<To, binary32>) return f16_to_f32(A);
    else if constexpr (std::is_same_v<To, binary64>) return f16_to_f64(A);
    else if constexpr (std::is_same_v<To, extended80>) return f16_to_extF80(A);
    else return f16_to_f128(A);
  }
};

template <> struct Sf<binary32> {
  using Type = float32_t;
  static Type pack(uint32_t B) { Type R; R.v = B; return R; }
  static uint32_t unpack(Type V) { return V.v; }

  static Type add(Type A, Type B) { return f32_add(A, B); }
  static Type sub(Type A, Type B) { return f32_sub(A, B); }
  static Type mul(Type A, Type B) { return f32_mul(A, B); }
  static Type div(Type A, Type B) { return f32_div(A, B); }
  static Type rem(Type A, Type B) { return f32_rem(A, B); }
  static Type mulAdd(Type A, Type B, Type C) { return f32_mulAdd(A, B, C); }
  static Type sqrt(Type A) { return f32_sqrt(A); }
  static Type roundToInt(Type A, uint_fast8_t M, bool X) {
    return f32_roundToInt(A, M, X);
  }
  static int_fast32_t toI32(Type A, uint_fast8_t M, bool X) { return f32_to_i32(A, M, X); }
  static int_fast64_t toI64(Type A, uint_fast8_t M, bool X) { return f32_to_i64(A, M, X); }
  static uint_fast32_t toU32(Type A, uint_fast8_t M, bool X) { return f32_to_ui32(A, M, X); }
  static uint_fast64_t toU64(Type A, uint_fast8_t M, bool X) { return f32_to_ui64(A, M, X); }
  static Type fromI32(int32_t V) { return i32_to_f32(V); }
  static Type fromI64(int64_t V) { return i64_to_f32(V); }
  static Type fromU32(uint32_t V) { return ui32_to_f32(V); }
  static Type fromU64(uint64_t V) { return ui64_to_f32(V); }

  template <typename To> static auto to(Type A) {
    if constexpr (std::is_same_v<To, binary16>) return f32_to_f16(A);
    else if constexpr (std::is_same_v<To, binary32>) return A;
    else if constexpr (std::is_same_v<To, binary64>) return f32_to_f64(A);
    else if constexpr (std::is_same_v<To, extended80>) return f32_to_extF80(A);
    else return f32_to_f128(A);
  }
};

template <> struct Sf<binary64> {
  using Type = float64_t;
  static Type pack(uint64_t B) { Type R; R.v = B; return R; }
  static uint64_t unpack(Type V) { return V.v; }

  static Type add(Type A, Type B) { return f64_add(A, B); }
  static Type sub(Type A, Type B) { return f64_sub(A, B); }
  static Type mul(Type A, Type B) { return f64_mul(A, B); }
  static Type div(Type A, Type B) { return f64_div(A, B); }
  static Type rem(Type A, Type B) { return f64_rem(A, B); }
  static Type mulAdd(Type A, Type B, Type C) { return f64_mulAdd(A, B, C); }
  static Type sqrt(Type A) { return f64_sqrt(A); }
  static Type roundToInt(Type A, uint_fast8_t M, bool X) {
    return f64_roundToInt(A, M, X);
  }
  static int_fast32_t toI32(Type A, uint_fast8_t M, bool X) { return f64_to_i32(A, M, X); }
  static int_fast64_t toI64(Type A, uint_fast8_t M, bool X) { return f64_to_i64(A, M, X); }
  static uint_fast32_t toU32(Type A, uint_fast8_t M, bool X) { return f64_to_ui32(A, M, X); }
  static uint_fast64_t toU64(Type A, uint_fast8_t M, bool X) { return f64_to_ui64(A, M, X); }
  static Type fromI32(int32_t V) { return i32_to_f64(V); }
  static Type fromI64(int64_t V) { return i64_to_f64(V); }
  static Type fromU32(uint32_t V) { return ui32_to_f64(V); }
  static Type fromU64(uint64_t V) { return ui64_to_f64(V); }

  template <typename To> static auto to(Type A) {
    if constexpr (std::is_same_v<To, binary16>) return f64_to_f16(A);
    else if constexpr (std::is_same_v<To, binary32>) return f64_to_f32(A);
    else if constexpr (std::is_same_v<To, binary64>) return A;
    else if constexpr (std::is_same_v<To, extended80>) return f64_to_extF80(A);
    else return f64_to_f128(A);
  }
};

template <> struct Sf<extended80> {
  using Type = extFloat80_t;
  using Bits = extended80::storage_type;
  static Type pack(Bits B) {
    Type R;
    R.signif = static_cast<uint64_t>(B);
    R.signExp = static_cast<uint16_t>(B >> 64);
    return R;
  }
  static Bits unpack(Type V) {
    return (Bits(V.signExp) << 64) | Bits(V.signif);
  }

  static Type add(Type A, Type B) { return extF80_add(A, B); }
  static Type sub(Type A, Type B) { return extF80_sub(A, B); }
  static Type mul(Type A, Type B) { return extF80_mul(A, B); }
  static Type div(Type A, Type B) { return extF80_div(A, B); }
  static Type rem(Type A, Type B) { return extF80_rem(A, B); }
  static Type sqrt(Type A) { return extF80_sqrt(A); }
  static Type roundToInt(Type A, uint_fast8_t M, bool X) {
    return extF80_roundToInt(A, M, X);
  }
  static int_fast32_t toI32(Type A, uint_fast8_t M, bool X) { return extF80_to_i32(A, M, X); }
  static int_fast64_t toI64(Type A, uint_fast8_t M, bool X) { return extF80_to_i64(A, M, X); }
  static uint_fast32_t toU32(Type A, uint_fast8_t M, bool X) { return extF80_to_ui32(A, M, X); }
  static uint_fast64_t toU64(Type A, uint_fast8_t M, bool X) { return extF80_to_ui64(A, M, X); }
  static Type fromI32(int32_t V) { return i32_to_extF80(V); }
  static Type fromI64(int64_t V) { return i64_to_extF80(V); }
  static Type fromU32(uint32_t V) { return ui32_to_extF80(V); }
  static Type fromU64(uint64_t V) { return ui64_to_extF80(V); }

  template <typename To> static auto to(Type A) {
    if constexpr (std::is_same_v<To, binary16>) return extF80_to_f16(A);
    else if constexpr (std::is_same_v<To, binary32>) return extF80_to_f32(A);
    else if constexpr (std::is_same_v<To, binary64>) return extF80_to_f64(A);
    else if constexpr (std::is_same_v<To, extended80>) return A;
    else return extF80_to_f128(A);
  }
};

template <> struct Sf<binary128> {
  using Type = float128_t;
  using Bits = binary128::storage_type;
  static Type pack(Bits B) {
    Type R;
    R.v[0] = static_cast<uint64_t>(B);
    R.v[1] = static_cast<uint64_t>(B >> 64);
    return R;
  }
  static Bits unpack(Type V) {
    return (Bits(V.v[1]) << 64) | Bits(V.v[0]);
  }

  static Type add(Type A, Type B) { return f128_add(A, B); }
  static Type sub(Type A, Type B) { return f128_sub(A, B); }
  static Type mul(Type A, Type B) { return f128_mul(A, B); }
  static Type div(Type A, Type B) { return f128_div(A, B); }
  static Type rem(Type A, Type B) { return f128_rem(A, B); }
  static Type mulAdd(Type A, Type B, Type C) { return f128_mulAdd(A, B, C); }
  static Type sqrt(Type A) { return f128_sqrt(A); }
  static Type roundToInt(Type A, uint_fast8_t M, bool X) {
    return f128_roundToInt(A, M, X);
  }
  static int_fast32_t toI32(Type A, uint_fast8_t M, bool X) { return f128_to_i32(A, M, X); }
  static int_fast64_t toI64(Type A, uint_fast8_t M, bool X) { return f128_to_i64(A, M, X); }
  static uint_fast32_t toU32(Type A, uint_fast8_t M, bool X) { return f128_to_ui32(A, M, X); }
  static uint_fast64_t toU64(Type A, uint_fast8_t M, bool X) { return f128_to_ui64(A, M, X); }
  static Type fromI32(int32_t V) { return i32_to_f128(V); }
  static Type fromI64(int64_t V) { return i64_to_f128(V); }
  static Type fromU32(uint32_t V) { return ui32_to_f128(V); }
  static Type fromU64(uint64_t V) { return ui64_to_f128(V); }

  template <typename To> static auto to(Type A) {
    if constexpr (std::is_same_v<To, binary16>) return f128_to_f16(A);
    else if constexpr (std::is_same_v<To, binary32>) return f128_to_f32(A);
    else if constexpr (std::is_same_v<To, binary64>) return f128_to_f64(A);
    else if constexpr (std::is_same_v<To, extended80>) return f128_to_extF80(A);
    else return A;
  }
};

// Routines computing in Fmt itself.
template <typename Fmt, typename Fn>
KernelResult<typename Fmt::storage_type> native(KernelMode M, Fn Compute) {
  SoftFloatCall Call(M);
  auto R = Compute();
  return {Sf<Fmt>::unpack(R), Call.raised()};
}

template <typename T, typename Fn>
KernelResult<T> toInteger(KernelMode M, Fn Compute) {
  SoftFloatCall Call(M);
  T R = static_cast<T>(Compute());
  return {R, Call.raised()};
}

// ===================================================================
// bfloat16 through binary32
// ===================================================================
// bfloat16 is the top half of a binary32 pattern: same sign, same
// exponent field, fraction truncated to 7 bits. Widening is a shift and
// is exact; narrowing rounds the low 16 bits away.

float32_t widenBf16(uint16_t B) {
  float32_t R;
  R.v = uint32_t(B) << 16;
  return R;
}

bool roundsUp(RoundingMode M, bool Negative, uint32_t Rem, uint32_t Half,
              bool LsbOdd) {
  switch (M) {
  case RoundingMode::TiesToEven:
    return Rem > Half || (Rem == Half && LsbOdd);
  case RoundingMode::TiesToAway:     return Rem >= Half;
  case RoundingMode::TowardZero:     return false;
  case RoundingMode::TowardPositive: return !Negative;
  case RoundingMode::TowardNegative: return Negative;
  }
  return false;
}

KernelResult<uint16_t> narrowToBf16(uint32_t Wide, KernelMode M,
                                    ExceptionFlags Flags) {
  constexpr uint32_t Unit = 0x10000;
  constexpr uint32_t MinNormal = 0x00800000;
  constexpr uint32_t Infinity = 0x7F800000;

  bool Negative = (Wide >> 31) != 0;
  uint32_t Sign = Wide & 0x80000000u;
  uint32_t Mag = Wide & 0x7FFFFFFFu;

  if (Mag >= Infinity) {
    if (Mag > Infinity)
      Mag |= 0x00400000u;
    return {static_cast<uint16_t>((Sign | Mag) >> 16), Flags};
  }

  uint32_t Rem = Mag & (Unit - 1);
  uint32_t Kept = Mag - Rem;
  if (Rem == 0)
    return {static_cast<uint16_t>((Sign | Kept) >> 16), Flags};

  bool Up = roundsUp(M.rounding, Negative, Rem, Unit / 2, (Kept & Unit) != 0);
  uint32_t Rounded = Kept + (Up ? Unit : 0);

  uint8_t Raised = ExceptionFlags::Inexact;
  if (Rounded >= Infinity)
    Raised |= ExceptionFlags::Overflow;

  if (Mag < MinNormal) {
    bool Tiny = true;
    if (M.tininess == Tininess::AfterRounding) {
      // Round with one more significant bit, as if the exponent were
      // unbounded, and see whether the result still falls short.
      constexpr uint32_t HalfUnit = Unit / 2;
      uint32_t UnboundedRem = Mag & (HalfUnit - 1);
      uint32_t UnboundedKept = Mag - UnboundedRem;
      bool UnboundedUp =
          UnboundedRem != 0 &&
          roundsUp(M.rounding, Negative, UnboundedRem, HalfUnit / 2,
                   (UnboundedKept & HalfUnit) != 0);
      Tiny = UnboundedKept + (UnboundedUp ? HalfUnit : 0) < MinNormal;
    }
    if (Tiny)
      Raised |= ExceptionFlags::Underflow;
  }

  return {static_cast<uint16_t>((Sign | Rounded) >> 16),
          Flags | ExceptionFlags::from_bits(Raised)};
}

// Computes in binary32 rounded to odd (truncate, then set the low bit if
// anything was lost) and rounds that once to bfloat16. binary32 carries
// more than twice bfloat16's precision plus two bits, so the odd
// intermediate never causes a double-rounding error.
//
// An exact zero takes its sign from the rounding mode when the operands
// cancel, so that case is computed again under the caller's mode.
template <typename Fn>
KernelResult<uint16_t> viaBinary32(KernelMode M, Fn Compute) {
  float32_t Wide;
  ExceptionFlags Raised;
  {
    SoftFloatCall Call({RoundingMode::TowardZero, M.tininess});
    Wide = Compute();
    Raised = Call.raised();
  }
  if (!Raised.is_inexact() && (Wide.v & 0x7FFFFFFFu) == 0) {
    SoftFloatCall Call(M);
    Wide = Compute();
  }
  uint32_t Odd = Wide.v;
  if (Raised.is_inexact())
    Odd |= 1u;
  return narrowToBf16(Odd, M, survivingFlags(Raised));
}

// extended80 has no SoftFloat fused multiply-add. binary128 holds the
// odd-rounded intermediate; one rounding to extended80 follows.
KernelResult<extended80::storage_type>
mulAddExtF80(extended80::storage_type A, extended80::storage_type B,
             extended80::storage_type C, KernelMode M) {
  using X = Sf<extended80>;
  float128_t Wa = extF80_to_f128(X::pack(A));
  float128_t Wb = extF80_to_f128(X::pack(B));
  float128_t Wc = extF80_to_f128(X::pack(C));
  float128_t Wide;
  ExceptionFlags WideRaised;
  {
    SoftFloatCall Call({RoundingMode::TowardZero, M.tininess});
    Wide = f128_mulAdd(Wa, Wb, Wc);
    WideRaised = Call.raised();
  }
  if (WideRaised.is_inexact()) {
    Wide.v[0] |= 1u;
  } else if (Wide.v[0] == 0 && (Wide.v[1] & 0x7FFFFFFFFFFFFFFFull) == 0) {
    // Sign of an exact zero depends on the mode; see viaBinary32.
    SoftFloatCall Call(M);
    Wide = f128_mulAdd(Wa, Wb, Wc);
  }
  SoftFloatCall Call(M);
  extFloat80_t R = f128_to_extF80(Wide);
  return {X::unpack(R), survivingFlags(WideRaised) | Call.raised()};
}

} // namespace

// ===================================================================
// SoftFloatKernel<Fmt>
// ===================================================================

template <typename Fmt> constexpr bool IsBf16 = std::is_same_v<Fmt, bfloat16>;

template <typename Fmt>
typename SoftFloatKernel<Fmt>::Result
SoftFloatKernel<Fmt>::add(Bits A, Bits B, KernelMode M) {
  if constexpr (IsBf16<Fmt>)
    return viaBinary32(M, [&] { return f32_add(widenBf16(A), widenBf16(B)); });
  else
    return native<Fmt>(M, [&] { return Sf<Fmt>::add(Sf<Fmt>::pack(A), Sf<Fmt>::pack(B)); });
}

template <typename Fmt>
typename SoftFloatKernel<Fmt>::Result
SoftFloatKernel<Fmt>::sub(Bits A, Bits B, KernelMode M) {
  if constexpr (IsBf16<Fmt>)
    return viaBinary32(M, [&] { return f32_sub(widenBf16(A), widenBf16(B)); });
  else
    return native<Fmt>(M, [&] { return Sf<Fmt>::sub(Sf<Fmt>::pack(A), Sf<Fmt>::pack(B)); });
}

template <typename Fmt>
typename SoftFloatKernel<Fmt>::Result
SoftFloatKernel<Fmt>::mul(Bits A, Bits B, KernelMode M) {
  if constexpr (IsBf16<Fmt>)
    return viaBinary32(M, [&] { return f32_mul(widenBf16(A), widenBf16(B)); });
  else
    return native<Fmt>(M, [&] { return Sf<Fmt>::mul(Sf<Fmt>::pack(A), Sf<Fmt>::pack(B)); });
}

template <typename Fmt>
typename SoftFloatKernel<Fmt>::Result
SoftFloatKernel<Fmt>::div(Bits A, Bits B, KernelMode M) {
  if constexpr (IsBf16<Fmt>)
    return viaBinary32(M, [&] { return f32_div(widenBf16(A), widenBf16(B)); });
  else
    return native<Fmt>(M, [&] { return Sf<Fmt>::div(Sf<Fmt>::pack(A), Sf<Fmt>::pack(B)); });
}

template <typename Fmt>
typename SoftFloatKernel<Fmt>::Result
SoftFloatKernel<Fmt>::rem(Bits A, Bits B, KernelMode M) {
  if constexpr (IsBf16<Fmt>)
    return viaBinary32(M, [&] { return f32_rem(widenBf16(A), widenBf16(B)); });
  else
    return native<Fmt>(M, [&] { return Sf<Fmt>::rem(Sf<Fmt>::pack(A), Sf<Fmt>::pack(B)); });
}

template <typename Fmt>
typename SoftFloatKernel<Fmt>::Result
SoftFloatKernel<Fmt>::mul_add(Bits A, Bits B, Bits C, KernelMode M) {
  if constexpr (IsBf16<Fmt>)
    return viaBinary32(M, [&] {
      return f32_mulAdd(widenBf16(A), widenBf16(B), widenBf16(C));
    });
  else if constexpr (std::is_same_v<Fmt, extended80>)
    return mulAddExtF80(A, B, C, M);
  else
    return native<Fmt>(M, [&] {
      return Sf<Fmt>::mulAdd(Sf<Fmt>::pack(A), Sf<Fmt>::pack(B),
                             Sf<Fmt>::pack(C));
    });
}

template <typename Fmt>
typename SoftFloatKernel<Fmt>::Result
SoftFloatKernel<Fmt>::sqrt(Bits A, KernelMode M) {
  if constexpr (IsBf16<Fmt>)
    return viaBinary32(M, [&] { return f32_sqrt(widenBf16(A)); });
  else
    return native<Fmt>(M, [&] { return Sf<Fmt>::sqrt(Sf<Fmt>::pack(A)); });
}

template <typename Fmt>
typename SoftFloatKernel<Fmt>::Result
SoftFloatKernel<Fmt>::round_to_int(Bits A, KernelMode M, bool Exact) {
  uint_fast8_t Mode = toSoftFloat(M.rounding);
  if constexpr (IsBf16<Fmt>) {
    // An integral value never needs more significant bits than its source.
    SoftFloatCall Call(M);
    float32_t R = f32_roundToInt(widenBf16(A), Mode, Exact);
    return {static_cast<uint16_t>(R.v >> 16), Call.raised()};
  } else {
    return native<Fmt>(M, [&] {
      return Sf<Fmt>::roundToInt(Sf<Fmt>::pack(A), Mode, Exact);
    });
  }
}

namespace {

// The binary32 view of a bfloat16 operand, or the operand's own type.
template <typename Fmt> auto sfOperand(typename Fmt::storage_type A) {
  if constexpr (IsBf16<Fmt>)
    return widenBf16(A);
  else
    return Sf<Fmt>::pack(A);
}

template <typename Fmt>
using SfOps = std::conditional_t<IsBf16<Fmt>, Sf<binary32>, Sf<Fmt>>;

} // namespace

template <typename Fmt>
KernelResult<int32_t> SoftFloatKernel<Fmt>::to_i32(Bits A, KernelMode M,
                                                   bool Exact) {
  return toInteger<int32_t>(M, [&] {
    return SfOps<Fmt>::toI32(sfOperand<Fmt>(A), toSoftFloat(M.rounding), Exact);
  });
}

template <typename Fmt>
KernelResult<int64_t> SoftFloatKernel<Fmt>::to_i64(Bits A, KernelMode M,
                                                   bool Exact) {
  return toInteger<int64_t>(M, [&] {
    return SfOps<Fmt>::toI64(sfOperand<Fmt>(A), toSoftFloat(M.rounding), Exact);
  });
}

template <typename Fmt>
KernelResult<uint32_t> SoftFloatKernel<Fmt>::to_u32(Bits A, KernelMode M,
                                                    bool Exact) {
  return toInteger<uint32_t>(M, [&] {
    return SfOps<Fmt>::toU32(sfOperand<Fmt>(A), toSoftFloat(M.rounding), Exact);
  });
}

template <typename Fmt>
KernelResult<uint64_t> SoftFloatKernel<Fmt>::to_u64(Bits A, KernelMode M,
                                                    bool Exact) {
  return toInteger<uint64_t>(M, [&] {
    return SfOps<Fmt>::toU64(sfOperand<Fmt>(A), toSoftFloat(M.rounding), Exact);
  });
}

template <typename Fmt>
typename SoftFloatKernel<Fmt>::Result
SoftFloatKernel<Fmt>::from_i32(int32_t V, KernelMode M) {
  if constexpr (IsBf16<Fmt>)
    return viaBinary32(M, [&] { return i32_to_f32(V); });
  else
    return native<Fmt>(M, [&] { return Sf<Fmt>::fromI32(V); });
}

template <typename Fmt>
typename SoftFloatKernel<Fmt>::Result
SoftFloatKernel<Fmt>::from_i64(int64_t V, KernelMode M) {
  if constexpr (IsBf16<Fmt>)
    return viaBinary32(M, [&] { return i64_to_f32(V); });
  else
    return native<Fmt>(M, [&] { return Sf<Fmt>::fromI64(V); });
}

template <typename Fmt>
typename SoftFloatKernel<Fmt>::Result
SoftFloatKernel<Fmt>::from_u32(uint32_t V, KernelMode M) {
  if constexpr (IsBf16<Fmt>)
    return viaBinary32(M, [&] { return ui32_to_f32(V); });
  else
    return native<Fmt>(M, [&] { return Sf<Fmt>::fromU32(V); });
}

template <typename Fmt>
typename SoftFloatKernel<Fmt>::Result
SoftFloatKernel<Fmt>::from_u64(uint64_t V, KernelMode M) {
  if constexpr (IsBf16<Fmt>)
    return viaBinary32(M, [&] { return ui64_to_f32(V); });
  else
    return native<Fmt>(M, [&] { return Sf<Fmt>::fromU64(V); });
}

template <typename Fmt>
template <FormatDescriptor To>
KernelResult<typename To::storage_type>
SoftFloatKernel<Fmt>::convert(Bits A, KernelMode M) {
  if constexpr (std::is_same_v<Fmt, To>) {
    return {A, ExceptionFlags()};
  } else if constexpr (IsBf16<To>) {
    return viaBinary32(M, [&] {
      return SfOps<Fmt>::template to<binary32>(sfOperand<Fmt>(A));
    });
  } else {
    return native<To>(M, [&] {
      return SfOps<Fmt>::template to<To>(sfOperand<Fmt>(A));
    });
  }
}

template struct SoftFloatKernel<binary16>;
template struct SoftFloatKernel<bfloat16>;
template struct SoftFloatKernel<binary32>;
template struct SoftFloatKernel<binary64>;
template struct SoftFloatKernel<extended80>;
template struct SoftFloatKernel<binary128>;

// Every format pair the engine can request through convert_to.
template KernelResult<binary16::storage_type>
SoftFloatKernel<binary16>::convert<binary16>(binary16::storage_type, KernelMode);
template KernelResult<bfloat16::storage_type>
SoftFloatKernel<binary16>::convert<bfloat16>(binary16::storage_type, KernelMode);
template KernelResult<binary32::storage_type>
SoftFloatKernel<binary16>::convert<binary32>(binary16::storage_type, KernelMode);
template KernelResult<binary64::storage_type>
SoftFloatKernel<binary16>::convert<binary64>(binary16::storage_type, KernelMode);
template KernelResult<extended80::storage_type>
SoftFloatKernel<binary16>::convert<extended80>(binary16::storage_type, KernelMode);
template KernelResult<binary128::storage_type>
SoftFloatKernel<binary16>::convert<binary128>(binary16::storage_type, KernelMode);

template KernelResult<binary16::storage_type>
SoftFloatKernel<bfloat16>::convert<binary16>(bfloat16::storage_type, KernelMode);
template KernelResult<bfloat16::storage_type>
SoftFloatKernel<bfloat16>::convert<bfloat16>(bfloat16::storage_type, KernelMode);
template KernelResult<binary32::storage_type>
SoftFloatKernel<bfloat16>::convert<binary32>(bfloat16::storage_type, KernelMode);
template KernelResult<binary64::storage_type>
SoftFloatKernel<bfloat16>::convert<binary64>(bfloat16::storage_type, KernelMode);
template KernelResult<extended80::storage_type>
SoftFloatKernel<bfloat16>::convert<extended80>(bfloat16::storage_type, KernelMode);
template KernelResult<binary128::storage_type>
SoftFloatKernel<bfloat16>::convert<binary128>(bfloat16::storage_type, KernelMode);

template KernelResult<binary16::storage_type>
SoftFloatKernel<binary32>::convert<binary16>(binary32::storage_type, KernelMode);
template KernelResult<bfloat16::storage_type>
SoftFloatKernel<binary32>::convert<bfloat16>(binary32::storage_type, KernelMode);
template KernelResult<binary32::storage_type>
SoftFloatKernel<binary32>::convert<binary32>(binary32::storage_type, KernelMode);
template KernelResult<binary64::storage_type>
SoftFloatKernel<binary32>::convert<binary64>(binary32::storage_type, KernelMode);
template KernelResult<extended80::storage_type>
SoftFloatKernel<binary32>::convert<extended80>(binary32::storage_type, KernelMode);
template KernelResult<binary128::storage_type>
SoftFloatKernel<binary32>::convert<binary128>(binary32::storage_type, KernelMode);

template KernelResult<binary16::storage_type>
SoftFloatKernel<binary64>::convert<binary16>(binary64::storage_type, KernelMode);
template KernelResult<bfloat16::storage_type>
SoftFloatKernel<binary64>::convert<bfloat16>(binary64::storage_type, KernelMode);
template KernelResult<binary32::storage_type>
SoftFloatKernel<binary64>::convert<binary32>(binary64::storage_type, KernelMode);
template KernelResult<binary64::storage_type>
SoftFloatKernel<binary64>::convert<binary64>(binary64::storage_type, KernelMode);
template KernelResult<extended80::storage_type>
SoftFloatKernel<binary64>::convert<extended80>(binary64::storage_type, KernelMode);
template KernelResult<binary128::storage_type>
SoftFloatKernel<binary64>::convert<binary128>(binary64::storage_type, KernelMode);

template KernelResult<binary16::storage_type>
SoftFloatKernel<extended80>::convert<binary16>(extended80::storage_type, KernelMode);
template KernelResult<bfloat16::storage_type>
SoftFloatKernel<extended80>::convert<bfloat16>(extended80::storage_type, KernelMode);
template KernelResult<binary32::storage_type>
SoftFloatKernel<extended80>::convert<binary32>(extended80::storage_type, KernelMode);
template KernelResult<binary64::storage_type>
SoftFloatKernel<extended80>::convert<binary64>(extended80::storage_type, KernelMode);
template KernelResult<extended80::storage_type>
SoftFloatKernel<extended80>::convert<extended80>(extended80::storage_type, KernelMode);
template KernelResult<binary128::storage_type>
SoftFloatKernel<extended80>::convert<binary128>(extended80::storage_type, KernelMode);

template KernelResult<binary16::storage_type>
SoftFloatKernel<binary128>::convert<binary16>(binary128::storage_type, KernelMode);
template KernelResult<bfloat16::storage_type>
SoftFloatKernel<binary128>::convert<bfloat16>(binary128::storage_type, KernelMode);
template KernelResult<binary32::storage_type>
SoftFloatKernel<binary128>::convert<binary32>(binary128::storage_type, KernelMode);
template KernelResult<binary64::storage_type>
SoftFloatKernel<binary128>::convert<binary64>(binary128::storage_type, KernelMode);
template KernelResult<extended80::storage_type>
SoftFloatKernel<binary128>::convert<extended80>(binary128::storage_type, KernelMode);
template KernelResult<binary128::storage_type>
SoftFloatKernel<binary128>::convert<binary128>(binary128::storage_type, KernelMode);

} // namespace detfp
