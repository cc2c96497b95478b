#ifndef DETFP_CORE_FLOAT_HPP
#define DETFP_CORE_FLOAT_HPP

#include <bit>
#include <concepts>
#include <cstdint>

#include "detfp/core/bits.hpp"
#include "detfp/core/enums.hpp"
#include "detfp/core/format.hpp"

namespace detfp {

// FloatValue<Fmt>: one immutable bit pattern of Fmt's width.
//
// Holds bits, nothing else: no arithmetic, no implicit conversion to
// another format or to a native type. Every query is a pure function of
// the pattern and never touches exception state. Arithmetic lives in
// Engine.
template <FormatDescriptor Fmt>
class FloatValue {
public:
  using format = Fmt;
  using storage_type = typename Fmt::storage_type;

  static constexpr storage_type WidthMask =
      low_mask<storage_type>(Fmt::total_bits);
  static constexpr storage_type SignMask =
      static_cast<storage_type>(storage_type{1} << Fmt::sign_offset);
  static constexpr storage_type ExpMax =
      low_mask<storage_type>(Fmt::exp_bits);
  static constexpr storage_type MantMask =
      low_mask<storage_type>(Fmt::mant_bits);
  static constexpr storage_type FracMask =
      low_mask<storage_type>(Fmt::frac_bits);
  static constexpr storage_type IntegerBit =
      Fmt::explicit_integer_bit
          ? static_cast<storage_type>(storage_type{1} << Fmt::frac_bits)
          : storage_type{0};
  static constexpr storage_type QuietBit =
      static_cast<storage_type>(storage_type{1} << (Fmt::frac_bits - 1));

  // +0.
  constexpr FloatValue() = default;

  // Total: every pattern is accepted. Bits above the format width are
  // discarded so the held pattern is always exactly Fmt::total_bits wide.
  static constexpr FloatValue from_bits(storage_type Raw) {
    return FloatValue(static_cast<storage_type>(Raw & WidthMask));
  }

  constexpr storage_type to_bits() const { return Bits; }

  // --- Fields ---

  constexpr bool sign() const { return (Bits & SignMask) != 0; }
  constexpr storage_type exponent() const {
    return extract_field(Bits, Fmt::exp_offset, Fmt::exp_bits);
  }
  // Fraction without the explicit integer bit.
  constexpr storage_type fraction() const {
    return static_cast<storage_type>(Bits & FracMask);
  }
  // Whole mantissa field (fraction plus explicit integer bit, if any).
  constexpr storage_type mantissa() const {
    return static_cast<storage_type>(Bits & MantMask);
  }

  constexpr FloatValue with_sign(bool Negative) const {
    return FloatValue(Negative ? storage_type(Bits | SignMask)
                               : storage_type(Bits & ~SignMask));
  }
  constexpr FloatValue with_exponent(storage_type Exp) const {
    constexpr storage_type Field =
        static_cast<storage_type>(ExpMax << Fmt::exp_offset);
    return FloatValue(static_cast<storage_type>(
        (Bits & ~Field) | ((Exp & ExpMax) << Fmt::exp_offset)));
  }
  constexpr FloatValue with_fraction(storage_type Frac) const {
    return FloatValue(
        static_cast<storage_type>((Bits & ~FracMask) | (Frac & FracMask)));
  }

  // --- Classification ---

  constexpr bool is_negative() const { return sign(); }
  constexpr bool is_positive() const { return !sign(); }
  constexpr bool is_nan() const {
    return exponent() == ExpMax && fraction() != 0;
  }
  constexpr bool is_signaling_nan() const {
    return is_nan() && (Bits & QuietBit) == 0;
  }
  constexpr bool is_quiet_nan() const {
    return is_nan() && (Bits & QuietBit) != 0;
  }
  constexpr bool is_infinite() const {
    return exponent() == ExpMax && fraction() == 0;
  }
  constexpr bool is_zero() const {
    return exponent() == 0 && mantissa() == 0;
  }
  constexpr bool is_subnormal() const {
    return exponent() == 0 && mantissa() != 0;
  }
  constexpr bool is_normal() const {
    return exponent() != 0 && exponent() != ExpMax;
  }
  constexpr bool is_finite() const { return exponent() != ExpMax; }

  // Classes follow the exponent field alone. Non-canonical extended80
  // encodings are not told apart: an unnormal (integer bit clear, nonzero
  // exponent) is Normal and a pseudo-denormal (integer bit set, zero
  // exponent) is Subnormal.
  constexpr FloatClass classify() const {
    if (is_nan())
      return is_signaling_nan() ? FloatClass::SignalingNaN
                                : FloatClass::QuietNaN;
    bool Neg = sign();
    if (is_infinite())
      return Neg ? FloatClass::NegativeInfinity : FloatClass::PositiveInfinity;
    if (is_zero())
      return Neg ? FloatClass::NegativeZero : FloatClass::PositiveZero;
    if (is_subnormal())
      return Neg ? FloatClass::NegativeSubnormal
                 : FloatClass::PositiveSubnormal;
    return Neg ? FloatClass::NegativeNormal : FloatClass::PositiveNormal;
  }

  // --- Sign operations (quiet, exact, never raise) ---

  constexpr FloatValue negate() const {
    return FloatValue(static_cast<storage_type>(Bits ^ SignMask));
  }
  constexpr FloatValue abs() const { return with_sign(false); }
  constexpr FloatValue copy_sign(FloatValue From) const {
    return with_sign(From.sign());
  }

  // --- Named values ---

  static constexpr FloatValue positive_zero() { return FloatValue(); }
  static constexpr FloatValue negative_zero() { return FloatValue(SignMask); }
  static constexpr FloatValue positive_infinity() {
    return FloatValue(static_cast<storage_type>(
        (ExpMax << Fmt::exp_offset) | IntegerBit));
  }
  static constexpr FloatValue negative_infinity() {
    return positive_infinity().negate();
  }
  // Positive quiet NaN with an empty payload.
  static constexpr FloatValue quiet_nan() {
    return FloatValue(static_cast<storage_type>(
        (ExpMax << Fmt::exp_offset) | IntegerBit | QuietBit));
  }
  static constexpr FloatValue max_finite() {
    return FloatValue(static_cast<storage_type>(
        ((ExpMax - 1) << Fmt::exp_offset) | MantMask));
  }
  static constexpr FloatValue min_normal() {
    return FloatValue(static_cast<storage_type>(
        (storage_type{1} << Fmt::exp_offset) | IntegerBit));
  }
  static constexpr FloatValue min_subnormal() {
    return FloatValue(storage_type{1});
  }
  static constexpr FloatValue one() {
    return FloatValue(static_cast<storage_type>(
        (storage_type(Fmt::bias) << Fmt::exp_offset) | IntegerBit));
  }

  // --- Host interop, binary32 and binary64 only ---

  static FloatValue from_native(float V)
    requires std::same_as<Fmt, binary32>
  {
    return FloatValue(std::bit_cast<uint32_t>(V));
  }
  static FloatValue from_native(double V)
    requires std::same_as<Fmt, binary64>
  {
    return FloatValue(std::bit_cast<uint64_t>(V));
  }
  float to_native() const
    requires std::same_as<Fmt, binary32>
  {
    return std::bit_cast<float>(Bits);
  }
  double to_native() const
    requires std::same_as<Fmt, binary64>
  {
    return std::bit_cast<double>(Bits);
  }

  // Bit-pattern identity. IEEE equality is Engine::eq.
  constexpr bool operator==(const FloatValue &) const = default;

private:
  constexpr explicit FloatValue(storage_type B) : Bits(B) {}

  storage_type Bits = 0;
};

// --- Convenience aliases ---

using F16 = FloatValue<binary16>;
using BF16 = FloatValue<bfloat16>;
using F32 = FloatValue<binary32>;
using F64 = FloatValue<binary64>;
using F80 = FloatValue<extended80>;
using F128 = FloatValue<binary128>;

} // namespace detfp

#endif // DETFP_CORE_FLOAT_HPP
