#ifndef DETFP_ENGINE_NAN_HPP
#define DETFP_ENGINE_NAN_HPP

// NaN results under a NanPolicy. Pure functions: each returns the NaN to
// deliver and whether the operation signals invalid.

#include "detfp/core/float.hpp"
#include "detfp/core/nan_policy.hpp"

namespace detfp::detail {

template <FormatDescriptor Fmt> struct NanOutcome {
  FloatValue<Fmt> value;
  bool invalid;
};

// Sets the quiet bit (and the integer bit of extended80).
template <FormatDescriptor Fmt>
constexpr FloatValue<Fmt> quieted(FloatValue<Fmt> V) {
  using F = FloatValue<Fmt>;
  return F::from_bits(
      static_cast<typename F::storage_type>(V.to_bits() | F::QuietBit |
                                            F::IntegerBit));
}

// One NaN operand: sqrt, round-to-integral, and an addend NaN in a
// fused multiply-add whose product is not a NaN.
template <FormatDescriptor Fmt>
constexpr NanOutcome<Fmt> propagate_nan(const NanPolicy &P,
                                        FloatValue<Fmt> A) {
  bool Invalid = A.is_signaling_nan();
  if (P.substitutes_default_nan())
    return {P.default_nan<Fmt>(), Invalid};
  return {quieted(A), Invalid};
}

// Two operands, at least one of them a NaN.
template <FormatDescriptor Fmt>
constexpr NanOutcome<Fmt> propagate_nan(const NanPolicy &P, FloatValue<Fmt> A,
                                        FloatValue<Fmt> B) {
  bool SigA = A.is_signaling_nan();
  bool SigB = B.is_signaling_nan();
  bool Invalid = SigA || SigB;

  switch (P.propagation) {
  case NanPropagation::DefaultNan:
    return {P.default_nan<Fmt>(), Invalid};

  case NanPropagation::FirstOperand:
    return {quieted(A.is_nan() ? A : B), Invalid};

  case NanPropagation::SignalingFirst:
    if (Invalid)
      return {quieted(SigA ? A : B), true};
    return {quieted(A.is_nan() ? A : B), false};

  case NanPropagation::LargerSignificand:
    break;
  }

  // x87: a lone signaling NaN yields to a quiet NaN partner; otherwise
  // the larger magnitude wins, and on a tie the positive one.
  if (SigA && !SigB)
    return {quieted(B.is_nan() ? B : A), true};
  if (SigB && !SigA)
    return {quieted(A.is_nan() ? A : B), true};
  auto MagA = A.abs().to_bits();
  auto MagB = B.abs().to_bits();
  if (MagA < MagB)
    return {quieted(B), Invalid};
  if (MagB < MagA)
    return {quieted(A), Invalid};
  FloatValue<Fmt> QA = quieted(A);
  FloatValue<Fmt> QB = quieted(B);
  return {QA.to_bits() < QB.to_bits() ? QA : QB, Invalid};
}

// NaN crossing formats. Payload policies keep the sign and the fraction,
// left-aligned, truncated or zero-extended to the target's fraction.
template <FormatDescriptor To, FormatDescriptor From>
constexpr NanOutcome<To> convert_nan(const NanPolicy &P, FloatValue<From> A) {
  bool Invalid = A.is_signaling_nan();
  if (P.substitutes_default_nan())
    return {P.default_nan<To>(), Invalid};

  using Wide = unsigned __int128;
  Wide Payload = Wide(A.fraction()) << (128 - From::frac_bits);
  auto Frac = static_cast<typename To::storage_type>(
      Payload >> (128 - To::frac_bits));
  FloatValue<To> R = FloatValue<To>::quiet_nan().with_sign(A.sign());
  return {R.with_fraction(
              static_cast<typename To::storage_type>(
                  Frac | FloatValue<To>::QuietBit)),
          Invalid};
}

} // namespace detfp::detail

#endif // DETFP_ENGINE_NAN_HPP
