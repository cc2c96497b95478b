#ifndef DETFP_CORE_NAN_POLICY_HPP
#define DETFP_CORE_NAN_POLICY_HPP

#include "detfp/core/enums.hpp"
#include "detfp/core/float.hpp"

namespace detfp {

// Architecture policy: how NaNs are produced and propagated, how tininess
// is detected, and what a NaN converts to as an integer.
//
// A structural literal type, so a policy value can be a template argument
// of Engine and is fixed for the lifetime of every engine built on it.
struct NanPolicy {
  NanPropagation propagation;
  bool default_nan_negative;
  Tininess tininess;
  NanToInteger nan_to_integer;

  constexpr bool substitutes_default_nan() const {
    return propagation == NanPropagation::DefaultNan;
  }

  // Exponent all ones, quiet bit set, payload clear. Sign per target.
  template <FormatDescriptor Fmt>
  constexpr FloatValue<Fmt> default_nan() const {
    return FloatValue<Fmt>::quiet_nan().with_sign(default_nan_negative);
  }
};

namespace policies {

inline constexpr NanPolicy X86{NanPropagation::LargerSignificand, true,
                               Tininess::AfterRounding,
                               NanToInteger::Indefinite};

inline constexpr NanPolicy X86Sse{NanPropagation::FirstOperand, true,
                                  Tininess::AfterRounding,
                                  NanToInteger::Indefinite};

inline constexpr NanPolicy ArmVfpv2{NanPropagation::SignalingFirst, false,
                                    Tininess::BeforeRounding,
                                    NanToInteger::Zero};

inline constexpr NanPolicy ArmVfpv2DefaultNan{
    NanPropagation::DefaultNan, false, Tininess::BeforeRounding,
    NanToInteger::Zero};

inline constexpr NanPolicy RiscV{NanPropagation::DefaultNan, false,
                                 Tininess::AfterRounding,
                                 NanToInteger::Maximum};

} // namespace policies

// Target -> policy. The primary template is left undefined, so a Target
// without a policy is an incomplete-type error at build time.
template <Target T> struct TargetPolicy;

template <> struct TargetPolicy<Target::X86> {
  static constexpr NanPolicy value = policies::X86;
};
template <> struct TargetPolicy<Target::X86Sse> {
  static constexpr NanPolicy value = policies::X86Sse;
};
template <> struct TargetPolicy<Target::ArmVfpv2> {
  static constexpr NanPolicy value = policies::ArmVfpv2;
};
template <> struct TargetPolicy<Target::ArmVfpv2DefaultNan> {
  static constexpr NanPolicy value = policies::ArmVfpv2DefaultNan;
};
template <> struct TargetPolicy<Target::RiscV> {
  static constexpr NanPolicy value = policies::RiscV;
};

template <Target T>
inline constexpr NanPolicy policy_for = TargetPolicy<T>::value;

static_assert(policy_for<Target::X86Sse>.propagation ==
              NanPropagation::FirstOperand);
static_assert(policy_for<Target::RiscV>.substitutes_default_nan());
static_assert(policies::X86.default_nan<binary32>().to_bits() == 0xFFC00000u);
static_assert(policies::RiscV.default_nan<binary32>().to_bits() ==
              0x7FC00000u);

} // namespace detfp

#endif // DETFP_CORE_NAN_POLICY_HPP
