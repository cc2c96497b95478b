#ifndef DETFP_CORE_TARGET_HPP
#define DETFP_CORE_TARGET_HPP

// Build-time target selection. The build defines exactly one
// DETFP_TARGET_* macro (CMake: -DDETFP_TARGET=<name>); anything else
// stops compilation here.

#include "detfp/core/enums.hpp"
#include "detfp/core/nan_policy.hpp"

#if (defined(DETFP_TARGET_X86) + defined(DETFP_TARGET_X86_SSE) +             \
     defined(DETFP_TARGET_ARM_VFPV2) +                                        \
     defined(DETFP_TARGET_ARM_VFPV2_DEFAULTNAN) +                             \
     defined(DETFP_TARGET_RISCV)) != 1
#error "detfp: define exactly one DETFP_TARGET_* macro"
#endif

namespace detfp {

#if defined(DETFP_TARGET_X86)
inline constexpr Target ActiveTarget = Target::X86;
#elif defined(DETFP_TARGET_X86_SSE)
inline constexpr Target ActiveTarget = Target::X86Sse;
#elif defined(DETFP_TARGET_ARM_VFPV2)
inline constexpr Target ActiveTarget = Target::ArmVfpv2;
#elif defined(DETFP_TARGET_ARM_VFPV2_DEFAULTNAN)
inline constexpr Target ActiveTarget = Target::ArmVfpv2DefaultNan;
#elif defined(DETFP_TARGET_RISCV)
inline constexpr Target ActiveTarget = Target::RiscV;
#endif

inline constexpr NanPolicy ActivePolicy = policy_for<ActiveTarget>;

} // namespace detfp

#endif // DETFP_CORE_TARGET_HPP
