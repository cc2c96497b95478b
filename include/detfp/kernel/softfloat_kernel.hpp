#ifndef DETFP_KERNEL_SOFTFLOAT_KERNEL_HPP
#define DETFP_KERNEL_SOFTFLOAT_KERNEL_HPP

// Berkeley SoftFloat 3 as the arithmetic kernel.
//
// Definitions live in src/softfloat_kernel.cpp, the only translation
// unit that includes softfloat.h, and are explicitly instantiated there
// for every supported format and format pair.
//
// SoftFloat keeps its rounding mode, tininess mode and flags in globals.
// Each call loads them from the KernelMode and reads the flags back, so
// callers on different threads need a SoftFloat built with THREAD_LOCAL.
//
// bfloat16 has no SoftFloat routines: it is computed in binary32 rounded
// to odd and then rounded once to bfloat16. extended80 fused
// multiply-add goes through binary128 the same way.

#include <cstdint>

#include "detfp/core/format.hpp"
#include "detfp/kernel/kernel.hpp"

namespace detfp {

template <typename Fmt> struct SoftFloatKernel {
  static_assert(FormatDescriptor<Fmt>);

  using Bits = typename Fmt::storage_type;
  using Result = KernelResult<Bits>;

  static Result add(Bits A, Bits B, KernelMode M);
  static Result sub(Bits A, Bits B, KernelMode M);
  static Result mul(Bits A, Bits B, KernelMode M);
  static Result div(Bits A, Bits B, KernelMode M);
  static Result rem(Bits A, Bits B, KernelMode M);
  static Result mul_add(Bits A, Bits B, Bits C, KernelMode M);
  static Result sqrt(Bits A, KernelMode M);
  static Result round_to_int(Bits A, KernelMode M, bool Exact);

  static KernelResult<int32_t> to_i32(Bits A, KernelMode M, bool Exact);
  static KernelResult<int64_t> to_i64(Bits A, KernelMode M, bool Exact);
  static KernelResult<uint32_t> to_u32(Bits A, KernelMode M, bool Exact);
  static KernelResult<uint64_t> to_u64(Bits A, KernelMode M, bool Exact);

  static Result from_i32(int32_t V, KernelMode M);
  static Result from_i64(int64_t V, KernelMode M);
  static Result from_u32(uint32_t V, KernelMode M);
  static Result from_u64(uint64_t V, KernelMode M);

  template <FormatDescriptor To>
  static KernelResult<typename To::storage_type> convert(Bits A,
                                                         KernelMode M);
};

extern template struct SoftFloatKernel<binary16>;
extern template struct SoftFloatKernel<bfloat16>;
extern template struct SoftFloatKernel<binary32>;
extern template struct SoftFloatKernel<binary64>;
extern template struct SoftFloatKernel<extended80>;
extern template struct SoftFloatKernel<binary128>;

static_assert(ArithmeticKernel<SoftFloatKernel, binary16>);
static_assert(ArithmeticKernel<SoftFloatKernel, bfloat16>);
static_assert(ArithmeticKernel<SoftFloatKernel, binary32>);
static_assert(ArithmeticKernel<SoftFloatKernel, binary64>);
static_assert(ArithmeticKernel<SoftFloatKernel, extended80>);
static_assert(ArithmeticKernel<SoftFloatKernel, binary128>);
static_assert(ConvertingKernel<SoftFloatKernel, binary16, binary128>);

} // namespace detfp

#endif // DETFP_KERNEL_SOFTFLOAT_KERNEL_HPP
