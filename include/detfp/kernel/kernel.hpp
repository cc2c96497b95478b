#ifndef DETFP_KERNEL_KERNEL_HPP
#define DETFP_KERNEL_KERNEL_HPP

// The arithmetic kernel seam.
//
// A kernel does the digit-level work: given operand bit patterns and a
// KernelMode it returns a correctly rounded pattern plus the flags that
// rounding raised. It never sees the caller's ExceptionState, and the
// engine only calls it once NaN operands and NaN-producing special cases
// have been resolved under the active NanPolicy.

#include <concepts>
#include <cstdint>

#include "detfp/core/enums.hpp"
#include "detfp/core/exceptions.hpp"
#include "detfp/core/format.hpp"

namespace detfp {

struct KernelMode {
  RoundingMode rounding;
  Tininess tininess;
};

template <typename T> struct KernelResult {
  T value;
  ExceptionFlags raised;
};

// Capability required of a kernel for one format. Conversions between
// formats are checked separately by ConvertingKernel.
template <template <typename> class K, typename Fmt>
concept ArithmeticKernel = FormatDescriptor<Fmt> &&
    requires(typename Fmt::storage_type A, KernelMode M, bool Exact,
             int32_t I32, int64_t I64, uint32_t U32, uint64_t U64) {
  { K<Fmt>::add(A, A, M) } -> std::same_as<KernelResult<typename Fmt::storage_type>>;
  { K<Fmt>::sub(A, A, M) } -> std::same_as<KernelResult<typename Fmt::storage_type>>;
  { K<Fmt>::mul(A, A, M) } -> std::same_as<KernelResult<typename Fmt::storage_type>>;
  { K<Fmt>::div(A, A, M) } -> std::same_as<KernelResult<typename Fmt::storage_type>>;
  { K<Fmt>::rem(A, A, M) } -> std::same_as<KernelResult<typename Fmt::storage_type>>;
  { K<Fmt>::mul_add(A, A, A, M) } -> std::same_as<KernelResult<typename Fmt::storage_type>>;
  { K<Fmt>::sqrt(A, M) } -> std::same_as<KernelResult<typename Fmt::storage_type>>;
  { K<Fmt>::round_to_int(A, M, Exact) } -> std::same_as<KernelResult<typename Fmt::storage_type>>;
  { K<Fmt>::to_i32(A, M, Exact) } -> std::same_as<KernelResult<int32_t>>;
  { K<Fmt>::to_i64(A, M, Exact) } -> std::same_as<KernelResult<int64_t>>;
  { K<Fmt>::to_u32(A, M, Exact) } -> std::same_as<KernelResult<uint32_t>>;
  { K<Fmt>::to_u64(A, M, Exact) } -> std::same_as<KernelResult<uint64_t>>;
  { K<Fmt>::from_i32(I32, M) } -> std::same_as<KernelResult<typename Fmt::storage_type>>;
  { K<Fmt>::from_i64(I64, M) } -> std::same_as<KernelResult<typename Fmt::storage_type>>;
  { K<Fmt>::from_u32(U32, M) } -> std::same_as<KernelResult<typename Fmt::storage_type>>;
  { K<Fmt>::from_u64(U64, M) } -> std::same_as<KernelResult<typename Fmt::storage_type>>;
};

template <template <typename> class K, typename From, typename To>
concept ConvertingKernel =
    FormatDescriptor<From> && FormatDescriptor<To> &&
    requires(typename From::storage_type A, KernelMode M) {
      { K<From>::template convert<To>(A, M) } ->
          std::same_as<KernelResult<typename To::storage_type>>;
    };

} // namespace detfp

#endif // DETFP_KERNEL_KERNEL_HPP
