#ifndef DETFP_ENGINE_ENGINE_HPP
#define DETFP_ENGINE_ENGINE_HPP

// Engine<Policy, Kernel>: the IEEE 754 operation set.
//
// Every operation follows the same path:
//   1. classify the operands (FloatValue predicates),
//   2. resolve NaN operands and the special-case table (invalid
//      operations, infinities, division by zero) under Policy,
//   3. otherwise hand the bit patterns to the Kernel with the caller's
//      rounding mode and Policy's tininess rule,
//   4. merge the raised flags into the injected ExceptionState.
//
// The engine holds a reference to the caller's ExceptionState and never
// clears it. Comparisons and classification are decided here without the
// kernel.

#include <compare>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>

#include "detfp/core/exceptions.hpp"
#include "detfp/core/float.hpp"
#include "detfp/core/nan_policy.hpp"
#include "detfp/engine/nan.hpp"
#include "detfp/kernel/kernel.hpp"
#include "detfp/kernel/softfloat_kernel.hpp"

namespace detfp {

// Integer types with a kernel conversion from a float.
template <typename I>
concept KernelInteger =
    std::same_as<I, int32_t> || std::same_as<I, int64_t> ||
    std::same_as<I, uint32_t> || std::same_as<I, uint64_t>;

// Integer types accepted by from_integer (widened to 32 or 64 bits).
template <typename I>
concept SourceInteger = std::integral<I> && !std::same_as<I, bool> &&
                        (sizeof(I) <= sizeof(uint64_t));

template <NanPolicy Policy, template <typename> class Kernel = SoftFloatKernel>
class Engine {
public:
  static constexpr NanPolicy policy = Policy;

  explicit Engine(ExceptionState &State) : State(State) {}

  ExceptionFlags current_flags() const { return State.current_flags(); }
  void reset_flags() { State.reset_flags(); }

  // ===================================================================
  // Arithmetic
  // ===================================================================

  template <FormatDescriptor Fmt>
  FloatValue<Fmt> add(FloatValue<Fmt> A, FloatValue<Fmt> B, RoundingMode M) {
    return addOrSub(A, B, false, M);
  }

  template <FormatDescriptor Fmt>
  FloatValue<Fmt> sub(FloatValue<Fmt> A, FloatValue<Fmt> B, RoundingMode M) {
    return addOrSub(A, B, true, M);
  }

  template <FormatDescriptor Fmt>
  FloatValue<Fmt> mul(FloatValue<Fmt> A, FloatValue<Fmt> B, RoundingMode M) {
    static_assert(ArithmeticKernel<Kernel, Fmt>);
    if (A.is_nan() || B.is_nan())
      return deliver(detail::propagate_nan(Policy, A, B));
    bool Negative = A.sign() != B.sign();
    if (A.is_infinite() || B.is_infinite()) {
      if (A.is_zero() || B.is_zero())
        return invalidOperation<Fmt>();
      return infinity<Fmt>(Negative);
    }
    return finish<Fmt>(
        Kernel<Fmt>::mul(A.to_bits(), B.to_bits(), mode(M)));
  }

  template <FormatDescriptor Fmt>
  FloatValue<Fmt> div(FloatValue<Fmt> A, FloatValue<Fmt> B, RoundingMode M) {
    static_assert(ArithmeticKernel<Kernel, Fmt>);
    if (A.is_nan() || B.is_nan())
      return deliver(detail::propagate_nan(Policy, A, B));
    bool Negative = A.sign() != B.sign();
    if (A.is_infinite()) {
      if (B.is_infinite())
        return invalidOperation<Fmt>();
      return infinity<Fmt>(Negative);
    }
    if (B.is_infinite())
      return FloatValue<Fmt>::positive_zero().with_sign(Negative);
    if (B.is_zero()) {
      if (A.is_zero())
        return invalidOperation<Fmt>();
      signal(ExceptionFlags::DivideByZero);
      return infinity<Fmt>(Negative);
    }
    return finish<Fmt>(
        Kernel<Fmt>::div(A.to_bits(), B.to_bits(), mode(M)));
  }

  // IEEE remainder: A - n*B with n the integer nearest A/B, ties to even.
  // The result is always exact; M only reaches the kernel for symmetry.
  template <FormatDescriptor Fmt>
  FloatValue<Fmt> remainder(FloatValue<Fmt> A, FloatValue<Fmt> B,
                            RoundingMode M) {
    static_assert(ArithmeticKernel<Kernel, Fmt>);
    if (A.is_nan() || B.is_nan())
      return deliver(detail::propagate_nan(Policy, A, B));
    if (A.is_infinite() || B.is_zero())
      return invalidOperation<Fmt>();
    if (B.is_infinite())
      return A;
    return finish<Fmt>(
        Kernel<Fmt>::rem(A.to_bits(), B.to_bits(), mode(M)));
  }

  // A * B + C with a single rounding.
  template <FormatDescriptor Fmt>
  FloatValue<Fmt> fused_multiply_add(FloatValue<Fmt> A, FloatValue<Fmt> B,
                                     FloatValue<Fmt> C, RoundingMode M) {
    static_assert(ArithmeticKernel<Kernel, Fmt>);
    if (A.is_nan() || B.is_nan()) {
      auto Product = detail::propagate_nan(Policy, A, B);
      if (C.is_nan()) {
        auto Sum = detail::propagate_nan(Policy, Product.value, C);
        Sum.invalid = Sum.invalid || Product.invalid;
        return deliver(Sum);
      }
      return deliver(Product);
    }

    bool ProductInfinite = A.is_infinite() || B.is_infinite();
    bool ProductZero = A.is_zero() || B.is_zero();
    if (ProductInfinite && ProductZero) {
      // Invalid even when the addend is a quiet NaN.
      signal(ExceptionFlags::Invalid);
      FloatValue<Fmt> Nan = Policy.template default_nan<Fmt>();
      if (C.is_nan())
        return deliver(detail::propagate_nan(Policy, Nan, C));
      return Nan;
    }
    if (C.is_nan())
      return deliver(detail::propagate_nan(Policy, C));

    bool ProductNegative = A.sign() != B.sign();
    if (ProductInfinite) {
      if (C.is_infinite() && C.sign() != ProductNegative)
        return invalidOperation<Fmt>();
      return infinity<Fmt>(ProductNegative);
    }
    if (C.is_infinite())
      return infinity<Fmt>(C.sign());

    return finish<Fmt>(Kernel<Fmt>::mul_add(A.to_bits(), B.to_bits(),
                                            C.to_bits(), mode(M)));
  }

  template <FormatDescriptor Fmt>
  FloatValue<Fmt> sqrt(FloatValue<Fmt> A, RoundingMode M) {
    static_assert(ArithmeticKernel<Kernel, Fmt>);
    if (A.is_nan())
      return deliver(detail::propagate_nan(Policy, A));
    if (A.is_zero())
      return A;
    if (A.sign())
      return invalidOperation<Fmt>();
    if (A.is_infinite())
      return infinity<Fmt>(false);
    return finish<Fmt>(Kernel<Fmt>::sqrt(A.to_bits(), mode(M)));
  }

  // Rounds to an integral value in the same format. Never raises inexact.
  template <FormatDescriptor Fmt>
  FloatValue<Fmt> round_to_integral(FloatValue<Fmt> A, RoundingMode M) {
    return roundToIntegral(A, M, false);
  }

  // As round_to_integral, raising inexact when the value changes.
  template <FormatDescriptor Fmt>
  FloatValue<Fmt> round_to_integral_exact(FloatValue<Fmt> A, RoundingMode M) {
    return roundToIntegral(A, M, true);
  }

  // ===================================================================
  // Comparison
  // ===================================================================
  // Quiet predicates signal invalid only for signaling NaN operands; the
  // _signaling variants signal it for any NaN. A NaN operand always gives
  // an unordered answer: std::nullopt, or std::partial_ordering::unordered.

  template <FormatDescriptor Fmt>
  std::partial_ordering compare(FloatValue<Fmt> A, FloatValue<Fmt> B) {
    return compareImpl(A, B, false);
  }

  template <FormatDescriptor Fmt>
  std::partial_ordering compare_signaling(FloatValue<Fmt> A,
                                          FloatValue<Fmt> B) {
    return compareImpl(A, B, true);
  }

  template <FormatDescriptor Fmt>
  std::optional<bool> eq(FloatValue<Fmt> A, FloatValue<Fmt> B) {
    std::partial_ordering O = compareImpl(A, B, false);
    if (O == std::partial_ordering::unordered)
      return std::nullopt;
    return O == 0;
  }

  template <FormatDescriptor Fmt>
  std::optional<bool> lt(FloatValue<Fmt> A, FloatValue<Fmt> B) {
    std::partial_ordering O = compareImpl(A, B, false);
    if (O == std::partial_ordering::unordered)
      return std::nullopt;
    return O < 0;
  }

  template <FormatDescriptor Fmt>
  std::optional<bool> le(FloatValue<Fmt> A, FloatValue<Fmt> B) {
    std::partial_ordering O = compareImpl(A, B, false);
    if (O == std::partial_ordering::unordered)
      return std::nullopt;
    return O <= 0;
  }

  template <FormatDescriptor Fmt>
  std::optional<bool> eq_signaling(FloatValue<Fmt> A, FloatValue<Fmt> B) {
    std::partial_ordering O = compareImpl(A, B, true);
    if (O == std::partial_ordering::unordered)
      return std::nullopt;
    return O == 0;
  }

  template <FormatDescriptor Fmt>
  std::optional<bool> lt_signaling(FloatValue<Fmt> A, FloatValue<Fmt> B) {
    std::partial_ordering O = compareImpl(A, B, true);
    if (O == std::partial_ordering::unordered)
      return std::nullopt;
    return O < 0;
  }

  template <FormatDescriptor Fmt>
  std::optional<bool> le_signaling(FloatValue<Fmt> A, FloatValue<Fmt> B) {
    std::partial_ordering O = compareImpl(A, B, true);
    if (O == std::partial_ordering::unordered)
      return std::nullopt;
    return O <= 0;
  }

  // ===================================================================
  // Conversion
  // ===================================================================

  // Exact when To is at least as wide as From (M is then unused);
  // otherwise rounds per M and raises inexact, overflow or underflow.
  template <FormatDescriptor To, FormatDescriptor From>
  FloatValue<To> convert_to(FloatValue<From> A, RoundingMode M) {
    static_assert(ConvertingKernel<Kernel, From, To>);
    if constexpr (std::is_same_v<To, From>) {
      return A;
    } else {
      if (A.is_nan())
        return deliver(detail::convert_nan<To>(Policy, A));
      if (A.is_infinite())
        return infinity<To>(A.sign());
      if (A.is_zero())
        return FloatValue<To>::positive_zero().with_sign(A.sign());
      return finish<To>(
          Kernel<From>::template convert<To>(A.to_bits(), mode(M)));
    }
  }

  // Out of range: invalid, saturated toward the nearer bound. NaN:
  // invalid, the Policy's NaN integer. Inexact is never raised.
  template <KernelInteger I, FormatDescriptor Fmt>
  I to_integer(FloatValue<Fmt> A, RoundingMode M) {
    return toInteger<I>(A, M, false);
  }

  // As to_integer, raising inexact when rounding changed the value.
  template <KernelInteger I, FormatDescriptor Fmt>
  I to_integer_exact(FloatValue<Fmt> A, RoundingMode M) {
    return toInteger<I>(A, M, true);
  }

  template <FormatDescriptor Fmt, SourceInteger I>
  FloatValue<Fmt> from_integer(I V, RoundingMode M) {
    static_assert(ArithmeticKernel<Kernel, Fmt>);
    KernelMode KM = mode(M);
    if constexpr (std::is_signed_v<I>) {
      if constexpr (sizeof(I) <= sizeof(int32_t))
        return finish<Fmt>(Kernel<Fmt>::from_i32(static_cast<int32_t>(V), KM));
      else
        return finish<Fmt>(Kernel<Fmt>::from_i64(static_cast<int64_t>(V), KM));
    } else {
      if constexpr (sizeof(I) <= sizeof(uint32_t))
        return finish<Fmt>(Kernel<Fmt>::from_u32(static_cast<uint32_t>(V), KM));
      else
        return finish<Fmt>(Kernel<Fmt>::from_u64(static_cast<uint64_t>(V), KM));
    }
  }

private:
  static constexpr KernelMode mode(RoundingMode M) {
    return {M, Policy.tininess};
  }

  void signal(uint8_t Flags) { State.raise(ExceptionFlags::from_bits(Flags)); }

  template <FormatDescriptor Fmt>
  static constexpr FloatValue<Fmt> infinity(bool Negative) {
    return FloatValue<Fmt>::positive_infinity().with_sign(Negative);
  }

  template <FormatDescriptor Fmt> FloatValue<Fmt> invalidOperation() {
    signal(ExceptionFlags::Invalid);
    return Policy.template default_nan<Fmt>();
  }

  template <FormatDescriptor Fmt>
  FloatValue<Fmt> deliver(detail::NanOutcome<Fmt> Outcome) {
    if (Outcome.invalid)
      signal(ExceptionFlags::Invalid);
    return Outcome.value;
  }

  template <FormatDescriptor Fmt>
  FloatValue<Fmt> finish(KernelResult<typename Fmt::storage_type> R) {
    State.raise(R.raised);
    return FloatValue<Fmt>::from_bits(R.value);
  }

  template <FormatDescriptor Fmt>
  FloatValue<Fmt> addOrSub(FloatValue<Fmt> A, FloatValue<Fmt> B,
                           bool Subtract, RoundingMode M) {
    static_assert(ArithmeticKernel<Kernel, Fmt>);
    if (A.is_nan() || B.is_nan())
      return deliver(detail::propagate_nan(Policy, A, B));
    bool NegativeB = B.sign() != Subtract;
    if (A.is_infinite()) {
      if (B.is_infinite() && A.sign() != NegativeB)
        return invalidOperation<Fmt>();
      return infinity<Fmt>(A.sign());
    }
    if (B.is_infinite())
      return infinity<Fmt>(NegativeB);
    KernelMode KM = mode(M);
    return finish<Fmt>(Subtract ? Kernel<Fmt>::sub(A.to_bits(), B.to_bits(), KM)
                                : Kernel<Fmt>::add(A.to_bits(), B.to_bits(), KM));
  }

  template <FormatDescriptor Fmt>
  FloatValue<Fmt> roundToIntegral(FloatValue<Fmt> A, RoundingMode M,
                                  bool Exact) {
    static_assert(ArithmeticKernel<Kernel, Fmt>);
    if (A.is_nan())
      return deliver(detail::propagate_nan(Policy, A));
    if (A.is_infinite() || A.is_zero())
      return A;
    return finish<Fmt>(
        Kernel<Fmt>::round_to_int(A.to_bits(), mode(M), Exact));
  }

  template <FormatDescriptor Fmt>
  std::partial_ordering compareImpl(FloatValue<Fmt> A, FloatValue<Fmt> B,
                                    bool Signaling) {
    if (A.is_nan() || B.is_nan()) {
      if (Signaling || A.is_signaling_nan() || B.is_signaling_nan())
        signal(ExceptionFlags::Invalid);
      return std::partial_ordering::unordered;
    }
    if (A.is_zero() && B.is_zero())
      return std::partial_ordering::equivalent;
    if (A.sign() != B.sign())
      return A.sign() ? std::partial_ordering::less
                      : std::partial_ordering::greater;
    auto MagA = A.abs().to_bits();
    auto MagB = B.abs().to_bits();
    return A.sign() ? (MagB <=> MagA) : (MagA <=> MagB);
  }

  template <KernelInteger I> static constexpr I nanInteger() {
    switch (Policy.nan_to_integer) {
    case NanToInteger::Indefinite:
      return std::is_signed_v<I> ? std::numeric_limits<I>::min()
                                 : std::numeric_limits<I>::max();
    case NanToInteger::Maximum:
      return std::numeric_limits<I>::max();
    case NanToInteger::Zero:
      break;
    }
    return I{0};
  }

  template <KernelInteger I, FormatDescriptor Fmt>
  I toInteger(FloatValue<Fmt> A, RoundingMode M, bool Exact) {
    static_assert(ArithmeticKernel<Kernel, Fmt>);
    if (A.is_nan()) {
      signal(ExceptionFlags::Invalid);
      return nanInteger<I>();
    }
    KernelMode KM = mode(M);
    KernelResult<I> R = [&] {
      if constexpr (std::is_same_v<I, int32_t>)
        return Kernel<Fmt>::to_i32(A.to_bits(), KM, Exact);
      else if constexpr (std::is_same_v<I, int64_t>)
        return Kernel<Fmt>::to_i64(A.to_bits(), KM, Exact);
      else if constexpr (std::is_same_v<I, uint32_t>)
        return Kernel<Fmt>::to_u32(A.to_bits(), KM, Exact);
      else
        return Kernel<Fmt>::to_u64(A.to_bits(), KM, Exact);
    }();
    if (R.raised.is_invalid()) {
      // Only an out-of-range value gets here; the kernel's own bound is
      // target-specific, so saturate by sign.
      signal(ExceptionFlags::Invalid);
      return A.sign() ? std::numeric_limits<I>::min()
                      : std::numeric_limits<I>::max();
    }
    State.raise(R.raised);
    return R.value;
  }

  ExceptionState &State;
};

} // namespace detfp

#endif // DETFP_ENGINE_ENGINE_HPP
