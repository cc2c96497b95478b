#ifndef DETFP_CORE_FORMAT_HPP
#define DETFP_CORE_FORMAT_HPP

#include <concepts>

#include "detfp/core/bits.hpp"

namespace detfp {

// Format descriptor (bit geometry).
//
// Standard [S][E][M] field order, sign in the most significant bit.
// FracBits counts the fraction bits only. When ExplicitIntegerBit is set
// (x87 extended precision) the mantissa field carries the integer bit
// above the fraction, so mant_bits == FracBits + 1.
template <int ExpBits, int FracBits, bool ExplicitIntegerBit = false>
struct Format {
  static constexpr int sign_bits = 1;
  static constexpr int exp_bits = ExpBits;
  static constexpr int frac_bits = FracBits;
  static constexpr bool explicit_integer_bit = ExplicitIntegerBit;
  static constexpr int mant_bits = FracBits + (ExplicitIntegerBit ? 1 : 0);
  static constexpr int total_bits = sign_bits + exp_bits + mant_bits;

  static constexpr int mant_offset = 0;
  static constexpr int exp_offset = mant_bits;
  static constexpr int sign_offset = exp_offset + exp_bits;

  static constexpr int bias = (1 << (ExpBits - 1)) - 1;
  static constexpr int precision = FracBits + 1; // significant bits

  using storage_type = bits_t<total_bits>;

  static_assert(ExpBits >= 2, "exponent field needs at least 2 bits");
  static_assert(FracBits >= 2, "fraction needs a quiet bit and a payload bit");
  static_assert(sign_bits + exp_bits + mant_bits == total_bits,
                "fields must exactly fill the format width");
  static_assert(total_bits <= int(sizeof(storage_type) * 8),
                "storage word must hold the format");
};

template <typename F>
concept FormatDescriptor = requires {
  { F::exp_bits } -> std::convertible_to<int>;
  { F::frac_bits } -> std::convertible_to<int>;
  { F::mant_bits } -> std::convertible_to<int>;
  { F::total_bits } -> std::convertible_to<int>;
  { F::bias } -> std::convertible_to<int>;
  { F::explicit_integer_bit } -> std::convertible_to<bool>;
  typename F::storage_type;
} && (F::sign_bits + F::exp_bits + F::mant_bits == F::total_bits);

// --- Supported formats ---

using binary16 = Format<5, 10>;
using bfloat16 = Format<8, 7>;
using binary32 = Format<8, 23>;
using binary64 = Format<11, 52>;
using extended80 = Format<15, 63, true>;
using binary128 = Format<15, 112>;

static_assert(FormatDescriptor<binary16>);
static_assert(FormatDescriptor<bfloat16>);
static_assert(FormatDescriptor<binary32>);
static_assert(FormatDescriptor<binary64>);
static_assert(FormatDescriptor<extended80>);
static_assert(FormatDescriptor<binary128>);

} // namespace detfp

#endif // DETFP_CORE_FORMAT_HPP
