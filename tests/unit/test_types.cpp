#include "detfp/detfp.hpp"

#include <type_traits>

using namespace detfp;

// --- Format geometry ---

static_assert(binary32::sign_bits == 1);
static_assert(binary32::exp_bits == 8);
static_assert(binary32::frac_bits == 23);
static_assert(binary32::mant_bits == 23);
static_assert(binary32::total_bits == 32);
static_assert(binary32::exp_offset == 23);
static_assert(binary32::sign_offset == 31);

static_assert(binary16::total_bits == 16);
static_assert(bfloat16::total_bits == 16);
static_assert(binary64::total_bits == 64);
static_assert(binary128::total_bits == 128);

// x87 extended: explicit integer bit above a 63-bit fraction
static_assert(extended80::total_bits == 80);
static_assert(extended80::frac_bits == 63);
static_assert(extended80::mant_bits == 64);
static_assert(extended80::explicit_integer_bit);
static_assert(!binary128::explicit_integer_bit);

// --- Bias and precision ---

static_assert(binary16::bias == 15);  // 2^(5-1) - 1
static_assert(bfloat16::bias == 127);
static_assert(binary32::bias == 127);
static_assert(binary64::bias == 1023);
static_assert(extended80::bias == 16383);
static_assert(binary128::bias == 16383);

static_assert(binary16::precision == 11);
static_assert(bfloat16::precision == 8);
static_assert(binary32::precision == 24);
static_assert(binary64::precision == 53);
static_assert(extended80::precision == 64);
static_assert(binary128::precision == 113);

// --- Storage words ---

static_assert(std::is_same_v<binary16::storage_type, uint16_t>);
static_assert(std::is_same_v<bfloat16::storage_type, uint16_t>);
static_assert(std::is_same_v<binary32::storage_type, uint32_t>);
static_assert(std::is_same_v<binary64::storage_type, uint64_t>);
static_assert(std::is_same_v<extended80::storage_type, unsigned __int128>);
static_assert(std::is_same_v<binary128::storage_type, unsigned __int128>);

static_assert(low_mask<uint32_t>(8) == 0xFFu);
static_assert(low_mask<uint16_t>(16) == 0xFFFFu);
static_assert(extract_field<uint32_t>(0x3F800000u, 23, 8) == 127u);

// --- Masks ---

static_assert(F32::SignMask == 0x80000000u);
static_assert(F32::QuietBit == 0x00400000u);
static_assert(F32::IntegerBit == 0);
static_assert(F16::QuietBit == 0x0200u);
static_assert(BF16::QuietBit == 0x0040u);
static_assert(F80::IntegerBit == (unsigned __int128)1 << 63);
static_assert(F80::QuietBit == (unsigned __int128)1 << 62);

// --- Named values ---

static_assert(F32::one().to_bits() == 0x3F800000u);
static_assert(F32::max_finite().to_bits() == 0x7F7FFFFFu);
static_assert(F32::min_normal().to_bits() == 0x00800000u);
static_assert(F32::positive_infinity().to_bits() == 0x7F800000u);
static_assert(F16::one().to_bits() == 0x3C00u);
static_assert(F16::max_finite().to_bits() == 0x7BFFu);
static_assert(BF16::one().to_bits() == 0x3F80u);
static_assert(F64::one().to_bits() == 0x3FF0000000000000ull);
static_assert(F80::one().to_bits() ==
              (((unsigned __int128)0x3FFF << 64) | ((unsigned __int128)1 << 63)));

// --- Kernel seam ---

static_assert(ArithmeticKernel<SoftFloatKernel, binary16>);
static_assert(ConvertingKernel<SoftFloatKernel, bfloat16, extended80>);
static_assert(ConvertingKernel<SoftFloatKernel, binary128, bfloat16>);

// --- Engine composition ---

using X87Engine = Engine<policies::X86>;
static_assert(X87Engine::policy.propagation ==
              NanPropagation::LargerSignificand);
static_assert(Engine<policies::RiscV>::policy.nan_to_integer ==
              NanToInteger::Maximum);
static_assert(DefaultEngine::policy.propagation ==
              ActivePolicy.propagation);

static_assert(KernelInteger<int32_t>);
static_assert(KernelInteger<uint64_t>);
static_assert(!KernelInteger<int16_t>);
static_assert(SourceInteger<int8_t>);
static_assert(!SourceInteger<bool>);

int main() { return 0; }
