#ifndef DETFP_CORE_BITS_HPP
#define DETFP_CORE_BITS_HPP

// bits_t<N>: the storage word for an N-bit floating-point pattern.
//
// Not an integer semantically: a bag of bits. Maps to the smallest
// standard unsigned type that holds N bits, with unsigned __int128 for
// the 80- and 128-bit formats.

#include <cstdint>

namespace detfp {

#if !defined(__SIZEOF_INT128__)
#error "detfp requires a compiler with unsigned __int128 (GCC or Clang)"
#endif

namespace detail {

template <int N>
struct BitsStorage {
  static_assert(N > 0 && N <= 128, "storage limited to 128 bits");
};

template <int N>
  requires(N > 8 && N <= 16)
struct BitsStorage<N> {
  using type = uint16_t;
};

template <int N>
  requires(N > 16 && N <= 32)
struct BitsStorage<N> {
  using type = uint32_t;
};

template <int N>
  requires(N > 32 && N <= 64)
struct BitsStorage<N> {
  using type = uint64_t;
};

template <int N>
  requires(N > 64 && N <= 128)
struct BitsStorage<N> {
  using type = unsigned __int128;
};

} // namespace detail

template <int N>
using bits_t = typename detail::BitsStorage<N>::type;

// All-ones mask covering the low Width bits of a BitsType.
template <typename BitsType>
constexpr BitsType low_mask(int Width) {
  if (Width >= int(sizeof(BitsType) * 8))
    return static_cast<BitsType>(~BitsType{0});
  return static_cast<BitsType>((BitsType{1} << Width) - 1);
}

template <typename BitsType>
constexpr BitsType extract_field(BitsType Bits, int Offset, int Width) {
  if (Width == 0)
    return BitsType{0};
  return static_cast<BitsType>((Bits >> Offset) & low_mask<BitsType>(Width));
}

} // namespace detfp

#endif // DETFP_CORE_BITS_HPP
