#ifndef DETFP_TESTS_HARNESS_AGREEMENT_HPP
#define DETFP_TESTS_HARNESS_AGREEMENT_HPP

// verifyAgreement: runs two adapters over the same inputs for every
// operation the adapters dispatch and checks that they agree.

#include <doctest/doctest.h>

#include "detfp/core/enums.hpp"
#include "detfp/core/float.hpp"
#include "harness/ops.hpp"
#include "harness/test_harness.hpp"

namespace detfp::testing {

// MPFR has no ties-to-away arithmetic.
inline constexpr RoundingMode MpfrModes[] = {
    RoundingMode::TiesToEven, RoundingMode::TowardZero,
    RoundingMode::TowardPositive, RoundingMode::TowardNegative};

inline constexpr RoundingMode AllModes[] = {
    RoundingMode::TiesToEven, RoundingMode::TowardZero,
    RoundingMode::TowardPositive, RoundingMode::TowardNegative,
    RoundingMode::TiesToAway};

inline const char *modeName(RoundingMode M) {
  switch (M) {
  case RoundingMode::TiesToEven:     return "RNE";
  case RoundingMode::TowardZero:     return "RTZ";
  case RoundingMode::TowardPositive: return "RUP";
  case RoundingMode::TowardNegative: return "RDN";
  case RoundingMode::TiesToAway:     return "RNA";
  }
  return "???";
}

inline constexpr int RandomCount = 20000;

// ===================================================================
// verifyAgreement: generic pairwise comparison
// ===================================================================
// Runs both adapters over the targeted edge cases and a random sample
// for every binary operation, square root, and fused multiply-add with
// a few fixed addends.

template <FormatDescriptor Fmt, typename AdapterA, typename AdapterB,
          typename Comparator>
void verifyAgreement(const AdapterA &A, const AdapterB &B, Comparator Cmp) {
  using BitsType = typename Fmt::storage_type;
  using F = FloatValue<Fmt>;
  constexpr int HexWidth = (Fmt::total_bits + 3) / 4;

  const auto Interesting = interestingValues<Fmt>();
  auto Iter = combined(
      TargetedPairs<BitsType>{Interesting.data(),
                              static_cast<int>(Interesting.size())},
      RandomPairs<Fmt>{42, RandomCount});

  for (auto O : {Op::Add, Op::Sub, Op::Mul, Op::Div, Op::Rem, Op::Eq,
                 Op::Lt, Op::Le}) {
    const char *Name = opName(O);
    CAPTURE(Name);
    auto ImplA = [&](BitsType X, BitsType Y) { return A.dispatch(O, X, Y); };
    auto ImplB = [&](BitsType X, BitsType Y) { return B.dispatch(O, X, Y); };
    auto R = testAgainst<BitsType>(Name, HexWidth, Iter, ImplA, ImplB, Cmp);
    CHECK(R.Failed == 0);
  }

  {
    // Y is ignored; each X is visited once per pairing partner.
    auto ImplA = [&](BitsType X, BitsType) {
      return A.dispatchUnary(Op::Sqrt, X);
    };
    auto ImplB = [&](BitsType X, BitsType) {
      return B.dispatchUnary(Op::Sqrt, X);
    };
    auto R = testAgainst<BitsType>("sqrt", HexWidth, Iter, ImplA, ImplB, Cmp);
    CHECK(R.Failed == 0);
  }

  {
    const BitsType Addends[] = {
        F::positive_zero().to_bits(),
        F::negative_zero().to_bits(),
        F::one().negate().to_bits(),
        F::min_subnormal().to_bits(),
        F::max_finite().negate().to_bits(),
    };
    for (BitsType C : Addends) {
      auto ImplA = [&](BitsType X, BitsType Y) {
        return A.dispatchTernary(Op::MulAdd, X, Y, C);
      };
      auto ImplB = [&](BitsType X, BitsType Y) {
        return B.dispatchTernary(Op::MulAdd, X, Y, C);
      };
      auto R =
          testAgainst<BitsType>("mulAdd", HexWidth, Iter, ImplA, ImplB, Cmp);
      CHECK(R.Failed == 0);
    }
  }
}

} // namespace detfp::testing

#endif // DETFP_TESTS_HARNESS_AGREEMENT_HPP
