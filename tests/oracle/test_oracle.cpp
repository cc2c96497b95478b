// Cross-validation against MPFR: verify that detfp and an independent
// arbitrary-precision implementation agree.
//
// Every test is an instance of the same pattern: take two adapters that
// should agree, run them on the same inputs, compare outputs. No adapter
// is privileged. MPFR supplies correctly rounded values in every format;
// NaNs match as a class and flags are not compared.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "harness/agreement.hpp"
#include "harness/impl_detfp.hpp"
#include "harness/impl_mpfr.hpp"
#include "harness/test_harness.hpp"

using namespace detfp;
using namespace detfp::testing;

// ===================================================================
// detfp vs MPFR: correctly rounded values in every format
// ===================================================================

TEST_CASE_TEMPLATE("detfp vs MPFR", T, binary16, bfloat16, binary32,
                   binary64, extended80, binary128) {
  for (RoundingMode M : MpfrModes) {
    const char *Mode = modeName(M);
    CAPTURE(Mode);
    verifyAgreement<T>(DetfpAdapter<T, policies::X86Sse>{M},
                       MpfrAdapter<T>{M}, NanAwareBitExact<T>{});
  }
}

// ===================================================================
// Decode validation: MPFR decode and encode agree
// ===================================================================
// Converting a decoded value back through encodeFromMpfr must give the
// same pattern for every finite edge case.

template <FormatDescriptor Fmt> void verifyDecodeRoundTrip() {
  using F = FloatValue<Fmt>;
  constexpr int HexWidth = (Fmt::total_bits + 3) / 4;
  int Failures = 0;

  for (auto Bits : interestingValues<Fmt>()) {
    if (F::from_bits(Bits).is_nan())
      continue;
    MpfrFloat Decoded = decodeToMpfr<Fmt>(Bits);
    if (encodeFromMpfr<Fmt>(Decoded) != Bits) {
      Failures++;
      std::fprintf(stderr, "  DECODE MISMATCH: bits=0x");
      printHex(stderr, Bits, HexWidth);
      std::fprintf(stderr, "\n");
    }
  }

  CHECK(Failures == 0);
}

TEST_CASE_TEMPLATE("decode: MPFR round trip", T, binary16, bfloat16,
                   binary32, binary64, extended80, binary128) {
  verifyDecodeRoundTrip<T>();
}
