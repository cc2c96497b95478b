#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "detfp/core/exceptions.hpp"

using namespace detfp;

TEST_CASE("ExceptionFlags") {
  ExceptionFlags None;
  CHECK(None.empty());
  CHECK(None.bits() == 0);

  ExceptionFlags Both = ExceptionFlags::from_bits(ExceptionFlags::Overflow |
                                                  ExceptionFlags::Inexact);
  CHECK(Both.is_overflow());
  CHECK(Both.is_inexact());
  CHECK_FALSE(Both.is_invalid());
  CHECK_FALSE(Both.is_divide_by_zero());
  CHECK_FALSE(Both.is_underflow());

  SUBCASE("from_bits drops unknown bits") {
    CHECK(ExceptionFlags::from_bits(0xFF).bits() == ExceptionFlags::All);
  }

  SUBCASE("union") {
    ExceptionFlags U = Both | ExceptionFlags::from_bits(ExceptionFlags::Invalid);
    CHECK(U.is_invalid());
    CHECK(U.is_overflow());
    CHECK(U == ExceptionFlags::from_bits(ExceptionFlags::Invalid |
                                         ExceptionFlags::Overflow |
                                         ExceptionFlags::Inexact));
  }
}

TEST_CASE("ExceptionState is sticky") {
  ExceptionState State;
  CHECK(State.current_flags().empty());

  State.raise(ExceptionFlags::from_bits(ExceptionFlags::Inexact));
  State.raise(ExceptionFlags::from_bits(ExceptionFlags::DivideByZero));
  State.raise(ExceptionFlags());

  ExceptionFlags F = State.current_flags();
  CHECK(F.is_inexact());
  CHECK(F.is_divide_by_zero());
  CHECK_FALSE(F.is_invalid());

  // Raising a flag that is already set changes nothing.
  State.raise(ExceptionFlags::from_bits(ExceptionFlags::Inexact));
  CHECK(State.current_flags() == F);

  SUBCASE("reset clears everything") {
    State.reset_flags();
    CHECK(State.current_flags().empty());
    State.reset_flags();
    CHECK(State.current_flags().empty());
  }
}

TEST_CASE("independent states do not share flags") {
  ExceptionState A;
  ExceptionState B;
  A.raise(ExceptionFlags::from_bits(ExceptionFlags::Underflow));
  CHECK(A.current_flags().is_underflow());
  CHECK(B.current_flags().empty());
}
