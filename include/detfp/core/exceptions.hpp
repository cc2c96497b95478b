#ifndef DETFP_CORE_EXCEPTIONS_HPP
#define DETFP_CORE_EXCEPTIONS_HPP

#include <cstdint>

namespace detfp {

// The five IEEE 754 exception flags as a value type.
class ExceptionFlags {
public:
  static constexpr uint8_t Invalid = 1u << 0;
  static constexpr uint8_t DivideByZero = 1u << 1;
  static constexpr uint8_t Overflow = 1u << 2;
  static constexpr uint8_t Underflow = 1u << 3;
  static constexpr uint8_t Inexact = 1u << 4;
  static constexpr uint8_t All =
      Invalid | DivideByZero | Overflow | Underflow | Inexact;

  constexpr ExceptionFlags() = default;

  static constexpr ExceptionFlags from_bits(uint8_t Bits) {
    return ExceptionFlags(Bits & All);
  }

  constexpr uint8_t bits() const { return Bits; }
  constexpr bool empty() const { return Bits == 0; }

  constexpr bool is_invalid() const { return (Bits & Invalid) != 0; }
  constexpr bool is_divide_by_zero() const {
    return (Bits & DivideByZero) != 0;
  }
  constexpr bool is_overflow() const { return (Bits & Overflow) != 0; }
  constexpr bool is_underflow() const { return (Bits & Underflow) != 0; }
  constexpr bool is_inexact() const { return (Bits & Inexact) != 0; }

  constexpr ExceptionFlags operator|(ExceptionFlags Other) const {
    return ExceptionFlags(Bits | Other.Bits);
  }
  constexpr ExceptionFlags &operator|=(ExceptionFlags Other) {
    Bits |= Other.Bits;
    return *this;
  }
  constexpr bool operator==(const ExceptionFlags &) const = default;

private:
  constexpr explicit ExceptionFlags(uint8_t B) : Bits(B) {}

  uint8_t Bits = 0;
};

// Sticky accumulator.
//
// Operations only OR flags in; reset_flags() is the sole way to clear
// them. The caller owns the instance and picks its scope. One instance
// must not be mutated from two threads at once; give each thread or task
// its own.
class ExceptionState {
public:
  ExceptionState() = default;

  ExceptionFlags current_flags() const { return Flags; }
  void reset_flags() { Flags = ExceptionFlags(); }
  void raise(ExceptionFlags Raised) { Flags |= Raised; }

private:
  ExceptionFlags Flags;
};

} // namespace detfp

#endif // DETFP_CORE_EXCEPTIONS_HPP
