#pragma once
#include <string>

// 128-bit fixed-point helpers for 1e18-scaled prices and rates.
namespace FixedPoint {
  using Uint128 = unsigned __int128;

  inline constexpr Uint128 SCALE = 1000000000000000000ULL; // 1e18
  inline constexpr Uint128 UINT128_MAX_VALUE = ~static_cast<Uint128>(0);

  // Full 256-bit product, split into high and low 128-bit halves.
  struct Uint256 {
    Uint128 hi = 0;
    Uint128 lo = 0;
  };

  Uint256 MulWide(Uint128 a, Uint128 b);

  // floor(a * b / d) with a 256-bit intermediate.
  // Throws ReferenceError(DivisionByZero) if d == 0 and
  // ReferenceError(Overflow) if the quotient does not fit 128 bits.
  Uint128 MulDiv(Uint128 a, Uint128 b, Uint128 d);

  // rate = floor(base_price * scale / quote_price).
  // Truncation toward zero is the only lossy step: the remainder of the
  // division is dropped, never rounded up. Throws std::invalid_argument
  // when scale == 0.
  Uint128 ComputeRate(Uint128 base_price, Uint128 quote_price, Uint128 scale = SCALE);

  std::string ToDecimalString(Uint128 value);
  // Digits only. std::invalid_argument on empty/non-digit input,
  // std::out_of_range above 2^128-1.
  Uint128 ParseUint128(const std::string& digits);
  // Human form of a scaled value: FormatDecimal(1500000000000000000, 18) == "1.5"
  std::string FormatDecimal(Uint128 value, unsigned decimals = 18);
}
