#include "math/fixed_point.hpp"
#include "common/reference_error.hpp"
#include <algorithm>
#include <stdexcept>

namespace {
  constexpr FixedPoint::Uint128 LOW64 = 0xFFFFFFFFFFFFFFFFULL;
}

namespace FixedPoint {
  Uint256 MulWide(Uint128 a, Uint128 b) {
    Uint128 a0 = a & LOW64, a1 = a >> 64;
    Uint128 b0 = b & LOW64, b1 = b >> 64;
    Uint128 p00 = a0 * b0;
    Uint128 p01 = a0 * b1;
    Uint128 p10 = a1 * b0;
    Uint128 p11 = a1 * b1;
    // at most 3 * (2^64 - 1), no carry out of 128 bits
    Uint128 mid = (p00 >> 64) + (p01 & LOW64) + (p10 & LOW64);
    Uint256 out;
    out.lo = (mid << 64) | (p00 & LOW64);
    out.hi = p11 + (p01 >> 64) + (p10 >> 64) + (mid >> 64);
    return out;
  }

  Uint128 MulDiv(Uint128 a, Uint128 b, Uint128 d) {
    if (d == 0) throw ReferenceError::DivisionByZero();
    Uint256 n = MulWide(a, b);
    if (n.hi == 0) return n.lo / d;
    // quotient >= 2^128 whenever the high half alone reaches d
    if (n.hi >= d) throw ReferenceError::Overflow();
    // Restoring long division of (hi:lo) by d; remainder stays below d.
    Uint128 rem = n.hi;
    Uint128 quot = 0;
    for (int i = 127; i >= 0; --i) {
      bool carry = (rem >> 127) != 0;
      rem = (rem << 1) | ((n.lo >> i) & 1);
      quot <<= 1;
      if (carry || rem >= d) {
        rem -= d;
        quot |= 1;
      }
    }
    return quot;
  }

  Uint128 ComputeRate(Uint128 base_price, Uint128 quote_price, Uint128 scale) {
    if (scale == 0) throw std::invalid_argument("scale must be non-zero");
    return MulDiv(base_price, scale, quote_price);
  }

  std::string ToDecimalString(Uint128 value) {
    if (value == 0) return "0";
    std::string out;
    while (value) {
      out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
      value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
  }

  Uint128 ParseUint128(const std::string& digits) {
    if (digits.empty()) throw std::invalid_argument("empty integer");
    Uint128 v = 0;
    for (char c : digits) {
      if (c < '0' || c > '9') throw std::invalid_argument("not a decimal integer: " + digits);
      Uint128 d = static_cast<Uint128>(c - '0');
      if (v > (UINT128_MAX_VALUE - d) / 10) throw std::out_of_range("exceeds uint128: " + digits);
      v = v * 10 + d;
    }
    return v;
  }

  std::string FormatDecimal(Uint128 value, unsigned decimals) {
    std::string s = ToDecimalString(value);
    if (decimals == 0) return s;
    if (s.size() <= decimals) s.insert(0, decimals - s.size() + 1, '0');
    std::string whole = s.substr(0, s.size() - decimals);
    std::string frac = s.substr(s.size() - decimals);
    while (!frac.empty() && frac.back() == '0') frac.pop_back();
    return frac.empty() ? whole : whole + "." + frac;
  }
}
