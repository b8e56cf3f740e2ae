#pragma once
#include "math/fixed_point.hpp"
#include <cstdint>

// Result of resolving one base/quote pair.
struct ReferenceData {
  FixedPoint::Uint128 rate = 0; // base/quote, 1e18-scaled
  std::uint64_t last_updated_base = 0;
  std::uint64_t last_updated_quote = 0;

  bool operator==(const ReferenceData& o) const {
    return rate == o.rate && last_updated_base == o.last_updated_base &&
           last_updated_quote == o.last_updated_quote;
  }
  bool operator!=(const ReferenceData& o) const { return !(*this == o); }
};
