#pragma once
#include "math/fixed_point.hpp"
#include <cstdint>
#include <optional>
#include <string>

// A symbol's USD price (1e18-scaled) and the unix time it was last written.
struct RawPrice {
  FixedPoint::Uint128 price = 0;
  std::uint64_t last_updated = 0;
};

// Read-only view of the feed storage consumed by the resolvers.
class PriceLookup {
public:
  virtual ~PriceLookup() = default;
  // std::nullopt when no feed was ever written for `symbol`.
  virtual std::optional<RawPrice> Get(const std::string& symbol) const = 0;
};
