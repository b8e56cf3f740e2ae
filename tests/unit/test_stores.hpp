#pragma once
#include "oracle/price_lookup.hpp"
#include <map>
#include <string>

// Map-backed PriceLookup that counts Get calls.
class MockPriceLookup : public PriceLookup {
public:
  void Put(const std::string& symbol, FixedPoint::Uint128 price, std::uint64_t last_updated) {
    prices_[symbol] = RawPrice{price, last_updated};
  }

  std::optional<RawPrice> Get(const std::string& symbol) const override {
    ++lookups_;
    auto it = prices_.find(symbol);
    if (it == prices_.end()) return std::nullopt;
    return it->second;
  }

  int lookups() const { return lookups_; }

private:
  std::map<std::string, RawPrice> prices_;
  mutable int lookups_ = 0;
};

// Reference prices used across the suites (USD, 1e18-scaled).
namespace TestPrices {
  inline const FixedPoint::Uint128 BTC = FixedPoint::ParseUint128("23131270000000000000000");
  inline const FixedPoint::Uint128 ETH = FixedPoint::ParseUint128("1640500000000000000000");
  inline const FixedPoint::Uint128 BAND = FixedPoint::ParseUint128("1500000000000000000");
  inline constexpr std::uint64_t BTC_TIME = 1659588229;
  inline constexpr std::uint64_t ETH_TIME = 1659588100;
  inline constexpr std::uint64_t BAND_TIME = 1659580000;
  inline constexpr std::uint64_t NOW = 1659589497;

  inline void Populate(MockPriceLookup& store) {
    store.Put("BTC", BTC, BTC_TIME);
    store.Put("ETH", ETH, ETH_TIME);
    store.Put("BAND", BAND, BAND_TIME);
  }
}
