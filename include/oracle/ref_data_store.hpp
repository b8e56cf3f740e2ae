#pragma once
#include "oracle/price_lookup.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Stored feed record for one symbol.
struct RefData {
  FixedPoint::Uint128 rate = 0;     // USD price, 1e18-scaled
  std::uint64_t resolve_time = 0;   // unix time the oracle request resolved
  std::uint64_t request_id = 0;

  bool operator==(const RefData& o) const {
    return rate == o.rate && resolve_time == o.resolve_time && request_id == o.request_id;
  }
};

// In-memory feed storage. Not synchronized: writes must not overlap reads.
class RefDataStore : public PriceLookup {
public:
  std::optional<RawPrice> Get(const std::string& symbol) const override;
  std::optional<RefData> GetRef(const std::string& symbol) const;

  // Writes every symbol whose stored resolve_time is older than `resolve_time`;
  // symbols already at or past it are skipped. Returns the number written.
  // Throws ReferenceError(LengthMismatch) before writing anything when sizes differ.
  std::size_t Relay(const std::vector<std::string>& symbols,
                    const std::vector<FixedPoint::Uint128>& rates,
                    std::uint64_t resolve_time,
                    std::uint64_t request_id);

  // Like Relay without the resolve_time guard.
  void ForceRelay(const std::vector<std::string>& symbols,
                  const std::vector<FixedPoint::Uint128>& rates,
                  std::uint64_t resolve_time,
                  std::uint64_t request_id);

  std::size_t Size() const { return refs_.size(); }
  std::vector<std::string> Symbols() const;

private:
  std::unordered_map<std::string, RefData> refs_;
};
