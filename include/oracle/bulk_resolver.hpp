#pragma once
#include "oracle/pair_resolver.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Batch front of PairResolver. All-or-nothing: the first failing pair aborts
// the whole batch with its error tagged by pair index (see ReferenceError::AtPair).
class BulkResolver {
public:
  explicit BulkResolver(PairResolver pair_resolver = PairResolver());

  // Output index i corresponds to (bases[i], quotes[i]).
  // LengthMismatch is raised before any lookup is made.
  std::vector<ReferenceData> Resolve(const std::vector<std::string>& bases,
                                     const std::vector<std::string>& quotes,
                                     std::uint64_t now,
                                     const PriceLookup& store) const;

  std::vector<ReferenceData> ResolvePairs(const std::vector<std::pair<std::string, std::string>>& pairs,
                                          std::uint64_t now,
                                          const PriceLookup& store) const;

  const PairResolver& pair_resolver() const { return pair_resolver_; }

private:
  PairResolver pair_resolver_;
};
