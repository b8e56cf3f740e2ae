#include "oracle/bulk_resolver.hpp"
#include "common/reference_error.hpp"
#include "constants/reference.hpp"

BulkResolver::BulkResolver(PairResolver pair_resolver) : pair_resolver_(std::move(pair_resolver)) {}

std::vector<ReferenceData> BulkResolver::Resolve(const std::vector<std::string>& bases,
                                                 const std::vector<std::string>& quotes,
                                                 std::uint64_t now,
                                                 const PriceLookup& store) const {
  if (bases.size() != quotes.size()) {
    throw ReferenceError::LengthMismatch(ReferenceConstants::ERR_NOT_ALL_INPUT_SIZES_ARE_THE_SAME);
  }
  std::vector<ReferenceData> out;
  out.reserve(bases.size());
  for (size_t i = 0; i < bases.size(); ++i) {
    try {
      out.push_back(pair_resolver_.Resolve(bases[i], quotes[i], now, store));
    } catch (const ReferenceError& e) {
      throw e.AtPair(i);
    }
  }
  return out;
}

std::vector<ReferenceData> BulkResolver::ResolvePairs(const std::vector<std::pair<std::string, std::string>>& pairs,
                                                      std::uint64_t now,
                                                      const PriceLookup& store) const {
  std::vector<std::string> bases, quotes;
  bases.reserve(pairs.size());
  quotes.reserve(pairs.size());
  for (const auto& p : pairs) {
    bases.push_back(p.first);
    quotes.push_back(p.second);
  }
  return Resolve(bases, quotes, now, store);
}
