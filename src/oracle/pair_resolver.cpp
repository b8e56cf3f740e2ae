#include "oracle/pair_resolver.hpp"
#include "common/reference_error.hpp"
#include <utility>
#include <vector>

PairResolver::PairResolver(SymbolResolver resolver) : resolver_(std::move(resolver)) {}

ReferenceData PairResolver::Resolve(const std::string& base,
                                    const std::string& quote,
                                    std::uint64_t now,
                                    const PriceLookup& store) const {
  auto base_price = resolver_.TryResolve(resolver_.Classify(base), now, store);
  auto quote_price = resolver_.TryResolve(resolver_.Classify(quote), now, store);

  std::vector<std::string> missing;
  if (!base_price) missing.push_back(base);
  if (!quote_price) missing.push_back(quote);
  if (!missing.empty()) throw ReferenceError::SymbolNotFound(std::move(missing));

  ReferenceData out;
  out.rate = FixedPoint::ComputeRate(base_price->price, quote_price->price, FixedPoint::SCALE);
  out.last_updated_base = base_price->last_updated;
  out.last_updated_quote = quote_price->last_updated;
  return out;
}
