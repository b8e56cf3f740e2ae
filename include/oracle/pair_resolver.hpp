#pragma once
#include "oracle/reference_data.hpp"
#include "oracle/symbol_resolver.hpp"
#include <cstdint>
#include <string>

// Resolves one base/quote pair into a 1e18-scaled cross rate.
class PairResolver {
public:
  explicit PairResolver(SymbolResolver resolver = SymbolResolver());

  // Both sides are looked up before failing, so a SymbolNotFound lists every
  // missing side in base, quote order. DivisionByZero when the quote price is
  // zero, Overflow when the rate exceeds 128 bits.
  ReferenceData Resolve(const std::string& base,
                        const std::string& quote,
                        std::uint64_t now,
                        const PriceLookup& store) const;

  const SymbolResolver& symbol_resolver() const { return resolver_; }

private:
  SymbolResolver resolver_;
};
