#pragma once
#include "oracle/price_lookup.hpp"
#include "constants/reference.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// A symbol backed by a relayed feed.
struct OrdinarySymbol {
  std::string name;
};

// The reserved fiat symbol; its price is synthetic.
struct UnitOfAccount {
  std::string name;
};

using Symbol = std::variant<OrdinarySymbol, UnitOfAccount>;

const std::string& SymbolName(const Symbol& symbol);

class SymbolResolver {
public:
  explicit SymbolResolver(std::string unit_of_account = ReferenceConstants::UNIT_OF_ACCOUNT);

  // Exact, case-sensitive match against the unit-of-account name.
  Symbol Classify(const std::string& name) const;

  // Unit-of-account resolves to {SCALE, now} without touching the store.
  // A stored record is returned as-is regardless of its age.
  // Throws ReferenceError(SymbolNotFound) when the store has no record.
  RawPrice Resolve(const Symbol& symbol, std::uint64_t now, const PriceLookup& store) const;
  RawPrice Resolve(const std::string& name, std::uint64_t now, const PriceLookup& store) const;

  // Same as Resolve but reports a miss as std::nullopt.
  std::optional<RawPrice> TryResolve(const Symbol& symbol, std::uint64_t now, const PriceLookup& store) const;

  const std::string& unit_of_account() const { return unit_of_account_; }

private:
  std::string unit_of_account_;
};
