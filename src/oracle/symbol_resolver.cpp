#include "oracle/symbol_resolver.hpp"
#include "common/reference_error.hpp"
#include <stdexcept>
#include <utility>

const std::string& SymbolName(const Symbol& symbol) {
  if (auto* s = std::get_if<OrdinarySymbol>(&symbol)) return s->name;
  return std::get<UnitOfAccount>(symbol).name;
}

SymbolResolver::SymbolResolver(std::string unit_of_account)
  : unit_of_account_(std::move(unit_of_account)) {
  if (unit_of_account_.empty()) throw std::invalid_argument("unit of account symbol must not be empty");
}

Symbol SymbolResolver::Classify(const std::string& name) const {
  if (name == unit_of_account_) return UnitOfAccount{name};
  return OrdinarySymbol{name};
}

std::optional<RawPrice> SymbolResolver::TryResolve(const Symbol& symbol,
                                                   std::uint64_t now,
                                                   const PriceLookup& store) const {
  if (std::holds_alternative<UnitOfAccount>(symbol)) {
    return RawPrice{FixedPoint::SCALE, now};
  }
  return store.Get(std::get<OrdinarySymbol>(symbol).name);
}

RawPrice SymbolResolver::Resolve(const Symbol& symbol, std::uint64_t now, const PriceLookup& store) const {
  auto price = TryResolve(symbol, now, store);
  if (!price) throw ReferenceError::SymbolNotFound({SymbolName(symbol)});
  return *price;
}

RawPrice SymbolResolver::Resolve(const std::string& name, std::uint64_t now, const PriceLookup& store) const {
  return Resolve(Classify(name), now, store);
}
