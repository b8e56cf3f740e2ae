#include "query/query_router.hpp"
#include "encoding/reference_json.hpp"
#include "constants/reference.hpp"
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

QueryRouter::QueryRouter(const RefDataStore& store, BulkResolver resolver)
  : store_(store), resolver_(std::move(resolver)) {}

json QueryRouter::Handle(const json& msg, std::uint64_t now) const {
  if (!msg.is_object() || msg.size() != 1) {
    throw std::invalid_argument(ReferenceConstants::ERR_UNKNOWN_QUERY);
  }
  const auto& kind = msg.begin().key();
  const auto& body = msg.begin().value();
  if (kind == "get_ref") return GetRef(body, now);
  if (kind == "get_reference_data") return GetReferenceData(body, now);
  if (kind == "get_reference_data_bulk") return GetReferenceDataBulk(body, now);
  throw std::invalid_argument(ReferenceConstants::ERR_UNKNOWN_QUERY);
}

std::string QueryRouter::HandleRaw(const std::string& body, std::uint64_t now) const {
  json msg;
  try {
    msg = json::parse(body);
  } catch (const json::parse_error& e) {
    throw std::invalid_argument(std::string("query is not valid JSON: ") + e.what());
  }
  return Handle(msg, now).dump();
}

json QueryRouter::GetRef(const json& body, std::uint64_t now) const {
  const auto& symbol_resolver = resolver_.pair_resolver().symbol_resolver();
  Symbol symbol = symbol_resolver.Classify(ReferenceJson::ParseString(body, "symbol"));
  if (std::holds_alternative<UnitOfAccount>(symbol)) {
    RawPrice p = symbol_resolver.Resolve(symbol, now, store_);
    return ReferenceJson::ToJson(RefData{p.price, p.last_updated, ReferenceConstants::UNIT_OF_ACCOUNT_REQUEST_ID});
  }
  auto ref = store_.GetRef(SymbolName(symbol));
  if (!ref) throw ReferenceError::SymbolNotFound({SymbolName(symbol)});
  return ReferenceJson::ToJson(*ref);
}

json QueryRouter::GetReferenceData(const json& body, std::uint64_t now) const {
  std::string base, quote;
  if (body.is_object() && body.contains("symbol_pair")) {
    const auto& p = body.at("symbol_pair");
    if (!p.is_array() || p.size() != 2 || !p.at(0).is_string() || !p.at(1).is_string()) {
      throw std::invalid_argument("expected [base, quote]: symbol_pair");
    }
    base = p.at(0).get<std::string>();
    quote = p.at(1).get<std::string>();
  } else {
    base = ReferenceJson::ParseString(body, "base_symbol");
    quote = ReferenceJson::ParseString(body, "quote_symbol");
  }
  return ReferenceJson::ToJson(resolver_.pair_resolver().Resolve(base, quote, now, store_));
}

json QueryRouter::GetReferenceDataBulk(const json& body, std::uint64_t now) const {
  if (body.is_object() && body.contains("symbol_pairs")) {
    auto pairs = ReferenceJson::ParseSymbolPairs(body, "symbol_pairs");
    return ReferenceJson::ToJson(resolver_.ResolvePairs(pairs, now, store_));
  }
  auto bases = ReferenceJson::ParseStringList(body, "base_symbols");
  auto quotes = ReferenceJson::ParseStringList(body, "quote_symbols");
  return ReferenceJson::ToJson(resolver_.Resolve(bases, quotes, now, store_));
}
