#pragma once
#include "oracle/bulk_resolver.hpp"
#include "oracle/ref_data_store.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

// Routes a decoded query message to the resolvers:
//   {"get_ref": {"symbol": S}}
//   {"get_reference_data": {"base_symbol": B, "quote_symbol": Q}} or {"symbol_pair": [B, Q]}
//   {"get_reference_data_bulk": {"base_symbols": [...], "quote_symbols": [...]}} or {"symbol_pairs": [[B, Q], ...]}
// ReferenceError propagates unchanged; unknown or malformed messages raise
// std::invalid_argument.
class QueryRouter {
public:
  QueryRouter(const RefDataStore& store, BulkResolver resolver = BulkResolver());

  nlohmann::json Handle(const nlohmann::json& msg, std::uint64_t now) const;
  std::string HandleRaw(const std::string& body, std::uint64_t now) const;

private:
  nlohmann::json GetRef(const nlohmann::json& body, std::uint64_t now) const;
  nlohmann::json GetReferenceData(const nlohmann::json& body, std::uint64_t now) const;
  nlohmann::json GetReferenceDataBulk(const nlohmann::json& body, std::uint64_t now) const;

  const RefDataStore& store_;
  BulkResolver resolver_;
};
