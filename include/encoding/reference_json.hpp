#pragma once
#include "common/reference_error.hpp"
#include "oracle/reference_data.hpp"
#include "oracle/ref_data_store.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// JSON schema of queries, execute messages and responses.
// uint128 values travel as decimal strings, uint64 as JSON numbers.
// Malformed input raises std::invalid_argument.
namespace ReferenceJson {
  using json = nlohmann::json;

  json ToJson(const ReferenceData& data);
  json ToJson(const std::vector<ReferenceData>& data);
  json ToJson(const RefData& data);
  json ErrorToJson(const ReferenceError& error);

  // Accepts "123" or a non-negative JSON integer.
  FixedPoint::Uint128 ParseUint128(const json& j);
  std::uint64_t ParseU64(const json& j, const char* field);
  std::string ParseString(const json& j, const char* field);
  std::vector<std::string> ParseStringList(const json& j, const char* field);
  // [["BTC","USD"], ...]
  std::vector<std::pair<std::string, std::string>> ParseSymbolPairs(const json& j, const char* field);

  // {"relay": {...}} or {"force_relay": {...}} with resolve_time, request_id
  // and either parallel symbols/rates lists or symbol_rates [[symbol, rate], ...].
  // Returns the number of symbols written.
  std::size_t ApplyExecuteMsg(RefDataStore& store, const json& msg);

  // Applies a JSON array of execute messages read from `path`.
  // std::runtime_error if the file cannot be read.
  std::size_t LoadSnapshot(RefDataStore& store, const std::string& path);
}
