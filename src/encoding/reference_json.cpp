#include "encoding/reference_json.hpp"
#include "common/logger.hpp"
#include "constants/reference.hpp"
#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace {
  const nlohmann::json& Field(const nlohmann::json& j, const char* field) {
    if (!j.is_object() || !j.contains(field)) {
      throw std::invalid_argument(std::string("missing field: ") + field);
    }
    return j.at(field);
  }
}

namespace ReferenceJson {
  json ToJson(const ReferenceData& data) {
    return json{
      {"rate", FixedPoint::ToDecimalString(data.rate)},
      {"last_updated_base", data.last_updated_base},
      {"last_updated_quote", data.last_updated_quote},
    };
  }

  json ToJson(const std::vector<ReferenceData>& data) {
    json out = json::array();
    for (const auto& d : data) out.push_back(ToJson(d));
    return out;
  }

  json ToJson(const RefData& data) {
    return json{
      {"rate", FixedPoint::ToDecimalString(data.rate)},
      {"resolve_time", data.resolve_time},
      {"request_id", data.request_id},
    };
  }

  json ErrorToJson(const ReferenceError& error) {
    json body{
      {"code", ReferenceErrorCodeName(error.code())},
      {"message", error.what()},
    };
    if (!error.symbols().empty()) body["symbols"] = error.symbols();
    if (error.pair_index()) body["pair_index"] = *error.pair_index();
    return json{{"error", body}};
  }

  FixedPoint::Uint128 ParseUint128(const json& j) {
    if (j.is_string()) {
      try {
        return FixedPoint::ParseUint128(j.get<std::string>());
      } catch (const std::out_of_range& e) {
        throw std::invalid_argument(e.what());
      }
    }
    if (j.is_number_unsigned()) return j.get<std::uint64_t>();
    throw std::invalid_argument("expected uint128 as decimal string, got: " + j.dump());
  }

  std::uint64_t ParseU64(const json& j, const char* field) {
    const auto& v = Field(j, field);
    if (v.is_number_unsigned()) return v.get<std::uint64_t>();
    // cosmwasm Uint64 is serialized as a string
    if (v.is_string()) {
      FixedPoint::Uint128 wide = 0;
      try {
        wide = FixedPoint::ParseUint128(v.get<std::string>());
      } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string("uint64 out of range: ") + field);
      }
      if (wide > static_cast<FixedPoint::Uint128>(UINT64_MAX)) {
        throw std::invalid_argument(std::string("uint64 out of range: ") + field);
      }
      return static_cast<std::uint64_t>(wide);
    }
    throw std::invalid_argument(std::string("expected uint64: ") + field);
  }

  std::string ParseString(const json& j, const char* field) {
    const auto& v = Field(j, field);
    if (!v.is_string()) throw std::invalid_argument(std::string("expected string: ") + field);
    return v.get<std::string>();
  }

  std::vector<std::string> ParseStringList(const json& j, const char* field) {
    const auto& v = Field(j, field);
    if (!v.is_array()) throw std::invalid_argument(std::string("expected array: ") + field);
    std::vector<std::string> out;
    out.reserve(v.size());
    for (const auto& item : v) {
      if (!item.is_string()) throw std::invalid_argument(std::string("expected string items: ") + field);
      out.push_back(item.get<std::string>());
    }
    return out;
  }

  std::vector<std::pair<std::string, std::string>> ParseSymbolPairs(const json& j, const char* field) {
    const auto& v = Field(j, field);
    if (!v.is_array()) throw std::invalid_argument(std::string("expected array: ") + field);
    std::vector<std::pair<std::string, std::string>> out;
    out.reserve(v.size());
    for (const auto& p : v) {
      if (!p.is_array() || p.size() != 2 || !p.at(0).is_string() || !p.at(1).is_string()) {
        throw std::invalid_argument(std::string("expected [base, quote] pairs: ") + field);
      }
      out.emplace_back(p.at(0).get<std::string>(), p.at(1).get<std::string>());
    }
    return out;
  }

  std::size_t ApplyExecuteMsg(RefDataStore& store, const json& msg) {
    bool force = false;
    const json* body = nullptr;
    if (msg.is_object() && msg.contains("relay")) {
      body = &msg.at("relay");
    } else if (msg.is_object() && msg.contains("force_relay")) {
      body = &msg.at("force_relay");
      force = true;
    } else {
      throw std::invalid_argument(ReferenceConstants::ERR_UNKNOWN_EXECUTE_MSG);
    }
    std::vector<std::string> symbols;
    std::vector<FixedPoint::Uint128> rates;
    if (body->is_object() && body->contains("symbol_rates")) {
      const auto& pairs = body->at("symbol_rates");
      if (!pairs.is_array()) throw std::invalid_argument("expected array: symbol_rates");
      for (const auto& p : pairs) {
        if (!p.is_array() || p.size() != 2 || !p.at(0).is_string()) {
          throw std::invalid_argument("expected [symbol, rate] pairs: symbol_rates");
        }
        symbols.push_back(p.at(0).get<std::string>());
        rates.push_back(ParseUint128(p.at(1)));
      }
    } else {
      symbols = ParseStringList(*body, "symbols");
      const auto& rates_json = Field(*body, "rates");
      if (!rates_json.is_array()) throw std::invalid_argument("expected array: rates");
      rates.reserve(rates_json.size());
      for (const auto& r : rates_json) rates.push_back(ParseUint128(r));
    }
    auto resolve_time = ParseU64(*body, "resolve_time");
    auto request_id = ParseU64(*body, "request_id");
    if (force) {
      store.ForceRelay(symbols, rates, resolve_time, request_id);
      return symbols.size();
    }
    return store.Relay(symbols, rates, resolve_time, request_id);
  }

  std::size_t LoadSnapshot(RefDataStore& store, const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("cannot open snapshot: " + path);
    json doc;
    try {
      doc = json::parse(in);
    } catch (const json::parse_error& e) {
      throw std::invalid_argument("snapshot " + path + " is not valid JSON: " + e.what());
    }
    if (!doc.is_array()) throw std::invalid_argument("snapshot " + path + " must be an array of execute messages");
    std::size_t written = 0;
    for (const auto& msg : doc) written += ApplyExecuteMsg(store, msg);
    Logger::Info("loaded snapshot " + path + ": " + std::to_string(doc.size()) + " messages, " +
                 std::to_string(written) + " symbol writes, " + std::to_string(store.Size()) + " symbols stored");
    return written;
  }
}
