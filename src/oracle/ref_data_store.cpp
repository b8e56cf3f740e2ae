#include "oracle/ref_data_store.hpp"
#include "common/logger.hpp"
#include "common/reference_error.hpp"
#include "constants/reference.hpp"
#include "math/fixed_point.hpp"
#include <algorithm>

std::optional<RawPrice> RefDataStore::Get(const std::string& symbol) const {
  auto it = refs_.find(symbol);
  if (it == refs_.end()) return std::nullopt;
  return RawPrice{it->second.rate, it->second.resolve_time};
}

std::optional<RefData> RefDataStore::GetRef(const std::string& symbol) const {
  auto it = refs_.find(symbol);
  if (it == refs_.end()) return std::nullopt;
  return it->second;
}

std::size_t RefDataStore::Relay(const std::vector<std::string>& symbols,
                                const std::vector<FixedPoint::Uint128>& rates,
                                std::uint64_t resolve_time,
                                std::uint64_t request_id) {
  if (symbols.size() != rates.size()) {
    throw ReferenceError::LengthMismatch(ReferenceConstants::ERR_MISMATCHED_INPUT_SIZES);
  }
  std::size_t written = 0;
  for (size_t i = 0; i < symbols.size(); ++i) {
    auto it = refs_.find(symbols[i]);
    if (it != refs_.end() && it->second.resolve_time >= resolve_time) {
      Logger::Debug("relay skipped " + symbols[i] + ": stored resolve_time " +
                    std::to_string(it->second.resolve_time) + " >= " + std::to_string(resolve_time));
      continue;
    }
    refs_[symbols[i]] = RefData{rates[i], resolve_time, request_id};
    Logger::Debug("relayed " + symbols[i] + "=" + FixedPoint::FormatDecimal(rates[i]));
    ++written;
  }
  Logger::Debug("relay request " + std::to_string(request_id) + ": wrote " + std::to_string(written) +
                "/" + std::to_string(symbols.size()) + " symbols");
  return written;
}

void RefDataStore::ForceRelay(const std::vector<std::string>& symbols,
                              const std::vector<FixedPoint::Uint128>& rates,
                              std::uint64_t resolve_time,
                              std::uint64_t request_id) {
  if (symbols.size() != rates.size()) {
    throw ReferenceError::LengthMismatch(ReferenceConstants::ERR_NOT_ALL_INPUT_SIZES_ARE_THE_SAME);
  }
  for (size_t i = 0; i < symbols.size(); ++i) {
    refs_[symbols[i]] = RefData{rates[i], resolve_time, request_id};
    Logger::Debug("force relayed " + symbols[i] + "=" + FixedPoint::FormatDecimal(rates[i]));
  }
  Logger::Debug("force relay request " + std::to_string(request_id) + ": wrote " +
                std::to_string(symbols.size()) + " symbols");
}

std::vector<std::string> RefDataStore::Symbols() const {
  std::vector<std::string> out;
  out.reserve(refs_.size());
  for (const auto& kv : refs_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}
