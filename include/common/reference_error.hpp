#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

enum class ReferenceErrorCode { SymbolNotFound, DivisionByZero, Overflow, LengthMismatch };

const char* ReferenceErrorCodeName(ReferenceErrorCode code);

// Single failure type raised by the resolution engine and the store.
// what() carries the wire message (e.g. DATA_NOT_AVAILABLE_FOR_BTC).
class ReferenceError : public std::runtime_error {
public:
  ReferenceError(ReferenceErrorCode code,
                 const std::string& message,
                 std::vector<std::string> symbols = {},
                 std::optional<std::size_t> pair_index = std::nullopt);

  static ReferenceError SymbolNotFound(std::vector<std::string> symbols);
  static ReferenceError DivisionByZero();
  static ReferenceError Overflow();
  static ReferenceError LengthMismatch(const std::string& message = "NOT_ALL_INPUT_SIZES_ARE_THE_SAME");

  // Copy of this error attributed to pair `index` of a bulk request.
  ReferenceError AtPair(std::size_t index) const;

  ReferenceErrorCode code() const { return code_; }
  const std::vector<std::string>& symbols() const { return symbols_; }
  std::optional<std::size_t> pair_index() const { return pair_index_; }

private:
  ReferenceErrorCode code_;
  std::vector<std::string> symbols_;
  std::optional<std::size_t> pair_index_;
};
