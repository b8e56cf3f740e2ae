#include "common/reference_error.hpp"
#include <utility>

const char* ReferenceErrorCodeName(ReferenceErrorCode code) {
  switch (code) {
    case ReferenceErrorCode::SymbolNotFound: return "SymbolNotFound";
    case ReferenceErrorCode::DivisionByZero: return "DivisionByZero";
    case ReferenceErrorCode::Overflow: return "Overflow";
    case ReferenceErrorCode::LengthMismatch: return "LengthMismatch";
  }
  return "Unknown";
}

ReferenceError::ReferenceError(ReferenceErrorCode code,
                               const std::string& message,
                               std::vector<std::string> symbols,
                               std::optional<std::size_t> pair_index)
  : std::runtime_error(message),
    code_(code),
    symbols_(std::move(symbols)),
    pair_index_(pair_index) {}

ReferenceError ReferenceError::SymbolNotFound(std::vector<std::string> symbols) {
  std::string msg = "DATA_NOT_AVAILABLE_FOR_";
  for (size_t i = 0; i < symbols.size(); ++i) {
    if (i) msg += '_';
    msg += symbols[i];
  }
  return ReferenceError(ReferenceErrorCode::SymbolNotFound, msg, std::move(symbols));
}

ReferenceError ReferenceError::DivisionByZero() {
  return ReferenceError(ReferenceErrorCode::DivisionByZero, "DIVISION_BY_ZERO");
}

ReferenceError ReferenceError::Overflow() {
  return ReferenceError(ReferenceErrorCode::Overflow, "RATE_OVERFLOW");
}

ReferenceError ReferenceError::LengthMismatch(const std::string& message) {
  return ReferenceError(ReferenceErrorCode::LengthMismatch, message);
}

ReferenceError ReferenceError::AtPair(std::size_t index) const {
  std::string msg = "PAIR_" + std::to_string(index) + ": " + what();
  return ReferenceError(code_, msg, symbols_, index);
}
