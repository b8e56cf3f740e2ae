#pragma once
#include <string>

namespace ReferenceConstants {
  // Fiat unit of account; priced at exactly 1.0 and never read from the store
  inline const std::string UNIT_OF_ACCOUNT = "USD";
  // Unit-of-account records carry no oracle request
  inline constexpr unsigned long long UNIT_OF_ACCOUNT_REQUEST_ID = 0ULL;
  inline const std::string ERR_MISMATCHED_INPUT_SIZES = "MISMATCHED_INPUT_SIZES";
  inline const std::string ERR_NOT_ALL_INPUT_SIZES_ARE_THE_SAME = "NOT_ALL_INPUT_SIZES_ARE_THE_SAME";
  inline const std::string ERR_UNKNOWN_QUERY = "UNKNOWN_QUERY";
  inline const std::string ERR_UNKNOWN_EXECUTE_MSG = "UNKNOWN_EXECUTE_MSG";
}
