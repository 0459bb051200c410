#ifndef SCC_COMMON_MODEL_MONEY_ERROR_HPP
#define SCC_COMMON_MODEL_MONEY_ERROR_HPP

#include <cstdint>
#include <system_error>

namespace scc::model {

/// @brief Money 驗證與加總的錯誤碼
/// @details
///  - 驗證類錯誤與幣別不符對應 std::errc::invalid_argument
///  - 溢位類錯誤對應 std::errc::value_too_large
enum class money_errc : uint8_t {
  // Validation
  invalid_currency_code = 1,
  sign_mismatch,
  nanos_out_of_range,

  // Arithmetic
  currency_mismatch,
  positive_overflow,
  negative_overflow,
};

const std::error_category& money_category() noexcept;

std::error_code make_error_code(money_errc ec) noexcept;

}  // namespace scc::model

template <>
struct std::is_error_code_enum<scc::model::money_errc> : std::true_type {};

#endif
