#ifndef SCC_COMMON_MODEL_MONEY_HPP
#define SCC_COMMON_MODEL_MONEY_HPP

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "scc/error.hpp"
#include "scc/model/money_error.hpp"

namespace scc::model {

// ======================
// 常數
// ======================
inline constexpr int32_t kBillion = 1'000'000'000;   ///< 1 unit = 10^9 nanos
inline constexpr int32_t kMaxNanos = kBillion - 1;   ///< nanos 絕對值上限
inline constexpr size_t kCurrencyCodeLength = 3;     ///< ISO 4217 alpha code

/// @brief 金額：幣別 + 定點數 (units + nanos)
/// @details
///  - units 為整數部分，nanos 為 10^-9 單位的小數部分
///  - 建構時不做檢查，需要時呼叫 check_valid()
///  - 空字串代表沒有幣別
struct Money {
  std::string currency_code;  ///< 三碼幣別，例如 "USD"
  int64_t units = 0;          ///< 整數部分，可為負
  int32_t nanos = 0;          ///< 小數部分，範圍 [-999,999,999, 999,999,999]

  [[nodiscard]] bool operator==(const Money& other) const = default;
};

/// @brief 金額的符號
/// @return units 不為 0 時取 units 的符號，否則取 nanos 的符號，皆為 0 回傳 0
[[nodiscard]] constexpr int sign_of(const Money& m) noexcept {
  if (m.units > 0) return 1;
  if (m.units < 0) return -1;
  if (m.nanos > 0) return 1;
  if (m.nanos < 0) return -1;
  return 0;
}

/// @brief 檢查金額是否合法
/// @details 依序檢查：
///  1. 幣別長度必須為 3 (invalid_currency_code)
///  2. units 與 nanos 不可一正一負 (sign_mismatch)
///  3. |nanos| <= 999,999,999 (nanos_out_of_range)
[[nodiscard]] Result<void> check_valid(const Money& value) noexcept;

/// @brief 兩筆同幣別金額相加
/// @param allow_overflow 為 true 時溢位會夾到最大/最小可表示值，否則回傳錯誤
/// @warning 不會重新驗證輸入，呼叫端應先 check_valid()
/// @return 幣別不同回傳 currency_mismatch，溢位回傳
/// positive_overflow / negative_overflow
[[nodiscard]] Result<Money> add(const Money& a, const Money& b,
                                bool allow_overflow);

/// @brief 兩筆同幣別金額相加，不允許溢位
[[nodiscard]] inline Result<Money> add(const Money& a, const Money& b) {
  return add(a, b, false);
}

/// @brief 從零開始依序累加一組金額
/// @details 每一筆都會先 check_valid()，遇到第一個錯誤即返回。空序列回傳零。
[[nodiscard]] Result<Money> sum(std::string_view currency_code,
                                std::span<const Money> values,
                                bool allow_overflow = false);

// ======================
// 序列化
// ======================
/// @brief 轉為可讀字串，僅供診斷使用
/// @details 合法金額輸出 "USD -1.500000000"，不合法時輸出
/// "Money(USD, 5, -5)"
std::string to_string(const Money& value);

}  // namespace scc::model

/// @brief 支持 fmt
template <>
struct fmt::formatter<scc::model::Money> : fmt::formatter<std::string> {
  auto format(const scc::model::Money& value, format_context& ctx) const {
    return fmt::formatter<std::string>::format(scc::model::to_string(value),
                                               ctx);
  }
};

#endif
