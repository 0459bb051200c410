#include "scc/model/money.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <limits>
#include <optional>

namespace scc::model {

namespace {

/// @brief nanos 相加的結果與進位
struct NanoSum {
  int32_t sum;
  int32_t carry;
};

/// @brief nanos 相加並處理進位
/// @note 比較的是 kBillion 而非 kMaxNanos，剛好等於 ±10^9 時不進位
constexpr NanoSum sum_nanos(int32_t a, int32_t b) noexcept {
  int64_t sum = static_cast<int64_t>(a) + b;
  if (sum > kBillion) {
    return {.sum = static_cast<int32_t>(sum - kBillion), .carry = 1};
  }
  if (sum < -kBillion) {
    return {.sum = static_cast<int32_t>(sum + kBillion), .carry = -1};
  }
  return {.sum = static_cast<int32_t>(sum), .carry = 0};
}

/// @brief 64 位元二補數環繞加法
/// @details 溢位時環繞而非 UB，溢位偵測依賴環繞後的符號
constexpr int64_t wrapping_add(int64_t a, int64_t b) noexcept {
  return static_cast<int64_t>(static_cast<uint64_t>(a) +
                              static_cast<uint64_t>(b));
}

/// @brief 找出第一個違反的規則，不記錄診斷資訊
std::optional<money_errc> first_violation(const Money& value) noexcept {
  if (value.currency_code.size() != kCurrencyCodeLength) {
    return money_errc::invalid_currency_code;
  }
  if ((value.units > 0 && value.nanos < 0) ||
      (value.units < 0 && value.nanos > 0)) {
    return money_errc::sign_mismatch;
  }
  if (value.nanos > kMaxNanos || value.nanos < -kMaxNanos) {
    return money_errc::nanos_out_of_range;
  }
  return std::nullopt;
}

}  // namespace

Result<void> check_valid(const Money& value) noexcept {
  if (auto violation = first_violation(value)) [[unlikely]] {
    return fail(*violation, "Money::check_valid");
  }
  return {};
}

Result<Money> add(const Money& a, const Money& b, bool allow_overflow) {
  if (a.currency_code != b.currency_code) [[unlikely]] {
    return fail(money_errc::currency_mismatch, "Money::add");
  }

  const NanoSum nano_sum = sum_nanos(a.nanos, b.nanos);
  const int64_t unit_sum_no_carry = wrapping_add(a.units, b.units);
  const int64_t unit_sum = wrapping_add(unit_sum_no_carry, nano_sum.carry);

  // 溢位偵測使用借位前的 unit_sum，借位時 INT64_MIN - 1 會環繞回正數
  const int sign_a = sign_of(a);
  const int sign_b = sign_of(b);

  if (sign_a > 0 && sign_b > 0 && unit_sum < 0) {
    if (!allow_overflow) {
      return fail(money_errc::positive_overflow, "Money::add");
    }
    return Money{.currency_code = a.currency_code,
                 .units = std::numeric_limits<int64_t>::max(),
                 .nanos = kMaxNanos};
  }

  if (sign_a < 0 && sign_b < 0 && (unit_sum_no_carry >= 0 || unit_sum >= 0)) {
    if (!allow_overflow) {
      return fail(money_errc::negative_overflow, "Money::add");
    }
    return Money{.currency_code = a.currency_code,
                 .units = std::numeric_limits<int64_t>::min(),
                 .nanos = -kMaxNanos};
  }

  // 借位：讓 units 與 nanos 同號
  int64_t units = unit_sum;
  int32_t nanos = nano_sum.sum;
  if (units > 0 && nanos < 0) {
    units -= 1;
    nanos += kBillion;
  } else if (units < 0 && nanos > 0) {
    units = wrapping_add(units, -1);
    nanos -= kBillion;
  }

  return Money{
      .currency_code = a.currency_code, .units = units, .nanos = nanos};
}

Result<Money> sum(std::string_view currency_code,
                  std::span<const Money> values, bool allow_overflow) {
  Money total{.currency_code = std::string(currency_code)};
  SCC_CHECK(check_valid(total));

  for (const auto& value : values) {
    SCC_CHECK(check_valid(value));
    total = SCC_TRY(add(total, value, allow_overflow));
  }

  return total;
}

std::string to_string(const Money& value) {
  if (first_violation(value)) {
    return fmt::format("Money({}, {}, {})", value.currency_code, value.units,
                       value.nanos);
  }

  // INT64_MIN 取絕對值會溢位，改用無號數
  const uint64_t abs_units =
      value.units < 0 ? 0 - static_cast<uint64_t>(value.units)
                      : static_cast<uint64_t>(value.units);
  const int32_t abs_nanos = value.nanos < 0 ? -value.nanos : value.nanos;

  return fmt::format("{} {}{}.{:09}", value.currency_code,
                     sign_of(value) < 0 ? "-" : "", abs_units, abs_nanos);
}

}  // namespace scc::model
