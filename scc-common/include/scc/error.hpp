#ifndef SCC_COMMON_ERROR_HPP
#define SCC_COMMON_ERROR_HPP

#include <expected>
#include <source_location>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace scc {

/// @brief 錯誤發生上下文資訊
///
struct ErrorContext {
  std::error_code ec;             ///< 發生時原始錯誤碼
  std::source_location location;  ///< 發生時錯誤位置
  const char* message;            ///< 上下文說明 (靜態字串)
  bool is_active = false;         ///< 標記是否有資料
};

/// @brief 執行緒局部的錯誤診斷暫存器
/// @note 每個執行緒獨立管理其最後一次錯誤，因此不需要同步
///
class ErrorRegistry {
 private:
  static inline thread_local ErrorContext last_info{};

 public:
  /// @brief 捕捉錯誤源頭
  ///
  static void capture_origin(std::error_code ec, const char* msg,
                             std::source_location loc) noexcept;

  /// @brief 獲取當前執行緒最後一次發生的錯誤詳情
  ///
  static const ErrorContext& get_last_error() noexcept { return last_info; }

  /// @brief 重置錯誤上下文狀態
  ///
  static void clear() noexcept { last_info.is_active = false; }
};

/// @brief 將錯誤上下文格式化為可讀字串
/// @details 格式範例："[scc.model.money:5]: Addition failed due to positive
/// overflow (money.cpp:120)"
///
[[nodiscard]] std::string describe(const ErrorContext& ctx);

/// @brief 可能失敗調用的標準回傳類型別名
/// @tparam T 成功的數值類型，預設為 void
///
template <typename T = void>
using Result = std::expected<T, std::error_code>;

/// @brief 產生錯誤結果並觸發診斷資訊捕捉
/// @param ec 錯誤代碼
/// @param msg 靜態描述字串，解釋錯誤背景
/// @param loc 自動捕捉呼叫處的原始碼位置
/// @warning 此函式應僅在錯誤源頭呼叫。
///
[[nodiscard]] inline auto fail(
    std::error_code ec, const char* msg = "",
    std::source_location loc = std::source_location::current()) noexcept {
  ErrorRegistry::capture_origin(ec, msg, loc);
  return std::unexpected(ec);
}

/// @brief 產生錯誤結果並觸發診斷資訊捕捉
/// @tparam Errc 模組錯誤碼枚舉 (需特化 std::is_error_code_enum)
///
template <typename Errc>
  requires std::is_error_code_enum_v<Errc>
[[nodiscard]] inline auto fail(
    Errc ev, const char* msg = "",
    std::source_location loc = std::source_location::current()) noexcept {
  std::error_code ec = make_error_code(ev);
  ErrorRegistry::capture_origin(ec, msg, loc);
  return std::unexpected(ec);
}

}  // namespace scc

/// @brief 解包 std::expected<T, E>，失敗時提前返回
/// @details 使用 GNU Statement Expression 提供類似 Rust ? operator 的語法
/// @warning 只能在返回 std::expected<T, E> 的函數中使用
///
/// @example
///   auto total = SCC_TRY(model::add(total, cost));
///
#define SCC_TRY(expr)                                                   \
  __extension__({                                                       \
    auto&& _res = (expr);                                               \
                                                                        \
    static_assert(                                                      \
        requires {                                                      \
          _res.error();                                                 \
          _res.has_value();                                             \
        }, "SCC_TRY() can only be used with std::expected-like types"); \
                                                                        \
    if (!_res) [[unlikely]] {                                           \
      return std::unexpected(std::move(_res.error()));                  \
    }                                                                   \
                                                                        \
    std::move(*_res);                                                   \
  })

/// @brief 檢查 std::expected<void, E>，失敗時提前返回
/// @warning 只能在返回 std::expected<T, E> 的函數中使用
///
/// @example
///   SCC_CHECK(model::check_valid(cost));
///
#define SCC_CHECK(expr)                                                   \
  do {                                                                    \
    auto&& _res = (expr);                                                 \
                                                                          \
    static_assert(                                                        \
        requires {                                                        \
          _res.error();                                                   \
          _res.has_value();                                               \
        }, "SCC_CHECK() can only be used with std::expected-like types"); \
                                                                          \
    if (!_res) [[unlikely]] {                                             \
      return std::unexpected(_res.error());                               \
    }                                                                     \
  } while (0)

#endif
