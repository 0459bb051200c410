#include "scc/error.hpp"

#include <fmt/format.h>

#include <string_view>

namespace scc {

void ErrorRegistry::capture_origin(std::error_code ec, const char* msg,
                                   std::source_location loc) noexcept {
  last_info = {.ec = ec, .location = loc, .message = msg, .is_active = true};
}

std::string describe(const ErrorContext& ctx) {
  if (!ctx.is_active) {
    return "no error";
  }

  // 只保留檔名，完整路徑對使用者沒有意義
  std::string_view file = ctx.location.file_name();
  if (auto pos = file.find_last_of('/'); pos != std::string_view::npos) {
    file.remove_prefix(pos + 1);
  }

  std::string header =
      fmt::format("[{}:{}]: {}", ctx.ec.category().name(), ctx.ec.value(),
                  ctx.ec.message());

  if (ctx.message == nullptr || *ctx.message == '\0') {
    return fmt::format("{} ({}:{})", header, file, ctx.location.line());
  }
  return fmt::format("{}\n └─▶ context: {} ({}:{})", header, ctx.message, file,
                     ctx.location.line());
}

}  // namespace scc
