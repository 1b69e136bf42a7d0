#include "bor/error.hpp"

#include <fmt/format.h>

#include <string_view>

namespace bor {

std::error_code make_error_code(int ev) noexcept {
  return {ev, std::generic_category()};
}

void ErrorRegistry::capture_origin(std::error_code ec, const char* msg,
                                   std::source_location loc) noexcept {
  last_info = {.ec = ec, .location = loc, .message = msg, .is_active = true};
}

std::string ErrorRegistry::describe() {
  if (!last_info.is_active) {
    return {};
  }

  const std::error_code& ec = last_info.ec;
  std::string header = fmt::format("[{}:{}]: {}", ec.category().name(),
                                   ec.value(), ec.message());

  std::string_view context =
      last_info.message == nullptr ? "" : last_info.message;
  if (context.empty()) {
    return header;
  }

  // 只保留檔名，完整路徑對閱讀沒有幫助
  std::string_view file = last_info.location.file_name();
  if (auto slash = file.find_last_of('/'); slash != std::string_view::npos) {
    file.remove_prefix(slash + 1);
  }

  return fmt::format("{}\n └─▶ {} ({}:{})", header, context, file,
                     last_info.location.line());
}

}  // namespace bor
