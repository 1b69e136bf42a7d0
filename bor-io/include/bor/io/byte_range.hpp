#ifndef BUFFERED_OFFSET_READER_IO_BYTE_RANGE_HPP
#define BUFFERED_OFFSET_READER_IO_BYTE_RANGE_HPP

#include <fmt/format.h>

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

namespace bor::io {

/// @brief 半開區間 [start, end) 的絕對 byte 範圍
///
/// - 用來描述 BufOffsetReader 目前持有的 window 與每次讀取請求
/// - start >= end 視為空區間
///
struct ByteRange {
  uint64_t start{0};  ///< 第一個 byte 的絕對位置
  uint64_t end{0};    ///< 最後一個 byte 的下一個位置

  /// @brief 由 offset 與長度建立
  /// @note end 超過 uint64_t 上限時會飽和而不是回繞
  ///
  [[nodiscard]] static constexpr ByteRange at(uint64_t offset,
                                              size_t length) noexcept {
    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    uint64_t len = static_cast<uint64_t>(length);
    return {offset, len > kMax - offset ? kMax : offset + len};
  }

  [[nodiscard]] constexpr bool empty() const noexcept { return start >= end; }

  [[nodiscard]] constexpr size_t size() const noexcept {
    return empty() ? 0 : static_cast<size_t>(end - start);
  }

  /// @brief 取交集
  /// @return 重疊部分；不重疊時回傳 [0, 0)
  ///
  [[nodiscard]] constexpr ByteRange intersect(
      const ByteRange& other) const noexcept {
    uint64_t s = std::max(start, other.start);
    uint64_t e = std::min(end, other.end);

    if (e <= s) {
      return {};
    }
    return {s, e};
  }

  /// @brief other 是否完全落在此區間內
  ///
  [[nodiscard]] constexpr bool contains(const ByteRange& other) const noexcept {
    return intersect(other) == other;
  }

  /// @brief 整個區間往前平移 n
  /// @warning n 不可大於 start
  ///
  [[nodiscard]] constexpr ByteRange shift_left(uint64_t n) const noexcept {
    assert(n <= start && "shift_left() past zero");
    return {start - n, end - n};
  }

  [[nodiscard]] constexpr ByteRange shift_right(uint64_t n) const noexcept {
    return {start + n, end + n};
  }

  constexpr bool operator==(const ByteRange&) const noexcept = default;
};

}  // namespace bor::io

/// @brief 支持 fmt，輸出 "[start, end)"
template <>
struct fmt::formatter<bor::io::ByteRange> : fmt::formatter<std::string_view> {
  auto format(const bor::io::ByteRange& r, format_context& ctx) const {
    return fmt::format_to(ctx.out(), "[{}, {})", r.start, r.end);
  }
};

#endif
