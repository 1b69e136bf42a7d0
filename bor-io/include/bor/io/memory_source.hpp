#ifndef BUFFERED_OFFSET_READER_IO_MEMORY_SOURCE_HPP
#define BUFFERED_OFFSET_READER_IO_MEMORY_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <span>

#include "bor/error.hpp"

namespace bor::io {

/// @brief 以記憶體區塊作為 positional source
///
/// - 不擁有資料，呼叫端保證 span 有效
/// - read_at 為 const，可多執行緒共用
///
class MemorySource {
 private:
  std::span<const std::byte> data_;

 public:
  explicit MemorySource(std::span<const std::byte> data) noexcept
      : data_(data) {}

  /// @brief 定位讀取
  /// @param dest 目標 buffer
  /// @param offset 起始位置
  /// @return 實際讀取的 bytes 數；offset 超出末尾時回傳 0 且不寫入 dest
  ///
  [[nodiscard]] Result<size_t> read_at(std::span<std::byte> dest,
                                       uint64_t offset) const noexcept;

  [[nodiscard]] size_t size() const noexcept { return data_.size(); }

  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return data_;
  }
};

}  // namespace bor::io

#endif
