#ifndef BUFFERED_OFFSET_READER_IO_SOURCE_HPP
#define BUFFERED_OFFSET_READER_IO_SOURCE_HPP

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <type_traits>
#include <utility>

#include "bor/error.hpp"

namespace bor::io {

// ----------------------------------------------------------------------------
// Capabilities
// ----------------------------------------------------------------------------

/// @brief 獨佔式定位讀取 (exclusive positional read)
///
/// 契約：
/// - 從絕對位置 offset 開始，最多寫入 dest.size() bytes
/// - 回傳實際讀取的 bytes 數；資源末尾回傳 0
/// - 短讀取不一定代表到達末尾
/// - 不依賴也不修改任何共享的讀取游標
/// - 只允許一個持有者，可以修改內部記帳
///
template <typename S>
concept PositionalRead =
    requires(S& s, std::span<std::byte> dest, uint64_t offset) {
      { s.read_at(dest, offset) } -> std::same_as<Result<size_t>>;
    };

/// @brief 共享式定位讀取 (shared positional read)
///
/// 與 PositionalRead 相同的契約，但可以透過 const 參考呼叫，
/// 多個執行緒可在沒有外部同步的情況下同時讀取。
///
template <typename S>
concept SharedPositionalRead =
    PositionalRead<S> &&
    requires(const S& s, std::span<std::byte> dest, uint64_t offset) {
      { s.read_at(dest, offset) } -> std::same_as<Result<size_t>>;
    };

// ----------------------------------------------------------------------------
// Handles
// ----------------------------------------------------------------------------

/// @brief 借用的 source（不擁有）
/// @warning 生命週期由呼叫端管理，source 必須比所有 handle 活得久
///
template <SharedPositionalRead S>
class BorrowedSource {
 private:
  const S* source_;

 public:
  explicit BorrowedSource(const S& source) noexcept : source_(&source) {}

  [[nodiscard]] Result<size_t> read_at(std::span<std::byte> dest,
                                       uint64_t offset) const noexcept {
    return source_->read_at(dest, offset);
  }

  [[nodiscard]] const S& get() const noexcept { return *source_; }
};

/// @brief 共享所有權的 source
///
/// 複製只增加參考計數，適合每個執行緒各自建立 BufOffsetReader
///
template <SharedPositionalRead S>
class SharedSource {
 private:
  std::shared_ptr<const S> source_;

 public:
  explicit SharedSource(std::shared_ptr<const S> source) noexcept
      : source_(std::move(source)) {}

  [[nodiscard]] Result<size_t> read_at(std::span<std::byte> dest,
                                       uint64_t offset) const noexcept {
    return source_->read_at(dest, offset);
  }

  [[nodiscard]] const S& get() const noexcept { return *source_; }

  [[nodiscard]] long use_count() const noexcept { return source_.use_count(); }
};

template <SharedPositionalRead S>
[[nodiscard]] BorrowedSource<S> borrow(const S& source) noexcept {
  return BorrowedSource<S>(source);
}

template <typename S>
  requires SharedPositionalRead<std::remove_const_t<S>>
[[nodiscard]] SharedSource<std::remove_const_t<S>> share(
    std::shared_ptr<S> source) noexcept {
  return SharedSource<std::remove_const_t<S>>(std::move(source));
}

}  // namespace bor::io

#endif
