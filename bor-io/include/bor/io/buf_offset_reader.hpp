#ifndef BUFFERED_OFFSET_READER_IO_BUF_OFFSET_READER_HPP
#define BUFFERED_OFFSET_READER_IO_BUF_OFFSET_READER_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>
#include <vector>

#include "bor/error.hpp"
#include "bor/io/byte_range.hpp"
#include "bor/io/source.hpp"

namespace bor::io {

/// @brief 帶緩衝的定位讀取器
///
/// 特性：
/// - 只保留一個 window：最近一次從 source 讀入的連續範圍
/// - 請求完全落在 window 內時直接 memcpy，不呼叫 source
/// - 否則從請求的 offset 開始重新填滿 window（最多 capacity bytes）
/// - 請求大於 capacity 時直接轉交 source，window 不變
/// - 每次 read_at 最多呼叫 source 一次，不重試
///
/// @note
/// - 對「往後」的讀取效果很好；倒著掃描檔案時幾乎每次都 miss
/// - 自身狀態沒有鎖，不可多執行緒共用同一個實例。
///   需要並行時，每個執行緒各自建立 reader，透過 BorrowedSource /
///   SharedSource 共用底層 source
///
template <PositionalRead Source>
class BufOffsetReader {
 public:
  // ----------------------------------------------------------------------------
  // Constants & Types
  // ----------------------------------------------------------------------------

  /// @brief 預設緩衝區大小 8 KB
  inline static constexpr size_t kDefaultCapacity = 8 * 1024;

  /// @brief 建構設定
  struct Options {
    size_t capacity = kDefaultCapacity;  ///< window 最大 bytes 數，必須 > 0
  };

  /// @brief 讀取統計
  struct Stats {
    uint64_t hits{0};      ///< 直接由 window 滿足
    uint64_t misses{0};    ///< 需要重新填充 window（包含失敗的填充）
    uint64_t bypasses{0};  ///< 請求過大，直接轉交 source
  };

 private:
  Source source_;                  ///< 底層 source（或其 handle）
  std::vector<std::byte> buffer_;  ///< window 資料，前 window_.size() 有效
  std::vector<std::byte> spare_;   ///< 填充用，成功後與 buffer_ 交換
  ByteRange window_{};             ///< buffer_ 對應的絕對範圍
  Stats stats_{};

  static constexpr bool kNothrowSource =
      noexcept(std::declval<Source&>().read_at(
          std::declval<std::span<std::byte>>(), uint64_t{0}));

  BufOffsetReader(Source source, size_t capacity)
      : source_(std::move(source)), buffer_(capacity), spare_(capacity) {}

 public:
  // ----------------------------------------------------------------------------
  // Factory Methods
  // ----------------------------------------------------------------------------

  /// @brief 使用預設容量建立
  ///
  explicit BufOffsetReader(Source source)
      : BufOffsetReader(std::move(source), kDefaultCapacity) {}

  /// @brief 指定容量建立
  /// @param source 底層 source（會被 move）
  /// @param capacity window 大小
  /// @return reader 或 invalid_argument（capacity 為 0）
  ///
  [[nodiscard]] static Result<BufOffsetReader> with_capacity(Source source,
                                                             size_t capacity) {
    if (capacity == 0) {
      return bor::fail(std::errc::invalid_argument,
                       "Buffer capacity must be > 0");
    }
    return BufOffsetReader(std::move(source), capacity);
  }

  [[nodiscard]] static Result<BufOffsetReader> with_options(Source source,
                                                            Options options) {
    return with_capacity(std::move(source), options.capacity);
  }

  // ----------------------------------------------------------------------------
  // RAII
  // ----------------------------------------------------------------------------
  ~BufOffsetReader() = default;
  BufOffsetReader(const BufOffsetReader&) = delete;
  BufOffsetReader& operator=(const BufOffsetReader&) = delete;
  BufOffsetReader(BufOffsetReader&&) noexcept = default;
  BufOffsetReader& operator=(BufOffsetReader&&) noexcept = default;

  // ----------------------------------------------------------------------------
  // Buffered Operations
  // ----------------------------------------------------------------------------

  /// @brief 從絕對位置 offset 讀取到 dest
  /// @param dest 目標 buffer，長度即請求長度
  /// @param offset 絕對位置
  /// @return 實際讀取的 bytes 數或 source 的錯誤
  /// @note 回傳值小於 dest.size() 代表可用資料不足（通常是 EOF），不是錯誤
  /// @note 填充失敗時 window 保持原狀
  ///
  [[nodiscard]] Result<size_t> read_at(
      std::span<std::byte> dest, uint64_t offset) noexcept(kNothrowSource) {
    if (dest.empty()) {
      return 0;
    }

    // 比 buffer 還大就直接讀取 source
    if (dest.size() > capacity()) {
      ++stats_.bypasses;
      return source_.read_at(dest, offset);
    }

    ByteRange request = ByteRange::at(offset, dest.size());

    if (!window_.empty() && window_.contains(request)) {
      ++stats_.hits;
      copy_out(request, dest);
      return request.size();
    }

    ++stats_.misses;
    CHECK(fill_at(offset));

    ByteRange available = window_.intersect(request);
    copy_out(available, dest);
    return available.size();
  }

  /// @brief 丟棄目前的 window，下一次讀取一定會重新填充
  /// @note 已知底層資料被修改時使用
  ///
  void clear() noexcept { window_ = {}; }

  // ----------------------------------------------------------------------------
  // Status
  // ----------------------------------------------------------------------------

  /// @brief 取得 buffer 容量
  ///
  [[nodiscard]] size_t capacity() const noexcept { return buffer_.size(); }

  /// @brief 檢查 range 是否完全在目前的 window 中
  ///
  [[nodiscard]] bool contains(const ByteRange& range) const noexcept {
    return window_.contains(range);
  }

  /// @brief 目前 window 對應的絕對範圍（未填充時為空）
  ///
  [[nodiscard]] ByteRange window() const noexcept { return window_; }

  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }

  void reset_stats() noexcept { stats_ = {}; }

  // ----------------------------------------------------------------------------
  // Accessor
  // ----------------------------------------------------------------------------

  [[nodiscard]] const Source& source() const noexcept { return source_; }

  [[nodiscard]] Source& source() noexcept { return source_; }

  /// @brief 釋放 source 所有權
  /// @warning window 中的資料會丟失
  ///
  [[nodiscard]] Source into_inner() && noexcept {
    window_ = {};
    return std::move(source_);
  }

 private:
  /// @brief 從 offset 開始填充 window
  /// @details 先讀進 spare_，成功才交換，失敗時舊 window 仍然有效
  ///
  Result<> fill_at(uint64_t offset) noexcept(kNothrowSource) {
    size_t n = TRY(source_.read_at(std::span(spare_), offset));

    std::swap(buffer_, spare_);
    window_ = ByteRange::at(offset, n);
    return {};
  }

  /// @brief 將 window 內的 range 複製到 dest 開頭
  /// @warning range 必須在 window 內
  ///
  void copy_out(const ByteRange& range, std::span<std::byte> dest) noexcept {
    if (range.empty()) {
      return;
    }
    ByteRange src = range.shift_left(window_.start);
    std::memcpy(dest.data(), buffer_.data() + src.start, range.size());
  }
};

}  // namespace bor::io

#endif
