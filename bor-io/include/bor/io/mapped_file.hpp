#ifndef BUFFERED_OFFSET_READER_IO_MAPPED_FILE_HPP
#define BUFFERED_OFFSET_READER_IO_MAPPED_FILE_HPP

#include <sys/mman.h>
#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <span>

#include "bor/error.hpp"
#include "bor/io/file.hpp"

namespace bor::io {

/// @brief 唯讀的 memory-mapped file
///
/// 生命週期：
/// - 擁有 File 物件，確保 fd 不會提前關閉
/// - RAII 自動 munmap
///
/// @note
/// - read_at 只做 memcpy，不需要 syscall
/// - 映射建立後檔案被截斷，存取被截掉的頁面會收到 SIGBUS
///
class MappedFile {
 private:
  File file_;
  void* addr_{nullptr};
  size_t length_{0};

  MappedFile(File file, void* addr, size_t length) noexcept;

 public:
  // ----------------------------------------------------------------------------
  // Factory Methods
  // ----------------------------------------------------------------------------

  /// @brief 從現有 File 建立唯讀映射
  /// @param file File 物件（會被 move）
  /// @param offset 檔案偏移（必須是 page size 倍數，預設 0）
  /// @param length 映射長度（0 = 從 offset 到檔案結尾）
  /// @return MappedFile 或錯誤
  /// @note 空檔案會得到 size() == 0 的物件，不呼叫 mmap
  ///
  [[nodiscard]] static Result<MappedFile> from_file(File file, off_t offset = 0,
                                                    size_t length = 0);

  // ----------------------------------------------------------------------------
  // RAII
  // ----------------------------------------------------------------------------
  ~MappedFile() noexcept;
  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;
  MappedFile(MappedFile&& other) noexcept;
  MappedFile& operator=(MappedFile&& other) noexcept;

  // ----------------------------------------------------------------------------
  // Positional Read
  // ----------------------------------------------------------------------------

  /// @brief 定位讀取（相對於映射起點）
  /// @return 實際複製的 bytes 數；offset 超出映射範圍時回傳 0
  ///
  [[nodiscard]] Result<size_t> read_at(std::span<std::byte> dest,
                                       uint64_t offset) const noexcept;

  // ----------------------------------------------------------------------------
  // Access
  // ----------------------------------------------------------------------------

  /// @brief 取得映射的記憶體區域
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return {static_cast<const std::byte*>(addr_), length_};
  }

  [[nodiscard]] size_t size() const noexcept { return length_; }

  [[nodiscard]] bool empty() const noexcept { return length_ == 0; }

  // ----------------------------------------------------------------------------
  // Advise 操作
  // ----------------------------------------------------------------------------

  /// @brief 提供記憶體存取建議 (madvise)
  enum class Advise {
    Normal = MADV_NORMAL,          ///< 預設
    Random = MADV_RANDOM,          ///< 隨機存取 (減少預讀)
    Sequential = MADV_SEQUENTIAL,  ///< 順序讀取 (預讀更多)
    WillNeed = MADV_WILLNEED,      ///< 即將需要 (預載入)
    DontNeed = MADV_DONTNEED,      ///< 不需要 (立即丟棄)
  };

  [[nodiscard]] Result<> advise(Advise advise) noexcept;

  // ----------------------------------------------------------------------------
  // Accessor
  // ----------------------------------------------------------------------------

  /// @brief 取得底層 File（唯讀）
  [[nodiscard]] const File& underlying_file() const noexcept { return file_; }

  /// @brief 手動解除映射
  void unmap() noexcept;
};

}  // namespace bor::io

#endif
