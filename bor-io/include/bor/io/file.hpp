#ifndef BUFFERED_OFFSET_READER_IO_FILE_HPP
#define BUFFERED_OFFSET_READER_IO_FILE_HPP

#include <fcntl.h>
#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>

#include "bor/error.hpp"

namespace bor::io {

// ----------------------------------------------------------------------------
// File
// ----------------------------------------------------------------------------

/// @brief 唯讀的 POSIX 檔案
///
/// - RAII 管理 file descriptor
/// - 只提供定位讀取 (pread)，不提供 seek + read，避免共享游標的競爭
/// - read_at 為 const，同一個 File 可被多個執行緒同時讀取
///
class File {
 private:
  int fd_{-1};        ///< file descriptor
  std::string path_;  ///< 文件路徑

  explicit File(int fd, std::string path) noexcept
      : fd_(fd), path_(std::move(path)) {}

 public:
  // ----------------------------------------------------------------------------
  // Factory Methods
  // ----------------------------------------------------------------------------

  /// @brief 開啟檔案
  /// @param path 檔案路徑
  /// @param flags 開啟模式 (O_RDONLY, O_CLOEXEC, ...)
  /// @param perm 權限 (僅用於 Create 模式下)
  /// @return File 或者錯誤
  ///
  [[nodiscard]] static Result<File> open(std::string path,
                                         int flags = O_RDONLY,
                                         mode_t perm = 0644);

  /// @brief 建立臨時檔案
  /// @param template_path 模板路徑 (例如: "/tmp/myfile.XXXXXX")
  /// @return File 物件或錯誤碼
  [[nodiscard]] static Result<File> create_temp(
      std::string template_path) noexcept;

  // ----------------------------------------------------------------------------
  // RAII
  // ----------------------------------------------------------------------------

  ~File() noexcept;
  File(const File&) = delete;
  File& operator=(const File&) = delete;
  File(File&& other) noexcept
      : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}
  File& operator=(File&& other) noexcept;

  // ----------------------------------------------------------------------------
  // I/O 操作
  // ----------------------------------------------------------------------------

  /// @brief 定位讀取 (Positional read)
  /// @param buffer 目標 buffer
  /// @param offset 絕對偏移量
  /// @return 實際讀取的 bytes 數或錯誤碼
  /// @note 不改變 file position，EOF 回傳 0
  ///
  [[nodiscard]] Result<size_t> read_at(std::span<std::byte> buffer,
                                       uint64_t offset) const noexcept;

  // ----------------------------------------------------------------------------
  // Size 操作
  // ----------------------------------------------------------------------------

  /// @brief 取得檔案大小
  /// @return 檔案大小 (bytes) 或錯誤碼
  [[nodiscard]] Result<size_t> size() const noexcept;

  // ----------------------------------------------------------------------------
  // Advise 操作
  // ----------------------------------------------------------------------------

  /// @brief 提示內核檔案存取模式 (fadvise)
  enum class Advise {
    Normal = POSIX_FADV_NORMAL,          ///< 預設
    Sequential = POSIX_FADV_SEQUENTIAL,  ///< 順序讀取 (預讀更多)
    Random = POSIX_FADV_RANDOM,          ///< 隨機存取 (減少預讀)
    NoReuse = POSIX_FADV_NOREUSE,        ///< 只用一次 (立即丟棄 cache)
    WillNeed = POSIX_FADV_WILLNEED,      ///< 即將需要 (預載入)
    DontNeed = POSIX_FADV_DONTNEED,      ///< 不需要 (立即丟棄)
  };

  /// @brief 提供存取建議
  /// @param advise 存取模式建議
  /// @param offset 起始偏移
  /// @param length 長度 (0 = 整個檔案)
  /// @return 成功或錯誤碼
  [[nodiscard]] Result<> advise(Advise advise, off_t offset = 0,
                                size_t length = 0) const noexcept;

  // ----------------------------------------------------------------------------
  // Access
  // ----------------------------------------------------------------------------

  /// @brief 檢查檔案是否開啟
  [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

  /// @brief 取得原始 file descriptor
  [[nodiscard]] int fd() const noexcept { return fd_; }

  /// @brief 取得檔案路徑
  [[nodiscard]] const std::string& path() const noexcept { return path_; }

  // ----------------------------------------------------------------------------
  // 手動管理
  // ----------------------------------------------------------------------------

  /// @brief 關閉檔案
  void close() noexcept;

  /// @brief 釋放所有權
  /// @return 原始 file descriptor
  int release() noexcept;
};

}  // namespace bor::io

#endif
