#include "bor/io/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <system_error>

#include "bor/error.hpp"

namespace bor::io {

// ----------------------------------------------------------------------------
// Factory Methods
// ----------------------------------------------------------------------------

Result<File> File::open(std::string path, int flags, mode_t perm) {
  int fd = ::open(path.c_str(), flags, perm);

  if (fd < 0) {
    return bor::fail(errno, "open() failed");
  }

  return File(fd, std::move(path));
}

Result<File> File::create_temp(std::string template_path) noexcept {
  int fd = ::mkstemp(template_path.data());

  if (fd < 0) {
    return bor::fail(errno, "mkstemp() failed");
  }

  return File(fd, std::move(template_path));
}

// ----------------------------------------------------------------------------
// RAII
// ----------------------------------------------------------------------------

File::~File() noexcept { close(); }

File& File::operator=(File&& other) noexcept {
  if (&other != this) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    path_ = std::move(other.path_);
  }

  return *this;
}

// ----------------------------------------------------------------------------
// I/O 操作
// ----------------------------------------------------------------------------

Result<size_t> File::read_at(std::span<std::byte> buffer,
                             uint64_t offset) const noexcept {
  if (!is_open()) {
    return bor::fail(std::errc::bad_file_descriptor);
  }

  // off_t 是有號數，超出範圍的 offset 無法交給 pread
  if (offset > static_cast<uint64_t>(std::numeric_limits<off_t>::max())) {
    return bor::fail(std::errc::invalid_argument, "Invalid offset");
  }

  ssize_t n;
  do {
    n = ::pread(fd_, buffer.data(), buffer.size(), static_cast<off_t>(offset));
  } while (n < 0 && errno == EINTR);

  if (n < 0) {
    return bor::fail(errno, "pread() failed");
  }

  return static_cast<size_t>(n);
}

// ----------------------------------------------------------------------------
// Size 操作
// ----------------------------------------------------------------------------

Result<size_t> File::size() const noexcept {
  if (!is_open()) {
    return bor::fail(std::errc::bad_file_descriptor);
  }

  struct stat st{};
  if (::fstat(fd_, &st) < 0) {
    return bor::fail(errno, "fstat() failed");
  }

  return static_cast<size_t>(st.st_size);
}

// ----------------------------------------------------------------------------
// Advise 操作
// ----------------------------------------------------------------------------

Result<> File::advise(Advise advise, off_t offset,
                      size_t length) const noexcept {
  if (!is_open()) {
    return bor::fail(std::errc::bad_file_descriptor);
  }

  // 直接返回錯誤碼，不設定 errno
  int ret = ::posix_fadvise(fd_, offset, static_cast<off_t>(length),
                            static_cast<int>(advise));

  if (ret != 0) {
    return bor::fail(ret, "posix_fadvise() failed");
  }

  return {};
}

// ----------------------------------------------------------------------------
// 手動管理
// ----------------------------------------------------------------------------

void File::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

int File::release() noexcept {
  int fd = fd_;
  fd_ = -1;
  return fd;
}

}  // namespace bor::io
