#include "bor/io/mapped_file.hpp"

#include <sys/mman.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

#include "bor/error.hpp"
#include "bor/io/file.hpp"

namespace bor::io {

// ----------------------------------------------------------------------------
// Factory Methods
// ----------------------------------------------------------------------------

Result<MappedFile> MappedFile::from_file(File file, off_t offset,
                                         size_t length) {
  size_t file_size = TRY(file.size());

  if (offset < 0 || static_cast<size_t>(offset) > file_size) {
    return bor::fail(std::errc::invalid_argument, "Offset out of range");
  }

  // length = 0 表示到檔案結尾
  size_t map_length =
      length == 0 ? file_size - static_cast<size_t>(offset) : length;

  if (static_cast<size_t>(offset) + map_length > file_size) {
    return bor::fail(std::errc::invalid_argument, "Length out of range");
  }

  // mmap 不接受長度 0
  if (map_length == 0) {
    return MappedFile(std::move(file), nullptr, 0);
  }

  void* addr =
      ::mmap(nullptr, map_length, PROT_READ, MAP_SHARED, file.fd(), offset);

  if (addr == MAP_FAILED) {
    return bor::fail(errno, "mmap() failed");
  }

  return MappedFile(std::move(file), addr, map_length);
}

// ----------------------------------------------------------------------------
// RAII
// ----------------------------------------------------------------------------

MappedFile::MappedFile(File file, void* addr, size_t length) noexcept
    : file_(std::move(file)), addr_(addr), length_(length) {}

MappedFile::~MappedFile() noexcept { unmap(); }

MappedFile::MappedFile(MappedFile&& other) noexcept
    : file_(std::move(other.file_)),
      addr_(std::exchange(other.addr_, nullptr)),
      length_(std::exchange(other.length_, 0)) {}

MappedFile& MappedFile::operator=(MappedFile&& other) noexcept {
  if (&other != this) {
    unmap();
    file_ = std::move(other.file_);
    addr_ = std::exchange(other.addr_, nullptr);
    length_ = std::exchange(other.length_, 0);
  }

  return *this;
}

// ----------------------------------------------------------------------------
// Positional Read
// ----------------------------------------------------------------------------

Result<size_t> MappedFile::read_at(std::span<std::byte> dest,
                                   uint64_t offset) const noexcept {
  if (offset >= length_) {
    return 0;
  }

  size_t n = std::min(dest.size(), length_ - static_cast<size_t>(offset));
  std::memcpy(dest.data(), static_cast<const std::byte*>(addr_) + offset, n);

  return n;
}

// ----------------------------------------------------------------------------
// Advise 操作
// ----------------------------------------------------------------------------

Result<> MappedFile::advise(Advise advise) noexcept {
  if (addr_ == nullptr) {
    return bor::fail(std::errc::bad_address, "MappedFile not mapped");
  }

  if (::madvise(addr_, length_, static_cast<int>(advise)) < 0) {
    return bor::fail(errno, "madvise() failed");
  }

  return {};
}

// ----------------------------------------------------------------------------
// 手動管理
// ----------------------------------------------------------------------------

void MappedFile::unmap() noexcept {
  if (addr_ != nullptr) {
    ::munmap(addr_, length_);
    addr_ = nullptr;
  }
  length_ = 0;
}

}  // namespace bor::io
