#include "bor/io/memory_source.hpp"

#include <algorithm>
#include <cstring>

namespace bor::io {

Result<size_t> MemorySource::read_at(std::span<std::byte> dest,
                                     uint64_t offset) const noexcept {
  if (offset >= data_.size()) {
    return 0;
  }

  auto remaining = data_.subspan(static_cast<size_t>(offset));
  size_t n = std::min(remaining.size(), dest.size());
  if (n > 0) {
    std::memcpy(dest.data(), remaining.data(), n);
  }

  return n;
}

}  // namespace bor::io
