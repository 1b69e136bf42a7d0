#include "bor/io/source.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "bor/io/file.hpp"
#include "bor/io/mapped_file.hpp"
#include "bor/io/memory_source.hpp"
#include "test_util.hpp"

namespace bor::io::test {

// ----------------------------------------------------------------------------
// Capabilities
// ----------------------------------------------------------------------------

static_assert(SharedPositionalRead<File>);
static_assert(SharedPositionalRead<MappedFile>);
static_assert(SharedPositionalRead<MemorySource>);
static_assert(SharedPositionalRead<BorrowedSource<File>>);
static_assert(SharedPositionalRead<SharedSource<MemorySource>>);

// 只有非 const 的 read_at
static_assert(PositionalRead<CountingSource>);
static_assert(!SharedPositionalRead<CountingSource>);

static_assert(!PositionalRead<int>);
static_assert(!PositionalRead<std::vector<std::byte>>);

// ----------------------------------------------------------------------------
// Handles
// ----------------------------------------------------------------------------

TEST(SourceTest, Borrow_ForwardsToSource) {
  auto data = sequential_bytes(32);
  MemorySource memory(data);
  auto borrowed = borrow(memory);
  auto copy = borrowed;

  std::vector<std::byte> tmp(4);
  ASSERT_EQ(copy.read_at(tmp, 8).value(), 4);
  EXPECT_EQ(tmp, bytes({8, 9, 10, 11}));
  EXPECT_EQ(&borrowed.get(), &memory);
  EXPECT_EQ(&copy.get(), &memory);
}

TEST(SourceTest, Share_CopiesShareOwnership) {
  auto data = sequential_bytes(32);
  auto memory = std::make_shared<MemorySource>(data);

  auto a = share(memory);
  {
    auto b = a;
    EXPECT_EQ(a.use_count(), 3);

    std::vector<std::byte> tmp(2);
    ASSERT_EQ(b.read_at(tmp, 30).value(), 2);
    EXPECT_EQ(tmp, bytes({30, 31}));
  }
  EXPECT_EQ(a.use_count(), 2);
}

TEST(SourceTest, Share_AcceptsPointerToConst) {
  auto data = sequential_bytes(8);
  std::shared_ptr<const MemorySource> memory =
      std::make_shared<const MemorySource>(data);

  SharedSource<MemorySource> shared = share(memory);
  std::vector<std::byte> tmp(8);
  EXPECT_EQ(shared.read_at(tmp, 0).value(), 8);
}

}  // namespace bor::io::test
