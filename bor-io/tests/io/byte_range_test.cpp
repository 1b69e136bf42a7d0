#include "bor/io/byte_range.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

namespace bor::io::test {

TEST(ByteRangeTest, DefaultIsEmpty) {
  ByteRange r;
  EXPECT_TRUE(r.empty());
  EXPECT_EQ(r.size(), 0);
}

TEST(ByteRangeTest, At_BuildsHalfOpenRange) {
  auto r = ByteRange::at(10, 6);
  EXPECT_EQ(r, (ByteRange{10, 16}));
  EXPECT_EQ(r.size(), 6);
  EXPECT_FALSE(r.empty());
}

TEST(ByteRangeTest, At_SaturatesInsteadOfWrapping) {
  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
  auto r = ByteRange::at(kMax - 2, 10);
  EXPECT_EQ(r.start, kMax - 2);
  EXPECT_EQ(r.end, kMax);
  EXPECT_EQ(r.size(), 2);
}

// ----------------------------------------------------------------------------
// Intersect
// ----------------------------------------------------------------------------

TEST(ByteRangeTest, Intersect_Disjoint) {
  ByteRange a{4, 14};
  ByteRange b{16, 21};
  EXPECT_TRUE(a.intersect(b).empty());
  EXPECT_TRUE(b.intersect(a).empty());
  EXPECT_EQ(a.intersect(b), ByteRange{});
}

TEST(ByteRangeTest, Intersect_Adjacent_IsEmpty) {
  ByteRange a{0, 16};
  ByteRange b{16, 20};
  EXPECT_TRUE(a.intersect(b).empty());
}

TEST(ByteRangeTest, Intersect_Subset) {
  ByteRange a{2, 22};
  ByteRange b{4, 14};
  EXPECT_EQ(a.intersect(b), b);
  EXPECT_EQ(b.intersect(a), b);
  EXPECT_EQ(a.intersect(a), a);
  EXPECT_EQ(b.intersect(b), b);
}

TEST(ByteRangeTest, Intersect_Partial) {
  ByteRange a{2, 20};
  ByteRange b{10, 30};
  ByteRange i{10, 20};
  EXPECT_EQ(a.intersect(b), i);
  EXPECT_EQ(b.intersect(a), i);
}

// ----------------------------------------------------------------------------
// Contains
// ----------------------------------------------------------------------------

TEST(ByteRangeTest, Contains) {
  ByteRange window{20, 36};
  EXPECT_TRUE(window.contains({20, 36}));
  EXPECT_TRUE(window.contains({24, 28}));
  EXPECT_FALSE(window.contains({16, 24}));
  EXPECT_FALSE(window.contains({32, 40}));
  EXPECT_FALSE(window.contains({0, 4}));
}

TEST(ByteRangeTest, EmptyWindow_ContainsNothing) {
  ByteRange window;
  EXPECT_FALSE(window.contains({0, 1}));
  EXPECT_FALSE((ByteRange{40, 40}).contains({40, 41}));
}

// ----------------------------------------------------------------------------
// Shift & Format
// ----------------------------------------------------------------------------

TEST(ByteRangeTest, Shift) {
  EXPECT_EQ((ByteRange{10, 20}).shift_left(5), (ByteRange{5, 15}));
  EXPECT_EQ((ByteRange{0, 5}).shift_right(10), (ByteRange{10, 15}));
}

TEST(ByteRangeTest, Format) {
  EXPECT_EQ(fmt::format("{}", ByteRange{20, 36}), "[20, 36)");
  EXPECT_EQ(fmt::format("{}", ByteRange{}), "[0, 0)");
}

}  // namespace bor::io::test
