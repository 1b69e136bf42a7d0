#include "bor/error.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <string>
#include <thread>

namespace bor::test {

namespace {

Result<int> fail_with_errno() { return bor::fail(EIO, "device gone"); }

Result<int> fail_without_context() {
  return bor::fail(std::errc::invalid_argument);
}

Result<int> add_one(Result<int> in) {
  int v = TRY(in);
  return v + 1;
}

Result<> check_twice(Result<> first, Result<> second) {
  CHECK(first);
  CHECK(second);
  return {};
}

}  // namespace

TEST(ErrorTest, MakeErrorCode_UsesGenericCategory) {
  auto ec = bor::make_error_code(ENOENT);
  EXPECT_EQ(ec.value(), ENOENT);
  EXPECT_EQ(ec.category(), std::generic_category());
  EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
}

TEST(ErrorTest, Fail_CapturesOrigin) {
  ErrorRegistry::clear();
  auto result = fail_with_errno();

  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), std::errc::io_error);

  const auto& last = ErrorRegistry::get_last_error();
  EXPECT_TRUE(last.is_active);
  EXPECT_EQ(last.ec, result.error());
  EXPECT_STREQ(last.message, "device gone");
  EXPECT_TRUE(
      std::string(last.location.file_name()).ends_with("error_test.cpp"));
  EXPECT_GT(last.location.line(), 0);
}

TEST(ErrorTest, Describe_WithContext) {
  ErrorRegistry::clear();
  auto _ = fail_with_errno();

  std::string text = ErrorRegistry::describe();
  EXPECT_TRUE(text.starts_with("[generic:5]: ")) << text;
  EXPECT_NE(text.find("└─▶ device gone (error_test.cpp:"), std::string::npos)
      << text;
}

TEST(ErrorTest, Describe_WithoutContext_HeaderOnly) {
  ErrorRegistry::clear();
  auto _ = fail_without_context();

  std::string text = ErrorRegistry::describe();
  EXPECT_TRUE(text.starts_with("[generic:22]: ")) << text;
  EXPECT_EQ(text.find('\n'), std::string::npos) << text;
}

TEST(ErrorTest, Describe_AfterClear_IsEmpty) {
  auto _ = fail_with_errno();
  ErrorRegistry::clear();

  EXPECT_FALSE(ErrorRegistry::get_last_error().is_active);
  EXPECT_TRUE(ErrorRegistry::describe().empty());
}

TEST(ErrorTest, Registry_IsThreadLocal) {
  ErrorRegistry::clear();

  std::thread worker([]() { auto _ = fail_with_errno(); });
  worker.join();

  EXPECT_FALSE(ErrorRegistry::get_last_error().is_active);
}

TEST(ErrorTest, Try_PropagatesErrorAndUnwrapsValue) {
  EXPECT_EQ(add_one(41).value(), 42);

  auto failed = add_one(fail_without_context());
  ASSERT_FALSE(failed);
  EXPECT_EQ(failed.error(), std::errc::invalid_argument);
}

TEST(ErrorTest, Check_StopsAtFirstError) {
  EXPECT_TRUE(check_twice({}, {}));

  auto failed = check_twice(bor::fail(std::errc::io_error),
                            bor::fail(std::errc::invalid_argument));
  ASSERT_FALSE(failed);
  EXPECT_EQ(failed.error(), std::errc::io_error);
}

}  // namespace bor::test
