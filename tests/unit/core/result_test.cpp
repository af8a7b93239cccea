#include <gtest/gtest.h>
#include <kgrag/core/types.h>

#include <spdlog/fmt/fmt.h>

#include <string>
#include <vector>

using namespace kgrag;

namespace {

Result<int> parsePositive(const std::string& s) {
    if (s.empty())
        return Error{ErrorCode::InvalidArgument, "empty"};
    int v = std::stoi(s);
    if (v <= 0)
        return ErrorCode::ValidationError;
    return v;
}

Result<void> requirePositive(const std::string& s) {
    auto r = parsePositive(s);
    if (!r)
        return r.error();
    return {};
}

} // namespace

TEST(ResultTest, HoldsValue) {
    auto r = parsePositive("42");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), 42);
    EXPECT_EQ(r.value_or(7), 42);
}

TEST(ResultTest, HoldsErrorWithMessage) {
    auto r = parsePositive("");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(r.error().message, "empty");
    EXPECT_EQ(r.value_or(7), 7);
}

TEST(ResultTest, CodeOnlyErrorUsesDefaultMessage) {
    auto r = parsePositive("-3");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error(), ErrorCode::ValidationError);
    EXPECT_EQ(r.error().message, "Validation error");
}

TEST(ResultTest, AccessingTheWrongAlternativeThrows) {
    auto bad = parsePositive("");
    EXPECT_THROW((void)bad.value(), std::runtime_error);
    auto good = parsePositive("1");
    EXPECT_THROW((void)good.error(), std::runtime_error);
}

TEST(ResultTest, VoidResultPropagatesErrors) {
    EXPECT_TRUE(requirePositive("5"));
    auto r = requirePositive("0");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);
}

TEST(ResultTest, MoveOutOfValue) {
    Result<std::vector<int>> r(std::vector<int>{1, 2, 3});
    auto v = std::move(r).value();
    EXPECT_EQ(v.size(), 3u);
}

TEST(ResultTest, ErrorCodeFormatsForLogging) {
    EXPECT_EQ(fmt::format("{}", ErrorCode::Timeout), "Operation timed out");
    EXPECT_EQ(fmt::format("{}", ErrorCode::NotFound), "Not found");
}
