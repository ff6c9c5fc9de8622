#include <gtest/gtest.h>

#include <string_view>

#include "bytes/bytes.hpp"

using sfx::Bytes;

TEST(Bytes, ViewsWholeString) {
    constexpr std::string_view text = "12.5";
    const Bytes bytes{text};
    EXPECT_EQ(bytes.size(), 4U);
    EXPECT_FALSE(bytes.empty());
    EXPECT_EQ(bytes.get(2), '.');
    EXPECT_EQ(bytes.to_string_view(), text);
}

TEST(Bytes, DefaultIsEmpty) {
    const Bytes bytes;
    EXPECT_TRUE(bytes.empty());
    EXPECT_EQ(bytes.size(), 0U);
    EXPECT_FALSE(bytes.split_first().has_value());
}

TEST(Bytes, SplitAtIndex) {
    const Bytes bytes{std::string_view{"abcdef"}};
    const auto [head, tail] = bytes.split(2);
    EXPECT_EQ(head.to_string_view(), "ab");
    EXPECT_EQ(tail.to_string_view(), "cdef");

    const auto [all, none] = bytes.split(6);
    EXPECT_EQ(all.size(), 6U);
    EXPECT_TRUE(none.empty());
}

TEST(Bytes, SplitFirstWalksAllBytes) {
    Bytes bytes{std::string_view{"x9"}};
    auto first = bytes.split_first();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->first, 'x');
    bytes = first->second;
    first = bytes.split_first();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->first, '9');
    EXPECT_TRUE(first->second.empty());
}

TEST(Bytes, UsableInConstantExpressions) {
    constexpr Bytes bytes{"0123", 4};
    static_assert(bytes.get(3) == '3');
    static_assert(bytes.split(1).second.size() == 3);
    SUCCEED();
}

TEST(BytesDeathTest, OutOfRangeAccessAborts) {
    const Bytes bytes{std::string_view{"12"}};
    EXPECT_EXIT((void)bytes.get(2), ::testing::ExitedWithCode(1), "");
    EXPECT_EXIT((void)bytes.split(3), ::testing::ExitedWithCode(1), "");
}
