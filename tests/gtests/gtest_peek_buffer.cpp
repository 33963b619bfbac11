#include "peekio/io/peek_buffer.hpp"

#include "gtest/gtest.h"

#include <array>
#include <string>
#include <string_view>

using namespace peekio::io;
using namespace std::string_view_literals;

namespace {

auto take_string(PeekBuffer &buffer, std::size_t max) -> std::string {
    std::string out(max, '\0');
    auto        len = buffer.take(out);
    out.resize(len);
    return out;
}

} // namespace

TEST(TestPeekBuffer, StartsEmpty) {
    PeekBuffer           buffer;
    std::array<char, 4>  dst{};
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.take(dst), 0);
}

TEST(TestPeekBuffer, TakesAcrossChunksInOrder) {
    PeekBuffer buffer;
    buffer.push("ab"sv);
    buffer.push("cde"sv);
    buffer.push("f"sv);
    EXPECT_EQ(buffer.size(), 6);
    EXPECT_EQ(buffer.chunk_count(), 3);

    EXPECT_EQ(take_string(buffer, 4), "abcd");
    EXPECT_EQ(buffer.size(), 2);
    EXPECT_EQ(take_string(buffer, 10), "ef");
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.chunk_count(), 0);
}

TEST(TestPeekBuffer, PartialTakeKeepsRemainderAtFront) {
    PeekBuffer buffer;
    buffer.push("abcdef"sv);
    EXPECT_EQ(take_string(buffer, 1), "a");
    EXPECT_EQ(take_string(buffer, 2), "bc");
    buffer.push("gh"sv);
    EXPECT_EQ(take_string(buffer, 5), "defgh");
}

TEST(TestPeekBuffer, PushFrontGoesBeforeRemainder) {
    PeekBuffer buffer;
    buffer.push("abcdef"sv);
    EXPECT_EQ(take_string(buffer, 3), "abc");
    buffer.push_front("abc"sv);
    EXPECT_EQ(buffer.size(), 6);
    EXPECT_EQ(take_string(buffer, 6), "abcdef");
}

TEST(TestPeekBuffer, EmptyChunksAreIgnored) {
    PeekBuffer buffer;
    buffer.push(""sv);
    buffer.push_front(""sv);
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.chunk_count(), 0);
}

TEST(TestPeekBuffer, Clear) {
    PeekBuffer buffer;
    buffer.push("abc"sv);
    EXPECT_EQ(take_string(buffer, 1), "a");
    buffer.clear();
    EXPECT_TRUE(buffer.empty());
    buffer.push("xy"sv);
    EXPECT_EQ(take_string(buffer, 2), "xy");
}
