#include "peekio/io/push_source.hpp"

#include "gtest/gtest.h"

#include <array>
#include <optional>
#include <string_view>

using namespace peekio;
using namespace peekio::io;
using namespace std::string_view_literals;

TEST(TestPushSource, FillsOnlyWhenEnoughIsBuffered) {
    PushSource          source;
    std::array<char, 4> buf{};

    EXPECT_TRUE(source.push("ab"sv));
    EXPECT_EQ(source.try_read(buf), 0);
    EXPECT_TRUE(source.push("cdef"sv));
    EXPECT_EQ(source.try_read(buf), 4);
    EXPECT_EQ(std::string_view(buf.data(), 4), "abcd");
    EXPECT_EQ(source.buffered(), 2);
}

TEST(TestPushSource, ShortReadAfterEnd) {
    PushSource          source;
    std::array<char, 4> buf{};
    int                 ends = 0;
    int                 closes = 0;
    source.once_end([&] {
        ends++;
    });
    source.once_close([&] {
        closes++;
    });

    EXPECT_TRUE(source.push("xy"sv));
    source.end();
    // `end` waits until the buffered tail is taken
    EXPECT_EQ(ends, 0);
    EXPECT_FALSE(source.push("z"sv));

    EXPECT_EQ(source.try_read(buf), 2);
    EXPECT_EQ(std::string_view(buf.data(), 2), "xy");
    EXPECT_EQ(ends, 1);
    EXPECT_EQ(closes, 1);
    EXPECT_EQ(source.try_read(buf), 0);
    EXPECT_EQ(ends, 1);
}

TEST(TestPushSource, ReadableIsOneShot) {
    PushSource source;
    int        readable = 0;
    source.once_readable([&] {
        readable++;
    });
    EXPECT_TRUE(source.push("a"sv));
    EXPECT_TRUE(source.push("b"sv));
    EXPECT_EQ(readable, 1);
}

TEST(TestPushSource, FailDiscardsDataAndCloses) {
    PushSource           source;
    std::array<char, 1>  buf{};
    std::optional<Error> seen;
    bool                 closed = false;
    source.once_error([&](Error error) {
        seen = error;
    });
    source.once_close([&] {
        closed = true;
    });

    EXPECT_TRUE(source.push("abc"sv));
    source.fail(make_uv_error(UV_ECONNRESET));
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen.value(), make_uv_error(UV_ECONNRESET));
    EXPECT_TRUE(closed);
    EXPECT_EQ(source.buffered(), 0);
    EXPECT_EQ(source.try_read(buf), 0);
}

TEST(TestPushSource, LateTerminalListenersFireImmediately) {
    PushSource source;
    source.end();

    bool ended = false;
    bool closed = false;
    source.once_end([&] {
        ended = true;
    });
    source.once_close([&] {
        closed = true;
    });
    EXPECT_TRUE(ended);
    EXPECT_TRUE(closed);
}

TEST(TestPushSource, RemoveListeners) {
    PushSource source;
    bool       fired = false;
    source.once_readable([&] {
        fired = true;
    });
    source.once_close([&] {
        fired = true;
    });
    source.remove_listeners();
    EXPECT_TRUE(source.push("a"sv));
    source.close();
    EXPECT_FALSE(fired);
    EXPECT_TRUE(source.is_closed());
}
