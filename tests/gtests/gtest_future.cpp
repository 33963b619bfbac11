#include "peekio/core.hpp"

#include "gtest/gtest.h"

#include <optional>
#include <string>

using namespace peekio;

TEST(TestFuture, FirstResolveWins) {
    Future<int> future;
    EXPECT_FALSE(future.is_settled());
    EXPECT_TRUE(future.resolve(1));
    EXPECT_FALSE(future.resolve(2));
    EXPECT_FALSE(future.reject(make_peekio_error(Error::EndOfStream)));
    EXPECT_TRUE(future.is_settled());

    std::optional<Result<int>> seen;
    auto                       consumer = [&]() -> Task<> {
        seen = co_await future;
    };
    spawn(consumer());
    ASSERT_TRUE(seen.has_value());
    ASSERT_TRUE(seen->has_value());
    EXPECT_EQ(seen->value(), 1);
}

TEST(TestFuture, FirstRejectWins) {
    Future<int> future;
    EXPECT_TRUE(future.reject(make_peekio_error(Error::AbruptClosure)));
    EXPECT_FALSE(future.resolve(3));

    std::optional<Result<int>> seen;
    auto                       consumer = [&]() -> Task<> {
        seen = co_await future;
    };
    spawn(consumer());
    ASSERT_TRUE(seen.has_value());
    ASSERT_FALSE(seen->has_value());
    EXPECT_EQ(seen->error(), make_peekio_error(Error::AbruptClosure));
}

TEST(TestFuture, AwaitSuspendsUntilResolved) {
    Future<std::string> future;
    bool                resumed = false;
    std::string         value;

    auto consumer = [&]() -> Task<> {
        auto ret = co_await future;
        resumed = true;
        EXPECT_TRUE(ret.has_value());
        if (ret) {
            value = ret.value();
        }
    };
    spawn(consumer());
    EXPECT_FALSE(resumed);

    // a copy shares the same cell
    auto producer = future;
    EXPECT_TRUE(producer.resolve("done"));
    EXPECT_TRUE(resumed);
    EXPECT_EQ(value, "done");
}
