#include <gtest/gtest.h>
#include <echo/echo_queue.hpp>

TEST(EchoQueue, StartsEmpty) {
    EchoQueue q;
    EXPECT_TRUE(q.empty());
    EXPECT_EQ(q.size(), 0u);
    EXPECT_FALSE(q.consume_front().has_value());
}

TEST(EchoQueue, ConsumesInRecordOrder) {
    EchoQueue q;
    q.record('a');
    q.record('b');
    q.record('\b');
    EXPECT_EQ(q.size(), 3u);

    EXPECT_EQ(q.consume_front(), 'a');
    EXPECT_EQ(q.consume_front(), 'b');
    EXPECT_EQ(q.consume_front(), '\b');
    EXPECT_FALSE(q.consume_front().has_value());
    EXPECT_TRUE(q.empty());
}

TEST(EchoQueue, ClearDropsEverything) {
    EchoQueue q;
    q.record('x');
    q.record('y');
    q.clear();
    EXPECT_TRUE(q.empty());

    q.record('z');
    EXPECT_EQ(q.consume_front(), 'z');
}
