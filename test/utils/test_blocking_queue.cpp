// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <gtest/gtest.h>

#include "blocking_queue.h"

#include <thread>

class TestBlockingQueue : public testing::Test {};

TEST_F(TestBlockingQueue, put_and_take) {
    BlockingQueue<int> queue(4);
    EXPECT_EQ(queue.GetCapacity(), 4);
    EXPECT_TRUE(queue.Empty());

    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(queue.Put(i));
    }
    EXPECT_EQ(queue.Size(), 4);

    int value = -1;
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(queue.Take(value));
        EXPECT_EQ(value, i);
    }
    EXPECT_TRUE(queue.Empty());
}

TEST_F(TestBlockingQueue, producer_waits_for_consumer) {
    BlockingQueue<int> queue(1);
    const int n = 1000;

    std::thread producer([&] {
        for (int i = 0; i < n; ++i) {
            queue.Put(i);
        }
        queue.Close();
    });

    int expected = 0;
    int value;
    while (queue.Take(value)) {
        EXPECT_EQ(value, expected++);
        EXPECT_LE(queue.Size(), 1);
    }
    producer.join();
    EXPECT_EQ(expected, n);
}

TEST_F(TestBlockingQueue, close_drains) {
    BlockingQueue<std::string> queue(8);
    queue.Put("a");
    queue.Put("b");
    queue.Close();

    EXPECT_FALSE(queue.Put("c"));

    std::string value;
    EXPECT_TRUE(queue.Take(value));
    EXPECT_EQ(value, "a");
    EXPECT_TRUE(queue.Take(value));
    EXPECT_EQ(value, "b");
    EXPECT_FALSE(queue.Take(value));
}

TEST_F(TestBlockingQueue, quit_releases_blocked_producer) {
    BlockingQueue<int> queue(1);
    ASSERT_TRUE(queue.Put(0));

    bool result = true;
    std::thread producer([&] { result = queue.Put(1); });

    queue.Quit();
    producer.join();
    EXPECT_FALSE(result);
    EXPECT_TRUE(queue.IsQuit());

    // queued elements are dropped as well
    int value;
    EXPECT_FALSE(queue.Take(value));
}

TEST_F(TestBlockingQueue, quit_releases_blocked_consumer) {
    BlockingQueue<int> queue(1);

    bool result = true;
    std::thread consumer([&] {
        int value;
        result = queue.Take(value);
    });

    queue.Quit();
    consumer.join();
    EXPECT_FALSE(result);
}

TEST_F(TestBlockingQueue, clear_unblocks_producer) {
    BlockingQueue<int> queue(2);
    queue.Put(1);
    queue.Put(2);

    std::thread producer([&] { queue.Put(3); });
    queue.Clear();
    producer.join();

    int value;
    ASSERT_TRUE(queue.Take(value));
    EXPECT_EQ(value, 3);
}
