#include <gtest/gtest.h>
#include "queue/event_channel.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace draftlink;

TEST(EventChannelTest, DefaultCapacityIsOne) {
    EXPECT_EQ((EventChannel<int>::capacity()), 1u);
}

TEST(EventChannelTest, SendReceiveSingleItem) {
    EventChannel<int> channel;

    EXPECT_TRUE(channel.try_send(42));

    auto result = channel.try_receive();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
}

TEST(EventChannelTest, ReceiveFromEmptyReturnsNullopt) {
    EventChannel<int> channel;

    EXPECT_FALSE(channel.try_receive().has_value());
    EXPECT_EQ(channel.peek(), nullptr);
}

TEST(EventChannelTest, SendDropsWhenFull) {
    EventChannel<int> channel;

    EXPECT_TRUE(channel.try_send(1));
    EXPECT_FALSE(channel.try_send(2));

    // The first item survives, the second was dropped
    auto result = channel.try_receive();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 1);
    EXPECT_FALSE(channel.try_receive().has_value());
}

TEST(EventChannelTest, SendSucceedsAfterReceive) {
    EventChannel<int> channel;

    EXPECT_TRUE(channel.try_send(1));
    EXPECT_FALSE(channel.try_send(2));
    EXPECT_TRUE(channel.try_receive().has_value());
    EXPECT_TRUE(channel.try_send(3));

    auto result = channel.try_receive();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 3);
}

TEST(EventChannelTest, PeekDoesNotConsume) {
    EventChannel<std::string> channel;
    EXPECT_TRUE(channel.try_send(std::string("frame")));

    const std::string* head = channel.peek();
    ASSERT_NE(head, nullptr);
    EXPECT_EQ(*head, "frame");
    EXPECT_EQ(channel.size_approx(), 1u);

    auto result = channel.try_receive();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "frame");
    EXPECT_TRUE(channel.is_empty());
}

TEST(EventChannelTest, CloseRefusesSendsButDrainsPending) {
    EventChannel<int, 4> channel;
    EXPECT_TRUE(channel.try_send(7));

    channel.close();
    channel.close();

    EXPECT_TRUE(channel.is_closed());
    EXPECT_FALSE(channel.try_send(8));

    auto result = channel.try_receive();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 7);
    EXPECT_FALSE(channel.try_receive().has_value());
}

TEST(EventChannelTest, FIFOOrderingWithLargerCapacity) {
    EventChannel<int, 8> channel;

    for (int i = 0; i < 8; ++i) {
        EXPECT_TRUE(channel.try_send(int{i}));
    }
    EXPECT_FALSE(channel.try_send(99));

    for (int i = 0; i < 8; ++i) {
        auto result = channel.try_receive();
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, i);
    }
}

TEST(EventChannelTest, WorksWithMoveOnlyTypes) {
    EventChannel<std::unique_ptr<int>> channel;

    EXPECT_TRUE(channel.try_send(std::make_unique<int>(42)));

    auto result = channel.try_receive();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(**result, 42);
}

TEST(EventChannelTest, DestructorReleasesPendingItem) {
    auto shared = std::make_shared<int>(1);
    {
        EventChannel<std::shared_ptr<int>> channel;
        EXPECT_TRUE(channel.try_send(std::shared_ptr<int>(shared)));
        EXPECT_EQ(shared.use_count(), 2);
    }
    EXPECT_EQ(shared.use_count(), 1);
}

TEST(EventChannelTest, ConcurrentProducerConsumerKeepsOrder) {
    EventChannel<int> channel;
    constexpr int kItems = 10000;
    std::atomic<bool> done{false};
    std::vector<int> received;
    received.reserve(kItems);

    std::thread consumer([&] {
        while (!done.load(std::memory_order_acquire) || !channel.is_empty()) {
            if (auto v = channel.try_receive()) {
                received.push_back(*v);
            }
        }
    });

    // Retry until accepted so no item is dropped
    for (int i = 0; i < kItems; ++i) {
        while (!channel.try_send(int{i})) {
            std::this_thread::yield();
        }
    }
    done.store(true, std::memory_order_release);
    consumer.join();

    ASSERT_EQ(received.size(), static_cast<std::size_t>(kItems));
    for (int i = 0; i < kItems; ++i) {
        EXPECT_EQ(received[i], i);
    }
}
