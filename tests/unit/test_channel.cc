#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

#include "core/channel.h"

namespace strata {

TEST(ChannelTest, HandsValuesAcrossThreadsInOrder) {
    RendezvousChannel<int> channel;
    std::vector<int> received;

    std::thread consumer([&] {
        while (std::optional<int> v = channel.Receive()) {
            received.push_back(*v);
        }
    });

    for (int i = 0; i < 100; ++i) {
        channel.Send(i);
    }
    channel.Close();
    consumer.join();

    ASSERT_EQ(received.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(received[i], i);
    }
}

TEST(ChannelTest, SendBlocksUntilTaken) {
    RendezvousChannel<int> channel;
    std::atomic<bool> sent{false};

    std::thread producer([&] {
        channel.Send(7);
        sent.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(sent.load());

    std::optional<int> v = channel.Receive();
    producer.join();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, 7);
    EXPECT_TRUE(sent.load());
}

TEST(ChannelTest, CloseWakesBlockedReceiver) {
    RendezvousChannel<int> channel;
    std::optional<int> result = 1;

    std::thread consumer([&] { result = channel.Receive(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.Close();
    consumer.join();

    EXPECT_FALSE(result.has_value());
    EXPECT_TRUE(channel.IsClosed());
}

TEST(ChannelTest, CloseFailsBlockedSender) {
    RendezvousChannel<int> channel;
    bool threw = false;

    std::thread producer([&] {
        try {
            channel.Send(3);
        } catch (const std::runtime_error&) {
            threw = true;
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.Close();
    producer.join();

    EXPECT_TRUE(threw);
}

TEST(ChannelTest, SendOnClosedChannelThrows) {
    RendezvousChannel<int> channel;
    channel.Close();
    EXPECT_THROW(channel.Send(1), std::runtime_error);
    EXPECT_FALSE(channel.Receive().has_value());
}

}  // namespace strata
