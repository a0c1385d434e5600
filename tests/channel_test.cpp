/*
 * steplog - Step Log Streaming
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "steplog/channel.hpp"
#include "steplog/client.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace steplog;

TEST(ChannelTest, DeliversInOrderAndDrainsAfterClose) {
    Channel<int> ch(4);
    EXPECT_TRUE(ch.send(1));
    EXPECT_TRUE(ch.send(2));
    ch.close();

    EXPECT_FALSE(ch.send(3));
    EXPECT_EQ(ch.receive().value(), 1);
    EXPECT_EQ(ch.receive().value(), 2);
    EXPECT_FALSE(ch.receive().has_value());
}

TEST(ChannelTest, TryReceiveReportsEmptyThenClosed) {
    Channel<std::string> ch;
    std::optional<std::string> out;
    EXPECT_EQ(ch.tryReceive(out), RecvStatus::Empty);
    ch.close();
    EXPECT_EQ(ch.tryReceive(out), RecvStatus::Closed);
    EXPECT_FALSE(out.has_value());
}

TEST(ChannelTest, ReceiveForTimesOutWithoutValue) {
    Channel<int> ch;
    std::optional<int> out;
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(ch.receiveFor(out, std::chrono::milliseconds(30)), RecvStatus::Empty);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));
}

TEST(ChannelTest, FullChannelBlocksSenderUntilDrained) {
    Channel<int> ch(1);
    ASSERT_TRUE(ch.send(1));

    std::atomic<bool> sent{false};
    std::thread producer([&] {
        EXPECT_TRUE(ch.send(2));
        sent.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(sent.load());
    EXPECT_EQ(ch.receive().value(), 1);
    producer.join();
    EXPECT_TRUE(sent.load());
    EXPECT_EQ(ch.receive().value(), 2);
}

TEST(ChannelTest, ConsumerCloseUnblocksSender) {
    Channel<int> ch(1);
    ASSERT_TRUE(ch.send(1));

    std::thread producer([&] { EXPECT_FALSE(ch.send(2)); });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    ch.close();
    producer.join();
}

TEST(SelectTest, ForwardsBothChannelsAndReportsEachCloseOnce) {
    Channel<int> numbers(2);
    Channel<std::string> words(2);

    std::thread producer([&] {
        for (int i = 0; i < 5; ++i) {
            (void)numbers.send(i);
            if (i == 2) {
                (void)words.send("two");
            }
        }
        numbers.close();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        (void)words.send("late");
        words.close();
    });

    std::vector<int> gotNumbers;
    std::vector<std::string> gotWords;
    int numberCloses = 0;
    int wordCloses = 0;

    bool completed = selectUntilClosed(numbers, words,
        [&](std::optional<int> v) {
            if (v) gotNumbers.push_back(*v); else ++numberCloses;
            return true;
        },
        [&](std::optional<std::string> v) {
            if (v) gotWords.push_back(*v); else ++wordCloses;
            return true;
        });
    producer.join();

    EXPECT_TRUE(completed);
    EXPECT_EQ(gotNumbers, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_EQ(gotWords, (std::vector<std::string>{"two", "late"}));
    EXPECT_EQ(numberCloses, 1);
    EXPECT_EQ(wordCloses, 1);
}

TEST(SelectTest, HandlerCanStopEarly) {
    Channel<int> a(4);
    Channel<int> b(4);
    (void)a.send(1);
    (void)a.send(2);

    int seen = 0;
    bool completed = selectUntilClosed(a, b,
        [&](std::optional<int>) { ++seen; return false; },
        [&](std::optional<int>) { return true; });

    EXPECT_FALSE(completed);
    EXPECT_EQ(seen, 1);
}

TEST(LogFeedTest, DestroyingFeedStopsBlockedProducer) {
    std::atomic<bool> producerDone{false};
    {
        LogFeed feed;
        feed.lines = std::make_shared<Channel<std::string>>(1);
        feed.errors = std::make_shared<Channel<std::string>>(1);
        auto lines = feed.lines;
        feed.producer = std::thread([lines, &producerDone] {
            while (lines->send("line")) {
            }
            producerDone.store(true);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        EXPECT_FALSE(producerDone.load());
    }
    EXPECT_TRUE(producerDone.load());
}

TEST(LogFeedTest, MoveAssignmentStopsReplacedProducer) {
    std::atomic<bool> producerDone{false};
    LogFeed feed;
    feed.lines = std::make_shared<Channel<std::string>>(1);
    auto lines = feed.lines;
    feed.producer = std::thread([lines, &producerDone] {
        while (lines->send("line")) {
        }
        producerDone.store(true);
    });

    feed = LogFeed();
    EXPECT_TRUE(producerDone.load());
    EXPECT_FALSE(feed.producer.joinable());
}
