#include <gtest/gtest.h>
#include "errors.hpp"
#include "message_queue.hpp"
#include <thread>

namespace roto {

using std::chrono::seconds;

TEST(InMemoryQueueTest, ReceiveHidesMessageUntilVisibilityExpires) {
    InMemoryQueue queue("jobs");
    std::string id = queue.send("{\"a\":1}");

    auto first = queue.receive(seconds(0), seconds(30));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->message_id, id);
    EXPECT_EQ(first->body, "{\"a\":1}");
    EXPECT_EQ(first->receive_count, 1);

    EXPECT_FALSE(queue.receive(seconds(0), seconds(30)).has_value());
    EXPECT_EQ(queue.size(), 1u);
}

TEST(InMemoryQueueTest, ZeroVisibilityRedeliversAndCounts) {
    InMemoryQueue queue;
    queue.send("body");

    for (int expected = 1; expected <= 3; ++expected) {
        auto message = queue.receive(seconds(0), seconds(0));
        ASSERT_TRUE(message.has_value());
        EXPECT_EQ(message->receive_count, expected);
    }
}

TEST(InMemoryQueueTest, StaleReceiptIsRejected) {
    InMemoryQueue queue;
    queue.send("body");

    auto first = queue.receive(seconds(0), seconds(0));
    auto second = queue.receive(seconds(0), seconds(30));
    ASSERT_TRUE(first && second);
    EXPECT_NE(first->receipt_handle, second->receipt_handle);

    EXPECT_THROW(queue.delete_message(first->receipt_handle), TransientError);
    EXPECT_THROW(queue.change_visibility(first->receipt_handle, seconds(10)), TransientError);

    queue.delete_message(second->receipt_handle);
    EXPECT_EQ(queue.size(), 0u);
}

TEST(InMemoryQueueTest, ChangeVisibilityCanReleaseMessage) {
    InMemoryQueue queue;
    queue.send("body");

    auto message = queue.receive(seconds(0), seconds(60));
    ASSERT_TRUE(message);
    queue.change_visibility(message->receipt_handle, seconds(0));

    auto again = queue.receive(seconds(0), seconds(60));
    ASSERT_TRUE(again);
    EXPECT_EQ(again->receive_count, 2);
}

TEST(InMemoryQueueTest, LongPollWakesOnSend) {
    InMemoryQueue queue;

    std::thread producer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        queue.send("late");
    });

    auto start = std::chrono::steady_clock::now();
    auto message = queue.receive(seconds(5), seconds(30));
    auto waited = std::chrono::steady_clock::now() - start;
    producer.join();

    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->body, "late");
    EXPECT_LT(waited, seconds(4));
}

TEST(InMemoryQueueTest, EmptyQueueReturnsNothing) {
    InMemoryQueue queue;
    EXPECT_FALSE(queue.receive(seconds(0), seconds(30)).has_value());
}

TEST(InMemoryQueueTest, MessagesKeepSendOrder) {
    InMemoryQueue queue("q");
    queue.send("one");
    queue.send("two");

    EXPECT_EQ(queue.bodies(), (std::vector<std::string>{"one", "two"}));
    auto first = queue.receive(seconds(0), seconds(30));
    ASSERT_TRUE(first);
    EXPECT_EQ(first->body, "one");
}

TEST(SqsCliQueueTest, ParsesReceiveOutput) {
    const std::string output = R"({
        "Messages": [{
            "MessageId": "m-123",
            "ReceiptHandle": "rh-abc",
            "Body": "{\"source_key\":\"videos/a.mp4\"}",
            "Attributes": {"ApproximateReceiveCount": "4"}
        }]
    })";

    auto message = SqsCliQueue::parse_receive_output(output);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->message_id, "m-123");
    EXPECT_EQ(message->receipt_handle, "rh-abc");
    EXPECT_EQ(message->body, "{\"source_key\":\"videos/a.mp4\"}");
    EXPECT_EQ(message->receive_count, 4);
}

TEST(SqsCliQueueTest, EmptyReceiveOutputMeansNoMessage) {
    EXPECT_FALSE(SqsCliQueue::parse_receive_output("").has_value());
    EXPECT_FALSE(SqsCliQueue::parse_receive_output("  \n").has_value());
    EXPECT_FALSE(SqsCliQueue::parse_receive_output("{\"Messages\": []}").has_value());
    EXPECT_FALSE(SqsCliQueue::parse_receive_output("{}").has_value());
}

TEST(SqsCliQueueTest, MissingCountDefaultsToFirstDelivery) {
    auto message = SqsCliQueue::parse_receive_output(
        R"({"Messages":[{"MessageId":"m","ReceiptHandle":"r","Body":"b"}]})");
    ASSERT_TRUE(message);
    EXPECT_EQ(message->receive_count, 1);
}

TEST(SqsCliQueueTest, MalformedOutputIsTransient) {
    EXPECT_THROW(SqsCliQueue::parse_receive_output("{not json"), TransientError);
    EXPECT_THROW(SqsCliQueue::parse_receive_output(R"({"Messages":[{"MessageId":"m"}]})"),
                 TransientError);
}

} // namespace roto
