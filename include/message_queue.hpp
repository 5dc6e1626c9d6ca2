#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace roto {

struct QueueMessage {
    std::string message_id;
    std::string receipt_handle;
    std::string body;
    int receive_count = 0;  // including this delivery
};

// At-least-once queue with visibility timeouts. Failures throw
// TransientError.
class MessageQueue {
public:
    virtual ~MessageQueue() = default;

    // Long-polls for at most `wait` and returns at most one message, hidden
    // from other consumers for `visibility`.
    virtual std::optional<QueueMessage> receive(std::chrono::seconds wait,
                                                std::chrono::seconds visibility) = 0;
    virtual void change_visibility(const std::string& receipt_handle,
                                   std::chrono::seconds visibility) = 0;
    virtual void delete_message(const std::string& receipt_handle) = 0;
    // Returns the new message id.
    virtual std::string send(const std::string& body) = 0;

    virtual std::string name() const = 0;
};

// SQS through `aws sqs`.
class SqsCliQueue : public MessageQueue {
public:
    SqsCliQueue(std::string queue_url, std::string aws_cli, std::string region);

    std::optional<QueueMessage> receive(std::chrono::seconds wait,
                                        std::chrono::seconds visibility) override;
    void change_visibility(const std::string& receipt_handle,
                           std::chrono::seconds visibility) override;
    void delete_message(const std::string& receipt_handle) override;
    std::string send(const std::string& body) override;

    std::string name() const override { return queue_url_; }

    // Parses `aws sqs receive-message` JSON output.
    static std::optional<QueueMessage> parse_receive_output(const std::string& output);

private:
    std::string run(const std::string& operation, const std::string& args);

    std::string queue_url_;
    std::string aws_cli_;
    std::string region_;
};

// Process-local queue for tests and --local runs. Tracks visibility and
// receive counts like SQS; no automatic redrive.
class InMemoryQueue : public MessageQueue {
public:
    explicit InMemoryQueue(std::string name = "memory");

    std::optional<QueueMessage> receive(std::chrono::seconds wait,
                                        std::chrono::seconds visibility) override;
    void change_visibility(const std::string& receipt_handle,
                           std::chrono::seconds visibility) override;
    void delete_message(const std::string& receipt_handle) override;
    std::string send(const std::string& body) override;

    std::string name() const override { return name_; }

    size_t size() const;
    std::vector<std::string> bodies() const;

private:
    using clock = std::chrono::steady_clock;

    struct Entry {
        QueueMessage message;
        clock::time_point visible_at;
    };

    Entry* find_by_receipt(const std::string& receipt_handle);

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::deque<Entry> entries_;
    uint64_t next_id_ = 1;
};

} // namespace roto
