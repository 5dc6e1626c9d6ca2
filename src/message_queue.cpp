#include "message_queue.hpp"
#include "errors.hpp"
#include "process.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace roto {

SqsCliQueue::SqsCliQueue(std::string queue_url, std::string aws_cli, std::string region)
    : queue_url_(std::move(queue_url)), aws_cli_(std::move(aws_cli)), region_(std::move(region)) {}

std::string SqsCliQueue::run(const std::string& operation, const std::string& args) {
    std::string command = join_command({aws_cli_, "sqs", operation,
                                        "--queue-url", queue_url_,
                                        "--region", region_, "--output", "json"}) + args;
    CommandResult result = run_command(command);
    if (!result.ok()) {
        throw TransientError("aws sqs " + operation + " exited with code " +
                             std::to_string(result.exit_code) + ": " + result.error_output);
    }
    return result.output;
}

std::optional<QueueMessage> SqsCliQueue::parse_receive_output(const std::string& output) {
    if (output.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }

    try {
        json response = json::parse(output);
        if (!response.contains("Messages") || response["Messages"].empty()) {
            return std::nullopt;
        }

        const json& m = response["Messages"][0];
        QueueMessage message;
        message.message_id = m.value("MessageId", "");
        message.receipt_handle = m.at("ReceiptHandle").get<std::string>();
        message.body = m.value("Body", "");
        message.receive_count = 1;
        if (m.contains("Attributes") && m["Attributes"].contains("ApproximateReceiveCount")) {
            message.receive_count = std::stoi(m["Attributes"]["ApproximateReceiveCount"].get<std::string>());
        }
        return message;
    } catch (const json::exception& e) {
        throw TransientError(std::string("Unparseable receive-message output: ") + e.what());
    } catch (const std::logic_error& e) {
        throw TransientError(std::string("Bad ApproximateReceiveCount: ") + e.what());
    }
}

std::optional<QueueMessage> SqsCliQueue::receive(std::chrono::seconds wait,
                                                 std::chrono::seconds visibility) {
    std::string output = run("receive-message",
        " --max-number-of-messages 1"
        " --wait-time-seconds " + std::to_string(wait.count()) +
        " --visibility-timeout " + std::to_string(visibility.count()) +
        " --attribute-names ApproximateReceiveCount");
    return parse_receive_output(output);
}

void SqsCliQueue::change_visibility(const std::string& receipt_handle,
                                    std::chrono::seconds visibility) {
    run("change-message-visibility",
        " --receipt-handle " + shell_quote(receipt_handle) +
        " --visibility-timeout " + std::to_string(visibility.count()));
}

void SqsCliQueue::delete_message(const std::string& receipt_handle) {
    run("delete-message", " --receipt-handle " + shell_quote(receipt_handle));
}

std::string SqsCliQueue::send(const std::string& body) {
    std::string output = run("send-message", " --message-body " + shell_quote(body));
    try {
        return json::parse(output).value("MessageId", "");
    } catch (const json::exception& e) {
        throw TransientError(std::string("Unparseable send-message output: ") + e.what());
    }
}

InMemoryQueue::InMemoryQueue(std::string name) : name_(std::move(name)) {}

std::optional<QueueMessage> InMemoryQueue::receive(std::chrono::seconds wait,
                                                   std::chrono::seconds visibility) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto give_up_at = clock::now() + wait;

    while (true) {
        auto now = clock::now();
        auto next_visible = clock::time_point::max();

        for (auto& entry : entries_) {
            if (entry.visible_at <= now) {
                entry.visible_at = now + visibility;
                entry.message.receive_count++;
                entry.message.receipt_handle =
                    entry.message.message_id + "#" + std::to_string(entry.message.receive_count);
                return entry.message;
            }
            next_visible = std::min(next_visible, entry.visible_at);
        }

        if (now >= give_up_at) {
            return std::nullopt;
        }
        changed_.wait_until(lock, std::min(give_up_at, next_visible));
    }
}

InMemoryQueue::Entry* InMemoryQueue::find_by_receipt(const std::string& receipt_handle) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry) {
        return entry.message.receipt_handle == receipt_handle;
    });
    return it == entries_.end() ? nullptr : &*it;
}

void InMemoryQueue::change_visibility(const std::string& receipt_handle,
                                      std::chrono::seconds visibility) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find_by_receipt(receipt_handle);
    if (!entry) {
        throw TransientError("Receipt handle is no longer valid: " + receipt_handle);
    }
    entry->visible_at = clock::now() + visibility;
    changed_.notify_all();
}

void InMemoryQueue::delete_message(const std::string& receipt_handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry) {
        return entry.message.receipt_handle == receipt_handle;
    });
    if (it == entries_.end()) {
        throw TransientError("Receipt handle is no longer valid: " + receipt_handle);
    }
    entries_.erase(it);
}

std::string InMemoryQueue::send(const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry entry;
    entry.message.message_id = name_ + "-" + std::to_string(next_id_++);
    entry.message.body = body;
    entry.visible_at = clock::now();
    entries_.push_back(entry);
    changed_.notify_all();
    return entry.message.message_id;
}

size_t InMemoryQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<std::string> InMemoryQueue::bodies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& entry : entries_) {
        result.push_back(entry.message.body);
    }
    return result;
}

} // namespace roto
