#pragma once

#include "effect_registry.hpp"
#include "errors.hpp"
#include "message_queue.hpp"
#include "storage_gateway.hpp"
#include "video_processor.hpp"
#include "worker_config.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace roto {

struct ProcessingRequest {
    std::string source_bucket;
    std::string source_key;
    std::string destination_key;
    std::string effect_id;
    nlohmann::json params = nlohmann::json::object();

    // Accepts the legacy names bucket, input_key, output_key and effect_type.
    // Missing source bucket falls back to `default_bucket`; missing
    // destination key is derived. Throws ValidationError.
    static ProcessingRequest parse(const std::string& body, const std::string& default_bucket);
};

// processed/<effect_id>/<source stem>.mp4
std::string derive_destination_key(const std::string& source_key, const std::string& effect_id);

enum class JobState {
    Idle,
    Received,
    Downloading,
    Processing,
    Uploading,
    Acknowledging,
    Failed,
    DeadLettered
};

const char* to_string(JobState state);

enum class JobOutcome { NoMessage, Succeeded, Failed, DeadLettered };

const char* to_string(JobOutcome outcome);

struct JobReport {
    JobOutcome outcome = JobOutcome::NoMessage;
    std::vector<JobState> states;  // in visiting order, starting with Idle
    std::string message_id;
    std::string destination_key;
    std::string error;
    std::optional<ErrorKind> error_kind;
};

// Keeps an in-flight message hidden by renewing its visibility timeout
// every `interval` until stopped or destroyed.
class VisibilityExtender {
public:
    VisibilityExtender(MessageQueue& queue, std::string receipt_handle, std::string message_id,
                       std::chrono::seconds interval, std::chrono::seconds visibility);
    ~VisibilityExtender();

    VisibilityExtender(const VisibilityExtender&) = delete;
    VisibilityExtender& operator=(const VisibilityExtender&) = delete;

    void stop();
    int extensions() const { return extensions_.load(); }

private:
    void loop();

    MessageQueue& queue_;
    std::string receipt_handle_;
    std::string message_id_;
    std::chrono::seconds interval_;
    std::chrono::seconds visibility_;

    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    std::atomic<int> extensions_{0};
    std::thread thread_;
};

// Receives one message at a time and drives it through download, effect,
// upload and acknowledgement. The only place that decides between retry,
// dead-letter and ack.
class JobConsumer {
public:
    // `dead_letter_queue` may be null; permanent failures are then left for
    // the queue's own redrive policy.
    JobConsumer(const WorkerConfig& config, const EffectRegistry& registry, VideoProcessor& processor,
                StorageGateway& storage, MessageQueue& queue, MessageQueue* dead_letter_queue);

    // Throws TransientError when the receive itself fails.
    JobReport poll_once();
    JobReport handle(const QueueMessage& message);

    // Polls until `stop` is set. Throws TransientError after
    // max_consecutive_poll_failures receive failures in a row.
    void run(const std::atomic<bool>& stop);

private:
    bool dead_letter(const QueueMessage& message, const std::string& reason, ErrorKind kind);

    const WorkerConfig& config_;
    const EffectRegistry& registry_;
    VideoProcessor& processor_;
    StorageGateway& storage_;
    MessageQueue& queue_;
    MessageQueue* dead_letter_queue_;
};

} // namespace roto
