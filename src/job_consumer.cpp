#include "job_consumer.hpp"
#include "deadline.hpp"
#include <filesystem>
#include <iostream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace roto {

namespace {

std::string first_string(const json& body, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        if (!body.contains(name) || body[name].is_null()) {
            continue;
        }
        if (!body[name].is_string()) {
            throw ValidationError(std::string("Field '") + name + "' must be a string");
        }
        return body[name].get<std::string>();
    }
    return "";
}

std::string tag(const std::string& message_id) {
    return "[" + message_id + "] ";
}

} // namespace

ProcessingRequest ProcessingRequest::parse(const std::string& body, const std::string& default_bucket) {
    json parsed;
    try {
        parsed = json::parse(body);
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("Message body is not valid JSON: ") + e.what());
    }
    if (!parsed.is_object()) {
        throw ValidationError("Message body must be a JSON object");
    }

    ProcessingRequest request;
    request.source_bucket = first_string(parsed, {"source_bucket", "bucket"});
    request.source_key = first_string(parsed, {"source_key", "input_key"});
    request.destination_key = first_string(parsed, {"destination_key", "output_key"});
    request.effect_id = first_string(parsed, {"effect_id", "effect_type"});

    if (request.source_bucket.empty()) {
        request.source_bucket = default_bucket;
    }
    if (request.source_bucket.empty()) {
        throw ValidationError("Request has no source_bucket and no default bucket is configured");
    }
    if (request.source_key.empty()) {
        throw ValidationError("Request is missing source_key");
    }
    if (request.effect_id.empty()) {
        throw ValidationError("Request is missing effect_id");
    }
    if (request.destination_key.empty()) {
        request.destination_key = derive_destination_key(request.source_key, request.effect_id);
    }

    if (parsed.contains("params") && !parsed["params"].is_null()) {
        if (!parsed["params"].is_object()) {
            throw ValidationError("params must be a JSON object");
        }
        request.params = parsed["params"];
    }
    return request;
}

std::string derive_destination_key(const std::string& source_key, const std::string& effect_id) {
    std::string stem = fs::path(source_key).stem().string();
    if (stem.empty()) {
        stem = "output";
    }
    return "processed/" + normalize_effect_id(effect_id) + "/" + stem + ".mp4";
}

const char* to_string(JobState state) {
    switch (state) {
        case JobState::Idle: return "Idle";
        case JobState::Received: return "Received";
        case JobState::Downloading: return "Downloading";
        case JobState::Processing: return "Processing";
        case JobState::Uploading: return "Uploading";
        case JobState::Acknowledging: return "Acknowledging";
        case JobState::Failed: return "Failed";
        case JobState::DeadLettered: return "DeadLettered";
    }
    return "Unknown";
}

const char* to_string(JobOutcome outcome) {
    switch (outcome) {
        case JobOutcome::NoMessage: return "no-message";
        case JobOutcome::Succeeded: return "succeeded";
        case JobOutcome::Failed: return "failed";
        case JobOutcome::DeadLettered: return "dead-lettered";
    }
    return "unknown";
}

VisibilityExtender::VisibilityExtender(MessageQueue& queue, std::string receipt_handle,
                                       std::string message_id, std::chrono::seconds interval,
                                       std::chrono::seconds visibility)
    : queue_(queue)
    , receipt_handle_(std::move(receipt_handle))
    , message_id_(std::move(message_id))
    , interval_(interval)
    , visibility_(visibility)
    , thread_(&VisibilityExtender::loop, this) {}

VisibilityExtender::~VisibilityExtender() {
    stop();
}

void VisibilityExtender::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void VisibilityExtender::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!wake_.wait_for(lock, interval_, [this] { return stopping_; })) {
        lock.unlock();
        try {
            queue_.change_visibility(receipt_handle_, visibility_);
            extensions_++;
        } catch (const std::exception& e) {
            std::cerr << tag(message_id_) << "Visibility extension failed: " << e.what() << std::endl;
        }
        lock.lock();
    }
}

JobConsumer::JobConsumer(const WorkerConfig& config, const EffectRegistry& registry,
                         VideoProcessor& processor, StorageGateway& storage, MessageQueue& queue,
                         MessageQueue* dead_letter_queue)
    : config_(config)
    , registry_(registry)
    , processor_(processor)
    , storage_(storage)
    , queue_(queue)
    , dead_letter_queue_(dead_letter_queue) {}

JobReport JobConsumer::poll_once() {
    std::optional<QueueMessage> message = queue_.receive(config_.poll_wait, config_.visibility_timeout);
    if (!message) {
        JobReport report;
        report.states.push_back(JobState::Idle);
        return report;
    }
    return handle(*message);
}

JobReport JobConsumer::handle(const QueueMessage& message) {
    JobReport report;
    report.message_id = message.message_id;
    report.states = {JobState::Idle, JobState::Received};
    const std::string prefix = tag(message.message_id);

    std::cout << prefix << "Received message (receive count " << message.receive_count << ")" << std::endl;

    if (message.receive_count > config_.max_receive_count) {
        std::string reason = "Exceeded max receive count (" + std::to_string(message.receive_count) +
                             " > " + std::to_string(config_.max_receive_count) + ")";
        report.error = reason;
        report.error_kind = ErrorKind::Permanent;
        if (dead_letter(message, reason, ErrorKind::Permanent)) {
            report.outcome = JobOutcome::DeadLettered;
            report.states.push_back(JobState::DeadLettered);
        } else {
            report.outcome = JobOutcome::Failed;
            report.states.push_back(JobState::Failed);
        }
        report.states.push_back(JobState::Idle);
        return report;
    }

    try {
        // Everything that can be rejected without touching storage.
        ProcessingRequest request = ProcessingRequest::parse(message.body, config_.bucket);
        const EffectDescriptor& effect = registry_.resolve(request.effect_id);
        ValidatedParams params = registry_.validate(effect.id, request.params);
        report.destination_key = request.destination_key;

        std::cout << prefix << "Job " << request.source_bucket << "/" << request.source_key
                  << " -> " << request.destination_key << " with " << effect.id
                  << " v" << effect.version << std::endl;

        VisibilityExtender extender(queue_, message.receipt_handle, message.message_id,
                                    config_.visibility_extend_interval, config_.visibility_timeout);
        Deadline deadline(config_.max_job_duration);
        ScratchSpace scratch(config_.scratch_dir);

        std::string input_path = scratch.file("input" + fs::path(request.source_key).extension().string());
        std::string output_path = scratch.file("output.mp4");

        report.states.push_back(JobState::Downloading);
        storage_.download(request.source_bucket, request.source_key, input_path, deadline);
        deadline.check("download");

        report.states.push_back(JobState::Processing);
        processor_.apply(effect, params, input_path, output_path, deadline);

        report.states.push_back(JobState::Uploading);
        deadline.check("upload");
        storage_.upload(request.source_bucket, request.destination_key, output_path, "video/mp4", deadline);

        report.states.push_back(JobState::Acknowledging);
        extender.stop();
        queue_.delete_message(message.receipt_handle);

        std::cout << prefix << "Completed " << request.source_bucket << "/" << request.destination_key
                  << " (" << extender.extensions() << " visibility extensions)" << std::endl;

        if (config_.delete_source_on_success && request.source_key != request.destination_key) {
            try {
                storage_.remove(request.source_bucket, request.source_key);
            } catch (const WorkerError& e) {
                std::cerr << prefix << "Could not delete source object: " << e.what() << std::endl;
            }
        }

        report.outcome = JobOutcome::Succeeded;
    } catch (const WorkerError& e) {
        report.error = e.what();
        report.error_kind = e.kind();
        std::cerr << prefix << "Job failed (" << to_string(e.kind()) << "): " << e.what() << std::endl;

        if (e.is_permanent() && dead_letter(message, e.what(), e.kind())) {
            report.outcome = JobOutcome::DeadLettered;
            report.states.push_back(JobState::DeadLettered);
        } else {
            report.outcome = JobOutcome::Failed;
            report.states.push_back(JobState::Failed);
        }
    } catch (const std::exception& e) {
        report.error = e.what();
        report.error_kind = ErrorKind::Processing;
        report.outcome = JobOutcome::Failed;
        report.states.push_back(JobState::Failed);
        std::cerr << prefix << "Job failed: " << e.what() << std::endl;
    }

    report.states.push_back(JobState::Idle);
    return report;
}

bool JobConsumer::dead_letter(const QueueMessage& message, const std::string& reason, ErrorKind kind) {
    const std::string prefix = tag(message.message_id);
    if (!dead_letter_queue_) {
        std::cerr << prefix << "No dead-letter queue configured, leaving message for redelivery" << std::endl;
        return false;
    }

    json envelope = {
        {"original_body", message.body},
        {"error", reason},
        {"error_kind", to_string(kind)},
        {"source_message_id", message.message_id},
        {"receive_count", message.receive_count}
    };

    try {
        std::string dlq_id = dead_letter_queue_->send(envelope.dump());
        queue_.delete_message(message.receipt_handle);
        std::cout << prefix << "Dead-lettered as " << dlq_id << ": " << reason << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << prefix << "Dead-lettering failed: " << e.what() << std::endl;
        return false;
    }
}

void JobConsumer::run(const std::atomic<bool>& stop) {
    int consecutive_failures = 0;
    RetryPolicy backoff;
    backoff.base_delay = config_.storage_retry_base_delay;

    std::cout << "Polling " << queue_.name() << " (wait " << config_.poll_wait.count()
              << "s, visibility " << config_.visibility_timeout.count() << "s)" << std::endl;

    while (!stop.load()) {
        try {
            JobReport report = poll_once();
            consecutive_failures = 0;
            if (report.outcome != JobOutcome::NoMessage) {
                std::cout << tag(report.message_id) << "Outcome: " << to_string(report.outcome) << std::endl;
            }
        } catch (const TransientError& e) {
            ++consecutive_failures;
            std::cerr << "Receive failed (" << consecutive_failures << "/"
                      << config_.max_consecutive_poll_failures << "): " << e.what() << std::endl;
            if (consecutive_failures >= config_.max_consecutive_poll_failures) {
                throw TransientError("Giving up after " + std::to_string(consecutive_failures) +
                                     " consecutive receive failures");
            }
            std::this_thread::sleep_for(backoff.delay_for(consecutive_failures));
        }
    }

    std::cout << "Stop requested, consumer exiting" << std::endl;
}

} // namespace roto
