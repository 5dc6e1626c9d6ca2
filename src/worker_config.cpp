#include "worker_config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace roto {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

bool parse_bool(const std::string& name, std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw ConfigError(name + " must be a boolean, got '" + value + "'");
}

long parse_long(const std::string& name, const std::string& value) {
    try {
        size_t consumed = 0;
        long parsed = std::stol(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigError(name + " must be an integer, got '" + value + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError(name + " must be an integer, got '" + value + "'");
    }
}

template <typename T>
void read_field(const json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Config field '") + key + "': " + e.what());
    }
}

void read_seconds(const json& j, const char* key, std::chrono::seconds& target) {
    long value = target.count();
    read_field(j, key, value);
    target = std::chrono::seconds(value);
}

void apply_json(WorkerConfig& config, const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    read_field(j, "queue_url", config.queue_url);
    read_field(j, "dead_letter_queue_url", config.dead_letter_queue_url);
    read_field(j, "bucket", config.bucket);
    read_field(j, "region", config.region);
    read_field(j, "aws_cli", config.aws_cli);
    read_field(j, "manifest_path", config.manifest_path);
    read_field(j, "edge_model_path", config.edge_model_path);
    read_field(j, "edge_backend", config.edge_backend);
    read_field(j, "scratch_dir", config.scratch_dir);
    read_field(j, "use_gpu", config.use_gpu);
    read_field(j, "num_threads", config.num_threads);
    read_field(j, "max_memory_mb", config.max_memory_mb);
    read_seconds(j, "poll_wait_seconds", config.poll_wait);
    read_seconds(j, "visibility_timeout_seconds", config.visibility_timeout);
    read_seconds(j, "visibility_extend_interval_seconds", config.visibility_extend_interval);
    read_seconds(j, "max_job_seconds", config.max_job_duration);
    read_field(j, "max_receive_count", config.max_receive_count);
    read_field(j, "max_consecutive_poll_failures", config.max_consecutive_poll_failures);
    read_field(j, "delete_source_on_success", config.delete_source_on_success);
    read_field(j, "storage_retry_attempts", config.storage_retry_attempts);
    long base_delay_ms = config.storage_retry_base_delay.count();
    read_field(j, "storage_retry_base_delay_ms", base_delay_ms);
    config.storage_retry_base_delay = std::chrono::milliseconds(base_delay_ms);
    read_field(j, "encoder", config.encoder);
    read_field(j, "ffmpeg_path", config.ffmpeg_path);
    read_field(j, "output_quality", config.output_quality);
}

} // namespace

void apply_environment(WorkerConfig& config) {
    if (auto v = env("QUEUE_URL")) config.queue_url = v;
    if (auto v = env("DEAD_LETTER_QUEUE_URL")) config.dead_letter_queue_url = v;
    if (auto v = env("BUCKET_NAME")) config.bucket = v;
    if (auto v = env("AWS_REGION")) config.region = v;
    if (auto v = env("MANIFEST_PATH")) config.manifest_path = v;
    if (auto v = env("EDGE_MODEL_PATH")) config.edge_model_path = v;
    if (auto v = env("EDGE_BACKEND")) config.edge_backend = v;
    if (auto v = env("SCRATCH_DIR")) config.scratch_dir = v;
    if (auto v = env("USE_GPU")) config.use_gpu = parse_bool("USE_GPU", v);
    if (auto v = env("NUM_THREADS")) config.num_threads = static_cast<int>(parse_long("NUM_THREADS", v));
    if (auto v = env("MAX_MEMORY_MB")) {
        long mb = parse_long("MAX_MEMORY_MB", v);
        if (mb <= 0) throw ConfigError("MAX_MEMORY_MB must be positive");
        config.max_memory_mb = static_cast<size_t>(mb);
    }
    if (auto v = env("MAX_RECEIVE_COUNT")) {
        config.max_receive_count = static_cast<int>(parse_long("MAX_RECEIVE_COUNT", v));
    }
    if (auto v = env("VISIBILITY_TIMEOUT")) {
        config.visibility_timeout = std::chrono::seconds(parse_long("VISIBILITY_TIMEOUT", v));
    }
    if (auto v = env("MAX_JOB_SECONDS")) {
        config.max_job_duration = std::chrono::seconds(parse_long("MAX_JOB_SECONDS", v));
    }
    if (auto v = env("ENCODER")) config.encoder = v;
    if (auto v = env("OUTPUT_QUALITY")) config.output_quality = v;
}

void validate_config(const WorkerConfig& config) {
    if (config.edge_backend != "hed" && config.edge_backend != "gradient") {
        throw ConfigError("edge_backend must be 'hed' or 'gradient', got '" + config.edge_backend + "'");
    }
    if (config.encoder != "ffmpeg" && config.encoder != "opencv") {
        throw ConfigError("encoder must be 'ffmpeg' or 'opencv', got '" + config.encoder + "'");
    }
    if (config.output_quality != "high" && config.output_quality != "medium" &&
        config.output_quality != "low") {
        throw ConfigError("output_quality must be high, medium or low");
    }
    if (config.num_threads <= 0) {
        throw ConfigError("num_threads must be positive");
    }
    if (config.max_memory_mb == 0) {
        throw ConfigError("max_memory_mb must be positive");
    }
    if (config.max_receive_count < 1) {
        throw ConfigError("max_receive_count must be at least 1");
    }
    // SQS caps long polling at 20 seconds.
    if (config.poll_wait.count() < 0 || config.poll_wait.count() > 20) {
        throw ConfigError("poll_wait_seconds must be within [0, 20]");
    }
    if (config.visibility_timeout.count() <= 0) {
        throw ConfigError("visibility_timeout_seconds must be positive");
    }
    if (config.visibility_extend_interval.count() <= 0 ||
        config.visibility_extend_interval >= config.visibility_timeout) {
        throw ConfigError("visibility_extend_interval_seconds must be positive and shorter than the visibility timeout");
    }
    if (config.max_job_duration.count() <= 0) {
        throw ConfigError("max_job_seconds must be positive");
    }
    if (config.storage_retry_attempts < 1) {
        throw ConfigError("storage_retry_attempts must be at least 1");
    }
    if (config.scratch_dir.empty()) {
        throw ConfigError("scratch_dir must not be empty");
    }
}

WorkerConfig load_worker_config(const std::string& json_path) {
    WorkerConfig config;

    if (!json_path.empty()) {
        std::ifstream file(json_path);
        if (!file.good()) {
            throw ConfigError("Cannot open config file: " + json_path);
        }

        json j;
        try {
            file >> j;
        } catch (const json::parse_error& e) {
            throw ConfigError("Malformed config file " + json_path + ": " + e.what());
        }

        apply_json(config, j);
        std::cout << "Loaded configuration from " << json_path << std::endl;
    }

    apply_environment(config);
    validate_config(config);
    return config;
}

} // namespace roto
