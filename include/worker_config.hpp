#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>
#include <thread>

namespace roto {

// Process-wide settings, enumerated once at startup and never re-read.
struct WorkerConfig {
    // Queue / storage
    std::string queue_url;
    std::string dead_letter_queue_url;
    std::string bucket;
    std::string region = "us-east-1";
    std::string aws_cli = "aws";

    // Effects and model
    std::string manifest_path = "config/manifest.json";
    std::string edge_model_path = "models/hed.onnx";
    std::string edge_backend = "hed";  // hed, gradient

    // Resources
    std::string scratch_dir = "/tmp/roto-worker";
    bool use_gpu = true;
    int num_threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    size_t max_memory_mb = 4096;

    // Job consumer
    std::chrono::seconds poll_wait{20};
    std::chrono::seconds visibility_timeout{600};
    std::chrono::seconds visibility_extend_interval{120};
    std::chrono::seconds max_job_duration{3600};
    int max_receive_count = 3;
    int max_consecutive_poll_failures = 10;
    bool delete_source_on_success = true;

    // Storage retries
    int storage_retry_attempts = 4;
    std::chrono::milliseconds storage_retry_base_delay{500};

    // Encoding
    std::string encoder = "ffmpeg";  // ffmpeg, opencv
    std::string ffmpeg_path = "ffmpeg";
    std::string output_quality = "high";  // high, medium, low
};

// Defaults, then the JSON file (when path is non-empty), then environment.
// Throws ConfigError on unreadable/malformed input or invalid values.
WorkerConfig load_worker_config(const std::string& json_path = "");

// Overlay environment variables onto an existing config.
void apply_environment(WorkerConfig& config);

// Throws ConfigError describing the first invalid field.
void validate_config(const WorkerConfig& config);

} // namespace roto
