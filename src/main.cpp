#include "edge_estimator.hpp"
#include "effect_registry.hpp"
#include "errors.hpp"
#include "inference_device.hpp"
#include "job_consumer.hpp"
#include "media_io.hpp"
#include "memory_budget.hpp"
#include "message_queue.hpp"
#include "storage_gateway.hpp"
#include "video_processor.hpp"
#include "worker_config.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) {
    g_stop.store(true);
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " MODE [OPTIONS]\n"
              << "Modes:\n"
              << "  --service            Consume jobs from QUEUE_URL until SIGTERM\n"
              << "  --local DIR          Use DIR as object store, jobs from DIR/requests.jsonl\n"
              << "  --input FILE --output FILE --effect ID [--params JSON]\n"
              << "                       Apply one effect to a local file\n"
              << "  --list-effects       Print the registered effects\n"
              << "  --info FILE          Show video information only\n"
              << "Options:\n"
              << "  --config FILE        JSON worker configuration\n"
              << "  --manifest FILE      Effect manifest (default: config/manifest.json)\n"
              << "  -t, --threads NUM    Number of inference threads (default: auto)\n"
              << "  -m, --memory NUM     Memory limit in MB (default: 4096)\n"
              << "  --cpu                Force CPU inference\n"
              << "  --encoder NAME       ffmpeg or opencv\n"
              << "  -h, --help           Show this help\n";
}

bool needs_edge_model(const roto::EffectRegistry& registry) {
    for (const auto& id : registry.effect_ids()) {
        if (registry.resolve(id).kind() == roto::EffectKind::FramePipeline) {
            return true;
        }
    }
    return false;
}

std::shared_ptr<roto::EdgeEstimator> load_edge_estimator(const roto::WorkerConfig& config,
                                                         const roto::EffectRegistry& registry) {
    if (!needs_edge_model(registry)) {
        return nullptr;
    }
    roto::InferenceDevice device = roto::select_inference_device(config.use_gpu);
    return roto::create_edge_estimator(config, device);
}

roto::RetryPolicy storage_policy(const roto::WorkerConfig& config) {
    roto::RetryPolicy policy;
    policy.max_attempts = config.storage_retry_attempts;
    policy.base_delay = config.storage_retry_base_delay;
    return policy;
}

int run_single(const roto::WorkerConfig& config, const roto::EffectRegistry& registry,
               const std::string& input, const std::string& output,
               const std::string& effect_id, const std::string& params_text) {
    json params = json::object();
    if (!params_text.empty()) {
        try {
            params = json::parse(params_text);
        } catch (const json::parse_error& e) {
            throw roto::ValidationError(std::string("--params is not valid JSON: ") + e.what());
        }
    }

    const roto::EffectDescriptor& effect = registry.resolve(effect_id);
    roto::ValidatedParams validated = registry.validate(effect.id, params);

    std::shared_ptr<roto::EdgeEstimator> estimator;
    if (effect.kind() == roto::EffectKind::FramePipeline) {
        estimator = roto::create_edge_estimator(config, roto::select_inference_device(config.use_gpu));
    }

    roto::MemoryBudget budget(config.max_memory_mb * 1024 * 1024);
    roto::VideoProcessor processor(estimator, budget, roto::EncoderOptions::from(config));
    auto result = processor.apply(effect, validated, input, output,
                                  roto::Deadline(config.max_job_duration));

    json output_json;
    output_json["effect_id"] = result.effect_id;
    output_json["input"] = input;
    output_json["output"] = output;
    output_json["frames"] = result.frames;
    output_json["frame_size"] = {result.frame_size.width, result.frame_size.height};
    output_json["elapsed_seconds"] = result.elapsed_seconds;
    std::cout << output_json.dump(2) << std::endl;
    return 0;
}

int run_service(const roto::WorkerConfig& config, const roto::EffectRegistry& registry) {
    if (config.queue_url.empty()) {
        throw roto::ConfigError("QUEUE_URL is required in service mode");
    }

    roto::MemoryBudget budget(config.max_memory_mb * 1024 * 1024);
    roto::VideoProcessor processor(load_edge_estimator(config, registry), budget,
                                   roto::EncoderOptions::from(config));
    roto::StorageGateway storage(std::make_shared<roto::AwsCliObjectStore>(config.aws_cli, config.region),
                                 storage_policy(config));
    roto::SqsCliQueue queue(config.queue_url, config.aws_cli, config.region);

    std::unique_ptr<roto::SqsCliQueue> dead_letters;
    if (!config.dead_letter_queue_url.empty()) {
        dead_letters = std::make_unique<roto::SqsCliQueue>(config.dead_letter_queue_url, config.aws_cli, config.region);
    } else {
        std::cout << "DEAD_LETTER_QUEUE_URL not set, relying on the queue redrive policy" << std::endl;
    }

    roto::JobConsumer consumer(config, registry, processor, storage, queue, dead_letters.get());
    consumer.run(g_stop);
    return 0;
}

int run_local(roto::WorkerConfig config, const roto::EffectRegistry& registry, const std::string& dir) {
    std::string requests_path = (std::filesystem::path(dir) / "requests.jsonl").string();
    std::ifstream requests(requests_path);
    if (!requests.good()) {
        throw roto::ConfigError("Cannot open " + requests_path);
    }

    config.poll_wait = std::chrono::seconds(0);

    roto::InMemoryQueue queue("local");
    roto::InMemoryQueue dead_letters("local-dlq");
    std::string line;
    while (std::getline(requests, line)) {
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            queue.send(line);
        }
    }

    roto::MemoryBudget budget(config.max_memory_mb * 1024 * 1024);
    roto::VideoProcessor processor(load_edge_estimator(config, registry), budget,
                                   roto::EncoderOptions::from(config));
    roto::StorageGateway storage(std::make_shared<roto::LocalObjectStore>(dir), storage_policy(config));
    roto::JobConsumer consumer(config, registry, processor, storage, queue, &dead_letters);

    json summary = json::array();
    while (!g_stop.load()) {
        roto::JobReport report = consumer.poll_once();
        if (report.outcome == roto::JobOutcome::NoMessage) {
            break;
        }
        json entry;
        entry["message_id"] = report.message_id;
        entry["outcome"] = roto::to_string(report.outcome);
        entry["destination_key"] = report.destination_key;
        if (!report.error.empty()) {
            entry["error"] = report.error;
        }
        summary.push_back(entry);
    }

    std::cout << summary.dump(2) << std::endl;
    return dead_letters.size() == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::string config_path;
    std::string manifest_path;
    std::string input_path;
    std::string output_path;
    std::string effect_id;
    std::string params_text;
    std::string local_dir;
    std::string info_path;
    std::string encoder;
    int threads = 0;
    size_t memory_mb = 0;
    bool force_cpu = false;
    bool service_mode = false;
    bool list_effects = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--config") {
                if (++i < argc) config_path = argv[i];
            } else if (arg == "--manifest") {
                if (++i < argc) manifest_path = argv[i];
            } else if (arg == "--input") {
                if (++i < argc) input_path = argv[i];
            } else if (arg == "--output") {
                if (++i < argc) output_path = argv[i];
            } else if (arg == "--effect") {
                if (++i < argc) effect_id = argv[i];
            } else if (arg == "--params") {
                if (++i < argc) params_text = argv[i];
            } else if (arg == "--local") {
                if (++i < argc) local_dir = argv[i];
            } else if (arg == "--info") {
                if (++i < argc) info_path = argv[i];
            } else if (arg == "--encoder") {
                if (++i < argc) encoder = argv[i];
            } else if (arg == "-t" || arg == "--threads") {
                if (++i < argc) threads = std::stoi(argv[i]);
            } else if (arg == "-m" || arg == "--memory") {
                if (++i < argc) memory_mb = std::stoul(argv[i]);
            } else if (arg == "--cpu") {
                force_cpu = true;
            } else if (arg == "--service") {
                service_mode = true;
            } else if (arg == "--list-effects") {
                list_effects = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Error: Unknown argument " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        if (!info_path.empty()) {
            auto info = roto::probe(info_path);

            json info_json;
            info_json["video_path"] = info_path;
            info_json["total_frames"] = info.total_frames;
            info_json["fps"] = info.fps;
            info_json["duration"] = info.duration;
            info_json["frame_size"] = {info.frame_size.width, info.frame_size.height};
            info_json["codec"] = info.codec;

            std::cout << info_json.dump(2) << std::endl;
            return 0;
        }

        roto::WorkerConfig config = roto::load_worker_config(config_path);
        if (!manifest_path.empty()) config.manifest_path = manifest_path;
        if (!encoder.empty()) config.encoder = encoder;
        if (threads > 0) config.num_threads = threads;
        if (memory_mb > 0) config.max_memory_mb = memory_mb;
        if (force_cpu) config.use_gpu = false;
        roto::validate_config(config);

        roto::EffectRegistry registry = roto::EffectRegistry::load(config.manifest_path);

        if (list_effects) {
            json effects = json::array();
            for (const auto& id : registry.effect_ids()) {
                const auto& effect = registry.resolve(id);
                effects.push_back({{"id", effect.id},
                                   {"version", effect.version},
                                   {"kind", roto::to_string(effect.kind())},
                                   {"description", effect.description}});
            }
            std::cout << effects.dump(2) << std::endl;
            return 0;
        }

        if (!input_path.empty() || !output_path.empty() || !effect_id.empty()) {
            if (input_path.empty() || output_path.empty() || effect_id.empty()) {
                std::cerr << "Error: --input, --output and --effect are required together\n";
                return 1;
            }
            return run_single(config, registry, input_path, output_path, effect_id, params_text);
        }

        if (!local_dir.empty()) {
            return run_local(config, registry, local_dir);
        }

        if (service_mode) {
            return run_service(config, registry);
        }

        print_usage(argv[0]);
        return 1;

    } catch (const roto::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const roto::WorkerError& e) {
        std::cerr << "Error (" << roto::to_string(e.kind()) << "): " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
