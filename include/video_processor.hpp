#pragma once

#include "deadline.hpp"
#include "edge_estimator.hpp"
#include "effect_registry.hpp"
#include "media_io.hpp"
#include "memory_budget.hpp"
#include <opencv2/opencv.hpp>
#include <memory>
#include <string>

namespace roto {

struct EffectResult {
    std::string effect_id;
    int64_t frames = -1;  // -1 when the effect ran outside the worker (filter graph)
    cv::Size frame_size;
    double elapsed_seconds = 0.0;
};

// Runs one resolved effect over a local input file.
class VideoProcessor {
public:
    VideoProcessor(std::shared_ptr<EdgeEstimator> edge_estimator, MemoryBudget& budget,
                   const EncoderOptions& encoder);
    ~VideoProcessor();

    EffectResult apply(const EffectDescriptor& effect, const ValidatedParams& params,
                       const std::string& input_path, const std::string& output_path,
                       const Deadline& deadline = Deadline());

    // Replaces `{name}` placeholders with validated values.
    static std::string substitute_params(const std::string& filter_graph, const ValidatedParams& params);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace roto
