#pragma once

#include "color_quantizer.hpp"
#include "deadline.hpp"
#include "edge_estimator.hpp"
#include "memory_budget.hpp"
#include "retry.hpp"
#include <opencv2/opencv.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace roto {

class ValidatedParams;

struct Frame {
    cv::Mat image;      // CV_8UC3 BGR
    int64_t index = 0;  // contiguous from 0
};

// Produces frames in index order.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual std::optional<Frame> next() = 0;
    virtual double fps() const = 0;
    virtual cv::Size frame_size() const = 0;
    // -1 when unknown
    virtual int64_t frame_count_hint() const { return -1; }
};

// Consumes frames in index order.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual void write(const Frame& frame) = 0;
    virtual void finish() = 0;
};

class VectorFrameSource : public FrameSource {
public:
    VectorFrameSource(std::vector<cv::Mat> frames, double fps);

    std::optional<Frame> next() override;
    double fps() const override { return fps_; }
    cv::Size frame_size() const override;
    int64_t frame_count_hint() const override { return static_cast<int64_t>(frames_.size()); }

private:
    std::vector<cv::Mat> frames_;
    double fps_;
    size_t position_ = 0;
};

class VectorFrameSink : public FrameSink {
public:
    void write(const Frame& frame) override { frames_.push_back(frame.image.clone()); }
    void finish() override { finished_ = true; }

    const std::vector<cv::Mat>& frames() const { return frames_; }
    bool finished() const { return finished_; }

private:
    std::vector<cv::Mat> frames_;
    bool finished_ = false;
};

struct RotoscopeParams {
    EdgeStyle edges;
    double edge_scale = 1.0;
    bool preserve_black = true;
    int num_colors = 8;
    ColorMethod color_method = ColorMethod::KMeans;
    double smoothing = 0.6;
    double saturation = 1.2;
    double temporal_smoothing = 0.3;

    static RotoscopeParams from(const ValidatedParams& params);

    // Edge inference is skipped entirely when this is false.
    bool edges_enabled() const { return preserve_black && edges.strength > 0.0; }
};

struct PipelineStats {
    int64_t frames = 0;
    cv::Size frame_size;
    double elapsed_seconds = 0.0;
    bool edges_inferred = false;
};

// Bytes held per frame while stylizing (input, edge maps, colour layer,
// stabilizer state, composite).
size_t estimate_working_set(const cv::Size& frame_size, const RotoscopeParams& params);

// Edge estimation, colour quantization and temporal stabilization, one
// frame at a time. The estimator is shared read-only; all per-video state
// is local to run().
class FramePipeline {
public:
    FramePipeline(std::shared_ptr<EdgeEstimator> estimator, MemoryBudget& budget,
                  RetryPolicy inference_retry = RetryPolicy());

    // Throws CorruptMediaError on an empty, mismatched or out-of-order frame,
    // ResourceExhaustedError when the working set does not fit the budget,
    // JobTimeoutError when the deadline passes between frames.
    PipelineStats run(FrameSource& source, FrameSink& sink, const RotoscopeParams& params,
                      const Deadline& deadline = Deadline());

    std::vector<cv::Mat> run(const std::vector<cv::Mat>& frames, const RotoscopeParams& params);

private:
    cv::Mat composite(const cv::Mat& colour, const cv::Mat& alpha) const;

    std::shared_ptr<EdgeEstimator> estimator_;
    MemoryBudget& budget_;
    RetryPolicy inference_retry_;
};

} // namespace roto
