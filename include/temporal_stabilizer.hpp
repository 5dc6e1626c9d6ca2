#pragma once

#include <opencv2/opencv.hpp>

namespace roto {

// Exponential moving average over the quantized colour layer:
//   state = (1 - w) * frame + w * state
// State lives for one pipeline run; construct a new stabilizer (or call
// reset()) per video. w = 1 freezes the output on the first frame.
class TemporalStabilizer {
public:
    explicit TemporalStabilizer(double weight);

    cv::Mat apply(const cv::Mat& frame);
    void reset();

    bool has_state() const { return !state_.empty(); }
    double weight() const { return weight_; }

private:
    double weight_;
    cv::Mat state_;  // CV_32FC3
};

// Scales the HSV saturation channel; factor 1 returns a copy of the input.
cv::Mat adjust_saturation(const cv::Mat& frame_bgr, double factor);

} // namespace roto
