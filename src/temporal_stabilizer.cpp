#include "temporal_stabilizer.hpp"
#include "errors.hpp"
#include <algorithm>

namespace roto {

TemporalStabilizer::TemporalStabilizer(double weight)
    : weight_(std::clamp(weight, 0.0, 1.0)) {}

cv::Mat TemporalStabilizer::apply(const cv::Mat& frame) {
    if (weight_ <= 0.0) {
        // Pure passthrough, no float round trip.
        return frame.clone();
    }

    cv::Mat current;
    frame.convertTo(current, CV_32FC3);

    if (state_.empty()) {
        state_ = current;
    } else {
        if (state_.size() != current.size()) {
            throw CorruptMediaError("Frame size changed mid-stream");
        }
        cv::addWeighted(current, 1.0 - weight_, state_, weight_, 0.0, state_);
    }

    cv::Mat out;
    state_.convertTo(out, CV_8UC3);
    return out;
}

void TemporalStabilizer::reset() {
    state_.release();
}

cv::Mat adjust_saturation(const cv::Mat& frame_bgr, double factor) {
    if (factor == 1.0) {
        return frame_bgr.clone();
    }

    cv::Mat hsv;
    cv::cvtColor(frame_bgr, hsv, cv::COLOR_BGR2HSV);
    std::vector<cv::Mat> channels;
    cv::split(hsv, channels);
    channels[1].convertTo(channels[1], CV_8U, std::max(0.0, factor));
    cv::merge(channels, hsv);

    cv::Mat out;
    cv::cvtColor(hsv, out, cv::COLOR_HSV2BGR);
    return out;
}

} // namespace roto
