#pragma once

#include "inference_device.hpp"
#include <opencv2/opencv.hpp>
#include <memory>
#include <string>

namespace roto {

struct WorkerConfig;

class EdgeEstimator {
public:
    virtual ~EdgeEstimator() = default;

    // Single-channel CV_32F edge strength in [0, 1] at the frame's size.
    // `scale` in (0, 1] runs inference on a downscaled copy; the result is
    // upsampled back with bilinear interpolation.
    virtual cv::Mat estimate(const cv::Mat& frame_bgr, double scale) = 0;

    virtual std::string name() const = 0;
};

// Holistically-nested edge detection network exported to ONNX.
// The model is loaded once and shared read-only across jobs.
class HedEdgeEstimator : public EdgeEstimator {
public:
    // Throws ConfigError when the model cannot be loaded.
    HedEdgeEstimator(const std::string& model_path, const InferenceDevice& device, int num_threads);
    ~HedEdgeEstimator() override;

    cv::Mat estimate(const cv::Mat& frame_bgr, double scale) override;
    std::string name() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

// Sobel gradient magnitude; needs no model.
class GradientEdgeEstimator : public EdgeEstimator {
public:
    cv::Mat estimate(const cv::Mat& frame_bgr, double scale) override;
    std::string name() const override { return "gradient"; }
};

// Builds the estimator named by config.edge_backend. Startup-fatal errors
// surface as ConfigError.
std::shared_ptr<EdgeEstimator> create_edge_estimator(const WorkerConfig& config,
                                                     const InferenceDevice& device);

struct EdgeStyle {
    double strength = 0.8;   // outline alpha
    double thickness = 1.5;  // dilation radius in pixels, rounded
    double threshold = 0.3;  // edge strength cut-off
};

// Thresholds and dilates an edge map into an outline alpha mask (CV_32F,
// values 0 or `strength`).
cv::Mat edge_alpha_mask(const cv::Mat& edges, const EdgeStyle& style);

} // namespace roto
