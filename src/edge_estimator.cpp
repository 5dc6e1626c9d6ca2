#include "edge_estimator.hpp"
#include "errors.hpp"
#include "worker_config.hpp"
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <vector>

namespace roto {

namespace {

// BGR channel means the HED weights were trained with.
const float kHedMean[3] = {104.00698793f, 116.66876762f, 122.67891434f};

cv::Size scaled_size(const cv::Size& size, double scale) {
    scale = std::clamp(scale, 0.05, 1.0);
    return cv::Size(std::max(1, static_cast<int>(std::lround(size.width * scale))),
                    std::max(1, static_cast<int>(std::lround(size.height * scale))));
}

bool looks_like_oom(const std::string& message) {
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("out of memory") != std::string::npos ||
           lower.find("failed to allocate") != std::string::npos ||
           lower.find("bad_alloc") != std::string::npos;
}

} // namespace

class HedEdgeEstimator::Impl {
public:
    Impl(const std::string& model_path, const InferenceDevice& device, int num_threads)
        : device_(device) {
        if (!std::filesystem::exists(model_path)) {
            throw ConfigError("Edge model not found: " + model_path);
        }

        try {
            env_ = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "roto-hed");

            Ort::SessionOptions session_options;
            session_options.SetIntraOpNumThreads(num_threads);
            session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

            if (device_.kind == DeviceKind::CUDA) {
                OrtCUDAProviderOptions cuda_options{};
                cuda_options.device_id = device_.index;
                session_options.AppendExecutionProvider_CUDA(cuda_options);
            }

            session_ = std::make_unique<Ort::Session>(*env_, model_path.c_str(), session_options);
            read_model_info();
        } catch (const Ort::Exception& e) {
            throw ConfigError("Failed to load edge model " + model_path + ": " + e.what());
        }

        std::cout << "Loaded HED edge model from " << model_path << " on " << device_.name << std::endl;
    }

    cv::Mat estimate(const cv::Mat& frame, double scale) {
        cv::Size input_size = fixed_input_size_.area() > 0 ? fixed_input_size_
                                                          : scaled_size(frame.size(), scale);

        cv::Mat resized;
        if (input_size != frame.size()) {
            cv::resize(frame, resized, input_size, 0, 0, cv::INTER_AREA);
        } else {
            resized = frame;
        }

        // HWC uint8 BGR -> NCHW float, mean subtracted.
        const int h = input_size.height;
        const int w = input_size.width;
        input_buffer_.resize(static_cast<size_t>(3) * h * w);
        cv::Mat as_float;
        resized.convertTo(as_float, CV_32FC3);
        std::vector<cv::Mat> planes(3);
        for (int c = 0; c < 3; ++c) {
            planes[c] = cv::Mat(h, w, CV_32FC1, input_buffer_.data() + static_cast<size_t>(c) * h * w);
        }
        cv::split(as_float, planes);
        for (int c = 0; c < 3; ++c) {
            planes[c] -= kHedMean[c];
        }

        std::vector<int64_t> dims = {1, 3, h, w};
        Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

        try {
            Ort::Value input = Ort::Value::CreateTensor<float>(
                memory_info, input_buffer_.data(), input_buffer_.size(), dims.data(), dims.size());

            auto outputs = session_->Run(Ort::RunOptions{nullptr},
                                         input_name_ptrs_.data(), &input, 1,
                                         output_name_ptrs_.data(), output_name_ptrs_.size());

            // The fused side output is the last one.
            Ort::Value& fused = outputs.back();
            auto shape = fused.GetTensorTypeAndShapeInfo().GetShape();
            if (shape.size() != 4 || shape[1] != 1) {
                throw std::runtime_error("unexpected HED output rank");
            }
            cv::Mat edges(static_cast<int>(shape[2]), static_cast<int>(shape[3]), CV_32FC1,
                          fused.GetTensorMutableData<float>());

            cv::Mat result;
            cv::resize(edges, result, frame.size(), 0, 0, cv::INTER_LINEAR);
            cv::min(cv::max(result, 0.0), 1.0, result);
            return result;
        } catch (const Ort::Exception& e) {
            if (looks_like_oom(e.what())) {
                throw ResourceExhaustedError("Edge inference ran out of memory on " + device_.name +
                                             " at " + std::to_string(w) + "x" + std::to_string(h) +
                                             ": " + e.what());
            }
            throw TransientError(std::string("Edge inference failed: ") + e.what());
        }
    }

    std::string name() const { return "hed@" + device_.name; }

private:
    void read_model_info() {
        Ort::AllocatorWithDefaultOptions allocator;

        if (session_->GetInputCount() != 1) {
            throw ConfigError("HED model must have exactly one input");
        }
        if (session_->GetOutputCount() < 1) {
            throw ConfigError("HED model has no outputs");
        }

        input_names_.emplace_back(session_->GetInputNameAllocated(0, allocator).get());

        auto input_shape = session_->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        if (input_shape.size() != 4 || (input_shape[1] > 0 && input_shape[1] != 3)) {
            throw ConfigError("HED model input must be NCHW with 3 channels");
        }
        if (input_shape[2] > 0 && input_shape[3] > 0) {
            fixed_input_size_ = cv::Size(static_cast<int>(input_shape[3]), static_cast<int>(input_shape[2]));
            std::cout << "HED model has fixed input " << fixed_input_size_.width << "x"
                      << fixed_input_size_.height << std::endl;
        }

        size_t num_outputs = session_->GetOutputCount();
        output_names_.reserve(num_outputs);
        for (size_t i = 0; i < num_outputs; ++i) {
            output_names_.emplace_back(session_->GetOutputNameAllocated(i, allocator).get());
        }

        // Pointers are taken after all strings are stored.
        for (const auto& n : input_names_) input_name_ptrs_.push_back(n.c_str());
        for (const auto& n : output_names_) output_name_ptrs_.push_back(n.c_str());
    }

    InferenceDevice device_;
    std::unique_ptr<Ort::Env> env_;
    std::unique_ptr<Ort::Session> session_;
    std::vector<std::string> input_names_;
    std::vector<std::string> output_names_;
    std::vector<const char*> input_name_ptrs_;
    std::vector<const char*> output_name_ptrs_;
    cv::Size fixed_input_size_;
    std::vector<float> input_buffer_;
};

HedEdgeEstimator::HedEdgeEstimator(const std::string& model_path, const InferenceDevice& device,
                                   int num_threads)
    : pimpl_(std::make_unique<Impl>(model_path, device, num_threads)) {}

HedEdgeEstimator::~HedEdgeEstimator() = default;

cv::Mat HedEdgeEstimator::estimate(const cv::Mat& frame_bgr, double scale) {
    return pimpl_->estimate(frame_bgr, scale);
}

std::string HedEdgeEstimator::name() const {
    return pimpl_->name();
}

cv::Mat GradientEdgeEstimator::estimate(const cv::Mat& frame_bgr, double scale) {
    cv::Mat small;
    cv::Size work_size = scaled_size(frame_bgr.size(), scale);
    if (work_size != frame_bgr.size()) {
        cv::resize(frame_bgr, small, work_size, 0, 0, cv::INTER_AREA);
    } else {
        small = frame_bgr;
    }

    cv::Mat gray, dx, dy, magnitude;
    cv::cvtColor(small, gray, cv::COLOR_BGR2GRAY);
    cv::GaussianBlur(gray, gray, cv::Size(3, 3), 0);
    cv::Sobel(gray, dx, CV_32F, 1, 0, 3);
    cv::Sobel(gray, dy, CV_32F, 0, 1, 3);
    cv::magnitude(dx, dy, magnitude);

    double max_value = 0.0;
    cv::minMaxLoc(magnitude, nullptr, &max_value);
    if (max_value > 1e-6) {
        magnitude /= max_value;
    } else {
        magnitude.setTo(0.0f);
    }

    if (magnitude.size() != frame_bgr.size()) {
        cv::Mat upsampled;
        cv::resize(magnitude, upsampled, frame_bgr.size(), 0, 0, cv::INTER_LINEAR);
        return upsampled;
    }
    return magnitude;
}

std::shared_ptr<EdgeEstimator> create_edge_estimator(const WorkerConfig& config,
                                                     const InferenceDevice& device) {
    if (config.edge_backend == "gradient") {
        std::cout << "Using gradient edge estimator (no model)" << std::endl;
        return std::make_shared<GradientEdgeEstimator>();
    }
    if (config.edge_backend == "hed") {
        return std::make_shared<HedEdgeEstimator>(config.edge_model_path, device, config.num_threads);
    }
    throw ConfigError("Unknown edge backend: " + config.edge_backend);
}

cv::Mat edge_alpha_mask(const cv::Mat& edges, const EdgeStyle& style) {
    cv::Mat mask;
    cv::threshold(edges, mask, style.threshold, 1.0, cv::THRESH_BINARY);

    int radius = static_cast<int>(std::lround(std::max(0.0, style.thickness)));
    if (radius > 0) {
        cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE,
                                                   cv::Size(2 * radius + 1, 2 * radius + 1));
        cv::dilate(mask, mask, kernel);
    }

    mask *= std::clamp(style.strength, 0.0, 1.0);
    return mask;
}

} // namespace roto
