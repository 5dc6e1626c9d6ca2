#include "frame_pipeline.hpp"
#include "effect_registry.hpp"
#include "errors.hpp"
#include "temporal_stabilizer.hpp"
#include <chrono>
#include <iostream>
#include <new>

namespace roto {

namespace {

const cv::Scalar kOutlineColor(16, 16, 16);

std::string describe(const cv::Size& size, int64_t frame_count) {
    std::string text = std::to_string(size.width) + "x" + std::to_string(size.height);
    if (frame_count >= 0) {
        text += ", " + std::to_string(frame_count) + " frames";
    }
    return text;
}

std::string out_of_memory(int64_t index, const cv::Size& size, int64_t frame_count) {
    return "Out of memory at frame " + std::to_string(index) + " (" + describe(size, frame_count) + ")";
}

} // namespace

VectorFrameSource::VectorFrameSource(std::vector<cv::Mat> frames, double fps)
    : frames_(std::move(frames)), fps_(fps) {}

std::optional<Frame> VectorFrameSource::next() {
    if (position_ >= frames_.size()) {
        return std::nullopt;
    }
    Frame frame;
    frame.image = frames_[position_];
    frame.index = static_cast<int64_t>(position_);
    ++position_;
    return frame;
}

cv::Size VectorFrameSource::frame_size() const {
    return frames_.empty() ? cv::Size() : frames_.front().size();
}

RotoscopeParams RotoscopeParams::from(const ValidatedParams& params) {
    RotoscopeParams p;
    p.edges.strength = params.get_double("edge_strength");
    p.edges.thickness = params.get_double("edge_thickness");
    p.edges.threshold = params.get_double("edge_threshold");
    p.edge_scale = params.get_double("edge_scale");
    p.preserve_black = params.get_bool("preserve_black");
    p.num_colors = static_cast<int>(params.get_int("num_colors"));
    p.color_method = parse_color_method(params.get_string("color_method"));
    p.smoothing = params.get_double("smoothing");
    p.saturation = params.get_double("saturation");
    p.temporal_smoothing = params.get_double("temporal_smoothing");
    return p;
}

size_t estimate_working_set(const cv::Size& frame_size, const RotoscopeParams& params) {
    const size_t pixels = static_cast<size_t>(frame_size.width) * static_cast<size_t>(frame_size.height);

    size_t bytes = pixels * 3;       // decoded frame
    bytes += pixels * 3 * 2;         // smoothed + quantized layer
    bytes += pixels * 3 * 4;         // stabilizer state (float)
    bytes += pixels * 3 * 2;         // saturation pass + output
    if (params.edges_enabled()) {
        bytes += pixels * 4 * 2;     // edge map + alpha mask
        bytes += pixels * 3 * 4 * 2; // float composite
    }
    return bytes;
}

FramePipeline::FramePipeline(std::shared_ptr<EdgeEstimator> estimator, MemoryBudget& budget,
                             RetryPolicy inference_retry)
    : estimator_(std::move(estimator)), budget_(budget), inference_retry_(inference_retry) {}

PipelineStats FramePipeline::run(FrameSource& source, FrameSink& sink, const RotoscopeParams& params,
                                 const Deadline& deadline) {
    auto start_time = std::chrono::high_resolution_clock::now();

    if (params.edges_enabled() && !estimator_) {
        throw ConfigError("Edge estimator required when outlines are enabled");
    }

    ColorQuantizer quantizer(params.color_method, params.num_colors, params.smoothing);
    TemporalStabilizer stabilizer(params.temporal_smoothing);

    PipelineStats stats;
    stats.edges_inferred = params.edges_enabled();
    std::optional<MemoryBudget::Reservation> reservation;
    int64_t expected_index = 0;

    while (true) {
        deadline.check("frame processing");

        std::optional<Frame> frame = source.next();
        if (!frame) {
            break;
        }

        if (frame->image.empty()) {
            throw CorruptMediaError("Empty frame at index " + std::to_string(frame->index));
        }
        if (frame->index != expected_index) {
            throw CorruptMediaError("Frame index " + std::to_string(frame->index) +
                                    " out of order, expected " + std::to_string(expected_index));
        }
        if (frame->image.type() != CV_8UC3) {
            throw CorruptMediaError("Frame " + std::to_string(frame->index) + " is not 8-bit BGR");
        }

        if (!reservation) {
            stats.frame_size = frame->image.size();
            reservation.emplace(budget_.reserve("frame_pipeline",
                                                estimate_working_set(stats.frame_size, params),
                                                describe(stats.frame_size, source.frame_count_hint())));
        } else if (frame->image.size() != stats.frame_size) {
            throw CorruptMediaError("Frame " + std::to_string(frame->index) + " is " +
                                    describe(frame->image.size(), -1) + ", expected " +
                                    describe(stats.frame_size, -1));
        }

        try {
            QuantizedFrame quantized = quantizer.quantize(frame->image);
            cv::Mat colour = adjust_saturation(stabilizer.apply(quantized.image), params.saturation);

            Frame out;
            out.index = frame->index;
            if (params.edges_enabled()) {
                cv::Mat edges = with_retry(inference_retry_, "Edge inference", deadline, [&]() {
                    return estimator_->estimate(frame->image, params.edge_scale);
                });
                out.image = composite(colour, edge_alpha_mask(edges, params.edges));
            } else {
                out.image = colour;
            }

            sink.write(out);
        } catch (const std::bad_alloc&) {
            throw ResourceExhaustedError(out_of_memory(frame->index, stats.frame_size,
                                                       source.frame_count_hint()));
        } catch (const cv::Exception& e) {
            if (e.code == cv::Error::StsNoMem) {
                throw ResourceExhaustedError(out_of_memory(frame->index, stats.frame_size,
                                                           source.frame_count_hint()));
            }
            throw;
        }
        ++expected_index;
        ++stats.frames;

        if (stats.frames % 100 == 0) {
            std::cout << "Stylized " << stats.frames << " frames" << std::endl;
        }
    }

    if (stats.frames == 0) {
        throw CorruptMediaError("No decodable frames");
    }

    sink.finish();

    auto end_time = std::chrono::high_resolution_clock::now();
    stats.elapsed_seconds = std::chrono::duration<double>(end_time - start_time).count();
    return stats;
}

std::vector<cv::Mat> FramePipeline::run(const std::vector<cv::Mat>& frames, const RotoscopeParams& params) {
    VectorFrameSource source(frames, 30.0);
    VectorFrameSink sink;
    run(source, sink, params);
    return sink.frames();
}

cv::Mat FramePipeline::composite(const cv::Mat& colour, const cv::Mat& alpha) const {
    if (cv::countNonZero(alpha) == 0) {
        return colour;
    }

    cv::Mat colour_f, alpha3;
    colour.convertTo(colour_f, CV_32FC3);
    cv::Mat planes[] = {alpha, alpha, alpha};
    cv::merge(planes, 3, alpha3);

    cv::Mat outline(colour.size(), CV_32FC3, kOutlineColor);
    cv::Mat inverse = cv::Scalar::all(1.0) - alpha3;
    cv::Mat blended = colour_f.mul(inverse) + outline.mul(alpha3);

    cv::Mat out;
    blended.convertTo(out, CV_8UC3);
    return out;
}

} // namespace roto
