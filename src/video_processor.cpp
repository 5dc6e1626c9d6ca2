#include "video_processor.hpp"
#include "errors.hpp"
#include "frame_pipeline.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <new>
#include <variant>

namespace roto {

class VideoProcessor::Impl {
public:
    Impl(std::shared_ptr<EdgeEstimator> edge_estimator, MemoryBudget& budget,
         const EncoderOptions& encoder)
        : pipeline_(std::move(edge_estimator), budget), encoder_(encoder) {}

    EffectResult run(const std::string& effect_id, const FilterGraphEffect& effect,
                     const ValidatedParams& params, const std::string& input_path,
                     const std::string& output_path, const Deadline& deadline) {
        EncoderOptions options = bounded(deadline);
        std::string graph = substitute_params(effect.filter_graph, params);

        std::cout << "Effect " << effect_id << ": filter graph " << graph << std::endl;
        apply_filter_graph(input_path, output_path, graph, effect.preserve_audio, options);

        EffectResult result;
        result.effect_id = effect_id;
        return result;
    }

    EffectResult run(const std::string& effect_id, const FramePipelineEffect& /*effect*/,
                     const ValidatedParams& params, const std::string& input_path,
                     const std::string& output_path, const Deadline& deadline) {
        RotoscopeParams rotoscope = RotoscopeParams::from(params);

        MediaReader reader(input_path);
        MediaWriter writer(output_path, reader.fps(), reader.frame_size(), bounded(deadline));

        std::cout << "Effect " << effect_id << ": " << reader.frame_size().width << "x"
                  << reader.frame_size().height << " @ " << reader.fps() << " fps, "
                  << to_string(rotoscope.color_method) << " " << rotoscope.num_colors << " colors"
                  << (rotoscope.edges_enabled() ? "" : ", no outlines") << std::endl;

        PipelineStats stats = pipeline_.run(reader, writer, rotoscope, deadline);

        EffectResult result;
        result.effect_id = effect_id;
        result.frames = stats.frames;
        result.frame_size = stats.frame_size;
        return result;
    }

private:
    EncoderOptions bounded(const Deadline& deadline) const {
        EncoderOptions options = encoder_;
        if (deadline.bounded()) {
            options.time_limit_seconds = std::max<long>(1, static_cast<long>(deadline.remaining().count()));
        }
        return options;
    }

    FramePipeline pipeline_;
    EncoderOptions encoder_;
};

VideoProcessor::VideoProcessor(std::shared_ptr<EdgeEstimator> edge_estimator, MemoryBudget& budget,
                               const EncoderOptions& encoder)
    : pimpl_(std::make_unique<Impl>(std::move(edge_estimator), budget, encoder)) {}

VideoProcessor::~VideoProcessor() = default;

EffectResult VideoProcessor::apply(const EffectDescriptor& effect, const ValidatedParams& params,
                                   const std::string& input_path, const std::string& output_path,
                                   const Deadline& deadline) {
    auto start_time = std::chrono::high_resolution_clock::now();
    deadline.check("effect start");

    EffectResult result;
    try {
        result = std::visit([&](const auto& impl) {
            return pimpl_->run(effect.id, impl, params, input_path, output_path, deadline);
        }, effect.implementation);
    } catch (const cv::Exception& e) {
        // Decode and encode failures are already translated by media_io.
        if (e.code == cv::Error::StsNoMem) {
            throw ResourceExhaustedError("Out of memory applying " + effect.id + " to " + input_path +
                                         ": " + e.what());
        }
        throw ProcessingError("OpenCV failed applying " + effect.id + " to " + input_path + ": " + e.what());
    } catch (const std::bad_alloc&) {
        throw ResourceExhaustedError("Out of memory applying " + effect.id + " to " + input_path);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.elapsed_seconds = std::chrono::duration<double>(end_time - start_time).count();

    std::cout << "Effect " << effect.id << " finished in " << result.elapsed_seconds << "s";
    if (result.frames >= 0) {
        std::cout << " (" << result.frames << " frames)";
    }
    std::cout << std::endl;
    return result;
}

std::string VideoProcessor::substitute_params(const std::string& filter_graph, const ValidatedParams& params) {
    std::string out;
    size_t pos = 0;
    while (pos < filter_graph.size()) {
        size_t open = filter_graph.find('{', pos);
        size_t close = open == std::string::npos ? std::string::npos : filter_graph.find('}', open + 1);
        if (close == std::string::npos) {
            out.append(filter_graph, pos, std::string::npos);
            break;
        }
        std::string name = filter_graph.substr(open + 1, close - open - 1);
        if (!params.contains(name)) {
            throw ValidationError("Filter graph references unknown parameter '" + name + "'");
        }
        out.append(filter_graph, pos, open - pos);
        out += params.format(name);
        pos = close + 1;
    }
    return out;
}

} // namespace roto
