#pragma once

#include "deadline.hpp"
#include "frame_pipeline.hpp"
#include "process.hpp"
#include <opencv2/opencv.hpp>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace roto {

struct WorkerConfig;

struct VideoInfo {
    int total_frames = 0;
    double fps = 0.0;
    double duration = 0.0;
    cv::Size frame_size;
    std::string codec;
};

// Throws CorruptMediaError when the file cannot be opened.
VideoInfo probe(const std::string& video_path);

struct EncoderOptions {
    std::string encoder = "ffmpeg";  // ffmpeg, opencv
    std::string ffmpeg_path = "ffmpeg";
    std::string quality = "high";    // high, medium, low
    long time_limit_seconds = 0;     // 0 = unlimited

    static EncoderOptions from(const WorkerConfig& config);

    int crf() const;
    std::string preset() const;
};

class MediaReader : public FrameSource {
public:
    // Throws CorruptMediaError when the file cannot be opened.
    explicit MediaReader(const std::string& video_path);

    std::optional<Frame> next() override;
    double fps() const override { return fps_; }
    cv::Size frame_size() const override { return frame_size_; }
    int64_t frame_count_hint() const override { return frame_count_; }

private:
    std::string path_;
    cv::VideoCapture capture_;
    double fps_ = 0.0;
    cv::Size frame_size_;
    int64_t frame_count_ = -1;
    int64_t next_index_ = 0;
};

// Encodes BGR frames to `output_path`. The output is deleted unless
// finish() succeeds. Encoder failures throw MediaEncodeError.
class MediaWriter : public FrameSink {
public:
    MediaWriter(const std::string& output_path, double fps, const cv::Size& frame_size,
                const EncoderOptions& options);
    ~MediaWriter() override;

    MediaWriter(const MediaWriter&) = delete;
    MediaWriter& operator=(const MediaWriter&) = delete;

    void write(const Frame& frame) override;
    void finish() override;

    int64_t frames_written() const { return frames_written_; }

private:
    void open_ffmpeg();
    void discard();

    std::string output_path_;
    double fps_;
    cv::Size frame_size_;
    EncoderOptions options_;

    FILE* pipe_ = nullptr;
    std::unique_ptr<StderrCapture> stderr_;
    cv::VideoWriter writer_;

    int64_t frames_written_ = 0;
    bool finished_ = false;
};

struct DecodedVideo {
    std::vector<cv::Mat> frames;
    double fps = 0.0;
    cv::Size size;
};

// Whole-sequence helpers for small clips and tests.
DecodedVideo decode(const std::string& video_path);
void encode(const std::vector<cv::Mat>& frames, double fps, const cv::Size& size,
            const std::string& output_path, const EncoderOptions& options);

// Runs `ffmpeg -vf <graph>`. Audio is re-encoded when preserve_audio is set,
// stripped otherwise.
void apply_filter_graph(const std::string& input_path, const std::string& output_path,
                        const std::string& filter_graph, bool preserve_audio,
                        const EncoderOptions& options);

} // namespace roto
