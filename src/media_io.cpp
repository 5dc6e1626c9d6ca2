#include "media_io.hpp"
#include "errors.hpp"
#include "worker_config.hpp"
#include <cmath>
#include <filesystem>
#include <iostream>
#include <sys/wait.h>

namespace roto {

namespace {

constexpr double kFallbackFps = 30.0;

// Containers without a frame index report a count estimated from the
// duration, which can overshoot by one.
constexpr int64_t kFrameCountSlack = 1;

std::string fourcc_to_string(int fourcc) {
    char codec_chars[5];
    codec_chars[0] = fourcc & 0xFF;
    codec_chars[1] = (fourcc >> 8) & 0xFF;
    codec_chars[2] = (fourcc >> 16) & 0xFF;
    codec_chars[3] = (fourcc >> 24) & 0xFF;
    codec_chars[4] = '\0';
    return std::string(codec_chars);
}

double usable_fps(double fps) {
    return (std::isfinite(fps) && fps > 0.0) ? fps : kFallbackFps;
}

void remove_quietly(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

int decode_status(int status) {
    if (status == -1) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

std::string last_line(const std::string& text) {
    size_t end = text.find_last_not_of("\r\n ");
    if (end == std::string::npos) return "";
    size_t newline = text.find_last_of('\n', end);
    size_t start = newline == std::string::npos ? 0 : newline + 1;
    return text.substr(start, end - start + 1);
}

} // namespace

VideoInfo probe(const std::string& video_path) {
    cv::VideoCapture cap(video_path);
    if (!cap.isOpened()) {
        throw CorruptMediaError("Cannot open video file: " + video_path);
    }

    VideoInfo info;
    info.total_frames = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_COUNT));
    info.fps = cap.get(cv::CAP_PROP_FPS);
    info.duration = info.fps > 0.0 ? info.total_frames / info.fps : 0.0;
    info.frame_size = cv::Size(
        static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
        static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT))
    );
    info.codec = fourcc_to_string(static_cast<int>(cap.get(cv::CAP_PROP_FOURCC)));

    return info;
}

EncoderOptions EncoderOptions::from(const WorkerConfig& config) {
    EncoderOptions options;
    options.encoder = config.encoder;
    options.ffmpeg_path = config.ffmpeg_path;
    options.quality = config.output_quality;
    return options;
}

int EncoderOptions::crf() const {
    if (quality == "low") return 28;
    if (quality == "medium") return 23;
    return 18;
}

std::string EncoderOptions::preset() const {
    if (quality == "low") return "faster";
    if (quality == "medium") return "medium";
    return "slow";
}

MediaReader::MediaReader(const std::string& video_path) : path_(video_path) {
    bool opened = false;
    try {
        opened = capture_.open(video_path);
    } catch (const cv::Exception& e) {
        throw CorruptMediaError("Cannot open video file " + video_path + ": " + e.what());
    }
    if (!opened) {
        throw CorruptMediaError("Cannot open video file: " + video_path);
    }
    fps_ = usable_fps(capture_.get(cv::CAP_PROP_FPS));
    frame_size_ = cv::Size(static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_WIDTH)),
                           static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT)));
    double count = capture_.get(cv::CAP_PROP_FRAME_COUNT);
    frame_count_ = count > 0 ? static_cast<int64_t>(count) : -1;
}

std::optional<Frame> MediaReader::next() {
    Frame frame;
    try {
        if (!capture_.read(frame.image) || frame.image.empty()) {
            if (frame_count_ > 0 && next_index_ + kFrameCountSlack < frame_count_) {
                throw CorruptMediaError("Decoding " + path_ + " ended at frame " +
                                        std::to_string(next_index_) + " of " +
                                        std::to_string(frame_count_));
            }
            return std::nullopt;
        }
    } catch (const cv::Exception& e) {
        throw CorruptMediaError("Decoding " + path_ + " failed at frame " +
                                std::to_string(next_index_) + ": " + e.what());
    }
    frame.index = next_index_++;
    return frame;
}

MediaWriter::MediaWriter(const std::string& output_path, double fps, const cv::Size& frame_size,
                         const EncoderOptions& options)
    : output_path_(output_path), fps_(usable_fps(fps)), frame_size_(frame_size), options_(options) {
    if (frame_size_.width <= 0 || frame_size_.height <= 0) {
        throw MediaEncodeError("Invalid output frame size");
    }

    if (options_.encoder == "opencv") {
        int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');
        bool opened = false;
        try {
            opened = writer_.open(output_path_, cv::CAP_OPENCV_MJPEG, fourcc, fps_, frame_size_);
        } catch (const cv::Exception& e) {
            throw MediaEncodeError("MJPEG writer for " + output_path_ + " failed: " + e.what());
        }
        if (!opened) {
            throw MediaEncodeError("Could not open MJPEG writer for " + output_path_);
        }
    } else if (options_.encoder == "ffmpeg") {
        open_ffmpeg();
    } else {
        throw ConfigError("Unknown encoder: " + options_.encoder);
    }
}

MediaWriter::~MediaWriter() {
    if (!finished_) {
        discard();
    }
}

void MediaWriter::open_ffmpeg() {
    std::vector<std::string> argv = {
        options_.ffmpeg_path, "-y", "-nostdin", "-loglevel", "error",
        "-f", "rawvideo", "-pix_fmt", "bgr24",
        "-s", std::to_string(frame_size_.width) + "x" + std::to_string(frame_size_.height),
        "-r", std::to_string(fps_),
        "-i", "-",
        "-an",
        "-c:v", "libx264",
        "-preset", options_.preset(),
        "-crf", std::to_string(options_.crf()),
        // 4:2:0 needs even dimensions
        "-pix_fmt", (frame_size_.width % 2 == 0 && frame_size_.height % 2 == 0) ? "yuv420p" : "yuv444p",
        "-movflags", "+faststart",
        output_path_
    };

    stderr_ = std::make_unique<StderrCapture>();
    std::string command = with_time_limit(join_command(argv), options_.time_limit_seconds) +
                          " >/dev/null" + stderr_->redirect();

    pipe_ = popen(command.c_str(), "w");
    if (!pipe_) {
        throw MediaEncodeError("Could not start encoder: " + options_.ffmpeg_path);
    }
}

void MediaWriter::write(const Frame& frame) {
    if (finished_) {
        throw MediaEncodeError("Write after finish on " + output_path_);
    }
    if (frame.image.size() != frame_size_ || frame.image.type() != CV_8UC3) {
        throw MediaEncodeError("Frame " + std::to_string(frame.index) +
                               " does not match the output format");
    }

    if (writer_.isOpened()) {
        try {
            writer_.write(frame.image);
        } catch (const cv::Exception& e) {
            throw MediaEncodeError("Encoding frame " + std::to_string(frame.index) + " to " +
                                   output_path_ + " failed: " + e.what());
        }
    } else {
        const size_t row_bytes = static_cast<size_t>(frame_size_.width) * 3;
        for (int y = 0; y < frame.image.rows; ++y) {
            if (fwrite(frame.image.ptr(y), 1, row_bytes, pipe_) != row_bytes) {
                throw MediaEncodeError("Encoder stopped accepting frames at frame " +
                                       std::to_string(frame.index) + " for " + output_path_);
            }
        }
    }
    ++frames_written_;
}

void MediaWriter::finish() {
    if (finished_) {
        return;
    }

    if (writer_.isOpened()) {
        try {
            writer_.release();
        } catch (const cv::Exception& e) {
            discard();
            throw MediaEncodeError("Finalizing " + output_path_ + " failed: " + e.what());
        }
    } else if (pipe_) {
        int exit_code = decode_status(pclose(pipe_));
        pipe_ = nullptr;
        if (exit_code == kTimeoutExitCode) {
            discard();
            throw JobTimeoutError("Encoding " + output_path_ + " exceeded its time limit");
        }
        if (exit_code != 0) {
            std::string detail = last_line(stderr_->read());
            discard();
            throw MediaEncodeError("Encoder exited with code " + std::to_string(exit_code) +
                                   (detail.empty() ? "" : ": " + detail));
        }
    }

    std::error_code ec;
    if (!std::filesystem::exists(output_path_, ec) || std::filesystem::file_size(output_path_, ec) == 0) {
        discard();
        throw MediaEncodeError("Encoder produced no output at " + output_path_);
    }

    finished_ = true;
    std::cout << "Encoded " << frames_written_ << " frames to " << output_path_ << std::endl;
}

void MediaWriter::discard() {
    if (writer_.isOpened()) {
        try {
            writer_.release();
        } catch (const cv::Exception& e) {
            std::cerr << "Releasing writer for " << output_path_ << " failed: " << e.what() << std::endl;
        }
    }
    if (pipe_) {
        pclose(pipe_);
        pipe_ = nullptr;
    }
    remove_quietly(output_path_);
}

DecodedVideo decode(const std::string& video_path) {
    MediaReader reader(video_path);

    DecodedVideo video;
    video.fps = reader.fps();
    while (auto frame = reader.next()) {
        video.frames.push_back(frame->image);
    }
    if (video.frames.empty()) {
        throw CorruptMediaError("No decodable frames in " + video_path);
    }
    video.size = video.frames.front().size();
    return video;
}

void encode(const std::vector<cv::Mat>& frames, double fps, const cv::Size& size,
            const std::string& output_path, const EncoderOptions& options) {
    MediaWriter writer(output_path, fps, size, options);
    int64_t index = 0;
    for (const auto& image : frames) {
        writer.write(Frame{image, index++});
    }
    writer.finish();
}

void apply_filter_graph(const std::string& input_path, const std::string& output_path,
                        const std::string& filter_graph, bool preserve_audio,
                        const EncoderOptions& options) {
    std::vector<std::string> argv = {
        options.ffmpeg_path, "-y", "-nostdin", "-loglevel", "error",
        "-i", input_path,
        "-vf", filter_graph,
        "-c:v", "libx264",
        "-preset", options.preset(),
        "-crf", std::to_string(options.crf()),
        "-pix_fmt", "yuv420p",
    };
    if (preserve_audio) {
        argv.insert(argv.end(), {"-c:a", "aac", "-b:a", "192k"});
    } else {
        argv.push_back("-an");
    }
    argv.insert(argv.end(), {"-movflags", "+faststart", output_path});

    std::cout << "Applying filter graph to " << input_path << std::endl;
    CommandResult result = run_command(with_time_limit(join_command(argv), options.time_limit_seconds));

    if (result.exit_code == kTimeoutExitCode) {
        remove_quietly(output_path);
        throw JobTimeoutError("Filter graph exceeded its time limit on " + input_path);
    }
    if (result.exit_code == kCommandNotFoundExitCode) {
        remove_quietly(output_path);
        throw MediaEncodeError("Encoder not available: " + options.ffmpeg_path);
    }
    if (!result.ok()) {
        remove_quietly(output_path);
        std::string detail = last_line(result.error_output);
        if (detail.find("Invalid data found") != std::string::npos ||
            detail.find("No such file") != std::string::npos) {
            throw CorruptMediaError("Cannot decode " + input_path + ": " + detail);
        }
        throw MediaEncodeError("Filter graph failed with code " + std::to_string(result.exit_code) +
                               (detail.empty() ? "" : ": " + detail));
    }
}

} // namespace roto
