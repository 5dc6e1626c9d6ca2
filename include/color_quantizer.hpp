#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace roto {

enum class ColorMethod { KMeans, Bilateral, Posterize };

// Throws ValidationError for names other than kmeans, bilateral, posterize.
ColorMethod parse_color_method(const std::string& name);
const char* to_string(ColorMethod method);

struct QuantizedFrame {
    cv::Mat image;                    // CV_8UC3, same size as the input
    std::vector<cv::Vec3b> palette;   // representative colours, at most num_colors
};

// Reduces a BGR frame to a small palette. Output depends only on the input
// frame and the settings, never on earlier calls.
class ColorQuantizer {
public:
    ColorQuantizer(ColorMethod method, int num_colors, double smoothing);

    QuantizedFrame quantize(const cv::Mat& frame) const;

    ColorMethod method() const { return method_; }
    int num_colors() const { return num_colors_; }

private:
    QuantizedFrame two_tone(const cv::Mat& frame) const;
    QuantizedFrame kmeans(const cv::Mat& frame) const;
    QuantizedFrame posterize(const cv::Mat& frame) const;
    cv::Mat pre_smooth(const cv::Mat& frame) const;

    ColorMethod method_;
    int num_colors_;
    double smoothing_;
};

size_t count_distinct_colors(const cv::Mat& image);

} // namespace roto
