#include "color_quantizer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <unordered_set>

namespace roto {

namespace {

constexpr int kMinColors = 2;
constexpr int kMaxColors = 16;
constexpr int kMaxKMeansSamples = 20000;
constexpr uint64_t kKMeansSeed = 0x5eed;

// Paints every pixel with the mean colour of its label; empty labels are
// left out of the palette.
QuantizedFrame paint_label_means(const cv::Mat& frame, const cv::Mat& labels, int k) {
    std::vector<cv::Vec3d> sums(k, cv::Vec3d(0, 0, 0));
    std::vector<size_t> counts(k, 0);

    for (int y = 0; y < frame.rows; ++y) {
        const cv::Vec3b* src = frame.ptr<cv::Vec3b>(y);
        const int* lab = labels.ptr<int>(y);
        for (int x = 0; x < frame.cols; ++x) {
            const cv::Vec3b& px = src[x];
            sums[lab[x]] += cv::Vec3d(px[0], px[1], px[2]);
            ++counts[lab[x]];
        }
    }

    std::vector<cv::Vec3b> colors(k);
    QuantizedFrame result;
    for (int i = 0; i < k; ++i) {
        if (counts[i] == 0) continue;
        cv::Vec3d mean = sums[i] / static_cast<double>(counts[i]);
        colors[i] = cv::Vec3b(cv::saturate_cast<uchar>(mean[0]),
                              cv::saturate_cast<uchar>(mean[1]),
                              cv::saturate_cast<uchar>(mean[2]));
        result.palette.push_back(colors[i]);
    }

    result.image.create(frame.size(), CV_8UC3);
    for (int y = 0; y < frame.rows; ++y) {
        cv::Vec3b* dst = result.image.ptr<cv::Vec3b>(y);
        const int* lab = labels.ptr<int>(y);
        for (int x = 0; x < frame.cols; ++x) {
            dst[x] = colors[lab[x]];
        }
    }
    return result;
}

cv::Mat luminance(const cv::Mat& frame) {
    cv::Mat gray;
    cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    return gray;
}

bool is_solid(const cv::Mat& frame) {
    cv::Mat diff;
    const cv::Vec3b first = frame.at<cv::Vec3b>(0, 0);
    cv::absdiff(frame, cv::Scalar(first[0], first[1], first[2]), diff);
    return cv::countNonZero(diff.reshape(1)) == 0;
}

} // namespace

ColorMethod parse_color_method(const std::string& name) {
    if (name == "kmeans") return ColorMethod::KMeans;
    if (name == "bilateral") return ColorMethod::Bilateral;
    if (name == "posterize") return ColorMethod::Posterize;
    throw ValidationError("Unknown color method: " + name);
}

const char* to_string(ColorMethod method) {
    switch (method) {
        case ColorMethod::KMeans: return "kmeans";
        case ColorMethod::Bilateral: return "bilateral";
        case ColorMethod::Posterize: return "posterize";
    }
    return "unknown";
}

ColorQuantizer::ColorQuantizer(ColorMethod method, int num_colors, double smoothing)
    : method_(method), num_colors_(num_colors), smoothing_(std::clamp(smoothing, 0.0, 1.0)) {
    if (num_colors_ < kMinColors || num_colors_ > kMaxColors) {
        throw ValidationError("num_colors must be in [2, 16], got " + std::to_string(num_colors));
    }
}

QuantizedFrame ColorQuantizer::quantize(const cv::Mat& frame) const {
    if (frame.empty() || frame.type() != CV_8UC3) {
        throw CorruptMediaError("Color quantizer expects a non-empty 8-bit BGR frame");
    }

    if (is_solid(frame)) {
        QuantizedFrame result;
        result.image = frame.clone();
        result.palette.push_back(frame.at<cv::Vec3b>(0, 0));
        return result;
    }

    // Two colours are the same split for every method.
    if (num_colors_ == 2) {
        return two_tone(frame);
    }

    switch (method_) {
        case ColorMethod::KMeans:
            return kmeans(pre_smooth(frame));
        case ColorMethod::Bilateral: {
            cv::Mat smoothed = pre_smooth(frame);
            int iterations = std::max(1, static_cast<int>(3 * smoothing_));
            cv::Mat tmp;
            for (int i = 0; i < iterations; ++i) {
                cv::bilateralFilter(smoothed, tmp, 9, 75, 75);
                std::swap(smoothed, tmp);
            }
            return posterize(smoothed);
        }
        case ColorMethod::Posterize:
            return posterize(frame);
    }
    throw ValidationError("Unknown color method");
}

cv::Mat ColorQuantizer::pre_smooth(const cv::Mat& frame) const {
    if (smoothing_ <= 0.0) {
        return frame.clone();
    }
    double sigma = 15.0 * smoothing_;
    int d = static_cast<int>(5 * smoothing_) * 2 + 1;
    cv::Mat smoothed;
    cv::bilateralFilter(frame, smoothed, d, sigma, sigma);
    return smoothed;
}

QuantizedFrame ColorQuantizer::two_tone(const cv::Mat& frame) const {
    cv::Mat gray = luminance(frame);
    cv::Mat bright;
    cv::threshold(gray, bright, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);

    cv::Mat labels;
    bright.convertTo(labels, CV_32S, 1.0 / 255.0);
    return paint_label_means(frame, labels, 2);
}

QuantizedFrame ColorQuantizer::posterize(const cv::Mat& frame) const {
    int levels = static_cast<int>(std::floor(std::cbrt(static_cast<double>(num_colors_)) + 1e-9));

    if (levels >= 2) {
        // Per-channel linear levels; levels^3 <= num_colors.
        cv::Mat lut(1, 256, CV_8U);
        for (int v = 0; v < 256; ++v) {
            int bucket = std::min(levels - 1, v * levels / 256);
            lut.at<uchar>(v) = cv::saturate_cast<uchar>(bucket * 255.0 / (levels - 1));
        }

        QuantizedFrame result;
        cv::LUT(frame, lut, result.image);
        for (int b = 0; b < levels; ++b)
            for (int g = 0; g < levels; ++g)
                for (int r = 0; r < levels; ++r)
                    result.palette.emplace_back(cv::saturate_cast<uchar>(b * 255.0 / (levels - 1)),
                                                cv::saturate_cast<uchar>(g * 255.0 / (levels - 1)),
                                                cv::saturate_cast<uchar>(r * 255.0 / (levels - 1)));
        return result;
    }

    // Fewer than 8 colours: bands of equal luminance width.
    cv::Mat gray = luminance(frame);
    cv::Mat labels(frame.size(), CV_32S);
    for (int y = 0; y < frame.rows; ++y) {
        const uchar* g = gray.ptr<uchar>(y);
        int* lab = labels.ptr<int>(y);
        for (int x = 0; x < frame.cols; ++x) {
            lab[x] = std::min(num_colors_ - 1, g[x] * num_colors_ / 256);
        }
    }
    return paint_label_means(frame, labels, num_colors_);
}

QuantizedFrame ColorQuantizer::kmeans(const cv::Mat& frame) const {
    const int total = frame.rows * frame.cols;
    const int stride = std::max(1, total / kMaxKMeansSamples);
    const int num_samples = (total + stride - 1) / stride;
    const int k = std::min(num_colors_, num_samples);

    cv::Mat flat = (frame.isContinuous() ? frame : frame.clone()).reshape(3, total);
    cv::Mat samples(num_samples, 3, CV_32F);
    std::vector<float> luma(num_samples);
    for (int i = 0; i < num_samples; ++i) {
        const cv::Vec3b& px = flat.at<cv::Vec3b>(i * stride);
        float* row = samples.ptr<float>(i);
        row[0] = px[0];
        row[1] = px[1];
        row[2] = px[2];
        luma[i] = 0.114f * px[0] + 0.587f * px[1] + 0.299f * px[2];
    }

    // Initial clusters are contiguous luminance percentile ranges.
    std::vector<int> order(num_samples);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&luma](int a, int b) { return luma[a] < luma[b]; });
    cv::Mat labels(num_samples, 1, CV_32S);
    for (int rank = 0; rank < num_samples; ++rank) {
        labels.at<int>(order[rank]) = static_cast<int>(static_cast<int64_t>(rank) * k / num_samples);
    }

    cv::theRNG() = cv::RNG(kKMeansSeed);
    cv::Mat centers;
    cv::kmeans(samples, k, labels,
               cv::TermCriteria(cv::TermCriteria::EPS + cv::TermCriteria::COUNT, 20, 0.5),
               1, cv::KMEANS_USE_INITIAL_LABELS, centers);

    QuantizedFrame result;
    std::vector<cv::Vec3f> centroids(k);
    for (int c = 0; c < k; ++c) {
        const float* row = centers.ptr<float>(c);
        centroids[c] = cv::Vec3f(row[0], row[1], row[2]);
    }

    // Reassign every pixel, not only the samples.
    std::vector<cv::Vec3b> colors(k);
    std::vector<bool> used(k, false);
    for (int c = 0; c < k; ++c) {
        colors[c] = cv::Vec3b(cv::saturate_cast<uchar>(centroids[c][0]),
                              cv::saturate_cast<uchar>(centroids[c][1]),
                              cv::saturate_cast<uchar>(centroids[c][2]));
    }

    result.image.create(frame.size(), CV_8UC3);
    for (int y = 0; y < frame.rows; ++y) {
        const cv::Vec3b* src = frame.ptr<cv::Vec3b>(y);
        cv::Vec3b* dst = result.image.ptr<cv::Vec3b>(y);
        for (int x = 0; x < frame.cols; ++x) {
            int best = 0;
            float best_dist = std::numeric_limits<float>::max();
            for (int c = 0; c < k; ++c) {
                float db = src[x][0] - centroids[c][0];
                float dg = src[x][1] - centroids[c][1];
                float dr = src[x][2] - centroids[c][2];
                float dist = db * db + dg * dg + dr * dr;
                if (dist < best_dist) {
                    best_dist = dist;
                    best = c;
                }
            }
            dst[x] = colors[best];
            used[best] = true;
        }
    }

    for (int c = 0; c < k; ++c) {
        if (used[c]) result.palette.push_back(colors[c]);
    }
    return result;
}

size_t count_distinct_colors(const cv::Mat& image) {
    std::unordered_set<uint32_t> colors;
    for (int y = 0; y < image.rows; ++y) {
        const cv::Vec3b* row = image.ptr<cv::Vec3b>(y);
        for (int x = 0; x < image.cols; ++x) {
            colors.insert((static_cast<uint32_t>(row[x][0]) << 16) |
                          (static_cast<uint32_t>(row[x][1]) << 8) | row[x][2]);
        }
    }
    return colors.size();
}

} // namespace roto
