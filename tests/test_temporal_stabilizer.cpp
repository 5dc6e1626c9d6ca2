#include <gtest/gtest.h>
#include "temporal_stabilizer.hpp"
#include <opencv2/opencv.hpp>
#include <vector>

namespace roto {

class TemporalStabilizerTest : public ::testing::Test {
protected:
    static cv::Mat solid(const cv::Scalar& color) {
        return cv::Mat(60, 80, CV_8UC3, color);
    }

    static std::vector<cv::Mat> run(TemporalStabilizer& stabilizer, const std::vector<cv::Mat>& frames) {
        std::vector<cv::Mat> out;
        for (const auto& frame : frames) {
            out.push_back(stabilizer.apply(frame));
        }
        return out;
    }
};

TEST_F(TemporalStabilizerTest, ZeroWeightIsPassthrough) {
    cv::Mat frame(60, 80, CV_8UC3);
    cv::randu(frame, cv::Scalar::all(0), cv::Scalar::all(255));

    TemporalStabilizer stabilizer(0.0);
    for (int i = 0; i < 3; ++i) {
        cv::Mat out = stabilizer.apply(frame);
        EXPECT_EQ(cv::norm(out, frame, cv::NORM_INF), 0.0);
    }
}

TEST_F(TemporalStabilizerTest, BlendsTowardPreviousFrames) {
    TemporalStabilizer stabilizer(0.5);

    cv::Mat first = stabilizer.apply(solid(cv::Scalar(0, 0, 0)));
    EXPECT_EQ(first.at<cv::Vec3b>(0, 0), cv::Vec3b(0, 0, 0));

    cv::Mat second = stabilizer.apply(solid(cv::Scalar(200, 100, 50)));
    EXPECT_EQ(second.at<cv::Vec3b>(0, 0), cv::Vec3b(100, 50, 25));
}

TEST_F(TemporalStabilizerTest, FullWeightFreezesFirstFrame) {
    TemporalStabilizer stabilizer(1.0);
    stabilizer.apply(solid(cv::Scalar(10, 20, 30)));
    cv::Mat out = stabilizer.apply(solid(cv::Scalar(200, 200, 200)));
    EXPECT_EQ(out.at<cv::Vec3b>(0, 0), cv::Vec3b(10, 20, 30));
}

TEST_F(TemporalStabilizerTest, NoStateLeaksBetweenRuns) {
    std::vector<cv::Mat> video_a = {solid(cv::Scalar(255, 0, 0)), solid(cv::Scalar(250, 10, 0))};
    std::vector<cv::Mat> video_b = {solid(cv::Scalar(0, 0, 255)), solid(cv::Scalar(0, 30, 200))};

    TemporalStabilizer alone(0.3);
    auto b_alone = run(alone, video_b);

    TemporalStabilizer first(0.3);
    run(first, video_a);
    TemporalStabilizer second(0.3);
    auto b_after_a = run(second, video_b);

    ASSERT_EQ(b_alone.size(), b_after_a.size());
    for (size_t i = 0; i < b_alone.size(); ++i) {
        EXPECT_EQ(cv::norm(b_alone[i], b_after_a[i], cv::NORM_INF), 0.0);
    }
}

TEST_F(TemporalStabilizerTest, ResetDropsState) {
    TemporalStabilizer stabilizer(0.3);
    stabilizer.apply(solid(cv::Scalar(255, 255, 255)));
    EXPECT_TRUE(stabilizer.has_state());

    stabilizer.reset();
    EXPECT_FALSE(stabilizer.has_state());

    cv::Mat out = stabilizer.apply(solid(cv::Scalar(0, 0, 0)));
    EXPECT_EQ(out.at<cv::Vec3b>(0, 0), cv::Vec3b(0, 0, 0));
}

TEST_F(TemporalStabilizerTest, SaturationOneIsIdentity) {
    cv::Mat frame = solid(cv::Scalar(40, 120, 200));
    EXPECT_EQ(cv::norm(adjust_saturation(frame, 1.0), frame, cv::NORM_INF), 0.0);
}

TEST_F(TemporalStabilizerTest, SaturationZeroIsGray) {
    cv::Mat out = adjust_saturation(solid(cv::Scalar(40, 120, 200)), 0.0);
    cv::Vec3b px = out.at<cv::Vec3b>(0, 0);
    EXPECT_EQ(px[0], px[1]);
    EXPECT_EQ(px[1], px[2]);
}

TEST_F(TemporalStabilizerTest, SaturationDoesNotFeedBackIntoState) {
    TemporalStabilizer plain(0.5);
    TemporalStabilizer saturated(0.5);

    std::vector<cv::Mat> frames = {solid(cv::Scalar(40, 120, 200)), solid(cv::Scalar(90, 90, 30))};
    cv::Mat expected, actual;
    for (const auto& frame : frames) {
        expected = adjust_saturation(plain.apply(frame), 1.8);
        actual = adjust_saturation(saturated.apply(frame), 1.8);
    }
    EXPECT_EQ(cv::norm(expected, actual, cv::NORM_INF), 0.0);
}

} // namespace roto
