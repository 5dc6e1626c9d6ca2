#include <gtest/gtest.h>
#include "edge_estimator.hpp"
#include "errors.hpp"
#include "job_consumer.hpp"
#include <opencv2/opencv.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace roto {

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Counts calls and optionally fails every one of them with TransientError.
class CountingStore : public ObjectStore {
public:
    explicit CountingStore(std::shared_ptr<ObjectStore> inner) : inner_(std::move(inner)) {}

    void get_object(const std::string& bucket, const std::string& key,
                    const std::string& local_path, const Deadline& deadline) override {
        ++gets;
        std::this_thread::sleep_for(get_delay);
        if (fail_all) throw TransientError("storage unavailable");
        inner_->get_object(bucket, key, local_path, deadline);
    }

    void put_object(const std::string& bucket, const std::string& key,
                    const std::string& local_path, const std::string& content_type,
                    const Deadline& deadline) override {
        ++puts;
        if (fail_all) throw TransientError("storage unavailable");
        inner_->put_object(bucket, key, local_path, content_type, deadline);
    }

    void delete_object(const std::string& bucket, const std::string& key) override {
        ++deletes;
        inner_->delete_object(bucket, key);
    }

    std::string name() const override { return "counting"; }

    int gets = 0;
    int puts = 0;
    int deletes = 0;
    bool fail_all = false;
    std::chrono::milliseconds get_delay{0};

private:
    std::shared_ptr<ObjectStore> inner_;
};

// Rejects its input the way a misconfigured OpenCV call does.
class RejectingEdgeEstimator : public EdgeEstimator {
public:
    cv::Mat estimate(const cv::Mat&, double) override {
        throw cv::Exception(cv::Error::StsBadArg, "unsupported layout", "estimate", __FILE__, __LINE__);
    }

    std::string name() const override { return "rejecting"; }
};

// Dead-letter queue whose sends fail outside the WorkerError hierarchy.
class BrokenQueue : public InMemoryQueue {
public:
    BrokenQueue() : InMemoryQueue("broken-dlq") {}

    std::string send(const std::string&) override {
        throw std::runtime_error("fork failed");
    }
};

} // namespace

class JobConsumerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("roto_consumer_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);

        config_.bucket = "media";
        config_.scratch_dir = (dir_ / "scratch").string();
        config_.encoder = "opencv";
        config_.poll_wait = std::chrono::seconds(0);
        config_.visibility_timeout = std::chrono::seconds(30);
        config_.visibility_extend_interval = std::chrono::seconds(10);
        config_.max_receive_count = 3;
        config_.delete_source_on_success = false;

        local_store_ = std::make_shared<LocalObjectStore>((dir_ / "store").string());
        store_ = std::make_shared<CountingStore>(local_store_);

        RetryPolicy retry;
        retry.max_attempts = 2;
        retry.base_delay = std::chrono::milliseconds(1);
        storage_ = std::make_unique<StorageGateway>(store_, retry);

        processor_ = std::make_unique<VideoProcessor>(std::make_shared<GradientEdgeEstimator>(),
                                                      budget_, EncoderOptions::from(config_));

        create_test_video((dir_ / "clip.avi").string(), 4, cv::Size(64, 48));
        local_store_->put_object("media", "uploads/clip.avi", (dir_ / "clip.avi").string(), "video/avi", Deadline());
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    void create_test_video(const std::string& filename, int num_frames, cv::Size size) {
        cv::VideoWriter writer;
        int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');

        if (!writer.open(filename, fourcc, 10.0, size)) {
            FAIL() << "Could not create test video: " << filename;
        }

        for (int i = 0; i < num_frames; ++i) {
            cv::Mat frame(size, CV_8UC3, cv::Scalar(40, 90, 160));
            cv::circle(frame, cv::Point(20 + i * 5, 24), 12, cv::Scalar(230, 230, 230), -1);
            writer << frame;
        }
        writer.release();
    }

    JobConsumer consumer(MessageQueue* dlq) {
        return JobConsumer(config_, registry_, *processor_, *storage_, queue_, dlq);
    }

    static std::string request(const std::string& effect_id, const std::string& source_key = "uploads/clip.avi") {
        json body = {
            {"source_bucket", "media"},
            {"source_key", source_key},
            {"effect_id", effect_id},
            {"params", {{"num_colors", 4}, {"color_method", "posterize"}}}
        };
        return body.dump();
    }

    bool scratch_is_empty() const {
        return !fs::exists(config_.scratch_dir) || fs::is_empty(config_.scratch_dir);
    }

    fs::path dir_;
    WorkerConfig config_;
    EffectRegistry registry_ = EffectRegistry::load(ROTO_MANIFEST_PATH);
    MemoryBudget budget_{512ull * 1024 * 1024};
    std::shared_ptr<LocalObjectStore> local_store_;
    std::shared_ptr<CountingStore> store_;
    std::unique_ptr<StorageGateway> storage_;
    std::unique_ptr<VideoProcessor> processor_;
    InMemoryQueue queue_{"jobs"};
    InMemoryQueue dlq_{"jobs-dlq"};
};

TEST_F(JobConsumerTest, ProcessesUploadsAndAcknowledges) {
    queue_.send(request("scanner-darkly"));

    JobReport report = consumer(&dlq_).poll_once();

    EXPECT_EQ(report.outcome, JobOutcome::Succeeded) << report.error;
    EXPECT_EQ(report.destination_key, "processed/scanner-darkly/clip.mp4");
    EXPECT_EQ(report.states, (std::vector<JobState>{
        JobState::Idle, JobState::Received, JobState::Downloading, JobState::Processing,
        JobState::Uploading, JobState::Acknowledging, JobState::Idle}));

    EXPECT_EQ(queue_.size(), 0u);
    EXPECT_EQ(dlq_.size(), 0u);
    EXPECT_TRUE(scratch_is_empty());

    std::string output = local_store_->path_for("media", "processed/scanner-darkly/clip.mp4");
    ASSERT_TRUE(fs::exists(output));
    cv::VideoCapture cap(output);
    ASSERT_TRUE(cap.isOpened());
    EXPECT_EQ(static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)), 64);
    EXPECT_EQ(static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT)), 48);

    // Source kept when deletion is disabled.
    EXPECT_TRUE(fs::exists(local_store_->path_for("media", "uploads/clip.avi")));
    EXPECT_EQ(store_->deletes, 0);
}

TEST_F(JobConsumerTest, DeletesSourceAfterSuccessWhenConfigured) {
    config_.delete_source_on_success = true;
    queue_.send(request("scanner-darkly"));

    JobReport report = consumer(&dlq_).poll_once();

    ASSERT_EQ(report.outcome, JobOutcome::Succeeded) << report.error;
    EXPECT_EQ(store_->deletes, 1);
    EXPECT_FALSE(fs::exists(local_store_->path_for("media", "uploads/clip.avi")));
}

TEST_F(JobConsumerTest, RedeliveryOverwritesWithIdenticalOutput) {
    std::string output = local_store_->path_for("media", "processed/scanner-darkly/clip.mp4");

    queue_.send(request("scanner-darkly"));
    ASSERT_EQ(consumer(&dlq_).poll_once().outcome, JobOutcome::Succeeded);
    std::string first = read_file(output);

    queue_.send(request("scanner-darkly"));
    ASSERT_EQ(consumer(&dlq_).poll_once().outcome, JobOutcome::Succeeded);
    std::string second = read_file(output);

    EXPECT_FALSE(first.empty());
    EXPECT_EQ(first, second);
}

TEST_F(JobConsumerTest, UnknownEffectFailsBeforeDownload) {
    queue_.send(request("does-not-exist"));

    JobReport report = consumer(&dlq_).poll_once();

    EXPECT_EQ(report.outcome, JobOutcome::DeadLettered);
    ASSERT_TRUE(report.error_kind.has_value());
    EXPECT_EQ(*report.error_kind, ErrorKind::Permanent);
    EXPECT_EQ(store_->gets, 0);
    EXPECT_EQ(queue_.size(), 0u);
    ASSERT_EQ(dlq_.size(), 1u);

    json envelope = json::parse(dlq_.bodies().front());
    EXPECT_EQ(envelope["original_body"].get<std::string>(), request("does-not-exist"));
    EXPECT_EQ(envelope["error_kind"].get<std::string>(), "permanent");
    EXPECT_EQ(envelope["receive_count"].get<int>(), 1);
    EXPECT_NE(envelope["error"].get<std::string>().find("does-not-exist"), std::string::npos);
}

TEST_F(JobConsumerTest, InvalidParamsAreRejectedBeforeDownload) {
    json body = json::parse(request("scanner-darkly"));
    body["params"]["color_method"] = "watercolor";
    queue_.send(body.dump());

    JobReport report = consumer(&dlq_).poll_once();

    EXPECT_EQ(report.outcome, JobOutcome::DeadLettered);
    EXPECT_EQ(store_->gets, 0);
}

TEST_F(JobConsumerTest, ExcessiveReceiveCountIsDeadLettered) {
    queue_.send(request("scanner-darkly"));
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(queue_.receive(std::chrono::seconds(0), std::chrono::seconds(0)).has_value());
    }

    JobReport report = consumer(&dlq_).poll_once();

    EXPECT_EQ(report.outcome, JobOutcome::DeadLettered);
    EXPECT_EQ(store_->gets, 0);
    EXPECT_EQ(queue_.size(), 0u);
    ASSERT_EQ(dlq_.size(), 1u);
    EXPECT_EQ(json::parse(dlq_.bodies().front())["receive_count"].get<int>(), 4);
}

TEST_F(JobConsumerTest, WithoutDeadLetterQueueMessageIsLeft) {
    queue_.send(request("does-not-exist"));

    JobReport report = consumer(nullptr).poll_once();

    EXPECT_EQ(report.outcome, JobOutcome::Failed);
    EXPECT_EQ(report.states.back(), JobState::Idle);
    EXPECT_EQ(queue_.size(), 1u);
}

TEST_F(JobConsumerTest, MissingSourceIsPermanentAndCleansScratch) {
    queue_.send(request("scanner-darkly", "uploads/missing.avi"));

    JobReport report = consumer(&dlq_).poll_once();

    EXPECT_EQ(report.outcome, JobOutcome::DeadLettered);
    EXPECT_EQ(store_->gets, 1);
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(JobConsumerTest, CorruptSourceIsDeadLettered) {
    std::string garbage = (dir_ / "garbage.avi").string();
    std::ofstream(garbage) << "this is not a video";
    local_store_->put_object("media", "uploads/garbage.avi", garbage, "video/avi", Deadline());
    queue_.send(request("scanner-darkly", "uploads/garbage.avi"));

    JobReport report = consumer(&dlq_).poll_once();

    EXPECT_EQ(report.outcome, JobOutcome::DeadLettered);
    ASSERT_TRUE(report.error_kind.has_value());
    EXPECT_EQ(*report.error_kind, ErrorKind::Permanent);
    EXPECT_FALSE(fs::exists(local_store_->path_for("media", "processed/scanner-darkly/garbage.mp4")));
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(JobConsumerTest, TransientStorageFailureLeavesMessageForRetry) {
    store_->fail_all = true;
    queue_.send(request("scanner-darkly"));

    JobReport report = consumer(&dlq_).poll_once();

    EXPECT_EQ(report.outcome, JobOutcome::Failed);
    ASSERT_TRUE(report.error_kind.has_value());
    EXPECT_EQ(*report.error_kind, ErrorKind::Transient);
    EXPECT_EQ(store_->gets, 2);
    EXPECT_EQ(queue_.size(), 1u);
    EXPECT_EQ(dlq_.size(), 0u);
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(JobConsumerTest, OpenCvFailureIsNotTreatedAsCorruptSource) {
    processor_ = std::make_unique<VideoProcessor>(std::make_shared<RejectingEdgeEstimator>(),
                                                  budget_, EncoderOptions::from(config_));
    queue_.send(request("scanner-darkly"));

    JobReport report = consumer(&dlq_).poll_once();

    EXPECT_EQ(report.outcome, JobOutcome::Failed);
    ASSERT_TRUE(report.error_kind.has_value());
    EXPECT_EQ(*report.error_kind, ErrorKind::Processing);
    EXPECT_EQ(dlq_.size(), 0u);
    EXPECT_EQ(queue_.size(), 1u);
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(JobConsumerTest, EmptyQueueReportsNoMessage) {
    JobReport report = consumer(&dlq_).poll_once();
    EXPECT_EQ(report.outcome, JobOutcome::NoMessage);
    EXPECT_EQ(report.states, std::vector<JobState>{JobState::Idle});
}

TEST_F(JobConsumerTest, ExpiredDeadlineIsTimeout) {
    config_.max_job_duration = std::chrono::seconds(0);
    queue_.send(request("scanner-darkly"));

    JobReport report = consumer(&dlq_).poll_once();

    EXPECT_EQ(report.outcome, JobOutcome::Failed);
    ASSERT_TRUE(report.error_kind.has_value());
    EXPECT_EQ(*report.error_kind, ErrorKind::Timeout);
    EXPECT_EQ(queue_.size(), 1u);
}

TEST_F(JobConsumerTest, StalledDownloadIsAbandonedAtDeadline) {
    config_.max_job_duration = std::chrono::seconds(1);
    store_->get_delay = std::chrono::milliseconds(1500);
    store_->fail_all = true;
    queue_.send(request("scanner-darkly"));

    JobReport report = consumer(&dlq_).poll_once();

    EXPECT_EQ(report.outcome, JobOutcome::Failed);
    ASSERT_TRUE(report.error_kind.has_value());
    EXPECT_EQ(*report.error_kind, ErrorKind::Timeout);
    EXPECT_EQ(store_->gets, 1);
    EXPECT_EQ(queue_.size(), 1u);
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(JobConsumerTest, FailingDeadLetterSendIsContained) {
    BrokenQueue broken;
    queue_.send(request("scanner-darkly"));
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(queue_.receive(std::chrono::seconds(0), std::chrono::seconds(0)).has_value());
    }

    JobReport report;
    EXPECT_NO_THROW(report = consumer(&broken).poll_once());
    EXPECT_EQ(report.outcome, JobOutcome::Failed);
    EXPECT_EQ(queue_.size(), 1u);

    queue_.send(request("does-not-exist"));
    EXPECT_NO_THROW(report = consumer(&broken).poll_once());
    EXPECT_EQ(report.outcome, JobOutcome::Failed);
}

TEST(ProcessingRequestTest, AcceptsLegacyFieldNames) {
    auto request = ProcessingRequest::parse(
        R"({"bucket":"b","input_key":"in/x.mov","output_key":"out/x.mp4","effect_type":"Scanner_Darkly"})",
        "default");

    EXPECT_EQ(request.source_bucket, "b");
    EXPECT_EQ(request.source_key, "in/x.mov");
    EXPECT_EQ(request.destination_key, "out/x.mp4");
    EXPECT_EQ(request.effect_id, "Scanner_Darkly");
    EXPECT_TRUE(request.params.is_object());
    EXPECT_TRUE(request.params.empty());
}

TEST(ProcessingRequestTest, FallsBackToDefaultsAndDerivesDestination) {
    auto request = ProcessingRequest::parse(
        R"({"source_key":"uploads/My Clip.mov","effect_id":"Scanner_Darkly"})", "media");

    EXPECT_EQ(request.source_bucket, "media");
    EXPECT_EQ(request.destination_key, "processed/scanner-darkly/My Clip.mp4");
}

TEST(ProcessingRequestTest, RejectsMalformedBodies) {
    EXPECT_THROW(ProcessingRequest::parse("not json", "b"), ValidationError);
    EXPECT_THROW(ProcessingRequest::parse("[1,2]", "b"), ValidationError);
    EXPECT_THROW(ProcessingRequest::parse(R"({"effect_id":"x"})", "b"), ValidationError);
    EXPECT_THROW(ProcessingRequest::parse(R"({"source_key":"k"})", "b"), ValidationError);
    EXPECT_THROW(ProcessingRequest::parse(R"({"source_key":"k","effect_id":"x"})", ""), ValidationError);
    EXPECT_THROW(ProcessingRequest::parse(R"({"source_key":"k","effect_id":"x","params":[1]})", "b"),
                 ValidationError);
    EXPECT_THROW(ProcessingRequest::parse(R"({"source_key":5,"effect_id":"x"})", "b"), ValidationError);
}

TEST(DestinationKeyTest, UsesNormalizedEffectAndSourceStem) {
    EXPECT_EQ(derive_destination_key("a/b/clip.final.mov", "grindhouse"), "processed/grindhouse/clip.final.mp4");
    EXPECT_EQ(derive_destination_key("clip", "Silent Movie"), "processed/silent-movie/clip.mp4");
}

TEST(VisibilityExtenderTest, KeepsMessageHidden) {
    InMemoryQueue queue;
    queue.send("body");
    auto message = queue.receive(std::chrono::seconds(0), std::chrono::seconds(2));
    ASSERT_TRUE(message.has_value());

    {
        VisibilityExtender extender(queue, message->receipt_handle, message->message_id,
                                    std::chrono::seconds(1), std::chrono::seconds(30));
        std::this_thread::sleep_for(std::chrono::milliseconds(2500));
        extender.stop();
        EXPECT_GE(extender.extensions(), 1);
    }

    EXPECT_FALSE(queue.receive(std::chrono::seconds(0), std::chrono::seconds(30)).has_value());
}

TEST(VisibilityExtenderTest, StopsPromptly) {
    InMemoryQueue queue;
    queue.send("body");
    auto message = queue.receive(std::chrono::seconds(0), std::chrono::seconds(30));
    ASSERT_TRUE(message.has_value());

    auto start = std::chrono::steady_clock::now();
    {
        VisibilityExtender extender(queue, message->receipt_handle, message->message_id,
                                    std::chrono::seconds(60), std::chrono::seconds(120));
        EXPECT_EQ(extender.extensions(), 0);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

} // namespace roto
