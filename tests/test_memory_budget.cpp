#include <gtest/gtest.h>
#include "errors.hpp"
#include "memory_budget.hpp"
#include <thread>
#include <vector>
#include <chrono>
#include <cstdint>

namespace roto {

class MemoryBudgetTest : public ::testing::Test {
protected:
    MemoryBudget budget_{10 * 1024 * 1024};
};

TEST_F(MemoryBudgetTest, BasicAllocationTracking) {
    budget_.track_allocation("test1", 1024);
    EXPECT_EQ(budget_.get_total_allocated(), 1024u);

    budget_.track_allocation("test2", 2048);
    EXPECT_EQ(budget_.get_total_allocated(), 1024u + 2048u);

    budget_.track_deallocation("test1", 1024);
    EXPECT_EQ(budget_.get_total_allocated(), 2048u);

    budget_.track_deallocation("test2", 2048);
    EXPECT_EQ(budget_.get_total_allocated(), 0u);
}

TEST_F(MemoryBudgetTest, PeakUsageSurvivesDeallocation) {
    budget_.track_allocation("peak_test", 5000);
    EXPECT_EQ(budget_.get_peak_usage(), 5000u);

    budget_.track_deallocation("peak_test", 5000);
    EXPECT_EQ(budget_.get_total_allocated(), 0u);
    EXPECT_EQ(budget_.get_peak_usage(), 5000u);
}

TEST_F(MemoryBudgetTest, AllocationStatsPerTag) {
    budget_.track_allocation("video_frames", 1000);
    budget_.track_allocation("edge_model", 2000);
    budget_.track_allocation("video_frames", 500);

    auto stats = budget_.get_allocation_stats();
    EXPECT_EQ(stats["video_frames"], 1500u);
    EXPECT_EQ(stats["edge_model"], 2000u);

    budget_.track_deallocation("video_frames", 500);
    stats = budget_.get_allocation_stats();
    EXPECT_EQ(stats["video_frames"], 1000u);
}

TEST_F(MemoryBudgetTest, LimitBoundaryConditions) {
    const size_t limit = 5 * 1024 * 1024;
    budget_.set_memory_limit(limit);

    EXPECT_TRUE(budget_.is_memory_available(limit));
    EXPECT_FALSE(budget_.is_memory_available(limit + 1));

    budget_.track_allocation("boundary_test", limit);
    EXPECT_FALSE(budget_.is_memory_available(1));

    budget_.track_deallocation("boundary_test", limit);
    EXPECT_TRUE(budget_.is_memory_available(limit));
}

TEST_F(MemoryBudgetTest, HugeRequestDoesNotOverflow) {
    budget_.track_allocation("resident", 1024);
    EXPECT_FALSE(budget_.is_memory_available(SIZE_MAX));
}

TEST_F(MemoryBudgetTest, ReservationReleasesOnScopeExit) {
    {
        auto reservation = budget_.reserve("frame_pipeline", 4096, "320x180");
        EXPECT_EQ(reservation.bytes(), 4096u);
        EXPECT_EQ(budget_.get_total_allocated(), 4096u);
    }
    EXPECT_EQ(budget_.get_total_allocated(), 0u);
}

TEST_F(MemoryBudgetTest, MovedReservationReleasesOnce) {
    {
        auto first = budget_.reserve("frame_pipeline", 4096, "moved");
        MemoryBudget::Reservation second(std::move(first));
        EXPECT_EQ(budget_.get_total_allocated(), 4096u);
    }
    EXPECT_EQ(budget_.get_total_allocated(), 0u);
}

TEST_F(MemoryBudgetTest, OverBudgetReservationReportsContext) {
    budget_.set_memory_limit(1024 * 1024);

    try {
        auto reservation = budget_.reserve("frame_pipeline", 64 * 1024 * 1024, "3840x2160, 900 frames");
        FAIL() << "Expected ResourceExhaustedError";
    } catch (const ResourceExhaustedError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("3840x2160"), std::string::npos);
        EXPECT_NE(message.find("900 frames"), std::string::npos);
        EXPECT_EQ(e.kind(), ErrorKind::ResourceExhausted);
    }
    EXPECT_EQ(budget_.get_total_allocated(), 0u);
}

TEST_F(MemoryBudgetTest, RefusedReservationLogsUsage) {
    budget_.set_memory_limit(8 * 1024 * 1024);
    auto held = budget_.reserve("decoder", 6 * 1024 * 1024, "held");

    testing::internal::CaptureStdout();
    EXPECT_THROW(budget_.reserve("frame_pipeline", 4 * 1024 * 1024, "1920x1080"), ResourceExhaustedError);
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("Memory in use: 6 MB"), std::string::npos);
    EXPECT_NE(output.find("decoder: 6 MB"), std::string::npos);
}

TEST_F(MemoryBudgetTest, ThreadSafety) {
    const int num_threads = 4;
    const int allocations_per_thread = 100;
    const size_t allocation_size = 1024;

    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t, allocations_per_thread, allocation_size]() {
            for (int i = 0; i < allocations_per_thread; ++i) {
                std::string tag = "thread_" + std::to_string(t) + "_alloc_" + std::to_string(i);

                budget_.track_allocation(tag, allocation_size);
                std::this_thread::sleep_for(std::chrono::microseconds(1));
                budget_.track_deallocation(tag, allocation_size);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(budget_.get_total_allocated(), 0u);
    for (const auto& [tag, size] : budget_.get_allocation_stats()) {
        EXPECT_EQ(size, 0u) << "Leaked reservation for tag: " << tag;
    }
}

TEST_F(MemoryBudgetTest, ZeroSizeAllocation) {
    EXPECT_NO_THROW({
        budget_.track_allocation("zero_alloc", 0);
        EXPECT_EQ(budget_.get_total_allocated(), 0u);

        budget_.track_deallocation("zero_alloc", 0);
        EXPECT_EQ(budget_.get_total_allocated(), 0u);
    });
}

} // namespace roto
