#include <gtest/gtest.h>
#include "uplift/transfer/transfer_monitor.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace uplift::transfer;
using namespace std::chrono_literals;

class TransferMonitorTest : public ::testing::Test {};

TEST_F(TransferMonitorTest, StartsEmpty) {
    TransferMonitor monitor(1000);
    auto status = monitor.status();
    
    EXPECT_EQ(status.bytes_so_far, 0u);
    EXPECT_EQ(status.total_bytes, 1000u);
    EXPECT_DOUBLE_EQ(status.current_rate, 0.0);
    ASSERT_TRUE(status.progress.has_value());
    EXPECT_DOUBLE_EQ(*status.progress, 0.0);
    EXPECT_FALSE(status.time_remaining.has_value());
}

TEST_F(TransferMonitorTest, RecordBytesAccumulates) {
    TransferMonitor monitor(1000);
    monitor.record_bytes(250);
    monitor.record_bytes(0);
    monitor.record_bytes(250);
    
    auto status = monitor.status();
    EXPECT_EQ(status.bytes_so_far, 500u);
    EXPECT_DOUBLE_EQ(*status.progress, 0.5);
    EXPECT_GT(status.current_rate, 0.0);
    ASSERT_TRUE(status.time_remaining.has_value());
}

TEST_F(TransferMonitorTest, ConcurrentRecordingIsAdditive) {
    constexpr int writers = 4;
    constexpr int records_per_writer = 10000;
    TransferMonitor monitor(writers * records_per_writer * 3);
    
    std::atomic<bool> done{false};
    std::thread reader([&] {
        uint64_t last = 0;
        while (!done) {
            auto status = monitor.status();
            EXPECT_GE(status.bytes_so_far, last);
            last = status.bytes_so_far;
        }
    });
    
    std::vector<std::thread> threads;
    for (int i = 0; i < writers; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < records_per_writer; ++j) {
                monitor.record_bytes(3);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    done = true;
    reader.join();
    
    EXPECT_EQ(monitor.bytes_so_far(), static_cast<uint64_t>(writers * records_per_writer * 3));
    EXPECT_DOUBLE_EQ(*monitor.status().progress, 1.0);
}

TEST_F(TransferMonitorTest, ProgressClampedWhenTotalUnderstated) {
    TransferMonitor monitor(100);
    monitor.record_bytes(150);
    
    auto status = monitor.status();
    EXPECT_EQ(status.bytes_so_far, 150u);
    EXPECT_DOUBLE_EQ(*status.progress, 1.0);
    ASSERT_TRUE(status.time_remaining.has_value());
    EXPECT_EQ(*status.time_remaining, 0ms);
}

TEST_F(TransferMonitorTest, UnknownTotalOmitsDerivedFields) {
    TransferMonitor monitor;
    monitor.record_bytes(4096);
    
    auto status = monitor.status();
    EXPECT_EQ(status.total_bytes, 0u);
    EXPECT_FALSE(status.progress.has_value());
    EXPECT_FALSE(status.time_remaining.has_value());
    EXPECT_GT(status.current_rate, 0.0);
}

TEST_F(TransferMonitorTest, SetTotalSizeKeepsCount) {
    TransferMonitor monitor;
    monitor.record_bytes(300);
    monitor.set_total_size(1200);
    
    auto status = monitor.status();
    EXPECT_EQ(status.bytes_so_far, 300u);
    EXPECT_EQ(monitor.total_size(), 1200u);
    EXPECT_DOUBLE_EQ(*status.progress, 0.25);
}

TEST_F(TransferMonitorTest, RateForgetsOldActivity) {
    TransferMonitor monitor(0, 100ms);
    monitor.record_bytes(10000);
    EXPECT_GT(monitor.status().current_rate, 0.0);
    
    std::this_thread::sleep_for(150ms);
    
    auto status = monitor.status();
    EXPECT_DOUBLE_EQ(status.current_rate, 0.0);
    EXPECT_GT(status.average_rate, 0.0);
    EXPECT_EQ(status.bytes_so_far, 10000u);
}

TEST_F(TransferMonitorTest, EstimatesTimeRemaining) {
    TransferMonitor monitor(1000000, 2000ms);
    
    // 100 KB over roughly half a second, about 200 KB/s
    for (int i = 0; i < 10; ++i) {
        monitor.record_bytes(10000);
        std::this_thread::sleep_for(50ms);
    }
    
    auto status = monitor.status();
    ASSERT_TRUE(status.time_remaining.has_value());
    EXPECT_GT(*status.time_remaining, 1s);
    EXPECT_LT(*status.time_remaining, 30s);
    EXPECT_GE(status.elapsed, 500ms);
}
