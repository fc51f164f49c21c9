/**
 * @file test_progress_monitor.cpp
 * @brief Unit tests for ProgressBoard and ProgressMonitor
 *
 * Status is derived from artifact files only:
 * none -> starting, intermediate -> computing, final -> completed.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

#include "core/ProgressMonitor.hpp"

using namespace MotifColoc;
namespace fs = std::filesystem;

class ProgressMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("motif_coloc_progress_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    WatchedPartition watched(const std::string& id) const {
        WatchedPartition w;
        w.partition_id = id;
        w.intermediate_path = (dir_ / (id + ".fa.Z-SCORE")).string();
        w.final_path = (dir_ / (id + ".fa.probability")).string();
        return w;
    }

    // Waits until the board shows the status or the deadline passes
    static bool wait_for_status(const ProgressBoard& board, const std::string& id, PartitionStatus status) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline) {
            auto p = board.get(id);
            if (p && p->status == status) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    }

    fs::path dir_;
};

TEST(ProgressBoardTest, UpdateReportsStatusChanges) {
    ProgressBoard board;
    PartitionProgress p;

    EXPECT_TRUE(board.update("chr1", p));   // new entry
    EXPECT_FALSE(board.update("chr1", p));  // same status

    p.status = PartitionStatus::COMPUTING;
    p.intermediate_bytes = 10;
    EXPECT_TRUE(board.update("chr1", p));

    p.intermediate_bytes = 20;
    EXPECT_FALSE(board.update("chr1", p));  // size only
    EXPECT_EQ(board.get("chr1")->intermediate_bytes, 20u);

    EXPECT_FALSE(board.get("chr9").has_value());
    EXPECT_EQ(board.count(PartitionStatus::COMPUTING), 1u);

    board.clear();
    EXPECT_TRUE(board.snapshot().empty());
}

TEST_F(ProgressMonitorTest, PollFollowsArtifactFiles) {
    ProgressBoard board;
    WatchedPartition w = watched("chr1");
    ProgressMonitor monitor(board, {w, watched("chr2")}, std::chrono::milliseconds(1000));

    // Registered as starting before any poll
    ASSERT_TRUE(board.get("chr1").has_value());
    EXPECT_EQ(board.get("chr1")->status, PartitionStatus::STARTING);
    EXPECT_EQ(board.count(PartitionStatus::STARTING), 2u);

    monitor.poll_once();
    EXPECT_EQ(board.get("chr1")->status, PartitionStatus::STARTING);

    std::ofstream(w.intermediate_path) << "12 8 12\n";
    monitor.poll_once();
    EXPECT_EQ(board.get("chr1")->status, PartitionStatus::COMPUTING);
    EXPECT_EQ(board.get("chr1")->intermediate_bytes, 8u);
    EXPECT_EQ(board.get("chr2")->status, PartitionStatus::STARTING);

    std::ofstream(w.final_path) << "10 0.1 0.2 350.0\n";
    monitor.poll_once();
    EXPECT_EQ(board.get("chr1")->status, PartitionStatus::COMPLETED);
    EXPECT_EQ(board.get("chr1")->final_bytes, 17u);
    EXPECT_EQ(board.get("chr1")->intermediate_bytes, 8u);

    EXPECT_EQ(board.count(PartitionStatus::COMPLETED), 1u);
    EXPECT_EQ(board.count(PartitionStatus::STARTING), 1u);
}

TEST_F(ProgressMonitorTest, FinalArtifactAloneMeansCompleted) {
    ProgressBoard board;
    WatchedPartition w = watched("chrX");
    ProgressMonitor monitor(board, {w}, std::chrono::milliseconds(1000));

    std::ofstream(w.final_path) << "";
    monitor.poll_once();
    EXPECT_EQ(board.get("chrX")->status, PartitionStatus::COMPLETED);
    EXPECT_EQ(board.get("chrX")->final_bytes, 0u);
}

TEST_F(ProgressMonitorTest, BackgroundThreadTracksTransitions) {
    ProgressBoard board;
    WatchedPartition w = watched("chr1");
    ProgressMonitor monitor(board, {w}, std::chrono::milliseconds(10));

    monitor.start();
    EXPECT_TRUE(monitor.is_running());

    std::ofstream(w.intermediate_path) << "x\n";
    EXPECT_TRUE(wait_for_status(board, "chr1", PartitionStatus::COMPUTING));

    std::ofstream(w.final_path) << "x\n";
    EXPECT_TRUE(wait_for_status(board, "chr1", PartitionStatus::COMPLETED));

    monitor.stop();
    EXPECT_FALSE(monitor.is_running());
    monitor.stop();  // idempotent
}
