/**
 * @file test_worker_pool.cpp
 * @brief Unit tests for PredictorWorkerPool and ExternalPredictor
 *
 * Tests cover:
 * 1. Partition selection and concurrency bound
 * 2. Partial failure reporting with an in-process predictor
 * 3. Cancellation of running and pending partitions
 * 4. Real child processes: success, nonzero exit, launch failure, timeout,
 *    cancellation and SIGTERM -> SIGKILL escalation
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <thread>

#include <signal.h>
#include <sys/types.h>

#include "core/ExternalPredictor.hpp"
#include "core/Predictor.hpp"
#include "core/PredictorWorkerPool.hpp"

using namespace MotifColoc;
namespace fs = std::filesystem;

namespace {

/**
 * In-process predictor: sleeps, tracks concurrency, fails for selected ids.
 */
class FakePredictor : public Predictor {
public:
    explicit FakePredictor(std::set<std::string> failing = {}, int sleep_ms = 20)
        : failing_(std::move(failing)), sleep_ms_(sleep_ms) {}

    PredictorOutcome run(const PartitionFile& partition, const CancellationToken& cancel) const override {
        const int now = ++running_;
        int seen = max_running_.load();
        while (now > seen && !max_running_.compare_exchange_weak(seen, now)) {
        }
        ++calls_;

        PredictorOutcome outcome;
        outcome.artifacts.intermediate_path = intermediate_path(partition);
        outcome.artifacts.final_path = final_path(partition);

        const auto end = std::chrono::steady_clock::now() + std::chrono::milliseconds(sleep_ms_);
        while (std::chrono::steady_clock::now() < end) {
            if (cancel.is_cancelled()) {
                ProcessError err;
                err.kind = ProcessErrorKind::CANCELLED;
                err.message = "cancelled while running";
                outcome.error = err;
                --running_;
                return outcome;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }

        if (failing_.count(partition.partition_id)) {
            ProcessError err;
            err.kind = ProcessErrorKind::NON_ZERO_EXIT;
            err.exit_code = 1;
            err.message = "exit code 1: segmentation fault in window 7";
            outcome.error = err;
        }
        --running_;
        return outcome;
    }

    std::string intermediate_path(const PartitionFile& partition) const override {
        return partition.sequence_file + ".Z-SCORE";
    }

    std::string final_path(const PartitionFile& partition) const override {
        return partition.sequence_file + ".probability";
    }

    int calls() const { return calls_.load(); }
    int max_running() const { return max_running_.load(); }

private:
    std::set<std::string> failing_;
    int sleep_ms_;
    mutable std::atomic<int> running_{0};
    mutable std::atomic<int> max_running_{0};
    mutable std::atomic<int> calls_{0};
};

PartitionFile partition(const std::string& dir, const std::string& id, int64_t length = 2000000) {
    PartitionFile p;
    p.partition_id = id;
    p.sequence_file = dir + "/" + id + ".fa";
    p.sequence_length = length;
    return p;
}

WorkerPoolOptions test_options() {
    WorkerPoolOptions o;
    o.poll_interval = std::chrono::milliseconds(20);
    o.min_partition_length = 0;
    o.observe_interrupts = false;
    return o;
}

}  // namespace

class WorkerPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("motif_coloc_pool_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    std::string dir() const { return dir_.string(); }

    PartitionFile write_partition(const std::string& id) {
        PartitionFile p = ::partition(dir(), id, 100);
        std::ofstream ofs(p.sequence_file);
        ofs << ">" << id << "\nCGCGCGCGCGCGCGCG\n";
        return p;
    }

    std::string write_script(const std::string& name, const std::string& body) {
        const std::string path = (dir_ / name).string();
        {
            std::ofstream ofs(path);
            ofs << "#!/bin/sh\n" << body;
        }
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
        return path;
    }

    fs::path dir_;
};

// ============================================================================
// Pool behavior with an in-process predictor
// ============================================================================

TEST_F(WorkerPoolTest, ZeroPartitionsReturnsImmediately) {
    FakePredictor predictor;
    PredictorWorkerPool pool(predictor, test_options());

    auto results = pool.run_all({});
    EXPECT_TRUE(results.empty());
    EXPECT_EQ(predictor.calls(), 0);
}

TEST_F(WorkerPoolTest, EffectiveConcurrency) {
    EXPECT_EQ(PredictorWorkerPool::effective_concurrency(0, 4), 1);
    EXPECT_EQ(PredictorWorkerPool::effective_concurrency(1, 8), 1);

    const int bounded = PredictorWorkerPool::effective_concurrency(100, 2);
    EXPECT_GE(bounded, 1);
    EXPECT_LE(bounded, 2);

    const int unbounded = PredictorWorkerPool::effective_concurrency(100000, 0);
    EXPECT_GE(unbounded, 1);
    EXPECT_LE(unbounded, static_cast<int>(std::max(1u, std::thread::hardware_concurrency())));
}

TEST_F(WorkerPoolTest, SelectionAppliesThresholdAndFilter) {
    FakePredictor predictor;
    WorkerPoolOptions options = test_options();
    options.min_partition_length = 1000;
    options.only_partitions = {"chr1", "chr3", "chrUnknown"};
    PredictorWorkerPool pool(predictor, options);

    std::vector<PartitionFile> parts = {partition(dir(), "chr1", 5000), partition(dir(), "chr2", 5000),
                                        partition(dir(), "chr3", 999)};
    auto selected = pool.select_partitions(parts);
    ASSERT_EQ(selected.size(), 1u);
    EXPECT_EQ(selected[0].partition_id, "chr1");

    auto results = pool.run_all(parts);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(predictor.calls(), 1);
}

TEST_F(WorkerPoolTest, PartialFailureKeepsSiblings) {
    FakePredictor predictor({"chr2"});
    PredictorWorkerPool pool(predictor, test_options());

    std::vector<PartitionFile> parts = {partition(dir(), "chr1"), partition(dir(), "chr2"), partition(dir(), "chr3")};
    auto results = pool.run_all(parts);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].partition_id, "chr1");
    EXPECT_TRUE(results[0].success);
    EXPECT_TRUE(results[0].error_text.empty());

    EXPECT_EQ(results[1].partition_id, "chr2");
    EXPECT_FALSE(results[1].success);
    EXPECT_NE(results[1].error_text.find("non_zero_exit"), std::string::npos);
    EXPECT_NE(results[1].error_text.find("segmentation fault"), std::string::npos);

    EXPECT_TRUE(results[2].success);
    EXPECT_EQ(predictor.calls(), 3);
}

TEST_F(WorkerPoolTest, ConcurrencyIsBounded) {
    FakePredictor predictor({}, 40);
    WorkerPoolOptions options = test_options();
    options.max_concurrency = 2;
    PredictorWorkerPool pool(predictor, options);

    std::vector<PartitionFile> parts;
    for (int i = 0; i < 6; ++i) {
        parts.push_back(partition(dir(), "chr" + std::to_string(i)));
    }
    auto results = pool.run_all(parts);

    ASSERT_EQ(results.size(), 6u);
    for (const auto& r : results) {
        EXPECT_TRUE(r.success);
    }
    EXPECT_LE(predictor.max_running(), 2);
    EXPECT_EQ(predictor.calls(), 6);
}

TEST_F(WorkerPoolTest, CancelStopsRunningAndPending) {
    FakePredictor predictor({}, 10000);
    WorkerPoolOptions options = test_options();
    options.max_concurrency = 1;
    PredictorWorkerPool pool(predictor, options);

    std::vector<PartitionFile> parts = {partition(dir(), "chr1"), partition(dir(), "chr2"), partition(dir(), "chr3")};

    std::thread canceller([&pool]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        pool.cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    auto results = pool.run_all(parts);
    canceller.join();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_TRUE(pool.is_cancelled());
    ASSERT_EQ(results.size(), 3u);
    for (const auto& r : results) {
        EXPECT_FALSE(r.success);
        EXPECT_NE(r.error_text.find("cancelled"), std::string::npos);
    }
    EXPECT_EQ(results[2].error_text, "cancelled: not started");
    EXPECT_EQ(predictor.calls(), 1);
}

// ============================================================================
// ExternalPredictor with real child processes
// ============================================================================

TEST_F(WorkerPoolTest, ExternalPredictorSuccess) {
    ExternalPredictorOptions options;
    options.executable = write_script("ok.sh",
                                      "echo \"$1 $2 $3\" > \"$4.Z-SCORE\"\n"
                                      "echo '10 0.1 0.2 350.0 CGCGCGCGCGCG' > \"$4.probability\"\n"
                                      "exit 0\n");
    ExternalPredictor predictor(options);

    EXPECT_EQ(predictor.build_command(partition(dir(), "x")),
              (std::vector<std::string>{options.executable, "12", "8", "12", dir() + "/x.fa"}));

    PredictorWorkerPool pool(predictor, test_options());
    auto results = pool.run_all({write_partition("chr1")});

    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].success) << results[0].error_text;
    EXPECT_EQ(results[0].output_artifact_paths.size(), 2u);
    EXPECT_TRUE(fs::exists(dir() + "/chr1.fa.probability"));

    std::ifstream args(dir() + "/chr1.fa.Z-SCORE");
    std::string line;
    std::getline(args, line);
    EXPECT_EQ(line, "12 8 12");

    auto progress = pool.progress().get("chr1");
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->status, PartitionStatus::COMPLETED);
}

TEST_F(WorkerPoolTest, ExternalPredictorNonZeroExitCapturesStderr) {
    ExternalPredictorOptions options;
    options.executable = write_script("fail.sh", "echo 'cannot allocate window' >&2\nexit 3\n");
    ExternalPredictor predictor(options);
    PredictorWorkerPool pool(predictor, test_options());

    auto results = pool.run_all({write_partition("chr1"), write_partition("chr2")});
    ASSERT_EQ(results.size(), 2u);
    for (const auto& r : results) {
        EXPECT_FALSE(r.success);
        EXPECT_NE(r.error_text.find("exit code 3"), std::string::npos) << r.error_text;
        EXPECT_NE(r.error_text.find("cannot allocate window"), std::string::npos) << r.error_text;
    }
}

TEST_F(WorkerPoolTest, ExternalPredictorMissingFinalArtifactFails) {
    ExternalPredictorOptions options;
    options.executable = write_script("silent.sh", "exit 0\n");
    ExternalPredictor predictor(options);

    CancellationToken token;
    auto outcome = predictor.run(write_partition("chr1"), token);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error->kind, ProcessErrorKind::NON_ZERO_EXIT);
}

TEST_F(WorkerPoolTest, ExternalPredictorLaunchFailure) {
    ExternalPredictorOptions options;
    options.executable = dir() + "/no_such_predictor";
    ExternalPredictor predictor(options);

    CancellationToken token;
    auto outcome = predictor.run(write_partition("chr1"), token);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error->kind, ProcessErrorKind::LAUNCH_FAILURE);
}

TEST_F(WorkerPoolTest, ExternalPredictorTimeout) {
    ExternalPredictorOptions options;
    options.executable = write_script("slow.sh", "sleep 30\n");
    options.timeout_sec = 1;
    options.grace_period_ms = 200;
    ExternalPredictor predictor(options);

    CancellationToken token;
    const auto start = std::chrono::steady_clock::now();
    auto outcome = predictor.run(write_partition("chr1"), token);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error->kind, ProcessErrorKind::TIMEOUT);
}

TEST_F(WorkerPoolTest, ExternalPredictorKillsProcessIgnoringTerm) {
    // The shell and its background child both ignore SIGTERM
    ExternalPredictorOptions options;
    options.executable = write_script("stubborn.sh",
                                      "trap '' TERM\n"
                                      "sleep 30 &\n"
                                      "echo $! > \"$4.child\"\n"
                                      "wait\n");
    options.grace_period_ms = 300;
    ExternalPredictor predictor(options);

    PartitionFile p = write_partition("chr1");
    CancellationToken token;
    std::thread canceller([&token, &p]() {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!fs::exists(p.sequence_file + ".child") && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    auto outcome = predictor.run(p, token);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error->kind, ProcessErrorKind::CANCELLED);
    EXPECT_EQ(outcome.error->exit_code, SIGKILL);
    EXPECT_GE(elapsed, std::chrono::milliseconds(300));
    EXPECT_LT(elapsed, std::chrono::seconds(10));

    // The grandchild was in the same process group and is gone as well
    pid_t child = 0;
    std::ifstream(p.sequence_file + ".child") >> child;
    ASSERT_GT(child, 0);
    bool gone = false;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (std::chrono::steady_clock::now() < deadline) {
        if (kill(child, 0) != 0 && errno == ESRCH) {
            gone = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_TRUE(gone);
}

TEST_F(WorkerPoolTest, PoolCancelStopsRunningExternalPredictor) {
    ExternalPredictorOptions options;
    options.executable = write_script("computing.sh",
                                      "echo running > \"$4.Z-SCORE\"\n"
                                      "trap '' TERM\n"
                                      "sleep 30\n");
    options.grace_period_ms = 200;
    ExternalPredictor predictor(options);

    WorkerPoolOptions pool_options = test_options();
    pool_options.max_concurrency = 1;
    PredictorWorkerPool pool(predictor, pool_options);

    std::vector<PartitionFile> parts = {write_partition("chr1"), write_partition("chr2")};

    bool saw_computing = false;
    std::thread canceller([&pool, &saw_computing]() {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline) {
            auto progress = pool.progress().get("chr1");
            if (progress && progress->status == PartitionStatus::COMPUTING) {
                saw_computing = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        pool.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    auto results = pool.run_all(parts);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_TRUE(saw_computing);
    EXPECT_LT(elapsed, std::chrono::seconds(10));

    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].success);
    EXPECT_NE(results[0].error_text.find("cancelled while running"), std::string::npos) << results[0].error_text;
    EXPECT_FALSE(results[1].success);
    EXPECT_EQ(results[1].error_text, "cancelled: not started");
}

TEST_F(WorkerPoolTest, ExternalPredictorCancelledBeforeLaunch) {
    ExternalPredictorOptions options;
    options.executable = write_script("never.sh", "touch \"$4.probability\"\n");
    ExternalPredictor predictor(options);

    CancellationToken token;
    token.cancel();
    auto outcome = predictor.run(write_partition("chr1"), token);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error->kind, ProcessErrorKind::CANCELLED);
    EXPECT_FALSE(fs::exists(dir() + "/chr1.fa.probability"));
}

TEST_F(WorkerPoolTest, ExternalPredictorReusesExistingArtifacts) {
    ExternalPredictorOptions options;
    options.executable = dir() + "/no_such_predictor";
    options.reuse_existing = true;
    ExternalPredictor predictor(options);

    PartitionFile p = write_partition("chr1");
    std::ofstream(predictor.final_path(p)) << "10 0 0 350\n";

    CancellationToken token;
    auto outcome = predictor.run(p, token);
    EXPECT_TRUE(outcome.ok());
    EXPECT_TRUE(outcome.artifacts.reused);
}
