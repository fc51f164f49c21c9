#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "core/DataStructs.hpp"
#include "core/Predictor.hpp"
#include "core/ProgressMonitor.hpp"

namespace MotifColoc {

/**
 * @brief Scheduling parameters of the predictor stage.
 */
struct WorkerPoolOptions {
    int max_concurrency = 0;                      ///< Upper bound on concurrent predictors, <= 0 = CPU count
    int64_t min_partition_length = 1048576;       ///< Shorter partitions are not sent to the predictor
    std::chrono::milliseconds poll_interval{2000};  ///< Progress monitor interval
    std::vector<std::string> only_partitions;     ///< If non-empty, restrict the run to these ids
    bool observe_interrupts = true;               ///< Treat SIGINT/SIGTERM as cancel()
};

/**
 * @brief Bounded pool running one Predictor invocation per partition.
 *
 * Concurrency is max(1, min(CPU count, partition count, max_concurrency)).
 * Worker threads take partitions from a shared index; each blocks on its own
 * predictor call, so at most that many predictor processes exist at once.
 * A progress monitor runs alongside and writes the pool's ProgressBoard.
 *
 * A failure of one partition never stops the others; there is no retry.
 * cancel() (or SIGINT/SIGTERM when observe_interrupts is set) stops handing
 * out partitions and makes running predictors terminate their processes.
 * Partitions never started are reported as failed with "cancelled".
 *
 * A pool is meant for one run_all(); once cancelled it stays cancelled.
 */
class PredictorWorkerPool {
public:
    PredictorWorkerPool(const Predictor& predictor, WorkerPoolOptions options);

    /**
     * @brief Runs the predictor over every eligible partition.
     *
     * Returns immediately with an empty list, spawning nothing, when no
     * partition is eligible.
     *
     * @return One WorkerResult per eligible partition, in input order.
     */
    std::vector<WorkerResult> run_all(const std::vector<PartitionFile>& partitions);

    /// Requests cancellation; safe from any thread.
    void cancel();

    bool is_cancelled() const { return cancel_.is_cancelled(); }

    /// Live per-partition status (advisory).
    const ProgressBoard& progress() const { return board_; }

    /**
     * @brief Partitions that pass the size threshold and the only_partitions filter.
     */
    std::vector<PartitionFile> select_partitions(const std::vector<PartitionFile>& partitions) const;

    /**
     * @brief max(1, min(available CPUs, partition_count, configured)); configured <= 0 means no limit.
     */
    static int effective_concurrency(size_t partition_count, int configured);

private:
    WorkerResult run_one(const PartitionFile& partition) const;

    const Predictor& predictor_;
    WorkerPoolOptions options_;
    CancellationToken cancel_;
    ProgressBoard board_;
};

} // namespace MotifColoc
