#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/Types.hpp"

namespace MotifColoc {

/**
 * @brief Advisory status of one partition, derived from artifact metadata only.
 */
struct PartitionProgress {
    PartitionStatus status = PartitionStatus::STARTING;
    uintmax_t intermediate_bytes = 0;  ///< Size of the intermediate artifact (may be mid-write)
    uintmax_t final_bytes = 0;         ///< Size of the final artifact
};

/**
 * @brief Progress-status map owned by the worker pool.
 *
 * The monitor is the only writer; callers read snapshots. A mutex guards the
 * map, readers never block the writer for longer than a copy.
 */
class ProgressBoard {
public:
    /**
     * @brief Stores the progress of a partition.
     * @return true if the status changed (or the partition is new).
     */
    bool update(const std::string& partition_id, const PartitionProgress& progress);

    std::optional<PartitionProgress> get(const std::string& partition_id) const;

    std::map<std::string, PartitionProgress> snapshot() const;

    /// Number of partitions currently in the given status.
    size_t count(PartitionStatus status) const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::map<std::string, PartitionProgress> entries_;
};

/**
 * @brief Files the monitor watches for one partition.
 */
struct WatchedPartition {
    std::string partition_id;
    std::string intermediate_path;
    std::string final_path;
};

/**
 * @brief Periodic background task that polls artifact sizes.
 *
 * Status per partition: final artifact present -> COMPLETED; intermediate
 * present -> COMPUTING; otherwise STARTING. Transitions are logged at INFO,
 * every poll at DEBUG. Never opens the artifacts, only stats them.
 *
 * Usage:
 *   ProgressMonitor monitor(board, watched, std::chrono::milliseconds(2000));
 *   monitor.start();
 *   ...
 *   monitor.stop();
 */
class ProgressMonitor {
public:
    ProgressMonitor(ProgressBoard& board, std::vector<WatchedPartition> partitions,
                    std::chrono::milliseconds interval);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    /// Starts the polling thread (first poll is immediate).
    void start();

    /// Signals the thread to stop and joins it. Idempotent.
    void stop();

    /// One synchronous poll of every watched partition.
    void poll_once();

    bool is_running() const { return thread_.joinable(); }

private:
    void loop();

    ProgressBoard& board_;
    std::vector<WatchedPartition> partitions_;
    std::chrono::milliseconds interval_;

    std::thread thread_;
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_ = false;
};

} // namespace MotifColoc
