#include "core/PredictorWorkerPool.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_set>

#include "utils/InterruptHandler.hpp"
#include "utils/Logger.hpp"

namespace MotifColoc {

PredictorWorkerPool::PredictorWorkerPool(const Predictor& predictor, WorkerPoolOptions options)
    : predictor_(predictor), options_(std::move(options)) {}

void PredictorWorkerPool::cancel() {
    if (!cancel_.is_cancelled()) {
        LOG_WARNING("Predictor stage cancelled; terminating running workers");
    }
    cancel_.cancel();
}

int PredictorWorkerPool::effective_concurrency(size_t partition_count, int configured) {
    int64_t cpus = static_cast<int64_t>(std::thread::hardware_concurrency());
    if (cpus <= 0) {
        cpus = 1;
    }
    int64_t n = std::min<int64_t>(cpus, static_cast<int64_t>(partition_count));
    if (configured > 0) {
        n = std::min<int64_t>(n, configured);
    }
    return static_cast<int>(std::max<int64_t>(1, n));
}

std::vector<PartitionFile> PredictorWorkerPool::select_partitions(const std::vector<PartitionFile>& partitions) const {
    std::unordered_set<std::string> only(options_.only_partitions.begin(), options_.only_partitions.end());

    std::vector<PartitionFile> selected;
    for (const auto& p : partitions) {
        if (!only.empty() && !only.count(p.partition_id)) {
            LOG_DEBUG("[" + p.partition_id + "] not in the requested partition list, skipped");
            continue;
        }
        if (p.sequence_length < options_.min_partition_length) {
            LOG_INFO("[" + p.partition_id + "] " + std::to_string(p.sequence_length) + " bp is below " +
                     std::to_string(options_.min_partition_length) + " bp, not sent to the predictor");
            continue;
        }
        selected.push_back(p);
    }

    for (const auto& id : options_.only_partitions) {
        bool known = std::any_of(partitions.begin(), partitions.end(),
                                 [&id](const PartitionFile& p) { return p.partition_id == id; });
        if (!known) {
            LOG_WARNING("Requested partition '" + id + "' does not exist in the input");
        }
    }

    return selected;
}

WorkerResult PredictorWorkerPool::run_one(const PartitionFile& partition) const {
    WorkerResult result;
    result.partition_id = partition.partition_id;

    const auto start = std::chrono::steady_clock::now();

    try {
        PredictorOutcome outcome = predictor_.run(partition, cancel_);
        if (outcome.ok()) {
            result.success = true;
            result.reused = outcome.artifacts.reused;
            for (const auto& path : outcome.artifacts.paths()) {
                if (!path.empty() && std::filesystem::exists(path)) {
                    result.output_artifact_paths.push_back(path);
                }
            }
        } else {
            const ProcessError& err = *outcome.error;
            result.success = false;
            result.error_text = ProcessError::kind_to_string(err.kind) + ": " + err.message;
        }
    } catch (const std::exception& e) {
        result.success = false;
        result.error_text = std::string("launch_failure: ") + e.what();
    }

    result.elapsed_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    if (result.success) {
        oss << "[" << result.partition_id << "] " << (result.reused ? "reused" : "finished") << " in "
            << result.elapsed_seconds << " s";
        LOG_INFO(oss.str());
    } else {
        oss << "[" << result.partition_id << "] failed after " << result.elapsed_seconds << " s: "
            << result.error_text;
        LOG_ERROR(oss.str());
    }
    return result;
}

std::vector<WorkerResult> PredictorWorkerPool::run_all(const std::vector<PartitionFile>& partitions) {
    const std::vector<PartitionFile> selected = select_partitions(partitions);
    if (selected.empty()) {
        LOG_INFO("No partitions eligible for the predictor");
        return {};
    }

    const int workers = effective_concurrency(selected.size(), options_.max_concurrency);
    LOG_INFO("Running predictor on " + std::to_string(selected.size()) + " partitions with " +
             std::to_string(workers) + " concurrent workers");

    std::vector<WatchedPartition> watched;
    watched.reserve(selected.size());
    for (const auto& p : selected) {
        watched.push_back({p.partition_id, predictor_.intermediate_path(p), predictor_.final_path(p)});
    }

    ProgressMonitor monitor(board_, std::move(watched), options_.poll_interval);
    monitor.start();

    std::vector<WorkerResult> results(selected.size());
    std::vector<char> launched(selected.size(), 0);
    std::atomic<size_t> next_index{0};

    std::mutex done_mutex;
    std::condition_variable done_cv;
    int workers_done = 0;

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (int w = 0; w < workers; ++w) {
        threads.emplace_back([&, w]() {
            Utils::Logger::set_thread_name("worker-" + std::to_string(w));
            while (!cancel_.is_cancelled()) {
                const size_t idx = next_index.fetch_add(1);
                if (idx >= selected.size()) {
                    break;
                }
                launched[idx] = 1;
                results[idx] = run_one(selected[idx]);
            }
            {
                std::lock_guard<std::mutex> lock(done_mutex);
                ++workers_done;
            }
            done_cv.notify_all();
        });
    }

    // Supervise: relay process-level interrupts into the cancellation token
    {
        std::unique_lock<std::mutex> lock(done_mutex);
        while (workers_done < workers) {
            done_cv.wait_for(lock, std::chrono::milliseconds(100));
            if (options_.observe_interrupts && Utils::InterruptHandler::interrupted() && !cancel_.is_cancelled()) {
                LOG_WARNING("Interrupt received (signal " + std::to_string(Utils::InterruptHandler::last_signal()) +
                            ")");
                lock.unlock();
                cancel();
                lock.lock();
            }
        }
    }

    for (auto& t : threads) {
        t.join();
    }

    monitor.stop();
    monitor.poll_once();

    size_t succeeded = 0;
    for (size_t i = 0; i < selected.size(); ++i) {
        if (!launched[i]) {
            results[i].partition_id = selected[i].partition_id;
            results[i].success = false;
            results[i].error_text = ProcessError::kind_to_string(ProcessErrorKind::CANCELLED) + ": not started";
        }
        if (results[i].success) {
            ++succeeded;
        }
    }

    LOG_INFO("Predictor stage: " + std::to_string(succeeded) + "/" + std::to_string(selected.size()) +
             " partitions succeeded");
    return results;
}

} // namespace MotifColoc
