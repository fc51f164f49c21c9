#pragma once

#include <string>
#include <vector>

#include "core/DataStructs.hpp"
#include "core/Types.hpp"

namespace MotifColoc {

/**
 * @brief Global, sorted collections of one run.
 */
struct AggregatedResults {
    std::vector<MotifCandidate> quadruplexes;  ///< QUADRUPLEX_REPEAT, sorted
    std::vector<MotifCandidate> alternatives;  ///< ALTERNATIVE_STRUCTURE, sorted
    std::vector<PartitionFailure> failures;    ///< Sorted by partition id

    size_t partitions_attempted = 0;
    size_t partitions_succeeded = 0;
    size_t partitions_reused = 0;
    size_t duplicates_removed = 0;
    size_t class_overlaps_collapsed = 0;
    size_t dropped_from_failed = 0;  ///< Alternative candidates of failed partitions

    size_t total_candidates() const { return quadruplexes.size() + alternatives.size(); }
};

/**
 * @brief Merges per-partition candidates and worker results.
 *
 * Candidates are routed by motif_class and sorted by
 * (sequence_id, start, end, run-length class, score). Exact duplicates (same
 * span, class and run-length class) are removed. Candidates of overlapping
 * run-length classes are kept unless dedupe_overlapping_classes is set, in
 * which case identical quadruplex spans keep only the smallest class.
 * Alternative-structure candidates of a failed partition are dropped.
 *
 * Not thread-safe; feed it from one thread.
 */
class ResultAggregator {
public:
    explicit ResultAggregator(bool dedupe_overlapping_classes = false);

    void add_candidates(std::vector<MotifCandidate> candidates);

    void add_worker_results(const std::vector<WorkerResult>& results);

    /// Produces the sorted collections; the aggregator is empty afterwards.
    AggregatedResults finalize();

    /// Ordering used for every collection.
    static bool candidate_less(const MotifCandidate& a, const MotifCandidate& b);

private:
    bool dedupe_overlapping_classes_;
    std::vector<MotifCandidate> quadruplexes_;
    std::vector<MotifCandidate> alternatives_;
    std::vector<WorkerResult> worker_results_;
};

/**
 * @brief Overall outcome of a run.
 *
 * FAILURE if predictor partitions were attempted and none succeeded, or no
 * candidates of any class exist; PARTIAL_SUCCESS if some partitions failed;
 * COMPLETE_SUCCESS otherwise.
 */
RunStatus classify_run(const AggregatedResults& results);

/// Process exit code for a status: 0 complete, 2 partial, 1 failure.
int exit_code_for(RunStatus status);

} // namespace MotifColoc
