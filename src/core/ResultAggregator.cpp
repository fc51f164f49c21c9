#include "core/ResultAggregator.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_set>

#include "utils/Logger.hpp"

namespace MotifColoc {

namespace {

int run_class(const MotifCandidate& c) {
    return c.motif_class == MotifClass::QUADRUPLEX_REPEAT ? c.quadruplex.g_run_length : 0;
}

bool same_span(const MotifCandidate& a, const MotifCandidate& b) {
    return a.sequence_id == b.sequence_id && a.start == b.start && a.end == b.end && a.motif_class == b.motif_class;
}

// Sorts, then removes exact duplicates; returns number removed
size_t sort_unique(std::vector<MotifCandidate>& v) {
    std::stable_sort(v.begin(), v.end(), ResultAggregator::candidate_less);
    auto last = std::unique(v.begin(), v.end(), [](const MotifCandidate& a, const MotifCandidate& b) {
        return same_span(a, b) && run_class(a) == run_class(b);
    });
    size_t removed = static_cast<size_t>(std::distance(last, v.end()));
    v.erase(last, v.end());
    return removed;
}

}  // namespace

ResultAggregator::ResultAggregator(bool dedupe_overlapping_classes)
    : dedupe_overlapping_classes_(dedupe_overlapping_classes) {}

bool ResultAggregator::candidate_less(const MotifCandidate& a, const MotifCandidate& b) {
    if (a.sequence_id != b.sequence_id) return a.sequence_id < b.sequence_id;
    if (a.start != b.start) return a.start < b.start;
    if (a.end != b.end) return a.end < b.end;
    if (a.motif_class != b.motif_class) return a.motif_class < b.motif_class;
    if (run_class(a) != run_class(b)) return run_class(a) < run_class(b);
    return a.score > b.score;
}

void ResultAggregator::add_candidates(std::vector<MotifCandidate> candidates) {
    for (auto& c : candidates) {
        if (c.motif_class == MotifClass::QUADRUPLEX_REPEAT) {
            quadruplexes_.push_back(std::move(c));
        } else {
            alternatives_.push_back(std::move(c));
        }
    }
}

void ResultAggregator::add_worker_results(const std::vector<WorkerResult>& results) {
    worker_results_.insert(worker_results_.end(), results.begin(), results.end());
}

AggregatedResults ResultAggregator::finalize() {
    AggregatedResults out;

    std::unordered_set<std::string> failed_ids;
    for (const auto& r : worker_results_) {
        ++out.partitions_attempted;
        if (r.success) {
            ++out.partitions_succeeded;
            if (r.reused) {
                ++out.partitions_reused;
            }
        } else {
            failed_ids.insert(r.partition_id);
            out.failures.push_back({r.partition_id, r.error_text.empty() ? "unknown error" : r.error_text});
        }
    }
    std::sort(out.failures.begin(), out.failures.end(),
              [](const PartitionFailure& a, const PartitionFailure& b) { return a.partition_id < b.partition_id; });

    if (!failed_ids.empty()) {
        auto keep_end = std::remove_if(alternatives_.begin(), alternatives_.end(), [&](const MotifCandidate& c) {
            return failed_ids.count(c.sequence_id) > 0;
        });
        out.dropped_from_failed = static_cast<size_t>(std::distance(keep_end, alternatives_.end()));
        alternatives_.erase(keep_end, alternatives_.end());
    }

    out.duplicates_removed += sort_unique(quadruplexes_);
    out.duplicates_removed += sort_unique(alternatives_);

    if (dedupe_overlapping_classes_) {
        // Sorted by run class within a span, so the first one is the smallest class
        auto last = std::unique(quadruplexes_.begin(), quadruplexes_.end(), same_span);
        out.class_overlaps_collapsed = static_cast<size_t>(std::distance(last, quadruplexes_.end()));
        quadruplexes_.erase(last, quadruplexes_.end());
    }

    out.quadruplexes = std::move(quadruplexes_);
    out.alternatives = std::move(alternatives_);
    quadruplexes_.clear();
    alternatives_.clear();
    worker_results_.clear();

    LOG_INFO("Aggregated " + std::to_string(out.quadruplexes.size()) + " quadruplex and " +
             std::to_string(out.alternatives.size()) + " alternative-structure candidates; " +
             std::to_string(out.failures.size()) + " failed partitions");
    if (out.duplicates_removed > 0) {
        LOG_DEBUG("Removed " + std::to_string(out.duplicates_removed) + " duplicate candidates");
    }
    if (out.dropped_from_failed > 0) {
        LOG_WARNING("Dropped " + std::to_string(out.dropped_from_failed) +
                    " alternative-structure candidates belonging to failed partitions");
    }
    return out;
}

RunStatus classify_run(const AggregatedResults& results) {
    if (results.partitions_attempted > 0 && results.partitions_succeeded == 0) {
        return RunStatus::FAILURE;
    }
    if (results.total_candidates() == 0) {
        return RunStatus::FAILURE;
    }
    if (!results.failures.empty()) {
        return RunStatus::PARTIAL_SUCCESS;
    }
    return RunStatus::COMPLETE_SUCCESS;
}

int exit_code_for(RunStatus status) {
    switch (status) {
        case RunStatus::COMPLETE_SUCCESS: return 0;
        case RunStatus::PARTIAL_SUCCESS: return 2;
        case RunStatus::FAILURE: return 1;
    }
    return 1;
}

} // namespace MotifColoc
