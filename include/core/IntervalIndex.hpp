#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/DataStructs.hpp"

namespace MotifColoc {

/**
 * @brief A feature as stored in the index; ref is its position in the input collection.
 */
struct IndexedFeature {
    int64_t start = 0;
    int64_t end = 0;
    size_t ref = 0;
};

/**
 * @brief Per-sequence features sorted by start, for window and overlap queries.
 *
 * build() is O(n log n). query_window() binary-searches the start range
 * [pos - window, pos + window] and returns it, O(log n + k).
 * query_overlap() bounds its scan with the longest feature of the sequence,
 * so it stays O(log n + k) unless lengths vary wildly.
 *
 * Immutable after build(); concurrent queries are safe.
 */
class IntervalIndex {
public:
    IntervalIndex() = default;

    static IntervalIndex build(const std::vector<GenomicInterval>& features);

    /**
     * @brief Features on sequence_id whose start s satisfies |s - pos| <= window.
     * @return Sorted by start; empty for unknown sequences.
     */
    std::vector<IndexedFeature> query_window(const std::string& sequence_id, int64_t pos, int64_t window) const;

    /**
     * @brief Features intersecting query as half-open intervals
     *        (f.start < q.end && q.start < f.end).
     */
    std::vector<IndexedFeature> query_overlap(const GenomicInterval& query) const;

    /// Sorted features of one sequence, nullptr if none.
    const std::vector<IndexedFeature>* features(const std::string& sequence_id) const;

    std::vector<std::string> sequence_ids() const;

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

private:
    struct Bucket {
        std::vector<IndexedFeature> features;
        int64_t max_length = 0;
    };

    std::unordered_map<std::string, Bucket> buckets_;
    size_t size_ = 0;
};

/// Spans of candidates, in the same order.
std::vector<GenomicInterval> to_intervals(const std::vector<MotifCandidate>& candidates);

} // namespace MotifColoc
