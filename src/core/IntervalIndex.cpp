#include "core/IntervalIndex.hpp"

#include <algorithm>

namespace MotifColoc {

namespace {

bool start_less(const IndexedFeature& f, int64_t value) {
    return f.start < value;
}

bool value_less(int64_t value, const IndexedFeature& f) {
    return value < f.start;
}

}  // namespace

IntervalIndex IntervalIndex::build(const std::vector<GenomicInterval>& features) {
    IntervalIndex index;
    for (size_t i = 0; i < features.size(); ++i) {
        const auto& f = features[i];
        Bucket& bucket = index.buckets_[f.sequence_id];
        bucket.features.push_back({f.start, f.end, i});
        bucket.max_length = std::max(bucket.max_length, f.end - f.start);
    }

    for (auto& kv : index.buckets_) {
        std::stable_sort(kv.second.features.begin(), kv.second.features.end(),
                         [](const IndexedFeature& a, const IndexedFeature& b) {
                             if (a.start != b.start) return a.start < b.start;
                             return a.end < b.end;
                         });
    }
    index.size_ = features.size();
    return index;
}

std::vector<IndexedFeature> IntervalIndex::query_window(const std::string& sequence_id, int64_t pos,
                                                        int64_t window) const {
    std::vector<IndexedFeature> hits;
    auto it = buckets_.find(sequence_id);
    if (it == buckets_.end() || window < 0) {
        return hits;
    }

    const auto& fs = it->second.features;
    auto lo = std::lower_bound(fs.begin(), fs.end(), pos - window, start_less);
    auto hi = std::upper_bound(lo, fs.end(), pos + window, value_less);
    hits.assign(lo, hi);
    return hits;
}

std::vector<IndexedFeature> IntervalIndex::query_overlap(const GenomicInterval& query) const {
    std::vector<IndexedFeature> hits;
    auto it = buckets_.find(query.sequence_id);
    if (it == buckets_.end()) {
        return hits;
    }

    const Bucket& bucket = it->second;
    const auto& fs = bucket.features;

    // Any overlapping feature ends after query.start, so it starts after query.start - max_length
    auto lo = std::lower_bound(fs.begin(), fs.end(), query.start - bucket.max_length, start_less);
    for (auto f = lo; f != fs.end() && f->start < query.end; ++f) {
        if (query.start < f->end) {
            hits.push_back(*f);
        }
    }
    return hits;
}

const std::vector<IndexedFeature>* IntervalIndex::features(const std::string& sequence_id) const {
    auto it = buckets_.find(sequence_id);
    return it == buckets_.end() ? nullptr : &it->second.features;
}

std::vector<std::string> IntervalIndex::sequence_ids() const {
    std::vector<std::string> ids;
    ids.reserve(buckets_.size());
    for (const auto& kv : buckets_) {
        ids.push_back(kv.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<GenomicInterval> to_intervals(const std::vector<MotifCandidate>& candidates) {
    std::vector<GenomicInterval> intervals;
    intervals.reserve(candidates.size());
    for (const auto& c : candidates) {
        intervals.emplace_back(c.sequence_id, c.start, c.end);
    }
    return intervals;
}

} // namespace MotifColoc
