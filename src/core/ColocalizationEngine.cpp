#include "core/ColocalizationEngine.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <unordered_set>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace MotifColoc {

std::vector<ColocalizationPair> ColocalizationEngine::find_proximal(const std::vector<GenomicInterval>& a,
                                                                    const std::vector<GenomicInterval>& b,
                                                                    int64_t window) {
    if (window < 0) {
        throw ConfigError("colocalization window must be non-negative (got " + std::to_string(window) + ")");
    }

    std::vector<ColocalizationPair> pairs;
    if (a.empty() || b.empty()) {
        return pairs;
    }

    const IntervalIndex index = IntervalIndex::build(b);

    for (size_t i = 0; i < a.size(); ++i) {
        const auto& fa = a[i];
        for (const auto& hit : index.query_window(fa.sequence_id, fa.start, window)) {
            ColocalizationPair p;
            p.sequence_id = fa.sequence_id;
            p.position_a = fa.start;
            p.position_b = hit.start;
            p.distance = hit.start >= fa.start ? hit.start - fa.start : fa.start - hit.start;
            p.ref_a = i;
            p.ref_b = hit.ref;
            pairs.push_back(std::move(p));
        }
    }

    std::sort(pairs.begin(), pairs.end(), [](const ColocalizationPair& x, const ColocalizationPair& y) {
        if (x.sequence_id != y.sequence_id) return x.sequence_id < y.sequence_id;
        if (x.position_a != y.position_a) return x.position_a < y.position_a;
        if (x.position_b != y.position_b) return x.position_b < y.position_b;
        if (x.ref_a != y.ref_a) return x.ref_a < y.ref_a;
        return x.ref_b < y.ref_b;
    });

    LOG_DEBUG("find_proximal: " + std::to_string(a.size()) + " x " + std::to_string(b.size()) + " features, window " +
              std::to_string(window) + " -> " + std::to_string(pairs.size()) + " pairs");
    return pairs;
}

std::vector<ColocalizationPair> ColocalizationEngine::find_proximal(const std::vector<MotifCandidate>& a,
                                                                    const std::vector<MotifCandidate>& b,
                                                                    int64_t window) {
    return find_proximal(to_intervals(a), to_intervals(b), window);
}

std::vector<ColocalizationPair> ColocalizationEngine::find_overlapping(const std::vector<GenomicInterval>& features,
                                                                       const std::vector<GenomicInterval>& regions) {
    std::vector<ColocalizationPair> pairs;
    if (features.empty() || regions.empty()) {
        return pairs;
    }

    const IntervalIndex index = IntervalIndex::build(regions);

    for (size_t i = 0; i < features.size(); ++i) {
        const auto& f = features[i];
        for (const auto& hit : index.query_overlap(f)) {
            ColocalizationPair p;
            p.sequence_id = f.sequence_id;
            p.position_a = f.start;
            p.position_b = hit.start;
            p.distance = std::min(f.end, hit.end) - std::max(f.start, hit.start);
            p.ref_a = i;
            p.ref_b = hit.ref;
            pairs.push_back(std::move(p));
        }
    }
    return pairs;
}

ColocalizationSummary ColocalizationEngine::summarize(const std::vector<ColocalizationPair>& pairs) {
    ColocalizationSummary s;
    s.pair_count = pairs.size();
    if (pairs.empty()) {
        return s;
    }

    std::unordered_set<size_t> refs_a;
    std::unordered_set<size_t> refs_b;
    double total = 0.0;
    for (const auto& p : pairs) {
        refs_a.insert(p.ref_a);
        refs_b.insert(p.ref_b);
        total += static_cast<double>(p.distance);
    }
    s.distinct_a = refs_a.size();
    s.distinct_b = refs_b.size();
    s.mean_distance = total / static_cast<double>(pairs.size());
    return s;
}

std::vector<SequenceColocalization> ColocalizationEngine::summarize_by_sequence(
    const std::vector<GenomicInterval>& a, const std::vector<GenomicInterval>& b,
    const std::vector<ColocalizationPair>& pairs) {
    std::map<std::string, SequenceColocalization> by_seq;
    auto entry = [&by_seq](const std::string& id) -> SequenceColocalization& {
        auto& e = by_seq[id];
        e.sequence_id = id;
        return e;
    };

    for (const auto& f : a) {
        ++entry(f.sequence_id).count_a;
    }
    for (const auto& f : b) {
        ++entry(f.sequence_id).count_b;
    }
    for (const auto& p : pairs) {
        ++entry(p.sequence_id).pair_count;
    }

    std::vector<SequenceColocalization> out;
    out.reserve(by_seq.size());
    for (auto& kv : by_seq) {
        auto& e = kv.second;
        e.rate = e.count_a > 0 ? static_cast<double>(e.pair_count) / static_cast<double>(e.count_a) : 0.0;
        out.push_back(e);
    }
    return out;
}

std::vector<std::string> ColocalizationEngine::collect_gene_ids(const std::vector<ColocalizationPair>& pairs,
                                                                const std::vector<std::string>& region_gene_ids) {
    std::set<std::string> ids;
    for (const auto& p : pairs) {
        if (p.ref_b < region_gene_ids.size() && !region_gene_ids[p.ref_b].empty()) {
            ids.insert(region_gene_ids[p.ref_b]);
        }
    }
    return std::vector<std::string>(ids.begin(), ids.end());
}

} // namespace MotifColoc
