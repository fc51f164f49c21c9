#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/DataStructs.hpp"
#include "core/IntervalIndex.hpp"

namespace MotifColoc {

/**
 * @brief Aggregate statistics of a pair list.
 */
struct ColocalizationSummary {
    size_t pair_count = 0;
    size_t distinct_a = 0;      ///< A-side features with at least one partner
    size_t distinct_b = 0;      ///< B-side features with at least one partner
    double mean_distance = 0.0;  ///< 0 when there are no pairs
};

/**
 * @brief Per-sequence proximity counts.
 */
struct SequenceColocalization {
    std::string sequence_id;
    size_t count_a = 0;
    size_t count_b = 0;
    size_t pair_count = 0;
    double rate = 0.0;  ///< pair_count / count_a, 0 when count_a is 0
};

/**
 * @brief Relates two feature collections by proximity or overlap.
 *
 * All operations index the second collection once and query it with every
 * feature of the first, O((|A| + |B|) log |B| + pairs) per sequence.
 */
class ColocalizationEngine {
public:
    /**
     * @brief All (a, b) on the same sequence with |b.start - a.start| <= window.
     *
     * position_a/position_b are the start coordinates, ref_a/ref_b the
     * indices in a/b. Swapping a and b yields the same pairs with the
     * positions swapped.
     *
     * @return Sorted by (sequence_id, position_a, position_b, ref_a, ref_b).
     * @throws ConfigError if window is negative.
     */
    static std::vector<ColocalizationPair> find_proximal(const std::vector<GenomicInterval>& a,
                                                         const std::vector<GenomicInterval>& b, int64_t window);

    static std::vector<ColocalizationPair> find_proximal(const std::vector<MotifCandidate>& a,
                                                         const std::vector<MotifCandidate>& b, int64_t window);

    /**
     * @brief All (feature, region) pairs intersecting as half-open intervals.
     *
     * distance is the overlap extent min(end) - max(start); ref_a indexes
     * features, ref_b regions.
     *
     * @return In feature order, then by region start.
     */
    static std::vector<ColocalizationPair> find_overlapping(const std::vector<GenomicInterval>& features,
                                                            const std::vector<GenomicInterval>& regions);

    static ColocalizationSummary summarize(const std::vector<ColocalizationPair>& pairs);

    /**
     * @brief Per-sequence counts, sorted by sequence id; covers every
     *        sequence present in a or b.
     */
    static std::vector<SequenceColocalization> summarize_by_sequence(const std::vector<GenomicInterval>& a,
                                                                     const std::vector<GenomicInterval>& b,
                                                                     const std::vector<ColocalizationPair>& pairs);

    /**
     * @brief Sorted distinct non-empty gene ids of the regions referenced by pairs (ref_b).
     *
     * @param region_gene_ids Gene id of each region, indexed like the regions
     *                        passed to find_overlapping().
     */
    static std::vector<std::string> collect_gene_ids(const std::vector<ColocalizationPair>& pairs,
                                                     const std::vector<std::string>& region_gene_ids);
};

} // namespace MotifColoc
