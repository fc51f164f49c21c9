#pragma once

#include <string>
#include <utility>
#include <vector>

#include "core/ColocalizationEngine.hpp"
#include "core/DataStructs.hpp"
#include "core/MotifStatistics.hpp"
#include "core/Types.hpp"

namespace MotifColoc {

/**
 * @brief One feature/promoter (or feature/gene body) intersection, ready for output.
 */
struct RegionOverlapRow {
    std::string sequence_id;
    int64_t feature_start = 0;
    int64_t feature_end = 0;
    int64_t region_start = 0;
    int64_t region_end = 0;
    int64_t overlap = 0;
    std::string gene_id;
    std::string gene_name;
    MotifClass feature_class = MotifClass::QUADRUPLEX_REPEAT;
    double score = 0.0;
};

/**
 * @brief Writes the result tables of a run.
 *
 * Output directory structure:
 * ```
 * output/
 *   quadruplex_candidates.tsv        # Quadruplex candidates (header + one row each)
 *   quadruplex_candidates.bed        # Same, BED6
 *   alternative_structures.tsv       # Predictor candidates in the quality band
 *   alternative_structures.bed
 *   colocalization_pairs.tsv         # Quadruplex/alternative pairs within the window
 *   colocalization_by_sequence.tsv   # Per-sequence pair counts and rate
 *   promoter_overlaps.tsv            # Candidates intersecting promoters
 *   gene_lists/<name>.txt            # One gene id per line
 *   motif_statistics.tsv             # Score/length summary per motif class
 *   partition_failures.tsv           # Failed predictor partitions
 *   run_summary.tsv                  # key/value summary
 * ```
 *
 * Coordinates are written as stored (0-based, half-open), which is also
 * what BED expects.
 */
class TableWriter {
public:
    /**
     * @throws std::runtime_error if the directory cannot be created.
     */
    explicit TableWriter(const std::string& output_dir);

    /**
     * @brief Candidate table: sequence_id start end length score sequence + class fields.
     *
     * Class fields are `g_run_length g_content gc_content` for quadruplexes
     * and `quality aux_scores` (comma-joined) for alternative structures.
     */
    std::string write_candidates(const std::string& file_name, const std::vector<MotifCandidate>& candidates,
                                 MotifClass motif_class) const;

    /// BED6; names are <prefix><1-based index>, strand '.'.
    std::string write_bed(const std::string& file_name, const std::vector<MotifCandidate>& candidates,
                          const std::string& name_prefix) const;

    /**
     * @brief Pair table: sequence_id position_a position_b distance sequence_a sequence_b aux_score_b.
     */
    std::string write_pairs(const std::string& file_name, const std::vector<ColocalizationPair>& pairs,
                            const std::vector<MotifCandidate>& a, const std::vector<MotifCandidate>& b) const;

    std::string write_sequence_summary(const std::string& file_name,
                                       const std::vector<SequenceColocalization>& rows) const;

    std::string write_region_overlaps(const std::string& file_name, const std::vector<RegionOverlapRow>& rows) const;

    /// gene_lists/<list_name>.txt
    std::string write_gene_list(const std::string& list_name, const std::vector<std::string>& gene_ids) const;

    std::string write_failures(const std::string& file_name, const std::vector<PartitionFailure>& failures) const;

    std::string write_statistics(const std::string& file_name,
                                 const std::vector<std::pair<std::string, MotifStatisticsReport>>& reports) const;

    std::string write_summary(const std::string& file_name,
                              const std::vector<std::pair<std::string, std::string>>& entries) const;

    /// Replaces tabs, CR and LF by spaces so text fits in one TSV cell.
    static std::string sanitize(const std::string& text);

    const std::string& get_output_dir() const { return output_dir_; }

private:
    std::string path_for(const std::string& file_name) const;

    std::string output_dir_;
};

} // namespace MotifColoc
