#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/DataStructs.hpp"

namespace MotifColoc {

/**
 * @brief Parameters of the quadruplex-repeat scan.
 */
struct ScanParameters {
    int min_run_length = 3;     ///< Smallest run-length class k (inclusive)
    int max_run_length = 7;     ///< Largest run-length class (exclusive)
    int max_loop_length = 7;    ///< Loops are 1..max_loop_length residues
    double min_score = 50.0;    ///< Candidates scoring below are discarded
    char repeat_base = 'G';     ///< Nucleotide forming the runs
};

/**
 * @brief Finds and scores tandem-repeat quadruplex motifs in raw sequence.
 *
 * For every run-length class k in [min_run_length, max_run_length) the pattern
 *
 *     B{k,} L{1,m} B{k,} L{1,m} B{k,} L{1,m} B{k,}
 *
 * (B = repeat base, L = any of A/C/G/T/N, m = max_loop_length) is searched in
 * the upper-cased sequence. Matching is leftmost-first with greedy quantifiers
 * and backtracking; after a match, scanning for that class resumes at the
 * match end. Classes scan independently, so their candidates may overlap.
 *
 * Characters outside A/C/G/T/N never abort the scan: they only terminate a
 * loop and count as non-repeat residues when scoring.
 *
 * Thread-safe: scan() is const and keeps all state on the stack, so one
 * scanner can be shared by every OpenMP thread.
 */
class SequenceScanner {
public:
    /**
     * @throws ConfigError if min_run_length < 1, min_run_length > max_run_length
     *         or max_loop_length < 1.
     */
    explicit SequenceScanner(const ScanParameters& params = ScanParameters());

    /**
     * @brief Scans one sequence with every run-length class.
     *
     * @return Candidates ordered by class, then by start. Each has
     *         0 <= start < end and matched_text.size() == end - start.
     */
    std::vector<MotifCandidate> scan(const Sequence& sequence) const;

    /**
     * @brief Scans an already upper-cased sequence with one run-length class.
     *
     * Candidates below min_score are dropped.
     */
    std::vector<MotifCandidate> scan_class(const std::string& upper, const std::string& sequence_id,
                                           int run_length) const;

    /**
     * @brief Scores a matched span.
     *
     * score = 100 * count(B) / length; if there are >= 4 maximal B-runs add
     * 10 * runs + 5 * mean(run length); if the mean length of the maximal
     * non-B stretches exceeds 5, multiply by 0.8. Rounded to 2 decimals.
     */
    static double score_motif(const std::string& text, char repeat_base = 'G');

    const ScanParameters& parameters() const {
        return params_;
    }

private:
    using MatchMemo = std::unordered_map<int64_t, int64_t>;

    /**
     * @brief Attempts the remaining runs starting at pos.
     * @return Match end (exclusive) or -1.
     */
    int64_t match_runs(const std::string& upper, int64_t pos, int runs_left, int run_length,
                       MatchMemo& memo) const;

    int64_t run_extent(const std::string& upper, int64_t pos) const;
    int64_t loop_extent(const std::string& upper, int64_t pos) const;

    MotifCandidate make_candidate(const std::string& upper, const std::string& sequence_id,
                                  int64_t start, int64_t end, int run_length) const;

    ScanParameters params_;
};

} // namespace MotifColoc
