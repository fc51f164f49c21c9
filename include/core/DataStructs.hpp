#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "Types.hpp"

namespace MotifColoc {

/**
 * @brief One named nucleotide sequence (chromosome/contig).
 *
 * Immutable once loaded; the residues are kept byte-for-byte as read (line wraps removed).
 */
struct Sequence {
    std::string id;        ///< Identifier from the FASTA header (up to first whitespace)
    std::string residues;  ///< Nucleotides, original case

    int64_t length() const {
        return static_cast<int64_t>(residues.size());
    }
};

/**
 * @brief Class-specific fields of a quadruplex-repeat candidate.
 */
struct QuadruplexMetadata {
    int g_run_length = 0;     ///< Run-length class k that produced the match
    double g_content = 0.0;   ///< Fraction of repeat-base residues
    double gc_content = 0.0;  ///< Fraction of G + C residues
};

/**
 * @brief Class-specific fields of an alternative-structure (predictor) candidate.
 */
struct AlternativeStructureMetadata {
    double quality_score = 0.0;       ///< Predictor quality metric (e.g. Z-score)
    std::vector<double> aux_scores;   ///< Remaining numeric predictor columns
};

/**
 * @brief A scored, positioned match of a structural pattern.
 *
 * Coordinates are 0-based, half-open [start, end). Identity is
 * (sequence_id, start, end, motif_class); only the metadata member matching
 * motif_class is meaningful.
 */
struct MotifCandidate {
    std::string sequence_id;
    int64_t start = 0;
    int64_t end = 0;
    std::string matched_text;
    MotifClass motif_class = MotifClass::QUADRUPLEX_REPEAT;
    double score = 0.0;

    QuadruplexMetadata quadruplex;
    AlternativeStructureMetadata alternative;

    int64_t length() const {
        return end - start;
    }
};

/**
 * @brief Generic span on one sequence, half-open [start, end).
 */
struct GenomicInterval {
    std::string sequence_id;
    int64_t start = 0;
    int64_t end = 0;

    GenomicInterval() = default;
    GenomicInterval(std::string seq, int64_t s, int64_t e) : sequence_id(std::move(seq)), start(s), end(e) {}

    int64_t length() const {
        return end - start;
    }
};

/**
 * @brief Gene/transcript record from an annotation file (read-only input).
 */
struct GeneAnnotation {
    std::string sequence_id;
    int64_t start = 0;
    int64_t end = 0;
    Strand strand = Strand::UNKNOWN;
    std::string gene_id;
    std::string gene_name;

    /// Transcription start site as a 0-based base: first base on the + strand,
    /// last base (end - 1) on the - strand.
    int64_t tss() const {
        return strand == Strand::REVERSE ? end - 1 : start;
    }
};

/**
 * @brief Strand-oriented interval flanking a TSS.
 */
struct PromoterRegion {
    GenomicInterval interval;
    std::string gene_id;
    std::string gene_name;
    Strand strand = Strand::UNKNOWN;
    int64_t tss = 0;
};

/**
 * @brief Relationship between a feature of collection A and one of collection B.
 *
 * For proximity queries distance = |position_b - position_a|; for region
 * queries it is the overlap extent. ref_a/ref_b index into the input collections.
 */
struct ColocalizationPair {
    std::string sequence_id;
    int64_t position_a = 0;
    int64_t position_b = 0;
    int64_t distance = 0;
    size_t ref_a = 0;
    size_t ref_b = 0;
};

/**
 * @brief Single-sequence input file handed to the predictor.
 */
struct PartitionFile {
    std::string partition_id;   ///< Sequence identifier
    std::string sequence_file;  ///< Path of the single-record FASTA
    int64_t sequence_length = 0;
};

/**
 * @brief Outcome of one predictor worker.
 *
 * Created when the worker process exits, consumed once by the ResultAggregator.
 */
struct WorkerResult {
    std::string partition_id;
    bool success = false;
    bool reused = false;                        ///< Artifacts existed and no process was launched
    double elapsed_seconds = 0.0;
    std::vector<std::string> output_artifact_paths;
    std::string error_text;                     ///< Empty on success
};

/**
 * @brief Entry of the failure list.
 */
struct PartitionFailure {
    std::string partition_id;
    std::string error_text;
};

}  // namespace MotifColoc
