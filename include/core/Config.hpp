#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "Types.hpp"

namespace MotifColoc {

/**
 * @brief Configuration structure holding all runtime parameters.
 *
 * Stores paths to input/output files, scanner and predictor parameters and
 * colocalization thresholds. Validated by both CLI11 (basic checks) and the
 * internal validate() method (relationships between fields).
 */
struct Config {
    // Input/Output
    std::string input_fasta_path;     ///< Multi-record FASTA, plain or gzip (Required)
    std::string annotation_gtf_path;  ///< GTF annotation (Optional; enables gene/promoter overlap)
    std::string output_dir = "output";  ///< Output directory for result tables
    std::string work_dir = "";        ///< Partition files and predictor artifacts
                                      ///< If empty, defaults to output_dir/partitions

    // Quadruplex scanner
    int min_run_length = 3;             ///< Smallest run-length class (inclusive)
    int max_run_length = 7;             ///< Largest run-length class (exclusive)
    int max_loop_length = 7;            ///< Maximum loop length between runs
    double min_quadruplex_score = 50.0; ///< Candidates scoring below are discarded
    char repeat_base = 'G';             ///< Repeat nucleotide

    // External predictor
    bool run_predictor = true;                       ///< Run the alternative-structure predictor stage
    std::string predictor_path = "zhunt";            ///< Predictor executable
    int predictor_min_run = 12;                      ///< First positional predictor argument
    int predictor_window = 8;                        ///< Second positional predictor argument
    int predictor_max_run = 12;                      ///< Third positional predictor argument
    std::string intermediate_extension = "Z-SCORE";  ///< Intermediate artifact suffix
    std::string final_extension = "probability";     ///< Final artifact suffix
    int64_t min_partition_length = 1048576;          ///< Shorter partitions skip the predictor
    int threads = 0;                                 ///< Scanner threads / predictor concurrency bound (0 = all CPUs)
    int poll_interval_ms = 2000;                     ///< Progress monitor interval
    int grace_period_ms = 5000;                      ///< SIGTERM -> SIGKILL delay on cancellation
    int predictor_timeout_sec = 0;                   ///< Per-partition timeout (0 = none)
    bool reuse_existing_artifacts = false;           ///< Keep partitions whose final artifact exists
    std::vector<std::string> only_partitions;        ///< Restrict the predictor stage to these ids

    // Predictor output parsing
    double zscore_min = 300.0;             ///< Quality band lower bound (inclusive)
    double zscore_max = 400.0;             ///< Quality band upper bound (inclusive)
    int predictor_numeric_columns = 4;     ///< Leading numeric columns per line
    int predictor_quality_column = 3;      ///< 0-based column of the quality metric
    bool predictor_sequence_column = true; ///< A trailing sequence column may follow
    bool predictor_one_based = true;       ///< Positions count from 1
    int predictor_window_length = 12;      ///< Span when a line has no sequence text
    int max_parse_warnings = 10;           ///< Malformed-line diagnostics shown per file

    // Colocalization
    int64_t colocalization_window = 1000;  ///< Proximity window (bp, inclusive)
    int64_t promoter_upstream = 1000;      ///< Promoter flank upstream of the TSS
    int64_t promoter_downstream = 1000;    ///< Promoter flank downstream of the TSS
    bool dedupe_overlapping_classes = false;  ///< Collapse identical spans across run classes

    // Logging
    LogLevel log_level = LogLevel::LOG_INFO;  ///< Logging verbosity level
    std::string log_file = "";                ///< Optional log file (appended)

    /**
     * @brief Lists every violated constraint.
     *
     * Checks that CLI11 cannot handle: relationships between fields, the
     * predictor column layout and the presence of the input file.
     */
    std::vector<std::string> validation_errors() const;

    /**
     * @brief Validates configuration logic.
     *
     * Prints every violation to stderr.
     *
     * @return true if configuration is valid, false otherwise.
     */
    bool validate() const;

    /**
     * @brief Same as validate(), but throws.
     * @throws ConfigError listing every violation.
     */
    void validate_or_throw() const;

    /**
     * @brief Prints the current configuration to stdout.
     */
    void print() const;

    /**
     * @brief Returns the effective work directory.
     */
    std::string get_work_dir() const {
        if (!work_dir.empty()) {
            return work_dir;
        }
        return output_dir + "/partitions";
    }

    /**
     * @brief Check if debug mode is enabled.
     */
    bool is_debug() const {
        return log_level >= LogLevel::LOG_DEBUG;
    }
};

}  // namespace MotifColoc
