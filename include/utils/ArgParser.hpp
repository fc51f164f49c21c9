#pragma once

#include <CLI/CLI.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>

#include "core/Config.hpp"

namespace MotifColoc {
namespace Utils {

/**
 * @brief Command-line argument parser wrapper around CLI11.
 */
class ArgParser {
public:
    /**
     * @brief Parses command line arguments and populates the Config object.
     *
     * Uses CLI11 to handle argument parsing, type conversion, and basic validation
     * (e.g., file existence, numeric ranges).
     *
     * @param argc Argument count.
     * @param argv Argument values.
     * @param config Reference to Config object to populate.
     * @return true if parsing was successful and execution should continue.
     * @return false if parsing failed or help was requested (execution should stop).
     */
    static bool parse(int argc, char** argv, Config& config) {
        CLI::App app{"MotifColoc - Quadruplex and alternative-structure motif detection and colocalization"};

        // Input/Output
        app.add_option("-i,--input", config.input_fasta_path, "Multi-record FASTA, plain or gzip (Required)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("-g,--gtf", config.annotation_gtf_path, "GTF annotation for gene/promoter overlap (Optional)")
            ->check(CLI::ExistingFile);

        app.add_option("-o,--output-dir", config.output_dir, "Output Directory (Default: output)");

        app.add_option("--work-dir", config.work_dir,
            "Partition files and predictor artifacts (Default: <output-dir>/partitions)");

        // Quadruplex scanner
        app.add_option("--min-run", config.min_run_length, "Smallest run-length class (Default: 3)")
            ->check(CLI::PositiveNumber);

        app.add_option("--max-run", config.max_run_length, "Largest run-length class, exclusive (Default: 7)")
            ->check(CLI::PositiveNumber);

        app.add_option("--max-loop", config.max_loop_length, "Maximum loop length (Default: 7)")
            ->check(CLI::PositiveNumber);

        app.add_option("--min-score", config.min_quadruplex_score, "Minimum quadruplex score (Default: 50)");

        std::string repeat_base_str = "G";
        app.add_option("--repeat-base", repeat_base_str, "Repeat nucleotide (Default: G)")
            ->check(CLI::IsMember({"A", "C", "G", "T", "a", "c", "g", "t"}));

        // External predictor
        app.add_flag("--predictor,!--no-predictor", config.run_predictor,
            "Run the alternative-structure predictor stage (Default: enabled)");

        app.add_option("--predictor-path", config.predictor_path, "Predictor executable (Default: zhunt)");

        app.add_option("--predictor-min-run", config.predictor_min_run, "Predictor argument 1 (Default: 12)")
            ->check(CLI::PositiveNumber);

        app.add_option("--predictor-window", config.predictor_window, "Predictor argument 2 (Default: 8)")
            ->check(CLI::PositiveNumber);

        app.add_option("--predictor-max-run", config.predictor_max_run, "Predictor argument 3 (Default: 12)")
            ->check(CLI::PositiveNumber);

        app.add_option("--intermediate-ext", config.intermediate_extension,
            "Intermediate artifact extension (Default: Z-SCORE)");

        app.add_option("--final-ext", config.final_extension, "Final artifact extension (Default: probability)");

        app.add_option("--min-partition-length", config.min_partition_length,
            "Partitions shorter than this skip the predictor (Default: 1048576)")
            ->check(CLI::NonNegativeNumber);

        app.add_option("-j,--threads", config.threads, "Number of threads (Default: all CPUs)")
            ->check(CLI::NonNegativeNumber);

        app.add_option("--poll-interval-ms", config.poll_interval_ms, "Progress poll interval (Default: 2000)")
            ->check(CLI::PositiveNumber);

        app.add_option("--grace-period-ms", config.grace_period_ms,
            "Delay between terminate and kill on cancellation (Default: 5000)")
            ->check(CLI::NonNegativeNumber);

        app.add_option("--timeout", config.predictor_timeout_sec, "Per-partition timeout in seconds (Default: none)")
            ->check(CLI::NonNegativeNumber);

        app.add_flag("--reuse-artifacts", config.reuse_existing_artifacts,
            "Skip partitions whose final artifact already exists");

        app.add_option("--only-partitions", config.only_partitions,
            "Restrict the predictor stage to these partition ids (re-run of failures)")
            ->delimiter(',');

        // Predictor output parsing
        app.add_option("--zscore-min", config.zscore_min, "Quality band lower bound (Default: 300)");
        app.add_option("--zscore-max", config.zscore_max, "Quality band upper bound (Default: 400)");

        app.add_option("--predictor-columns", config.predictor_numeric_columns,
            "Leading numeric columns in predictor output (Default: 4)")
            ->check(CLI::PositiveNumber);

        app.add_option("--predictor-quality-column", config.predictor_quality_column,
            "0-based column of the quality metric (Default: 3)")
            ->check(CLI::NonNegativeNumber);

        app.add_flag("--predictor-sequence-column,!--no-predictor-sequence-column", config.predictor_sequence_column,
            "Predictor lines may end with a sequence column (Default: enabled)");

        app.add_flag("--predictor-one-based,!--predictor-zero-based", config.predictor_one_based,
            "Predictor positions are 1-based (Default: enabled)");

        app.add_option("--predictor-window-length", config.predictor_window_length,
            "Span of a prediction without sequence text (Default: 12)")
            ->check(CLI::PositiveNumber);

        app.add_option("--max-parse-warnings", config.max_parse_warnings,
            "Malformed-line warnings shown per file (Default: 10)")
            ->check(CLI::NonNegativeNumber);

        // Colocalization
        app.add_option("-w,--window", config.colocalization_window, "Colocalization window in bp (Default: 1000)")
            ->check(CLI::PositiveNumber);

        app.add_option("--promoter-upstream", config.promoter_upstream, "Promoter upstream flank (Default: 1000)")
            ->check(CLI::NonNegativeNumber);

        app.add_option("--promoter-downstream", config.promoter_downstream,
            "Promoter downstream flank (Default: 1000)")
            ->check(CLI::NonNegativeNumber);

        app.add_flag("--dedupe-run-classes", config.dedupe_overlapping_classes,
            "Collapse identical quadruplex spans found by several run-length classes");

        // Logging
        std::string log_level_str = "info";
        app.add_option("--log-level", log_level_str,
            "Logging level: error, warn, info, debug (Default: info)")
            ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));

        app.add_option("--log-file", config.log_file, "Also write log lines to this file");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // If help is requested (ret=0) or error occurs (ret>0), we print message and return false.
            app.exit(e);
            return false;
        }

        // Convert log level string to enum
        static const std::map<std::string, LogLevel> log_level_map = {
            {"error", LogLevel::LOG_ERROR},
            {"warn", LogLevel::LOG_WARN},
            {"info", LogLevel::LOG_INFO},
            {"debug", LogLevel::LOG_DEBUG}
        };

        std::string log_lower = log_level_str;
        std::transform(log_lower.begin(), log_lower.end(), log_lower.begin(), ::tolower);
        auto it = log_level_map.find(log_lower);
        if (it != log_level_map.end()) {
            config.log_level = it->second;
        }

        config.repeat_base = static_cast<char>(std::toupper(static_cast<unsigned char>(repeat_base_str[0])));

        return true;
    }
};

} // namespace Utils
} // namespace MotifColoc
