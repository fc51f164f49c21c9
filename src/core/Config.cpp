#include "core/Config.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>

#include "core/Errors.hpp"

namespace MotifColoc {

std::vector<std::string> Config::validation_errors() const {
    std::vector<std::string> errors;

    if (input_fasta_path.empty()) {
        errors.push_back("Input FASTA path is required.");
    } else if (!std::filesystem::exists(input_fasta_path)) {
        errors.push_back("Input FASTA not found: " + input_fasta_path);
    }

    if (!annotation_gtf_path.empty() && !std::filesystem::exists(annotation_gtf_path)) {
        errors.push_back("Annotation GTF not found: " + annotation_gtf_path);
    }

    if (min_run_length < 1) {
        errors.push_back("min_run_length must be >= 1.");
    }
    if (min_run_length > max_run_length) {
        errors.push_back("min_run_length must not exceed max_run_length.");
    }
    if (max_loop_length < 1) {
        errors.push_back("max_loop_length must be >= 1.");
    }

    if (zscore_min > zscore_max) {
        errors.push_back("zscore_min must not exceed zscore_max.");
    }

    if (colocalization_window <= 0) {
        errors.push_back("colocalization_window must be positive.");
    }
    if (promoter_upstream < 0 || promoter_downstream < 0) {
        errors.push_back("Promoter flanks must be non-negative.");
    }

    if (poll_interval_ms <= 0) {
        errors.push_back("poll_interval_ms must be positive.");
    }
    if (grace_period_ms < 0) {
        errors.push_back("grace_period_ms must be non-negative.");
    }
    if (predictor_timeout_sec < 0) {
        errors.push_back("predictor_timeout_sec must be non-negative.");
    }
    if (threads < 0) {
        errors.push_back("threads must be non-negative.");
    }

    if (predictor_numeric_columns < 1) {
        errors.push_back("predictor_numeric_columns must be >= 1.");
    }
    if (predictor_quality_column < 0 || predictor_quality_column >= predictor_numeric_columns) {
        errors.push_back("predictor_quality_column must index one of the numeric columns.");
    }
    if (predictor_quality_column == 0) {
        errors.push_back("predictor_quality_column 0 is the position column.");
    }
    if (predictor_window_length < 1) {
        errors.push_back("predictor_window_length must be >= 1.");
    }
    if (max_parse_warnings < 0) {
        errors.push_back("max_parse_warnings must be non-negative.");
    }

    if (run_predictor && predictor_path.empty()) {
        errors.push_back("predictor_path is required when the predictor stage is enabled.");
    }

    return errors;
}

bool Config::validate() const {
    const auto errors = validation_errors();
    for (const auto& e : errors) {
        std::cerr << "Error: " << e << std::endl;
    }
    return errors.empty();
}

void Config::validate_or_throw() const {
    const auto errors = validation_errors();
    if (errors.empty()) {
        return;
    }
    std::ostringstream oss;
    oss << "Invalid configuration:";
    for (const auto& e : errors) {
        oss << "\n  - " << e;
    }
    throw ConfigError(oss.str());
}

void Config::print() const {
    std::cout << "--- Configuration ---" << std::endl;
    std::cout << "Input FASTA: " << input_fasta_path << std::endl;
    std::cout << "Annotation: " << (annotation_gtf_path.empty() ? "None" : annotation_gtf_path) << std::endl;
    std::cout << "Output Dir: " << output_dir << std::endl;
    std::cout << "Work Dir: " << get_work_dir() << std::endl;
    std::cout << "Run Lengths: [" << min_run_length << ", " << max_run_length << "), max loop " << max_loop_length
              << ", min score " << min_quadruplex_score << ", base " << repeat_base << std::endl;
    if (run_predictor) {
        std::cout << "Predictor: " << predictor_path << " " << predictor_min_run << " " << predictor_window << " "
                  << predictor_max_run << std::endl;
        std::cout << "Min Partition Length: " << min_partition_length << " bp" << std::endl;
        std::cout << "Timeout: " << (predictor_timeout_sec > 0 ? std::to_string(predictor_timeout_sec) + " s" : "none")
                  << ", grace " << grace_period_ms << " ms" << std::endl;
        std::cout << "Reuse Artifacts: " << (reuse_existing_artifacts ? "yes" : "no") << std::endl;
    } else {
        std::cout << "Predictor: disabled" << std::endl;
    }
    std::cout << "Quality Band: [" << zscore_min << ", " << zscore_max << "]" << std::endl;
    std::cout << "Colocalization Window: " << colocalization_window << " bp" << std::endl;
    std::cout << "Promoter Flanks: -" << promoter_upstream << "/+" << promoter_downstream << " bp" << std::endl;
    std::cout << "Threads: " << (threads > 0 ? std::to_string(threads) : "all") << std::endl;
    std::cout << "---------------------" << std::endl;
}

} // namespace MotifColoc
