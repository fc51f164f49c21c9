#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/ColocalizationEngine.hpp"
#include "core/Config.hpp"
#include "core/DataStructs.hpp"
#include "core/MotifStatistics.hpp"
#include "core/PartitionSplitter.hpp"
#include "core/Predictor.hpp"
#include "core/PredictorOutputParser.hpp"
#include "core/ResultAggregator.hpp"
#include "core/SequenceScanner.hpp"
#include "io/TableWriter.hpp"

namespace MotifColoc {

/**
 * @brief Everything a run produced, before it is written out.
 */
struct PipelineReport {
    AggregatedResults results;
    RunStatus status = RunStatus::FAILURE;

    std::vector<ColocalizationPair> proximal_pairs;  ///< A = quadruplex, B = alternative
    ColocalizationSummary proximity;
    std::vector<SequenceColocalization> by_sequence;

    size_t genes_loaded = 0;
    std::vector<RegionOverlapRow> promoter_overlaps;
    std::map<std::string, std::vector<std::string>> gene_lists;

    MotifStatisticsReport quadruplex_stats;
    MotifStatisticsReport alternative_stats;

    size_t sequences = 0;
    int64_t total_length = 0;
    double elapsed_seconds = 0.0;
};

/**
 * @brief Runs the whole analysis for one Config.
 *
 * Stages:
 * 1. Load and split the input FASTA, write partition files.
 * 2. Scan every sequence for quadruplex candidates (OpenMP across sequences).
 * 3. Run the predictor per partition with a bounded worker pool.
 * 4. Parse the predictor output of successful partitions (OpenMP).
 * 5. Aggregate, classify the run.
 * 6. Colocalize: quadruplex vs alternative proximity, gene/promoter overlap.
 * 7. Write the result tables.
 *
 * Thread-safety: one pipeline per run; stages use their own parallelism.
 */
class AnalysisPipeline {
public:
    /**
     * @param predictor Used for stage 3; if null an ExternalPredictor built
     *                  from the Config is used.
     * @throws ConfigError if the configuration is invalid.
     */
    explicit AnalysisPipeline(const Config& config, const Predictor* predictor = nullptr);
    ~AnalysisPipeline();

    /**
     * @brief Runs all stages and writes the tables.
     * @throws InputError / ConfigError before orchestration starts.
     */
    PipelineReport run();

    // Individual stages, used by run() and by tests
    std::vector<MotifCandidate> scan_all(const SequenceMap& sequences) const;

    std::vector<WorkerResult> run_predictor(const std::vector<PartitionFile>& partitions) const;

    /**
     * @brief Parses the final artifact of every successful partition.
     *
     * A partition whose artifact cannot be read is marked failed in
     * worker_results (error_text "parse_error: ...") and contributes nothing.
     */
    std::vector<MotifCandidate> parse_predictions(const SequenceMap& sequences,
                                                  const std::vector<PartitionFile>& partitions,
                                                  std::vector<WorkerResult>& worker_results) const;

    void colocalize(PipelineReport& report) const;

    void annotate(PipelineReport& report) const;

    void write_outputs(const PipelineReport& report) const;

    void print_summary(const PipelineReport& report) const;

    const Predictor& predictor() const { return *predictor_; }

private:
    int scan_threads() const;

    Config config_;
    SequenceScanner scanner_;
    PredictorOutputParser parser_;
    std::unique_ptr<Predictor> owned_predictor_;
    const Predictor* predictor_;
};

} // namespace MotifColoc
