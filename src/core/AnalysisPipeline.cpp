#include "core/AnalysisPipeline.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <thread>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "core/AnnotationLoader.hpp"
#include "core/Errors.hpp"
#include "core/ExternalPredictor.hpp"
#include "core/IntervalIndex.hpp"
#include "core/PredictorWorkerPool.hpp"
#include "utils/Logger.hpp"

namespace MotifColoc {

namespace {

ScanParameters scan_parameters(const Config& config) {
    ScanParameters p;
    p.min_run_length = config.min_run_length;
    p.max_run_length = config.max_run_length;
    p.max_loop_length = config.max_loop_length;
    p.min_score = config.min_quadruplex_score;
    p.repeat_base = config.repeat_base;
    return p;
}

PredictorOutputSchema output_schema(const Config& config) {
    PredictorOutputSchema s;
    s.numeric_columns = config.predictor_numeric_columns;
    s.quality_column = config.predictor_quality_column;
    s.sequence_column = config.predictor_sequence_column;
    s.one_based = config.predictor_one_based;
    s.window_length = config.predictor_window_length;
    return s;
}

ExternalPredictorOptions predictor_options(const Config& config) {
    ExternalPredictorOptions o;
    o.executable = config.predictor_path;
    o.min_run = config.predictor_min_run;
    o.window = config.predictor_window;
    o.max_run = config.predictor_max_run;
    o.intermediate_extension = config.intermediate_extension;
    o.final_extension = config.final_extension;
    o.grace_period_ms = config.grace_period_ms;
    o.timeout_sec = config.predictor_timeout_sec;
    o.reuse_existing = config.reuse_existing_artifacts;
    return o;
}

std::vector<RegionOverlapRow> overlap_rows(const std::vector<ColocalizationPair>& pairs,
                                           const std::vector<MotifCandidate>& features,
                                           const std::vector<PromoterRegion>& promoters) {
    std::vector<RegionOverlapRow> rows;
    rows.reserve(pairs.size());
    for (const auto& p : pairs) {
        const auto& f = features[p.ref_a];
        const auto& r = promoters[p.ref_b];
        RegionOverlapRow row;
        row.sequence_id = p.sequence_id;
        row.feature_start = f.start;
        row.feature_end = f.end;
        row.region_start = r.interval.start;
        row.region_end = r.interval.end;
        row.overlap = p.distance;
        row.gene_id = r.gene_id;
        row.gene_name = r.gene_name;
        row.feature_class = f.motif_class;
        row.score = f.score;
        rows.push_back(std::move(row));
    }
    return rows;
}

}  // namespace

AnalysisPipeline::AnalysisPipeline(const Config& config, const Predictor* predictor)
    : config_(config),
      scanner_(scan_parameters(config)),
      parser_(output_schema(config), static_cast<size_t>(std::max(0, config.max_parse_warnings))),
      predictor_(predictor) {
    if (!predictor_) {
        owned_predictor_ = std::make_unique<ExternalPredictor>(predictor_options(config_));
        predictor_ = owned_predictor_.get();
    }

#ifdef _OPENMP
    omp_set_num_threads(scan_threads());
#endif

    std::stringstream ss;
    ss << "AnalysisPipeline initialized:\n"
       << "  Scanner threads: " << scan_threads() << "\n"
       << "  Run classes: [" << config_.min_run_length << ", " << config_.max_run_length << ")\n"
       << "  Predictor stage: " << (config_.run_predictor ? "enabled" : "disabled") << "\n"
       << "  Colocalization window: " << config_.colocalization_window << " bp";
    LOG_INFO(ss.str());
}

AnalysisPipeline::~AnalysisPipeline() = default;

int AnalysisPipeline::scan_threads() const {
    if (config_.threads > 0) {
        return config_.threads;
    }
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? static_cast<int>(hw) : 1;
}

std::vector<MotifCandidate> AnalysisPipeline::scan_all(const SequenceMap& sequences) const {
    Utils::ScopedLogger scope("Quadruplex scan");

    const auto& seqs = sequences.all();
    const int n = static_cast<int>(seqs.size());
    std::vector<std::vector<MotifCandidate>> per_sequence(seqs.size());

#pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < n; i++) {
        per_sequence[i] = scanner_.scan(seqs[i]);
        LOG_DEBUG(seqs[i].id + ": " + std::to_string(per_sequence[i].size()) + " quadruplex candidates");
    }

    std::vector<MotifCandidate> all;
    for (auto& v : per_sequence) {
        all.insert(all.end(), std::make_move_iterator(v.begin()), std::make_move_iterator(v.end()));
    }
    LOG_INFO("Quadruplex scan found " + std::to_string(all.size()) + " candidates in " + std::to_string(n) +
             " sequences");
    return all;
}

std::vector<WorkerResult> AnalysisPipeline::run_predictor(const std::vector<PartitionFile>& partitions) const {
    Utils::ScopedLogger scope("Predictor stage");

    WorkerPoolOptions options;
    options.max_concurrency = config_.threads;
    options.min_partition_length = config_.min_partition_length;
    options.poll_interval = std::chrono::milliseconds(config_.poll_interval_ms);
    options.only_partitions = config_.only_partitions;

    PredictorWorkerPool pool(*predictor_, options);
    return pool.run_all(partitions);
}

std::vector<MotifCandidate> AnalysisPipeline::parse_predictions(const SequenceMap& sequences,
                                                                const std::vector<PartitionFile>& partitions,
                                                                std::vector<WorkerResult>& worker_results) const {
    Utils::ScopedLogger scope("Predictor output parsing");

    std::vector<std::pair<const PartitionFile*, WorkerResult*>> to_parse;
    for (auto& r : worker_results) {
        if (!r.success) {
            continue;
        }
        for (const auto& p : partitions) {
            if (p.partition_id == r.partition_id) {
                to_parse.emplace_back(&p, &r);
                break;
            }
        }
    }

    const int n = static_cast<int>(to_parse.size());
    std::vector<std::vector<MotifCandidate>> per_partition(to_parse.size());

    // Exceptions must not leave the parallel region; an unreadable artifact
    // turns the partition into a failure instead.
#pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < n; i++) {
        const PartitionFile& part = *to_parse[i].first;
        try {
            per_partition[i] = parser_.parse(predictor_->final_path(part), part.partition_id, config_.zscore_min,
                                             config_.zscore_max, sequences.find(part.partition_id));
            LOG_INFO("[" + part.partition_id + "] " + std::to_string(per_partition[i].size()) +
                     " alternative-structure candidates in the quality band");
        } catch (const std::exception& e) {
            per_partition[i].clear();
            WorkerResult& result = *to_parse[i].second;
            result.success = false;
            result.error_text = std::string("parse_error: ") + e.what();
            LOG_ERROR("[" + part.partition_id + "] Failed to read predictor output: " + e.what());
        }
    }

    std::vector<MotifCandidate> all;
    for (auto& v : per_partition) {
        all.insert(all.end(), std::make_move_iterator(v.begin()), std::make_move_iterator(v.end()));
    }
    return all;
}

void AnalysisPipeline::colocalize(PipelineReport& report) const {
    Utils::ScopedLogger scope("Colocalization");

    const auto& a = report.results.quadruplexes;
    const auto& b = report.results.alternatives;

    report.proximal_pairs = ColocalizationEngine::find_proximal(a, b, config_.colocalization_window);
    report.proximity = ColocalizationEngine::summarize(report.proximal_pairs);
    report.by_sequence = ColocalizationEngine::summarize_by_sequence(to_intervals(a), to_intervals(b),
                                                                     report.proximal_pairs);
}

void AnalysisPipeline::annotate(PipelineReport& report) const {
    if (config_.annotation_gtf_path.empty()) {
        return;
    }
    Utils::ScopedLogger scope("Gene and promoter overlap");

    AnnotationLoader loader(static_cast<size_t>(std::max(0, config_.max_parse_warnings)));
    const auto genes = loader.load_gtf(config_.annotation_gtf_path);
    const auto promoters = AnnotationLoader::build_promoters(genes, config_.promoter_upstream,
                                                             config_.promoter_downstream);
    report.genes_loaded = genes.size();

    const auto gene_spans = AnnotationLoader::gene_intervals(genes);
    const auto promoter_spans = AnnotationLoader::promoter_intervals(promoters);

    std::vector<std::string> gene_ids;
    gene_ids.reserve(genes.size());
    for (const auto& g : genes) {
        gene_ids.push_back(g.gene_id);
    }
    std::vector<std::string> promoter_gene_ids;
    promoter_gene_ids.reserve(promoters.size());
    for (const auto& p : promoters) {
        promoter_gene_ids.push_back(p.gene_id);
    }

    struct ClassInput {
        const char* list_prefix;
        const std::vector<MotifCandidate>* candidates;
    };
    const ClassInput classes[] = {
        {"alternative_structure", &report.results.alternatives},
        {"quadruplex", &report.results.quadruplexes},
    };

    for (const auto& cls : classes) {
        const auto spans = to_intervals(*cls.candidates);

        const auto body_pairs = ColocalizationEngine::find_overlapping(spans, gene_spans);
        const auto promoter_pairs = ColocalizationEngine::find_overlapping(spans, promoter_spans);

        const std::string prefix(cls.list_prefix);
        report.gene_lists[prefix + "_genes"] = ColocalizationEngine::collect_gene_ids(body_pairs, gene_ids);
        report.gene_lists[prefix + "_promoter_genes"] =
            ColocalizationEngine::collect_gene_ids(promoter_pairs, promoter_gene_ids);

        auto rows = overlap_rows(promoter_pairs, *cls.candidates, promoters);
        report.promoter_overlaps.insert(report.promoter_overlaps.end(), std::make_move_iterator(rows.begin()),
                                        std::make_move_iterator(rows.end()));

        LOG_INFO(prefix + ": " + std::to_string(body_pairs.size()) + " gene-body overlaps, " +
                 std::to_string(promoter_pairs.size()) + " promoter overlaps, " +
                 std::to_string(report.gene_lists[prefix + "_genes"].size()) + " genes");
    }
}

PipelineReport AnalysisPipeline::run() {
    const auto t_start = std::chrono::steady_clock::now();
    PipelineReport report;

    config_.validate_or_throw();

    LOG_INFO("[1] Loading sequences from " + config_.input_fasta_path);
    SequenceMap sequences = PartitionSplitter::split_file(config_.input_fasta_path);
    report.sequences = sequences.size();
    report.total_length = sequences.total_length();

    std::vector<PartitionFile> partitions;
    if (config_.run_predictor) {
        partitions = PartitionSplitter::write_partitions(sequences, config_.get_work_dir());
    }

    LOG_INFO("[2] Scanning " + std::to_string(sequences.size()) + " sequences for quadruplex motifs...");
    ResultAggregator aggregator(config_.dedupe_overlapping_classes);
    aggregator.add_candidates(scan_all(sequences));

    if (config_.run_predictor) {
        LOG_INFO("[3] Running predictor on partitions...");
        std::vector<WorkerResult> worker_results = run_predictor(partitions);

        LOG_INFO("[4] Parsing predictor output...");
        aggregator.add_candidates(parse_predictions(sequences, partitions, worker_results));
        aggregator.add_worker_results(worker_results);
    } else {
        LOG_INFO("[3] Predictor stage disabled");
    }

    LOG_INFO("[5] Aggregating results...");
    report.results = aggregator.finalize();
    report.status = classify_run(report.results);

    report.quadruplex_stats = MotifStatistics::compute(report.results.quadruplexes);
    report.alternative_stats = MotifStatistics::compute(report.results.alternatives);

    LOG_INFO("[6] Colocalization...");
    colocalize(report);
    annotate(report);

    report.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t_start).count();

    LOG_INFO("[7] Writing tables to " + config_.output_dir);
    write_outputs(report);

    return report;
}

void AnalysisPipeline::write_outputs(const PipelineReport& report) const {
    TableWriter writer(config_.output_dir);
    const auto& r = report.results;

    writer.write_candidates("quadruplex_candidates.tsv", r.quadruplexes, MotifClass::QUADRUPLEX_REPEAT);
    writer.write_bed("quadruplex_candidates.bed", r.quadruplexes, "G4_");
    writer.write_candidates("alternative_structures.tsv", r.alternatives, MotifClass::ALTERNATIVE_STRUCTURE);
    writer.write_bed("alternative_structures.bed", r.alternatives, "ALT_");

    writer.write_pairs("colocalization_pairs.tsv", report.proximal_pairs, r.quadruplexes, r.alternatives);
    writer.write_sequence_summary("colocalization_by_sequence.tsv", report.by_sequence);

    writer.write_statistics("motif_statistics.tsv", {{motif_class_to_string(MotifClass::QUADRUPLEX_REPEAT),
                                                      report.quadruplex_stats},
                                                     {motif_class_to_string(MotifClass::ALTERNATIVE_STRUCTURE),
                                                      report.alternative_stats}});

    if (!config_.annotation_gtf_path.empty()) {
        writer.write_region_overlaps("promoter_overlaps.tsv", report.promoter_overlaps);
        for (const auto& kv : report.gene_lists) {
            writer.write_gene_list(kv.first, kv.second);
        }
    }

    writer.write_failures("partition_failures.tsv", r.failures);

    std::ostringstream mean_distance;
    mean_distance << std::fixed << std::setprecision(2) << report.proximity.mean_distance;
    std::ostringstream elapsed;
    elapsed << std::fixed << std::setprecision(2) << report.elapsed_seconds;

    writer.write_summary("run_summary.tsv",
                         {{"status", run_status_to_string(report.status)},
                          {"sequences", std::to_string(report.sequences)},
                          {"total_length_bp", std::to_string(report.total_length)},
                          {"quadruplex_candidates", std::to_string(r.quadruplexes.size())},
                          {"alternative_candidates", std::to_string(r.alternatives.size())},
                          {"partitions_attempted", std::to_string(r.partitions_attempted)},
                          {"partitions_succeeded", std::to_string(r.partitions_succeeded)},
                          {"partitions_reused", std::to_string(r.partitions_reused)},
                          {"partitions_failed", std::to_string(r.failures.size())},
                          {"colocalization_window_bp", std::to_string(config_.colocalization_window)},
                          {"colocalization_pairs", std::to_string(report.proximity.pair_count)},
                          {"colocalized_quadruplexes", std::to_string(report.proximity.distinct_a)},
                          {"colocalized_alternatives", std::to_string(report.proximity.distinct_b)},
                          {"mean_pair_distance", mean_distance.str()},
                          {"genes_loaded", std::to_string(report.genes_loaded)},
                          {"elapsed_seconds", elapsed.str()}});
}

void AnalysisPipeline::print_summary(const PipelineReport& report) const {
    const auto& r = report.results;

    std::stringstream ss;
    ss << "\n=== Run Summary ===\n"
       << "Status: " << run_status_to_string(report.status) << "\n"
       << "Sequences: " << report.sequences << " (" << report.total_length << " bp)\n"
       << "Quadruplex candidates: " << r.quadruplexes.size() << "\n";
    if (!report.quadruplex_stats.per_run_class.empty()) {
        for (const auto& kv : report.quadruplex_stats.per_run_class) {
            ss << "  run class " << kv.first << ": " << kv.second << "\n";
        }
    }
    ss << "Alternative-structure candidates: " << r.alternatives.size() << "\n"
       << "Predictor partitions: " << r.partitions_succeeded << "/" << r.partitions_attempted << " succeeded";
    if (r.partitions_reused > 0) {
        ss << " (" << r.partitions_reused << " reused)";
    }
    ss << "\n"
       << "Colocalization pairs (<= " << config_.colocalization_window << " bp): " << report.proximity.pair_count
       << "\n"
       << "  Quadruplexes with a partner: " << report.proximity.distinct_a << "\n"
       << "  Alternatives with a partner: " << report.proximity.distinct_b << "\n"
       << "  Mean distance: " << std::fixed << std::setprecision(1) << report.proximity.mean_distance << " bp\n";
    if (report.genes_loaded > 0) {
        ss << "Genes loaded: " << report.genes_loaded << "\n";
        for (const auto& kv : report.gene_lists) {
            ss << "  " << kv.first << ": " << kv.second.size() << "\n";
        }
    }
    ss << "Elapsed: " << std::setprecision(2) << report.elapsed_seconds << " s";
    LOG_INFO(ss.str());

    if (!r.failures.empty()) {
        std::stringstream fs;
        fs << r.failures.size() << " partition(s) failed:";
        for (const auto& f : r.failures) {
            fs << "\n  " << f.partition_id << ": " << f.error_text;
        }
        LOG_WARNING(fs.str());
    }
    if (report.status == RunStatus::FAILURE) {
        LOG_ERROR("Run failed: " + std::string(r.partitions_attempted > 0 && r.partitions_succeeded == 0
                                                   ? "no predictor partition succeeded"
                                                   : "no candidates were produced"));
    }
}

} // namespace MotifColoc
