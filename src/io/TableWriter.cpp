#include "io/TableWriter.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "utils/Logger.hpp"

namespace MotifColoc {

namespace {

std::ofstream open_or_throw(const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    return ofs;
}

void close_or_throw(std::ofstream& ofs, const std::string& path) {
    ofs.close();
    if (!ofs) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
}

std::string join_scores(const std::vector<double>& values) {
    std::ostringstream oss;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ",";
        oss << values[i];
    }
    return values.empty() ? "." : oss.str();
}

}  // namespace

TableWriter::TableWriter(const std::string& output_dir) : output_dir_(output_dir) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + output_dir_ + ": " + ec.message());
    }
}

std::string TableWriter::path_for(const std::string& file_name) const {
    return (std::filesystem::path(output_dir_) / file_name).string();
}

std::string TableWriter::sanitize(const std::string& text) {
    std::string out(text);
    for (auto& c : out) {
        if (c == '\t' || c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return out;
}

std::string TableWriter::write_candidates(const std::string& file_name, const std::vector<MotifCandidate>& candidates,
                                          MotifClass motif_class) const {
    const std::string path = path_for(file_name);
    std::ofstream ofs = open_or_throw(path);

    ofs << "sequence_id\tstart\tend\tlength\tscore\tsequence";
    if (motif_class == MotifClass::QUADRUPLEX_REPEAT) {
        ofs << "\tg_run_length\tg_content\tgc_content\n";
    } else {
        ofs << "\tquality\taux_scores\n";
    }

    for (const auto& c : candidates) {
        ofs << c.sequence_id << "\t" << c.start << "\t" << c.end << "\t" << c.length() << "\t" << std::fixed
            << std::setprecision(2) << c.score << "\t" << c.matched_text;
        if (motif_class == MotifClass::QUADRUPLEX_REPEAT) {
            ofs << "\t" << c.quadruplex.g_run_length << "\t" << std::setprecision(4) << c.quadruplex.g_content
                << "\t" << c.quadruplex.gc_content;
        } else {
            ofs << "\t" << std::setprecision(2) << c.alternative.quality_score;
            ofs << std::defaultfloat << "\t" << join_scores(c.alternative.aux_scores);
        }
        ofs << std::defaultfloat << "\n";
    }

    close_or_throw(ofs, path);
    LOG_DEBUG("Wrote " + std::to_string(candidates.size()) + " rows to " + path);
    return path;
}

std::string TableWriter::write_bed(const std::string& file_name, const std::vector<MotifCandidate>& candidates,
                                   const std::string& name_prefix) const {
    const std::string path = path_for(file_name);
    std::ofstream ofs = open_or_throw(path);

    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& c = candidates[i];
        ofs << c.sequence_id << "\t" << c.start << "\t" << c.end << "\t" << name_prefix << (i + 1) << "\t"
            << std::fixed << std::setprecision(2) << c.score << std::defaultfloat << "\t.\n";
    }

    close_or_throw(ofs, path);
    return path;
}

std::string TableWriter::write_pairs(const std::string& file_name, const std::vector<ColocalizationPair>& pairs,
                                     const std::vector<MotifCandidate>& a, const std::vector<MotifCandidate>& b) const {
    const std::string path = path_for(file_name);
    std::ofstream ofs = open_or_throw(path);

    ofs << "sequence_id\tposition_a\tposition_b\tdistance\tsequence_a\tsequence_b\taux_score_b\n";
    for (const auto& p : pairs) {
        const MotifCandidate* ca = p.ref_a < a.size() ? &a[p.ref_a] : nullptr;
        const MotifCandidate* cb = p.ref_b < b.size() ? &b[p.ref_b] : nullptr;
        ofs << p.sequence_id << "\t" << p.position_a << "\t" << p.position_b << "\t" << p.distance << "\t"
            << (ca ? ca->matched_text : ".") << "\t" << (cb ? cb->matched_text : ".") << "\t";
        if (cb) {
            ofs << std::fixed << std::setprecision(2) << cb->score << std::defaultfloat;
        } else {
            ofs << ".";
        }
        ofs << "\n";
    }

    close_or_throw(ofs, path);
    LOG_DEBUG("Wrote " + std::to_string(pairs.size()) + " pairs to " + path);
    return path;
}

std::string TableWriter::write_sequence_summary(const std::string& file_name,
                                                const std::vector<SequenceColocalization>& rows) const {
    const std::string path = path_for(file_name);
    std::ofstream ofs = open_or_throw(path);

    ofs << "sequence_id\tquadruplex_count\talternative_count\tpairs\trate\n";
    for (const auto& r : rows) {
        ofs << r.sequence_id << "\t" << r.count_a << "\t" << r.count_b << "\t" << r.pair_count << "\t" << std::fixed
            << std::setprecision(4) << r.rate << std::defaultfloat << "\n";
    }

    close_or_throw(ofs, path);
    return path;
}

std::string TableWriter::write_region_overlaps(const std::string& file_name,
                                               const std::vector<RegionOverlapRow>& rows) const {
    const std::string path = path_for(file_name);
    std::ofstream ofs = open_or_throw(path);

    ofs << "sequence_id\tfeature_start\tfeature_end\tregion_start\tregion_end\toverlap\tgene_id\tgene_name\t"
           "feature_class\tscore\n";
    for (const auto& r : rows) {
        ofs << r.sequence_id << "\t" << r.feature_start << "\t" << r.feature_end << "\t" << r.region_start << "\t"
            << r.region_end << "\t" << r.overlap << "\t" << r.gene_id << "\t" << r.gene_name << "\t"
            << motif_class_to_string(r.feature_class) << "\t" << std::fixed << std::setprecision(2) << r.score
            << std::defaultfloat << "\n";
    }

    close_or_throw(ofs, path);
    return path;
}

std::string TableWriter::write_gene_list(const std::string& list_name, const std::vector<std::string>& gene_ids) const {
    const std::filesystem::path dir = std::filesystem::path(output_dir_) / "gene_lists";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create directory " + dir.string() + ": " + ec.message());
    }

    const std::string path = (dir / (list_name + ".txt")).string();
    std::ofstream ofs = open_or_throw(path);
    for (const auto& id : gene_ids) {
        ofs << id << "\n";
    }
    close_or_throw(ofs, path);
    return path;
}

std::string TableWriter::write_failures(const std::string& file_name,
                                        const std::vector<PartitionFailure>& failures) const {
    const std::string path = path_for(file_name);
    std::ofstream ofs = open_or_throw(path);

    ofs << "partition_id\terror_text\n";
    for (const auto& f : failures) {
        ofs << f.partition_id << "\t" << sanitize(f.error_text) << "\n";
    }

    close_or_throw(ofs, path);
    return path;
}

std::string TableWriter::write_statistics(
    const std::string& file_name, const std::vector<std::pair<std::string, MotifStatisticsReport>>& reports) const {
    const std::string path = path_for(file_name);
    std::ofstream ofs = open_or_throw(path);

    ofs << "motif_class\tcount\tscore_mean\tscore_median\tscore_min\tscore_max\tscore_sd\t"
           "length_mean\tlength_median\tlength_min\tlength_max\tmean_g_content\tmean_gc_content\n";
    ofs << std::fixed << std::setprecision(4);
    for (const auto& kv : reports) {
        const auto& r = kv.second;
        ofs << kv.first << "\t" << r.count << "\t" << r.score.mean << "\t" << r.score.median << "\t" << r.score.min
            << "\t" << r.score.max << "\t" << r.score.stddev << "\t" << r.length.mean << "\t" << r.length.median
            << "\t" << r.length.min << "\t" << r.length.max << "\t" << r.mean_g_content << "\t" << r.mean_gc_content
            << "\n";
    }

    close_or_throw(ofs, path);
    return path;
}

std::string TableWriter::write_summary(const std::string& file_name,
                                       const std::vector<std::pair<std::string, std::string>>& entries) const {
    const std::string path = path_for(file_name);
    std::ofstream ofs = open_or_throw(path);

    ofs << "key\tvalue\n";
    for (const auto& kv : entries) {
        ofs << kv.first << "\t" << sanitize(kv.second) << "\n";
    }

    close_or_throw(ofs, path);
    return path;
}

} // namespace MotifColoc
