#include "core/AnnotationLoader.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <filesystem>

#include "utils/Logger.hpp"
#include "utils/TextLineReader.hpp"

namespace MotifColoc {

namespace {

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> cols;
    size_t begin = 0;
    while (true) {
        size_t tab = line.find('\t', begin);
        if (tab == std::string::npos) {
            cols.push_back(line.substr(begin));
            break;
        }
        cols.push_back(line.substr(begin, tab - begin));
        begin = tab + 1;
    }
    return cols;
}

bool parse_position(const std::string& s, int64_t& value) {
    if (s.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) {
        return false;
    }
    value = static_cast<int64_t>(v);
    return true;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) {
        return "";
    }
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

ParseError make_error(size_t line_number, const std::string& reason, const std::string& line) {
    ParseError err;
    err.line_number = line_number;
    err.reason = reason;
    err.line = line.size() > 120 ? line.substr(0, 120) + "..." : line;
    return err;
}

}  // namespace

AnnotationLoader::AnnotationLoader(size_t max_warnings) : max_warnings_(max_warnings) {}

std::string AnnotationLoader::attribute_value(const std::string& attributes, const std::string& key) {
    size_t begin = 0;
    while (begin < attributes.size()) {
        size_t semi = attributes.find(';', begin);
        std::string attr = trim(attributes.substr(begin, semi == std::string::npos ? std::string::npos : semi - begin));
        begin = semi == std::string::npos ? attributes.size() : semi + 1;

        if (attr.size() <= key.size() || attr.compare(0, key.size(), key) != 0) {
            continue;
        }
        if (attr[key.size()] != ' ' && attr[key.size()] != '\t') {
            continue;  // e.g. gene_id_version when looking for gene_id
        }

        std::string value = trim(attr.substr(key.size()));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        return value;
    }
    return "";
}

bool AnnotationLoader::parse_line(const std::string& line, size_t line_number, const std::string& feature_type,
                                  GeneAnnotation& out, bool& matched, ParseError& err) const {
    matched = false;
    const std::vector<std::string> cols = split_tabs(line);
    if (cols.size() < 9) {
        err = make_error(line_number, "expected 9 tab-separated columns, found " + std::to_string(cols.size()), line);
        return false;
    }

    if (cols[2] != feature_type) {
        return true;
    }

    int64_t start = 0, end = 0;
    if (!parse_position(cols[3], start) || !parse_position(cols[4], end)) {
        err = make_error(line_number, "non-numeric coordinates '" + cols[3] + "'/'" + cols[4] + "'", line);
        return false;
    }
    if (start < 1 || start > end) {
        err = make_error(line_number, "invalid coordinates " + cols[3] + ".." + cols[4], line);
        return false;
    }

    if (cols[6].size() != 1 || (cols[6][0] != '+' && cols[6][0] != '-')) {
        err = make_error(line_number, "unknown strand '" + cols[6] + "'", line);
        return false;
    }

    std::string gene_id = attribute_value(cols[8], "gene_id");
    if (gene_id.empty()) {
        err = make_error(line_number, "missing gene_id attribute", line);
        return false;
    }
    std::string gene_name = attribute_value(cols[8], "gene_name");

    GeneAnnotation gene;
    gene.sequence_id = cols[0];
    gene.start = start - 1;
    gene.end = end;
    gene.strand = strand_from_char(cols[6][0]);
    gene.gene_id = gene_id;
    gene.gene_name = gene_name.empty() ? gene_id : gene_name;

    out = std::move(gene);
    matched = true;
    return true;
}

std::vector<GeneAnnotation> AnnotationLoader::load_gtf(const std::string& path, const std::string& feature_type,
                                                       AnnotationSummary* summary) const {
    if (!std::filesystem::exists(path)) {
        throw InputError("Annotation file not found: " + path);
    }

    std::vector<GeneAnnotation> genes;
    AnnotationSummary local;

    try {
        TextLineReader reader(path);
        std::string line;
        while (reader.next_line(line)) {
            ++local.lines_read;
            if (line.empty() || line[0] == '#') {
                continue;
            }

            GeneAnnotation gene;
            bool matched = false;
            ParseError err;
            if (!parse_line(line, reader.line_number(), feature_type, gene, matched, err)) {
                ++local.malformed;
                if (local.first_errors.size() < max_warnings_) {
                    local.first_errors.push_back(err);
                    LOG_WARNING(path + ": skipped " + err.to_string());
                }
                continue;
            }
            if (!matched) {
                ++local.other_features;
                continue;
            }
            genes.push_back(std::move(gene));
        }
    } catch (const std::runtime_error& e) {
        throw InputError(e.what());
    }

    local.records_kept = genes.size();
    if (local.malformed > local.first_errors.size()) {
        LOG_WARNING(path + ": " + std::to_string(local.malformed - local.first_errors.size()) +
                    " further malformed lines not shown");
    }
    LOG_INFO("Loaded " + std::to_string(genes.size()) + " " + feature_type + " records from " + path);

    if (summary) {
        *summary = std::move(local);
    }
    return genes;
}

std::vector<PromoterRegion> AnnotationLoader::build_promoters(const std::vector<GeneAnnotation>& genes,
                                                              int64_t upstream, int64_t downstream) {
    if (upstream < 0 || downstream < 0) {
        throw ConfigError("promoter flanks must be non-negative");
    }

    std::vector<PromoterRegion> promoters;
    promoters.reserve(genes.size());
    for (const auto& g : genes) {
        PromoterRegion p;
        p.gene_id = g.gene_id;
        p.gene_name = g.gene_name;
        p.strand = g.strand;
        p.tss = g.tss();

        // Closed [tss - up, tss + down] in genomic order, stored half-open
        int64_t start, end;
        if (g.strand == Strand::REVERSE) {
            start = p.tss - downstream;
            end = p.tss + upstream + 1;
        } else {
            start = p.tss - upstream;
            end = p.tss + downstream + 1;
        }
        // First base: 1 in GTF terms, 0 here
        start = std::max<int64_t>(0, start);
        end = std::max(end, start);

        p.interval = GenomicInterval(g.sequence_id, start, end);
        promoters.push_back(std::move(p));
    }
    return promoters;
}

std::vector<GenomicInterval> AnnotationLoader::gene_intervals(const std::vector<GeneAnnotation>& genes) {
    std::vector<GenomicInterval> out;
    out.reserve(genes.size());
    for (const auto& g : genes) {
        out.emplace_back(g.sequence_id, g.start, g.end);
    }
    return out;
}

std::vector<GenomicInterval> AnnotationLoader::promoter_intervals(const std::vector<PromoterRegion>& promoters) {
    std::vector<GenomicInterval> out;
    out.reserve(promoters.size());
    for (const auto& p : promoters) {
        out.push_back(p.interval);
    }
    return out;
}

} // namespace MotifColoc
