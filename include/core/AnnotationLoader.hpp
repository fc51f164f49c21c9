#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/DataStructs.hpp"
#include "core/Errors.hpp"

namespace MotifColoc {

/**
 * @brief Counters of one load_gtf() call.
 */
struct AnnotationSummary {
    size_t lines_read = 0;
    size_t records_kept = 0;
    size_t other_features = 0;  ///< Well-formed lines of a different feature type
    size_t malformed = 0;
    std::vector<ParseError> first_errors;
};

/**
 * @brief Reads gene/transcript annotation and derives promoter regions.
 *
 * GTF coordinates (1-based, closed) are converted to the 0-based half-open
 * coordinates used everywhere else: [start - 1, end).
 */
class AnnotationLoader {
public:
    explicit AnnotationLoader(size_t max_warnings = 10);

    /**
     * @brief Loads records of one feature type from a GTF file (plain or gzip).
     *
     * Malformed records (fewer than 9 columns, non-numeric or inverted
     * coordinates, unknown strand, missing gene_id) are skipped and the first
     * max_warnings of them are logged. gene_name falls back to gene_id.
     *
     * @throws InputError if the file does not exist or cannot be opened.
     */
    std::vector<GeneAnnotation> load_gtf(const std::string& path, const std::string& feature_type = "transcript",
                                         AnnotationSummary* summary = nullptr) const;

    /**
     * @brief Strict parse of one GTF line.
     *
     * @param matched Set to false (with true returned) for a well-formed line of another feature type.
     * @return false with err filled if the line is malformed.
     */
    bool parse_line(const std::string& line, size_t line_number, const std::string& feature_type,
                    GeneAnnotation& out, bool& matched, ParseError& err) const;

    /**
     * @brief Promoter per gene, oriented by strand.
     *
     * + strand: [tss - upstream, tss + downstream); - strand:
     * [tss - downstream, tss + upstream). Start is clamped to the first base.
     *
     * @throws ConfigError if a flank is negative.
     */
    static std::vector<PromoterRegion> build_promoters(const std::vector<GeneAnnotation>& genes, int64_t upstream,
                                                       int64_t downstream);

    /// Gene bodies as intervals, same order.
    static std::vector<GenomicInterval> gene_intervals(const std::vector<GeneAnnotation>& genes);

    /// Promoter spans as intervals, same order.
    static std::vector<GenomicInterval> promoter_intervals(const std::vector<PromoterRegion>& promoters);

    /**
     * @brief Value of a GTF attribute (`key "value";`), empty if absent.
     */
    static std::string attribute_value(const std::string& attributes, const std::string& key);

private:
    size_t max_warnings_;
};

} // namespace MotifColoc
