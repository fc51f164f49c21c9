#include "core/MotifStatistics.hpp"

#include <algorithm>
#include <cmath>

namespace MotifColoc {

double MotifStatistics::median(Eigen::ArrayXd values) {
    const Eigen::Index n = values.size();
    if (n == 0) {
        return 0.0;
    }
    double* begin = values.data();
    double* mid = begin + n / 2;
    std::nth_element(begin, mid, begin + n);
    if (n % 2 == 1) {
        return *mid;
    }
    const double upper = *mid;
    const double lower = *std::max_element(begin, mid);
    return (lower + upper) / 2.0;
}

ColumnSummary MotifStatistics::summarize(const Eigen::ArrayXd& values) {
    ColumnSummary s;
    if (values.size() == 0) {
        return s;
    }
    s.mean = values.mean();
    s.min = values.minCoeff();
    s.max = values.maxCoeff();
    s.median = median(values);
    s.stddev = std::sqrt((values - s.mean).square().mean());
    return s;
}

MotifStatisticsReport MotifStatistics::compute(const std::vector<MotifCandidate>& candidates) {
    MotifStatisticsReport report;
    report.count = candidates.size();
    if (candidates.empty()) {
        return report;
    }

    const Eigen::Index n = static_cast<Eigen::Index>(candidates.size());
    Eigen::ArrayXd scores(n);
    Eigen::ArrayXd lengths(n);

    double g_total = 0.0;
    double gc_total = 0.0;
    size_t quadruplex_count = 0;

    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& c = candidates[static_cast<size_t>(i)];
        scores(i) = c.score;
        lengths(i) = static_cast<double>(c.length());
        ++report.per_sequence[c.sequence_id];

        if (c.motif_class == MotifClass::QUADRUPLEX_REPEAT) {
            g_total += c.quadruplex.g_content;
            gc_total += c.quadruplex.gc_content;
            ++quadruplex_count;
            ++report.per_run_class[c.quadruplex.g_run_length];
        }
    }

    report.score = summarize(scores);
    report.length = summarize(lengths);
    if (quadruplex_count > 0) {
        report.mean_g_content = g_total / static_cast<double>(quadruplex_count);
        report.mean_gc_content = gc_total / static_cast<double>(quadruplex_count);
    }
    return report;
}

} // namespace MotifColoc
