#pragma once

#include <map>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "core/DataStructs.hpp"

namespace MotifColoc {

/**
 * @brief Five-number-style summary of one numeric column.
 */
struct ColumnSummary {
    double mean = 0.0;
    double median = 0.0;
    double min = 0.0;
    double max = 0.0;
    double stddev = 0.0;  ///< Population standard deviation
};

/**
 * @brief Distribution statistics of a candidate collection.
 */
struct MotifStatisticsReport {
    size_t count = 0;
    ColumnSummary score;
    ColumnSummary length;
    double mean_g_content = 0.0;   ///< Quadruplex candidates only
    double mean_gc_content = 0.0;  ///< Quadruplex candidates only
    std::map<std::string, size_t> per_sequence;
    std::map<int, size_t> per_run_class;  ///< Quadruplex candidates only
};

/**
 * @brief Descriptive statistics over candidate columns, computed with Eigen arrays.
 */
class MotifStatistics {
public:
    static MotifStatisticsReport compute(const std::vector<MotifCandidate>& candidates);

    /// Summary of a column; all zeros for an empty column.
    static ColumnSummary summarize(const Eigen::ArrayXd& values);

    static double median(Eigen::ArrayXd values);
};

} // namespace MotifColoc
