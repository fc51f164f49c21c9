#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/DataStructs.hpp"
#include "core/Errors.hpp"

namespace MotifColoc {

/**
 * @brief Column layout of the predictor's scored-window output.
 *
 * A line is `numeric_columns` whitespace-separated numbers, optionally
 * followed by one sequence-text column. Column position_column holds an
 * integer position, quality_column the quality metric; every other numeric
 * column becomes an auxiliary score.
 */
struct PredictorOutputSchema {
    int numeric_columns = 4;
    int position_column = 0;
    int quality_column = 3;
    bool sequence_column = true;  ///< A trailing sequence column may be present
    bool one_based = true;        ///< Positions count from 1
    int64_t window_length = 12;   ///< Span used when the line carries no sequence text

    /**
     * @throws ConfigError if columns are out of range or overlap.
     */
    void validate() const;
};

/**
 * @brief One strictly parsed predictor line.
 */
struct PredictorRecord {
    int64_t position = 0;         ///< As written in the file
    double quality = 0.0;
    std::vector<double> aux_scores;
    std::string sequence_text;    ///< Empty if the column is absent
};

/**
 * @brief Counters of one parse() call.
 */
struct ParseSummary {
    size_t lines_read = 0;
    size_t records_parsed = 0;
    size_t records_kept = 0;
    size_t out_of_range = 0;
    size_t malformed = 0;
    std::vector<ParseError> first_errors;  ///< At most max_warnings entries
};

/**
 * @brief Turns predictor output into ALTERNATIVE_STRUCTURE candidates.
 *
 * Each well-formed line whose quality metric lies in [min_score, max_score]
 * (inclusive) yields one candidate. Malformed lines are skipped; only the
 * first max_warnings reasons are logged, parsing always runs to the end.
 * Blank lines and lines starting with '#' are ignored silently.
 */
class PredictorOutputParser {
public:
    /**
     * @throws ConfigError if the schema is invalid.
     */
    explicit PredictorOutputParser(PredictorOutputSchema schema = PredictorOutputSchema(), size_t max_warnings = 10);

    /**
     * @brief Strict parse of one line.
     * @return false with err filled if the line does not match the schema.
     */
    bool parse_line(const std::string& line, size_t line_number, PredictorRecord& out, ParseError& err) const;

    /**
     * @brief Parses a predictor output file (plain or gzip).
     *
     * @param path        Final artifact of one partition.
     * @param sequence_id Sequence the positions refer to.
     * @param min_score   Lower bound of the quality band (inclusive).
     * @param max_score   Upper bound of the quality band (inclusive).
     * @param reference   If given, supplies the matched text of lines without
     *                    a sequence column and bounds positions.
     * @param summary     Optional counters.
     * @return Candidates in file order; empty if the file does not exist.
     * @throws ConfigError if min_score > max_score.
     */
    std::vector<MotifCandidate> parse(const std::string& path, const std::string& sequence_id, double min_score,
                                      double max_score, const Sequence* reference = nullptr,
                                      ParseSummary* summary = nullptr) const;

    /**
     * @brief Builds a candidate from a record; start/end are 0-based half-open.
     * @return false with err filled if the position lies outside the reference.
     */
    bool to_candidate(const PredictorRecord& record, size_t line_number, const std::string& sequence_id,
                      const Sequence* reference, MotifCandidate& out, ParseError& err) const;

    const PredictorOutputSchema& schema() const { return schema_; }

private:
    PredictorOutputSchema schema_;
    size_t max_warnings_;
};

} // namespace MotifColoc
