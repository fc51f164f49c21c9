#include "core/PredictorOutputParser.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <sstream>

#include "utils/Logger.hpp"
#include "utils/TextLineReader.hpp"

namespace MotifColoc {

namespace {

std::vector<std::string> split_whitespace(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        fields.push_back(token);
    }
    return fields;
}

bool parse_int64(const std::string& s, int64_t& value) {
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

bool parse_finite_double(const std::string& s, double& value) {
    if (s.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size() || !std::isfinite(v)) {
        return false;
    }
    value = v;
    return true;
}

bool is_skippable(const std::string& line) {
    size_t i = line.find_first_not_of(" \t");
    return i == std::string::npos || line[i] == '#';
}

ParseError make_error(size_t line_number, const std::string& reason, const std::string& line) {
    ParseError err;
    err.line_number = line_number;
    err.reason = reason;
    err.line = line.size() > 120 ? line.substr(0, 120) + "..." : line;
    return err;
}

}  // namespace

void PredictorOutputSchema::validate() const {
    if (numeric_columns < 1) {
        throw ConfigError("predictor output needs at least one numeric column");
    }
    if (position_column < 0 || position_column >= numeric_columns) {
        throw ConfigError("position column " + std::to_string(position_column) + " outside the " +
                          std::to_string(numeric_columns) + " numeric columns");
    }
    if (quality_column < 0 || quality_column >= numeric_columns) {
        throw ConfigError("quality column " + std::to_string(quality_column) + " outside the " +
                          std::to_string(numeric_columns) + " numeric columns");
    }
    if (quality_column == position_column) {
        throw ConfigError("quality column and position column must differ");
    }
    if (window_length < 1) {
        throw ConfigError("predictor window length must be >= 1");
    }
}

PredictorOutputParser::PredictorOutputParser(PredictorOutputSchema schema, size_t max_warnings)
    : schema_(schema), max_warnings_(max_warnings) {
    schema_.validate();
}

bool PredictorOutputParser::parse_line(const std::string& line, size_t line_number, PredictorRecord& out,
                                       ParseError& err) const {
    const std::vector<std::string> fields = split_whitespace(line);
    const size_t numeric = static_cast<size_t>(schema_.numeric_columns);

    const bool plain = fields.size() == numeric;
    const bool with_text = schema_.sequence_column && fields.size() == numeric + 1;
    if (!plain && !with_text) {
        std::string expected = std::to_string(numeric);
        if (schema_.sequence_column) {
            expected += " or " + std::to_string(numeric + 1);
        }
        err = make_error(line_number,
                         "expected " + expected + " columns, found " + std::to_string(fields.size()), line);
        return false;
    }

    PredictorRecord rec;
    for (size_t c = 0; c < numeric; ++c) {
        if (static_cast<int>(c) == schema_.position_column) {
            if (!parse_int64(fields[c], rec.position)) {
                err = make_error(line_number, "position '" + fields[c] + "' is not an integer", line);
                return false;
            }
            continue;
        }

        double value = 0.0;
        if (!parse_finite_double(fields[c], value)) {
            err = make_error(line_number,
                             "column " + std::to_string(c + 1) + " '" + fields[c] + "' is not a number", line);
            return false;
        }
        if (static_cast<int>(c) == schema_.quality_column) {
            rec.quality = value;
        } else {
            rec.aux_scores.push_back(value);
        }
    }

    const int64_t min_position = schema_.one_based ? 1 : 0;
    if (rec.position < min_position) {
        err = make_error(line_number, "position " + std::to_string(rec.position) + " is below " +
                                          std::to_string(min_position), line);
        return false;
    }

    if (with_text) {
        rec.sequence_text = fields[numeric];
    }

    out = std::move(rec);
    return true;
}

bool PredictorOutputParser::to_candidate(const PredictorRecord& record, size_t line_number,
                                         const std::string& sequence_id, const Sequence* reference,
                                         MotifCandidate& out, ParseError& err) const {
    MotifCandidate c;
    c.sequence_id = sequence_id;
    c.motif_class = MotifClass::ALTERNATIVE_STRUCTURE;
    c.start = schema_.one_based ? record.position - 1 : record.position;
    c.score = record.quality;
    c.alternative.quality_score = record.quality;
    c.alternative.aux_scores = record.aux_scores;

    if (reference && c.start >= reference->length()) {
        err = make_error(line_number,
                         "position " + std::to_string(record.position) + " beyond end of " + sequence_id + " (" +
                             std::to_string(reference->length()) + " bp)",
                         "");
        return false;
    }

    if (!record.sequence_text.empty()) {
        c.matched_text = record.sequence_text;
        c.end = c.start + static_cast<int64_t>(c.matched_text.size());
    } else if (reference) {
        c.end = std::min(c.start + schema_.window_length, reference->length());
        c.matched_text = reference->residues.substr(static_cast<size_t>(c.start), static_cast<size_t>(c.end - c.start));
    } else {
        // No text anywhere: keep the span, text is unknown residues
        c.end = c.start + schema_.window_length;
        c.matched_text.assign(static_cast<size_t>(schema_.window_length), 'N');
    }

    out = std::move(c);
    return true;
}

std::vector<MotifCandidate> PredictorOutputParser::parse(const std::string& path, const std::string& sequence_id,
                                                         double min_score, double max_score,
                                                         const Sequence* reference, ParseSummary* summary) const {
    if (min_score > max_score) {
        throw ConfigError("quality band is empty: min " + std::to_string(min_score) + " > max " +
                          std::to_string(max_score));
    }

    std::vector<MotifCandidate> candidates;
    ParseSummary local;

    if (!std::filesystem::exists(path)) {
        LOG_WARNING("Predictor output not found: " + path);
        if (summary) {
            *summary = local;
        }
        return candidates;
    }

    TextLineReader reader(path);
    std::string line;

    auto report = [&](const ParseError& err) {
        ++local.malformed;
        if (local.first_errors.size() < max_warnings_) {
            local.first_errors.push_back(err);
            LOG_WARNING(path + ": skipped " + err.to_string());
        }
    };

    while (reader.next_line(line)) {
        ++local.lines_read;
        if (is_skippable(line)) {
            continue;
        }

        PredictorRecord record;
        ParseError err;
        if (!parse_line(line, reader.line_number(), record, err)) {
            report(err);
            continue;
        }
        ++local.records_parsed;

        if (record.quality < min_score || record.quality > max_score) {
            ++local.out_of_range;
            continue;
        }

        MotifCandidate candidate;
        if (!to_candidate(record, reader.line_number(), sequence_id, reference, candidate, err)) {
            report(err);
            continue;
        }
        candidates.push_back(std::move(candidate));
    }

    local.records_kept = candidates.size();
    if (local.malformed > local.first_errors.size()) {
        LOG_WARNING(path + ": " + std::to_string(local.malformed - local.first_errors.size()) +
                    " further malformed lines not shown");
    }
    LOG_DEBUG(path + ": " + std::to_string(local.records_parsed) + " records, " +
              std::to_string(local.records_kept) + " in [" + std::to_string(min_score) + ", " +
              std::to_string(max_score) + "], " + std::to_string(local.malformed) + " malformed");

    if (summary) {
        *summary = std::move(local);
    }
    return candidates;
}

} // namespace MotifColoc
