#include "core/SequenceScanner.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace MotifColoc {

namespace {

// Loop residues: the four nucleotides plus the ambiguity code N
inline bool is_loop_residue(char c) {
    switch (c) {
        case 'A':
        case 'C':
        case 'G':
        case 'T':
        case 'N':
            return true;
        default:
            return false;
    }
}

std::string to_upper_copy(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::toupper(c); });
    return out;
}

}  // namespace

SequenceScanner::SequenceScanner(const ScanParameters& params) : params_(params) {
    if (params_.min_run_length < 1) {
        throw ConfigError("min_run_length must be >= 1 (got " + std::to_string(params_.min_run_length) + ")");
    }
    if (params_.min_run_length > params_.max_run_length) {
        throw ConfigError("min_run_length (" + std::to_string(params_.min_run_length) +
                          ") must not exceed max_run_length (" + std::to_string(params_.max_run_length) + ")");
    }
    if (params_.max_loop_length < 1) {
        throw ConfigError("max_loop_length must be >= 1 (got " + std::to_string(params_.max_loop_length) + ")");
    }
    params_.repeat_base = static_cast<char>(std::toupper(static_cast<unsigned char>(params_.repeat_base)));
}

std::vector<MotifCandidate> SequenceScanner::scan(const Sequence& sequence) const {
    std::vector<MotifCandidate> candidates;
    if (sequence.residues.empty()) {
        return candidates;
    }

    const std::string upper = to_upper_copy(sequence.residues);

    for (int k = params_.min_run_length; k < params_.max_run_length; ++k) {
        auto found = scan_class(upper, sequence.id, k);
        LOG_DEBUG(sequence.id + ": run class " + std::to_string(k) + " -> " + std::to_string(found.size()) +
                  " candidates");
        candidates.insert(candidates.end(), std::make_move_iterator(found.begin()),
                          std::make_move_iterator(found.end()));
    }

    return candidates;
}

std::vector<MotifCandidate> SequenceScanner::scan_class(const std::string& upper, const std::string& sequence_id,
                                                        int run_length) const {
    std::vector<MotifCandidate> candidates;
    const int64_t n = static_cast<int64_t>(upper.size());

    // Shortest possible match: four runs of k plus three single-residue loops
    const int64_t min_match = 4 * static_cast<int64_t>(run_length) + 3;

    int64_t s = 0;
    while (s + min_match <= n) {
        if (upper[s] != params_.repeat_base || run_extent(upper, s) < run_length) {
            ++s;
            continue;
        }

        MatchMemo memo;
        int64_t e = match_runs(upper, s, 4, run_length, memo);
        if (e < 0) {
            ++s;
            continue;
        }

        MotifCandidate candidate = make_candidate(upper, sequence_id, s, e, run_length);
        if (candidate.score >= params_.min_score) {
            candidates.push_back(std::move(candidate));
        }
        // Non-overlapping within a class: resume right after the match
        s = e;
    }

    return candidates;
}

int64_t SequenceScanner::run_extent(const std::string& upper, int64_t pos) const {
    const int64_t n = static_cast<int64_t>(upper.size());
    int64_t i = pos;
    while (i < n && upper[i] == params_.repeat_base) {
        ++i;
    }
    return i - pos;
}

int64_t SequenceScanner::loop_extent(const std::string& upper, int64_t pos) const {
    const int64_t n = static_cast<int64_t>(upper.size());
    int64_t i = pos;
    while (i < n && (i - pos) < params_.max_loop_length && is_loop_residue(upper[i])) {
        ++i;
    }
    return i - pos;
}

int64_t SequenceScanner::match_runs(const std::string& upper, int64_t pos, int runs_left, int run_length,
                                    MatchMemo& memo) const {
    const int64_t key = pos * 4 + (runs_left - 1);
    auto it = memo.find(key);
    if (it != memo.end()) {
        return it->second;
    }

    int64_t result = -1;
    const int64_t available = run_extent(upper, pos);

    if (available >= run_length) {
        if (runs_left == 1) {
            // Last run is greedy and nothing follows it
            result = pos + available;
        } else {
            // Greedy run, then greedy loop, backtracking shorter on failure
            for (int64_t r = available; r >= run_length && result < 0; --r) {
                const int64_t loop_start = pos + r;
                const int64_t max_loop = loop_extent(upper, loop_start);
                for (int64_t l = max_loop; l >= 1; --l) {
                    int64_t e = match_runs(upper, loop_start + l, runs_left - 1, run_length, memo);
                    if (e >= 0) {
                        result = e;
                        break;
                    }
                }
            }
        }
    }

    memo.emplace(key, result);
    return result;
}

MotifCandidate SequenceScanner::make_candidate(const std::string& upper, const std::string& sequence_id,
                                               int64_t start, int64_t end, int run_length) const {
    MotifCandidate c;
    c.sequence_id = sequence_id;
    c.start = start;
    c.end = end;
    c.matched_text = upper.substr(static_cast<size_t>(start), static_cast<size_t>(end - start));
    c.motif_class = MotifClass::QUADRUPLEX_REPEAT;
    c.score = score_motif(c.matched_text, params_.repeat_base);

    const double len = static_cast<double>(c.matched_text.size());
    const auto base_count = std::count(c.matched_text.begin(), c.matched_text.end(), params_.repeat_base);
    const auto g_count = std::count(c.matched_text.begin(), c.matched_text.end(), 'G');
    const auto c_count = std::count(c.matched_text.begin(), c.matched_text.end(), 'C');

    c.quadruplex.g_run_length = run_length;
    c.quadruplex.g_content = base_count / len;
    c.quadruplex.gc_content = (g_count + c_count) / len;
    return c;
}

double SequenceScanner::score_motif(const std::string& text, char repeat_base) {
    if (text.empty()) {
        return 0.0;
    }

    const char base = static_cast<char>(std::toupper(static_cast<unsigned char>(repeat_base)));

    int64_t base_count = 0;
    int64_t run_count = 0;
    int64_t run_total = 0;
    int64_t gap_count = 0;
    int64_t gap_total = 0;

    size_t i = 0;
    while (i < text.size()) {
        const bool is_base = std::toupper(static_cast<unsigned char>(text[i])) == base;
        size_t j = i;
        while (j < text.size() && (std::toupper(static_cast<unsigned char>(text[j])) == base) == is_base) {
            ++j;
        }
        const int64_t stretch = static_cast<int64_t>(j - i);
        if (is_base) {
            base_count += stretch;
            ++run_count;
            run_total += stretch;
        } else {
            ++gap_count;
            gap_total += stretch;
        }
        i = j;
    }

    double score = 100.0 * static_cast<double>(base_count) / static_cast<double>(text.size());

    if (run_count >= 4) {
        score += 10.0 * run_count + 5.0 * (static_cast<double>(run_total) / run_count);
    }

    if (gap_count > 0 && static_cast<double>(gap_total) / gap_count > 5.0) {
        score *= 0.8;
    }

    // Two decimals, exact ties to the even neighbour (default rounding mode)
    return std::nearbyint(score * 100.0) / 100.0;
}

} // namespace MotifColoc
