#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace MotifColoc {

/**
 * @brief Missing, empty or malformed sequence/annotation input.
 *
 * Fatal: raised before orchestration starts.
 */
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Inconsistent parameters (e.g. min > max thresholds, non-positive window).
 *
 * Fatal: raised at configuration-validation time.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A single malformed line. Recovered locally by the caller.
 */
struct ParseError {
    size_t line_number = 0;  ///< 1-based line number within the source file
    std::string reason;      ///< Short description of the violation
    std::string line;        ///< Offending line (may be truncated)

    std::string to_string() const {
        return "line " + std::to_string(line_number) + ": " + reason;
    }
};

/**
 * @brief Why an external predictor invocation did not succeed.
 */
enum class ProcessErrorKind {
    NON_ZERO_EXIT,   ///< Process exited with a nonzero code
    SIGNALED,        ///< Process was terminated by a signal it did not expect
    LAUNCH_FAILURE,  ///< fork/exec failed
    TIMEOUT,         ///< Exceeded the configured per-partition timeout
    CANCELLED        ///< Stopped because the run was cancelled
};

/**
 * @brief Recorded per partition in the failure list; never aborts sibling partitions.
 */
struct ProcessError {
    ProcessErrorKind kind = ProcessErrorKind::NON_ZERO_EXIT;
    int exit_code = -1;   ///< Exit code or signal number, -1 if not applicable
    std::string message;  ///< Captured stderr tail or launch error text

    static std::string kind_to_string(ProcessErrorKind k) {
        switch (k) {
            case ProcessErrorKind::NON_ZERO_EXIT: return "non_zero_exit";
            case ProcessErrorKind::SIGNALED: return "signaled";
            case ProcessErrorKind::LAUNCH_FAILURE: return "launch_failure";
            case ProcessErrorKind::TIMEOUT: return "timeout";
            case ProcessErrorKind::CANCELLED: return "cancelled";
        }
        return "unknown";
    }
};

} // namespace MotifColoc
