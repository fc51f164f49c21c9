#pragma once

#include <cstdint>
#include <string>

namespace MotifColoc {

/**
 * @brief Structural class of a motif candidate.
 *
 * - QUADRUPLEX_REPEAT: four G-runs separated by short loops, found by the in-process scanner
 * - ALTERNATIVE_STRUCTURE: Z-DNA-like windows reported by the external predictor
 */
enum class MotifClass : uint8_t {
    QUADRUPLEX_REPEAT = 0,
    ALTERNATIVE_STRUCTURE = 1
};

/**
 * @brief Strand of a gene annotation.
 */
enum class Strand : uint8_t {
    FORWARD = 0,  ///< Forward strand (+)
    REVERSE = 1,  ///< Reverse strand (-)
    UNKNOWN = 2   ///< Unknown strand (.)
};

/**
 * @brief Log level for controlling output verbosity.
 */
enum class LogLevel {
    LOG_ERROR = 0,    ///< Only errors
    LOG_WARN = 1,     ///< Errors and warnings
    LOG_INFO = 2,     ///< Normal operational messages
    LOG_DEBUG = 3     ///< Detailed debug output including every progress poll
};

/**
 * @brief Advisory status of one predictor partition, derived from its artifacts on disk.
 */
enum class PartitionStatus : uint8_t {
    STARTING = 0,   ///< No artifact written yet
    COMPUTING = 1,  ///< Intermediate scoring file exists and grows
    COMPLETED = 2   ///< Final probability file exists
};

/**
 * @brief Overall outcome of a run.
 */
enum class RunStatus : uint8_t {
    COMPLETE_SUCCESS = 0,
    PARTIAL_SUCCESS = 1,
    FAILURE = 2
};

inline std::string motif_class_to_string(MotifClass c) {
    switch (c) {
        case MotifClass::QUADRUPLEX_REPEAT: return "quadruplex";
        case MotifClass::ALTERNATIVE_STRUCTURE: return "alternative";
    }
    return "unknown";
}

inline std::string strand_to_string(Strand s) {
    switch (s) {
        case Strand::FORWARD: return "+";
        case Strand::REVERSE: return "-";
        default: return ".";
    }
}

inline Strand strand_from_char(char c) {
    switch (c) {
        case '+': return Strand::FORWARD;
        case '-': return Strand::REVERSE;
        default: return Strand::UNKNOWN;
    }
}

inline std::string partition_status_to_string(PartitionStatus s) {
    switch (s) {
        case PartitionStatus::STARTING: return "starting";
        case PartitionStatus::COMPUTING: return "computing";
        case PartitionStatus::COMPLETED: return "completed";
    }
    return "unknown";
}

inline std::string run_status_to_string(RunStatus s) {
    switch (s) {
        case RunStatus::COMPLETE_SUCCESS: return "complete_success";
        case RunStatus::PARTIAL_SUCCESS: return "partial_success";
        case RunStatus::FAILURE: return "failure";
    }
    return "unknown";
}

} // namespace MotifColoc
