#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "core/DataStructs.hpp"
#include "core/Errors.hpp"

namespace MotifColoc {

/**
 * @brief Shared stop flag observed by running predictors and the progress monitor.
 *
 * Set once, never cleared; safe to read and set from any thread.
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Files produced for one partition.
 */
struct PredictorArtifacts {
    std::string intermediate_path;  ///< Per-position scores, grows while computing
    std::string final_path;         ///< Scored windows, written at the end
    bool reused = false;            ///< Already present; nothing was run

    std::vector<std::string> paths() const {
        return {intermediate_path, final_path};
    }
};

/**
 * @brief Either artifacts (error empty) or a ProcessError.
 */
struct PredictorOutcome {
    PredictorArtifacts artifacts;
    std::optional<ProcessError> error;

    bool ok() const { return !error.has_value(); }
};

/**
 * @brief Capability of computing alternative-structure predictions for one partition.
 *
 * The worker pool depends only on this interface. Implementations must be
 * callable concurrently for distinct partitions and must return promptly
 * (with a CANCELLED error) once the token is cancelled.
 */
class Predictor {
public:
    virtual ~Predictor() = default;

    virtual PredictorOutcome run(const PartitionFile& partition, const CancellationToken& cancel) const = 0;

    /// Path of the intermediate artifact the progress monitor watches.
    virtual std::string intermediate_path(const PartitionFile& partition) const = 0;

    /// Path of the final artifact; its presence means the partition is complete.
    virtual std::string final_path(const PartitionFile& partition) const = 0;
};

} // namespace MotifColoc
