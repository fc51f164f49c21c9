#pragma once

#include <string>
#include <vector>

#include "core/Predictor.hpp"

namespace MotifColoc {

/**
 * @brief Settings of the external predictor executable.
 */
struct ExternalPredictorOptions {
    std::string executable = "zhunt";                ///< Resolved through PATH if it has no '/'
    int min_run = 12;                                ///< First positional argument
    int window = 8;                                  ///< Second positional argument
    int max_run = 12;                                ///< Third positional argument
    std::string intermediate_extension = "Z-SCORE";  ///< Appended to the partition file name
    std::string final_extension = "probability";     ///< Appended to the partition file name
    int grace_period_ms = 5000;                      ///< Delay between SIGTERM and SIGKILL
    int timeout_sec = 0;                             ///< Per-partition wall clock limit, 0 = none
    int wait_poll_ms = 50;                           ///< Child status polling interval
    bool reuse_existing = false;                     ///< Skip launch if the final artifact exists
    size_t stderr_tail_bytes = 2048;                 ///< Amount of stderr kept as error text
};

/**
 * @brief Runs the predictor binary as a child process, one per partition.
 *
 * Invocation: `<executable> <min_run> <window> <max_run> <partition file>`.
 * The child gets its own process group, stdin from /dev/null and
 * stdout/stderr redirected to `<partition file>.stdout.log` and
 * `<partition file>.stderr.log`. Artifacts are expected beside the
 * partition file as `<partition file>.<extension>`.
 *
 * On cancellation or timeout the whole process group receives SIGTERM, then
 * SIGKILL after the grace period; run() returns only after the child has
 * been reaped, so no worker process outlives it.
 *
 * POSIX only.
 */
class ExternalPredictor : public Predictor {
public:
    explicit ExternalPredictor(ExternalPredictorOptions options);

    PredictorOutcome run(const PartitionFile& partition, const CancellationToken& cancel) const override;

    std::string intermediate_path(const PartitionFile& partition) const override;
    std::string final_path(const PartitionFile& partition) const override;

    /// Command line for one partition (argv[0] is the executable).
    std::vector<std::string> build_command(const PartitionFile& partition) const;

    const ExternalPredictorOptions& options() const { return options_; }

private:
    /**
     * @brief Sends SIGTERM to the process group, waits up to the grace
     *        period, then SIGKILLs and reaps.
     * @return wait status of the reaped child.
     */
    int terminate_and_reap(int pid) const;

    /// Last stderr_tail_bytes of a log file, trimmed.
    std::string read_tail(const std::string& path) const;

    ExternalPredictorOptions options_;
};

} // namespace MotifColoc
