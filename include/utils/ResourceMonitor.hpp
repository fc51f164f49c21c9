#pragma once

#include <sys/resource.h>

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>

#ifdef USE_JEMALLOC
#include <jemalloc/jemalloc.h>
#endif

namespace MotifColoc {
namespace Utils {

/**
 * @brief Wall-clock and memory usage of a stage, a test or the whole run.
 */
class ResourceMonitor {
public:
    ResourceMonitor() {
        reset();
    }

    void reset() {
        start_time_ = std::chrono::steady_clock::now();
    }

    double get_elapsed_seconds() const {
        auto end_time = std::chrono::steady_clock::now();
        std::chrono::duration<double> elapsed = end_time - start_time_;
        return elapsed.count();
    }

    // Returns allocated memory in bytes (jemalloc builds only, 0 otherwise)
    size_t get_memory_usage() const {
        size_t allocated = 0;
#ifdef USE_JEMALLOC
        size_t sz = sizeof(size_t);
        // epoch needs to be advanced to get up-to-date stats
        uint64_t epoch = 1;
        mallctl("epoch", &epoch, &sz, &epoch, sizeof(epoch));

        if (mallctl("stats.allocated", &allocated, &sz, NULL, 0) != 0) {
            allocated = 0;
        }
#endif
        return allocated;
    }

    // Peak resident set size of this process in bytes
    static size_t get_peak_rss() {
        struct rusage usage;
        if (getrusage(RUSAGE_SELF, &usage) != 0) {
            return 0;
        }
        return static_cast<size_t>(usage.ru_maxrss) * 1024;  // ru_maxrss is in KiB on Linux
    }

    void print_stats(const std::string& label = "Execution") const {
        double time = get_elapsed_seconds();

        std::cout << "[" << label << "] ";
        std::cout << "Time: " << std::fixed << std::setprecision(4) << time << " s";

#ifdef USE_JEMALLOC
        size_t mem = get_memory_usage();
        std::cout << ", Memory: " << std::fixed << std::setprecision(2) << (mem / 1024.0 / 1024.0) << " MB";
#else
        std::cout << ", Peak RSS: " << std::fixed << std::setprecision(2) << (get_peak_rss() / 1024.0 / 1024.0)
                  << " MB";
#endif
        std::cout << std::endl;
    }

private:
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace Utils
} // namespace MotifColoc
