#pragma once

#include <atomic>
#include <csignal>

namespace MotifColoc {
namespace Utils {

/**
 * @brief Process-level SIGINT/SIGTERM latch.
 *
 * install() replaces the handlers of both signals with one that only sets a
 * lock-free flag; long-running loops poll interrupted(). restore() puts the
 * previous handlers back.
 */
class InterruptHandler {
public:
    static void install();
    static void restore();

    static bool interrupted();

    /// Signal number that set the flag, 0 if none.
    static int last_signal();

    /// Clears the flag (tests, or after the interrupt was handled).
    static void reset();

    /// Sets the flag as if a signal had arrived.
    static void raise_flag(int signum);

private:
    static void handle(int signum);

    static volatile std::sig_atomic_t signal_number_;
    static std::atomic<bool> flag_;
    static bool installed_;
};

} // namespace Utils
} // namespace MotifColoc
