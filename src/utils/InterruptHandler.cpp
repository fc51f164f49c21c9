#include "utils/InterruptHandler.hpp"

#include <csignal>
#include <cstring>

#include <signal.h>

#include "utils/Logger.hpp"

namespace MotifColoc {
namespace Utils {

static_assert(std::atomic<bool>::is_always_lock_free, "interrupt flag must be lock-free");

volatile std::sig_atomic_t InterruptHandler::signal_number_ = 0;
std::atomic<bool> InterruptHandler::flag_{false};
bool InterruptHandler::installed_ = false;

namespace {
struct sigaction previous_int;
struct sigaction previous_term;
}  // namespace

void InterruptHandler::handle(int signum) {
    signal_number_ = signum;
    flag_.store(true, std::memory_order_relaxed);
}

void InterruptHandler::install() {
    if (installed_) {
        return;
    }

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = &InterruptHandler::handle;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    if (sigaction(SIGINT, &sa, &previous_int) != 0 || sigaction(SIGTERM, &sa, &previous_term) != 0) {
        LOG_WARNING("Could not install SIGINT/SIGTERM handlers; interrupts will not cancel workers cleanly");
        return;
    }
    installed_ = true;
    LOG_DEBUG("Interrupt handlers installed");
}

void InterruptHandler::restore() {
    if (!installed_) {
        return;
    }
    sigaction(SIGINT, &previous_int, nullptr);
    sigaction(SIGTERM, &previous_term, nullptr);
    installed_ = false;
}

bool InterruptHandler::interrupted() {
    return flag_.load(std::memory_order_relaxed);
}

int InterruptHandler::last_signal() {
    return static_cast<int>(signal_number_);
}

void InterruptHandler::reset() {
    signal_number_ = 0;
    flag_.store(false, std::memory_order_relaxed);
}

void InterruptHandler::raise_flag(int signum) {
    handle(signum);
}

} // namespace Utils
} // namespace MotifColoc
