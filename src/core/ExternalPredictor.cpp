#include "core/ExternalPredictor.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/Logger.hpp"

namespace MotifColoc {

namespace {

namespace fs = std::filesystem;

using Clock = std::chrono::steady_clock;

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return "";
    }
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

void remove_if_exists(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        LOG_WARNING("Could not remove stale file " + path + ": " + ec.message());
    }
}

// Child side of fork(): only async-signal-safe calls until exec.
[[noreturn]] void exec_child(char* const* argv, const char* stdout_log, const char* stderr_log, int error_fd) {
    setpgid(0, 0);

    int in_fd = open("/dev/null", O_RDONLY);
    int out_fd = open(stdout_log, O_WRONLY | O_CREAT | O_TRUNC, 0644);
    int err_fd = open(stderr_log, O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (in_fd < 0 || out_fd < 0 || err_fd < 0) {
        int code = errno;
        ssize_t ignored = write(error_fd, &code, sizeof(code));
        (void)ignored;
        _exit(127);
    }
    dup2(in_fd, STDIN_FILENO);
    dup2(out_fd, STDOUT_FILENO);
    dup2(err_fd, STDERR_FILENO);
    close(in_fd);
    close(out_fd);
    close(err_fd);

    execvp(argv[0], argv);

    int code = errno;
    ssize_t ignored = write(error_fd, &code, sizeof(code));
    (void)ignored;
    _exit(127);
}

ProcessError make_error(ProcessErrorKind kind, int code, const std::string& message) {
    ProcessError err;
    err.kind = kind;
    err.exit_code = code;
    err.message = message;
    return err;
}

}  // namespace

ExternalPredictor::ExternalPredictor(ExternalPredictorOptions options) : options_(std::move(options)) {}

std::string ExternalPredictor::intermediate_path(const PartitionFile& partition) const {
    return partition.sequence_file + "." + options_.intermediate_extension;
}

std::string ExternalPredictor::final_path(const PartitionFile& partition) const {
    return partition.sequence_file + "." + options_.final_extension;
}

std::vector<std::string> ExternalPredictor::build_command(const PartitionFile& partition) const {
    return {options_.executable, std::to_string(options_.min_run), std::to_string(options_.window),
            std::to_string(options_.max_run), partition.sequence_file};
}

PredictorOutcome ExternalPredictor::run(const PartitionFile& partition, const CancellationToken& cancel) const {
    PredictorOutcome outcome;
    outcome.artifacts.intermediate_path = intermediate_path(partition);
    outcome.artifacts.final_path = final_path(partition);

    if (options_.reuse_existing && fs::exists(outcome.artifacts.final_path)) {
        LOG_INFO("[" + partition.partition_id + "] reusing existing " + outcome.artifacts.final_path);
        outcome.artifacts.reused = true;
        return outcome;
    }

    if (cancel.is_cancelled()) {
        outcome.error = make_error(ProcessErrorKind::CANCELLED, -1, "cancelled before launch");
        return outcome;
    }

    // Artifacts left by an earlier run must not count as progress or success
    remove_if_exists(outcome.artifacts.intermediate_path);
    remove_if_exists(outcome.artifacts.final_path);

    const std::string stdout_log = partition.sequence_file + ".stdout.log";
    const std::string stderr_log = partition.sequence_file + ".stderr.log";
    const std::vector<std::string> command = build_command(partition);

    // argv is built before fork(): the child must not allocate
    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& arg : command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // Exec failures are reported through a close-on-exec pipe: EOF means exec succeeded.
    int error_pipe[2];
    if (pipe(error_pipe) != 0) {
        outcome.error = make_error(ProcessErrorKind::LAUNCH_FAILURE, errno,
                                   std::string("pipe() failed: ") + std::strerror(errno));
        return outcome;
    }
    fcntl(error_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(error_pipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        int code = errno;
        close(error_pipe[0]);
        close(error_pipe[1]);
        outcome.error = make_error(ProcessErrorKind::LAUNCH_FAILURE, code,
                                   std::string("fork() failed: ") + std::strerror(code));
        return outcome;
    }
    if (pid == 0) {
        close(error_pipe[0]);
        exec_child(argv.data(), stdout_log.c_str(), stderr_log.c_str(), error_pipe[1]);
    }

    // Also set in the parent so signalling the group cannot race the child's setpgid
    setpgid(pid, pid);
    close(error_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(error_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(error_pipe[0]);

    if (n > 0) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        outcome.error = make_error(ProcessErrorKind::LAUNCH_FAILURE, exec_errno,
                                   "cannot execute '" + options_.executable + "': " + std::strerror(exec_errno));
        return outcome;
    }

    LOG_DEBUG("[" + partition.partition_id + "] launched pid " + std::to_string(pid) + ": " + options_.executable +
              " " + command[1] + " " + command[2] + " " + command[3] + " " + command[4]);

    const auto start = Clock::now();
    const bool has_timeout = options_.timeout_sec > 0;
    const auto deadline = start + std::chrono::seconds(options_.timeout_sec);

    int status = 0;
    bool reaped = false;
    std::optional<ProcessErrorKind> forced;

    while (!reaped) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            reaped = true;
            break;
        }
        if (r < 0 && errno != EINTR) {
            outcome.error = make_error(ProcessErrorKind::LAUNCH_FAILURE, errno,
                                       std::string("waitpid() failed: ") + std::strerror(errno));
            return outcome;
        }

        if (cancel.is_cancelled()) {
            forced = ProcessErrorKind::CANCELLED;
        } else if (has_timeout && Clock::now() >= deadline) {
            forced = ProcessErrorKind::TIMEOUT;
        }

        if (forced) {
            LOG_WARNING("[" + partition.partition_id + "] " +
                        (*forced == ProcessErrorKind::TIMEOUT ? "timed out" : "cancelled") +
                        ", terminating pid " + std::to_string(pid));
            status = terminate_and_reap(pid);
            reaped = true;
            break;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(options_.wait_poll_ms));
    }

    if (forced) {
        std::string message = *forced == ProcessErrorKind::TIMEOUT
                                  ? "exceeded timeout of " + std::to_string(options_.timeout_sec) + " s"
                                  : "cancelled while running";
        outcome.error = make_error(*forced, WIFSIGNALED(status) ? WTERMSIG(status) : -1, message);
        return outcome;
    }

    if (WIFSIGNALED(status)) {
        const int sig = WTERMSIG(status);
        std::string tail = read_tail(stderr_log);
        outcome.error = make_error(ProcessErrorKind::SIGNALED, sig,
                                   "killed by signal " + std::to_string(sig) + (tail.empty() ? "" : ": " + tail));
        return outcome;
    }

    const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (code != 0) {
        std::string tail = read_tail(stderr_log);
        outcome.error = make_error(ProcessErrorKind::NON_ZERO_EXIT, code,
                                   "exit code " + std::to_string(code) + (tail.empty() ? "" : ": " + tail));
        return outcome;
    }

    if (!fs::exists(outcome.artifacts.final_path)) {
        outcome.error = make_error(ProcessErrorKind::NON_ZERO_EXIT, 0,
                                   "exited normally but produced no " + outcome.artifacts.final_path);
        return outcome;
    }

    return outcome;
}

int ExternalPredictor::terminate_and_reap(int pid) const {
    int status = 0;

    // The child is not reaped yet, so its pid and group id cannot have been reused
    kill(-pid, SIGTERM);

    const auto grace_end = Clock::now() + std::chrono::milliseconds(options_.grace_period_ms);
    while (Clock::now() < grace_end) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            return status;
        }
        if (r < 0 && errno != EINTR) {
            return status;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(options_.wait_poll_ms));
    }

    LOG_WARNING("pid " + std::to_string(pid) + " survived SIGTERM for " + std::to_string(options_.grace_period_ms) +
                " ms, sending SIGKILL");
    kill(-pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return status;
}

std::string ExternalPredictor::read_tail(const std::string& path) const {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in.is_open()) {
        return "";
    }
    const std::streamoff size = in.tellg();
    const std::streamoff keep = std::min<std::streamoff>(size, static_cast<std::streamoff>(options_.stderr_tail_bytes));
    in.seekg(size - keep);
    std::string tail(static_cast<size_t>(keep), '\0');
    in.read(&tail[0], keep);
    return trim(tail);
}

} // namespace MotifColoc
