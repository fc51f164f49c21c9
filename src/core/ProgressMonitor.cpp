#include "core/ProgressMonitor.hpp"

#include <filesystem>
#include <sstream>

#include "utils/Logger.hpp"

namespace MotifColoc {

// ==================================================
// ProgressBoard Implementation
// ==================================================

bool ProgressBoard::update(const std::string& partition_id, const PartitionProgress& progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(partition_id);
    if (it == entries_.end()) {
        entries_.emplace(partition_id, progress);
        return true;
    }
    const bool changed = it->second.status != progress.status;
    it->second = progress;
    return changed;
}

std::optional<PartitionProgress> ProgressBoard::get(const std::string& partition_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(partition_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, PartitionProgress> ProgressBoard::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t ProgressBoard::count(PartitionStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& kv : entries_) {
        if (kv.second.status == status) {
            ++n;
        }
    }
    return n;
}

void ProgressBoard::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

// ==================================================
// ProgressMonitor Implementation
// ==================================================

namespace {

// Size of a file or nullopt if it does not exist (yet)
std::optional<uintmax_t> file_size_if_exists(const std::string& path) {
    std::error_code ec;
    uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return size;
}

}  // namespace

ProgressMonitor::ProgressMonitor(ProgressBoard& board, std::vector<WatchedPartition> partitions,
                                 std::chrono::milliseconds interval)
    : board_(board), partitions_(std::move(partitions)), interval_(interval) {
    for (const auto& p : partitions_) {
        board_.update(p.partition_id, PartitionProgress());
    }
}

ProgressMonitor::~ProgressMonitor() {
    stop();
}

void ProgressMonitor::start() {
    if (thread_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&ProgressMonitor::loop, this);
}

void ProgressMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ProgressMonitor::poll_once() {
    size_t starting = 0, computing = 0, completed = 0;

    for (const auto& p : partitions_) {
        PartitionProgress progress;
        auto final_size = file_size_if_exists(p.final_path);
        auto inter_size = file_size_if_exists(p.intermediate_path);

        if (final_size) {
            progress.status = PartitionStatus::COMPLETED;
            progress.final_bytes = *final_size;
            progress.intermediate_bytes = inter_size.value_or(0);
            ++completed;
        } else if (inter_size) {
            progress.status = PartitionStatus::COMPUTING;
            progress.intermediate_bytes = *inter_size;
            ++computing;
        } else {
            progress.status = PartitionStatus::STARTING;
            ++starting;
        }

        if (board_.update(p.partition_id, progress)) {
            LOG_INFO("[" + p.partition_id + "] " + partition_status_to_string(progress.status));
        }
    }

    std::ostringstream oss;
    oss << "Progress: " << starting << " starting, " << computing << " computing, " << completed << " completed";
    LOG_DEBUG(oss.str());
}

void ProgressMonitor::loop() {
    Utils::Logger::set_thread_name("monitor");

    std::unique_lock<std::mutex> lock(stop_mutex_);
    while (!stop_requested_) {
        lock.unlock();
        poll_once();
        lock.lock();
        stop_cv_.wait_for(lock, interval_, [this] { return stop_requested_; });
    }
}

} // namespace MotifColoc
