#pragma once

#include "service/tomography_session.hpp"

#include "progress_reporter.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <deque>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace service {

// Collects progress from a running session. Keeps the newest `log_capacity`
// records so a poller sees the latest stage and attempt messages.
class SessionProgressReporter final : public mle_tomography::ProgressReporter {
  public:
    static constexpr std::size_t kDefaultLogCapacity = 8;

    explicit SessionProgressReporter(std::size_t log_capacity = kDefaultLogCapacity)
        : log_capacity_(std::max<std::size_t>(log_capacity, 1)) {}

    void set_total_steps(std::size_t total_steps) override {
        total_steps_.store(total_steps, std::memory_order_relaxed);
    }

    void increment_completed_steps(std::size_t delta = 1) override {
        completed_steps_.fetch_add(delta, std::memory_order_relaxed);
    }

    void record_log(const ExecutionLog& log) override {
        std::lock_guard<std::mutex> lock(mutex_);
        logs_.push_back(log);
        while (logs_.size() > log_capacity_) {
            logs_.pop_front();
        }
    }

    std::size_t total_steps() const {
        return total_steps_.load(std::memory_order_relaxed);
    }

    std::size_t completed_steps() const {
        return completed_steps_.load(std::memory_order_relaxed);
    }

    std::size_t log_capacity() const { return log_capacity_; }

    std::vector<ExecutionLog> recent_logs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<ExecutionLog>(logs_.begin(), logs_.end());
    }

  private:
    const std::size_t log_capacity_;
    mutable std::mutex mutex_;
    std::deque<ExecutionLog> logs_;
    std::atomic<std::size_t> total_steps_{0};
    std::atomic<std::size_t> completed_steps_{0};
};

// Pipeline stages log a handful of records; each attempt may add one more.
std::size_t log_capacity_for(const TomographyConfig& config);

enum class JobStatus {
    Pending,
    Running,
    Completed,
    Failed,
};

std::string status_to_string(JobStatus status);

struct JobResult {
    std::string job_id;
    JobStatus status = JobStatus::Pending;
    std::optional<TomographyResult> tomography;
    double elapsed_time = 0.0;
    std::string message;
};

struct JobStatusSnapshot {
    JobStatus status = JobStatus::Pending;
    double percent_complete = 0.0;
    std::string message;
    std::vector<ExecutionLog> recent_logs;
};

// Runs tomography jobs on background threads so a front end can poll for
// progress instead of blocking on the optimizer.
class TomographyService {
  public:
    TomographyService();
    ~TomographyService();

    // Submit a run for asynchronous execution. Returns the generated job ID.
    std::string submit(TomographyConfig config, std::optional<std::uint64_t> seed = std::nullopt);

    // Final result once the job has completed or failed.
    std::optional<JobResult> poll_result(const std::string& job_id) const;

    JobStatusSnapshot status(const std::string& job_id) const;

  private:
    struct JobEntry {
        TomographyConfig config;
        std::optional<std::uint64_t> seed;
        JobResult result;
        std::shared_ptr<SessionProgressReporter> reporter;
        std::atomic<JobStatus> status{JobStatus::Pending};
        mutable std::mutex result_mutex;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<JobEntry>> jobs_;
    std::atomic<std::uint64_t> id_counter_{0};
};

}  // namespace service
