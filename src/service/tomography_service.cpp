#include "service/tomography_service.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

namespace service {

std::string status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:
            return "pending";
        case JobStatus::Running:
            return "running";
        case JobStatus::Completed:
            return "completed";
        case JobStatus::Failed:
            return "failed";
    }
    return "unknown";
}

std::size_t log_capacity_for(const TomographyConfig& config) {
    return SessionProgressReporter::kDefaultLogCapacity + config.estimator.attempts;
}

TomographyService::TomographyService()
    : id_counter_(0) {}

TomographyService::~TomographyService() = default;

std::string TomographyService::submit(TomographyConfig config, std::optional<std::uint64_t> seed) {
    const std::uint64_t seq = id_counter_.fetch_add(1, std::memory_order_relaxed);
    const std::string job_id = "job-" + std::to_string(seq);

    auto entry = std::make_shared<JobEntry>();
    entry->config = std::move(config);
    entry->seed = seed;
    entry->reporter = std::make_shared<SessionProgressReporter>(log_capacity_for(entry->config));
    entry->result.job_id = job_id;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.emplace(job_id, entry);
    }

    std::thread worker([entry]() {
        entry->status.store(JobStatus::Running, std::memory_order_relaxed);
        const auto start = std::chrono::steady_clock::now();
        try {
            const TomographySession session = create(entry->config, entry->seed);
            TomographyResult tomography = run(session, entry->reporter.get());
            const auto end = std::chrono::steady_clock::now();
            std::lock_guard<std::mutex> guard(entry->result_mutex);
            entry->result.tomography = std::move(tomography);
            entry->result.status = JobStatus::Completed;
            entry->result.elapsed_time = std::chrono::duration<double>(end - start).count();
            entry->status.store(JobStatus::Completed, std::memory_order_relaxed);
        } catch (const std::exception& ex) {
            const auto end = std::chrono::steady_clock::now();
            std::lock_guard<std::mutex> guard(entry->result_mutex);
            entry->result.status = JobStatus::Failed;
            entry->result.message = ex.what();
            entry->result.elapsed_time = std::chrono::duration<double>(end - start).count();
            entry->status.store(JobStatus::Failed, std::memory_order_relaxed);
        }
    });
    worker.detach();

    return job_id;
}

std::optional<JobResult> TomographyService::poll_result(const std::string& job_id) const {
    std::shared_ptr<JobEntry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            return std::nullopt;
        }
        entry = it->second;
    }
    const JobStatus status = entry->status.load(std::memory_order_relaxed);
    if (status != JobStatus::Completed && status != JobStatus::Failed) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> guard(entry->result_mutex);
    return entry->result;
}

JobStatusSnapshot TomographyService::status(const std::string& job_id) const {
    JobStatusSnapshot snapshot;
    std::shared_ptr<JobEntry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            snapshot.status = JobStatus::Failed;
            snapshot.message = std::string("job_id not found");
            return snapshot;
        }
        entry = it->second;
    }
    snapshot.status = entry->status.load(std::memory_order_relaxed);
    const std::size_t total = entry->reporter->total_steps();
    const std::size_t completed = entry->reporter->completed_steps();
    snapshot.percent_complete = total == 0 ? 0.0
        : std::min(1.0, static_cast<double>(completed) / static_cast<double>(total));
    snapshot.recent_logs = entry->reporter->recent_logs();
    {
        std::lock_guard<std::mutex> guard(entry->result_mutex);
        snapshot.message = entry->result.message;
    }
    return snapshot;
}

}  // namespace service
