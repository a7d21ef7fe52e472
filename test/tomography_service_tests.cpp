#include "service/tomography_service.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>
#include <thread>

using service::JobResult;
using service::JobStatus;
using service::TomographyConfig;
using service::TomographyService;

namespace {

TomographyConfig make_small_config() {
    TomographyConfig config;
    config.qubits.n_qubits = 1;
    config.qubits.shots_x = 200;
    config.qubits.shots_y = 200;
    config.qubits.shots_z = 200;
    config.estimator.attempts = 4;
    return config;
}

std::optional<JobResult> wait_for(const TomographyService& service, const std::string& job_id) {
    std::optional<JobResult> result;
    for (int attempt = 0; attempt < 2000 && !result; ++attempt) {
        result = service.poll_result(job_id);
        if (!result) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
    return result;
}

}  // namespace

TEST(TomographyServiceTests, SubmitsAsyncJobAndReturnsResult) {
    TomographyService service;
    const std::string job_id = service.submit(make_small_config(), 42);
    ASSERT_FALSE(job_id.empty());

    const auto result = wait_for(service, job_id);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, JobStatus::Completed);
    ASSERT_TRUE(result->tomography.has_value());
    EXPECT_EQ(result->tomography->outcomes.size(), 3u);

    const auto snapshot = service.status(job_id);
    EXPECT_EQ(snapshot.status, JobStatus::Completed);
    EXPECT_DOUBLE_EQ(snapshot.percent_complete, 1.0);
    EXPECT_FALSE(snapshot.recent_logs.empty());
}

TEST(TomographyServiceTests, InvalidConfigFailsTheJob) {
    TomographyService service;
    auto config = make_small_config();
    config.qubits.shots_z = -5;
    const std::string job_id = service.submit(config, 1);

    const auto result = wait_for(service, job_id);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, JobStatus::Failed);
    EXPECT_FALSE(result->message.empty());
    EXPECT_FALSE(result->tomography.has_value());
}

TEST(TomographyServiceTests, UnknownJobReportsNotFound) {
    TomographyService service;
    EXPECT_FALSE(service.poll_result("job-missing").has_value());
    const auto snapshot = service.status("job-missing");
    EXPECT_EQ(snapshot.status, JobStatus::Failed);
    EXPECT_EQ(snapshot.message, "job_id not found");
    EXPECT_EQ(service::status_to_string(JobStatus::Running), "running");
}

TEST(TomographyServiceTests, ReporterKeepsNewestLogsUpToCapacity) {
    service::SessionProgressReporter reporter(3);
    EXPECT_EQ(reporter.log_capacity(), 3u);
    for (int i = 0; i < 5; ++i) {
        reporter.record_log(ExecutionLog{i, "Attempt", "attempt " + std::to_string(i)});
    }
    const auto logs = reporter.recent_logs();
    ASSERT_EQ(logs.size(), 3u);
    EXPECT_EQ(logs.front().attempt, 2);
    EXPECT_EQ(logs.back().attempt, 4);

    reporter.set_total_steps(10);
    reporter.increment_completed_steps();
    reporter.increment_completed_steps(2);
    EXPECT_EQ(reporter.total_steps(), 10u);
    EXPECT_EQ(reporter.completed_steps(), 3u);
}

TEST(TomographyServiceTests, LogCapacityGrowsWithAttempts) {
    TomographyConfig config = make_small_config();
    config.estimator.attempts = 50;
    EXPECT_EQ(
        service::log_capacity_for(config),
        service::SessionProgressReporter::kDefaultLogCapacity + 50u
    );
    EXPECT_EQ(service::SessionProgressReporter(0).log_capacity(), 1u);
}
