#ifndef LUDOTECA_JOB_TYPES_HPP
#define LUDOTECA_JOB_TYPES_HPP

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace ludoteca {

enum class JobStatus {
    Running,
    Completed,
    Failed
};

std::string jobStatusToString(JobStatus status);

// A job handler reports failure by throwing; what() becomes the recorded error.
using JobHandler = std::function<void()>;

// A recurring unit of work owned by the Scheduler. Callers only ever get copies.
struct Task {
    std::string name;
    std::string description;
    std::chrono::milliseconds interval{0};
    JobHandler handler;
    std::chrono::system_clock::time_point last_run{};
    std::chrono::system_clock::time_point next_run{};
    bool enabled = true;
    bool running = false;

    bool hasRun() const { return last_run != std::chrono::system_clock::time_point{}; }
};

// One run of one task. Terminal once status leaves Running.
struct JobExecution {
    std::string id;
    std::string job_name;
    JobStatus status = JobStatus::Running;
    std::chrono::system_clock::time_point start_time{};
    std::chrono::system_clock::time_point end_time{};
    std::chrono::nanoseconds duration{0};
    std::string error;
};

struct HealthStatus {
    bool is_running = false;
    int total_jobs = 0;
    int enabled_jobs = 0;
    int disabled_jobs = 0;
    std::optional<JobExecution> last_execution;
};

struct JobStatistics {
    int total_executions = 0;
    int successful_executions = 0;
    int failed_executions = 0;
    std::map<std::string, int> job_execution_counts;
    // Percentage in [0, 100]; jobs without executions have no entry.
    std::map<std::string, double> job_success_rates;
};

} // namespace ludoteca

#endif // LUDOTECA_JOB_TYPES_HPP
