#include "jobs/job_report.hpp"
#include "utils/time_utils.hpp"

namespace ludoteca {

void JobReport::writeExecution(JsonWriter& json, const JobExecution& execution) {
    json.beginObject();
    json.key("id").value(execution.id);
    json.key("job_name").value(execution.job_name);
    json.key("status").value(jobStatusToString(execution.status));
    json.key("start_time").value(formatTimestamp(execution.start_time));
    if (execution.status != JobStatus::Running) {
        json.key("end_time").value(formatTimestamp(execution.end_time));
    }
    if (!execution.error.empty()) {
        json.key("error").value(execution.error);
    }
    json.key("duration").value(formatDuration(execution.duration));
    json.endObject();
}

std::string JobReport::executionToJson(const JobExecution& execution) {
    JsonWriter json;
    writeExecution(json, execution);
    return json.str();
}

std::string JobReport::executionsToJson(const std::vector<JobExecution>& executions) {
    JsonWriter json;
    json.beginObject().key("executions").beginArray();
    for (const auto& execution : executions) {
        writeExecution(json, execution);
    }
    json.endArray().endObject();
    return json.str();
}

std::string JobReport::healthToJson(const HealthStatus& health) {
    JsonWriter json;
    json.beginObject();
    json.key("is_running").value(health.is_running);
    json.key("total_jobs").value(health.total_jobs);
    json.key("enabled_jobs").value(health.enabled_jobs);
    json.key("disabled_jobs").value(health.disabled_jobs);
    if (health.last_execution) {
        json.key("last_execution");
        writeExecution(json, *health.last_execution);
    }
    json.endObject();
    return json.str();
}

std::string JobReport::statisticsToJson(const JobStatistics& stats) {
    JsonWriter json;
    json.beginObject();
    json.key("total_executions").value(stats.total_executions);
    json.key("successful_executions").value(stats.successful_executions);
    json.key("failed_executions").value(stats.failed_executions);

    json.key("job_execution_counts").beginObject();
    for (const auto& entry : stats.job_execution_counts) {
        json.key(entry.first).value(entry.second);
    }
    json.endObject();

    json.key("job_success_rates").beginObject();
    for (const auto& entry : stats.job_success_rates) {
        json.key(entry.first).value(entry.second);
    }
    json.endObject();

    json.endObject();
    return json.str();
}

std::string JobReport::jobsToJson(const std::map<std::string, Task>& jobs) {
    JsonWriter json;
    json.beginObject().key("jobs").beginObject();
    for (const auto& entry : jobs) {
        const Task& task = entry.second;
        json.key(entry.first).beginObject();
        json.key("description").value(task.description);
        json.key("schedule").value(formatDuration(task.interval));
        json.key("enabled").value(task.enabled);
        json.key("running").value(task.running);
        if (task.hasRun()) {
            json.key("last_run").value(formatTimestamp(task.last_run));
        }
        json.key("next_run").value(formatTimestamp(task.next_run));
        json.endObject();
    }
    json.endObject().endObject();
    return json.str();
}

} // namespace ludoteca
