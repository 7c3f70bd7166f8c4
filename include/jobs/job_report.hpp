#ifndef LUDOTECA_JOB_REPORT_HPP
#define LUDOTECA_JOB_REPORT_HPP

#include <map>
#include <string>
#include <vector>
#include "jobs/job_types.hpp"
#include "utils/json_writer.hpp"

namespace ludoteca {

// JSON views of scheduler state for a status/health endpoint.
// Timestamps are RFC 3339 UTC; durations use formatDuration().
class JobReport {
public:
    static std::string executionToJson(const JobExecution& execution);
    static std::string executionsToJson(const std::vector<JobExecution>& executions);
    static std::string healthToJson(const HealthStatus& health);
    static std::string statisticsToJson(const JobStatistics& stats);
    static std::string jobsToJson(const std::map<std::string, Task>& jobs);

private:
    static void writeExecution(JsonWriter& json, const JobExecution& execution);
};

} // namespace ludoteca

#endif // LUDOTECA_JOB_REPORT_HPP
