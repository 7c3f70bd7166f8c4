#include "jobs/job_types.hpp"

namespace ludoteca {

std::string jobStatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::Running: return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        default: return "unknown";
    }
}

} // namespace ludoteca
