#ifndef LUDOTECA_JOB_MANAGER_HPP
#define LUDOTECA_JOB_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "jobs/alert_service.hpp"
#include "jobs/job_types.hpp"
#include "jobs/scheduler.hpp"
#include "utils/cancellation_signal.hpp"
#include "utils/logger.hpp"

namespace ludoteca {

/**
 * Lifecycle and policy layer around one Scheduler.
 *
 * Registers the built-in alert jobs according to Config, starts and stops
 * the scheduler (manually or when a CancellationSignal fires) and derives
 * health and statistics from the execution history.
 */
class JobManager {
public:
    static constexpr const char* kOverdueAlertsJob = "overdue-alerts";
    static constexpr const char* kReminderAlertsJob = "reminder-alerts";
    static constexpr const char* kCleanupAlertsJob = "cleanup-alerts";

    struct Config {
        bool enable_overdue_alerts = true;
        bool enable_reminder_alerts = true;
        bool enable_alert_cleanup = true;

        std::chrono::milliseconds overdue_alert_schedule{std::chrono::hours(24)};
        std::chrono::milliseconds reminder_alert_schedule{std::chrono::hours(24)};
        std::chrono::milliseconds cleanup_schedule{std::chrono::hours(6)};

        // Sweep period of the underlying scheduler.
        std::chrono::milliseconds tick_interval{Scheduler::kDefaultTick};

        // Empty means the process logger with a "[JOB-MANAGER]" prefix.
        LogSink logger;

        /**
         * Defaults overridden by LUDOTECA_JOBS_* variables.
         * Throws std::invalid_argument on malformed or non-positive values.
         */
        static Config fromEnvironment();

        // Throws std::invalid_argument describing the first bad field.
        void validate() const;
    };

    static Config defaultConfig();

    // alert_service must outlive any built-in job still in flight.
    explicit JobManager(AlertService& alert_service);
    JobManager(AlertService& alert_service, Config config);
    ~JobManager();

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    /**
     * Start the scheduler. When cancel_signal fires, stop() is called from a
     * background waiter. A null signal leaves shutdown to a manual stop().
     */
    bool start(std::shared_ptr<CancellationSignal> cancel_signal, std::string* error = nullptr);
    bool stop(std::string* error = nullptr);
    bool isStarted() const;
    // For graceful shutdown: stop() leaves in-flight handlers running.
    bool waitForIdle(std::chrono::milliseconds timeout) const;

    bool runJobNow(const std::string& job_name, std::string* error = nullptr);
    std::map<std::string, Task> getJobs() const;
    std::vector<JobExecution> getJobExecutions(int limit) const;
    std::optional<Task> getJobStatus(const std::string& job_name) const;
    bool enableJob(const std::string& job_name, std::string* error = nullptr);
    bool disableJob(const std::string& job_name, std::string* error = nullptr);
    void addCustomJob(const std::string& name, const std::string& description,
                      std::chrono::milliseconds schedule, JobHandler handler);
    void removeJob(const std::string& job_name);

    // Triggers overdue-alerts then reminder-alerts without waiting for them.
    bool generateAllAlerts(std::string* error = nullptr);
    bool cleanupAlerts(std::string* error = nullptr);

    HealthStatus getHealthStatus() const;
    JobStatistics getJobStatistics() const;

private:
    AlertService& alert_service_;
    LogSink logger_;
    Scheduler scheduler_;

    // Serializes start/stop and the waiter bookkeeping. Never held while logging.
    std::mutex mutex_;
    std::atomic<bool> started_{false};

    // Per-start state shared between the signal callback and the waiter thread.
    struct WaiterState {
        std::mutex mutex;
        std::condition_variable cv;
        bool fired = false;
        bool released = false;
    };

    uint64_t session_ = 0;
    std::shared_ptr<CancellationSignal> cancel_signal_;
    CancellationSignal::CallbackId cancel_callback_ = 0;
    std::shared_ptr<WaiterState> waiter_state_;
    std::thread cancel_waiter_;

    void configureJobs(const Config& config);
    void registerAlertJob(const std::string& name, const std::string& description,
                          std::chrono::milliseconds schedule,
                          void (AlertService::*operation)(),
                          const std::string& action, const std::string& failure_context);
    void waitForCancellation(std::shared_ptr<WaiterState> state, uint64_t session);
    bool stopSession(uint64_t session, std::string* error);
    bool stopLocked(std::string* error);
    void logMessage(LogLevel level, const std::string& message) const;
};

} // namespace ludoteca

#endif // LUDOTECA_JOB_MANAGER_HPP
