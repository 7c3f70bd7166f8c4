#include "jobs/job_manager.hpp"
#include "utils/env_config.hpp"

#include <stdexcept>
#include <utility>

namespace ludoteca {

namespace {

LogSink resolveLogger(const JobManager::Config& config) {
    return config.logger ? config.logger : Logger::makeSink("[JOB-MANAGER]");
}

const JobManager::Config& validated(const JobManager::Config& config) {
    config.validate();
    return config;
}

} // namespace

JobManager::Config JobManager::Config::fromEnvironment() {
    Config config;
    config.enable_overdue_alerts = getEnvBool("LUDOTECA_JOBS_ENABLE_OVERDUE", config.enable_overdue_alerts);
    config.enable_reminder_alerts = getEnvBool("LUDOTECA_JOBS_ENABLE_REMINDERS", config.enable_reminder_alerts);
    config.enable_alert_cleanup = getEnvBool("LUDOTECA_JOBS_ENABLE_CLEANUP", config.enable_alert_cleanup);

    config.overdue_alert_schedule = getEnvDuration("LUDOTECA_JOBS_OVERDUE_SCHEDULE", config.overdue_alert_schedule);
    config.reminder_alert_schedule = getEnvDuration("LUDOTECA_JOBS_REMINDER_SCHEDULE", config.reminder_alert_schedule);
    config.cleanup_schedule = getEnvDuration("LUDOTECA_JOBS_CLEANUP_SCHEDULE", config.cleanup_schedule);
    config.tick_interval = getEnvDuration("LUDOTECA_JOBS_TICK", config.tick_interval);

    config.validate();
    return config;
}

void JobManager::Config::validate() const {
    if (overdue_alert_schedule.count() <= 0) {
        throw std::invalid_argument("overdue alert schedule must be positive");
    }
    if (reminder_alert_schedule.count() <= 0) {
        throw std::invalid_argument("reminder alert schedule must be positive");
    }
    if (cleanup_schedule.count() <= 0) {
        throw std::invalid_argument("cleanup schedule must be positive");
    }
    if (tick_interval.count() <= 0) {
        throw std::invalid_argument("scheduler tick must be positive");
    }
}

JobManager::Config JobManager::defaultConfig() {
    return Config();
}

JobManager::JobManager(AlertService& alert_service)
    : JobManager(alert_service, defaultConfig()) {
}

JobManager::JobManager(AlertService& alert_service, Config config)
    : alert_service_(alert_service),
      logger_(resolveLogger(config)),
      scheduler_(logger_, validated(config).tick_interval) {
    configureJobs(config);
}

JobManager::~JobManager() {
    bool stopped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped = stopLocked(nullptr);
    }
    if (stopped) {
        logMessage(LogLevel::INFO, "Job manager stopped successfully");
    }
    if (cancel_waiter_.joinable()) {
        cancel_waiter_.join();
    }
}

void JobManager::configureJobs(const Config& config) {
    scheduler_.removeTask(kOverdueAlertsJob);
    scheduler_.removeTask(kReminderAlertsJob);
    scheduler_.removeTask(kCleanupAlertsJob);

    if (config.enable_overdue_alerts) {
        registerAlertJob(kOverdueAlertsJob, "Generate alerts for overdue items",
                         config.overdue_alert_schedule, &AlertService::generateOverdueAlerts,
                         "overdue alert generation", "overdue alert generation failed");
    }

    if (config.enable_reminder_alerts) {
        registerAlertJob(kReminderAlertsJob, "Generate reminder alerts for items due soon",
                         config.reminder_alert_schedule, &AlertService::generateReminderAlerts,
                         "reminder alert generation", "reminder alert generation failed");
    }

    if (config.enable_alert_cleanup) {
        registerAlertJob(kCleanupAlertsJob, "Clean up alerts for returned items",
                         config.cleanup_schedule, &AlertService::cleanupResolvedAlerts,
                         "alert cleanup", "alert cleanup failed");
    }
}

void JobManager::registerAlertJob(const std::string& name, const std::string& description,
                                  std::chrono::milliseconds schedule,
                                  void (AlertService::*operation)(),
                                  const std::string& action, const std::string& failure_context) {
    // Handlers may outlive this manager, so they hold no pointer to it.
    AlertService* service = &alert_service_;
    LogSink logger = logger_;
    scheduler_.addTask(name, description, schedule,
                       [service, logger, operation, action, failure_context]() {
        logger(LogLevel::INFO, "Starting " + action);
        try {
            (service->*operation)();
        } catch (const std::exception& e) {
            logger(LogLevel::ERROR, "Failed " + action + ": " + e.what());
            throw std::runtime_error(failure_context + ": " + e.what());
        }
        logger(LogLevel::INFO, "Finished " + action + " successfully");
    });
}

bool JobManager::start(std::shared_ptr<CancellationSignal> cancel_signal, std::string* error) {
    std::thread previous_waiter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_.load()) {
            if (error) *error = "job manager is already started";
            return false;
        }

        scheduler_.start();
        started_.store(true);
        const uint64_t session = ++session_;

        previous_waiter = std::move(cancel_waiter_);
        waiter_state_.reset();
        cancel_signal_ = std::move(cancel_signal);

        if (cancel_signal_) {
            auto state = std::make_shared<WaiterState>();
            waiter_state_ = state;
            cancel_callback_ = cancel_signal_->onCancel([state]() {
                std::lock_guard<std::mutex> state_lock(state->mutex);
                state->fired = true;
                state->cv.notify_all();
            });
            cancel_waiter_ = std::thread([this, state, session]() {
                waitForCancellation(state, session);
            });
        }
    }
    logMessage(LogLevel::INFO, "Job manager started successfully");

    // A waiter from an earlier run may still be leaving stopSession().
    if (previous_waiter.joinable()) {
        previous_waiter.join();
    }
    return true;
}

bool JobManager::stop(std::string* error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stopLocked(error)) return false;
    }
    logMessage(LogLevel::INFO, "Job manager stopped successfully");
    return true;
}

bool JobManager::stopSession(uint64_t session, std::string* error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session != session_) {
            if (error) *error = "job manager was restarted";
            return false;
        }
        if (!stopLocked(error)) return false;
    }
    logMessage(LogLevel::INFO, "Job manager stopped successfully");
    return true;
}

bool JobManager::stopLocked(std::string* error) {
    if (!started_.load()) {
        if (error) *error = "job manager is not started";
        return false;
    }

    scheduler_.stop();
    started_.store(false);

    if (cancel_signal_) {
        cancel_signal_->removeCallback(cancel_callback_);
        cancel_signal_.reset();
        cancel_callback_ = 0;
    }
    if (waiter_state_) {
        std::lock_guard<std::mutex> state_lock(waiter_state_->mutex);
        waiter_state_->released = true;
        waiter_state_->cv.notify_all();
    }
    return true;
}

void JobManager::waitForCancellation(std::shared_ptr<WaiterState> state, uint64_t session) {
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->cv.wait(lock, [&state]() { return state->fired || state->released; });
        if (state->released) return;
    }

    logMessage(LogLevel::INFO, "Cancellation signal received");
    std::string error;
    if (!stopSession(session, &error)) {
        logMessage(LogLevel::DEBUG, "Cancellation ignored: " + error);
    }
}

bool JobManager::isStarted() const {
    return started_.load();
}

bool JobManager::waitForIdle(std::chrono::milliseconds timeout) const {
    return scheduler_.waitForIdle(timeout);
}

bool JobManager::runJobNow(const std::string& job_name, std::string* error) {
    return scheduler_.runNow(job_name, error);
}

std::map<std::string, Task> JobManager::getJobs() const {
    return scheduler_.getTasks();
}

std::vector<JobExecution> JobManager::getJobExecutions(int limit) const {
    return scheduler_.getExecutions(limit);
}

std::optional<Task> JobManager::getJobStatus(const std::string& job_name) const {
    return scheduler_.getTaskStatus(job_name);
}

bool JobManager::enableJob(const std::string& job_name, std::string* error) {
    return scheduler_.enableTask(job_name, error);
}

bool JobManager::disableJob(const std::string& job_name, std::string* error) {
    return scheduler_.disableTask(job_name, error);
}

void JobManager::addCustomJob(const std::string& name, const std::string& description,
                              std::chrono::milliseconds schedule, JobHandler handler) {
    scheduler_.addTask(name, description, schedule, std::move(handler));
}

void JobManager::removeJob(const std::string& job_name) {
    scheduler_.removeTask(job_name);
}

bool JobManager::generateAllAlerts(std::string* error) {
    for (const char* job_name : {kOverdueAlertsJob, kReminderAlertsJob}) {
        std::string cause;
        if (!runJobNow(job_name, &cause)) {
            if (error) *error = std::string("failed to run job ") + job_name + ": " + cause;
            return false;
        }
    }
    return true;
}

bool JobManager::cleanupAlerts(std::string* error) {
    return runJobNow(kCleanupAlertsJob, error);
}

HealthStatus JobManager::getHealthStatus() const {
    HealthStatus status;
    status.is_running = isStarted();

    const auto jobs = scheduler_.getTasks();
    status.total_jobs = static_cast<int>(jobs.size());
    for (const auto& entry : jobs) {
        if (entry.second.enabled) {
            status.enabled_jobs++;
        } else {
            status.disabled_jobs++;
        }
    }

    auto executions = scheduler_.getExecutions(1);
    if (!executions.empty()) {
        status.last_execution = std::move(executions.front());
    }
    return status;
}

JobStatistics JobManager::getJobStatistics() const {
    const auto executions = scheduler_.getExecutions(0);

    JobStatistics stats;
    stats.total_executions = static_cast<int>(executions.size());

    std::map<std::string, int> successes;
    for (const auto& execution : executions) {
        stats.job_execution_counts[execution.job_name]++;
        if (execution.status == JobStatus::Completed) {
            stats.successful_executions++;
            successes[execution.job_name]++;
        } else if (execution.status == JobStatus::Failed) {
            stats.failed_executions++;
        }
    }

    for (const auto& entry : stats.job_execution_counts) {
        if (entry.second <= 0) continue;
        stats.job_success_rates[entry.first] =
            static_cast<double>(successes[entry.first]) / static_cast<double>(entry.second) * 100.0;
    }
    return stats;
}

void JobManager::logMessage(LogLevel level, const std::string& message) const {
    if (logger_) logger_(level, message);
}

} // namespace ludoteca
