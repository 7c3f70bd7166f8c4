#include "jobs/scheduler.hpp"
#include "utils/time_utils.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <set>
#include <shared_mutex>
#include <system_error>
#include <utility>

namespace ludoteca {

struct Scheduler::State {
    LogSink logger;

    mutable std::shared_mutex mutex;
    std::map<std::string, Task> tasks;
    // Registration generation per name; a completion only reschedules the
    // registration it was launched from.
    std::map<std::string, uint64_t> generations;
    // Names with an execution in flight, independent of re-registration.
    std::set<std::string> active;
    std::deque<JobExecution> executions;
    uint64_t execution_seq = 0;
    uint64_t generation_seq = 0;

    mutable std::mutex idle_mutex;
    mutable std::condition_variable idle_cv;
    std::size_t in_flight = 0;

    void log(LogLevel level, const std::string& message) const {
        if (logger) logger(level, message);
    }
};

namespace {

using State = Scheduler::State;

struct Launch {
    std::string name;
    uint64_t generation = 0;
    std::string id;
    JobHandler handler;
    std::chrono::steady_clock::time_point started;
};

std::string makeExecutionId(const std::string& name,
                            std::chrono::system_clock::time_point start,
                            uint64_t sequence) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(start.time_since_epoch()).count();
    return name + "-" + std::to_string(seconds) + "-" + std::to_string(sequence);
}

std::string notFound(const std::string& name) {
    return "job '" + name + "' not found";
}

void trimHistory(State& state) {
    while (state.executions.size() > Scheduler::kMaxExecutions) {
        state.executions.pop_front();
    }
}

// Caller holds the registry lock exclusively.
Launch prepareLaunch(State& state, Task& task) {
    const auto start_time = std::chrono::system_clock::now();

    Launch launch;
    launch.name = task.name;
    launch.generation = state.generations[task.name];
    launch.id = makeExecutionId(task.name, start_time, ++state.execution_seq);
    launch.handler = task.handler;
    launch.started = std::chrono::steady_clock::now();

    task.running = true;
    state.active.insert(task.name);

    JobExecution execution;
    execution.id = launch.id;
    execution.job_name = task.name;
    execution.status = JobStatus::Running;
    execution.start_time = start_time;
    state.executions.push_back(std::move(execution));
    trimHistory(state);

    {
        std::lock_guard<std::mutex> lock(state.idle_mutex);
        ++state.in_flight;
    }
    return launch;
}

void finishExecution(State& state, const Launch& launch, bool failed, const std::string& error) {
    const auto end_time = std::chrono::system_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - launch.started);

    {
        std::unique_lock<std::shared_mutex> lock(state.mutex);
        // Evicted records stay evicted.
        for (auto it = state.executions.rbegin(); it != state.executions.rend(); ++it) {
            if (it->id != launch.id) continue;
            it->end_time = end_time;
            it->duration = elapsed;
            it->status = failed ? JobStatus::Failed : JobStatus::Completed;
            it->error = error;
            break;
        }

        state.active.erase(launch.name);
        auto task = state.tasks.find(launch.name);
        if (task != state.tasks.end()) {
            task->second.running = false;
            auto generation = state.generations.find(launch.name);
            if (generation != state.generations.end() && generation->second == launch.generation) {
                task->second.last_run = end_time;
                task->second.next_run = end_time + task->second.interval;
            }
        }
    }

    if (failed) {
        state.log(LogLevel::ERROR, "Job execution failed: " + launch.id + " - " + error);
    } else {
        state.log(LogLevel::INFO, "Job execution completed: " + launch.id +
                  " (" + formatDuration(elapsed) + ")");
    }

    {
        std::lock_guard<std::mutex> lock(state.idle_mutex);
        --state.in_flight;
    }
    state.idle_cv.notify_all();
}

void runExecution(const std::shared_ptr<State>& state, const Launch& launch) {
    bool failed = false;
    std::string error;
    try {
        if (launch.handler) launch.handler();
    } catch (const std::exception& e) {
        failed = true;
        error = e.what();
        if (error.empty()) error = "job failed";
    } catch (...) {
        failed = true;
        error = "unknown error";
    }
    finishExecution(*state, launch, failed, error);
}

// Returns false when no thread could be created; the record is then failed.
bool launchExecution(const std::shared_ptr<State>& state, Launch launch, std::string* error) {
    state->log(LogLevel::INFO, "Starting job execution: " + launch.id);
    try {
        std::thread([state, launch]() { runExecution(state, launch); }).detach();
    } catch (const std::system_error& e) {
        const std::string reason = std::string("failed to start thread: ") + e.what();
        finishExecution(*state, launch, true, reason);
        if (error) *error = "failed to start job '" + launch.name + "': " + reason;
        return false;
    }
    return true;
}

} // namespace

Scheduler::Scheduler(LogSink logger, std::chrono::milliseconds tick)
    : state_(std::make_shared<State>()),
      tick_(tick),
      timer_(io_) {
    state_->logger = logger ? std::move(logger) : Logger::makeSink("[SCHEDULER]");
}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::addTask(const std::string& name, const std::string& description,
                        std::chrono::milliseconds interval, JobHandler handler) {
    {
        std::unique_lock<std::shared_mutex> lock(state_->mutex);
        Task task;
        task.name = name;
        task.description = description;
        task.interval = interval;
        task.handler = std::move(handler);
        task.next_run = std::chrono::system_clock::now() + interval;
        task.enabled = true;
        task.running = state_->active.count(name) > 0;
        state_->tasks[name] = std::move(task);
        state_->generations[name] = ++state_->generation_seq;
    }
    logMessage(LogLevel::INFO, "Added job '" + name + "' with schedule " + formatDuration(interval));
}

void Scheduler::removeTask(const std::string& name) {
    {
        std::unique_lock<std::shared_mutex> lock(state_->mutex);
        state_->tasks.erase(name);
        state_->generations.erase(name);
    }
    logMessage(LogLevel::INFO, "Removed job '" + name + "'");
}

bool Scheduler::enableTask(const std::string& name, std::string* error) {
    {
        std::unique_lock<std::shared_mutex> lock(state_->mutex);
        auto it = state_->tasks.find(name);
        if (it == state_->tasks.end()) {
            if (error) *error = notFound(name);
            return false;
        }
        it->second.enabled = true;
    }
    logMessage(LogLevel::INFO, "Enabled job '" + name + "'");
    return true;
}

bool Scheduler::disableTask(const std::string& name, std::string* error) {
    {
        std::unique_lock<std::shared_mutex> lock(state_->mutex);
        auto it = state_->tasks.find(name);
        if (it == state_->tasks.end()) {
            if (error) *error = notFound(name);
            return false;
        }
        it->second.enabled = false;
    }
    logMessage(LogLevel::INFO, "Disabled job '" + name + "'");
    return true;
}

bool Scheduler::runNow(const std::string& name, std::string* error) {
    Launch launch;
    {
        std::unique_lock<std::shared_mutex> lock(state_->mutex);
        auto it = state_->tasks.find(name);
        if (it == state_->tasks.end()) {
            if (error) *error = notFound(name);
            return false;
        }
        Task& task = it->second;
        if (!task.enabled) {
            if (error) *error = "job '" + name + "' is disabled";
            return false;
        }
        if (state_->active.count(name) > 0) {
            if (error) *error = "job '" + name + "' is already running";
            return false;
        }
        launch = prepareLaunch(*state_, task);
    }

    logMessage(LogLevel::INFO, "Running job '" + name + "' on demand");
    return launchExecution(state_, std::move(launch), error);
}

void Scheduler::start() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (running_.load()) return;

        io_.restart();
        scheduleTick();
        worker_ = std::thread([this]() { io_.run(); });
        running_.store(true);
    }
    logMessage(LogLevel::INFO, "Job scheduler started");
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!running_.load()) return;

        running_.store(false);
        io_.stop();
        if (worker_.joinable()) worker_.join();
        // The sweep thread is gone; the aborted wait is dropped on the next restart().
        timer_.cancel();
    }
    logMessage(LogLevel::INFO, "Job scheduler stopped");
}

bool Scheduler::isRunning() const {
    return running_.load();
}

bool Scheduler::waitForIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->idle_mutex);
    return state_->idle_cv.wait_for(lock, timeout, [this]() { return state_->in_flight == 0; });
}

std::map<std::string, Task> Scheduler::getTasks() const {
    std::shared_lock<std::shared_mutex> lock(state_->mutex);
    return state_->tasks;
}

std::vector<JobExecution> Scheduler::getExecutions(int limit) const {
    std::shared_lock<std::shared_mutex> lock(state_->mutex);

    std::size_t count = state_->executions.size();
    if (limit > 0 && static_cast<std::size_t>(limit) < count) {
        count = static_cast<std::size_t>(limit);
    }

    std::vector<JobExecution> result;
    result.reserve(count);
    for (auto it = state_->executions.rbegin(); it != state_->executions.rend() && result.size() < count; ++it) {
        result.push_back(*it);
    }
    return result;
}

std::optional<Task> Scheduler::getTaskStatus(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(state_->mutex);
    auto it = state_->tasks.find(name);
    if (it == state_->tasks.end()) return std::nullopt;
    return it->second;
}

void Scheduler::scheduleTick() {
    timer_.expires_after(tick_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) return;
        try {
            checkAndRunJobs();
        } catch (const std::exception& e) {
            logMessage(LogLevel::ERROR, std::string("Job sweep failed: ") + e.what());
        }
        scheduleTick();
    });
}

void Scheduler::checkAndRunJobs() {
    std::vector<Launch> due;
    {
        std::unique_lock<std::shared_mutex> lock(state_->mutex);
        const auto now = std::chrono::system_clock::now();
        for (auto& entry : state_->tasks) {
            Task& task = entry.second;
            if (!task.enabled || state_->active.count(task.name) > 0 || now < task.next_run) continue;
            due.push_back(prepareLaunch(*state_, task));
        }
    }

    for (auto& launch : due) {
        launchExecution(state_, std::move(launch), nullptr);
    }
}

void Scheduler::logMessage(LogLevel level, const std::string& message) const {
    state_->log(level, message);
}

} // namespace ludoteca
