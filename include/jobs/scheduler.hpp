#ifndef LUDOTECA_SCHEDULER_HPP
#define LUDOTECA_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include "jobs/job_types.hpp"
#include "utils/logger.hpp"

namespace ludoteca {

/**
 * Fixed-interval background job scheduler.
 *
 * Owns a registry of named tasks and a bounded execution history. Once
 * started, a sweep timer fires every tick and launches each enabled task
 * whose next_run has passed. Every execution gets its own thread, so a
 * handler that hangs never delays other tasks. Handlers never run on the
 * sweep thread and never under the registry lock.
 *
 * A task is never executed twice concurrently: the sweep skips tasks that
 * are still in flight and runNow() refuses them. Re-registering a name
 * while its handler runs keeps that guard.
 *
 * Registry and history are shared with the execution threads, so the
 * destructor does not wait for handlers still in flight.
 */
class Scheduler {
public:
    static constexpr std::size_t kMaxExecutions = 100;
    static constexpr std::chrono::milliseconds kDefaultTick{std::chrono::minutes(1)};

    explicit Scheduler(LogSink logger = LogSink(),
                       std::chrono::milliseconds tick = kDefaultTick);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Inserts or replaces the task; next_run = now + interval.
    void addTask(const std::string& name, const std::string& description,
                 std::chrono::milliseconds interval, JobHandler handler);
    void removeTask(const std::string& name);

    bool enableTask(const std::string& name, std::string* error = nullptr);
    bool disableTask(const std::string& name, std::string* error = nullptr);

    /**
     * Launch the task immediately, regardless of its schedule.
     * Does not wait for the handler; its outcome only shows up in the
     * execution history, where a running record is already present when
     * this returns.
     */
    bool runNow(const std::string& name, std::string* error = nullptr);

    void start();
    // Cancels the sweep timer and joins the sweep thread. In-flight handlers keep running.
    void stop();
    bool isRunning() const;

    // Blocks until no handler is in flight or the timeout expires.
    bool waitForIdle(std::chrono::milliseconds timeout) const;

    std::map<std::string, Task> getTasks() const;
    // Most recent first. limit <= 0 returns the whole history.
    std::vector<JobExecution> getExecutions(int limit) const;
    std::optional<Task> getTaskStatus(const std::string& name) const;

    std::chrono::milliseconds getTick() const { return tick_; }

    // Registry and history, shared with the execution threads.
    struct State;

private:
    std::shared_ptr<State> state_;
    const std::chrono::milliseconds tick_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    boost::asio::io_context io_;
    boost::asio::steady_timer timer_;
    std::thread worker_;

    void scheduleTick();
    void checkAndRunJobs();
    void logMessage(LogLevel level, const std::string& message) const;
};

} // namespace ludoteca

#endif // LUDOTECA_SCHEDULER_HPP
