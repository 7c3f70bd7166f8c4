#include <QtTest/QtTest>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "jobs/scheduler.hpp"
#include "mock_alert_service.hpp"

using namespace std::chrono_literals;
using ludoteca::JobStatus;
using ludoteca::Scheduler;

class SchedulerTests : public QObject {
    Q_OBJECT

private slots:
    void startsWithEmptyRegistry();
    void addTaskRegistersEnabledTask();
    void addTaskReplacesExistingName();
    void removeTaskIgnoresUnknownName();
    void enableDisableTask();
    void enableDisableUnknownTaskFails();
    void runNowRecordsCompletedExecution();
    void runNowUnknownTaskFails();
    void runNowDisabledTaskCreatesNoRecord();
    void runNowRejectsTaskInFlight();
    void failingHandlerRecordsFailure();
    void nonStandardExceptionRecordedAsUnknown();
    void executionsAreMostRecentFirst();
    void historyIsBounded();
    void taskStatusIsACopy();
    void sweepRunsDueTasks();
    void sweepSkipsDisabledTasks();
    void stopDoesNotWaitForTick();
    void startStopAreIdempotent();
    void concurrentStartStopLeavesConsistentState();
    void hungHandlersDoNotDelayOtherTasks();
    void destructorDoesNotWaitForHungHandler();
    void readdingTaskInFlightKeepsOverlapGuard();
};

void SchedulerTests::startsWithEmptyRegistry() {
    Scheduler scheduler(quietSink());
    QVERIFY(scheduler.getTasks().empty());
    QVERIFY(scheduler.getExecutions(0).empty());
    QVERIFY(!scheduler.isRunning());
}

void SchedulerTests::addTaskRegistersEnabledTask() {
    Scheduler scheduler(quietSink());

    const auto before = std::chrono::system_clock::now();
    scheduler.addTask("test-job", "Test job description", 1h, []() {});
    const auto after = std::chrono::system_clock::now();

    const auto tasks = scheduler.getTasks();
    QCOMPARE(int(tasks.size()), 1);
    const auto& task = tasks.at("test-job");
    QCOMPARE(QString::fromStdString(task.name), QString("test-job"));
    QCOMPARE(QString::fromStdString(task.description), QString("Test job description"));
    QVERIFY(task.interval == 1h);
    QVERIFY(task.enabled);
    QVERIFY(!task.running);
    QVERIFY(!task.hasRun());
    QVERIFY(static_cast<bool>(task.handler));
    QVERIFY(task.next_run >= before + 1h);
    QVERIFY(task.next_run <= after + 1h);
}

void SchedulerTests::addTaskReplacesExistingName() {
    Scheduler scheduler(quietSink());
    scheduler.addTask("job", "first", 1h, []() {});
    QVERIFY(scheduler.disableTask("job"));

    scheduler.addTask("job", "second", 2h, []() {});

    const auto tasks = scheduler.getTasks();
    QCOMPARE(int(tasks.size()), 1);
    QCOMPARE(QString::fromStdString(tasks.at("job").description), QString("second"));
    QVERIFY(tasks.at("job").interval == 2h);
    QVERIFY(tasks.at("job").enabled);
}

void SchedulerTests::removeTaskIgnoresUnknownName() {
    Scheduler scheduler(quietSink());
    scheduler.addTask("job", "job", 1h, []() {});

    scheduler.removeTask("missing");
    QCOMPARE(int(scheduler.getTasks().size()), 1);

    scheduler.removeTask("job");
    QVERIFY(scheduler.getTasks().empty());
}

void SchedulerTests::enableDisableTask() {
    Scheduler scheduler(quietSink());
    scheduler.addTask("job", "job", 1h, []() {});

    QVERIFY(scheduler.disableTask("job"));
    QVERIFY(!scheduler.getTaskStatus("job")->enabled);

    QVERIFY(scheduler.enableTask("job"));
    QVERIFY(scheduler.getTaskStatus("job")->enabled);
}

void SchedulerTests::enableDisableUnknownTaskFails() {
    Scheduler scheduler(quietSink());

    std::string error;
    QVERIFY(!scheduler.enableTask("non-existent", &error));
    QCOMPARE(QString::fromStdString(error), QString("job 'non-existent' not found"));

    error.clear();
    QVERIFY(!scheduler.disableTask("non-existent", &error));
    QCOMPARE(QString::fromStdString(error), QString("job 'non-existent' not found"));
}

void SchedulerTests::runNowRecordsCompletedExecution() {
    std::atomic<int> runs{0};
    Scheduler scheduler(quietSink());
    scheduler.addTask("test-job", "Test job", 1h, [&runs]() { runs++; });

    std::string error;
    QVERIFY(scheduler.runNow("test-job", &error));
    QVERIFY(scheduler.waitForIdle(5s));
    QCOMPARE(runs.load(), 1);
    QVERIFY(!scheduler.getTaskStatus("test-job")->running);

    const auto executions = scheduler.getExecutions(10);
    QCOMPARE(int(executions.size()), 1);
    const auto& execution = executions.front();
    QCOMPARE(QString::fromStdString(execution.job_name), QString("test-job"));
    QVERIFY(execution.status == JobStatus::Completed);
    QVERIFY(execution.error.empty());
    QVERIFY(QString::fromStdString(execution.id).startsWith("test-job-"));
    QVERIFY(execution.end_time >= execution.start_time);
    QVERIFY(execution.duration.count() >= 0);

    const auto task = scheduler.getTaskStatus("test-job");
    QVERIFY(task.has_value());
    QVERIFY(task->hasRun());
    QVERIFY(task->next_run - task->last_run == 1h);
}

void SchedulerTests::runNowUnknownTaskFails() {
    Scheduler scheduler(quietSink());

    std::string error;
    QVERIFY(!scheduler.runNow("non-existent", &error));
    QCOMPARE(QString::fromStdString(error), QString("job 'non-existent' not found"));
}

void SchedulerTests::runNowDisabledTaskCreatesNoRecord() {
    std::atomic<int> runs{0};
    Scheduler scheduler(quietSink());
    scheduler.addTask("test-job", "Test job", 1h, [&runs]() { runs++; });
    QVERIFY(scheduler.disableTask("test-job"));

    std::string error;
    QVERIFY(!scheduler.runNow("test-job", &error));
    QCOMPARE(QString::fromStdString(error), QString("job 'test-job' is disabled"));

    QTest::qWait(50);
    QCOMPARE(runs.load(), 0);
    QVERIFY(scheduler.getExecutions(0).empty());
}

void SchedulerTests::runNowRejectsTaskInFlight() {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<int> runs{0};
    Scheduler scheduler(quietSink());
    scheduler.addTask("slow", "slow job", 1h, [gate, &runs]() {
        runs++;
        gate.wait();
    });

    QVERIFY(scheduler.runNow("slow"));
    QTRY_COMPARE(runs.load(), 1);

    std::string error;
    QVERIFY(!scheduler.runNow("slow", &error));
    QCOMPARE(QString::fromStdString(error), QString("job 'slow' is already running"));

    const auto inFlight = scheduler.getExecutions(0);
    QCOMPARE(int(inFlight.size()), 1);
    QVERIFY(inFlight.front().status == JobStatus::Running);

    release.set_value();
    QTRY_VERIFY(!scheduler.getTaskStatus("slow")->running);
    QVERIFY(scheduler.getExecutions(0).front().status == JobStatus::Completed);

    QVERIFY(scheduler.runNow("slow"));
    QVERIFY(scheduler.waitForIdle(5s));
    QCOMPARE(runs.load(), 2);
}

void SchedulerTests::failingHandlerRecordsFailure() {
    Scheduler scheduler(quietSink());
    scheduler.addTask("broken", "always fails", 1h, []() {
        throw std::runtime_error("database unavailable");
    });

    QVERIFY(scheduler.runNow("broken"));
    QTRY_VERIFY(!scheduler.getTaskStatus("broken")->running);

    const auto executions = scheduler.getExecutions(0);
    QCOMPARE(int(executions.size()), 1);
    QVERIFY(executions.front().status == JobStatus::Failed);
    QCOMPARE(QString::fromStdString(executions.front().error), QString("database unavailable"));

    const auto task = scheduler.getTaskStatus("broken");
    QVERIFY(task->hasRun());
    QVERIFY(task->next_run - task->last_run == 1h);
}

void SchedulerTests::nonStandardExceptionRecordedAsUnknown() {
    Scheduler scheduler(quietSink());
    scheduler.addTask("odd", "throws an int", 1h, []() { throw 42; });

    QVERIFY(scheduler.runNow("odd"));
    QTRY_VERIFY(!scheduler.getTaskStatus("odd")->running);

    const auto executions = scheduler.getExecutions(0);
    QCOMPARE(int(executions.size()), 1);
    QVERIFY(executions.front().status == JobStatus::Failed);
    QCOMPARE(QString::fromStdString(executions.front().error), QString("unknown error"));
}

void SchedulerTests::executionsAreMostRecentFirst() {
    Scheduler scheduler(quietSink());
    for (const char* name : {"first", "second", "third"}) {
        scheduler.addTask(name, name, 1h, []() {});
    }

    for (const char* name : {"first", "second", "third"}) {
        QVERIFY(scheduler.runNow(name));
        QTRY_VERIFY(!scheduler.getTaskStatus(name)->running);
    }

    const auto two = scheduler.getExecutions(2);
    QCOMPARE(int(two.size()), 2);
    QCOMPARE(QString::fromStdString(two[0].job_name), QString("third"));
    QCOMPARE(QString::fromStdString(two[1].job_name), QString("second"));

    QCOMPARE(int(scheduler.getExecutions(0).size()), 3);
    QCOMPARE(int(scheduler.getExecutions(-1).size()), 3);
    QCOMPARE(int(scheduler.getExecutions(50).size()), 3);
    QCOMPARE(QString::fromStdString(scheduler.getExecutions(0).back().job_name), QString("first"));
}

void SchedulerTests::historyIsBounded() {
    std::atomic<int> runs{0};
    Scheduler scheduler(quietSink());
    scheduler.addTask("busy", "runs a lot", 1h, [&runs]() { runs++; });

    const int total = static_cast<int>(Scheduler::kMaxExecutions) + 5;
    for (int i = 0; i < total; ++i) {
        QVERIFY(scheduler.runNow("busy"));
        QVERIFY(scheduler.waitForIdle(5s));
    }
    QCOMPARE(runs.load(), total);

    const auto executions = scheduler.getExecutions(0);
    QCOMPARE(int(executions.size()), static_cast<int>(Scheduler::kMaxExecutions));
    QVERIFY(QString::fromStdString(executions.front().id).endsWith("-" + QString::number(total)));
    QVERIFY(QString::fromStdString(executions.back().id).endsWith("-6"));
}

void SchedulerTests::taskStatusIsACopy() {
    Scheduler scheduler(quietSink());
    scheduler.addTask("job", "job", 1h, []() {});

    QVERIFY(!scheduler.getTaskStatus("missing").has_value());

    auto copy = scheduler.getTaskStatus("job");
    QVERIFY(copy.has_value());
    copy->enabled = false;
    copy->description = "changed";

    auto tasks = scheduler.getTasks();
    tasks["job"].enabled = false;

    const auto fresh = scheduler.getTaskStatus("job");
    QVERIFY(fresh->enabled);
    QCOMPARE(QString::fromStdString(fresh->description), QString("job"));
}

void SchedulerTests::sweepRunsDueTasks() {
    std::atomic<int> runs{0};
    Scheduler scheduler(quietSink(), 20ms);
    scheduler.addTask("frequent", "every 10ms", 10ms, [&runs]() { runs++; });

    scheduler.start();
    QVERIFY(scheduler.isRunning());
    QTRY_VERIFY_WITH_TIMEOUT(runs.load() >= 2, 5000);
    scheduler.stop();
    QVERIFY(!scheduler.isRunning());

    QVERIFY(scheduler.waitForIdle(5s));
    const int afterStop = runs.load();
    QTest::qWait(150);
    QCOMPARE(runs.load(), afterStop);

    const auto task = scheduler.getTaskStatus("frequent");
    QVERIFY(task->next_run - task->last_run == 10ms);
    for (const auto& execution : scheduler.getExecutions(0)) {
        QVERIFY(execution.status == JobStatus::Completed);
    }
}

void SchedulerTests::sweepSkipsDisabledTasks() {
    std::atomic<int> runs{0};
    Scheduler scheduler(quietSink(), 10ms);
    scheduler.addTask("off", "disabled", 1ms, [&runs]() { runs++; });
    QVERIFY(scheduler.disableTask("off"));

    scheduler.start();
    QTest::qWait(150);
    scheduler.stop();

    QCOMPARE(runs.load(), 0);
    QVERIFY(scheduler.getExecutions(0).empty());
}

void SchedulerTests::stopDoesNotWaitForTick() {
    Scheduler scheduler(quietSink());
    QVERIFY(scheduler.getTick() == std::chrono::minutes(1));

    scheduler.start();
    const auto begin = std::chrono::steady_clock::now();
    scheduler.stop();
    const auto elapsed = std::chrono::steady_clock::now() - begin;
    QVERIFY(elapsed < 1s);
}

void SchedulerTests::startStopAreIdempotent() {
    std::atomic<int> runs{0};
    Scheduler scheduler(quietSink(), 10ms);
    scheduler.stop();
    QVERIFY(!scheduler.isRunning());

    scheduler.start();
    scheduler.start();
    QVERIFY(scheduler.isRunning());

    scheduler.stop();
    scheduler.stop();
    QVERIFY(!scheduler.isRunning());

    scheduler.addTask("later", "after restart", 1ms, [&runs]() { runs++; });
    scheduler.start();
    QTRY_VERIFY_WITH_TIMEOUT(runs.load() >= 1, 5000);
    scheduler.stop();
    QVERIFY(scheduler.waitForIdle(5s));
}

void SchedulerTests::concurrentStartStopLeavesConsistentState() {
    std::atomic<int> runs{0};
    Scheduler scheduler(quietSink(), 5ms);
    scheduler.addTask("tick", "counts sweeps", 1ms, [&runs]() { runs++; });

    std::vector<std::thread> togglers;
    for (int t = 0; t < 4; ++t) {
        togglers.emplace_back([&scheduler, t]() {
            for (int i = 0; i < 50; ++i) {
                if ((i + t) % 2 == 0) {
                    scheduler.start();
                } else {
                    scheduler.stop();
                }
            }
        });
    }
    for (auto& toggler : togglers) toggler.join();

    scheduler.stop();
    QVERIFY(!scheduler.isRunning());
    QVERIFY(scheduler.waitForIdle(5s));

    const int before = runs.load();
    scheduler.start();
    QVERIFY(scheduler.isRunning());
    QTRY_VERIFY_WITH_TIMEOUT(runs.load() > before, 5000);
    scheduler.stop();
    QVERIFY(scheduler.waitForIdle(5s));
}

void SchedulerTests::hungHandlersDoNotDelayOtherTasks() {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<int> hungStarted{0};
    std::atomic<int> fastRuns{0};
    std::atomic<int> sweptRuns{0};
    Scheduler scheduler(quietSink(), 10ms);

    const int hungCount = 8;
    for (int i = 0; i < hungCount; ++i) {
        const std::string name = "hung-" + std::to_string(i);
        scheduler.addTask(name, "never returns on its own", 1h, [gate, &hungStarted]() {
            hungStarted++;
            gate.wait();
        });
        QVERIFY(scheduler.runNow(name));
    }

    // Every launch is visible in the history before its handler is scheduled.
    auto executions = scheduler.getExecutions(0);
    QCOMPARE(int(executions.size()), hungCount);
    for (const auto& execution : executions) {
        QVERIFY(execution.status == JobStatus::Running);
    }
    QTRY_COMPARE_WITH_TIMEOUT(hungStarted.load(), hungCount, 5000);

    scheduler.addTask("fast", "on demand", 1h, [&fastRuns]() { fastRuns++; });
    QVERIFY(scheduler.runNow("fast"));
    QTRY_COMPARE_WITH_TIMEOUT(fastRuns.load(), 1, 5000);
    QTRY_VERIFY(!scheduler.getTaskStatus("fast")->running);
    QVERIFY(scheduler.getExecutions(1).front().status == JobStatus::Completed);

    scheduler.addTask("swept", "due every sweep", 1ms, [&sweptRuns]() { sweptRuns++; });
    scheduler.start();
    QTRY_VERIFY_WITH_TIMEOUT(sweptRuns.load() >= 2, 5000);
    scheduler.stop();

    int stillRunning = 0;
    for (const auto& execution : scheduler.getExecutions(0)) {
        if (execution.status == JobStatus::Running) stillRunning++;
    }
    QVERIFY(stillRunning >= hungCount);
    QVERIFY(!scheduler.waitForIdle(50ms));

    release.set_value();
    QVERIFY(scheduler.waitForIdle(5s));
    for (const auto& execution : scheduler.getExecutions(0)) {
        QVERIFY(execution.status == JobStatus::Completed);
    }
}

void SchedulerTests::destructorDoesNotWaitForHungHandler() {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};

    auto scheduler = std::make_unique<Scheduler>(quietSink(), 10ms);
    scheduler->addTask("stuck", "blocks until released", 1h, [gate, &entered, &finished]() {
        entered = true;
        gate.wait();
        finished = true;
    });
    scheduler->start();
    QVERIFY(scheduler->runNow("stuck"));
    QTRY_VERIFY_WITH_TIMEOUT(entered.load(), 5000);

    const auto begin = std::chrono::steady_clock::now();
    scheduler.reset();
    const auto elapsed = std::chrono::steady_clock::now() - begin;
    QVERIFY(elapsed < 1s);
    QVERIFY(!finished.load());

    release.set_value();
    QTRY_VERIFY_WITH_TIMEOUT(finished.load(), 5000);
}

void SchedulerTests::readdingTaskInFlightKeepsOverlapGuard() {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<bool> entered{false};
    std::atomic<int> replacementRuns{0};
    Scheduler scheduler(quietSink());

    scheduler.addTask("job", "original", 1h, [gate, &entered]() {
        entered = true;
        gate.wait();
    });
    QVERIFY(scheduler.runNow("job"));
    QTRY_VERIFY_WITH_TIMEOUT(entered.load(), 5000);

    scheduler.addTask("job", "replacement", 2h, [&replacementRuns]() { replacementRuns++; });
    const auto replaced = scheduler.getTaskStatus("job");
    QVERIFY(replaced->running);
    QCOMPARE(QString::fromStdString(replaced->description), QString("replacement"));

    std::string error;
    QVERIFY(!scheduler.runNow("job", &error));
    QCOMPARE(QString::fromStdString(error), QString("job 'job' is already running"));

    release.set_value();
    QVERIFY(scheduler.waitForIdle(5s));

    // The old run finishes but leaves the new registration's schedule alone.
    const auto afterOld = scheduler.getTaskStatus("job");
    QVERIFY(!afterOld->running);
    QVERIFY(!afterOld->hasRun());
    QVERIFY(afterOld->next_run == replaced->next_run);
    QVERIFY(scheduler.getExecutions(1).front().status == JobStatus::Completed);
    QCOMPARE(replacementRuns.load(), 0);

    QVERIFY(scheduler.runNow("job"));
    QVERIFY(scheduler.waitForIdle(5s));
    QCOMPARE(replacementRuns.load(), 1);
    const auto afterNew = scheduler.getTaskStatus("job");
    QVERIFY(afterNew->hasRun());
    QVERIFY(afterNew->next_run - afterNew->last_run == 2h);
}

QTEST_MAIN(SchedulerTests)
#include "test_scheduler.moc"
