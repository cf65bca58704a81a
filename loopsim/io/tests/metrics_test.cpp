#include <loopsim/core/scheduler.hpp>
#include <loopsim/io/error.hpp>
#include <loopsim/io/metrics.hpp>
#include <loopsim/io/trace_writers.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace loopsim::io;
using namespace loopsim::core;

class MetricsTest : public ::testing::Test {
protected:
    void SetUp() override {
        sched.set_trace_writer(&writer);
    }

    Duration ticks(int64_t n) { return duration_from_ticks(n); }

    MemoryTraceWriter writer;
    Scheduler sched;
};

TEST_F(MetricsTest, EmptyTrace) {
    LoopMetrics metrics = compute_metrics({});

    EXPECT_EQ(metrics.total_executed, 0u);
    EXPECT_EQ(metrics.jobs_submitted, 0u);
    EXPECT_EQ(metrics.final_tick, 0);
    EXPECT_DOUBLE_EQ(metrics.mean_queueing_delay, 0.0);
}

TEST_F(MetricsTest, ExecutedPerQueue) {
    sched.submit_immediate([] {});
    sched.submit_microtask([] {});
    sched.submit_microtask([] {});
    sched.submit_timer([] {}, ticks(2));
    sched.submit_check([] {});
    sched.run();

    LoopMetrics metrics = compute_metrics(writer.records());

    EXPECT_EQ(metrics.total_executed, 5u);
    EXPECT_EQ(metrics.executed(QueueKind::Immediate), 1u);
    EXPECT_EQ(metrics.executed(QueueKind::Microtask), 2u);
    EXPECT_EQ(metrics.executed(QueueKind::TimerPhase), 1u);
    EXPECT_EQ(metrics.executed(QueueKind::IOPhase), 0u);
    EXPECT_EQ(metrics.executed(QueueKind::CheckPhase), 1u);
    EXPECT_EQ(metrics.clock_advances, 1u);
    EXPECT_EQ(metrics.final_tick, 2);
}

TEST_F(MetricsTest, WorkerPoolStatistics) {
    sched.configure({.worker_pool_capacity = 2});
    for (int i = 0; i < 3; ++i) {
        sched.submit_worker_job(ticks(5), [] {});
    }
    sched.run();

    LoopMetrics metrics = compute_metrics(writer.records());

    EXPECT_EQ(metrics.jobs_submitted, 3u);
    EXPECT_EQ(metrics.jobs_completed, 3u);
    EXPECT_EQ(metrics.jobs_cancelled, 0u);
    EXPECT_EQ(metrics.peak_running_jobs, 2u);
    // Jobs 1 and 2 start at once; job 3 waits 5 ticks
    EXPECT_EQ(metrics.max_queueing_delay, 5u);
    EXPECT_DOUBLE_EQ(metrics.mean_queueing_delay, 5.0 / 3.0);
    EXPECT_EQ(metrics.executed(QueueKind::IOPhase), 3u);
    EXPECT_EQ(metrics.final_tick, 10);
}

TEST_F(MetricsTest, CancellationsAndReleasedWorkers) {
    sched.configure({.worker_pool_capacity = 1});
    auto running = sched.submit_worker_job(ticks(4), [] {});
    auto queued = sched.submit_worker_job(ticks(4), [] {});
    auto callback = sched.submit_check([] {});
    sched.cancel(running);
    sched.cancel(queued);
    sched.cancel(callback);
    sched.submit_worker_job(ticks(1), [] {});
    sched.run();

    LoopMetrics metrics = compute_metrics(writer.records());

    EXPECT_EQ(metrics.jobs_cancelled, 2u);
    EXPECT_EQ(metrics.callbacks_cancelled, 1u);
    EXPECT_EQ(metrics.jobs_completed, 1u);
    // The released worker frees its slot before the last job starts
    EXPECT_EQ(metrics.peak_running_jobs, 1u);
    EXPECT_EQ(metrics.max_queueing_delay, 4u);
}

TEST_F(MetricsTest, UncaughtExceptions) {
    sched.submit_microtask([] { throw std::runtime_error("x"); });
    sched.submit_check([] { throw std::runtime_error("y"); });
    sched.run();

    LoopMetrics metrics = compute_metrics(writer.records());

    EXPECT_EQ(metrics.uncaught_exceptions, 2u);
}

TEST_F(MetricsTest, UnknownQueueRejected) {
    TraceRecord record;
    record.type = "callback_executed";
    record.fields["queue"] = std::string("poll");

    EXPECT_THROW(compute_metrics({record}), InvalidQueueError);
}

TEST_F(MetricsTest, FromFileMatchesInMemory) {
    auto path = std::filesystem::temp_directory_path() / "loopsim_test_metrics.json";
    {
        std::ofstream out(path);
        JsonTraceWriter json(out);
        sched.set_trace_writer(&json);
        sched.configure({.worker_pool_capacity = 1});
        sched.submit_worker_job(ticks(3), [] {});
        sched.submit_worker_job(ticks(3), [] {});
        sched.submit_interval([] {}, ticks(4));
        sched.run(time_from_ticks(9));
        sched.set_trace_writer(nullptr);
    }

    LoopMetrics metrics = compute_metrics_from_file(path);
    std::filesystem::remove(path);

    EXPECT_EQ(metrics.jobs_submitted, 2u);
    EXPECT_EQ(metrics.jobs_completed, 2u);
    EXPECT_EQ(metrics.executed(QueueKind::TimerPhase), 2u);
    EXPECT_EQ(metrics.executed(QueueKind::IOPhase), 2u);
    EXPECT_EQ(metrics.max_queueing_delay, 3u);
    EXPECT_EQ(metrics.final_tick, 9);
}

TEST_F(MetricsTest, FromFileErrors) {
    EXPECT_THROW(compute_metrics_from_file("/nonexistent/loopsim_trace.json"), LoaderError);

    auto path = std::filesystem::temp_directory_path() / "loopsim_test_bad_metrics.json";
    {
        std::ofstream out(path);
        out << R"({"not": "an array"})";
    }
    EXPECT_THROW(compute_metrics_from_file(path), LoaderError);
    std::filesystem::remove(path);
}

TEST_F(MetricsTest, SummaryMentionsCounts) {
    sched.submit_worker_job(ticks(2), [] {});
    sched.run();

    std::ostringstream oss;
    write_metrics_summary(compute_metrics(writer.records()), oss);

    std::string summary = oss.str();
    EXPECT_NE(summary.find("Executed callbacks: 1"), std::string::npos);
    EXPECT_NE(summary.find("Jobs: 1 submitted, 1 completed, 0 cancelled"), std::string::npos);
    EXPECT_NE(summary.find("Final tick: 2"), std::string::npos);
}
