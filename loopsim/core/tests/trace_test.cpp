#include <loopsim/core/error.hpp>
#include <loopsim/core/scheduler.hpp>
#include <loopsim/core/trace_writer.hpp>

#include <gtest/gtest.h>

#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace loopsim::core;

// Records every event so tests can inspect the emitted sequence
class RecordingTraceWriter : public TraceWriter {
public:
    struct Record {
        TimePoint time;
        std::string type_name;
        std::vector<std::pair<std::string, std::string>> fields;

        [[nodiscard]] std::string get(const std::string& key) const {
            for (const auto& [k, v] : fields) {
                if (k == key) {
                    return v;
                }
            }
            return {};
        }
    };

    void begin(TimePoint time) override {
        current_record_.time = time;
        current_record_.type_name.clear();
        current_record_.fields.clear();
    }

    void type(std::string_view name) override {
        current_record_.type_name = std::string(name);
    }

    void field(std::string_view key, uint64_t value) override {
        current_record_.fields.emplace_back(std::string(key), std::to_string(value));
    }

    void field(std::string_view key, std::string_view value) override {
        current_record_.fields.emplace_back(std::string(key), std::string(value));
    }

    void end() override {
        records.push_back(current_record_);
    }

    [[nodiscard]] std::vector<std::string> types() const {
        std::vector<std::string> result;
        for (const auto& r : records) {
            result.push_back(r.type_name);
        }
        return result;
    }

    [[nodiscard]] const Record* first(const std::string& type_name) const {
        for (const auto& r : records) {
            if (r.type_name == type_name) {
                return &r;
            }
        }
        return nullptr;
    }

    std::vector<Record> records;

private:
    Record current_record_;
};

class TraceTest : public ::testing::Test {
protected:
    void SetUp() override {
        sched.set_trace_writer(&writer);
    }

    Duration ticks(int64_t n) { return duration_from_ticks(n); }
    TimePoint at(int64_t n) { return time_from_ticks(n); }

    RecordingTraceWriter writer;
    Scheduler sched;
};

TEST_F(TraceTest, NoWriterIsSafe) {
    Scheduler quiet;

    quiet.trace([](TraceWriter& w) { w.type("never"); });
    quiet.submit_microtask([] {});

    EXPECT_NO_THROW(quiet.run());
}

TEST_F(TraceTest, MicrotaskSubmittedAndExecuted) {
    auto handle = sched.submit_microtask([] {});

    sched.run();

    EXPECT_EQ(writer.types(),
              (std::vector<std::string>{"callback_submitted", "callback_executed", "sim_finished"}));
    const auto& submitted = writer.records[0];
    EXPECT_EQ(submitted.get("callback_id"), std::to_string(handle.id()));
    EXPECT_EQ(submitted.get("queue"), "microtask");
    EXPECT_EQ(writer.records[2].get("executed"), "1");
}

TEST_F(TraceTest, TimerRecordsFireTimeAndClockAdvance) {
    sched.submit_timer([] {}, ticks(4));

    sched.run();

    EXPECT_EQ(writer.types(), (std::vector<std::string>{"callback_submitted", "clock_advanced",
                                                        "callback_executed", "sim_finished"}));
    EXPECT_EQ(writer.records[0].get("fire_time"), "4");
    EXPECT_EQ(writer.records[0].get("queue"), "timer");

    const auto& advanced = writer.records[1];
    EXPECT_EQ(advanced.time, at(4));
    EXPECT_EQ(advanced.get("from"), "0");
    EXPECT_EQ(advanced.get("to"), "4");
}

TEST_F(TraceTest, WorkerJobLifecycle) {
    auto job = sched.submit_worker_job(ticks(5), [] {});

    sched.run();

    EXPECT_EQ(writer.types(),
              (std::vector<std::string>{"job_submitted", "job_started", "clock_advanced",
                                        "job_completed", "callback_submitted",
                                        "callback_executed", "sim_finished"}));
    EXPECT_EQ(writer.records[0].get("duration"), "5");
    EXPECT_EQ(writer.records[1].get("completion_time"), "5");
    EXPECT_EQ(writer.records[3].time, at(5));
    EXPECT_EQ(writer.records[4].get("queue"), "io");
    EXPECT_EQ(writer.records[4].get("job_id"), std::to_string(job.id()));
    EXPECT_EQ(writer.records[5].get("job_id"), std::to_string(job.id()));
}

TEST_F(TraceTest, CancelledRunningJobReleasesWorker) {
    auto job = sched.submit_worker_job(ticks(3), [] {});
    sched.cancel(job);

    sched.run();

    EXPECT_EQ(writer.types(),
              (std::vector<std::string>{"job_submitted", "job_started", "job_cancelled",
                                        "clock_advanced", "worker_released", "sim_finished"}));
    EXPECT_EQ(writer.records[2].get("state"), "running");
    EXPECT_EQ(writer.records[4].time, at(3));
}

TEST_F(TraceTest, CancelledQueuedJob) {
    sched.configure({.worker_pool_capacity = 1});
    sched.submit_worker_job(ticks(3), [] {});
    auto queued = sched.submit_worker_job(ticks(3), [] {});

    sched.cancel(queued);

    const auto* cancelled = writer.first("job_cancelled");
    ASSERT_NE(cancelled, nullptr);
    EXPECT_EQ(cancelled->get("state"), "queued");
    EXPECT_EQ(cancelled->get("job_id"), std::to_string(queued.id()));
}

TEST_F(TraceTest, CancelledCallback) {
    auto handle = sched.submit_check([] {});

    sched.cancel(handle);

    const auto* cancelled = writer.first("callback_cancelled");
    ASSERT_NE(cancelled, nullptr);
    EXPECT_EQ(cancelled->get("callback_id"), std::to_string(handle.id()));
    EXPECT_EQ(cancelled->get("queue"), "check");
}

TEST_F(TraceTest, UncaughtExceptionRecorded) {
    auto handle = sched.submit_io([] { throw std::runtime_error("disk on fire"); });

    sched.run();

    const auto* uncaught = writer.first("uncaught_exception");
    ASSERT_NE(uncaught, nullptr);
    EXPECT_EQ(uncaught->get("callback_id"), std::to_string(handle.id()));
    EXPECT_EQ(uncaught->get("message"), "disk on fire");
}

TEST_F(TraceTest, FailingUncaughtHandlerRecorded) {
    sched.set_uncaught_handler([](std::exception_ptr, CallbackId) {
        throw std::logic_error("handler gave up");
    });
    auto handle = sched.submit_check([] { throw std::runtime_error("check failed"); });

    EXPECT_NO_THROW(sched.run());

    const auto* failed = writer.first("uncaught_handler_failed");
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->get("callback_id"), std::to_string(handle.id()));
    EXPECT_EQ(failed->get("message"), "handler gave up");
    EXPECT_EQ(writer.types().back(), "sim_finished");
}

TEST_F(TraceTest, IntervalFiringsCarrySeries) {
    CallbackHandle series;
    series = sched.submit_interval([&] { sched.cancel(series); }, ticks(2));

    sched.run();

    const auto* submitted = writer.first("callback_submitted");
    ASSERT_NE(submitted, nullptr);
    EXPECT_EQ(submitted->get("series"), std::to_string(series.id()));
    EXPECT_EQ(submitted->get("fire_time"), "2");
}

TEST_F(TraceTest, LivelockRecorded) {
    sched.configure({.livelock_guard = 5});
    std::function<void()> again = [&] { sched.submit_microtask(again); };
    sched.submit_microtask(again);

    EXPECT_THROW(sched.run(), LivelockError);

    const auto* livelock = writer.first("livelock");
    ASSERT_NE(livelock, nullptr);
    EXPECT_EQ(livelock->get("queue"), "microtask");
    EXPECT_EQ(livelock->get("limit"), "5");
    EXPECT_EQ(writer.first("sim_finished"), nullptr);
}

TEST_F(TraceTest, WriterCanBeDetached) {
    sched.submit_microtask([] {});
    sched.set_trace_writer(nullptr);

    sched.run();

    EXPECT_EQ(writer.types(), (std::vector<std::string>{"callback_submitted"}));
}
