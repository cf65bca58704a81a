#include <loopsim/core/scheduler.hpp>

#include <gtest/gtest.h>

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

using namespace loopsim::core;

class UncaughtTest : public ::testing::Test {
protected:
    void SetUp() override {
        sched.set_uncaught_handler([this](std::exception_ptr error, CallbackId id) {
            reported_ids.push_back(id);
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& e) {
                messages.emplace_back(e.what());
            } catch (int code) {
                messages.push_back("int " + std::to_string(code));
            }
        });
    }

    Scheduler sched;
    std::vector<CallbackId> reported_ids;
    std::vector<std::string> messages;
};

TEST_F(UncaughtTest, HandlerReceivesIdAndException) {
    auto bad = sched.submit_microtask([] { throw std::runtime_error("boom"); });

    ExecutionTrace trace = sched.run();

    ASSERT_EQ(reported_ids.size(), 1u);
    EXPECT_EQ(reported_ids[0], bad.id());
    EXPECT_EQ(messages[0], "boom");
    EXPECT_EQ(sched.uncaught_count(), 1u);
    // The failing callback still counts as executed
    ASSERT_EQ(trace.size(), 1u);
    EXPECT_EQ(trace[0].callback_id, bad.id());
}

TEST_F(UncaughtTest, LoopContinuesAfterException) {
    std::vector<std::string> order;
    sched.submit_immediate([] { throw std::logic_error("first"); });
    sched.submit_microtask([&] { order.push_back("micro"); });
    sched.submit_check([] { throw std::runtime_error("second"); });
    sched.submit_timer([&] { order.push_back("timer"); }, duration_from_ticks(2));

    ExecutionTrace trace = sched.run();

    EXPECT_EQ(order, (std::vector<std::string>{"micro", "timer"}));
    EXPECT_EQ(messages, (std::vector<std::string>{"first", "second"}));
    EXPECT_EQ(trace.size(), 4u);
}

TEST_F(UncaughtTest, NonStandardException) {
    sched.submit_check([] { throw 42; });

    sched.run();

    EXPECT_EQ(messages, (std::vector<std::string>{"int 42"}));
}

TEST_F(UncaughtTest, ExceptionInJobCompletionCallback) {
    sched.submit_worker_job(duration_from_ticks(3), [] { throw std::runtime_error("io failed"); });

    ExecutionTrace trace = sched.run();

    EXPECT_EQ(messages, (std::vector<std::string>{"io failed"}));
    ASSERT_EQ(trace.size(), 1u);
    EXPECT_EQ(trace[0].queue, QueueKind::IOPhase);
}

TEST_F(UncaughtTest, WithoutHandlerExceptionsAreCounted) {
    Scheduler plain;
    plain.submit_microtask([] { throw std::runtime_error("ignored"); });
    plain.submit_microtask([] { throw std::runtime_error("ignored too"); });

    EXPECT_NO_THROW(plain.run());
    EXPECT_EQ(plain.uncaught_count(), 2u);
    EXPECT_EQ(plain.executed_count(), 2u);
}

TEST_F(UncaughtTest, SubmissionsBeforeThrowSurvive) {
    std::vector<std::string> order;
    sched.submit_microtask([&] {
        sched.submit_check([&] { order.push_back("check"); });
        throw std::runtime_error("after submit");
    });

    sched.run();

    EXPECT_EQ(order, (std::vector<std::string>{"check"}));
    EXPECT_EQ(sched.uncaught_count(), 1u);
}

TEST_F(UncaughtTest, ThrowingHandlerDoesNotStopRun) {
    Scheduler strict;
    std::vector<std::string> order;
    strict.set_uncaught_handler([](std::exception_ptr, CallbackId) {
        throw std::runtime_error("handler failed");
    });
    strict.submit_microtask([] { throw std::runtime_error("boom"); });
    strict.submit_microtask([&] { order.push_back("micro"); });
    strict.submit_check([&] { order.push_back("check"); });

    ExecutionTrace trace;
    EXPECT_NO_THROW(trace = strict.run());

    EXPECT_EQ(order, (std::vector<std::string>{"micro", "check"}));
    EXPECT_EQ(trace.size(), 3u);
    EXPECT_EQ(strict.uncaught_count(), 1u);
    EXPECT_EQ(strict.handler_failure_count(), 1u);
}
