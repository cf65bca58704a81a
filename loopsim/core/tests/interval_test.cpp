#include <loopsim/core/error.hpp>
#include <loopsim/core/scheduler.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <set>
#include <stdexcept>

using namespace loopsim::core;

class IntervalTest : public ::testing::Test {
protected:
    Duration ticks(int64_t n) { return duration_from_ticks(n); }
    TimePoint at(int64_t n) { return time_from_ticks(n); }

    Scheduler sched;
};

TEST_F(IntervalTest, FiresEveryPeriodUntilCancelled) {
    CallbackHandle series;
    int fired = 0;
    series = sched.submit_interval([&] {
        if (++fired == 3) {
            sched.cancel(series);
        }
    }, ticks(5));

    ExecutionTrace trace = sched.run();

    ASSERT_EQ(trace.size(), 3u);
    EXPECT_EQ(trace[0].time, at(5));
    EXPECT_EQ(trace[1].time, at(10));
    EXPECT_EQ(trace[2].time, at(15));
    EXPECT_EQ(trace[0].callback_id, series.id());

    std::set<CallbackId> ids;
    for (const auto& entry : trace) {
        EXPECT_EQ(entry.queue, QueueKind::TimerPhase);
        ids.insert(entry.callback_id);
    }
    EXPECT_EQ(ids.size(), 3u);
    EXPECT_FALSE(sched.pending());
}

TEST_F(IntervalTest, CancelBeforeFirstFiring) {
    auto series = sched.submit_interval([] {}, ticks(2));
    EXPECT_TRUE(sched.pending());

    sched.cancel(series);
    ExecutionTrace trace = sched.run();

    EXPECT_TRUE(trace.empty());
    EXPECT_FALSE(sched.pending());
    EXPECT_EQ(sched.time(), at(0));
}

TEST_F(IntervalTest, RunUntilBoundsAnInterval) {
    auto series = sched.submit_interval([] {}, ticks(5));

    ExecutionTrace trace = sched.run(at(12));

    EXPECT_EQ(trace.size(), 2u);
    EXPECT_EQ(sched.time(), at(12));
    EXPECT_TRUE(sched.pending());

    // Cancelling the series removes the firing queued for tick 15
    sched.cancel(series);
    EXPECT_TRUE(sched.run().empty());
    EXPECT_EQ(sched.time(), at(12));
}

TEST_F(IntervalTest, CancelFromAnotherCallback) {
    int fired = 0;
    auto series = sched.submit_interval([&] { ++fired; }, ticks(3));
    sched.submit_timer([&] { sched.cancel(series); }, ticks(7));

    sched.run();

    EXPECT_EQ(fired, 2);
    EXPECT_EQ(sched.time(), at(7));
}

TEST_F(IntervalTest, ThrowingIntervalKeepsFiring) {
    sched.submit_interval([] { throw std::runtime_error("tick"); }, ticks(2));

    ExecutionTrace trace = sched.run(at(6));

    EXPECT_EQ(trace.size(), 3u);
    EXPECT_EQ(sched.uncaught_count(), 3u);
}

TEST_F(IntervalTest, NonPositivePeriodRejected) {
    EXPECT_THROW(sched.submit_interval([] {}, ticks(0)), InvalidDurationError);
    EXPECT_THROW(sched.submit_interval([] {}, ticks(-4)), InvalidDurationError);
    EXPECT_FALSE(sched.pending());
}

TEST_F(IntervalTest, SeriesEndsWhenNextFiringOverflowsClock) {
    int fired = 0;
    const int64_t period = std::numeric_limits<int64_t>::max() / 2 + 1;
    sched.submit_interval([&] { ++fired; }, ticks(period));

    sched.run();

    EXPECT_EQ(fired, 1);
    EXPECT_EQ(sched.time(), time_from_ticks(period));
    EXPECT_FALSE(sched.pending());
}

TEST_F(IntervalTest, CancelSeriesTwiceThrows) {
    auto series = sched.submit_interval([] {}, ticks(1));

    sched.cancel(series);

    EXPECT_THROW(sched.cancel(series), NotFoundError);
}
