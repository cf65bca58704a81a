#pragma once

#include <loopsim/core/handle.hpp>
#include <loopsim/core/queue_kind.hpp>
#include <loopsim/core/types.hpp>

#include <compare>
#include <functional>

namespace loopsim::core {

/// @brief A deferred unit of scheduler-level work.
///
/// A Callback belongs to exactly one queue at a time and is removed from
/// it before it runs. Resubmitting from inside an action always creates a
/// new Callback with a new id.
///
/// Ids come from the Scheduler's single submission sequence, so comparing
/// ids compares submission order.
///
/// @see QueueSet, Scheduler
/// @ingroup core_queues
struct Callback {
    CallbackId id{0};                ///< Unique id; also the submission order.
    QueueKind queue{QueueKind::Immediate};
    std::function<void()> action;    ///< Client code; may throw.
    TimePoint fire_time{};           ///< TimerPhase only: submission time + delay.
    JobId job_id{0};                 ///< IOPhase completions only: originating job.
    CallbackId series{0};            ///< Interval firings only: id of the series.
};

/// @brief Deterministic ordering key for pending timers.
///
/// Timers are ordered first by fire time, then by submission order so that
/// timers due at the same tick enter the TimerPhase queue FIFO.
///
/// @ingroup core_queues
struct TimerKey {
    TimePoint fire_time;  ///< Primary: tick at which the timer becomes due.
    CallbackId sequence;  ///< Secondary: submission order.

    auto operator<=>(const TimerKey&) const = default;
};

} // namespace loopsim::core
