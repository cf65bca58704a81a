#pragma once

#include <loopsim/core/callback.hpp>
#include <loopsim/core/queue_kind.hpp>
#include <loopsim/core/types.hpp>

#include <array>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>

namespace loopsim::core {

/// @brief The ordered collection of callback queues.
///
/// Holds one FIFO queue per QueueKind plus the set of pending timers that
/// are not yet due. Queue order is strict FIFO by submission; the set of
/// queues has the fixed priority Immediate > Microtask > macrotask phases.
///
/// The QueueSet never runs anything by itself: drain_all() and pop_one()
/// hand callbacks to the caller, which is always the Scheduler.
///
/// @see Scheduler, QueueKind
/// @ingroup core_queues
class QueueSet {
public:
    /// @brief Default bound on callbacks executed by a single drain_all().
    static constexpr std::size_t DEFAULT_LIVELOCK_GUARD = 100000;

    /// @brief Invoked by drain_all() for every popped callback.
    using Executor = std::function<void(Callback&)>;

    explicit QueueSet(std::size_t livelock_guard = DEFAULT_LIVELOCK_GUARD);

    QueueSet(const QueueSet&) = delete;
    QueueSet& operator=(const QueueSet&) = delete;

    /// @brief Append @p callback to the tail of queue @p kind.
    ///
    /// The callback's `queue` member is overwritten with @p kind.
    ///
    /// @throws InvalidQueueError if @p kind is out of range.
    void enqueue(QueueKind kind, Callback callback);

    /// @brief Register a timer that becomes due at `callback.fire_time`.
    ///
    /// The timer stays in the pending set until promote_due_timers() moves
    /// it into the TimerPhase queue.
    void add_timer(Callback callback);

    /// @brief Move every pending timer with fire time <= @p now into the
    /// TimerPhase queue, ordered by (fire time, submission order).
    /// @return Number of timers moved.
    std::size_t promote_due_timers(TimePoint now);

    /// @brief Earliest fire time among pending timers, if any.
    [[nodiscard]] std::optional<TimePoint> next_timer_time() const;

    /// @brief Pop and execute callbacks from @p kind until it is empty.
    ///
    /// Callbacks enqueued onto @p kind by earlier callbacks of the same drain
    /// are executed by the same drain. Each callback is removed from the
    /// queue before @p execute sees it.
    ///
    /// @return Number of callbacks executed.
    /// @throws LivelockError if the queue is still non-empty after
    ///         livelock_guard() callbacks.
    /// @throws InvalidQueueError if @p kind is out of range.
    std::size_t drain_all(QueueKind kind, const Executor& execute);

    /// @brief Remove and return the oldest callback of a macrotask phase.
    /// @return The callback, or std::nullopt if the phase is empty.
    /// @throws InvalidQueueError if @p kind is not a macrotask phase.
    std::optional<Callback> pop_one(QueueKind kind);

    /// @brief Remove a queued or pending callback without running it.
    /// @return The queue the callback was removed from.
    /// @throws NotFoundError if no queued or pending callback has @p id.
    QueueKind cancel(CallbackId id);

    /// @brief Returns true if @p id is queued or pending.
    [[nodiscard]] bool contains(CallbackId id) const noexcept;

    /// @brief Number of callbacks waiting in queue @p kind.
    ///
    /// Pending timers are not counted; see pending_timer_count().
    ///
    /// @throws InvalidQueueError if @p kind is out of range.
    [[nodiscard]] std::size_t size(QueueKind kind) const;

    /// @brief Number of timers that are registered but not yet due.
    [[nodiscard]] std::size_t pending_timer_count() const noexcept { return pending_timers_.size(); }

    /// @brief Returns true when TimerPhase, IOPhase and CheckPhase are empty.
    [[nodiscard]] bool macrotasks_empty() const noexcept;

    /// @brief Returns true when every queue and the pending-timer set are empty.
    [[nodiscard]] bool empty() const noexcept;

    [[nodiscard]] std::size_t livelock_guard() const noexcept { return livelock_guard_; }

    /// @throws OutOfRangeError if @p guard is 0.
    void set_livelock_guard(std::size_t guard);

private:
    std::deque<Callback>& queue(QueueKind kind);
    [[nodiscard]] const std::deque<Callback>& queue(QueueKind kind) const;

    std::array<std::deque<Callback>, QUEUE_KIND_COUNT> queues_;
    std::map<TimerKey, Callback> pending_timers_;

    // Location of every live callback, for cancellation.
    std::unordered_map<CallbackId, QueueKind> queued_;
    std::unordered_map<CallbackId, TimerKey> pending_keys_;

    std::size_t livelock_guard_;
};

} // namespace loopsim::core
