#pragma once

#include <loopsim/core/handle.hpp>
#include <loopsim/core/types.hpp>

#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <set>

namespace loopsim::core {

class Clock;

/// @brief Lifecycle state of a worker Job.
///
/// Transitions are monotonic: Queued -> Running -> Completed, with
/// Cancelled reachable from Queued or Running.
///
/// @ingroup core_pool
enum class JobState {
    Queued,
    Running,
    Completed,
    Cancelled,
};

/// @brief One unit of work submitted to the WorkerPool.
///
/// Jobs are owned by the pool from submission until their completion
/// callback has been handed over (or until a queued job is cancelled).
///
/// @ingroup core_pool
struct Job {
    JobId id{0};                       ///< Unique id; also the submission order.
    Duration duration;                 ///< Ticks of work; always positive.
    std::function<void()> payload;     ///< Completion action delivered to the IO phase.
    JobState state{JobState::Queued};
    TimePoint submit_time;             ///< Tick of submission.
    TimePoint start_time;              ///< Tick the job took a worker slot.
    TimePoint completion_time;         ///< start_time + duration, once Running.
};

/// @brief Notifications emitted by the WorkerPool.
/// @ingroup core_pool
enum class JobEvent {
    Submitted,  ///< A job entered the pool.
    Started,    ///< A job took a worker slot.
    Completed,  ///< A job finished; the listener takes its payload.
    Released,   ///< A cancelled running job reached its completion tick.
};

/// @brief Fixed-capacity executor of worker Jobs.
///
/// At most capacity() jobs are Running at any time; the rest wait in a
/// FIFO queue. A job occupies its slot for exactly `duration` ticks, even
/// when it was cancelled while running: in-flight native work cannot be
/// interrupted, so cancellation only suppresses the completion.
///
/// The pool never enqueues callbacks itself. Completions are reported to
/// the JobListener, which the Scheduler uses to post IOPhase callbacks.
///
/// With N workers and M jobs of equal duration D submitted at tick 0, job k
/// (1-based) completes at tick D * ceil(k / N).
///
/// @see Scheduler::submit_worker_job
/// @ingroup core_pool
class WorkerPool {
public:
    /// @brief Receives job lifecycle notifications.
    using JobListener = std::function<void(Job&, JobEvent)>;

    /// @brief Default number of workers.
    static constexpr std::size_t DEFAULT_CAPACITY = 4;

    /// @param clock    Time source used to stamp submissions (must outlive the pool).
    /// @param capacity Number of workers.
    /// @throws OutOfRangeError if @p capacity is 0.
    explicit WorkerPool(const Clock& clock, std::size_t capacity = DEFAULT_CAPACITY);

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /// @brief Install the lifecycle listener (replaces any previous one).
    void set_listener(JobListener listener);

    /// @brief Submit a job of @p duration ticks.
    ///
    /// Starts the job immediately if a worker is free, otherwise appends it
    /// to the FIFO queue.
    ///
    /// @throws InvalidDurationError if @p duration is not positive.
    JobHandle submit(Duration duration, std::function<void()> payload);

    /// @brief Cancel a queued or running job.
    ///
    /// A queued job is removed at once. A running job is marked Cancelled
    /// but keeps its worker until its completion tick.
    ///
    /// @return The state the job was in before cancellation.
    /// @throws NotFoundError if the job is unknown, completed, or already cancelled.
    JobState cancel(JobHandle handle);

    /// @brief Complete due jobs, then admit queued jobs into freed slots.
    ///
    /// Every running job whose completion tick is <= @p now leaves the pool
    /// in ascending submission order. Queued jobs are then admitted
    /// oldest-first with completion tick `now + duration`.
    ///
    /// @return Number of non-cancelled jobs that completed.
    std::size_t tick(TimePoint now);

    /// @brief Change the number of workers.
    ///
    /// Growing the pool admits queued jobs immediately.
    ///
    /// @throws OutOfRangeError if @p capacity is 0.
    /// @throws InvalidStateError if fewer slots than running jobs are requested.
    void set_capacity(std::size_t capacity);

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    /// @brief Jobs holding a worker slot, including cancelled ones.
    [[nodiscard]] std::size_t running_count() const noexcept { return running_.size(); }

    [[nodiscard]] std::size_t queued_count() const noexcept { return queued_.size(); }

    /// @brief Returns true when no job is running or queued.
    [[nodiscard]] bool idle() const noexcept { return running_.empty() && queued_.empty(); }

    /// @brief Earliest completion tick among running jobs, if any.
    [[nodiscard]] std::optional<TimePoint> next_completion_time() const;

    /// @brief Look up a job that is still owned by the pool.
    /// @return Pointer to the job, or nullptr once it has left the pool.
    [[nodiscard]] const Job* find(JobId id) const;

private:
    void start(Job& job, TimePoint now);
    void admit(TimePoint now);
    void notify(Job& job, JobEvent event);

    const Clock& clock_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::size_t capacity_;
    JobId next_id_{1};

    std::map<JobId, Job> jobs_;
    std::set<JobId> running_;
    std::deque<JobId> queued_;
    JobListener listener_;
};

} // namespace loopsim::core
