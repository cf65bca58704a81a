#pragma once

#include <cstdint>

namespace loopsim::core {

class Scheduler;
class WorkerPool;

/// @brief Identifier of a submitted Callback (never 0 for a real callback).
/// @ingroup core_events
using CallbackId = uint64_t;

/// @brief Identifier of a submitted worker Job (never 0 for a real job).
/// @ingroup core_events
using JobId = uint64_t;

/// @brief Cancellable reference to a submitted Callback.
/// @ingroup core_events
///
/// Returned by every Scheduler::submit_* call that creates a Callback.
/// Default-constructed instances are invalid; only the Scheduler may create
/// valid handles. A handle stays valid (it remains a well-formed reference)
/// after the callback runs or is cancelled; cancelling it again is reported
/// by Scheduler::cancel() as NotFoundError.
///
/// @see Scheduler::cancel(CallbackHandle)
/// @see JobHandle
class CallbackHandle {
    friend class Scheduler;

public:
    /// @brief Default-construct an invalid handle.
    CallbackHandle() = default;

    /// @brief Id of the referenced callback (or interval series).
    [[nodiscard]] CallbackId id() const noexcept { return id_; }

    /// @brief Check whether this handle was created by a Scheduler.
    [[nodiscard]] bool valid() const noexcept { return id_ != 0; }

    explicit operator bool() const noexcept { return valid(); }

    bool operator==(const CallbackHandle&) const = default;

private:
    explicit CallbackHandle(CallbackId id) noexcept : id_(id) {}

    CallbackId id_{0};
};

/// @brief Cancellable reference to a Job submitted to the WorkerPool.
/// @ingroup core_events
///
/// @see WorkerPool::submit, Scheduler::submit_worker_job, CallbackHandle
class JobHandle {
    friend class WorkerPool;

public:
    /// @brief Default-construct an invalid handle.
    JobHandle() = default;

    /// @brief Id of the referenced job.
    [[nodiscard]] JobId id() const noexcept { return id_; }

    /// @brief Check whether this handle was created by a WorkerPool.
    [[nodiscard]] bool valid() const noexcept { return id_ != 0; }

    explicit operator bool() const noexcept { return valid(); }

    bool operator==(const JobHandle&) const = default;

private:
    explicit JobHandle(JobId id) noexcept : id_(id) {}

    JobId id_{0};
};

} // namespace loopsim::core
