#pragma once

#include <loopsim/core/handle.hpp>
#include <loopsim/core/queue_kind.hpp>
#include <loopsim/core/types.hpp>

#include <vector>

namespace loopsim::core {

/// @brief One executed callback, as recorded by Scheduler::run().
///
/// @ingroup core_engine
struct TraceEntry {
    TimePoint time;          ///< Clock value when the callback started.
    QueueKind queue;         ///< Queue the callback was taken from.
    CallbackId callback_id;  ///< Id of the executed callback.
    JobId job_id{0};         ///< Worker job whose completion this is, or 0.

    bool operator==(const TraceEntry&) const = default;
};

/// @brief Ordered list of executed callbacks returned by Scheduler::run().
/// @ingroup core_engine
using ExecutionTrace = std::vector<TraceEntry>;

} // namespace loopsim::core
