#pragma once

/// @defgroup core Core Library
/// @brief Logical clock, callback queues, worker pool and the run loop.
///
/// The core library is the deterministic event-loop simulator: a Clock
/// that only moves when told to, a QueueSet holding the Immediate,
/// Microtask and macrotask phase queues, a fixed-capacity WorkerPool,
/// and the Scheduler that drives them. It has no dependencies on I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Strong types for logical time.

/// @defgroup core_engine Engine
/// @ingroup core
/// @brief Scheduler run loop, clock and execution trace.

/// @defgroup core_queues Queues
/// @ingroup core
/// @brief Callbacks, queue kinds and the QueueSet.

/// @defgroup core_pool Worker Pool
/// @ingroup core
/// @brief Jobs and the bounded worker pool.

/// @defgroup core_events Handles
/// @ingroup core
/// @brief Callback and job identifiers.

#include <loopsim/core/types.hpp>
#include <loopsim/core/error.hpp>
#include <loopsim/core/handle.hpp>
#include <loopsim/core/queue_kind.hpp>
#include <loopsim/core/callback.hpp>
#include <loopsim/core/execution_trace.hpp>
#include <loopsim/core/trace_writer.hpp>
#include <loopsim/core/clock.hpp>
#include <loopsim/core/queue_set.hpp>
#include <loopsim/core/worker_pool.hpp>

#include <loopsim/core/scheduler.hpp>
