#pragma once

/// @defgroup io I/O Library
/// @brief JSON scenarios, trace output, and metrics.
///
/// The I/O library handles all external data formats: loading and
/// writing scenario JSON files, injecting scenarios into a Scheduler,
/// writing scheduler traces (JSON, textual, in-memory), exporting the
/// execution trace, and computing post-run metrics.
/// Depends on core only.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Scenario JSON loader, writer and injection.

/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief JSON, textual, memory, and null trace writers; execution trace export.

/// @defgroup io_metrics Metrics
/// @ingroup io
/// @brief Post-run metrics.

#include <loopsim/io/error.hpp>
#include <loopsim/io/trace_writers.hpp>
#include <loopsim/io/scenario_loader.hpp>
#include <loopsim/io/scenario_injection.hpp>
#include <loopsim/io/trace_export.hpp>
#include <loopsim/io/metrics.hpp>
