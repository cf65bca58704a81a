#pragma once

/// @file metrics.hpp
/// @brief Post-run metrics computed from scheduler trace records.
///
/// @ingroup io_metrics

#include <loopsim/core/queue_kind.hpp>
#include <loopsim/io/trace_writers.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <vector>

namespace loopsim::io {

/// @brief Aggregated metrics computed from a scheduler trace.
///
/// @ingroup io_metrics
/// @see compute_metrics, compute_metrics_from_file
struct LoopMetrics {
    // -- Callbacks -----------------------------------------------------------

    /// @brief Executed callbacks, indexed by core::QueueKind.
    std::array<uint64_t, core::QUEUE_KIND_COUNT> executed_per_queue{};
    uint64_t total_executed{0};
    uint64_t callbacks_cancelled{0};
    uint64_t uncaught_exceptions{0};

    // -- Worker pool ---------------------------------------------------------

    uint64_t jobs_submitted{0};
    uint64_t jobs_completed{0};
    uint64_t jobs_cancelled{0};
    uint64_t peak_running_jobs{0};  ///< Most jobs holding a worker at once.

    /// @brief Mean ticks between job submission and start, over started jobs.
    double mean_queueing_delay{0.0};
    uint64_t max_queueing_delay{0};  ///< Longest submission-to-start wait (ticks).

    // -- Clock ---------------------------------------------------------------

    uint64_t clock_advances{0};
    int64_t final_tick{0};  ///< Tick of the last record.

    [[nodiscard]] uint64_t executed(core::QueueKind kind) const {
        return executed_per_queue.at(static_cast<std::size_t>(kind));
    }
};

/// @brief Compute aggregated metrics from in-memory trace records.
///
/// @param traces  Trace records (typically from MemoryTraceWriter).
/// @throws core::InvalidQueueError if a record names an unknown queue.
///
/// @see compute_metrics_from_file, MemoryTraceWriter
LoopMetrics compute_metrics(const std::vector<TraceRecord>& traces);

/// @brief Compute aggregated metrics from a JSON trace file on disk.
///
/// The file is read as written by JsonTraceWriter.
///
/// @throws LoaderError  If the file cannot be read or parsed.
LoopMetrics compute_metrics_from_file(const std::filesystem::path& path);

/// @brief Write a human-readable summary of @p metrics.
void write_metrics_summary(const LoopMetrics& metrics, std::ostream& out);

} // namespace loopsim::io
