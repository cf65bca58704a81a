#pragma once

/// @file trace_export.hpp
/// @brief Serialisation of the execution trace returned by Scheduler::run().
/// @ingroup io_writers

#include <loopsim/core/execution_trace.hpp>
#include <loopsim/io/scenario_injection.hpp>

#include <filesystem>
#include <ostream>

namespace loopsim::io {

/// @brief Write @p trace as a JSON array.
///
/// Each entry becomes `{"tick": T, "queue": "io", "callback_id": N}`, with
/// a `job_id` member for worker job completions.
void write_execution_trace(const core::ExecutionTrace& trace, std::ostream& out);

/// @brief Read a JSON array produced by write_execution_trace.
///
/// @throws LoaderError  If the file cannot be read or an entry is malformed.
core::ExecutionTrace load_execution_trace(const std::filesystem::path& path);

/// @brief Write one `tick queue label` line per executed scenario callback.
void write_label_log(const LabelLog& labels, std::ostream& out);

} // namespace loopsim::io
