#pragma once

/// @file scenario_loader.hpp
/// @brief Functions and data structures for loading and writing JSON scenario files.
/// @ingroup io_loaders

#include <loopsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace loopsim::io {

/// @brief How a scenario entry enters the event loop.
///
/// Five kinds map one-to-one onto a core::QueueKind. `Interval` is a
/// repeating timer and `WorkerJob` a job whose completion runs in the
/// IO phase.
///
/// @ingroup io_loaders
enum class SubmissionKind {
    Immediate,
    Microtask,
    Timer,
    IO,
    Check,
    Interval,
    WorkerJob,
};

/// @brief Returns the JSON spelling of @p kind (e.g. `"worker_job"`).
[[nodiscard]] std::string_view to_string(SubmissionKind kind);

/// @brief Parse the JSON spelling of a submission kind.
/// @throws LoaderError if @p name is not a known kind.
[[nodiscard]] SubmissionKind submission_kind_from_string(std::string_view name);

/// @brief One callback (or job) to submit, with the work it submits in turn.
///
/// @ingroup io_loaders
/// @see ScenarioData, inject_scenario
struct Submission {
    SubmissionKind kind{SubmissionKind::Microtask};
    std::string label;              ///< Name written to the LabelLog when the callback runs.
    core::Duration delay{};         ///< Timer only; >= 0.
    core::Duration duration{};      ///< WorkerJob only; > 0.
    core::Duration period{};        ///< Interval only; > 0.
    /// Interval only: firings before the series cancels itself.
    /// Unset means the series repeats until the run is bounded.
    std::optional<uint64_t> repeat;
    bool throws{false};             ///< Raise after submitting @ref then.
    std::vector<Submission> then;   ///< Submitted each time this callback runs.
};

/// @brief Scheduler options carried by a scenario file.
///
/// Unset values leave the scheduler's current option untouched.
///
/// @ingroup io_loaders
struct ScenarioOptions {
    std::optional<std::size_t> worker_pool_capacity;
    std::optional<std::size_t> livelock_guard;
};

/// @brief Complete scenario definition: options plus top-level submissions.
///
/// @ingroup io_loaders
/// @see load_scenario, inject_scenario
struct ScenarioData {
    ScenarioOptions options;
    std::vector<Submission> submissions;
};

/// @brief Returns true if any interval (at any depth) has no repeat bound.
///
/// Such a scenario never runs out of work and needs a bounded run.
[[nodiscard]] bool has_unbounded_interval(const ScenarioData& scenario);

/// @brief Load a scenario from a JSON file.
///
/// @param path  Filesystem path to the JSON scenario file.
/// @return Parsed scenario data.
///
/// @throws LoaderError  If the file cannot be read or contains invalid JSON.
///
/// @see load_scenario_from_string, inject_scenario
ScenarioData load_scenario(const std::filesystem::path& path);

/// @brief Load a scenario from a JSON string.
///
/// Errors name the offending entry as a JSON path, e.g.
/// `submissions[2].then[0]: field 'duration' must be positive`.
///
/// @throws LoaderError  If the JSON is malformed or fails validation.
ScenarioData load_scenario_from_string(std::string_view json);

/// @brief Write a scenario to a JSON file.
///
/// @throws LoaderError  If the file cannot be opened for writing.
/// @see write_scenario_to_stream
void write_scenario(const ScenarioData& scenario, const std::filesystem::path& path);

/// @brief Write a scenario to an output stream in the format read by
///        load_scenario_from_string.
///
/// Only the fields meaningful for each kind are written.
void write_scenario_to_stream(const ScenarioData& scenario, std::ostream& out);

} // namespace loopsim::io
