#pragma once

/// @file scenario_injection.hpp
/// @brief Functions for injecting scenario data into a Scheduler.
/// @ingroup io_loaders

#include <loopsim/core/queue_kind.hpp>
#include <loopsim/core/scheduler.hpp>
#include <loopsim/io/scenario_loader.hpp>

#include <string>
#include <vector>

namespace loopsim::io {

/// @brief One executed scenario callback, by label.
///
/// @ingroup io_loaders
struct LabelEntry {
    core::TimePoint time;
    core::QueueKind queue;
    std::string label;

    bool operator==(const LabelEntry&) const = default;
};

/// @brief Execution order of scenario callbacks, by label.
using LabelLog = std::vector<LabelEntry>;

/// @brief Apply the scenario options to @p scheduler.
///
/// Unset options keep their current value.
///
/// @throws core::AlreadyRunningError if the scheduler is running.
/// @throws core::InvalidStateError if the capacity is below the running job count.
void apply_options(core::Scheduler& scheduler, const ScenarioOptions& options);

/// @brief Apply the options and submit every top-level entry of @p scenario.
///
/// Each scenario callback, when it runs:
///   1. appends its label to @p labels (if non-null);
///   2. submits its `then` entries;
///   3. throws std::runtime_error if `throws` is set.
///
/// Interval entries with a `repeat` bound cancel their own series after the
/// last firing. The scenario is copied; @p labels must outlive the run.
///
/// @param scheduler  An idle scheduler to populate.
/// @param scenario   Scenario data (typically from load_scenario).
/// @param labels     Optional log receiving the label of each executed callback.
///
/// @see load_scenario, LabelLog
void inject_scenario(core::Scheduler& scheduler, const ScenarioData& scenario,
                     LabelLog* labels = nullptr);

} // namespace loopsim::io
