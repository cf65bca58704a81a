#pragma once

#include <loopsim/core/types.hpp>

namespace loopsim::core {

/// @brief Monotonic logical time source.
///
/// The clock never moves on its own: the Scheduler advances it explicitly
/// when no work is left at the current tick. Nothing in the simulator
/// sleeps or reads wall-clock time.
///
/// @ingroup core_engine
class Clock {
public:
    /// @brief Current logical time; no side effect.
    [[nodiscard]] TimePoint now() const noexcept { return now_; }

    /// @brief Move the clock forward to @p tick.
    ///
    /// Advancing to the current tick is allowed and has no effect.
    ///
    /// @throws InvalidTimeError if @p tick < now().
    void advance_to(TimePoint tick);

private:
    TimePoint now_{};
};

} // namespace loopsim::core
