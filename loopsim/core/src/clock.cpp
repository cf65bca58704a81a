#include <loopsim/core/clock.hpp>
#include <loopsim/core/error.hpp>

#include <string>

namespace loopsim::core {

void Clock::advance_to(TimePoint tick) {
    if (tick < now_) {
        throw InvalidTimeError("Cannot move clock back from tick " +
                               std::to_string(time_to_ticks(now_)) + " to tick " +
                               std::to_string(time_to_ticks(tick)));
    }
    now_ = tick;
}

} // namespace loopsim::core
