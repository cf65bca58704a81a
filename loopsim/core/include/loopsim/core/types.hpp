#pragma once

#include <compare>
#include <cstdint>

namespace loopsim::core {

/// @brief Logical time interval represented as an integer tick count.
///
/// Duration wraps an `int64_t` tick value with a private constructor.
/// All construction goes through named factories or bridge functions, so
/// that a raw integer never silently becomes a time value. Negative
/// durations are representable; APIs that require a positive or
/// non-negative interval validate their argument.
///
/// @see duration_from_ticks, duration_to_ticks, TimePoint
/// @ingroup core_types
class Duration {
    int64_t ticks_;

    explicit constexpr Duration(int64_t ticks) noexcept : ticks_(ticks) {}

    friend constexpr Duration duration_from_ticks(int64_t ticks) noexcept;
    friend constexpr int64_t duration_to_ticks(Duration d) noexcept;

public:
    /// @brief Default constructor: zero duration.
    constexpr Duration() noexcept : ticks_(0) {}

    /// @brief Named factory returning a zero-length duration.
    static constexpr Duration zero() noexcept { return Duration{0}; }

    /// @brief Return the raw tick count.
    /// @see duration_to_ticks
    [[nodiscard]] constexpr int64_t ticks() const noexcept { return ticks_; }

    constexpr Duration operator+(Duration rhs) const noexcept {
        return Duration{ticks_ + rhs.ticks_};
    }

    constexpr Duration operator-(Duration rhs) const noexcept {
        return Duration{ticks_ - rhs.ticks_};
    }

    constexpr Duration& operator+=(Duration rhs) noexcept {
        ticks_ += rhs.ticks_;
        return *this;
    }

    constexpr Duration& operator-=(Duration rhs) noexcept {
        ticks_ -= rhs.ticks_;
        return *this;
    }

    constexpr Duration operator-() const noexcept {
        return Duration{-ticks_};
    }

    constexpr auto operator<=>(const Duration& rhs) const noexcept = default;
    constexpr bool operator==(const Duration& rhs) const noexcept = default;
};

/// @brief Absolute logical time as a Duration offset from epoch (tick 0).
///
/// TimePoint supports arithmetic with Duration (TimePoint +/- Duration yields
/// TimePoint) and differencing (TimePoint - TimePoint yields Duration). Two
/// TimePoints cannot be added.
///
/// @see time_from_ticks, time_to_ticks, Duration
/// @ingroup core_types
class TimePoint {
    Duration since_epoch_;

    explicit constexpr TimePoint(Duration d) noexcept : since_epoch_(d) {}

    friend constexpr TimePoint time_from_ticks(int64_t ticks) noexcept;

public:
    /// @brief Default constructor: epoch (tick 0).
    constexpr TimePoint() noexcept : since_epoch_(Duration::zero()) {}

    /// @brief Named factory returning the epoch.
    static constexpr TimePoint epoch() noexcept {
        return TimePoint{Duration::zero()};
    }

    /// @brief Return the duration elapsed since epoch.
    [[nodiscard]] constexpr Duration time_since_epoch() const noexcept {
        return since_epoch_;
    }

    constexpr TimePoint operator+(Duration d) const noexcept {
        return TimePoint{since_epoch_ + d};
    }

    constexpr TimePoint operator-(Duration d) const noexcept {
        return TimePoint{since_epoch_ - d};
    }

    constexpr TimePoint& operator+=(Duration d) noexcept {
        since_epoch_ += d;
        return *this;
    }

    constexpr Duration operator-(TimePoint rhs) const noexcept {
        return since_epoch_ - rhs.since_epoch_;
    }

    constexpr auto operator<=>(const TimePoint& rhs) const noexcept = default;
    constexpr bool operator==(const TimePoint& rhs) const noexcept = default;
};

// ============================================================================
// Bridge functions: the canonical API for Duration/TimePoint conversion
// ============================================================================

/// @brief Create a Duration from a raw tick count.
/// @param ticks Tick count (may be negative; callers validate).
/// @return Duration wrapping @p ticks.
/// @see duration_to_ticks
[[nodiscard]] constexpr Duration duration_from_ticks(int64_t ticks) noexcept {
    return Duration{ticks};
}

/// @brief Extract the raw tick count from a Duration.
/// @see duration_from_ticks
[[nodiscard]] constexpr int64_t duration_to_ticks(Duration d) noexcept {
    return d.ticks_;
}

/// @brief Create a TimePoint from an absolute tick count.
/// @param ticks Ticks since epoch.
/// @see time_to_ticks
[[nodiscard]] constexpr TimePoint time_from_ticks(int64_t ticks) noexcept {
    return TimePoint{duration_from_ticks(ticks)};
}

/// @brief Convert a TimePoint to ticks since epoch.
/// @see time_from_ticks
[[nodiscard]] constexpr int64_t time_to_ticks(TimePoint tp) noexcept {
    return tp.time_since_epoch().ticks();
}

} // namespace loopsim::core
