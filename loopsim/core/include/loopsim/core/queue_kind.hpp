#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace loopsim::core {

/// @brief Names the callback queue a Callback belongs to.
///
/// The enumerators are listed in total priority order: the Immediate queue
/// is drained before the Microtask queue, and both are drained before any
/// of the three macrotask phases, which are served one callback at a time
/// in the fixed rotation TimerPhase, IOPhase, CheckPhase.
///
/// @see QueueSet, Scheduler
/// @ingroup core_queues
enum class QueueKind {
    Immediate,
    Microtask,
    TimerPhase,
    IOPhase,
    CheckPhase,
};

/// @brief Number of QueueKind enumerators.
inline constexpr std::size_t QUEUE_KIND_COUNT = 5;

/// @brief Macrotask phases in rotation order.
inline constexpr std::array<QueueKind, 3> MACROTASK_PHASES{
    QueueKind::TimerPhase, QueueKind::IOPhase, QueueKind::CheckPhase};

/// @brief Returns true if @p kind names one of the enumerators above.
[[nodiscard]] constexpr bool is_valid(QueueKind kind) noexcept {
    return static_cast<std::size_t>(kind) < QUEUE_KIND_COUNT;
}

/// @brief Returns true for the three phases served one callback per step.
[[nodiscard]] constexpr bool is_macrotask(QueueKind kind) noexcept {
    return kind == QueueKind::TimerPhase || kind == QueueKind::IOPhase ||
           kind == QueueKind::CheckPhase;
}

/// @brief Short lowercase name used in traces and scenario files.
///
/// Returns `"immediate"`, `"microtask"`, `"timer"`, `"io"` or `"check"`.
///
/// @throws InvalidQueueError if @p kind is out of range.
[[nodiscard]] std::string_view to_string(QueueKind kind);

/// @brief Parse a queue name.
///
/// Accepts the short names produced by to_string() as well as the
/// enumerator spellings (`"TimerPhase"`, `"IOPhase"`, ...).
///
/// @throws InvalidQueueError for any other name.
[[nodiscard]] QueueKind queue_kind_from_string(std::string_view name);

} // namespace loopsim::core
