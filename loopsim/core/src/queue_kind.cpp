#include <loopsim/core/queue_kind.hpp>
#include <loopsim/core/error.hpp>

#include <string>

namespace loopsim::core {

std::string_view to_string(QueueKind kind) {
    switch (kind) {
        case QueueKind::Immediate:  return "immediate";
        case QueueKind::Microtask:  return "microtask";
        case QueueKind::TimerPhase: return "timer";
        case QueueKind::IOPhase:    return "io";
        case QueueKind::CheckPhase: return "check";
    }
    throw InvalidQueueError("Unknown queue kind " +
                            std::to_string(static_cast<int>(kind)));
}

QueueKind queue_kind_from_string(std::string_view name) {
    if (name == "immediate" || name == "Immediate") {
        return QueueKind::Immediate;
    }
    if (name == "microtask" || name == "Microtask") {
        return QueueKind::Microtask;
    }
    if (name == "timer" || name == "TimerPhase") {
        return QueueKind::TimerPhase;
    }
    if (name == "io" || name == "IOPhase") {
        return QueueKind::IOPhase;
    }
    if (name == "check" || name == "CheckPhase") {
        return QueueKind::CheckPhase;
    }
    throw InvalidQueueError("Unknown queue name '" + std::string(name) + "'");
}

} // namespace loopsim::core
