#include <loopsim/core/queue_set.hpp>
#include <loopsim/core/error.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace loopsim::core {

QueueSet::QueueSet(std::size_t livelock_guard)
    : livelock_guard_(livelock_guard) {
    if (livelock_guard_ == 0) {
        throw OutOfRangeError("Livelock guard must be at least 1");
    }
}

std::deque<Callback>& QueueSet::queue(QueueKind kind) {
    if (!is_valid(kind)) {
        throw InvalidQueueError("Unknown queue kind " + std::to_string(static_cast<int>(kind)));
    }
    return queues_[static_cast<std::size_t>(kind)];
}

const std::deque<Callback>& QueueSet::queue(QueueKind kind) const {
    if (!is_valid(kind)) {
        throw InvalidQueueError("Unknown queue kind " + std::to_string(static_cast<int>(kind)));
    }
    return queues_[static_cast<std::size_t>(kind)];
}

void QueueSet::enqueue(QueueKind kind, Callback callback) {
    auto& target = queue(kind);
    callback.queue = kind;
    queued_.emplace(callback.id, kind);
    target.push_back(std::move(callback));
}

void QueueSet::add_timer(Callback callback) {
    callback.queue = QueueKind::TimerPhase;
    TimerKey key{callback.fire_time, callback.id};
    pending_keys_.emplace(callback.id, key);
    pending_timers_.emplace(key, std::move(callback));
}

std::size_t QueueSet::promote_due_timers(TimePoint now) {
    std::size_t moved = 0;
    while (!pending_timers_.empty()) {
        auto it = pending_timers_.begin();
        if (it->first.fire_time > now) {
            break;
        }
        Callback callback = std::move(it->second);
        pending_keys_.erase(callback.id);
        pending_timers_.erase(it);
        enqueue(QueueKind::TimerPhase, std::move(callback));
        ++moved;
    }
    return moved;
}

std::optional<TimePoint> QueueSet::next_timer_time() const {
    if (pending_timers_.empty()) {
        return std::nullopt;
    }
    return pending_timers_.begin()->first.fire_time;
}

std::size_t QueueSet::drain_all(QueueKind kind, const Executor& execute) {
    auto& target = queue(kind);
    std::size_t executed = 0;

    // The executor may append to target, so the emptiness test is repeated
    // after every callback.
    while (!target.empty()) {
        if (executed >= livelock_guard_) {
            throw LivelockError(kind, livelock_guard_);
        }
        Callback callback = std::move(target.front());
        target.pop_front();
        queued_.erase(callback.id);

        ++executed;
        execute(callback);
    }
    return executed;
}

std::optional<Callback> QueueSet::pop_one(QueueKind kind) {
    if (!is_macrotask(kind)) {
        throw InvalidQueueError("pop_one() requires a macrotask phase, got '" +
                                std::string(to_string(kind)) + "'");
    }
    auto& target = queue(kind);
    if (target.empty()) {
        return std::nullopt;
    }
    Callback callback = std::move(target.front());
    target.pop_front();
    queued_.erase(callback.id);
    return callback;
}

QueueKind QueueSet::cancel(CallbackId id) {
    if (auto pending = pending_keys_.find(id); pending != pending_keys_.end()) {
        pending_timers_.erase(pending->second);
        pending_keys_.erase(pending);
        return QueueKind::TimerPhase;
    }

    auto location = queued_.find(id);
    if (location == queued_.end()) {
        throw NotFoundError("No queued callback with id " + std::to_string(id));
    }
    QueueKind kind = location->second;
    auto& target = queue(kind);
    auto it = std::find_if(target.begin(), target.end(),
                           [id](const Callback& cb) { return cb.id == id; });
    if (it != target.end()) {
        target.erase(it);
    }
    queued_.erase(location);
    return kind;
}

bool QueueSet::contains(CallbackId id) const noexcept {
    return queued_.contains(id) || pending_keys_.contains(id);
}

std::size_t QueueSet::size(QueueKind kind) const {
    return queue(kind).size();
}

bool QueueSet::macrotasks_empty() const noexcept {
    return std::all_of(MACROTASK_PHASES.begin(), MACROTASK_PHASES.end(), [this](QueueKind kind) {
        return queues_[static_cast<std::size_t>(kind)].empty();
    });
}

bool QueueSet::empty() const noexcept {
    return pending_timers_.empty() &&
           std::all_of(queues_.begin(), queues_.end(),
                       [](const std::deque<Callback>& q) { return q.empty(); });
}

void QueueSet::set_livelock_guard(std::size_t guard) {
    if (guard == 0) {
        throw OutOfRangeError("Livelock guard must be at least 1");
    }
    livelock_guard_ = guard;
}

} // namespace loopsim::core
