#include <loopsim/core/worker_pool.hpp>
#include <loopsim/core/clock.hpp>
#include <loopsim/core/error.hpp>

#include <algorithm>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace loopsim::core {

WorkerPool::WorkerPool(const Clock& clock, std::size_t capacity)
    : clock_(clock)
    , capacity_(capacity) {
    if (capacity_ == 0) {
        throw OutOfRangeError("Worker pool capacity must be at least 1");
    }
}

void WorkerPool::set_listener(JobListener listener) {
    listener_ = std::move(listener);
}

JobHandle WorkerPool::submit(Duration duration, std::function<void()> payload) {
    if (duration <= Duration::zero()) {
        throw InvalidDurationError("Job duration must be a positive tick count, got " +
                                   std::to_string(duration.ticks()));
    }
    if (duration.ticks() > std::numeric_limits<int64_t>::max() - time_to_ticks(clock_.now())) {
        throw InvalidDurationError("Job duration of " + std::to_string(duration.ticks()) +
                                   " ticks overflows the clock");
    }

    JobId id = next_id_++;
    Job job;
    job.id = id;
    job.duration = duration;
    job.payload = std::move(payload);
    job.submit_time = clock_.now();

    auto it = jobs_.emplace(id, std::move(job)).first;
    notify(it->second, JobEvent::Submitted);
    if (running_.size() < capacity_) {
        start(it->second, clock_.now());
    } else {
        queued_.push_back(id);
    }
    return JobHandle(id);
}

JobState WorkerPool::cancel(JobHandle handle) {
    auto it = jobs_.find(handle.id());
    if (it == jobs_.end()) {
        throw NotFoundError("No pending job with id " + std::to_string(handle.id()));
    }

    Job& job = it->second;
    switch (job.state) {
        case JobState::Queued:
            queued_.erase(std::find(queued_.begin(), queued_.end(), job.id));
            jobs_.erase(it);
            return JobState::Queued;
        case JobState::Running:
            // The slot stays busy until completion_time.
            job.state = JobState::Cancelled;
            return JobState::Running;
        case JobState::Completed:
        case JobState::Cancelled:
            break;
    }
    throw NotFoundError("Job " + std::to_string(handle.id()) + " was already cancelled");
}

std::size_t WorkerPool::tick(TimePoint now) {
    // running_ is ordered by id, so due jobs come out in submission order.
    std::vector<JobId> due;
    for (JobId id : running_) {
        if (jobs_.at(id).completion_time <= now) {
            due.push_back(id);
        }
    }

    std::size_t completed = 0;
    for (JobId id : due) {
        running_.erase(id);
        auto node = jobs_.extract(id);
        Job& job = node.mapped();
        if (job.state == JobState::Cancelled) {
            notify(job, JobEvent::Released);
            continue;
        }
        job.state = JobState::Completed;
        ++completed;
        notify(job, JobEvent::Completed);
    }

    admit(now);
    return completed;
}

void WorkerPool::set_capacity(std::size_t capacity) {
    if (capacity == 0) {
        throw OutOfRangeError("Worker pool capacity must be at least 1");
    }
    if (capacity < running_.size()) {
        throw InvalidStateError("Cannot shrink worker pool to " + std::to_string(capacity) +
                                " while " + std::to_string(running_.size()) +
                                " jobs are running");
    }
    capacity_ = capacity;
    admit(clock_.now());
}

std::optional<TimePoint> WorkerPool::next_completion_time() const {
    std::optional<TimePoint> earliest;
    for (JobId id : running_) {
        TimePoint t = jobs_.at(id).completion_time;
        if (!earliest || t < *earliest) {
            earliest = t;
        }
    }
    return earliest;
}

const Job* WorkerPool::find(JobId id) const {
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : &it->second;
}

void WorkerPool::start(Job& job, TimePoint now) {
    job.state = JobState::Running;
    job.start_time = now;
    job.completion_time = now + job.duration;
    running_.insert(job.id);
    notify(job, JobEvent::Started);
}

void WorkerPool::admit(TimePoint now) {
    while (running_.size() < capacity_ && !queued_.empty()) {
        JobId id = queued_.front();
        queued_.pop_front();
        start(jobs_.at(id), now);
    }
}

void WorkerPool::notify(Job& job, JobEvent event) {
    if (listener_) {
        listener_(job, event);
    }
}

} // namespace loopsim::core
