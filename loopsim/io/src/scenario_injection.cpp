#include <loopsim/io/scenario_injection.hpp>

#include <memory>
#include <stdexcept>
#include <utility>

namespace loopsim::io {

namespace {

using namespace loopsim::core;

// Owns a copy of the scenario so submitted actions can refer to its entries
// for as long as any of them is still queued.
class Injector : public std::enable_shared_from_this<Injector> {
public:
    Injector(Scheduler& scheduler, ScenarioData scenario, LabelLog* labels)
        : scheduler_(scheduler)
        , scenario_(std::move(scenario))
        , labels_(labels) {}

    void inject() { submit_all(scenario_.submissions); }

private:
    struct IntervalState {
        CallbackHandle handle;
        uint64_t fired{0};
    };

    void submit_all(const std::vector<Submission>& subs) {
        for (const auto& sub : subs) {
            submit(sub);
        }
    }

    void submit(const Submission& sub) {
        switch (sub.kind) {
            case SubmissionKind::Immediate:
                scheduler_.submit_immediate(make_action(sub, QueueKind::Immediate));
                break;
            case SubmissionKind::Microtask:
                scheduler_.submit_microtask(make_action(sub, QueueKind::Microtask));
                break;
            case SubmissionKind::Timer:
                scheduler_.submit_timer(make_action(sub, QueueKind::TimerPhase), sub.delay);
                break;
            case SubmissionKind::IO:
                scheduler_.submit_io(make_action(sub, QueueKind::IOPhase));
                break;
            case SubmissionKind::Check:
                scheduler_.submit_check(make_action(sub, QueueKind::CheckPhase));
                break;
            case SubmissionKind::WorkerJob:
                scheduler_.submit_worker_job(sub.duration, make_action(sub, QueueKind::IOPhase));
                break;
            case SubmissionKind::Interval:
                submit_interval(sub);
                break;
        }
    }

    void submit_interval(const Submission& sub) {
        auto state = std::make_shared<IntervalState>();
        Scheduler::Action body = make_action(sub, QueueKind::TimerPhase);
        const Submission* entry = &sub;

        // The series stops itself only after the body ran, so a throwing
        // body still counts as a firing.
        state->handle = scheduler_.submit_interval(
            [self = shared_from_this(), state, entry, body = std::move(body)] {
                ++state->fired;
                bool last = entry->repeat && state->fired >= *entry->repeat;
                if (last) {
                    self->scheduler_.cancel(state->handle);
                }
                body();
            },
            sub.period);
    }

    Scheduler::Action make_action(const Submission& sub, QueueKind queue) {
        const Submission* entry = &sub;
        return [self = shared_from_this(), entry, queue] {
            if (self->labels_) {
                self->labels_->push_back({self->scheduler_.time(), queue, entry->label});
            }
            self->submit_all(entry->then);
            if (entry->throws) {
                throw std::runtime_error("scenario callback '" + entry->label + "' threw");
            }
        };
    }

    Scheduler& scheduler_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    ScenarioData scenario_;
    LabelLog* labels_;
};

} // anonymous namespace

void apply_options(Scheduler& scheduler, const ScenarioOptions& options) {
    SchedulerOptions merged = scheduler.options();
    if (options.worker_pool_capacity) {
        merged.worker_pool_capacity = *options.worker_pool_capacity;
    }
    if (options.livelock_guard) {
        merged.livelock_guard = *options.livelock_guard;
    }
    scheduler.configure(merged);
}

void inject_scenario(Scheduler& scheduler, const ScenarioData& scenario, LabelLog* labels) {
    apply_options(scheduler, scenario.options);

    auto injector = std::make_shared<Injector>(scheduler, scenario, labels);
    injector->inject();
}

} // namespace loopsim::io
