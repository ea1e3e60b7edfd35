#pragma once

#include "allocwatch/monitor/core.hpp"
#include "allocwatch/monitor/liveness_monitor.hpp"
#include "allocwatch/monitor/observability.hpp"
#include "allocwatch/monitor/retry_policy.hpp"
#include "allocwatch/monitor/task_queue_backend.hpp"
#include <caf/actor_system.hpp>
#include <caf/behavior.hpp>
#include <caf/event_based_actor.hpp>
#include <atomic>
#include <chrono>
#include <memory>

namespace allocwatch {
namespace monitor {

// Process exit statuses
struct ExitStatus {
    static constexpr int idle = 0;
    static constexpr int active = 1;              // single-shot mode only
    static constexpr int no_workers = 2;
    static constexpr int backend_unavailable = 3;
    static constexpr int config_error = 64;
    static constexpr int internal_error = 70;
    static constexpr int cancelled = 130;

    static int for_result(const CheckResult& result);

    // A fired token wins over whatever the interrupted check concluded
    static int for_result(const CheckResult& result, const CancellationToken& cancel);
};

struct MonitorSettings {
    JobSpecView job;
    std::chrono::milliseconds sleep{60000};
    MonitorOptions options;
    int32_t backend_failure_limit = 3;  // consecutive failed checks tolerated
};

// Shared with main, which owns the backend and outlives the actor
struct MonitorRuntime {
    std::shared_ptr<TaskQueueBackend> backend;
    std::shared_ptr<Observability> observability;
    std::shared_ptr<CancellationToken> cancel;
    std::shared_ptr<std::atomic<int>> exit_status;
};

// Runs a check on every "tick" and schedules the next one while work is
// active. Spawn detached: a check may block for up to max_wait_attempts sleeps.
class MonitorActorState {
public:
    MonitorActorState(caf::event_based_actor* self, MonitorSettings settings, MonitorRuntime runtime);

    caf::behavior make_behavior();

private:
    caf::event_based_actor* self_;
    MonitorSettings settings_;
    MonitorRuntime runtime_;
    LivenessMonitor monitor_;
    int64_t checks_ = 0;
    int32_t consecutive_backend_failures_ = 0;

    void run_check();
    void schedule_next_check();
    void finish(int exit_status);
};

class MonitorActor : public caf::event_based_actor {
public:
    MonitorActor(caf::actor_config& cfg, MonitorSettings settings, MonitorRuntime runtime)
        : caf::event_based_actor(cfg),
          state_(this, std::move(settings), std::move(runtime)) {}

    caf::behavior make_behavior() override {
        return state_.make_behavior();
    }

private:
    MonitorActorState state_;
};

} // namespace monitor
} // namespace allocwatch
