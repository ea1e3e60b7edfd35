#pragma once

#include "allocwatch/monitor/core.hpp"
#include "allocwatch/monitor/observability.hpp"
#include "allocwatch/monitor/retry_policy.hpp"
#include "allocwatch/monitor/task_queue_backend.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace allocwatch {
namespace monitor {

struct WaitResult {
    bool workers_found = false;
    int32_t attempts = 0;       // failed polls before the loop ended
    ErrorCode error_code = ErrorCode::none;
    std::string error_message;
};

/**
 * Decides whether the monitored job still has active work.
 *
 *   consumers == 0           -> wait for workers (fatal after max_wait_attempts polls)
 *   jobs > 0                 -> active
 *   jobs == 0                -> active iff a worker on a relevant queue is mid-task
 *
 * Holds no state between checks; the backend is borrowed, never owned.
 */
class LivenessMonitor {
public:
    LivenessMonitor(TaskQueueBackend& backend,
                    std::shared_ptr<Observability> observability,
                    MonitorOptions options = MonitorOptions());

    CheckResult check_status(const JobSpecView& job,
                             std::chrono::milliseconds sleep,
                             const CancellationToken& cancel,
                             const std::string& check_id = "");

    // Polls worker identifiers until an expected worker shows up
    WaitResult wait_for_workers(const JobSpecView& job,
                                std::chrono::milliseconds sleep,
                                const CancellationToken& cancel,
                                const std::string& check_id = "");

    // Expected names match reported "<name>@<host>" identifiers by substring
    static bool any_expected_worker(const std::vector<std::string>& expected_worker_names,
                                    const std::vector<std::string>& worker_identifiers);

private:
    TaskQueueBackend& backend_;
    std::shared_ptr<Observability> observability_;
    MonitorOptions options_;

    CheckResult decide(const JobSpecView& job,
                       std::chrono::milliseconds sleep,
                       const CancellationToken& cancel,
                       const std::string& check_id);
    CheckResult backend_failure(const std::string& operation, const caf::error& err,
                                const JobSpecView& job, const std::string& check_id,
                                int64_t total_jobs = 0, int64_t total_consumers = 0,
                                int32_t wait_attempts = 0);
};

} // namespace monitor
} // namespace allocwatch
