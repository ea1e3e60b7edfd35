#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace allocwatch {
namespace monitor {

// Forward declarations
class TaskQueueBackend;
class LivenessMonitor;
class Observability;

// Per-queue counters reported by the backend. Produced fresh on every poll.
struct QueueStatus {
    std::string name;
    int64_t pending_jobs = 0;
    int64_t consumer_count = 0;
};

// Keyed by queue name; ordered so logs and metrics are stable between polls
using QueueStatusMap = std::map<std::string, QueueStatus>;

// Queue name -> worker identifiers ("<name>@<host>") subscribed to it
using ActiveQueueMap = std::map<std::string, std::set<std::string>>;

struct ActiveQueuesSnapshot {
    ActiveQueueMap queues;
    std::vector<std::string> responding_workers;  // auxiliary metadata
};

// Read-only view of the job being monitored. Owned by the caller.
struct JobSpecView {
    std::string job_name;
    std::vector<std::string> relevant_queues;       // every queue of the job, in declaration order
    std::vector<std::string> status_queues;         // queues whose job counts are queried
    std::vector<std::string> expected_worker_names;

    const std::vector<std::string>& queues_for_status() const {
        return status_queues.empty() ? relevant_queues : status_queues;
    }
};

enum class CheckStatus {
    active,    // work is queued or a worker is mid-task
    idle,      // nothing queued and nobody working
    error,     // backend unreachable or no workers ever appeared
    cancelled  // interrupted by a shutdown request
};

// Machine-readable error codes for programmatic error handling
enum class ErrorCode {
    none = 0,
    // Validation errors (1xxx)
    invalid_input = 1001,
    invalid_job_spec = 1002,
    unsupported_backend = 1003,
    // Monitoring errors (2xxx)
    no_workers_available = 2001,
    // Backend errors (3xxx)
    backend_unavailable = 3001,
    // System errors (4xxx)
    internal_error = 4001,
    // Cancellation (5xxx)
    cancelled_by_user = 5001
};

// Outcome of a single status check
struct CheckResult {
    CheckStatus status = CheckStatus::idle;
    ErrorCode error_code = ErrorCode::none;
    std::string error_message;
    int64_t total_jobs = 0;
    int64_t total_consumers = 0;
    int32_t wait_attempts = 0;
    int64_t latency_ms = 0;

    bool is_active() const { return status == CheckStatus::active; }
    bool is_idle() const { return status == CheckStatus::idle; }
    bool is_error() const { return status == CheckStatus::error; }
    bool is_cancelled() const { return status == CheckStatus::cancelled; }

    static CheckResult active(int64_t total_jobs, int64_t total_consumers, int32_t wait_attempts = 0) {
        CheckResult result;
        result.status = CheckStatus::active;
        result.total_jobs = total_jobs;
        result.total_consumers = total_consumers;
        result.wait_attempts = wait_attempts;
        return result;
    }

    static CheckResult idle(int64_t total_jobs, int64_t total_consumers, int32_t wait_attempts = 0) {
        CheckResult result;
        result.status = CheckStatus::idle;
        result.total_jobs = total_jobs;
        result.total_consumers = total_consumers;
        result.wait_attempts = wait_attempts;
        return result;
    }

    static CheckResult error_result(ErrorCode code, const std::string& message,
                                    int64_t total_jobs = 0, int64_t total_consumers = 0,
                                    int32_t wait_attempts = 0) {
        CheckResult result;
        result.status = CheckStatus::error;
        result.error_code = code;
        result.error_message = message;
        result.total_jobs = total_jobs;
        result.total_consumers = total_consumers;
        result.wait_attempts = wait_attempts;
        return result;
    }

    static CheckResult cancelled_result(int64_t total_jobs = 0, int64_t total_consumers = 0,
                                        int32_t wait_attempts = 0) {
        CheckResult result;
        result.status = CheckStatus::cancelled;
        result.error_code = ErrorCode::cancelled_by_user;
        result.error_message = "check cancelled";
        result.total_jobs = total_jobs;
        result.total_consumers = total_consumers;
        result.wait_attempts = wait_attempts;
        return result;
    }
};

// By default total_jobs sums every queue returned by the status query while
// consumers only count on the job's own queues.
struct AggregationOptions {
    bool restrict_jobs_to_relevant = false;
    bool restrict_consumers_to_relevant = true;
};

struct MonitorOptions {
    int32_t max_wait_attempts = 10;
    AggregationOptions aggregation;
};

// Process-level configuration, filled from the command line or INI file
struct MonitorConfig {
    std::string job_spec_path;
    std::string steps = "all";
    std::string backend = "http";
    std::string backend_url = "http://localhost:15672";
    std::string snapshot_path;
    int64_t connect_timeout_ms = 5000;
    int64_t request_timeout_ms = 10000;
    int64_t sleep_seconds = 60;
    int32_t max_wait_attempts = 10;
    int32_t backend_failure_limit = 3;
    bool filter_jobs_to_spec = false;
    bool count_all_consumers = false;
    bool once = false;
    std::string metrics_endpoint;

    // Empty when the timing options are usable. A zero sleep would poll the
    // broker in a tight loop, so at least one second is required.
    std::string validation_error() const {
        if (sleep_seconds < 1) {
            return "sleep must be at least 1 second";
        }
        if (max_wait_attempts < 1) {
            return "max-wait-attempts must be at least 1";
        }
        if (backend_failure_limit < 0) {
            return "backend-failure-limit must not be negative";
        }
        if (connect_timeout_ms < 1 || request_timeout_ms < 1) {
            return "HTTP timeouts must be positive";
        }
        return "";
    }

    template <class Inspector>
    friend typename Inspector::result_type inspect(Inspector& f, MonitorConfig& config) {
        return f(config.job_spec_path, config.steps, config.backend, config.backend_url,
                 config.snapshot_path, config.connect_timeout_ms, config.request_timeout_ms,
                 config.sleep_seconds, config.max_wait_attempts, config.backend_failure_limit,
                 config.filter_jobs_to_spec, config.count_all_consumers, config.once,
                 config.metrics_endpoint);
    }
};

} // namespace monitor
} // namespace allocwatch
