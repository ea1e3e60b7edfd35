#include "allocwatch/monitor/liveness_monitor.hpp"
#include "allocwatch/monitor/status_aggregator.hpp"
#include "allocwatch/monitor/status_converter.hpp"
#include <caf/error.hpp>
#include <algorithm>
#include <set>

namespace allocwatch {
namespace monitor {

namespace {

template <class Container>
std::string join(const Container& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ",";
        }
        out += item;
    }
    return out;
}

std::string describe_queues(const QueueStatusMap& statuses) {
    std::string out;
    for (const auto& [name, status] : statuses) {
        if (!out.empty()) {
            out += ",";
        }
        out += name + ":" + std::to_string(status.pending_jobs) + "/" + std::to_string(status.consumer_count);
    }
    return out;
}

} // namespace

LivenessMonitor::LivenessMonitor(TaskQueueBackend& backend,
                                 std::shared_ptr<Observability> observability,
                                 MonitorOptions options)
    : backend_(backend), observability_(std::move(observability)), options_(options) {
    if (!observability_) {
        observability_ = std::make_shared<Observability>("liveness_monitor");
    }
}

CheckResult LivenessMonitor::check_status(const JobSpecView& job,
                                          std::chrono::milliseconds sleep,
                                          const CancellationToken& cancel,
                                          const std::string& check_id) {
    auto start_time = std::chrono::steady_clock::now();

    CheckResult result = decide(job, sleep, cancel, check_id);

    auto end_time = std::chrono::steady_clock::now();
    result.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

    observability_->record_check(result, job.job_name);

    std::unordered_map<std::string, std::string> context = {
        {"status", StatusConverter::status_to_string(result.status)},
        {"total_jobs", std::to_string(result.total_jobs)},
        {"total_consumers", std::to_string(result.total_consumers)},
        {"latency_ms", std::to_string(result.latency_ms)}
    };
    if (result.is_error()) {
        context["error_code"] = StatusConverter::error_code_to_string(result.error_code);
        context["error"] = result.error_message;
        observability_->log_error("Monitor: status check failed", job.job_name, check_id, context);
    } else {
        observability_->log_debug("Monitor: status check finished", job.job_name, check_id, context);
    }
    return result;
}

CheckResult LivenessMonitor::decide(const JobSpecView& job,
                                    std::chrono::milliseconds sleep,
                                    const CancellationToken& cancel,
                                    const std::string& check_id) {
    const auto relevant = StatusAggregator::to_queue_set(job.relevant_queues);

    auto queue_status = backend_.query_queue_status(job.queues_for_status());
    if (!queue_status) {
        return backend_failure("query_queue_status", queue_status.error(), job, check_id);
    }
    observability_->record_queue_status(*queue_status);
    observability_->log_debug("Monitor: queue status", job.job_name, check_id, {
        {"queues", describe_queues(*queue_status)}
    });

    int64_t total_jobs = options_.aggregation.restrict_jobs_to_relevant
        ? StatusAggregator::aggregate_jobs(*queue_status, relevant)
        : StatusAggregator::aggregate_jobs(*queue_status);

    auto active_queues = backend_.query_active_queues();
    if (!active_queues) {
        return backend_failure("query_active_queues", active_queues.error(), job, check_id, total_jobs);
    }

    std::set<std::string> consumers = options_.aggregation.restrict_consumers_to_relevant
        ? StatusAggregator::collect_consumers(active_queues->queues, relevant)
        : StatusAggregator::collect_all_consumers(active_queues->queues);
    int64_t total_consumers = static_cast<int64_t>(consumers.size());

    observability_->log_debug("Monitor: consumers found", job.job_name, check_id, {
        {"consumers", join(consumers)},
        {"responding_workers", join(active_queues->responding_workers)}
    });
    observability_->log_info("Monitor: found " + std::to_string(total_jobs) + " jobs in queues and "
                             + std::to_string(total_consumers) + " workers alive",
                             job.job_name, check_id);

    int32_t wait_attempts = 0;
    if (total_consumers == 0) {
        WaitResult wait = wait_for_workers(job, sleep, cancel, check_id);
        wait_attempts = wait.attempts;
        if (wait.error_code == ErrorCode::cancelled_by_user) {
            return CheckResult::cancelled_result(total_jobs, total_consumers, wait_attempts);
        }
        if (!wait.workers_found) {
            return CheckResult::error_result(wait.error_code, wait.error_message,
                                             total_jobs, total_consumers, wait_attempts);
        }
    }

    // A non-empty backlog keeps the allocation alive whatever the consumer count
    if (total_jobs > 0) {
        return CheckResult::active(total_jobs, total_consumers, wait_attempts);
    }

    // Nothing queued: only a worker still executing a task keeps the job active
    auto processing = backend_.query_workers_processing(job.relevant_queues);
    if (!processing) {
        return backend_failure("query_workers_processing", processing.error(), job, check_id,
                               total_jobs, total_consumers, wait_attempts);
    }

    observability_->log_debug("Monitor: workers processing", job.job_name, check_id, {
        {"processing", *processing ? "true" : "false"}
    });

    if (*processing) {
        return CheckResult::active(total_jobs, total_consumers, wait_attempts);
    }
    return CheckResult::idle(total_jobs, total_consumers, wait_attempts);
}

WaitResult LivenessMonitor::wait_for_workers(const JobSpecView& job,
                                             std::chrono::milliseconds sleep,
                                             const CancellationToken& cancel,
                                             const std::string& check_id) {
    observability_->log_info("Monitor: checking for the following workers", job.job_name, check_id, {
        {"workers", join(job.expected_worker_names)}
    });

    RetryPolicy::Config policy_config;
    policy_config.interval = sleep;
    policy_config.max_attempts = options_.max_wait_attempts;
    Backoff backoff(RetryPolicy(policy_config), cancel);

    WaitResult result;
    while (true) {
        if (backoff.is_cancelled()) {
            result.attempts = backoff.attempts();
            result.error_code = ErrorCode::cancelled_by_user;
            result.error_message = "wait for workers cancelled";
            return result;
        }

        auto workers = backend_.query_worker_identifiers();
        if (!workers) {
            observability_->record_backend_error("query_worker_identifiers");
            result.attempts = backoff.attempts();
            result.error_code = ErrorCode::backend_unavailable;
            result.error_message = "query_worker_identifiers: " + caf::to_string(workers.error());
            return result;
        }

        observability_->log_info("Monitor: checking for workers", job.job_name, check_id, {
            {"running_workers", join(*workers)},
            {"attempt", std::to_string(backoff.attempts() + 1)}
        });

        if (any_expected_worker(job.expected_worker_names, *workers)) {
            result.workers_found = true;
            result.attempts = backoff.attempts();
            return result;
        }

        observability_->record_wait_attempt(job.job_name);
        switch (backoff.record_failure()) {
            case BackoffStep::retry:
                continue;
            case BackoffStep::cancelled:
                result.attempts = backoff.attempts();
                result.error_code = ErrorCode::cancelled_by_user;
                result.error_message = "wait for workers cancelled";
                return result;
            case BackoffStep::exhausted:
                result.attempts = backoff.attempts();
                result.error_code = ErrorCode::no_workers_available;
                result.error_message = "Monitor: no workers available to process the non-empty queue after "
                                       + std::to_string(result.attempts) + " attempts";
                return result;
        }
    }
}

bool LivenessMonitor::any_expected_worker(const std::vector<std::string>& expected_worker_names,
                                          const std::vector<std::string>& worker_identifiers) {
    return std::any_of(expected_worker_names.begin(), expected_worker_names.end(),
                       [&](const std::string& expected) {
                           return std::any_of(worker_identifiers.begin(), worker_identifiers.end(),
                                              [&](const std::string& reported) {
                                                  return reported.find(expected) != std::string::npos;
                                              });
                       });
}

CheckResult LivenessMonitor::backend_failure(const std::string& operation, const caf::error& err,
                                             const JobSpecView& job, const std::string& check_id,
                                             int64_t total_jobs, int64_t total_consumers,
                                             int32_t wait_attempts) {
    observability_->record_backend_error(operation);
    observability_->log_warn("Monitor: backend round trip failed", job.job_name, check_id, {
        {"operation", operation},
        {"backend", backend_.backend_type()},
        {"error", caf::to_string(err)}
    });
    return CheckResult::error_result(ErrorCode::backend_unavailable,
                                     operation + ": " + caf::to_string(err),
                                     total_jobs, total_consumers, wait_attempts);
}

} // namespace monitor
} // namespace allocwatch
