#include "allocwatch/monitor/monitor_actor.hpp"
#include "allocwatch/monitor/status_converter.hpp"
#include <caf/atom.hpp>
#include <caf/send.hpp>
#include <string>

namespace allocwatch {
namespace monitor {

int ExitStatus::for_result(const CheckResult& result) {
    switch (result.status) {
        case CheckStatus::active:
            return active;
        case CheckStatus::idle:
            return idle;
        case CheckStatus::cancelled:
            return cancelled;
        case CheckStatus::error:
            break;
    }

    switch (result.error_code) {
        case ErrorCode::no_workers_available:
            return no_workers;
        case ErrorCode::backend_unavailable:
            return backend_unavailable;
        case ErrorCode::cancelled_by_user:
            return cancelled;
        case ErrorCode::invalid_input:
        case ErrorCode::invalid_job_spec:
        case ErrorCode::unsupported_backend:
            return config_error;
        default:
            return internal_error;
    }
}

int ExitStatus::for_result(const CheckResult& result, const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        return cancelled;
    }
    return for_result(result);
}

MonitorActorState::MonitorActorState(caf::event_based_actor* self, MonitorSettings settings, MonitorRuntime runtime)
    : self_(self),
      settings_(std::move(settings)),
      runtime_(std::move(runtime)),
      monitor_(*runtime_.backend, runtime_.observability, settings_.options) {
    runtime_.observability->log_info("MonitorActor initialized", settings_.job.job_name, "", {
        {"backend", runtime_.backend->backend_type()},
        {"sleep_ms", std::to_string(settings_.sleep.count())},
        {"max_wait_attempts", std::to_string(settings_.options.max_wait_attempts)},
        {"backend_failure_limit", std::to_string(settings_.backend_failure_limit)}
    });
}

caf::behavior MonitorActorState::make_behavior() {
    return {
        [this](caf::atom_value atom) {
            if (atom != caf::atom("tick")) {
                return;
            }
            run_check();
        }
    };
}

void MonitorActorState::run_check() {
    ++checks_;
    std::string check_id = std::to_string(checks_);
    const auto& job_name = settings_.job.job_name;

    CheckResult result;
    try {
        result = monitor_.check_status(settings_.job, settings_.sleep, *runtime_.cancel, check_id);
    } catch (const std::exception& e) {
        runtime_.observability->log_error("Monitor: unexpected failure during status check", job_name, check_id, {
            {"error", e.what()}
        });
        finish(ExitStatus::internal_error);
        return;
    }

    switch (result.status) {
        case CheckStatus::active:
            consecutive_backend_failures_ = 0;
            runtime_.observability->log_info("Monitor: work is still active, keeping the allocation alive",
                                             job_name, check_id, {
                {"total_jobs", std::to_string(result.total_jobs)},
                {"total_consumers", std::to_string(result.total_consumers)}
            });
            schedule_next_check();
            return;

        case CheckStatus::idle:
            runtime_.observability->log_info("Monitor: no jobs queued and no workers processing, allocation can end",
                                             job_name, check_id);
            finish(ExitStatus::idle);
            return;

        case CheckStatus::cancelled:
            runtime_.observability->log_warn("Monitor: cancelled by shutdown request", job_name, check_id);
            finish(ExitStatus::cancelled);
            return;

        case CheckStatus::error:
            break;
    }

    if (result.error_code == ErrorCode::backend_unavailable) {
        ++consecutive_backend_failures_;
        if (consecutive_backend_failures_ <= settings_.backend_failure_limit) {
            runtime_.observability->log_warn("Monitor: task queue backend unreachable, retrying on next check",
                                             job_name, check_id, {
                {"consecutive_failures", std::to_string(consecutive_backend_failures_)},
                {"backend_failure_limit", std::to_string(settings_.backend_failure_limit)},
                {"error", result.error_message}
            });
            schedule_next_check();
            return;
        }
        runtime_.observability->log_error("Monitor: task queue backend unreachable, giving up",
                                          job_name, check_id, {
            {"consecutive_failures", std::to_string(consecutive_backend_failures_)},
            {"error", result.error_message}
        });
        finish(ExitStatus::backend_unavailable);
        return;
    }

    if (result.error_code == ErrorCode::no_workers_available) {
        runtime_.observability->log_error("Monitor: workers never started, stopping the monitor",
                                          job_name, check_id, {
            {"wait_attempts", std::to_string(result.wait_attempts)},
            {"expected_workers", std::to_string(settings_.job.expected_worker_names.size())}
        });
    }
    finish(ExitStatus::for_result(result));
}

void MonitorActorState::schedule_next_check() {
    if (runtime_.cancel->is_cancelled()) {
        finish(ExitStatus::cancelled);
        return;
    }
    self_->delayed_send(self_, settings_.sleep, caf::atom("tick"));
}

void MonitorActorState::finish(int exit_status) {
    // A shutdown signal may land while a check is still in flight
    if (runtime_.cancel->is_cancelled()) {
        exit_status = ExitStatus::cancelled;
    }
    runtime_.exit_status->store(exit_status);
    runtime_.observability->log_info("MonitorActor stopping", settings_.job.job_name, "", {
        {"exit_status", std::to_string(exit_status)},
        {"checks_run", std::to_string(checks_)}
    });
    self_->quit();
}

} // namespace monitor
} // namespace allocwatch
