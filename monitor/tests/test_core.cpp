#include <iostream>
#include <cassert>
#include <string>
#include "allocwatch/monitor/core.hpp"
#include "allocwatch/monitor/monitor_actor.hpp"
#include "allocwatch/monitor/retry_policy.hpp"
#include "allocwatch/monitor/status_converter.hpp"

using namespace allocwatch::monitor;

void test_check_result_factories() {
    std::cout << "Testing CheckResult factories..." << std::endl;

    auto active = CheckResult::active(3, 2, 1);
    assert(active.is_active());
    assert(active.error_code == ErrorCode::none);
    assert(active.total_jobs == 3);
    assert(active.total_consumers == 2);
    assert(active.wait_attempts == 1);

    auto idle = CheckResult::idle(0, 1);
    assert(idle.is_idle());
    assert(idle.error_code == ErrorCode::none);
    assert(idle.wait_attempts == 0);

    auto error = CheckResult::error_result(ErrorCode::backend_unavailable, "query_queue_status: refused", 4);
    assert(error.is_error());
    assert(error.error_code == ErrorCode::backend_unavailable);
    assert(error.error_message == "query_queue_status: refused");
    assert(error.total_jobs == 4);
    assert(error.total_consumers == 0);

    auto cancelled = CheckResult::cancelled_result(1, 0, 2);
    assert(cancelled.is_cancelled());
    assert(cancelled.error_code == ErrorCode::cancelled_by_user);
    assert(!cancelled.error_message.empty());
    assert(cancelled.wait_attempts == 2);

    std::cout << "✓ CheckResult factories test passed" << std::endl;
}

void test_default_check_result() {
    std::cout << "Testing default CheckResult..." << std::endl;

    CheckResult result;
    assert(result.is_idle());
    assert(result.error_code == ErrorCode::none);
    assert(result.latency_ms == 0);

    std::cout << "✓ Default CheckResult test passed" << std::endl;
}

void test_error_code_values() {
    std::cout << "Testing error code bands..." << std::endl;

    assert(static_cast<int>(ErrorCode::invalid_input) == 1001);
    assert(static_cast<int>(ErrorCode::invalid_job_spec) == 1002);
    assert(static_cast<int>(ErrorCode::unsupported_backend) == 1003);
    assert(static_cast<int>(ErrorCode::no_workers_available) == 2001);
    assert(static_cast<int>(ErrorCode::backend_unavailable) == 3001);
    assert(static_cast<int>(ErrorCode::internal_error) == 4001);
    assert(static_cast<int>(ErrorCode::cancelled_by_user) == 5001);

    std::cout << "✓ Error code bands test passed" << std::endl;
}

void test_status_strings() {
    std::cout << "Testing status string conversion..." << std::endl;

    assert(StatusConverter::status_to_string(CheckStatus::active) == "active");
    assert(StatusConverter::status_to_string(CheckStatus::idle) == "idle");
    assert(StatusConverter::status_to_string(CheckStatus::error) == "error");
    assert(StatusConverter::status_to_string(CheckStatus::cancelled) == "cancelled");

    assert(StatusConverter::string_to_status("active") == CheckStatus::active);
    assert(StatusConverter::string_to_status("idle") == CheckStatus::idle);
    assert(StatusConverter::string_to_status("cancelled") == CheckStatus::cancelled);
    assert(StatusConverter::string_to_status("bogus") == CheckStatus::error);

    assert(StatusConverter::error_code_to_string(ErrorCode::none) == "NONE");
    assert(StatusConverter::error_code_to_string(ErrorCode::no_workers_available) == "NO_WORKERS_AVAILABLE");
    assert(StatusConverter::error_code_to_string(ErrorCode::backend_unavailable) == "BACKEND_UNAVAILABLE");
    assert(StatusConverter::error_code_to_string(ErrorCode::invalid_job_spec) == "INVALID_JOB_SPEC");
    assert(StatusConverter::error_code_to_string(ErrorCode::cancelled_by_user) == "CANCELLED_BY_USER");

    std::cout << "✓ Status strings test passed" << std::endl;
}

void test_validate_result() {
    std::cout << "Testing result validation..." << std::endl;

    assert(StatusConverter::validate_result(CheckResult::active(1, 1)));
    assert(StatusConverter::validate_result(CheckResult::idle(0, 1)));
    assert(StatusConverter::validate_result(CheckResult::error_result(ErrorCode::no_workers_available, "none")));
    assert(StatusConverter::validate_result(CheckResult::cancelled_result()));

    CheckResult error_without_code;
    error_without_code.status = CheckStatus::error;
    assert(!StatusConverter::validate_result(error_without_code));

    CheckResult active_with_code = CheckResult::active(1, 1);
    active_with_code.error_code = ErrorCode::internal_error;
    assert(!StatusConverter::validate_result(active_with_code));

    CheckResult negative_jobs = CheckResult::idle(-1, 0);
    assert(!StatusConverter::validate_result(negative_jobs));

    std::cout << "✓ Result validation test passed" << std::endl;
}

void test_result_json_report() {
    std::cout << "Testing single-shot JSON report..." << std::endl;

    auto active = StatusConverter::to_json(CheckResult::active(5, 2), "study");
    assert(active["job"] == "study");
    assert(active["status"] == "active");
    assert(active["active"] == true);
    assert(active["total_jobs"] == 5);
    assert(active["total_consumers"] == 2);
    assert(!active.contains("error_code"));

    auto error = StatusConverter::to_json(
        CheckResult::error_result(ErrorCode::no_workers_available, "no workers", 5, 0, 10), "study");
    assert(error["status"] == "error");
    assert(error["active"] == false);
    assert(error["error_code"] == "NO_WORKERS_AVAILABLE");
    assert(error["error_message"] == "no workers");
    assert(error["wait_attempts"] == 10);

    std::cout << "✓ JSON report test passed" << std::endl;
}

void test_exit_status_mapping() {
    std::cout << "Testing exit status mapping..." << std::endl;

    assert(ExitStatus::for_result(CheckResult::idle(0, 1)) == 0);
    assert(ExitStatus::for_result(CheckResult::active(1, 1)) == 1);
    assert(ExitStatus::for_result(CheckResult::error_result(ErrorCode::no_workers_available, "")) == 2);
    assert(ExitStatus::for_result(CheckResult::error_result(ErrorCode::backend_unavailable, "")) == 3);
    assert(ExitStatus::for_result(CheckResult::error_result(ErrorCode::invalid_job_spec, "")) == 64);
    assert(ExitStatus::for_result(CheckResult::error_result(ErrorCode::internal_error, "")) == 70);
    assert(ExitStatus::for_result(CheckResult::cancelled_result()) == 130);

    std::cout << "✓ Exit status mapping test passed" << std::endl;
}

void test_exit_status_after_cancellation() {
    std::cout << "Testing a fired token overrides the check's exit status..." << std::endl;

    CancellationToken live;
    assert(ExitStatus::for_result(CheckResult::idle(0, 1), live) == ExitStatus::idle);
    assert(ExitStatus::for_result(CheckResult::active(1, 1), live) == ExitStatus::active);

    CancellationToken fired;
    fired.cancel();
    assert(ExitStatus::for_result(CheckResult::idle(0, 1), fired) == ExitStatus::cancelled);
    assert(ExitStatus::for_result(CheckResult::active(1, 1), fired) == ExitStatus::cancelled);
    assert(ExitStatus::for_result(
        CheckResult::error_result(ErrorCode::backend_unavailable, "down"), fired) == ExitStatus::cancelled);

    std::cout << "✓ Exit status after cancellation test passed" << std::endl;
}

void test_monitor_config_validation() {
    std::cout << "Testing MonitorConfig timing validation..." << std::endl;

    MonitorConfig config;
    assert(config.validation_error().empty());

    MonitorConfig zero_sleep;
    zero_sleep.sleep_seconds = 0;
    assert(zero_sleep.validation_error().find("sleep") != std::string::npos);

    MonitorConfig negative_sleep;
    negative_sleep.sleep_seconds = -5;
    assert(!negative_sleep.validation_error().empty());

    MonitorConfig no_attempts;
    no_attempts.max_wait_attempts = 0;
    assert(no_attempts.validation_error().find("max-wait-attempts") != std::string::npos);

    MonitorConfig negative_limit;
    negative_limit.backend_failure_limit = -1;
    assert(!negative_limit.validation_error().empty());

    MonitorConfig zero_limit;
    zero_limit.backend_failure_limit = 0;
    assert(zero_limit.validation_error().empty());

    MonitorConfig zero_timeout;
    zero_timeout.request_timeout_ms = 0;
    assert(!zero_timeout.validation_error().empty());

    std::cout << "✓ MonitorConfig validation test passed" << std::endl;
}

void test_monitor_config_defaults() {
    std::cout << "Testing MonitorConfig defaults..." << std::endl;

    MonitorConfig config;
    assert(config.steps == "all");
    assert(config.backend == "http");
    assert(config.sleep_seconds == 60);
    assert(config.max_wait_attempts == 10);
    assert(config.backend_failure_limit == 3);
    assert(!config.filter_jobs_to_spec);
    assert(!config.count_all_consumers);
    assert(!config.once);

    MonitorOptions options;
    assert(options.max_wait_attempts == 10);
    assert(!options.aggregation.restrict_jobs_to_relevant);
    assert(options.aggregation.restrict_consumers_to_relevant);

    std::cout << "✓ MonitorConfig defaults test passed" << std::endl;
}

void test_job_view_status_queue_fallback() {
    std::cout << "Testing JobSpecView status queue fallback..." << std::endl;

    JobSpecView job;
    job.relevant_queues = {"q1", "q2"};
    assert((job.queues_for_status() == std::vector<std::string>{"q1", "q2"}));

    job.status_queues = {"q2"};
    assert((job.queues_for_status() == std::vector<std::string>{"q2"}));

    std::cout << "✓ Status queue fallback test passed" << std::endl;
}

int main() {
    try {
        std::cout << "Running core tests..." << std::endl;
        std::cout << "===========================================" << std::endl;

        std::cout << "\n[Core Data Structures]" << std::endl;
        test_check_result_factories();
        test_default_check_result();
        test_error_code_values();
        test_monitor_config_defaults();
        test_monitor_config_validation();
        test_job_view_status_queue_fallback();

        std::cout << "\n[Conversion]" << std::endl;
        test_status_strings();
        test_validate_result();
        test_result_json_report();
        test_exit_status_mapping();
        test_exit_status_after_cancellation();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All core tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
