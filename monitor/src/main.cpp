#include <iostream>
#include <caf/actor_system.hpp>
#include <caf/actor_system_config.hpp>
#include <caf/atom.hpp>
#include <caf/send.hpp>
#include "allocwatch/monitor/core.hpp"
#include "allocwatch/monitor/job_spec.hpp"
#include "allocwatch/monitor/liveness_monitor.hpp"
#include "allocwatch/monitor/monitor_actor.hpp"
#include "allocwatch/monitor/observability.hpp"
#include "allocwatch/monitor/status_converter.hpp"
#include "allocwatch/monitor/task_queue_backend.hpp"
#include <atomic>
#include <csignal>
#include <string>
#include <ctime>
#include <functional>
#include <thread>
#include <unistd.h>

using namespace allocwatch::monitor;

class MonitorAppConfig : public caf::actor_system_config {
public:
    MonitorAppConfig() {
        opt_group{custom_options_, "global"}
            .add(monitor_config.job_spec_path, "job-spec", "Path to the job specification JSON")
            .add(monitor_config.steps, "steps", "Comma-separated steps whose queues are counted (default: all)")
            .add(monitor_config.backend, "backend", "Task queue backend: http | snapshot")
            .add(monitor_config.backend_url, "backend-url", "Base URL of the queue service status API")
            .add(monitor_config.snapshot_path, "snapshot-path", "Status document for the snapshot backend")
            .add(monitor_config.connect_timeout_ms, "connect-timeout-ms", "HTTP connect timeout (ms)")
            .add(monitor_config.request_timeout_ms, "request-timeout-ms", "HTTP total request timeout (ms)")
            .add(monitor_config.sleep_seconds, "sleep", "Seconds between checks and between worker polls")
            .add(monitor_config.max_wait_attempts, "max-wait-attempts", "Worker polls before giving up")
            .add(monitor_config.backend_failure_limit, "backend-failure-limit",
                 "Consecutive backend failures tolerated between checks")
            .add(monitor_config.filter_jobs_to_spec, "filter-jobs-to-spec",
                 "Count jobs only on the job's own queues")
            .add(monitor_config.count_all_consumers, "count-all-consumers",
                 "Count workers on every queue, not only the job's")
            .add(monitor_config.once, "once", "Run a single check, print it as JSON and exit")
            .add(monitor_config.metrics_endpoint, "metrics-endpoint", "Prometheus endpoint (host:port)");
    }

    MonitorConfig monitor_config;
};

// Turns SIGINT/SIGTERM into a callback on a dedicated thread, where locking
// and messaging are safe. block_signals() must run before any other thread starts.
class SignalWatcher {
public:
    explicit SignalWatcher(std::function<void(int)> on_signal)
        : on_signal_(std::move(on_signal)), signals_(shutdown_signals()) {
        thread_ = std::thread(&SignalWatcher::run, this);
    }

    static void block_signals() {
        sigset_t signals = shutdown_signals();
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    }

    ~SignalWatcher() {
        running_ = false;
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    static sigset_t shutdown_signals() {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        return signals;
    }

    void run() {
        timespec timeout{0, 200 * 1000 * 1000};
        while (running_) {
            int signal = sigtimedwait(&signals_, nullptr, &timeout);
            if (signal > 0) {
                on_signal_(signal);
                return;
            }
        }
    }

    std::function<void(int)> on_signal_;
    sigset_t signals_;
    std::atomic<bool> running_{true};
    std::thread thread_;
};

static MonitorOptions make_monitor_options(const MonitorConfig& config) {
    MonitorOptions options;
    options.max_wait_attempts = config.max_wait_attempts;
    options.aggregation.restrict_jobs_to_relevant = config.filter_jobs_to_spec;
    options.aggregation.restrict_consumers_to_relevant = !config.count_all_consumers;
    return options;
}

static int run_once(const MonitorConfig& config, const JobSpecView& job,
                    TaskQueueBackend& backend, const std::shared_ptr<Observability>& observability) {
    auto cancel = std::make_shared<CancellationToken>();
    SignalWatcher watcher([cancel, observability](int signal) {
        observability->log_warn("Shutdown signal received", "", "", {{"signal", std::to_string(signal)}});
        cancel->cancel();
    });

    LivenessMonitor monitor(backend, observability, make_monitor_options(config));
    CheckResult result = monitor.check_status(job, std::chrono::seconds(config.sleep_seconds), *cancel, "once");

    std::cout << StatusConverter::to_json(result, job.job_name).dump() << std::endl;
    return ExitStatus::for_result(result, *cancel);
}

static int run_loop(caf::actor_system& system, const MonitorConfig& config, const JobSpecView& job,
                    const std::shared_ptr<TaskQueueBackend>& backend,
                    const std::shared_ptr<Observability>& observability) {
    MonitorRuntime runtime;
    runtime.backend = backend;
    runtime.observability = observability;
    runtime.cancel = std::make_shared<CancellationToken>();
    runtime.exit_status = std::make_shared<std::atomic<int>>(ExitStatus::internal_error);

    MonitorSettings settings;
    settings.job = job;
    settings.sleep = std::chrono::seconds(config.sleep_seconds);
    settings.options = make_monitor_options(config);
    settings.backend_failure_limit = config.backend_failure_limit;

    // Blocking checks run on their own thread, not on the scheduler
    auto monitor_actor = system.spawn<MonitorActor, caf::detached>(settings, runtime);

    auto cancel = runtime.cancel;
    auto exit_status = runtime.exit_status;
    SignalWatcher watcher([cancel, exit_status, monitor_actor, observability](int signal) {
        observability->log_warn("Shutdown signal received", "", "", {{"signal", std::to_string(signal)}});
        exit_status->store(ExitStatus::cancelled);
        cancel->cancel();
        caf::anon_send_exit(monitor_actor, caf::exit_reason::user_shutdown);
    });

    caf::anon_send(monitor_actor, caf::atom("tick"));
    system.await_all_actors_done();

    return exit_status->load();
}

int caf_main(caf::actor_system& system, const MonitorAppConfig& app_config) {
    const MonitorConfig& config = app_config.monitor_config;
    auto observability = std::make_shared<Observability>("allocwatch_" + std::to_string(getpid()));

    try {
        if (config.job_spec_path.empty()) {
            observability->log_error("Missing required option --job-spec", "", "", {
                {"error_code", StatusConverter::error_code_to_string(ErrorCode::invalid_input)}
            });
            return ExitStatus::config_error;
        }
        std::string invalid = config.validation_error();
        if (!invalid.empty()) {
            observability->log_error("Invalid monitor timing options", "", "", {
                {"error_code", StatusConverter::error_code_to_string(ErrorCode::invalid_input)},
                {"error", invalid},
                {"sleep", std::to_string(config.sleep_seconds)},
                {"max_wait_attempts", std::to_string(config.max_wait_attempts)},
                {"backend_failure_limit", std::to_string(config.backend_failure_limit)}
            });
            return ExitStatus::config_error;
        }

        auto spec = JobSpec::load(config.job_spec_path);
        if (!spec) {
            observability->log_error("Failed to load job specification", "", "", {
                {"error_code", StatusConverter::error_code_to_string(ErrorCode::invalid_job_spec)},
                {"path", config.job_spec_path},
                {"error", caf::to_string(spec.error())}
            });
            return ExitStatus::config_error;
        }

        auto job = spec->view(JobSpec::split_steps(config.steps));
        if (!job) {
            observability->log_error("Invalid step selection", spec->name(), "", {
                {"error_code", StatusConverter::error_code_to_string(ErrorCode::invalid_input)},
                {"steps", config.steps},
                {"error", caf::to_string(job.error())}
            });
            return ExitStatus::config_error;
        }

        auto backend = BackendFactory::with_builtin_backends().create(BackendSettings::from_config(config));
        if (!backend) {
            observability->log_error("Failed to create task queue backend", spec->name(), "", {
                {"error_code", StatusConverter::error_code_to_string(ErrorCode::unsupported_backend)},
                {"backend", config.backend},
                {"error", caf::to_string(backend.error())}
            });
            return ExitStatus::config_error;
        }

        if (!config.metrics_endpoint.empty()) {
            observability->start_metrics_endpoint(config.metrics_endpoint);
        }

        observability->log_info("Monitor starting", job->job_name, "", {
            {"backend", config.backend},
            {"relevant_queues", std::to_string(job->relevant_queues.size())},
            {"expected_workers", std::to_string(job->expected_worker_names.size())},
            {"sleep", std::to_string(config.sleep_seconds)},
            {"once", config.once ? "true" : "false"}
        });

        int status = config.once
            ? run_once(config, *job, **backend, observability)
            : run_loop(system, config, *job, *backend, observability);

        observability->log_info("Monitor shutting down", job->job_name, "", {
            {"exit_status", std::to_string(status)}
        });
        return status;

    } catch (const std::exception& e) {
        observability->log_error("Monitor fatal error", "", "", {
            {"error_code", StatusConverter::error_code_to_string(ErrorCode::internal_error)},
            {"error", e.what()}
        });
        return ExitStatus::internal_error;
    }
}

int main(int argc, char** argv) {
    MonitorAppConfig config;

    // Parse command line arguments
    if (auto err = config.parse(argc, argv)) {
        // Use stderr for argument parsing errors (before observability is initialized)
        std::cerr << "Failed to parse arguments: " << caf::to_string(err) << std::endl;
        return ExitStatus::config_error;
    }
    if (config.cli_helptext_printed) {
        return 0;
    }

    // Scheduler threads inherit the mask, so only the watcher sees shutdown signals
    SignalWatcher::block_signals();

    // Run the actor system
    caf::actor_system system(config);
    return caf_main(system, config);
}
