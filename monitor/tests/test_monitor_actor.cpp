#include <iostream>
#include <cassert>
#include <chrono>
#include <memory>
#include <thread>
#include <caf/actor_system.hpp>
#include <caf/actor_system_config.hpp>
#include <caf/atom.hpp>
#include <caf/send.hpp>
#include "allocwatch/monitor/monitor_actor.hpp"
#include "fake_backend.hpp"

using namespace allocwatch::monitor;
using namespace std::chrono_literals;

struct ActorRun {
    std::shared_ptr<FakeBackend> backend = std::make_shared<FakeBackend>();
    MonitorSettings settings;
    MonitorRuntime runtime;

    ActorRun() {
        settings.job = make_two_step_job();
        settings.sleep = 10ms;
        runtime.backend = backend;
        runtime.observability = std::make_shared<Observability>("test_actor");
        runtime.cancel = std::make_shared<CancellationToken>();
        runtime.exit_status = std::make_shared<std::atomic<int>>(ExitStatus::internal_error);
    }

    int run() {
        caf::actor_system_config cfg;
        caf::actor_system system{cfg};
        auto actor = system.spawn<MonitorActor, caf::detached>(settings, runtime);
        caf::anon_send(actor, caf::atom("tick"));
        system.await_all_actors_done();
        return runtime.exit_status->load();
    }
};

void test_idle_job_exits_zero() {
    std::cout << "Testing an idle job stops the monitor with status 0..." << std::endl;

    ActorRun run;
    run.backend->set_queue("q1", 0);
    run.backend->add_consumer("q1", "step1_worker@node01");

    int status = run.run();
    assert(status == ExitStatus::idle);
    assert(run.backend->queue_status_calls == 1);

    std::cout << "✓ Idle exit test passed" << std::endl;
}

void test_active_job_keeps_checking_until_idle() {
    std::cout << "Testing active checks reschedule until the job drains..." << std::endl;

    ActorRun run;
    run.backend->set_queue("q1", 0);
    run.backend->add_consumer("q1", "step1_worker@node01");
    run.backend->processing_sequence = {true, true, false};

    int status = run.run();
    assert(status == ExitStatus::idle);
    assert(run.backend->processing_calls == 3);
    assert(run.backend->queue_status_calls == 3);

    std::cout << "✓ Active loop test passed" << std::endl;
}

void test_missing_workers_exit_two() {
    std::cout << "Testing workers that never start stop the monitor with status 2..." << std::endl;

    ActorRun run;
    run.backend->set_queue("q1", 5);
    run.settings.options.max_wait_attempts = 2;

    int status = run.run();
    assert(status == ExitStatus::no_workers);
    assert(run.backend->worker_identifier_calls == 2);

    std::cout << "✓ No workers exit test passed" << std::endl;
}

void test_backend_failures_tolerated_up_to_limit() {
    std::cout << "Testing consecutive backend failures up to the limit..." << std::endl;

    ActorRun run;
    run.backend->fail_queue_status = true;
    run.settings.backend_failure_limit = 2;

    int status = run.run();
    assert(status == ExitStatus::backend_unavailable);
    // Two tolerated failures, the third gives up
    assert(run.backend->queue_status_calls == 3);

    std::cout << "✓ Backend failure limit test passed" << std::endl;
}

void test_zero_failure_limit_gives_up_immediately() {
    std::cout << "Testing backend_failure_limit=0 gives up on the first failure..." << std::endl;

    ActorRun run;
    run.backend->fail_active_queues = true;
    run.settings.backend_failure_limit = 0;

    int status = run.run();
    assert(status == ExitStatus::backend_unavailable);
    assert(run.backend->active_queues_calls == 1);

    std::cout << "✓ Zero failure limit test passed" << std::endl;
}

void test_cancelled_token_stops_after_active_check() {
    std::cout << "Testing a fired token stops the loop with status 130..." << std::endl;

    ActorRun run;
    run.backend->set_queue("q1", 3);
    run.backend->add_consumer("q1", "step1_worker@node01");
    run.runtime.cancel->cancel();

    int status = run.run();
    assert(status == ExitStatus::cancelled);
    assert(run.backend->queue_status_calls == 1);

    std::cout << "✓ Cancelled token test passed" << std::endl;
}

void test_exit_message_interrupts_long_sleep() {
    std::cout << "Testing an exit message ends the monitor between ticks..." << std::endl;

    ActorRun run;
    run.backend->set_queue("q1", 3);
    run.backend->add_consumer("q1", "step1_worker@node01");
    run.settings.sleep = 60s;

    caf::actor_system_config cfg;
    caf::actor_system system{cfg};
    auto actor = system.spawn<MonitorActor, caf::detached>(run.settings, run.runtime);

    auto cancel = run.runtime.cancel;
    auto exit_status = run.runtime.exit_status;
    std::thread stopper([actor, cancel, exit_status]() {
        std::this_thread::sleep_for(200ms);
        exit_status->store(ExitStatus::cancelled);
        cancel->cancel();
        caf::anon_send_exit(actor, caf::exit_reason::user_shutdown);
    });

    auto start = std::chrono::steady_clock::now();
    caf::anon_send(actor, caf::atom("tick"));
    system.await_all_actors_done();
    auto elapsed = std::chrono::steady_clock::now() - start;
    stopper.join();

    assert(exit_status->load() == ExitStatus::cancelled);
    assert(elapsed < 30s);
    assert(run.backend->queue_status_calls == 1);

    std::cout << "✓ Exit message test passed" << std::endl;
}

// Signal watcher as wired in main: publish 130, fire the token, send exit
static std::thread stop_after(std::chrono::milliseconds delay, const caf::actor& actor,
                              const MonitorRuntime& runtime) {
    auto cancel = runtime.cancel;
    auto exit_status = runtime.exit_status;
    return std::thread([delay, actor, cancel, exit_status]() {
        std::this_thread::sleep_for(delay);
        exit_status->store(ExitStatus::cancelled);
        cancel->cancel();
        caf::anon_send_exit(actor, caf::exit_reason::user_shutdown);
    });
}

void test_signal_during_idle_check_reports_cancelled() {
    std::cout << "Testing a signal during an in-flight idle check keeps status 130..." << std::endl;

    ActorRun run;
    run.backend->set_queue("q1", 0);
    run.backend->add_consumer("q1", "step1_worker@node01");
    run.backend->processing = false;
    run.backend->before_processing_reply = []() {
        std::this_thread::sleep_for(400ms);
    };

    caf::actor_system_config cfg;
    caf::actor_system system{cfg};
    auto actor = system.spawn<MonitorActor, caf::detached>(run.settings, run.runtime);
    auto stopper = stop_after(100ms, actor, run.runtime);

    caf::anon_send(actor, caf::atom("tick"));
    system.await_all_actors_done();
    stopper.join();

    // The check itself concluded idle; the shutdown must not read as drained
    assert(run.backend->processing_calls == 1);
    assert(run.runtime.exit_status->load() == ExitStatus::cancelled);

    std::cout << "✓ In-flight idle check test passed" << std::endl;
}

void test_signal_during_failing_check_reports_cancelled() {
    std::cout << "Testing a signal during a failing check keeps status 130..." << std::endl;

    ActorRun run;
    run.backend->set_queue("q1", 0);
    run.backend->add_consumer("q1", "step1_worker@node01");
    run.backend->fail_processing = true;
    run.backend->before_processing_reply = []() {
        std::this_thread::sleep_for(400ms);
    };
    run.settings.backend_failure_limit = 0;

    caf::actor_system_config cfg;
    caf::actor_system system{cfg};
    auto actor = system.spawn<MonitorActor, caf::detached>(run.settings, run.runtime);
    auto stopper = stop_after(100ms, actor, run.runtime);

    caf::anon_send(actor, caf::atom("tick"));
    system.await_all_actors_done();
    stopper.join();

    assert(run.runtime.exit_status->load() == ExitStatus::cancelled);

    std::cout << "✓ In-flight failing check test passed" << std::endl;
}

int main() {
    try {
        std::cout << "Running MonitorActor tests..." << std::endl;
        std::cout << "===========================================" << std::endl;

        std::cout << "\n[Outer Loop]" << std::endl;
        test_idle_job_exits_zero();
        test_active_job_keeps_checking_until_idle();
        test_missing_workers_exit_two();

        std::cout << "\n[Backend Failures]" << std::endl;
        test_backend_failures_tolerated_up_to_limit();
        test_zero_failure_limit_gives_up_immediately();

        std::cout << "\n[Shutdown]" << std::endl;
        test_cancelled_token_stops_after_active_check();
        test_exit_message_interrupts_long_sleep();
        test_signal_during_idle_check_reports_cancelled();
        test_signal_during_failing_check_reports_cancelled();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All MonitorActor tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
