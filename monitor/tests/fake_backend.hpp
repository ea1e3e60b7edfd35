#pragma once

#include "allocwatch/monitor/task_queue_backend.hpp"
#include <caf/error.hpp>
#include <caf/sec.hpp>
#include <algorithm>
#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace allocwatch {
namespace monitor {

// Scripted TaskQueueBackend for tests
class FakeBackend : public TaskQueueBackend {
public:
    std::string backend_type() const override { return "fake"; }

    caf::expected<QueueStatusMap> query_queue_status(const std::vector<std::string>& queue_names) override {
        ++queue_status_calls;
        last_status_queues = queue_names;
        if (fail_queue_status) {
            return caf::make_error(caf::sec::runtime_error, "connection refused");
        }
        // Mirror a real broker: only requested queues, zero-filled when unknown
        QueueStatusMap result;
        for (const auto& name : queue_names) {
            auto it = queues.find(name);
            if (it != queues.end()) {
                result[name] = it->second;
            } else {
                QueueStatus empty;
                empty.name = name;
                result[name] = empty;
            }
        }
        return result;
    }

    caf::expected<ActiveQueuesSnapshot> query_active_queues() override {
        ++active_queues_calls;
        if (fail_active_queues) {
            return caf::make_error(caf::sec::runtime_error, "broker timeout");
        }
        ActiveQueuesSnapshot snapshot;
        snapshot.queues = active_queues;
        for (const auto& [queue, workers] : active_queues) {
            snapshot.responding_workers.insert(snapshot.responding_workers.end(), workers.begin(), workers.end());
        }
        return snapshot;
    }

    caf::expected<std::vector<std::string>> query_worker_identifiers() override {
        int call = worker_identifier_calls++;
        if (fail_worker_identifiers) {
            return caf::make_error(caf::sec::runtime_error, "broker timeout");
        }
        if (workers_appear_on_call >= 0 && call >= workers_appear_on_call) {
            return late_workers;
        }
        return workers;
    }

    caf::expected<bool> query_workers_processing(const std::vector<std::string>& relevant_queues) override {
        ++processing_calls;
        last_processing_queues = relevant_queues;
        if (before_processing_reply) {
            before_processing_reply();
        }
        if (fail_processing) {
            return caf::make_error(caf::sec::runtime_error, "broker timeout");
        }
        if (processing_sequence.empty()) {
            return processing;
        }
        size_t index = std::min(processing_index_, processing_sequence.size() - 1);
        ++processing_index_;
        return static_cast<bool>(processing_sequence[index]);
    }

    void set_queue(const std::string& name, int64_t jobs, int64_t consumers = 0) {
        QueueStatus status;
        status.name = name;
        status.pending_jobs = jobs;
        status.consumer_count = consumers;
        queues[name] = status;
    }

    void add_consumer(const std::string& queue, const std::string& worker) {
        active_queues[queue].insert(worker);
    }

    // Scripted state
    QueueStatusMap queues;
    ActiveQueueMap active_queues;
    std::vector<std::string> workers;
    std::vector<std::string> late_workers;
    int workers_appear_on_call = -1;
    bool processing = false;
    std::vector<bool> processing_sequence;
    // Runs inside query_workers_processing, e.g. to simulate a slow broker
    std::function<void()> before_processing_reply;

    bool fail_queue_status = false;
    bool fail_active_queues = false;
    bool fail_worker_identifiers = false;
    bool fail_processing = false;

    // Observed calls
    std::atomic<int> queue_status_calls{0};
    std::atomic<int> active_queues_calls{0};
    std::atomic<int> worker_identifier_calls{0};
    std::atomic<int> processing_calls{0};
    std::vector<std::string> last_status_queues;
    std::vector<std::string> last_processing_queues;

private:
    size_t processing_index_ = 0;
};

// Two-step job: step1 on q1, step2 on q2, one worker per step
inline JobSpecView make_two_step_job() {
    JobSpecView job;
    job.job_name = "study";
    job.relevant_queues = {"q1", "q2"};
    job.status_queues = {"q1", "q2"};
    job.expected_worker_names = {"step1_worker", "step2_worker"};
    return job;
}

} // namespace monitor
} // namespace allocwatch
