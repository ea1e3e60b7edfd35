#include "allocwatch/monitor/status_aggregator.hpp"

namespace allocwatch {
namespace monitor {

int64_t StatusAggregator::aggregate_jobs(const QueueStatusMap& queue_statuses) {
    int64_t total_jobs = 0;
    for (const auto& [name, status] : queue_statuses) {
        total_jobs += status.pending_jobs;
    }
    return total_jobs;
}

int64_t StatusAggregator::aggregate_jobs(const std::vector<QueueStatus>& queue_statuses) {
    int64_t total_jobs = 0;
    for (const auto& status : queue_statuses) {
        total_jobs += status.pending_jobs;
    }
    return total_jobs;
}

int64_t StatusAggregator::aggregate_jobs(const QueueStatusMap& queue_statuses,
                                         const std::set<std::string>& relevant_queues) {
    int64_t total_jobs = 0;
    for (const auto& [name, status] : queue_statuses) {
        if (relevant_queues.count(name)) {
            total_jobs += status.pending_jobs;
        }
    }
    return total_jobs;
}

int64_t StatusAggregator::aggregate_consumers(const ActiveQueueMap& active_queue_map,
                                              const std::set<std::string>& relevant_queues) {
    return static_cast<int64_t>(collect_consumers(active_queue_map, relevant_queues).size());
}

std::set<std::string> StatusAggregator::collect_consumers(const ActiveQueueMap& active_queue_map,
                                                          const std::set<std::string>& relevant_queues) {
    std::set<std::string> consumers;
    for (const auto& [queue, workers] : active_queue_map) {
        // A worker dedicated to another job's queue must not keep this job alive
        if (!relevant_queues.count(queue)) {
            continue;
        }
        consumers.insert(workers.begin(), workers.end());
    }
    return consumers;
}

std::set<std::string> StatusAggregator::collect_all_consumers(const ActiveQueueMap& active_queue_map) {
    std::set<std::string> consumers;
    for (const auto& [queue, workers] : active_queue_map) {
        consumers.insert(workers.begin(), workers.end());
    }
    return consumers;
}

std::set<std::string> StatusAggregator::to_queue_set(const std::vector<std::string>& queues) {
    return std::set<std::string>(queues.begin(), queues.end());
}

} // namespace monitor
} // namespace allocwatch
