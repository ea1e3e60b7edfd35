#pragma once

#include "allocwatch/monitor/core.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace allocwatch {
namespace monitor {

// Reduces raw backend snapshots to the two scalars the liveness decision needs
class StatusAggregator {
public:
    // Sum of pending_jobs over every entry
    static int64_t aggregate_jobs(const QueueStatusMap& queue_statuses);
    static int64_t aggregate_jobs(const std::vector<QueueStatus>& queue_statuses);

    // Sum of pending_jobs over entries whose queue is in `relevant_queues`
    static int64_t aggregate_jobs(const QueueStatusMap& queue_statuses,
                                  const std::set<std::string>& relevant_queues);

    // Number of distinct workers across the relevant queues (set union, not a sum)
    static int64_t aggregate_consumers(const ActiveQueueMap& active_queue_map,
                                       const std::set<std::string>& relevant_queues);

    static std::set<std::string> collect_consumers(const ActiveQueueMap& active_queue_map,
                                                   const std::set<std::string>& relevant_queues);

    // Every worker on every queue
    static std::set<std::string> collect_all_consumers(const ActiveQueueMap& active_queue_map);

    static std::set<std::string> to_queue_set(const std::vector<std::string>& queues);
};

} // namespace monitor
} // namespace allocwatch
