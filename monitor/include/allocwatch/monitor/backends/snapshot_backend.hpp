#pragma once

#include "allocwatch/monitor/task_queue_backend.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace allocwatch {
namespace monitor {

// Reads the full status document from a file that an external exporter
// rewrites; every query re-reads it so each poll sees a fresh snapshot.
class SnapshotBackend : public TaskQueueBackend {
public:
    explicit SnapshotBackend(std::string snapshot_path);

    std::string backend_type() const override { return "snapshot"; }

    caf::expected<QueueStatusMap> query_queue_status(const std::vector<std::string>& queue_names) override;
    caf::expected<ActiveQueuesSnapshot> query_active_queues() override;
    caf::expected<std::vector<std::string>> query_worker_identifiers() override;
    caf::expected<bool> query_workers_processing(const std::vector<std::string>& relevant_queues) override;

    const std::string& snapshot_path() const { return snapshot_path_; }

private:
    std::string snapshot_path_;

    caf::expected<nlohmann::json> read_document() const;
};

} // namespace monitor
} // namespace allocwatch
