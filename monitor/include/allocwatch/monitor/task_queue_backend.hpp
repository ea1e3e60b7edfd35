#pragma once

#include "allocwatch/monitor/core.hpp"
#include <caf/expected.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace allocwatch {
namespace monitor {

// TaskQueueBackend interface
// Every call is a single synchronous round trip. A caf::error means the broker
// could not be reached or answered with something unusable; callers never
// retry inside a check.
class TaskQueueBackend {
public:
    virtual ~TaskQueueBackend() = default;

    virtual std::string backend_type() const = 0;

    // Requested queues the broker does not know are reported with zero counters
    virtual caf::expected<QueueStatusMap> query_queue_status(const std::vector<std::string>& queue_names) = 0;

    virtual caf::expected<ActiveQueuesSnapshot> query_active_queues() = 0;

    // Every connected worker, as "<name>@<host>"
    virtual caf::expected<std::vector<std::string>> query_worker_identifiers() = 0;

    // True if a worker is executing a task delivered from one of `relevant_queues`
    virtual caf::expected<bool> query_workers_processing(const std::vector<std::string>& relevant_queues) = 0;
};

struct BackendSettings {
    std::string backend = "http";
    std::string backend_url;
    std::string snapshot_path;
    int64_t connect_timeout_ms = 5000;
    int64_t request_timeout_ms = 10000;

    static BackendSettings from_config(const MonitorConfig& config) {
        BackendSettings settings;
        settings.backend = config.backend;
        settings.backend_url = config.backend_url;
        settings.snapshot_path = config.snapshot_path;
        settings.connect_timeout_ms = config.connect_timeout_ms;
        settings.request_timeout_ms = config.request_timeout_ms;
        return settings;
    }
};

// Creates the one backend selected by configuration. New backends are added
// by registering a creator, never by branching on names in the monitor.
class BackendFactory {
public:
    using Creator = std::function<caf::expected<std::shared_ptr<TaskQueueBackend>>(const BackendSettings&)>;

    // Registry preloaded with the built-in "http" and "snapshot" backends
    static BackendFactory with_builtin_backends();

    void register_backend(const std::string& name, Creator creator);

    bool has_backend(const std::string& name) const;

    std::vector<std::string> backend_names() const;

    caf::expected<std::shared_ptr<TaskQueueBackend>> create(const BackendSettings& settings) const;

private:
    std::map<std::string, Creator> creators_;
};

} // namespace monitor
} // namespace allocwatch
