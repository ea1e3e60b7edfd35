#pragma once

#include "allocwatch/monitor/core.hpp"
#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <cstdint>

namespace allocwatch {
namespace monitor {

class Observability {
public:
    Observability(const std::string& monitor_id);
    ~Observability();

    // Metrics (gated behind ALLOCWATCH_METRICS_ENABLED)
    void record_queue_status(const QueueStatusMap& queue_statuses);

    void record_check(const CheckResult& result, const std::string& job_name);

    void record_wait_attempt(const std::string& job_name);

    void record_backend_error(const std::string& operation);

    // Metrics endpoint, "host:port"
    bool start_metrics_endpoint(const std::string& bind_address);
    void stop_metrics_endpoint();
    std::string get_metrics_response(); // Prometheus text format

    // Logging
    void log_info(const std::string& message,
                  const std::string& job_name = "",
                  const std::string& check_id = "",
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_warn(const std::string& message,
                  const std::string& job_name = "",
                  const std::string& check_id = "",
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_error(const std::string& message,
                   const std::string& job_name = "",
                   const std::string& check_id = "",
                   const std::unordered_map<std::string, std::string>& context = {});

    // Dropped unless ALLOCWATCH_DEBUG_LOGS_ENABLED is set
    void log_debug(const std::string& message,
                   const std::string& job_name = "",
                   const std::string& check_id = "",
                   const std::unordered_map<std::string, std::string>& context = {});

    // Prometheus registry access
    std::shared_ptr<prometheus::Registry> registry() { return registry_; }

    const std::string& monitor_id() const { return monitor_id_; }

private:
    std::string monitor_id_;
    std::shared_ptr<prometheus::Registry> registry_;
    std::unique_ptr<prometheus::Exposer> exposer_;
    std::mutex output_mutex_;

    prometheus::Family<prometheus::Gauge>* queue_jobs_family_ = nullptr;
    prometheus::Family<prometheus::Gauge>* queue_consumers_family_ = nullptr;
    prometheus::Family<prometheus::Gauge>* total_jobs_family_ = nullptr;
    prometheus::Family<prometheus::Gauge>* total_consumers_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* checks_total_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* wait_attempts_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* backend_errors_family_ = nullptr;

    void initialize_metrics();
    bool metrics_ready() const;
    void write_line(std::ostream& out, const std::string& line);
    std::string format_json_log(const std::string& level,
                                const std::string& message,
                                const std::string& job_name,
                                const std::string& check_id,
                                const std::unordered_map<std::string, std::string>& context);
};

} // namespace monitor
} // namespace allocwatch
