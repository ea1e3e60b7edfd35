#include "allocwatch/monitor/observability.hpp"
#include "allocwatch/monitor/feature_flags.hpp"
#include "allocwatch/monitor/status_converter.hpp"
#include <prometheus/text_serializer.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <sstream>
#include <vector>

namespace allocwatch {
namespace monitor {

using json = nlohmann::json;

// Secret fields to filter (broker URLs carry credentials)
static const std::vector<std::string> SECRET_FIELDS = {
    "password", "secret", "token", "access_token", "api_key",
    "authorization", "credentials"
};

// Helper function to check if a field name should be filtered (case-insensitive)
static bool is_secret_field(const std::string& field_name) {
    std::string lower_field = field_name;
    std::transform(lower_field.begin(), lower_field.end(), lower_field.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& secret_field : SECRET_FIELDS) {
        if (lower_field.find(secret_field) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Recursively filter secrets from JSON object
static void filter_secrets_recursive(json& obj) {
    if (obj.is_object()) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (is_secret_field(it.key())) {
                it.value() = "[REDACTED]";
            } else if (it.value().is_object() || it.value().is_array()) {
                filter_secrets_recursive(it.value());
            }
        }
    } else if (obj.is_array()) {
        for (auto& item : obj) {
            if (item.is_object() || item.is_array()) {
                filter_secrets_recursive(item);
            }
        }
    }
}

// Generate ISO 8601 timestamp with microseconds
static std::string get_iso8601_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto duration = now.time_since_epoch();
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration) % 1000000;

    std::tm tm_buf;
    gmtime_r(&time_t, &tm_buf);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(microseconds.count()));

    return std::string(buf);
}

Observability::Observability(const std::string& monitor_id)
    : monitor_id_(monitor_id), registry_(std::make_shared<prometheus::Registry>()) {
    if (FeatureFlags::is_metrics_enabled()) {
        initialize_metrics();
    }
}

Observability::~Observability() {
    stop_metrics_endpoint();
}

void Observability::initialize_metrics() {
    queue_jobs_family_ = &prometheus::BuildGauge()
        .Name("allocwatch_queue_jobs")
        .Help("Pending jobs per queue at the last poll")
        .Labels({{"monitor_id", monitor_id_}})
        .Register(*registry_);

    queue_consumers_family_ = &prometheus::BuildGauge()
        .Name("allocwatch_queue_consumers")
        .Help("Consumers per queue reported by the broker at the last poll")
        .Labels({{"monitor_id", monitor_id_}})
        .Register(*registry_);

    total_jobs_family_ = &prometheus::BuildGauge()
        .Name("allocwatch_total_jobs")
        .Help("Aggregated pending jobs seen by the last check")
        .Labels({{"monitor_id", monitor_id_}})
        .Register(*registry_);

    total_consumers_family_ = &prometheus::BuildGauge()
        .Name("allocwatch_total_consumers")
        .Help("Distinct workers on the job's queues at the last check")
        .Labels({{"monitor_id", monitor_id_}})
        .Register(*registry_);

    checks_total_family_ = &prometheus::BuildCounter()
        .Name("allocwatch_checks_total")
        .Help("Status checks by outcome")
        .Labels({{"monitor_id", monitor_id_}})
        .Register(*registry_);

    wait_attempts_family_ = &prometheus::BuildCounter()
        .Name("allocwatch_worker_wait_attempts_total")
        .Help("Worker-presence polls that found none of the expected workers")
        .Labels({{"monitor_id", monitor_id_}})
        .Register(*registry_);

    backend_errors_family_ = &prometheus::BuildCounter()
        .Name("allocwatch_backend_errors_total")
        .Help("Failed backend round trips by operation")
        .Labels({{"monitor_id", monitor_id_}})
        .Register(*registry_);
}

bool Observability::metrics_ready() const {
    return queue_jobs_family_ != nullptr;
}

void Observability::record_queue_status(const QueueStatusMap& queue_statuses) {
    if (!metrics_ready()) {
        return;
    }

    for (const auto& [name, status] : queue_statuses) {
        queue_jobs_family_->Add({{"queue", name}}).Set(static_cast<double>(status.pending_jobs));
        queue_consumers_family_->Add({{"queue", name}}).Set(static_cast<double>(status.consumer_count));
    }
}

void Observability::record_check(const CheckResult& result, const std::string& job_name) {
    if (!metrics_ready()) {
        return;
    }

    total_jobs_family_->Add({{"job", job_name}}).Set(static_cast<double>(result.total_jobs));
    total_consumers_family_->Add({{"job", job_name}}).Set(static_cast<double>(result.total_consumers));

    std::string outcome = StatusConverter::status_to_string(result.status);
    if (result.is_error()) {
        outcome = StatusConverter::error_code_to_string(result.error_code);
    }
    checks_total_family_->Add({{"job", job_name}, {"outcome", outcome}}).Increment();
}

void Observability::record_wait_attempt(const std::string& job_name) {
    if (!metrics_ready()) {
        return;
    }
    wait_attempts_family_->Add({{"job", job_name}}).Increment();
}

void Observability::record_backend_error(const std::string& operation) {
    if (!metrics_ready()) {
        return;
    }
    backend_errors_family_->Add({{"operation", operation}}).Increment();
}

std::string Observability::get_metrics_response() {
    if (!metrics_ready()) {
        return ""; // Return empty if feature flag disabled
    }

    std::ostringstream oss;
    prometheus::TextSerializer serializer;
    serializer.Serialize(oss, registry_->Collect());
    return oss.str();
}

bool Observability::start_metrics_endpoint(const std::string& bind_address) {
    if (!metrics_ready()) {
        log_warn("Metrics endpoint requested but ALLOCWATCH_METRICS_ENABLED is not set", "", "", {
            {"address", bind_address}
        });
        return false;
    }

    if (exposer_) {
        return true; // Already running
    }

    try {
        exposer_ = std::make_unique<prometheus::Exposer>(bind_address);
        exposer_->RegisterCollectable(registry_);
    } catch (const std::exception& e) {
        exposer_.reset();
        log_error("Failed to start metrics endpoint", "", "", {
            {"address", bind_address},
            {"error", e.what()}
        });
        return false;
    }

    log_info("Metrics endpoint started", "", "", {
        {"address", bind_address}
    });
    return true;
}

void Observability::stop_metrics_endpoint() {
    if (!exposer_) {
        return;
    }
    exposer_.reset();
    log_info("Metrics endpoint stopped");
}

void Observability::log_info(const std::string& message,
                             const std::string& job_name,
                             const std::string& check_id,
                             const std::unordered_map<std::string, std::string>& context) {
    write_line(std::cout, format_json_log("INFO", message, job_name, check_id, context));
}

void Observability::log_warn(const std::string& message,
                             const std::string& job_name,
                             const std::string& check_id,
                             const std::unordered_map<std::string, std::string>& context) {
    write_line(std::cout, format_json_log("WARN", message, job_name, check_id, context));
}

void Observability::log_error(const std::string& message,
                              const std::string& job_name,
                              const std::string& check_id,
                              const std::unordered_map<std::string, std::string>& context) {
    write_line(std::cerr, format_json_log("ERROR", message, job_name, check_id, context));
}

void Observability::log_debug(const std::string& message,
                              const std::string& job_name,
                              const std::string& check_id,
                              const std::unordered_map<std::string, std::string>& context) {
    if (!FeatureFlags::is_debug_logging_enabled()) {
        return;
    }
    write_line(std::cout, format_json_log("DEBUG", message, job_name, check_id, context));
}

void Observability::write_line(std::ostream& out, const std::string& line) {
    // The signal watcher and the monitor actor log from different threads
    std::lock_guard<std::mutex> lock(output_mutex_);
    out << line << std::endl;
}

std::string Observability::format_json_log(const std::string& level,
                                           const std::string& message,
                                           const std::string& job_name,
                                           const std::string& check_id,
                                           const std::unordered_map<std::string, std::string>& context) {
    json log_entry;

    // Required fields (always present)
    log_entry["timestamp"] = get_iso8601_timestamp();
    log_entry["level"] = level;
    log_entry["component"] = "monitor";
    log_entry["message"] = message;

    // Correlation fields (at top level, when provided)
    if (!job_name.empty()) {
        log_entry["job"] = job_name;
    }
    if (!check_id.empty()) {
        log_entry["check_id"] = check_id;
    }

    json context_obj;
    context_obj["monitor_id"] = monitor_id_;
    for (const auto& [key, value] : context) {
        context_obj[key] = value;
    }

    filter_secrets_recursive(context_obj);
    log_entry["context"] = context_obj;

    return log_entry.dump();
}

} // namespace monitor
} // namespace allocwatch
