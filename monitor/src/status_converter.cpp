#include "allocwatch/monitor/status_converter.hpp"
#include <caf/error.hpp>
#include <caf/sec.hpp>
#include <set>

namespace allocwatch {
namespace monitor {

using json = nlohmann::json;

namespace {

caf::error malformed(const std::string& what) {
    return caf::make_error(caf::sec::runtime_error, "malformed status document: " + what);
}

} // namespace

std::string StatusConverter::status_to_string(CheckStatus status) {
    switch (status) {
        case CheckStatus::active:
            return "active";
        case CheckStatus::idle:
            return "idle";
        case CheckStatus::error:
            return "error";
        case CheckStatus::cancelled:
            return "cancelled";
        default:
            return "error";
    }
}

CheckStatus StatusConverter::string_to_status(const std::string& status_str) {
    if (status_str == "active") {
        return CheckStatus::active;
    } else if (status_str == "idle") {
        return CheckStatus::idle;
    } else if (status_str == "cancelled") {
        return CheckStatus::cancelled;
    }
    return CheckStatus::error;  // Default to error for unknown status
}

std::string StatusConverter::error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::none:
            return "NONE";
        case ErrorCode::invalid_input:
            return "INVALID_INPUT";
        case ErrorCode::invalid_job_spec:
            return "INVALID_JOB_SPEC";
        case ErrorCode::unsupported_backend:
            return "UNSUPPORTED_BACKEND";
        case ErrorCode::no_workers_available:
            return "NO_WORKERS_AVAILABLE";
        case ErrorCode::backend_unavailable:
            return "BACKEND_UNAVAILABLE";
        case ErrorCode::internal_error:
            return "INTERNAL_ERROR";
        case ErrorCode::cancelled_by_user:
            return "CANCELLED_BY_USER";
        default:
            return "UNKNOWN_ERROR";
    }
}

json StatusConverter::to_json(const CheckResult& result, const std::string& job_name) {
    json report;
    report["job"] = job_name;
    report["status"] = status_to_string(result.status);
    report["active"] = result.is_active();
    report["total_jobs"] = result.total_jobs;
    report["total_consumers"] = result.total_consumers;
    report["wait_attempts"] = result.wait_attempts;
    report["latency_ms"] = result.latency_ms;

    if (result.error_code != ErrorCode::none) {
        report["error_code"] = error_code_to_string(result.error_code);
        if (!result.error_message.empty()) {
            report["error_message"] = result.error_message;
        }
    }
    return report;
}

bool StatusConverter::validate_result(const CheckResult& result) {
    if (result.status == CheckStatus::error && result.error_code == ErrorCode::none) {
        return false;
    }
    if ((result.status == CheckStatus::active || result.status == CheckStatus::idle)
        && result.error_code != ErrorCode::none) {
        return false;
    }
    if (result.total_jobs < 0 || result.total_consumers < 0 || result.wait_attempts < 0) {
        return false;
    }
    if (result.latency_ms < 0) {
        return false;
    }
    return true;
}

caf::expected<QueueStatusMap> StatusConverter::parse_queue_status(const json& document,
                                                                  const std::vector<std::string>& queue_names) {
    auto queues_it = document.find("queues");
    if (queues_it == document.end() || !queues_it->is_array()) {
        return malformed("'queues' must be an array");
    }

    std::set<std::string> requested(queue_names.begin(), queue_names.end());
    QueueStatusMap statuses;

    try {
        for (const auto& entry : *queues_it) {
            QueueStatus status;
            status.name = entry.at("name").get<std::string>();
            status.pending_jobs = entry.value("jobs", int64_t{0});
            status.consumer_count = entry.value("consumers", int64_t{0});
            if (status.pending_jobs < 0 || status.consumer_count < 0) {
                return malformed("negative counter for queue '" + status.name + "'");
            }
            if (!requested.count(status.name)) {
                continue;
            }
            statuses[status.name] = status;
        }
    } catch (const json::exception& e) {
        return malformed(e.what());
    }

    for (const auto& name : queue_names) {
        if (!statuses.count(name)) {
            QueueStatus empty;
            empty.name = name;
            statuses[name] = empty;
        }
    }
    return statuses;
}

caf::expected<ActiveQueuesSnapshot> StatusConverter::parse_active_queues(const json& document) {
    auto active_it = document.find("active_queues");
    if (active_it == document.end() || !active_it->is_object()) {
        return malformed("'active_queues' must be an object");
    }

    ActiveQueuesSnapshot snapshot;
    try {
        for (const auto& [worker, queues] : active_it->items()) {
            snapshot.responding_workers.push_back(worker);
            for (const auto& queue : queues) {
                snapshot.queues[queue.get<std::string>()].insert(worker);
            }
        }
    } catch (const json::exception& e) {
        return malformed(e.what());
    }
    return snapshot;
}

caf::expected<std::vector<std::string>> StatusConverter::parse_worker_identifiers(const json& document) {
    auto workers_it = document.find("workers");
    if (workers_it == document.end() || !workers_it->is_array()) {
        return malformed("'workers' must be an array");
    }

    try {
        return workers_it->get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        return malformed(e.what());
    }
}

caf::expected<bool> StatusConverter::parse_workers_processing(const json& document,
                                                              const std::vector<std::string>& relevant_queues) {
    auto tasks_it = document.find("active_tasks");
    if (tasks_it == document.end() || !tasks_it->is_object()) {
        return malformed("'active_tasks' must be an object");
    }

    std::set<std::string> queues(relevant_queues.begin(), relevant_queues.end());
    try {
        for (const auto& [worker, tasks] : tasks_it->items()) {
            for (const auto& task : tasks) {
                if (queues.count(task.at("queue").get<std::string>())) {
                    return true;
                }
            }
        }
    } catch (const json::exception& e) {
        return malformed(e.what());
    }
    return false;
}

} // namespace monitor
} // namespace allocwatch
