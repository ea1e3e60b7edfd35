#pragma once

#include "allocwatch/monitor/core.hpp"
#include <caf/expected.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace allocwatch {
namespace monitor {

// Converter utilities between monitor types and the JSON status document
// served by queue backends:
//
//   {
//     "queues":        [{"name": "q", "jobs": 3, "consumers": 1}],
//     "active_queues": {"worker@host": ["q"]},
//     "workers":       ["worker@host"],
//     "active_tasks":  {"worker@host": [{"id": "t1", "queue": "q"}]}
//   }
class StatusConverter {
public:
    // "active" | "idle" | "error" | "cancelled"
    static std::string status_to_string(CheckStatus status);

    static CheckStatus string_to_status(const std::string& status_str);

    // Convert ErrorCode to machine-readable string code
    static std::string error_code_to_string(ErrorCode code);

    // One-line report for single-shot mode
    static nlohmann::json to_json(const CheckResult& result, const std::string& job_name);

    // Success status with an error code (or the reverse) is invalid
    static bool validate_result(const CheckResult& result);

    // Entries for every requested queue; missing ones are zero-filled
    static caf::expected<QueueStatusMap> parse_queue_status(const nlohmann::json& document,
                                                            const std::vector<std::string>& queue_names);

    // Inverts the per-worker queue lists into queue -> workers
    static caf::expected<ActiveQueuesSnapshot> parse_active_queues(const nlohmann::json& document);

    static caf::expected<std::vector<std::string>> parse_worker_identifiers(const nlohmann::json& document);

    static caf::expected<bool> parse_workers_processing(const nlohmann::json& document,
                                                        const std::vector<std::string>& relevant_queues);
};

} // namespace monitor
} // namespace allocwatch
