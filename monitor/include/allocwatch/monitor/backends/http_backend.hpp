#pragma once

#include "allocwatch/monitor/task_queue_backend.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>

namespace allocwatch {
namespace monitor {

// Queries a queue service's JSON status API:
//   GET /api/queues?names=a,b        -> {"queues": [...]}
//   GET /api/workers/active_queues   -> {"active_queues": {...}}
//   GET /api/workers                 -> {"workers": [...]}
//   GET /api/workers/active_tasks    -> {"active_tasks": {...}}
// One CURL easy handle lives as long as the backend.
class HttpBackend : public TaskQueueBackend {
public:
    explicit HttpBackend(const BackendSettings& settings);
    ~HttpBackend() override;

    HttpBackend(const HttpBackend&) = delete;
    HttpBackend& operator=(const HttpBackend&) = delete;

    std::string backend_type() const override { return "http"; }

    caf::expected<QueueStatusMap> query_queue_status(const std::vector<std::string>& queue_names) override;
    caf::expected<ActiveQueuesSnapshot> query_active_queues() override;
    caf::expected<std::vector<std::string>> query_worker_identifiers() override;
    caf::expected<bool> query_workers_processing(const std::vector<std::string>& relevant_queues) override;

    const std::string& base_url() const { return base_url_; }

    // "a", "b c" -> "a,b%20c"
    std::string encode_queue_names(const std::vector<std::string>& queue_names);

private:
    std::string base_url_;
    int64_t connect_timeout_ms_;
    int64_t request_timeout_ms_;
    CURL* curl_ = nullptr;
    std::mutex curl_mutex_;

    caf::expected<nlohmann::json> get_json(const std::string& path);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp);
};

} // namespace monitor
} // namespace allocwatch
