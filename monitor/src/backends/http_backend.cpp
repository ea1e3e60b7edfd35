#include "allocwatch/monitor/backends/http_backend.hpp"
#include "allocwatch/monitor/status_converter.hpp"
#include <caf/error.hpp>
#include <caf/sec.hpp>
#include <stdexcept>

namespace allocwatch {
namespace monitor {

using json = nlohmann::json;

HttpBackend::HttpBackend(const BackendSettings& settings)
    : base_url_(settings.backend_url),
      connect_timeout_ms_(settings.connect_timeout_ms),
      request_timeout_ms_(settings.request_timeout_ms) {
    if (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
    curl_ = curl_easy_init();
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

HttpBackend::~HttpBackend() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

caf::expected<QueueStatusMap> HttpBackend::query_queue_status(const std::vector<std::string>& queue_names) {
    auto document = get_json("/api/queues?names=" + encode_queue_names(queue_names));
    if (!document) {
        return document.error();
    }
    return StatusConverter::parse_queue_status(*document, queue_names);
}

caf::expected<ActiveQueuesSnapshot> HttpBackend::query_active_queues() {
    auto document = get_json("/api/workers/active_queues");
    if (!document) {
        return document.error();
    }
    return StatusConverter::parse_active_queues(*document);
}

caf::expected<std::vector<std::string>> HttpBackend::query_worker_identifiers() {
    auto document = get_json("/api/workers");
    if (!document) {
        return document.error();
    }
    return StatusConverter::parse_worker_identifiers(*document);
}

caf::expected<bool> HttpBackend::query_workers_processing(const std::vector<std::string>& relevant_queues) {
    auto document = get_json("/api/workers/active_tasks");
    if (!document) {
        return document.error();
    }
    return StatusConverter::parse_workers_processing(*document, relevant_queues);
}

std::string HttpBackend::encode_queue_names(const std::vector<std::string>& queue_names) {
    std::lock_guard<std::mutex> lock(curl_mutex_);
    std::string encoded;
    for (const auto& name : queue_names) {
        char* escaped = curl_easy_escape(curl_, name.c_str(), static_cast<int>(name.size()));
        if (!escaped) {
            continue;
        }
        if (!encoded.empty()) {
            encoded += ",";
        }
        encoded += escaped;
        curl_free(escaped);
    }
    return encoded;
}

caf::expected<json> HttpBackend::get_json(const std::string& path) {
    std::lock_guard<std::mutex> lock(curl_mutex_);

    std::string url = base_url_ + path;
    std::string response_body;
    long response_code = 0;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(request_timeout_ms_));

    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Accept: application/json");
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        return caf::make_error(caf::sec::runtime_error,
                               "GET " + url + " failed: " + std::string(curl_easy_strerror(res)));
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response_code);
    if (response_code < 200 || response_code >= 300) {
        return caf::make_error(caf::sec::runtime_error,
                               "GET " + url + " returned status " + std::to_string(response_code));
    }

    try {
        return json::parse(response_body);
    } catch (const json::parse_error& e) {
        return caf::make_error(caf::sec::runtime_error,
                               "GET " + url + " returned invalid JSON: " + std::string(e.what()));
    }
}

size_t HttpBackend::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    if (userp == nullptr || contents == nullptr) {
        return 0;
    }
    const char* data = static_cast<const char*>(contents);
    userp->append(data, size * nmemb);
    return size * nmemb;
}

} // namespace monitor
} // namespace allocwatch
