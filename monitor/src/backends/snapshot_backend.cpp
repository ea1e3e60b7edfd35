#include "allocwatch/monitor/backends/snapshot_backend.hpp"
#include "allocwatch/monitor/status_converter.hpp"
#include <caf/error.hpp>
#include <caf/sec.hpp>
#include <fstream>

namespace allocwatch {
namespace monitor {

using json = nlohmann::json;

SnapshotBackend::SnapshotBackend(std::string snapshot_path)
    : snapshot_path_(std::move(snapshot_path)) {}

caf::expected<QueueStatusMap> SnapshotBackend::query_queue_status(const std::vector<std::string>& queue_names) {
    auto document = read_document();
    if (!document) {
        return document.error();
    }
    return StatusConverter::parse_queue_status(*document, queue_names);
}

caf::expected<ActiveQueuesSnapshot> SnapshotBackend::query_active_queues() {
    auto document = read_document();
    if (!document) {
        return document.error();
    }
    return StatusConverter::parse_active_queues(*document);
}

caf::expected<std::vector<std::string>> SnapshotBackend::query_worker_identifiers() {
    auto document = read_document();
    if (!document) {
        return document.error();
    }
    return StatusConverter::parse_worker_identifiers(*document);
}

caf::expected<bool> SnapshotBackend::query_workers_processing(const std::vector<std::string>& relevant_queues) {
    auto document = read_document();
    if (!document) {
        return document.error();
    }
    return StatusConverter::parse_workers_processing(*document, relevant_queues);
}

caf::expected<json> SnapshotBackend::read_document() const {
    std::ifstream file(snapshot_path_);
    if (!file) {
        return caf::make_error(caf::sec::runtime_error, "cannot open snapshot '" + snapshot_path_ + "'");
    }

    try {
        json document;
        file >> document;
        return document;
    } catch (const json::parse_error& e) {
        // The exporter may be mid-write; the caller sees an unavailable backend
        return caf::make_error(caf::sec::runtime_error,
                               "snapshot '" + snapshot_path_ + "' is not valid JSON: " + std::string(e.what()));
    }
}

} // namespace monitor
} // namespace allocwatch
