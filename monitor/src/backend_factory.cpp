#include "allocwatch/monitor/task_queue_backend.hpp"
#include "allocwatch/monitor/backends/http_backend.hpp"
#include "allocwatch/monitor/backends/snapshot_backend.hpp"
#include <caf/error.hpp>
#include <caf/sec.hpp>
#include <stdexcept>

namespace allocwatch {
namespace monitor {

BackendFactory BackendFactory::with_builtin_backends() {
    BackendFactory factory;

    factory.register_backend("http", [](const BackendSettings& settings)
                                         -> caf::expected<std::shared_ptr<TaskQueueBackend>> {
        if (settings.backend_url.empty()) {
            return caf::make_error(caf::sec::invalid_argument, "http backend requires backend-url");
        }
        try {
            return std::shared_ptr<TaskQueueBackend>(std::make_shared<HttpBackend>(settings));
        } catch (const std::exception& e) {
            return caf::make_error(caf::sec::runtime_error, std::string("http backend: ") + e.what());
        }
    });

    factory.register_backend("snapshot", [](const BackendSettings& settings)
                                             -> caf::expected<std::shared_ptr<TaskQueueBackend>> {
        if (settings.snapshot_path.empty()) {
            return caf::make_error(caf::sec::invalid_argument, "snapshot backend requires snapshot-path");
        }
        return std::shared_ptr<TaskQueueBackend>(std::make_shared<SnapshotBackend>(settings.snapshot_path));
    });

    return factory;
}

void BackendFactory::register_backend(const std::string& name, Creator creator) {
    creators_[name] = std::move(creator);
}

bool BackendFactory::has_backend(const std::string& name) const {
    return creators_.count(name) > 0;
}

std::vector<std::string> BackendFactory::backend_names() const {
    std::vector<std::string> names;
    for (const auto& [name, creator] : creators_) {
        names.push_back(name);
    }
    return names;
}

caf::expected<std::shared_ptr<TaskQueueBackend>> BackendFactory::create(const BackendSettings& settings) const {
    auto it = creators_.find(settings.backend);
    if (it == creators_.end()) {
        return caf::make_error(caf::sec::invalid_argument,
                               "unsupported backend '" + settings.backend + "'");
    }
    return it->second(settings);
}

} // namespace monitor
} // namespace allocwatch
