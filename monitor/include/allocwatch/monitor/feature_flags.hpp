#pragma once

#include <string>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace allocwatch {
namespace monitor {

/**
 * Monitor Feature Flags
 *
 * Optional behavior is gated behind environment variables and defaults to off:
 * - ALLOCWATCH_DEBUG_LOGS_ENABLED
 * - ALLOCWATCH_METRICS_ENABLED
 */
class FeatureFlags {
public:
    /**
     * Emit DEBUG log lines (raw queue snapshots, consumer sets, wait polls)
     */
    static bool is_debug_logging_enabled() {
        return get_env_bool("ALLOCWATCH_DEBUG_LOGS_ENABLED", false);
    }

    /**
     * Collect Prometheus metrics and allow the exposition endpoint to start
     */
    static bool is_metrics_enabled() {
        return get_env_bool("ALLOCWATCH_METRICS_ENABLED", false);
    }

private:
    /**
     * Returns `true` if the variable is "true", "1" or "yes" (case-insensitive),
     * `default_value` if it is unset, `false` otherwise.
     */
    static bool get_env_bool(const char* env_var, bool default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return default_value;
        }

        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        return (str_value == "true" || str_value == "1" || str_value == "yes");
    }
};

} // namespace monitor
} // namespace allocwatch
