#pragma once

#include <string>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace tollgate {
namespace client {

/**
 * Runtime feature flags read from environment variables.
 * All flags default to `false`.
 *
 * - TOLLGATE_METRICS_ENABLED: collect Prometheus metrics for payments,
 *   spend and pipeline steps
 * - TOLLGATE_DEBUG_LOGGING: emit DEBUG log lines (challenge terms, headers)
 */
class FeatureFlags {
public:
    static bool is_metrics_enabled() {
        return get_env_bool("TOLLGATE_METRICS_ENABLED", false);
    }

    static bool is_debug_logging_enabled() {
        return get_env_bool("TOLLGATE_DEBUG_LOGGING", false);
    }

private:
    /**
     * Returns `true` if the variable is set to "true", "1" or "yes"
     * (case-insensitive), `default_value` if unset.
     */
    static bool get_env_bool(const char* env_var, bool default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return default_value;
        }

        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(), ::tolower);

        return (str_value == "true" || str_value == "1" || str_value == "yes");
    }
};

} // namespace client
} // namespace tollgate
