#pragma once

#include "tollgate/client/core.hpp"
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/tracer.h>
#include <memory>
#include <string>
#include <unordered_map>

namespace tollgate {
namespace client {

using LogFields = std::unordered_map<std::string, std::string>;

class Observability {
public:
    explicit Observability(const std::string& component_id);

    // Metrics (gated behind TOLLGATE_METRICS_ENABLED)
    void record_payment(PaymentModeKind mode, const std::string& network,
                        const std::string& asset, const std::string& outcome);
    void record_spend(const std::string& asset, const Amount& committed_total);
    void record_step_execution(const std::string& step, const std::string& status,
                               double duration_seconds);
    void record_pipeline_execution(const std::string& status, double duration_seconds);

    // Prometheus text format
    std::string get_metrics_response() const;
    std::shared_ptr<prometheus::Registry> registry() { return registry_; }

    // Tracing
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> start_span(
        const std::string& operation,
        const RunContext& ctx,
        const std::string& step = "");

    // Logging
    void log_info(const std::string& message,
                  const RunContext& ctx = {},
                  const std::string& step = "",
                  const LogFields& context = {});

    void log_warn(const std::string& message,
                  const RunContext& ctx = {},
                  const std::string& step = "",
                  const LogFields& context = {});

    void log_error(const std::string& message,
                   const RunContext& ctx = {},
                   const std::string& step = "",
                   const LogFields& context = {});

    void log_debug(const std::string& message,
                   const RunContext& ctx = {},
                   const std::string& step = "",
                   const LogFields& context = {});

    /**
     * One JSON log line: timestamp, level, component, message, correlation
     * fields at top level and a redacted `context` object.
     */
    std::string format_json_log(const std::string& level,
                                const std::string& message,
                                const RunContext& ctx,
                                const std::string& step,
                                const LogFields& context) const;

    // True for field names that may carry credentials or key material
    static bool is_secret_field(const std::string& field_name);

private:
    std::string component_id_;
    bool metrics_enabled_;
    bool debug_enabled_;
    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Family<prometheus::Counter>* payments_total_family_;
    prometheus::Family<prometheus::Gauge>* spend_committed_family_;
    prometheus::Family<prometheus::Counter>* step_executions_total_family_;
    prometheus::Family<prometheus::Histogram>* step_duration_seconds_family_;
    prometheus::Family<prometheus::Histogram>* pipeline_duration_seconds_family_;

    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;

    void initialize_metrics();
    void initialize_tracing();
    void write_line(bool to_stderr, const std::string& line) const;
};

} // namespace client
} // namespace tollgate
