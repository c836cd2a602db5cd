#include "tollgate/client/observability.hpp"
#include "tollgate/client/feature_flags.hpp"
#include <prometheus/text_serializer.h>
#include <opentelemetry/trace/provider.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <map>
#include <mutex>
#include <vector>

namespace tollgate {
namespace client {

using json = nlohmann::json;

// Credential and key material field names to redact
static const std::vector<std::string> SECRET_FIELDS = {
    "private_key", "api_key", "secret", "token", "authorization",
    "credential", "signature", "password", "mnemonic"
};

// Header names whose whole value is a signed payload
static const std::vector<std::string> SECRET_HEADERS = {
    "x-payment", "payment-signature"
};

static std::mutex& output_mutex() {
    static std::mutex mutex;
    return mutex;
}

// Recursively redact secrets from a JSON object
static void filter_secrets_recursive(json& obj) {
    if (obj.is_object()) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (Observability::is_secret_field(it.key())) {
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

// ISO 8601 timestamp with microseconds
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

bool Observability::is_secret_field(const std::string& field_name) {
    auto lower_field = lowercase(field_name);
    if (std::find(SECRET_HEADERS.begin(), SECRET_HEADERS.end(), lower_field) != SECRET_HEADERS.end()) {
        return true;
    }
    for (const auto& secret : SECRET_FIELDS) {
        if (lower_field.find(secret) != std::string::npos) {
            return true;
        }
    }
    return false;
}

Observability::Observability(const std::string& component_id)
    : component_id_(component_id),
      metrics_enabled_(FeatureFlags::is_metrics_enabled()),
      debug_enabled_(FeatureFlags::is_debug_logging_enabled()) {
    initialize_metrics();
    initialize_tracing();
}

void Observability::initialize_metrics() {
    registry_ = std::make_shared<prometheus::Registry>();

    payments_total_family_ = &prometheus::BuildCounter()
        .Name("tollgate_payments_total")
        .Help("Payments attempted, by mode, network, asset and outcome")
        .Labels({{"component", component_id_}})
        .Register(*registry_);

    spend_committed_family_ = &prometheus::BuildGauge()
        .Name("tollgate_spend_committed")
        .Help("Committed spend in the active window, in asset units")
        .Labels({{"component", component_id_}})
        .Register(*registry_);

    step_executions_total_family_ = &prometheus::BuildCounter()
        .Name("tollgate_step_executions_total")
        .Help("Pipeline step executions by status")
        .Labels({{"component", component_id_}})
        .Register(*registry_);

    step_duration_seconds_family_ = &prometheus::BuildHistogram()
        .Name("tollgate_step_duration_seconds")
        .Help("Pipeline step duration in seconds")
        .Labels({{"component", component_id_}})
        .Register(*registry_);

    pipeline_duration_seconds_family_ = &prometheus::BuildHistogram()
        .Name("tollgate_pipeline_duration_seconds")
        .Help("Pipeline duration in seconds")
        .Labels({{"component", component_id_}})
        .Register(*registry_);
}

void Observability::initialize_tracing() {
    // Uses whatever provider the host registered; the API default is a no-op.
    auto provider = opentelemetry::trace::Provider::GetTracerProvider();
    tracer_ = provider->GetTracer("tollgate_client", "1.0.0");
}

void Observability::record_payment(PaymentModeKind mode, const std::string& network,
                                   const std::string& asset, const std::string& outcome) {
    if (!metrics_enabled_) {
        return;
    }
    payments_total_family_->Add({
        {"mode", to_string(mode)},
        {"network", network},
        {"asset", asset},
        {"outcome", outcome}
    }).Increment();
}

void Observability::record_spend(const std::string& asset, const Amount& committed_total) {
    if (!metrics_enabled_) {
        return;
    }
    // Gauge precision is a double; the ledger itself stays exact.
    double value = std::stod(committed_total.to_decimal_string());
    spend_committed_family_->Add({{"asset", asset}}).Set(value);
}

void Observability::record_step_execution(const std::string& step, const std::string& status,
                                          double duration_seconds) {
    if (!metrics_enabled_) {
        return;
    }
    step_executions_total_family_->Add({{"step", step}, {"status", status}}).Increment();
    step_duration_seconds_family_->Add(
        {{"step", step}},
        prometheus::Histogram::BucketBoundaries{0.05, 0.1, 0.5, 1.0, 2.0, 5.0, 10.0, 30.0}
    ).Observe(duration_seconds);
}

void Observability::record_pipeline_execution(const std::string& status, double duration_seconds) {
    if (!metrics_enabled_) {
        return;
    }
    pipeline_duration_seconds_family_->Add(
        {{"status", status}},
        prometheus::Histogram::BucketBoundaries{0.5, 1.0, 5.0, 10.0, 30.0, 60.0, 120.0}
    ).Observe(duration_seconds);
}

std::string Observability::get_metrics_response() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> Observability::start_span(
    const std::string& operation,
    const RunContext& ctx,
    const std::string& step) {
    using opentelemetry::nostd::string_view;
    return tracer_->StartSpan(operation, {
        {"pipeline_id", string_view(ctx.pipeline_id)},
        {"trace_id", string_view(ctx.trace_id)},
        {"step", string_view(step)},
        {"component", string_view(component_id_)}
    });
}

void Observability::log_info(const std::string& message,
                             const RunContext& ctx,
                             const std::string& step,
                             const LogFields& context) {
    write_line(false, format_json_log("INFO", message, ctx, step, context));
}

void Observability::log_warn(const std::string& message,
                             const RunContext& ctx,
                             const std::string& step,
                             const LogFields& context) {
    write_line(true, format_json_log("WARN", message, ctx, step, context));
}

void Observability::log_error(const std::string& message,
                              const RunContext& ctx,
                              const std::string& step,
                              const LogFields& context) {
    write_line(true, format_json_log("ERROR", message, ctx, step, context));
}

void Observability::log_debug(const std::string& message,
                              const RunContext& ctx,
                              const std::string& step,
                              const LogFields& context) {
    if (!debug_enabled_) {
        return;
    }
    write_line(false, format_json_log("DEBUG", message, ctx, step, context));
}

void Observability::write_line(bool to_stderr, const std::string& line) const {
    std::lock_guard<std::mutex> lock(output_mutex());
    if (to_stderr) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

std::string Observability::format_json_log(const std::string& level,
                                           const std::string& message,
                                           const RunContext& ctx,
                                           const std::string& step,
                                           const LogFields& context) const {
    json log_entry;

    log_entry["timestamp"] = get_iso8601_timestamp();
    log_entry["level"] = level;
    log_entry["component"] = "tollgate";
    log_entry["message"] = message;

    if (!ctx.pipeline_id.empty()) {
        log_entry["pipeline_id"] = ctx.pipeline_id;
    }
    if (!step.empty()) {
        log_entry["step"] = step;
    }
    if (!ctx.trace_id.empty()) {
        log_entry["trace_id"] = ctx.trace_id;
    }

    json context_obj;
    context_obj["component_id"] = component_id_;
    // Sorted so identical fields always render identically
    std::map<std::string, std::string> sorted(context.begin(), context.end());
    for (const auto& [key, value] : sorted) {
        context_obj[key] = value;
    }
    filter_secrets_recursive(context_obj);
    log_entry["context"] = context_obj;

    return log_entry.dump();
}

} // namespace client
} // namespace tollgate
