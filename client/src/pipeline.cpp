#include "tollgate/client/pipeline.hpp"
#include "tollgate/client/result_converter.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace tollgate {
namespace client {

using json = nlohmann::json;

namespace {

int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

// Builder errors from outside the payment_errc category become invalid_request
caf::error as_payment_error(const caf::error& err) {
    if (code_of(err) != payment_errc::none) {
        return err;
    }
    return caf::make_error(payment_errc::invalid_request, describe(err));
}

} // namespace

std::optional<json> PipelineContext::output_of(const std::string& step) const {
    for (const auto& result : completed_) {
        if (result.name == step && result.is_success()) {
            return result.output;
        }
    }
    return std::nullopt;
}

caf::expected<json> PipelineContext::require(const std::string& step) const {
    if (auto output = output_of(step)) {
        return *output;
    }
    return caf::make_error(payment_errc::invalid_request, "no output from step '" + step + "'");
}

caf::expected<json> StepSpec::default_output(const HttpResponse& response) {
    auto doc = json::parse(response.body, nullptr, false);
    if (doc.is_discarded()) {
        return json(response.body);
    }
    return doc;
}

Pipeline::Pipeline(std::string pipeline_id,
                   std::shared_ptr<PaymentExecutor> executor,
                   std::shared_ptr<Observability> observability,
                   std::string trace_id)
    : pipeline_id_(std::move(pipeline_id)),
      executor_(std::move(executor)),
      observability_(std::move(observability)) {
    run_context_.pipeline_id = pipeline_id_;
    run_context_.trace_id = trace_id.empty() ? pipeline_id_ : std::move(trace_id);
}

PipelineSummary Pipeline::run(const std::vector<StepSpec>& steps, const CancellationToken& token) {
    return execute_from(steps, {}, token);
}

PipelineSummary Pipeline::resume(const std::vector<StepSpec>& steps,
                                 const PipelineSummary& previous,
                                 const CancellationToken& token) {
    std::vector<StepResult> completed;
    for (const auto& spec : steps) {
        const auto* result = previous.find(spec.name);
        if (result == nullptr || !result->is_success()) {
            break;
        }
        completed.push_back(*result);
    }
    if (observability_) {
        observability_->log_info("Resuming pipeline", run_context_, "", {
            {"completed_steps", std::to_string(completed.size())},
            {"total_steps", std::to_string(steps.size())}
        });
    }
    return execute_from(steps, std::move(completed), token);
}

PipelineSummary Pipeline::run_with_policy(const std::vector<StepSpec>& steps,
                                          const RetryPolicy& policy,
                                          const CancellationToken& token) {
    auto start_time = std::chrono::steady_clock::now();
    auto summary = run(steps, token);

    for (int32_t attempt = 0; attempt < policy.max_retries(); ++attempt) {
        if (summary.status != PipelineStatus::failed || summary.steps.empty()) {
            break;
        }
        const auto& failed = summary.steps.back();
        if (!policy.is_retryable(failed.error_code)) {
            break;
        }
        if (policy.is_budget_exhausted(elapsed_ms(start_time), attempt)) {
            if (observability_) {
                observability_->log_warn("Retry budget exhausted", run_context_, failed.name);
            }
            break;
        }

        auto delay = policy.calculate_backoff_delay(attempt);
        if (observability_) {
            observability_->log_warn("Retrying pipeline after transport error", run_context_, failed.name, {
                {"attempt", std::to_string(attempt + 1)},
                {"delay_ms", std::to_string(delay)},
                {"error", failed.error_message}
            });
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        summary = resume(steps, summary, token);
    }
    return summary;
}

PipelineSummary Pipeline::execute_from(const std::vector<StepSpec>& steps,
                                       std::vector<StepResult> completed,
                                       const CancellationToken& token) {
    auto start_time = std::chrono::steady_clock::now();
    PipelineSummary summary;
    summary.pipeline_id = pipeline_id_;
    summary.status = PipelineStatus::completed;

    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span;
    if (observability_) {
        span = observability_->start_span("pipeline.run", run_context_);
    }

    size_t index = completed.size();
    summary.steps = std::move(completed);

    for (; index < steps.size(); ++index) {
        if (token.is_cancelled()) {
            summary.status = PipelineStatus::cancelled;
            if (observability_) {
                observability_->log_warn("Pipeline cancelled", run_context_, steps[index].name);
            }
            break;
        }

        auto result = execute_step(steps[index], index, summary.steps);
        bool failed = result.is_failure();
        summary.steps.push_back(std::move(result));
        if (failed) {
            summary.status = PipelineStatus::failed;
            ++index;
            break;
        }
    }
    for (; index < steps.size(); ++index) {
        summary.not_attempted.push_back(steps[index].name);
    }

    summary.latency_ms = elapsed_ms(start_time);
    finalize(summary);

    auto status = ResultConverter::pipeline_status_to_string(summary.status);
    if (observability_) {
        observability_->record_pipeline_execution(status, summary.latency_ms / 1000.0);
        observability_->log_info("Pipeline finished", run_context_, "", {
            {"status", status},
            {"steps_attempted", std::to_string(summary.steps.size())},
            {"steps_not_attempted", std::to_string(summary.not_attempted.size())},
            {"payments_made", std::to_string(summary.payments_made())},
            {"latency_ms", std::to_string(summary.latency_ms)}
        });
    }
    if (span) {
        span->SetAttribute("tollgate.pipeline.status", opentelemetry::nostd::string_view(status));
        span->End();
    }
    return summary;
}

StepResult Pipeline::execute_step(const StepSpec& spec, size_t index,
                                  const std::vector<StepResult>& completed) {
    auto start_time = std::chrono::steady_clock::now();
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span;
    if (observability_) {
        span = observability_->start_span("pipeline.step", run_context_, spec.name);
    }

    auto finish = [&](StepResult result) {
        auto status = ResultConverter::status_to_string(result.status);
        if (observability_) {
            observability_->record_step_execution(spec.name, status, result.latency_ms / 1000.0);
            if (result.is_failure()) {
                observability_->log_error("Step failed", run_context_, spec.name, {
                    {"error_code", to_string(result.error_code)},
                    {"error", result.error_message},
                    {"payment_incurred", result.has_payment() ? "true" : "false"}
                });
            } else {
                observability_->log_info("Step succeeded", run_context_, spec.name, {
                    {"http_status", std::to_string(result.http_status)},
                    {"paid", result.has_payment() ? "true" : "false"},
                    {"latency_ms", std::to_string(result.latency_ms)}
                });
            }
        }
        if (span) {
            span->SetAttribute("tollgate.step.status", opentelemetry::nostd::string_view(status));
            span->End();
        }
        return result;
    };

    if (observability_) {
        observability_->log_info("Step started", run_context_, spec.name,
                                 {{"index", std::to_string(index)}});
    }

    if (!spec.build) {
        return finish(StepResult::failure(spec.name, index, run_context_,
                                          caf::make_error(payment_errc::invalid_request,
                                                          "step '" + spec.name + "' has no request builder"),
                                          std::nullopt, elapsed_ms(start_time)));
    }

    PipelineContext context(run_context_, completed);
    auto request = spec.build(context);
    if (!request) {
        return finish(StepResult::failure(spec.name, index, run_context_, as_payment_error(request.error()),
                                          std::nullopt, elapsed_ms(start_time)));
    }

    std::optional<PaymentProof> incurred;
    auto paid = executor_->execute(*request, incurred, run_context_);
    if (!paid) {
        return finish(StepResult::failure(spec.name, index, run_context_, paid.error(),
                                          std::move(incurred), elapsed_ms(start_time)));
    }

    int status_code = paid->response.status_code;
    bool accepted = spec.accept_status ? spec.accept_status(status_code) : paid->response.is_success();
    if (!accepted) {
        auto result = StepResult::failure(spec.name, index, run_context_,
                                          caf::make_error(payment_errc::http_error,
                                                          "step '" + spec.name + "' returned status "
                                                              + std::to_string(status_code)),
                                          std::move(paid->proof), elapsed_ms(start_time), status_code);
        result.body = std::move(paid->response.body);
        return finish(std::move(result));
    }

    auto output = spec.extract_output ? spec.extract_output(paid->response)
                                      : StepSpec::default_output(paid->response);
    if (!output) {
        auto result = StepResult::failure(spec.name, index, run_context_, as_payment_error(output.error()),
                                          std::move(paid->proof), elapsed_ms(start_time), status_code);
        result.body = std::move(paid->response.body);
        return finish(std::move(result));
    }

    return finish(StepResult::success(spec.name, index, run_context_, status_code,
                                      std::move(paid->response.body), std::move(*output),
                                      std::move(paid->proof), elapsed_ms(start_time)));
}

void Pipeline::finalize(PipelineSummary& summary) {
    summary.total_spent.clear();
    for (const auto& step : summary.steps) {
        // Committed proofs moved funds, accepted upstream or not
        if (!step.payment || !step.payment->committed) {
            continue;
        }
        const auto& amount = step.payment->amount;
        auto it = summary.total_spent.find(step.payment->asset);
        if (it == summary.total_spent.end()) {
            summary.total_spent.emplace(step.payment->asset, amount);
            continue;
        }
        auto scale = std::max(it->second.decimals(), amount.decimals());
        auto lhs = it->second.rescale(scale);
        auto rhs = amount.rescale(scale);
        if (lhs && rhs) {
            if (auto sum = lhs->plus(*rhs)) {
                it->second = *sum;
            }
        }
    }
}

} // namespace client
} // namespace tollgate
