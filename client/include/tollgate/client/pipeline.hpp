#pragma once

#include "tollgate/client/core.hpp"
#include "tollgate/client/observability.hpp"
#include "tollgate/client/payment_executor.hpp"
#include "tollgate/client/retry_policy.hpp"
#include <atomic>
#include <caf/expected.hpp>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tollgate {
namespace client {

// Read-only view of a run handed to request builders
class PipelineContext {
public:
    PipelineContext(RunContext run, const std::vector<StepResult>& completed)
        : run_(std::move(run)), completed_(completed) {}

    const RunContext& run() const { return run_; }

    const std::vector<StepResult>& completed() const { return completed_; }

    // Output of an earlier succeeded step
    std::optional<nlohmann::json> output_of(const std::string& step) const;

    // Like output_of(), but a missing step is invalid_request
    caf::expected<nlohmann::json> require(const std::string& step) const;

private:
    RunContext run_;
    const std::vector<StepResult>& completed_;
};

struct StepSpec {
    using Builder = std::function<caf::expected<HttpRequest>(const PipelineContext&)>;
    using Extractor = std::function<caf::expected<nlohmann::json>(const HttpResponse&)>;
    using StatusPredicate = std::function<bool(int)>;

    std::string name;
    Builder build;
    Extractor extract_output;        // empty: body as JSON, else as a string
    StatusPredicate accept_status;   // empty: 2xx

    static caf::expected<nlohmann::json> default_output(const HttpResponse& response);
};

// Checked between steps; a step already started always runs to completion
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * Sequential, fail-fast orchestration of payment-aware calls.
 *
 * The first failing step ends the run; its StepResult keeps the error and
 * any payment already incurred, and the remaining steps are listed as
 * never attempted. run() never retries; resume() and run_with_policy()
 * are the caller-side ways to continue.
 */
class Pipeline {
public:
    Pipeline(std::string pipeline_id,
             std::shared_ptr<PaymentExecutor> executor,
             std::shared_ptr<Observability> observability = nullptr,
             std::string trace_id = "");

    PipelineSummary run(const std::vector<StepSpec>& steps,
                        const CancellationToken& token = CancellationToken());

    // Re-runs from the first step of `previous` that did not succeed,
    // keeping earlier results and outputs
    PipelineSummary resume(const std::vector<StepSpec>& steps,
                           const PipelineSummary& previous,
                           const CancellationToken& token = CancellationToken());

    // run(), then resume() after transport_error failures with backoff
    PipelineSummary run_with_policy(const std::vector<StepSpec>& steps,
                                    const RetryPolicy& policy,
                                    const CancellationToken& token = CancellationToken());

    const std::string& id() const { return pipeline_id_; }

private:
    std::string pipeline_id_;
    std::shared_ptr<PaymentExecutor> executor_;
    std::shared_ptr<Observability> observability_;
    RunContext run_context_;

    PipelineSummary execute_from(const std::vector<StepSpec>& steps,
                                 std::vector<StepResult> completed,
                                 const CancellationToken& token);

    StepResult execute_step(const StepSpec& spec, size_t index,
                            const std::vector<StepResult>& completed);

    static void finalize(PipelineSummary& summary);
};

} // namespace client
} // namespace tollgate
