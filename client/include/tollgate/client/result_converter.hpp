#pragma once

#include "tollgate/client/core.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace tollgate {
namespace client {

// Renders StepResult / PipelineSummary for presentation layers and the
// payment summary report. Tx hashes and receipts are public audit data;
// payment header values are never rendered.
class ResultConverter {
public:
    // Contract: "succeeded" | "failed" | "not_attempted"
    static std::string status_to_string(StepStatus status);

    static StepStatus string_to_status(const std::string& status_str);

    // Contract: "completed" | "failed" | "cancelled"
    static std::string pipeline_status_to_string(PipelineStatus status);

    // Upper-case machine code, e.g. "SPEND_LIMIT_EXCEEDED"
    static std::string error_code_to_string(payment_errc code);

    static nlohmann::json proof_to_json(const PaymentProof& proof);

    static nlohmann::json step_to_json(const StepResult& result);

    /**
     * Payment summary report:
     * {
     *   "pipeline_id", "status", "latency_ms",
     *   "steps": [...attempted...],
     *   "not_attempted": [names],
     *   "payments_made": n,
     *   "total_spent": {"USDC": "0.050000"}
     * }
     */
    static nlohmann::json to_json(const PipelineSummary& summary);

    // A failed result must carry an error code, a succeeded one must not
    static bool validate_result(const StepResult& result);
};

} // namespace client
} // namespace tollgate
