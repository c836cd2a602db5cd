#include "tollgate/client/result_converter.hpp"
#include <algorithm>
#include <cctype>

namespace tollgate {
namespace client {

using json = nlohmann::json;

std::string ResultConverter::status_to_string(StepStatus status) {
    switch (status) {
        case StepStatus::succeeded:
            return "succeeded";
        case StepStatus::failed:
            return "failed";
        case StepStatus::not_attempted:
            return "not_attempted";
        default:
            return "failed";
    }
}

StepStatus ResultConverter::string_to_status(const std::string& status_str) {
    if (status_str == "succeeded") {
        return StepStatus::succeeded;
    } else if (status_str == "not_attempted") {
        return StepStatus::not_attempted;
    }
    return StepStatus::failed;  // Default to failed for unknown status
}

std::string ResultConverter::pipeline_status_to_string(PipelineStatus status) {
    switch (status) {
        case PipelineStatus::completed:
            return "completed";
        case PipelineStatus::failed:
            return "failed";
        case PipelineStatus::cancelled:
            return "cancelled";
        default:
            return "failed";
    }
}

std::string ResultConverter::error_code_to_string(payment_errc code) {
    auto name = to_string(code);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return name;
}

json ResultConverter::proof_to_json(const PaymentProof& proof) {
    json doc = {
        {"mode", to_string(proof.mode)},
        {"fingerprint", proof.challenge_fingerprint},
        {"amount", proof.amount.to_decimal_string()},
        {"asset", proof.asset},
        {"network", proof.network},
        {"committed", proof.committed},
        {"accepted", proof.accepted}
    };
    if (proof.mode == PaymentModeKind::relay) {
        doc["client_tx"] = proof.client_tx.empty() ? json(nullptr)
                                                   : json{{"hash", proof.client_tx.value},
                                                          {"network", proof.client_tx.network}};
        doc["facilitator_tx"] = proof.facilitator_tx.empty() ? json(nullptr)
                                                             : json{{"hash", proof.facilitator_tx.value},
                                                                    {"network", proof.facilitator_tx.network}};
    } else {
        doc["debit_receipt"] = proof.debit_receipt;
    }
    if (!proof.payment_response.is_null()) {
        doc["payment_response"] = proof.payment_response;
    }
    return doc;
}

json ResultConverter::step_to_json(const StepResult& result) {
    json doc = {
        {"name", result.name},
        {"index", result.index},
        {"status", status_to_string(result.status)},
        {"latency_ms", result.latency_ms}
    };
    if (result.http_status != 0) {
        doc["http_status"] = result.http_status;
    }
    if (result.status == StepStatus::failed) {
        doc["error_code"] = error_code_to_string(result.error_code);
        doc["error_message"] = result.error_message;
    } else if (!result.output.is_null()) {
        doc["output"] = result.output;
    }
    doc["payment"] = result.payment ? proof_to_json(*result.payment) : json(nullptr);
    if (!result.metadata.trace_id.empty()) {
        doc["trace_id"] = result.metadata.trace_id;
    }
    return doc;
}

json ResultConverter::to_json(const PipelineSummary& summary) {
    json steps = json::array();
    for (const auto& step : summary.steps) {
        steps.push_back(step_to_json(step));
    }
    json total = json::object();
    for (const auto& [asset, amount] : summary.total_spent) {
        total[asset] = amount.to_decimal_string();
    }
    return json{
        {"pipeline_id", summary.pipeline_id},
        {"status", pipeline_status_to_string(summary.status)},
        {"latency_ms", summary.latency_ms},
        {"steps", steps},
        {"not_attempted", summary.not_attempted},
        {"payments_made", summary.payments_made()},
        {"total_spent", total}
    };
}

bool ResultConverter::validate_result(const StepResult& result) {
    if (result.status == StepStatus::succeeded && result.error_code != payment_errc::none) {
        return false;  // Invalid: success status with error code
    }
    if (result.status == StepStatus::failed && result.error_code == payment_errc::none) {
        return false;  // Invalid: failure status without error code
    }
    if (result.payment && result.payment->payment_header.empty()) {
        return false;  // Invalid: a proof always carries the header it was sent with
    }
    return true;
}

} // namespace client
} // namespace tollgate
