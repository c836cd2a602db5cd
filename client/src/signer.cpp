#include "tollgate/client/signer.hpp"
#include <nlohmann/json.hpp>

namespace tollgate {
namespace client {

using json = nlohmann::json;

HttpSigner::HttpSigner(std::shared_ptr<HttpTransport> transport, std::string signer_url,
                       ChainFamily family, std::string identity)
    : transport_(std::move(transport)),
      signer_url_(std::move(signer_url)),
      family_(family),
      identity_(std::move(identity)) {
    while (!signer_url_.empty() && signer_url_.back() == '/') {
        signer_url_.pop_back();
    }
}

json HttpSigner::instruction_to_json(const PaymentInstruction& instruction) {
    json doc = {
        {"scheme", instruction.scheme},
        {"network", instruction.network},
        {"amount", instruction.amount_atomic},
        {"decimals", instruction.decimals},
        {"asset", instruction.asset},
        {"assetAddress", instruction.asset_address},
        {"payTo", instruction.pay_to},
        {"resource", instruction.resource},
        {"fingerprint", instruction.fingerprint}
    };
    if (!instruction.fee_payer.empty()) {
        doc["feePayer"] = instruction.fee_payer;
    }
    if (instruction.nonce) {
        doc["nonce"] = *instruction.nonce;
    }
    return doc;
}

caf::expected<SignerReceipt> HttpSigner::sign_and_submit(const PaymentInstruction& instruction,
                                                         const TimeoutConfig& timeouts) {
    HttpRequest request;
    request.method = "POST";
    request.url = signer_url_ + "/sign";
    request.set_header("Content-Type", "application/json");
    request.set_header("Accept", "application/json");
    request.body = instruction_to_json(instruction).dump();

    auto response = transport_->send(request, timeouts);
    if (!response) {
        return response.error();
    }

    auto body = json::parse(response->body, nullptr, false);
    std::string reason = "signer returned status " + std::to_string(response->status_code);
    if (!body.is_discarded() && body.is_object() && body.contains("error") && body["error"].is_string()) {
        reason += ": " + body["error"].get<std::string>();
    }

    // 409/422: the facilitator declined the payment; everything else non-2xx
    // means no valid signature was produced
    if (response->status_code == 409 || response->status_code == 422) {
        return caf::make_error(payment_errc::payment_rejected, reason);
    }
    if (!response->is_success()) {
        return caf::make_error(payment_errc::signer_error, reason);
    }
    if (body.is_discarded() || !body.is_object()) {
        return caf::make_error(payment_errc::signer_error, "signer response is not a JSON object");
    }

    SignerReceipt receipt;
    receipt.client_tx.network = instruction.network;
    receipt.facilitator_tx.network = instruction.network;
    if (body.contains("clientTx") && body["clientTx"].is_string()) {
        receipt.client_tx.value = body["clientTx"].get<std::string>();
    }
    if (body.contains("facilitatorTx") && body["facilitatorTx"].is_string()) {
        receipt.facilitator_tx.value = body["facilitatorTx"].get<std::string>();
    }
    if (body.contains("paymentHeader") && body["paymentHeader"].is_string()) {
        receipt.payment_header = body["paymentHeader"].get<std::string>();
    }
    return receipt;
}

} // namespace client
} // namespace tollgate
