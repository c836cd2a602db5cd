#include "tollgate/client/account_gateway.hpp"
#include <nlohmann/json.hpp>

namespace tollgate {
namespace client {

using json = nlohmann::json;

AccountGateway::AccountGateway(std::shared_ptr<HttpTransport> transport, std::string account_url)
    : transport_(std::move(transport)), account_url_(std::move(account_url)) {}

caf::expected<DebitReceipt> AccountGateway::debit(const std::string& api_key,
                                                  const PaymentChallenge& challenge,
                                                  const TimeoutConfig& timeouts) {
    if (api_key.empty()) {
        return caf::make_error(payment_errc::auth_error, "no account credential configured");
    }

    json payload = {
        {"challenge", challenge.raw},
        {"x402Version", challenge.x402_version},
        {"resource", challenge.resource},
        {"fingerprint", challenge.fingerprint}
    };

    HttpRequest request;
    request.method = "POST";
    request.url = account_url_;
    request.set_header("Content-Type", "application/json");
    request.set_header("Accept", "application/json");
    request.set_header("Authorization", "Bearer " + api_key);
    request.body = payload.dump();

    auto response = transport_->send(request, timeouts);
    if (!response) {
        return response.error();
    }

    auto body = json::parse(response->body, nullptr, false);
    std::string detail;
    if (!body.is_discarded() && body.is_object() && body.contains("error") && body["error"].is_string()) {
        detail = ": " + body["error"].get<std::string>();
    }

    switch (response->status_code) {
        case 402:
            return caf::make_error(payment_errc::insufficient_balance,
                                   "account balance cannot cover " + challenge.amount.to_decimal_string()
                                       + " " + challenge.asset + detail);
        case 401:
        case 403:
            return caf::make_error(payment_errc::auth_error,
                                   "account credential rejected with status "
                                       + std::to_string(response->status_code) + detail);
        default:
            break;
    }
    if (!response->is_success()) {
        return caf::make_error(payment_errc::payment_rejected,
                               "account endpoint returned status " + std::to_string(response->status_code) + detail);
    }

    if (body.is_discarded() || !body.is_object()
        || !body.contains("receiptId") || !body["receiptId"].is_string()
        || !body.contains("paymentHeader") || !body["paymentHeader"].is_string()) {
        return caf::make_error(payment_errc::payment_rejected,
                               "account endpoint response lacks receiptId or paymentHeader");
    }

    DebitReceipt receipt;
    receipt.receipt_id = body["receiptId"].get<std::string>();
    receipt.payment_header = body["paymentHeader"].get<std::string>();
    return receipt;
}

} // namespace client
} // namespace tollgate
