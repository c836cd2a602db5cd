#pragma once

#include "tollgate/client/core.hpp"
#include "tollgate/client/http_transport.hpp"
#include <caf/expected.hpp>
#include <memory>
#include <string>

namespace tollgate {
namespace client {

struct DebitReceipt {
    std::string receipt_id;
    std::string payment_header;  // value to attach as X-PAYMENT
};

/**
 * Proxy-mode facilitator account endpoint.
 *
 * POSTs the challenge terms with `Authorization: Bearer <api key>`; the
 * facilitator debits the prepaid balance and answers with a receipt.
 * 402 -> insufficient_balance, 401/403 -> auth_error, other non-2xx or a
 * malformed body -> payment_rejected, network failure -> transport_error.
 */
class AccountGateway {
public:
    AccountGateway(std::shared_ptr<HttpTransport> transport, std::string account_url);

    caf::expected<DebitReceipt> debit(const std::string& api_key,
                                      const PaymentChallenge& challenge,
                                      const TimeoutConfig& timeouts);

    const std::string& account_url() const { return account_url_; }

private:
    std::shared_ptr<HttpTransport> transport_;
    std::string account_url_;
};

} // namespace client
} // namespace tollgate
