#pragma once

#include "tollgate/client/challenge_parser.hpp"
#include "tollgate/client/core.hpp"
#include "tollgate/client/http_transport.hpp"
#include "tollgate/client/observability.hpp"
#include "tollgate/client/payment_resolver.hpp"
#include "tollgate/client/spend_guard.hpp"
#include <caf/expected.hpp>
#include <memory>
#include <optional>

namespace tollgate {
namespace client {

struct PaidResponse {
    HttpResponse response;
    std::optional<PaymentProof> proof;  // set only when a 402 was answered
};

/**
 * Challenge / pay / retry cycle for one HTTP call.
 *
 * A 402 is parsed, checked against the spend guard, resolved, and the
 * request is sent again exactly once with the proof attached. A second 402
 * is payment_not_accepted; the executor never pays twice for one call.
 * A proof cached by an earlier call is applied again without signing, and
 * its spend is committed to the guard once, by whichever call moves it.
 */
class PaymentExecutor {
public:
    PaymentExecutor(std::shared_ptr<HttpTransport> transport,
                    std::shared_ptr<SpendGuard> guard,
                    std::shared_ptr<PaymentResolver> resolver,
                    PaymentMode mode,
                    ChallengeParser parser = ChallengeParser{},
                    TimeoutConfig timeouts = {},
                    std::shared_ptr<Observability> observability = nullptr);

    caf::expected<PaidResponse> execute(const HttpRequest& request, const RunContext& ctx = {});

    // On error, `incurred` holds the proof of a payment that was already
    // made for this call (funds moved but the request did not complete).
    caf::expected<PaidResponse> execute(const HttpRequest& request,
                                        std::optional<PaymentProof>& incurred,
                                        const RunContext& ctx = {});

    const PaymentMode& mode() const { return mode_; }

    // Copies x-client-payment and x-payment-response (or payment-response)
    // from the accepted response into the proof
    static void apply_payment_headers(const HttpResponse& response, PaymentProof& proof,
                                      Observability* observability = nullptr,
                                      const RunContext& ctx = {});

private:
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<SpendGuard> guard_;
    std::shared_ptr<PaymentResolver> resolver_;
    PaymentMode mode_;
    ChallengeParser parser_;
    TimeoutConfig timeouts_;
    std::shared_ptr<Observability> observability_;

    std::optional<ChainFamily> payable_family() const;
    void record_payment(const PaymentProof& proof, const std::string& outcome);
};

} // namespace client
} // namespace tollgate
