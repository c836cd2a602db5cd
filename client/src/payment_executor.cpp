#include "tollgate/client/payment_executor.hpp"
#include "tollgate/client/encoding.hpp"
#include "tollgate/client/signer.hpp"
#include <nlohmann/json.hpp>

namespace tollgate {
namespace client {

using json = nlohmann::json;

PaymentExecutor::PaymentExecutor(std::shared_ptr<HttpTransport> transport,
                                 std::shared_ptr<SpendGuard> guard,
                                 std::shared_ptr<PaymentResolver> resolver,
                                 PaymentMode mode,
                                 ChallengeParser parser,
                                 TimeoutConfig timeouts,
                                 std::shared_ptr<Observability> observability)
    : transport_(std::move(transport)),
      guard_(std::move(guard)),
      resolver_(std::move(resolver)),
      mode_(std::move(mode)),
      parser_(std::move(parser)),
      timeouts_(timeouts),
      observability_(std::move(observability)) {}

std::optional<ChainFamily> PaymentExecutor::payable_family() const {
    if (auto relay = std::get_if<RelayMode>(&mode_)) {
        if (relay->signer) {
            return relay->signer->family();
        }
    }
    return std::nullopt;
}

void PaymentExecutor::record_payment(const PaymentProof& proof, const std::string& outcome) {
    if (observability_) {
        observability_->record_payment(proof.mode, proof.network, proof.asset, outcome);
    }
}

caf::expected<PaidResponse> PaymentExecutor::execute(const HttpRequest& request, const RunContext& ctx) {
    std::optional<PaymentProof> incurred;
    return execute(request, incurred, ctx);
}

caf::expected<PaidResponse> PaymentExecutor::execute(const HttpRequest& request,
                                                     std::optional<PaymentProof>& incurred,
                                                     const RunContext& ctx) {
    incurred.reset();

    auto first = transport_->send(request, timeouts_);
    if (!first) {
        return first.error();
    }
    if (!first->is_payment_required()) {
        return PaidResponse{std::move(*first), std::nullopt};
    }

    auto challenge = parser_.parse(*first, payable_family());
    if (!challenge) {
        if (observability_) {
            observability_->log_warn("Unrecognized payment challenge", ctx, "", {
                {"url", request.url},
                {"error", describe(challenge.error())}
            });
        }
        return challenge.error();
    }

    if (observability_) {
        observability_->log_info("Payment required", ctx, "", {
            {"url", request.url},
            {"network", challenge->network},
            {"asset", challenge->asset},
            {"amount", challenge->amount.to_decimal_string()},
            {"pay_to", challenge->pay_to}
        });
    }

    // A proof that exists but was never accepted upstream is applied again
    // instead of paying a second time. Its spend still needs a hold unless
    // an earlier call already committed it.
    const auto& fingerprint = challenge->fingerprint;
    auto cached = resolver_->lookup(fingerprint);
    std::optional<uint64_t> hold;
    if (!cached || !cached->committed) {
        auto decision = guard_->authorize(challenge->amount, challenge->asset, challenge->network);
        if (!decision.allowed) {
            if (observability_) {
                observability_->log_warn("Payment denied by spend guard", ctx, "", {
                    {"asset", challenge->asset},
                    {"reason", decision.reason}
                });
            }
            return caf::make_error(payment_errc::spend_limit_exceeded, decision.reason);
        }
        hold = decision.hold_id;
    }

    std::optional<PaymentProof> proof;
    if (cached) {
        proof = std::move(cached->proof);
        proof->committed = cached->committed;
    } else {
        auto resolution = resolver_->resolve(*challenge, mode_, ctx);
        if (!resolution) {
            guard_->release(*hold);
            return resolution.error();
        }
        proof = std::move(resolution->proof);
    }
    incurred = proof;

    // Exactly one caller turns its hold into spend for a given proof
    auto commit_spend = [&]() {
        if (!hold) {
            return;
        }
        if (resolver_->mark_committed(fingerprint)) {
            if (auto err = guard_->commit(*hold)) {
                if (observability_) {
                    observability_->log_error("Failed to commit spend", ctx, "", {{"error", describe(err)}});
                }
            } else if (observability_) {
                observability_->record_spend(proof->asset, guard_->spent(proof->asset, proof->amount.decimals()));
            }
        } else {
            guard_->release(*hold);
        }
        hold.reset();
        proof->committed = true;
    };

    HttpRequest paid = request;
    paid.set_header("X-PAYMENT", proof->payment_header);
    auto second = transport_->send(paid, timeouts_);

    if (!second) {
        // Funds already moved; the proof stays cached for a caller retry
        commit_spend();
        incurred = proof;
        record_payment(*proof, "unapplied");
        if (observability_) {
            observability_->log_error("Paid resend failed", ctx, "", {
                {"url", request.url},
                {"error", describe(second.error())}
            });
        }
        return second.error();
    }

    if (second->is_payment_required()) {
        if (hold) {
            guard_->release(*hold);
        }
        record_payment(*proof, "not_accepted");
        if (observability_) {
            observability_->log_error("Payment not accepted by upstream", ctx, "", {
                {"url", request.url},
                {"fingerprint", proof->challenge_fingerprint}
            });
        }
        return caf::make_error(payment_errc::payment_not_accepted,
                               "upstream answered 402 again after payment for " + request.url);
    }

    commit_spend();
    proof->accepted = true;
    apply_payment_headers(*second, *proof, observability_.get(), ctx);
    resolver_->settle(fingerprint);
    incurred = proof;
    record_payment(*proof, "accepted");

    if (observability_) {
        observability_->log_info("Payment accepted", ctx, "", {
            {"url", request.url},
            {"status", std::to_string(second->status_code)},
            {"client_tx", proof->client_tx.value},
            {"facilitator_tx", proof->facilitator_tx.value},
            {"debit_receipt", proof->debit_receipt}
        });
    }
    return PaidResponse{std::move(*second), std::move(proof)};
}

void PaymentExecutor::apply_payment_headers(const HttpResponse& response, PaymentProof& proof,
                                            Observability* observability, const RunContext& ctx) {
    if (auto client_payment = response.header("x-client-payment")) {
        proof.client_payment_header = *client_payment;
        if (proof.client_tx.empty()) {
            proof.client_tx = TxHash{*client_payment, proof.network};
        }
    }

    auto payment_response = response.header("payment-response");
    if (!payment_response) {
        payment_response = response.header("x-payment-response");
    }
    if (!payment_response) {
        return;
    }

    auto decoded = base64_decode(*payment_response);
    json doc = json::value_t::discarded;
    if (decoded) {
        doc = json::parse(*decoded, nullptr, false);
    }
    if (doc.is_discarded() || !doc.is_object()) {
        if (observability) {
            observability->log_warn("Could not decode payment response header", ctx);
        }
        proof.payment_response = json{{"raw", *payment_response}};
        return;
    }

    proof.payment_response = doc;
    if (doc.contains("transaction") && doc["transaction"].is_string()) {
        auto network = proof.network;
        if (doc.contains("network") && doc["network"].is_string()) {
            network = doc["network"].get<std::string>();
        }
        proof.facilitator_tx = TxHash{doc["transaction"].get<std::string>(), network};
    }
}

} // namespace client
} // namespace tollgate
