#include "tollgate/client/payment_resolver.hpp"
#include "tollgate/client/challenge_parser.hpp"
#include "tollgate/client/signer.hpp"
#include <type_traits>
#include <variant>

namespace tollgate {
namespace client {

PaymentResolver::PaymentResolver(std::shared_ptr<HttpTransport> transport,
                                 TimeoutConfig timeouts,
                                 std::shared_ptr<Observability> observability)
    : transport_(std::move(transport)),
      timeouts_(timeouts),
      observability_(std::move(observability)) {}

caf::expected<Resolution> PaymentResolver::resolve(const PaymentChallenge& challenge,
                                                   const PaymentMode& mode,
                                                   const RunContext& ctx) {
    const auto& fingerprint = challenge.fingerprint;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            auto it = entries_.find(fingerprint);
            if (it == entries_.end()) {
                entries_.emplace(fingerprint, Entry{});
                break;
            }
            if (!it->second.in_flight && it->second.proof) {
                if (observability_) {
                    observability_->log_info("Challenge already paid, reusing proof", ctx, "",
                                             {{"fingerprint", fingerprint}});
                }
                return Resolution{*it->second.proof, false};
            }
            settled_cv_.wait(lock);
        }
    }

    if (observability_) {
        observability_->log_info("Resolving payment", ctx, "", {
            {"mode", to_string(kind_of(mode))},
            {"network", challenge.network},
            {"asset", challenge.asset},
            {"amount", challenge.amount.to_decimal_string()},
            {"fingerprint", fingerprint}
        });
    }

    auto proof = std::visit([&](const auto& m) -> caf::expected<PaymentProof> {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RelayMode>) {
            return resolve_relay(challenge, m);
        } else {
            return resolve_proxy(challenge, m);
        }
    }, mode);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!proof) {
        entries_.erase(fingerprint);
        settled_cv_.notify_all();
        if (observability_) {
            observability_->log_warn("Payment resolution failed", ctx, "", {
                {"fingerprint", fingerprint},
                {"error", describe(proof.error())}
            });
        }
        return proof.error();
    }

    auto& entry = entries_[fingerprint];
    entry.in_flight = false;
    entry.proof = *proof;
    settled_cv_.notify_all();
    return Resolution{*proof, true};
}

caf::expected<PaymentProof> PaymentResolver::resolve_relay(const PaymentChallenge& challenge,
                                                           const RelayMode& mode) {
    if (!mode.signer) {
        return caf::make_error(payment_errc::signer_error, "relay mode has no signer configured");
    }
    if (mode.signer->family() != challenge.family) {
        return caf::make_error(payment_errc::signer_error,
                               "signer for " + to_string(mode.signer->family())
                                   + " cannot pay on network " + challenge.network);
    }

    auto instruction = ChallengeParser::make_instruction(challenge);

    auto signer_lock = lock_for(mode.signer->identity());
    auto receipt = [&] {
        std::lock_guard<std::mutex> guard(*signer_lock);
        return mode.signer->sign_and_submit(instruction, timeouts_);
    }();
    if (!receipt) {
        return receipt.error();
    }
    if (receipt->client_tx.empty()) {
        return caf::make_error(payment_errc::signer_error, "signer receipt lacks the client transaction hash");
    }
    if (receipt->payment_header.empty()) {
        return caf::make_error(payment_errc::signer_error, "signer receipt lacks a payment header");
    }

    PaymentProof proof;
    proof.mode = PaymentModeKind::relay;
    proof.challenge_fingerprint = challenge.fingerprint;
    proof.amount = challenge.amount;
    proof.asset = challenge.asset;
    proof.network = challenge.network;
    proof.client_tx = receipt->client_tx;
    proof.facilitator_tx = receipt->facilitator_tx;
    proof.payment_header = receipt->payment_header;
    return proof;
}

caf::expected<PaymentProof> PaymentResolver::resolve_proxy(const PaymentChallenge& challenge,
                                                           const ProxyMode& mode) {
    if (mode.account_url.empty()) {
        return caf::make_error(payment_errc::invalid_request, "proxy mode has no facilitator account endpoint");
    }
    AccountGateway gateway(transport_, mode.account_url);
    auto receipt = gateway.debit(mode.api_key, challenge, timeouts_);
    if (!receipt) {
        return receipt.error();
    }

    PaymentProof proof;
    proof.mode = PaymentModeKind::proxy;
    proof.challenge_fingerprint = challenge.fingerprint;
    proof.amount = challenge.amount;
    proof.asset = challenge.asset;
    proof.network = challenge.network;
    proof.debit_receipt = receipt->receipt_id;
    proof.payment_header = receipt->payment_header;
    return proof;
}

std::optional<PaymentProof> PaymentResolver::cached(const std::string& fingerprint) const {
    if (auto entry = lookup(fingerprint)) {
        return entry->proof;
    }
    return std::nullopt;
}

std::optional<CachedProof> PaymentResolver::lookup(const std::string& fingerprint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(fingerprint);
    if (it == entries_.end() || it->second.in_flight || !it->second.proof) {
        return std::nullopt;
    }
    return CachedProof{*it->second.proof, it->second.committed};
}

bool PaymentResolver::mark_committed(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(fingerprint);
    if (it == entries_.end() || it->second.in_flight || it->second.committed) {
        return false;
    }
    it->second.committed = true;
    return true;
}

void PaymentResolver::settle(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(fingerprint);
    if (it != entries_.end() && !it->second.in_flight) {
        entries_.erase(it);
    }
}

size_t PaymentResolver::cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::shared_ptr<std::mutex> PaymentResolver::lock_for(const std::string& identity) {
    std::lock_guard<std::mutex> lock(signer_locks_mutex_);
    auto& slot = signer_locks_[identity];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

} // namespace client
} // namespace tollgate
