#pragma once

#include "tollgate/client/account_gateway.hpp"
#include "tollgate/client/core.hpp"
#include "tollgate/client/http_transport.hpp"
#include "tollgate/client/observability.hpp"
#include <caf/expected.hpp>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tollgate {
namespace client {

struct Resolution {
    PaymentProof proof;
    bool fresh = true;  // false when another call already paid this challenge
};

// A proof produced earlier and not yet accepted upstream
struct CachedProof {
    PaymentProof proof;
    bool committed = false;  // its spend is already in the guard ledger
};

/**
 * Turns a challenge into a PaymentProof.
 *
 * Relay mode hands a PaymentInstruction to the mode's Signer; proxy mode
 * debits the prepaid account through AccountGateway. Proofs are kept per
 * challenge fingerprint until the executor reports them applied with
 * settle(); a resolve() for a fingerprint that is in flight waits for the
 * first call and shares its proof. Failures are never cached. Each entry
 * also records whether its spend was committed, so that exactly one
 * caller counts it against the daily limit.
 *
 * One instance is shared by every pipeline of a process.
 */
class PaymentResolver {
public:
    PaymentResolver(std::shared_ptr<HttpTransport> transport,
                    TimeoutConfig timeouts = {},
                    std::shared_ptr<Observability> observability = nullptr);

    caf::expected<Resolution> resolve(const PaymentChallenge& challenge,
                                      const PaymentMode& mode,
                                      const RunContext& ctx = {});

    // Proof already produced for this fingerprint and not yet settled
    std::optional<PaymentProof> cached(const std::string& fingerprint) const;

    std::optional<CachedProof> lookup(const std::string& fingerprint) const;

    // True for the one call that gets to commit this proof's spend
    bool mark_committed(const std::string& fingerprint);

    // Upstream accepted the proof; the next identical challenge is a new charge
    void settle(const std::string& fingerprint);

    size_t cache_size() const;

private:
    struct Entry {
        bool in_flight = true;
        bool committed = false;
        std::optional<PaymentProof> proof;
    };

    std::shared_ptr<HttpTransport> transport_;
    TimeoutConfig timeouts_;
    std::shared_ptr<Observability> observability_;

    mutable std::mutex mutex_;
    std::condition_variable settled_cv_;
    std::map<std::string, Entry> entries_;

    std::mutex signer_locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> signer_locks_;

    caf::expected<PaymentProof> resolve_relay(const PaymentChallenge& challenge, const RelayMode& mode);
    caf::expected<PaymentProof> resolve_proxy(const PaymentChallenge& challenge, const ProxyMode& mode);

    std::shared_ptr<std::mutex> lock_for(const std::string& identity);
};

} // namespace client
} // namespace tollgate
