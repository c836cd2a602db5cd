#pragma once

#include "tollgate/client/core.hpp"
#include "tollgate/client/http_transport.hpp"
#include <caf/expected.hpp>
#include <memory>
#include <string>

namespace tollgate {
namespace client {

// Result of one relay payment as reported by the signer collaborator
struct SignerReceipt {
    TxHash client_tx;            // caller -> facilitator, always present
    TxHash facilitator_tx;       // facilitator -> upstream, empty until observable
    std::string payment_header;  // value to attach as X-PAYMENT
};

/**
 * Signing and broadcast collaborator for relay mode.
 *
 * Implementations hold (or reach) the key material; the core only ever sees
 * identity() and the receipt. Errors must be one of signer_error (key absent,
 * network mismatch, bad signature), payment_rejected (facilitator declined,
 * e.g. insufficient relay liquidity) or transport_error.
 */
class Signer {
public:
    virtual ~Signer() = default;

    virtual ChainFamily family() const = 0;

    // Stable identifier (address or public key); concurrent calls for one
    // identity are serialized by the resolver
    virtual std::string identity() const = 0;

    virtual caf::expected<SignerReceipt> sign_and_submit(const PaymentInstruction& instruction,
                                                         const TimeoutConfig& timeouts) = 0;
};

// Forwards instructions to a local signing service over HTTP:
// POST <url>/sign with the instruction as JSON.
class HttpSigner : public Signer {
public:
    HttpSigner(std::shared_ptr<HttpTransport> transport, std::string signer_url,
               ChainFamily family, std::string identity);

    ChainFamily family() const override { return family_; }
    std::string identity() const override { return identity_; }

    caf::expected<SignerReceipt> sign_and_submit(const PaymentInstruction& instruction,
                                                 const TimeoutConfig& timeouts) override;

    static nlohmann::json instruction_to_json(const PaymentInstruction& instruction);

private:
    std::shared_ptr<HttpTransport> transport_;
    std::string signer_url_;
    ChainFamily family_;
    std::string identity_;
};

} // namespace client
} // namespace tollgate
