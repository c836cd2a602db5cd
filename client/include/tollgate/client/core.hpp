#pragma once

#include "tollgate/client/amount.hpp"
#include "tollgate/client/errors.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tollgate {
namespace client {

// Forward declarations
class Signer;

// Chain families the payment path knows how to settle on
enum class ChainFamily {
    evm,
    solana
};

std::string to_string(ChainFamily family);

// Maps an x402 network identifier ("base", "solana-devnet", ...) to its family
std::optional<ChainFamily> family_of_network(const std::string& network);

// Timeouts are configuration, propagated to every network collaborator
struct TimeoutConfig {
    int64_t connect_timeout_ms = 5000;
    int64_t request_timeout_ms = 30000;
};

// Header names are stored lower-cased
struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;

    void set_header(const std::string& name, const std::string& value);
};

struct HttpResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    std::optional<std::string> header(const std::string& name) const;
    bool is_success() const { return status_code >= 200 && status_code < 300; }
    bool is_payment_required() const { return status_code == 402; }
};

std::string lowercase(std::string value);

// Parsed terms of one x402 offer. Produced fresh per 402 response and never
// modified afterwards.
struct PaymentChallenge {
    int x402_version = 1;
    std::string scheme;
    Amount amount;
    std::string asset;          // symbol, e.g. "USDC"
    std::string asset_address;  // contract address or SPL mint
    std::string network;
    ChainFamily family = ChainFamily::evm;
    std::string pay_to;
    std::string resource;
    std::string description;
    std::string fee_payer;      // Solana facilitator fee payer
    std::optional<std::string> nonce;
    std::optional<std::chrono::system_clock::time_point> expires_at;
    std::string fingerprint;    // hex SHA-256 of the canonical terms
    nlohmann::json raw;         // the selected accepts[] entry
};

// What the relay facilitator is asked to pay. Amount stays in atomic units.
struct PaymentInstruction {
    std::string scheme;
    std::string network;
    std::string amount_atomic;
    uint8_t decimals = 6;
    std::string asset;
    std::string asset_address;
    std::string pay_to;
    std::string resource;
    std::string fee_payer;
    std::optional<std::string> nonce;
    std::string fingerprint;
};

// One on-chain transfer, kept separate per leg of a relay payment
struct TxHash {
    std::string value;
    std::string network;

    bool empty() const { return value.empty(); }
};

enum class PaymentModeKind {
    relay,
    proxy
};

std::string to_string(PaymentModeKind kind);

struct PaymentProof {
    PaymentModeKind mode = PaymentModeKind::relay;
    std::string challenge_fingerprint;
    Amount amount;
    std::string asset;
    std::string network;
    TxHash client_tx;             // caller -> facilitator (relay)
    TxHash facilitator_tx;        // facilitator -> upstream API (relay)
    std::string debit_receipt;    // prepaid account debit (proxy)
    std::string payment_header;   // value attached as X-PAYMENT on the resend
    std::string client_payment_header;  // raw x-client-payment
    nlohmann::json payment_response;    // decoded x-payment-response
    bool committed = false;       // counted against the daily limit (funds moved)
    bool accepted = false;
};

// Relay: a facilitator pays upstream and the caller reimburses it on-chain
// through the signer. The core never sees key material.
struct RelayMode {
    std::shared_ptr<Signer> signer;
};

// Proxy: the facilitator debits a prepaid account identified by api_key
struct ProxyMode {
    std::string api_key;
    std::string account_url;
};

using PaymentMode = std::variant<RelayMode, ProxyMode>;

PaymentModeKind kind_of(const PaymentMode& mode);

// Correlation fields carried into logs and results
struct RunContext {
    std::string pipeline_id;
    std::string trace_id;
};

enum class StepStatus {
    succeeded,
    failed,
    not_attempted
};

struct StepResult {
    std::string name;
    size_t index = 0;
    StepStatus status = StepStatus::succeeded;
    payment_errc error_code = payment_errc::none;
    std::string error_message;    // recorded verbatim from the failing component
    int http_status = 0;
    std::string body;
    nlohmann::json output;        // value later steps may consume
    std::optional<PaymentProof> payment;
    RunContext metadata;
    int64_t latency_ms = 0;

    bool is_success() const { return status == StepStatus::succeeded; }
    bool is_failure() const { return status == StepStatus::failed; }
    bool has_payment() const { return payment.has_value(); }

    static StepResult success(const std::string& name, size_t index, const RunContext& meta,
                              int http_status, std::string body, nlohmann::json output,
                              std::optional<PaymentProof> payment, int64_t latency_ms);

    static StepResult failure(const std::string& name, size_t index, const RunContext& meta,
                              const caf::error& error, std::optional<PaymentProof> payment,
                              int64_t latency_ms, int http_status = 0);
};

enum class PipelineStatus {
    completed,
    failed,
    cancelled
};

struct PipelineSummary {
    std::string pipeline_id;
    PipelineStatus status = PipelineStatus::completed;
    std::vector<StepResult> steps;            // attempted steps, in order
    std::vector<std::string> not_attempted;   // steps never started
    std::map<std::string, Amount> total_spent;  // asset -> committed payments
    int64_t latency_ms = 0;

    const StepResult* find(const std::string& name) const;
    StepStatus state_of(const std::string& name) const;
    size_t payments_made() const;
};

// Recognized options of a client instance
struct ClientConfig {
    std::string mode = "relay";                       // relay | proxy
    std::map<std::string, std::string> daily_limits;  // asset -> decimal, e.g. USDC -> "1.00"
    std::vector<std::string> preferred_networks;      // most preferred first
    std::string signer_url;                           // relay signing service
    std::string signer_identity;                      // defaults to signer_url
    std::string signer_family;                        // evm | solana; defaults from networks
    std::string api_key;                              // proxy credential
    std::string facilitator_url;                      // proxy account endpoint
    TimeoutConfig timeouts;
    int32_t retry_attempts = 1;
};

} // namespace client
} // namespace tollgate
