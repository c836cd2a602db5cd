#pragma once

#include "tollgate/client/core.hpp"
#include <caf/expected.hpp>
#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tollgate {
namespace client {

/**
 * Decodes 402 responses into PaymentChallenge values.
 *
 * Sources, in order:
 * - JSON body with an `accepts` array (x402 v1)
 * - base64 JSON in the `payment-required` header (x402 v2)
 *
 * Offers are filtered (scheme, known network, numeric amount, payTo, asset,
 * payable chain family) and ranked by the preferred network order; ties keep
 * the server's order. The parser has no side effects.
 */
class ChallengeParser {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit ChallengeParser(std::vector<std::string> preferred_networks = {},
                             Clock clock = [] { return std::chrono::system_clock::now(); });

    // Best offer, or payment_errc::challenge_unrecognized.
    // payable_family == nullopt accepts any family (proxy mode).
    caf::expected<PaymentChallenge> parse(const HttpResponse& response,
                                          std::optional<ChainFamily> payable_family) const;

    // All acceptable offers, best first
    caf::expected<std::vector<PaymentChallenge>> parse_offers(
        const HttpResponse& response,
        std::optional<ChainFamily> payable_family) const;

    // Facilitator instruction carrying the challenge terms unchanged
    static PaymentInstruction make_instruction(const PaymentChallenge& challenge);

    static std::string fingerprint_of(const PaymentChallenge& challenge);

    const std::vector<std::string>& preferred_networks() const { return preferred_networks_; }

private:
    std::vector<std::string> preferred_networks_;
    Clock clock_;

    caf::expected<nlohmann::json> extract_document(const HttpResponse& response) const;

    // Empty optional with reason filled when the offer is skipped
    std::optional<PaymentChallenge> parse_offer(const nlohmann::json& offer, int version,
                                                std::optional<ChainFamily> payable_family,
                                                std::string& reason) const;

    size_t preference_rank(const std::string& network) const;
};

} // namespace client
} // namespace tollgate
