#include "tollgate/client/challenge_parser.hpp"
#include "tollgate/client/encoding.hpp"
#include <algorithm>
#include <array>
#include <string_view>
#include <utility>

namespace tollgate {
namespace client {

using json = nlohmann::json;

namespace {

constexpr uint8_t kDefaultDecimals = 6;

// Well-known stablecoin deployments, matched case-insensitively
constexpr std::array<std::pair<std::string_view, std::string_view>, 8> kKnownAssets{{
    {"0x833589fcd6edb6e08f4c7c32d4f71b54bda02913", "USDC"},  // base
    {"0x036cbd53842c5426634e7929541ec2318f3dcf7e", "USDC"},  // base-sepolia
    {"0x3c499c542cef5e3811e1192ce70d8cc03d5c3359", "USDC"},  // polygon
    {"0xb97ef9ef8734c71904d8002f8b6bc66dd9c48a6e", "USDC"},  // avalanche
    {"0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48", "USDC"},  // ethereum
    {"epjfwdd5aufqssqem2qn1xzybapc8g4weggkzwytdt1v", "USDC"}, // solana
    {"4zmmc9srt5ri5x14gagxhahii3gnpaeerypjgzjdncdu", "USDC"}, // solana-devnet
    {"0x60a3e35cc302bfa44cb288bc5a4f316fdb1adb42", "EURC"},  // base
}};

std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

// JSON integers built in code are signed even when non-negative
std::optional<uint64_t> unsigned_value(const json& value) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_number_integer() && value.get<int64_t>() >= 0) {
        return static_cast<uint64_t>(value.get<int64_t>());
    }
    return std::nullopt;
}

// Known addresses first: extra.name is often the EIP-712 domain name
// ("USD Coin"), not the ticker
std::string asset_symbol(const json& offer, const std::string& address) {
    auto lower = lowercase(address);
    for (const auto& [known, symbol] : kKnownAssets) {
        if (known == lower) {
            return std::string(symbol);
        }
    }
    if (offer.contains("extra") && offer["extra"].is_object()) {
        auto name = string_field(offer["extra"], "name");
        if (!name.empty()) {
            return name;
        }
    }
    return address;
}

uint8_t asset_decimals(const json& offer) {
    if (offer.contains("extra") && offer["extra"].is_object()) {
        const auto& extra = offer["extra"];
        auto it = extra.find("decimals");
        if (it != extra.end()) {
            auto decimals = unsigned_value(*it);
            if (decimals && *decimals <= 18) {
                return static_cast<uint8_t>(*decimals);
            }
        }
    }
    return kDefaultDecimals;
}

// Atomic amounts arrive as strings; some servers send bare integers
std::string amount_field(const json& offer) {
    for (const char* key : {"maxAmountRequired", "amount"}) {
        auto it = offer.find(key);
        if (it == offer.end()) {
            continue;
        }
        if (it->is_string()) {
            return it->get<std::string>();
        }
        if (auto value = unsigned_value(*it)) {
            return std::to_string(*value);
        }
    }
    return {};
}

} // namespace

ChallengeParser::ChallengeParser(std::vector<std::string> preferred_networks, Clock clock)
    : preferred_networks_(std::move(preferred_networks)), clock_(std::move(clock)) {
    for (auto& network : preferred_networks_) {
        network = lowercase(network);
    }
}

caf::expected<PaymentChallenge> ChallengeParser::parse(const HttpResponse& response,
                                                       std::optional<ChainFamily> payable_family) const {
    auto offers = parse_offers(response, payable_family);
    if (!offers) {
        return offers.error();
    }
    return std::move(offers->front());
}

caf::expected<std::vector<PaymentChallenge>> ChallengeParser::parse_offers(
    const HttpResponse& response,
    std::optional<ChainFamily> payable_family) const {
    if (!response.is_payment_required()) {
        return caf::make_error(payment_errc::challenge_unrecognized,
                               "status " + std::to_string(response.status_code) + " is not a payment challenge");
    }

    auto document = extract_document(response);
    if (!document) {
        return document.error();
    }

    int version = 1;
    if (document->contains("x402Version") && (*document)["x402Version"].is_number_integer()) {
        version = (*document)["x402Version"].get<int>();
    }

    const auto& accepts = (*document)["accepts"];
    std::vector<PaymentChallenge> offers;
    std::string skipped;
    for (size_t i = 0; i < accepts.size(); ++i) {
        std::string reason;
        auto offer = parse_offer(accepts[i], version, payable_family, reason);
        if (offer) {
            offers.push_back(std::move(*offer));
        } else {
            skipped += (skipped.empty() ? "" : "; ") + std::string("[") + std::to_string(i) + "] " + reason;
        }
    }

    if (offers.empty()) {
        return caf::make_error(payment_errc::challenge_unrecognized,
                               "no acceptable payment offer: " + (skipped.empty() ? std::string("accepts is empty") : skipped));
    }

    std::stable_sort(offers.begin(), offers.end(),
                     [this](const PaymentChallenge& lhs, const PaymentChallenge& rhs) {
                         return preference_rank(lhs.network) < preference_rank(rhs.network);
                     });
    return offers;
}

caf::expected<json> ChallengeParser::extract_document(const HttpResponse& response) const {
    auto has_accepts = [](const json& doc) {
        return doc.is_object() && doc.contains("accepts") && doc["accepts"].is_array();
    };

    if (!response.body.empty()) {
        auto body = json::parse(response.body, nullptr, false);
        if (!body.is_discarded() && has_accepts(body)) {
            return body;
        }
    }

    if (auto header = response.header("payment-required")) {
        auto decoded = base64_decode(*header);
        if (!decoded) {
            return caf::make_error(payment_errc::challenge_unrecognized,
                                   "payment-required header is not valid base64");
        }
        auto doc = json::parse(*decoded, nullptr, false);
        if (!doc.is_discarded() && has_accepts(doc)) {
            return doc;
        }
        return caf::make_error(payment_errc::challenge_unrecognized,
                               "payment-required header carries no accepts array");
    }

    return caf::make_error(payment_errc::challenge_unrecognized,
                           "402 response carries no x402 payment requirements");
}

std::optional<PaymentChallenge> ChallengeParser::parse_offer(const json& offer, int version,
                                                             std::optional<ChainFamily> payable_family,
                                                             std::string& reason) const {
    if (!offer.is_object()) {
        reason = "offer is not an object";
        return std::nullopt;
    }

    PaymentChallenge challenge;
    challenge.x402_version = version;
    challenge.scheme = string_field(offer, "scheme");
    if (challenge.scheme != "exact") {
        reason = "scheme '" + challenge.scheme + "' unsupported";
        return std::nullopt;
    }

    challenge.network = string_field(offer, "network");
    auto family = family_of_network(challenge.network);
    if (!family) {
        reason = "network '" + challenge.network + "' unknown";
        return std::nullopt;
    }
    if (payable_family && *payable_family != *family) {
        reason = "network '" + challenge.network + "' is not payable by the " + to_string(*payable_family) + " signer";
        return std::nullopt;
    }
    challenge.family = *family;

    challenge.pay_to = string_field(offer, "payTo");
    challenge.asset_address = string_field(offer, "asset");
    if (challenge.pay_to.empty() || challenge.asset_address.empty()) {
        reason = "payTo or asset missing";
        return std::nullopt;
    }

    auto amount = Amount::from_atomic(amount_field(offer), asset_decimals(offer));
    if (!amount || amount->is_zero()) {
        reason = "amount missing or not an integer of atomic units";
        return std::nullopt;
    }
    challenge.amount = *amount;
    challenge.asset = asset_symbol(offer, challenge.asset_address);

    challenge.resource = string_field(offer, "resource");
    challenge.description = string_field(offer, "description");

    if (offer.contains("extra") && offer["extra"].is_object()) {
        const auto& extra = offer["extra"];
        challenge.fee_payer = string_field(extra, "feePayer");
        auto nonce = string_field(extra, "nonce");
        if (!nonce.empty()) {
            challenge.nonce = nonce;
        }
    }
    if (!challenge.nonce) {
        auto nonce = string_field(offer, "nonce");
        if (!nonce.empty()) {
            challenge.nonce = nonce;
        }
    }

    auto timeout = offer.find("maxTimeoutSeconds");
    if (timeout != offer.end()) {
        if (auto seconds = unsigned_value(*timeout)) {
            challenge.expires_at = clock_() + std::chrono::seconds(static_cast<int64_t>(*seconds));
        }
    }

    challenge.raw = offer;
    challenge.fingerprint = fingerprint_of(challenge);
    return challenge;
}

size_t ChallengeParser::preference_rank(const std::string& network) const {
    auto it = std::find(preferred_networks_.begin(), preferred_networks_.end(), lowercase(network));
    return static_cast<size_t>(it - preferred_networks_.begin());
}

PaymentInstruction ChallengeParser::make_instruction(const PaymentChallenge& challenge) {
    PaymentInstruction instruction;
    instruction.scheme = challenge.scheme;
    instruction.network = challenge.network;
    instruction.amount_atomic = challenge.amount.atomic_string();
    instruction.decimals = challenge.amount.decimals();
    instruction.asset = challenge.asset;
    instruction.asset_address = challenge.asset_address;
    instruction.pay_to = challenge.pay_to;
    instruction.resource = challenge.resource;
    instruction.fee_payer = challenge.fee_payer;
    instruction.nonce = challenge.nonce;
    instruction.fingerprint = challenge.fingerprint;
    return instruction;
}

std::string ChallengeParser::fingerprint_of(const PaymentChallenge& challenge) {
    // Canonical terms; identical offers hash identically across responses
    json canonical = {
        {"version", challenge.x402_version},
        {"scheme", challenge.scheme},
        {"network", lowercase(challenge.network)},
        {"amount", challenge.amount.atomic_string()},
        {"decimals", challenge.amount.decimals()},
        {"asset", lowercase(challenge.asset_address)},
        {"payTo", challenge.pay_to},
        {"resource", challenge.resource},
        {"nonce", challenge.nonce.value_or("")}
    };
    return sha256_hex(canonical.dump());
}

} // namespace client
} // namespace tollgate
