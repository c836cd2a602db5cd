#include "tollgate/client/client_config.hpp"
#include "tollgate/client/signer.hpp"
#include <cstdlib>

namespace tollgate {
namespace client {

namespace {

// Digits with at most one decimal point
bool is_decimal(const std::string& text) {
    bool seen_digit = false;
    bool seen_dot = false;
    for (char c : text) {
        if (c >= '0' && c <= '9') {
            seen_digit = true;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
        } else {
            return false;
        }
    }
    return seen_digit;
}

} // namespace

caf::expected<std::map<std::string, std::string>> parse_daily_limits(const std::vector<std::string>& entries) {
    std::map<std::string, std::string> limits;
    for (const auto& entry : entries) {
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == entry.size()) {
            return caf::make_error(payment_errc::invalid_request,
                                   "daily limit must look like ASSET=amount, got '" + entry + "'");
        }
        auto asset = entry.substr(0, eq);
        auto value = entry.substr(eq + 1);
        if (!is_decimal(value)) {
            return caf::make_error(payment_errc::invalid_request,
                                   "daily limit for " + asset + " is not a decimal amount: '" + value + "'");
        }
        limits[asset] = value;
    }
    return limits;
}

std::string resolve_api_key(const std::string& configured) {
    if (!configured.empty()) {
        return configured;
    }
    const char* env = std::getenv("TOLLGATE_API_KEY");
    return env != nullptr ? std::string(env) : std::string();
}

caf::expected<PaymentMode> make_payment_mode(const ClientConfig& config,
                                             std::shared_ptr<HttpTransport> transport) {
    if (config.mode == "relay") {
        if (config.signer_url.empty()) {
            return caf::make_error(payment_errc::invalid_request, "relay mode requires signer-url");
        }
        auto family = ChainFamily::evm;
        if (config.signer_family == "solana") {
            family = ChainFamily::solana;
        } else if (!config.signer_family.empty() && config.signer_family != "evm") {
            return caf::make_error(payment_errc::invalid_request,
                                   "unknown signer family '" + config.signer_family + "'");
        } else if (config.signer_family.empty() && !config.preferred_networks.empty()) {
            if (auto preferred = family_of_network(config.preferred_networks.front())) {
                family = *preferred;
            }
        }
        auto identity = config.signer_identity.empty() ? config.signer_url : config.signer_identity;
        auto signer = std::make_shared<HttpSigner>(std::move(transport), config.signer_url, family, identity);
        return PaymentMode{RelayMode{std::move(signer)}};
    }

    if (config.mode == "proxy") {
        auto api_key = resolve_api_key(config.api_key);
        if (api_key.empty()) {
            return caf::make_error(payment_errc::auth_error,
                                   "proxy mode requires api-key or TOLLGATE_API_KEY");
        }
        if (config.facilitator_url.empty()) {
            return caf::make_error(payment_errc::invalid_request, "proxy mode requires facilitator-url");
        }
        return PaymentMode{ProxyMode{api_key, config.facilitator_url}};
    }

    return caf::make_error(payment_errc::invalid_request,
                           "mode must be relay or proxy, got '" + config.mode + "'");
}

} // namespace client
} // namespace tollgate
