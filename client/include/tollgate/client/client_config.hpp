#pragma once

#include "tollgate/client/core.hpp"
#include "tollgate/client/http_transport.hpp"
#include <caf/expected.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tollgate {
namespace client {

// "USDC=1.00" entries -> {"USDC": "1.00"}
caf::expected<std::map<std::string, std::string>> parse_daily_limits(const std::vector<std::string>& entries);

// Configured key, else TOLLGATE_API_KEY, else empty
std::string resolve_api_key(const std::string& configured);

/**
 * Builds the single payment mode of a client instance.
 *
 * relay: requires signer_url; the signer family comes from signer_family,
 *        else from the first preferred network, else EVM.
 * proxy: requires an API key and facilitator_url.
 */
caf::expected<PaymentMode> make_payment_mode(const ClientConfig& config,
                                             std::shared_ptr<HttpTransport> transport);

} // namespace client
} // namespace tollgate
