#include "tollgate/client/core.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <utility>

namespace tollgate {
namespace client {

namespace {

// x402 network identifiers seen in facilitator offers
constexpr std::array<std::pair<std::string_view, ChainFamily>, 18> kNetworkFamilies{{
    {"base", ChainFamily::evm},
    {"base-sepolia", ChainFamily::evm},
    {"ethereum", ChainFamily::evm},
    {"sepolia", ChainFamily::evm},
    {"polygon", ChainFamily::evm},
    {"polygon-amoy", ChainFamily::evm},
    {"avalanche", ChainFamily::evm},
    {"avalanche-fuji", ChainFamily::evm},
    {"arbitrum", ChainFamily::evm},
    {"optimism", ChainFamily::evm},
    {"iotex", ChainFamily::evm},
    {"sei", ChainFamily::evm},
    {"sei-testnet", ChainFamily::evm},
    {"peaq", ChainFamily::evm},
    {"xlayer", ChainFamily::evm},
    {"skale-base-sepolia", ChainFamily::evm},
    {"solana", ChainFamily::solana},
    {"solana-devnet", ChainFamily::solana},
}};

} // namespace

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string to_string(ChainFamily family) {
    switch (family) {
        case ChainFamily::evm:
            return "evm";
        case ChainFamily::solana:
            return "solana";
    }
    return "unknown";
}

std::optional<ChainFamily> family_of_network(const std::string& network) {
    auto name = lowercase(network);
    for (const auto& [id, family] : kNetworkFamilies) {
        if (id == name) {
            return family;
        }
    }
    // CAIP-2 identifiers
    if (name.rfind("eip155:", 0) == 0) {
        return ChainFamily::evm;
    }
    if (name.rfind("solana:", 0) == 0) {
        return ChainFamily::solana;
    }
    return std::nullopt;
}

std::string to_string(PaymentModeKind kind) {
    return kind == PaymentModeKind::relay ? "relay" : "proxy";
}

PaymentModeKind kind_of(const PaymentMode& mode) {
    return std::holds_alternative<RelayMode>(mode) ? PaymentModeKind::relay : PaymentModeKind::proxy;
}

void HttpRequest::set_header(const std::string& name, const std::string& value) {
    headers[lowercase(name)] = value;
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(lowercase(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

StepResult StepResult::success(const std::string& name, size_t index, const RunContext& meta,
                               int http_status, std::string body, nlohmann::json output,
                               std::optional<PaymentProof> payment, int64_t latency_ms) {
    StepResult result;
    result.name = name;
    result.index = index;
    result.status = StepStatus::succeeded;
    result.http_status = http_status;
    result.body = std::move(body);
    result.output = std::move(output);
    result.payment = std::move(payment);
    result.metadata = meta;
    result.latency_ms = latency_ms;
    return result;
}

StepResult StepResult::failure(const std::string& name, size_t index, const RunContext& meta,
                               const caf::error& error, std::optional<PaymentProof> payment,
                               int64_t latency_ms, int http_status) {
    StepResult result;
    result.name = name;
    result.index = index;
    result.status = StepStatus::failed;
    result.error_code = code_of(error);
    result.error_message = describe(error);
    result.http_status = http_status;
    result.payment = std::move(payment);
    result.metadata = meta;
    result.latency_ms = latency_ms;
    return result;
}

const StepResult* PipelineSummary::find(const std::string& name) const {
    for (const auto& step : steps) {
        if (step.name == name) {
            return &step;
        }
    }
    return nullptr;
}

StepStatus PipelineSummary::state_of(const std::string& name) const {
    if (const auto* step = find(name)) {
        return step->status;
    }
    return StepStatus::not_attempted;
}

size_t PipelineSummary::payments_made() const {
    return static_cast<size_t>(std::count_if(steps.begin(), steps.end(),
                                              [](const StepResult& step) { return step.has_payment(); }));
}

} // namespace client
} // namespace tollgate
