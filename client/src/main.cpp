#include <iostream>
#include <mutex>
#include <caf/actor_system.hpp>
#include <caf/actor_system_config.hpp>
#include <caf/blocking_actor.hpp>
#include "tollgate/client/client_config.hpp"
#include "tollgate/client/core.hpp"
#include "tollgate/client/feature_flags.hpp"
#include "tollgate/client/http_transport.hpp"
#include "tollgate/client/observability.hpp"
#include "tollgate/client/payment_executor.hpp"
#include "tollgate/client/payment_resolver.hpp"
#include "tollgate/client/pipeline.hpp"
#include "tollgate/client/pipeline_loader.hpp"
#include "tollgate/client/result_converter.hpp"
#include "tollgate/client/retry_policy.hpp"
#include "tollgate/client/spend_guard.hpp"
#include <unistd.h>

using namespace tollgate::client;

class TollgateConfig : public caf::actor_system_config {
public:
    TollgateConfig() {
        opt_group{custom_options_, "global"}
            .add(client_config.mode, "mode", "payment mode: relay or proxy")
            .add(daily_limits, "daily-limits", "per-asset daily ceilings, e.g. [\"USDC=1.00\"]")
            .add(client_config.preferred_networks, "preferred-networks", "networks in preference order")
            .add(client_config.signer_url, "signer-url", "relay mode signing service URL")
            .add(client_config.signer_identity, "signer-identity", "relay signer address (default: signer-url)")
            .add(client_config.signer_family, "signer-family", "relay signer chain family: evm or solana")
            .add(client_config.api_key, "api-key", "proxy account credential (or TOLLGATE_API_KEY)")
            .add(client_config.facilitator_url, "facilitator-url", "proxy account endpoint URL")
            .add(client_config.timeouts.connect_timeout_ms, "connect-timeout-ms", "connect timeout (ms)")
            .add(client_config.timeouts.request_timeout_ms, "request-timeout-ms", "request timeout (ms)")
            .add(client_config.retry_attempts, "retry-attempts", "pipeline resumptions after transport errors")
            .add(pipelines, "pipelines", "pipeline definition files (JSON)");
    }

    ClientConfig client_config;
    std::vector<std::string> daily_limits;
    std::vector<std::string> pipelines;
};

int caf_main(caf::actor_system& system, const TollgateConfig& config) {
    auto observability = std::make_shared<Observability>("tollgate_" + std::to_string(getpid()));

    auto client_config = config.client_config;
    auto limits = parse_daily_limits(config.daily_limits);
    if (!limits) {
        observability->log_error("Invalid configuration", {}, "", {{"error", describe(limits.error())}});
        return 1;
    }
    client_config.daily_limits = *limits;

    if (config.pipelines.empty()) {
        observability->log_error("No pipeline definitions given (--pipelines)");
        return 1;
    }

    std::vector<PipelineDefinition> definitions;
    for (const auto& path : config.pipelines) {
        auto definition = PipelineLoader::from_file(path);
        if (!definition) {
            observability->log_error("Invalid pipeline definition", {}, "", {
                {"file", path},
                {"error", describe(definition.error())}
            });
            return 1;
        }
        definitions.push_back(std::move(*definition));
    }

    auto transport = std::make_shared<CurlTransport>();
    auto mode = make_payment_mode(client_config, transport);
    if (!mode) {
        observability->log_error("Invalid configuration", {}, "", {{"error", describe(mode.error())}});
        return 1;
    }
    auto guard = SpendGuard::make(client_config.daily_limits);
    if (!guard) {
        observability->log_error("Invalid configuration", {}, "", {{"error", describe(guard.error())}});
        return 1;
    }

    observability->log_info("Tollgate starting", {}, "", {
        {"mode", client_config.mode},
        {"pipelines", std::to_string(definitions.size())},
        {"connect_timeout_ms", std::to_string(client_config.timeouts.connect_timeout_ms)},
        {"request_timeout_ms", std::to_string(client_config.timeouts.request_timeout_ms)},
        {"metrics_enabled", FeatureFlags::is_metrics_enabled() ? "true" : "false"}
    });

    // One guard and one resolver for every pipeline of the process
    auto resolver = std::make_shared<PaymentResolver>(transport, client_config.timeouts, observability);
    auto executor = std::make_shared<PaymentExecutor>(
        transport, *guard, resolver, *mode,
        ChallengeParser(client_config.preferred_networks),
        client_config.timeouts, observability);

    RetryPolicy::Config retry_config;
    retry_config.max_retries = client_config.retry_attempts;
    RetryPolicy policy(retry_config);

    std::mutex summaries_mutex;
    std::vector<PipelineSummary> summaries;

    for (const auto& definition : definitions) {
        system.spawn([&, definition](caf::blocking_actor*) {
            Pipeline pipeline(definition.id, executor, observability);
            auto summary = pipeline.run_with_policy(definition.steps, policy);
            std::lock_guard<std::mutex> lock(summaries_mutex);
            summaries.push_back(std::move(summary));
        });
    }
    system.await_all_actors_done();

    bool all_completed = true;
    nlohmann::json report = nlohmann::json::array();
    for (const auto& summary : summaries) {
        all_completed = all_completed && summary.status == PipelineStatus::completed;
        report.push_back(ResultConverter::to_json(summary));
    }
    std::cout << report.dump(2) << std::endl;

    if (FeatureFlags::is_metrics_enabled()) {
        std::cout << observability->get_metrics_response();
    }

    observability->log_info("Tollgate finished", {}, "", {
        {"status", all_completed ? "completed" : "failed"}
    });
    return all_completed ? 0 : 2;
}

int main(int argc, char** argv) {
    init_global_meta_objects();

    TollgateConfig config;

    // Parse command line arguments and caf-application.conf
    if (auto err = config.parse(argc, argv)) {
        std::cerr << "Failed to parse arguments: " << caf::to_string(err) << std::endl;
        return 1;
    }
    if (config.cli_helptext_printed) {
        return 0;
    }

    CurlTransport::global_init();
    int rc = 0;
    {
        caf::actor_system system(config);
        rc = caf_main(system, config);
    }
    CurlTransport::global_cleanup();
    return rc;
}
