#pragma once

#include "tollgate/client/pipeline.hpp"
#include <caf/expected.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tollgate {
namespace client {

struct PipelineDefinition {
    std::string id;
    std::vector<StepSpec> steps;
};

/**
 * Declarative pipelines.
 *
 * {
 *   "id": "market-brief",
 *   "steps": [
 *     {"name": "news", "url": "https://api.example/news"},
 *     {"name": "flows", "method": "POST", "url": "...", "body": {...}, "output": "/data"},
 *     {"name": "digest", "method": "POST", "url": "...",
 *      "headers": {"Accept": "application/json"},
 *      "body": {"tokens": "${flows}", "query": "news for ${flows/0/token_symbol}"},
 *      "accept_status": [200, 201]}
 *   ]
 * }
 *
 * Strings in url, headers and body may reference outputs of earlier steps as
 * ${step} or ${step/json/pointer}. A string that is exactly one reference is
 * replaced by the referenced JSON value; otherwise references are spliced in
 * as text. References to unknown or later steps are rejected at load time.
 */
class PipelineLoader {
public:
    static caf::expected<PipelineDefinition> from_json(const nlohmann::json& doc);
    static caf::expected<PipelineDefinition> from_string(const std::string& text);
    static caf::expected<PipelineDefinition> from_file(const std::string& path);

    // Substitutes every ${...} reference in templ
    static caf::expected<nlohmann::json> render(const nlohmann::json& templ, const PipelineContext& context);

    // Value of "step" or "step/pointer"
    static caf::expected<nlohmann::json> resolve_reference(const std::string& reference,
                                                           const PipelineContext& context);

    // Step names referenced anywhere in templ
    static std::vector<std::string> references_in(const nlohmann::json& templ);
};

} // namespace client
} // namespace tollgate
