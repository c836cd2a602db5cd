#include "tollgate/client/pipeline_loader.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

namespace tollgate {
namespace client {

using json = nlohmann::json;

namespace {

const std::set<std::string> kMethods = {"GET", "POST", "PUT", "PATCH", "DELETE"};

caf::error invalid(const std::string& message) {
    return caf::make_error(payment_errc::invalid_request, message);
}

// Offsets of "${" and matching "}" for each reference in text
std::vector<std::pair<size_t, size_t>> find_references(const std::string& text) {
    std::vector<std::pair<size_t, size_t>> refs;
    size_t pos = 0;
    while ((pos = text.find("${", pos)) != std::string::npos) {
        auto end = text.find('}', pos + 2);
        if (end == std::string::npos) {
            break;
        }
        refs.emplace_back(pos, end);
        pos = end + 1;
    }
    return refs;
}

std::string step_of(const std::string& reference) {
    return reference.substr(0, reference.find('/'));
}

std::string as_text(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

caf::expected<json> render_string(const std::string& text, const PipelineContext& context) {
    auto refs = find_references(text);
    if (refs.empty()) {
        return json(text);
    }
    if (refs.size() == 1 && refs[0].first == 0 && refs[0].second == text.size() - 1) {
        return PipelineLoader::resolve_reference(text.substr(2, text.size() - 3), context);
    }

    std::string out;
    size_t last = 0;
    for (const auto& [begin, end] : refs) {
        out.append(text, last, begin - last);
        auto value = PipelineLoader::resolve_reference(text.substr(begin + 2, end - begin - 2), context);
        if (!value) {
            return value.error();
        }
        out += as_text(*value);
        last = end + 1;
    }
    out.append(text, last, std::string::npos);
    return json(out);
}

void collect_references(const json& node, std::vector<std::string>& names) {
    if (node.is_string()) {
        const auto& text = node.get_ref<const std::string&>();
        for (const auto& [begin, end] : find_references(text)) {
            names.push_back(step_of(text.substr(begin + 2, end - begin - 2)));
        }
    } else if (node.is_structured()) {
        for (const auto& child : node) {
            collect_references(child, names);
        }
    }
}

caf::expected<StepSpec> make_step(const json& entry, const std::set<std::string>& earlier) {
    if (!entry.is_object()) {
        return invalid("pipeline step must be an object");
    }
    if (!entry.contains("name") || !entry["name"].is_string() || entry["name"].get<std::string>().empty()) {
        return invalid("pipeline step requires a non-empty 'name'");
    }
    auto name = entry["name"].get<std::string>();
    if (!entry.contains("url") || !entry["url"].is_string()) {
        return invalid("step '" + name + "' requires a 'url' string");
    }

    std::string method = "GET";
    if (entry.contains("method")) {
        if (!entry["method"].is_string() || kMethods.count(entry["method"].get<std::string>()) == 0) {
            return invalid("step '" + name + "' has an unsupported 'method'");
        }
        method = entry["method"].get<std::string>();
    }

    json headers = json::object();
    if (entry.contains("headers")) {
        if (!entry["headers"].is_object()) {
            return invalid("step '" + name + "' 'headers' must be an object");
        }
        headers = entry["headers"];
    }

    json body = entry.contains("body") ? entry["body"] : json(nullptr);

    std::vector<std::string> referenced;
    collect_references(entry["url"], referenced);
    collect_references(headers, referenced);
    collect_references(body, referenced);
    for (const auto& ref : referenced) {
        if (earlier.count(ref) == 0) {
            return invalid("step '" + name + "' references '" + ref + "', which is not an earlier step");
        }
    }

    std::optional<json::json_pointer> output_pointer;
    if (entry.contains("output")) {
        if (!entry["output"].is_string()) {
            return invalid("step '" + name + "' 'output' must be a JSON pointer string");
        }
        try {
            output_pointer = json::json_pointer(entry["output"].get<std::string>());
        } catch (const json::exception& e) {
            return invalid("step '" + name + "' 'output' is not a JSON pointer: " + e.what());
        }
    }

    std::vector<int> accepted_statuses;
    if (entry.contains("accept_status")) {
        if (!entry["accept_status"].is_array()) {
            return invalid("step '" + name + "' 'accept_status' must be an array of status codes");
        }
        for (const auto& status : entry["accept_status"]) {
            if (!status.is_number_integer()) {
                return invalid("step '" + name + "' 'accept_status' must be an array of status codes");
            }
            accepted_statuses.push_back(status.get<int>());
        }
    }

    StepSpec spec;
    spec.name = name;
    json url = entry["url"];
    spec.build = [method, url, headers, body](const PipelineContext& context) -> caf::expected<HttpRequest> {
        HttpRequest request;
        request.method = method;

        auto rendered_url = PipelineLoader::render(url, context);
        if (!rendered_url) {
            return rendered_url.error();
        }
        request.url = as_text(*rendered_url);

        auto rendered_headers = PipelineLoader::render(headers, context);
        if (!rendered_headers) {
            return rendered_headers.error();
        }
        for (const auto& [header, value] : rendered_headers->items()) {
            request.set_header(header, as_text(value));
        }

        if (!body.is_null()) {
            auto rendered_body = PipelineLoader::render(body, context);
            if (!rendered_body) {
                return rendered_body.error();
            }
            if (rendered_body->is_string()) {
                request.body = rendered_body->get<std::string>();
            } else {
                request.body = rendered_body->dump();
                if (request.headers.count("content-type") == 0) {
                    request.set_header("Content-Type", "application/json");
                }
            }
        }
        return request;
    };

    if (output_pointer) {
        auto pointer = *output_pointer;
        spec.extract_output = [pointer, name](const HttpResponse& response) -> caf::expected<json> {
            auto doc = StepSpec::default_output(response);
            if (!doc) {
                return doc.error();
            }
            if (!doc->contains(pointer)) {
                return invalid("step '" + name + "' response has no value at " + pointer.to_string());
            }
            return doc->at(pointer);
        };
    }

    if (!accepted_statuses.empty()) {
        spec.accept_status = [accepted_statuses](int status) {
            return std::find(accepted_statuses.begin(), accepted_statuses.end(), status)
                   != accepted_statuses.end();
        };
    }
    return spec;
}

} // namespace

caf::expected<json> PipelineLoader::resolve_reference(const std::string& reference,
                                                      const PipelineContext& context) {
    auto step = step_of(reference);
    auto output = context.require(step);
    if (!output) {
        return output.error();
    }
    if (step.size() == reference.size()) {
        return *output;
    }
    try {
        json::json_pointer pointer(reference.substr(step.size()));
        if (!output->contains(pointer)) {
            return invalid("output of step '" + step + "' has no value at " + pointer.to_string());
        }
        return output->at(pointer);
    } catch (const json::exception& e) {
        return invalid("invalid reference '${" + reference + "}': " + e.what());
    }
}

caf::expected<json> PipelineLoader::render(const json& templ, const PipelineContext& context) {
    if (templ.is_string()) {
        return render_string(templ.get<std::string>(), context);
    }
    if (templ.is_object()) {
        json out = json::object();
        for (const auto& [key, value] : templ.items()) {
            auto rendered = render(value, context);
            if (!rendered) {
                return rendered.error();
            }
            out[key] = std::move(*rendered);
        }
        return out;
    }
    if (templ.is_array()) {
        json out = json::array();
        for (const auto& value : templ) {
            auto rendered = render(value, context);
            if (!rendered) {
                return rendered.error();
            }
            out.push_back(std::move(*rendered));
        }
        return out;
    }
    return templ;
}

std::vector<std::string> PipelineLoader::references_in(const json& templ) {
    std::vector<std::string> names;
    collect_references(templ, names);
    return names;
}

caf::expected<PipelineDefinition> PipelineLoader::from_json(const json& doc) {
    if (!doc.is_object()) {
        return invalid("pipeline definition must be a JSON object");
    }
    if (!doc.contains("id") || !doc["id"].is_string() || doc["id"].get<std::string>().empty()) {
        return invalid("pipeline definition requires a non-empty 'id'");
    }
    if (!doc.contains("steps") || !doc["steps"].is_array() || doc["steps"].empty()) {
        return invalid("pipeline definition requires a non-empty 'steps' array");
    }

    PipelineDefinition definition;
    definition.id = doc["id"].get<std::string>();
    std::set<std::string> earlier;
    for (const auto& entry : doc["steps"]) {
        auto step = make_step(entry, earlier);
        if (!step) {
            return step.error();
        }
        if (!earlier.insert(step->name).second) {
            return invalid("duplicate step name '" + step->name + "'");
        }
        definition.steps.push_back(std::move(*step));
    }
    return definition;
}

caf::expected<PipelineDefinition> PipelineLoader::from_string(const std::string& text) {
    auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return invalid("pipeline definition is not valid JSON");
    }
    return from_json(doc);
}

caf::expected<PipelineDefinition> PipelineLoader::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return invalid("cannot open pipeline definition " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return from_string(buffer.str());
}

} // namespace client
} // namespace tollgate
