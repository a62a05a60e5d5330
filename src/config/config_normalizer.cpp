#include "flowpack/config_normalizer.hpp"

#include <cctype>

#include <spdlog/spdlog.h>

namespace flowpack {

namespace {

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool has_operation(const json& payload, const char* key) {
    return payload.contains(key) && payload[key].is_string() &&
           !is_blank(payload[key].get<std::string>());
}

} // namespace

DefaultOperationResult default_operation(const ResolvedComponent& component) {
    DefaultOperationResult result;

    json manifest;
    try {
        manifest = json::parse(component.manifest_json);
    } catch (const json::parse_error& e) {
        result.error = "invalid manifest JSON for " + component.key() + ": " + e.what();
        return result;
    }

    result.ok = true;
    if (!manifest.contains("operations") || !manifest["operations"].is_array() ||
        manifest["operations"].empty()) {
        return result;
    }

    const json& first = manifest["operations"].front();
    if (first.is_string()) {
        result.operation = first.get<std::string>();
    } else if (first.is_object() && first.contains("name") && first["name"].is_string()) {
        result.operation = first["name"].get<std::string>();
    }
    return result;
}

NormalizeResult normalize_node_operations(json& flow_doc,
                                          const ComponentResolver& resolver,
                                          const std::vector<ResolvedNode>& nodes) {
    NormalizeResult result;

    for (const auto& node : nodes) {
        ResolvedNode normalized = node;

        json::json_pointer pointer(node.pointer);
        if (!flow_doc.contains(pointer)) {
            result.nodes.push_back(std::move(normalized));
            continue;
        }
        json& payload = flow_doc[pointer];

        if (payload.is_object() && !has_operation(payload, "operation") &&
            !has_operation(payload, "op")) {
            const ResolvedComponent* component = resolver.find(node.component);
            if (!component) {
                result.error = "node `" + node.node_id + "`: component " + node.component +
                               " is not resolved";
                return result;
            }

            auto op = default_operation(*component);
            if (!op.ok) {
                result.error = "node `" + node.node_id + "`: " + op.error;
                return result;
            }

            if (op.operation) {
                if (!payload.contains("operation")) payload["operation"] = *op.operation;
                if (!payload.contains("op")) payload["op"] = *op.operation;
                spdlog::debug("node {} defaults to operation {}", node.node_id, *op.operation);
            } else {
                spdlog::debug("node {}: {} declares no operations", node.node_id, node.component);
            }
        }

        normalized.config = payload;
        result.nodes.push_back(std::move(normalized));
    }

    result.ok = true;
    return result;
}

} // namespace flowpack
