#include "flowpack/node_resolver.hpp"

#include <spdlog/spdlog.h>

namespace flowpack {

namespace {

// The node's map inside the flow document, or nullptr
const json* find_document_node(const json& flow_doc, const std::string& node_id) {
    if (!flow_doc.is_object() || !flow_doc.contains("nodes")) return nullptr;
    const json& nodes = flow_doc["nodes"];
    if (!nodes.is_object() || !nodes.contains(node_id)) return nullptr;
    const json& node = nodes[node_id];
    return node.is_object() ? &node : nullptr;
}

ClassifyResult missing_node(const std::string& node_id) {
    ClassifyResult result;
    result.error_code = BuildError::MISSING_FLOW_NODE;
    result.error = "node `" + node_id + "` missing from flow document";
    return result;
}

ClassifyResult missing_payload(const std::string& node_id, const std::string& what) {
    ClassifyResult result;
    result.error_code = BuildError::MISSING_EXEC_PAYLOAD;
    result.error = "component.exec node `" + node_id + "` " + what;
    return result;
}

} // namespace

bool is_builtin_component(const std::string& name) {
    return name == EXEC_COMPONENT || name == "flow.call" || name == "session.wait" ||
           name.rfind("emit", 0) == 0;
}

std::string escape_pointer_token(const std::string& token) {
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
    return out;
}

std::string node_payload_pointer(const std::string& node_id, const std::string& payload_key) {
    return "/nodes/" + escape_pointer_token(node_id) + "/" + escape_pointer_token(payload_key);
}

ClassifyResult classify_node(const NodeRef& ref, const json& flow_doc) {
    const std::string& name = ref.component.name;

    if (is_builtin_component(name) && name != EXEC_COMPONENT) {
        ClassifyResult result;
        result.ok = true;
        result.node = BuiltInNode{ref.node_id, name};
        return result;
    }

    const json* node = find_document_node(flow_doc, ref.node_id);
    if (!node) {
        return missing_node(ref.node_id);
    }

    ExternalNode external;
    external.node_id = ref.node_id;

    if (name == EXEC_COMPONENT) {
        if (!node->contains(EXEC_COMPONENT) || !(*node)[EXEC_COMPONENT].is_object()) {
            return missing_payload(ref.node_id, "has no payload");
        }
        const json& payload = (*node)[EXEC_COMPONENT];
        if (!payload.contains("component") || !payload["component"].is_string()) {
            return missing_payload(ref.node_id, "requires a `component` string");
        }
        external.pin = parse_component_ref(payload["component"].get<std::string>());
        if (external.pin.name.empty()) {
            return missing_payload(ref.node_id, "has an empty `component` reference");
        }
        external.payload_key = EXEC_COMPONENT;
        external.inline_exec = true;
    } else {
        external.pin = ref.component;
        external.payload_key = name;
    }

    ClassifyResult result;
    result.ok = true;
    result.node = std::move(external);
    return result;
}

NodeResolveResult resolve_nodes(const FlowBundle& bundle,
                                const json& flow_doc,
                                ComponentResolver& resolver) {
    NodeResolveResult result;

    for (const auto& ref : bundle.nodes) {
        auto classified = classify_node(ref, flow_doc);
        if (!classified.ok) {
            result.error_code = classified.error_code;
            result.error = classified.error;
            return result;
        }

        if (auto* builtin = std::get_if<BuiltInNode>(&classified.node)) {
            spdlog::debug("node {} uses built-in {}; not packaged", builtin->node_id,
                          builtin->component);
            continue;
        }

        const auto& external = std::get<ExternalNode>(classified.node);
        auto resolved = resolver.resolve(external.pin.name, external.pin.version_req);
        if (!resolved.ok) {
            result.error_code = resolved.error_code;
            result.error = "node `" + external.node_id + "`: " + resolved.error;
            return result;
        }

        const json& doc_node = flow_doc["nodes"][external.node_id];

        ResolvedNode node;
        node.node_id = external.node_id;
        node.component = resolved.key;
        node.pointer = node_payload_pointer(external.node_id, external.payload_key);
        node.config = doc_node.contains(external.payload_key) ? doc_node[external.payload_key]
                                                              : json(nullptr);
        node.inline_exec = external.inline_exec;
        result.nodes.push_back(std::move(node));
    }

    result.ok = true;
    return result;
}

} // namespace flowpack
