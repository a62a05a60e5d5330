#pragma once

#include "flowpack/component_resolver.hpp"
#include "flowpack/flow_bundle.hpp"
#include "flowpack/types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace flowpack {

// Component name of the inline execution wrapper
inline constexpr const char* EXEC_COMPONENT = "component.exec";

// Runtime-provided node (flow.call, session.wait, emit*). Never packaged.
struct BuiltInNode {
    std::string node_id;
    std::string component;
};

// Node backed by a packaged component. For component.exec nodes the pin
// comes from the payload's `component` reference and `payload_key` is
// "component.exec"; otherwise `payload_key` is the pinned name itself.
struct ExternalNode {
    std::string node_id;
    ComponentPin pin;
    std::string payload_key;
    bool inline_exec = false;
};

using ClassifiedNode = std::variant<BuiltInNode, ExternalNode>;

// True for component names the runtime provides itself
bool is_builtin_component(const std::string& name);

struct ClassifyResult {
    bool ok = false;
    BuildError error_code = BuildError::MISSING_FLOW_NODE;
    std::string error;
    ClassifiedNode node;
};

// Classify a flow node once. component.exec nodes are turned into external
// nodes here, which requires reading their payload from the flow document.
ClassifyResult classify_node(const NodeRef& ref, const json& flow_doc);

struct NodeResolveResult {
    bool ok = false;
    BuildError error_code = BuildError::COMPONENT_NOT_FOUND;
    std::string error;
    std::vector<ResolvedNode> nodes;  // Flow order, built-ins omitted
};

// Resolve every packaged node of the flow to a concrete component build.
// Stops at the first failure.
NodeResolveResult resolve_nodes(const FlowBundle& bundle,
                                const json& flow_doc,
                                ComponentResolver& resolver);

// Escape one JSON pointer reference token ("~" -> "~0", "/" -> "~1")
std::string escape_pointer_token(const std::string& token);

// "/nodes/<node_id>/<payload_key>"
std::string node_payload_pointer(const std::string& node_id, const std::string& payload_key);

} // namespace flowpack
