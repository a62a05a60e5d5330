#pragma once

#include "flowpack/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace flowpack {

// ============================================================================
// Flow Bundle
// ============================================================================

// A validated flow. Node order is document order.
struct FlowBundle {
    std::string id;
    std::string kind;
    std::string entry;               // Start node id
    std::vector<NodeRef> nodes;
    json document = json::object();  // Flow document converted to JSON
    std::string source;              // Flow source text as read
    std::string hash;                // SHA-256 hex of canonical_json_dump(document)
};

struct FlowValidationResult {
    bool ok = false;
    std::string error;
    FlowBundle bundle;
};

// Flow validation service. The pipeline only depends on this interface.
class FlowValidator {
public:
    virtual ~FlowValidator() = default;

    // `path` is used for error messages only
    virtual FlowValidationResult validate(const std::string& source,
                                          const std::optional<std::string>& path) const = 0;
};

// Validates `.ygtc` YAML flow documents:
//   - `id` and `type` are non-empty strings
//   - `nodes` is a non-empty map; each node holds exactly one component key
//     besides the reserved keys `routing`, `version` and `schema`
//   - `start` (default: first node) and every `routing[].to` name a node
class YamlFlowValidator : public FlowValidator {
public:
    FlowValidationResult validate(const std::string& source,
                                  const std::optional<std::string>& path) const override;
};

// ============================================================================
// YAML and Canonical JSON
// ============================================================================

struct YamlParseResult {
    bool ok = false;
    std::string error;
    json value;
};

// Parse a YAML document into JSON. Quoted scalars stay strings; plain
// scalars become null, bool, integer or float when they read as one.
YamlParseResult parse_yaml_document(const std::string& source);

// Compact JSON with object keys in sorted order
std::string canonical_json_dump(const json& value);

// SHA-256 hex of canonical_json_dump(document); empty on digest failure
std::string hash_flow_document(const json& document);

// True for the node keys that are not component references
bool is_reserved_node_key(const std::string& key);

} // namespace flowpack
