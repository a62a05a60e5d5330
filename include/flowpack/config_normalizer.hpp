#pragma once

#include "flowpack/component_resolver.hpp"
#include "flowpack/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace flowpack {

struct DefaultOperationResult {
    bool ok = false;
    std::string error;
    std::optional<std::string> operation;  // Absent when the manifest declares none
};

// First entry of the manifest's `operations` array: its `name`, or the entry
// itself when it is a string.
DefaultOperationResult default_operation(const ResolvedComponent& component);

struct NormalizeResult {
    bool ok = false;
    BuildError error_code = BuildError::MANIFEST_INVALID;
    std::string error;
    std::vector<ResolvedNode> nodes;  // Same order as the input, normalized config
};

// Backfill `operation` and `op` on node payloads that name neither.
//
// The flow document is updated in place so the packaged flow carries the
// defaults. Existing keys are never overwritten. Input nodes are not
// modified; the result holds new records with the payload as it now reads
// in the document.
NormalizeResult normalize_node_operations(json& flow_doc,
                                          const ComponentResolver& resolver,
                                          const std::vector<ResolvedNode>& nodes);

} // namespace flowpack
