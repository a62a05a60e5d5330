#pragma once

#include "flowpack/component_resolver.hpp"
#include "flowpack/types.hpp"

#include <vector>

namespace flowpack {

// One artifact per distinct component build, in first-seen node order.
// Hashes are reduced to bare hex (any "<scheme>:" prefix removed).
std::vector<ComponentArtifact> collect_component_artifacts(const std::vector<ResolvedNode>& nodes,
                                                           const ComponentResolver& resolver);

// Project a resolved component into its packaging form
ComponentArtifact to_component_artifact(const ResolvedComponent& component);

} // namespace flowpack
