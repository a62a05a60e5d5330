#include "flowpack/artifact_collector.hpp"
#include "flowpack/hash.hpp"

#include <set>

namespace flowpack {

ComponentArtifact to_component_artifact(const ResolvedComponent& component) {
    ComponentArtifact artifact;
    artifact.name = component.name;
    artifact.version = component.version_str;
    artifact.artifact_path = component.artifact_path;
    artifact.schema_json = component.schema_json;
    artifact.manifest_json = component.manifest_json;
    artifact.capabilities = component.capabilities;
    artifact.world = component.world;
    artifact.hash_hex = normalize_hash_hex(component.artifact_hash);
    return artifact;
}

std::vector<ComponentArtifact> collect_component_artifacts(const std::vector<ResolvedNode>& nodes,
                                                           const ComponentResolver& resolver) {
    std::vector<ComponentArtifact> artifacts;
    std::set<std::string> seen;

    for (const auto& node : nodes) {
        if (!seen.insert(node.component).second) continue;

        const ResolvedComponent* component = resolver.find(node.component);
        if (!component) continue;

        artifacts.push_back(to_component_artifact(*component));
    }
    return artifacts;
}

} // namespace flowpack
