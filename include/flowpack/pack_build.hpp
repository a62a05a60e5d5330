#pragma once

#include "flowpack/flow_bundle.hpp"
#include "flowpack/pack_assembler.hpp"
#include "flowpack/provenance.hpp"
#include "flowpack/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flowpack {

// ============================================================================
// Build Stages
// ============================================================================

enum class BuildStage {
    Start,
    FlowValidated,
    NodesResolved,
    ConfigNormalized,
    SchemaChecked,
    ArtifactsCollected,
    Assembled,
    DeterminismVerified,
    Done,
    Failed,
};

const char* build_stage_to_string(BuildStage stage);

// ============================================================================
// Build Configuration
// ============================================================================

struct BuildConfig {
    std::string workspace_root;
    std::string flow_path;                         // Must stay under workspace_root
    std::string output_path;                       // Relative paths resolve against workspace_root
    std::optional<std::string> meta_path;          // pack.toml, must stay under workspace_root
    std::vector<std::string> component_dirs;       // Default: <workspace_root>/components
    std::optional<std::string> diagnostics_dir;    // Default: <workspace_root>/.flowpack/resolved_config
    SigningMode signing = SigningMode::Dev;
    bool verify_determinism = false;

    // Frozen provenance; collected with provenance_options when unset
    std::optional<Provenance> provenance;
    ProvenanceOptions provenance_options;

    // Service implementations; the YAML validator and gtpack assembler when unset
    std::shared_ptr<const FlowValidator> flow_validator;
    std::shared_ptr<const ArchiveAssembler> assembler;
};

// Default diagnostics directory below a workspace
std::string default_diagnostics_dir(const std::string& workspace_root);

// ============================================================================
// Build Result
// ============================================================================

struct BuildResult {
    bool ok = false;
    BuildStage stage = BuildStage::Start;    // Done or Failed once run_pack_build returns
    BuildStage reached = BuildStage::Start;  // Last stage completed
    std::optional<BuildError> error_code;
    std::string error;
    std::vector<NodeSchemaError> schema_errors;

    std::string out_path;
    std::string manifest_hash;
    std::string flow_hash;
    std::vector<ResolvedNode> nodes;          // Normalized
    std::vector<ComponentArtifact> artifacts;
    std::vector<std::string> diagnostics_files;
    Provenance provenance;
    bool determinism_verified = false;
};

// Run the whole pipeline: validate the flow, resolve and normalize nodes,
// check node configuration, collect artifacts, write diagnostics and the
// archive. With verify_determinism the pipeline runs a second time into a
// temporary directory and both archives must match byte for byte.
BuildResult run_pack_build(const BuildConfig& config);

// Diagnostics file name for a node. Separators, "%" and control bytes are
// percent-encoded, so distinct node ids always get distinct files.
std::string diagnostics_file_name(const std::string& node_id);

} // namespace flowpack
