#pragma once

#include "flowpack/semver.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace flowpack {

using json = nlohmann::json;

// ============================================================================
// Build Errors
// ============================================================================

// Errors that halt a pack build. Every failure surfaces exactly one of these,
// except SCHEMA_VALIDATION_FAILED which carries the aggregated node errors.
enum class BuildError {
    FLOW_INVALID,
    PATH_ESCAPES_ROOT,
    COMPONENT_NOT_FOUND,
    MANIFEST_INVALID,
    INVALID_VERSION_REQUIREMENT,
    MISSING_FLOW_NODE,
    MISSING_EXEC_PAYLOAD,
    SCHEMA_VALIDATION_FAILED,
    PACK_META_INVALID,
    DIAGNOSTICS_WRITE_FAILED,
    ARCHIVE_ASSEMBLY_FAILED,
    NON_DETERMINISTIC_BUILD,
};

inline const char* build_error_to_string(BuildError e) {
    switch (e) {
        case BuildError::FLOW_INVALID: return "FLOW_INVALID";
        case BuildError::PATH_ESCAPES_ROOT: return "PATH_ESCAPES_ROOT";
        case BuildError::COMPONENT_NOT_FOUND: return "COMPONENT_NOT_FOUND";
        case BuildError::MANIFEST_INVALID: return "MANIFEST_INVALID";
        case BuildError::INVALID_VERSION_REQUIREMENT: return "INVALID_VERSION_REQUIREMENT";
        case BuildError::MISSING_FLOW_NODE: return "MISSING_FLOW_NODE";
        case BuildError::MISSING_EXEC_PAYLOAD: return "MISSING_EXEC_PAYLOAD";
        case BuildError::SCHEMA_VALIDATION_FAILED: return "SCHEMA_VALIDATION_FAILED";
        case BuildError::PACK_META_INVALID: return "PACK_META_INVALID";
        case BuildError::DIAGNOSTICS_WRITE_FAILED: return "DIAGNOSTICS_WRITE_FAILED";
        case BuildError::ARCHIVE_ASSEMBLY_FAILED: return "ARCHIVE_ASSEMBLY_FAILED";
        case BuildError::NON_DETERMINISTIC_BUILD: return "NON_DETERMINISTIC_BUILD";
    }
    return "UNKNOWN";
}

// Parse an error code string (case-insensitive)
std::optional<BuildError> parse_build_error(const std::string& s);

// ============================================================================
// Signing Mode
// ============================================================================

// Passed through to the archive assembler and recorded in the pack manifest.
enum class SigningMode {
    Dev,
    None
};

inline const char* signing_mode_to_string(SigningMode m) {
    switch (m) {
        case SigningMode::Dev: return "dev";
        case SigningMode::None: return "none";
    }
    return "none";
}

std::optional<SigningMode> parse_signing_mode(const std::string& s);

// ============================================================================
// Flow Node References
// ============================================================================

struct ComponentPin {
    std::string name;
    std::string version_req;  // Raw requirement text, "*" when the flow omits it
};

struct NodeRef {
    std::string node_id;
    ComponentPin component;
    std::optional<std::string> schema_id;
};

// ============================================================================
// Resolved Components and Nodes
// ============================================================================

// A concrete component build found on the search path. Owned by the
// ComponentResolver arena and shared by key across every referencing node.
struct ResolvedComponent {
    std::string name;
    Version version;
    std::string version_str;         // Version exactly as the manifest declares it
    std::string manifest_path;
    std::string artifact_path;       // Absolute path of the executable artifact
    std::string manifest_json;       // Raw manifest text
    std::optional<std::string> schema_json;
    json capabilities = json::object();
    std::string world;
    std::string artifact_hash;       // May carry a scheme prefix ("blake3:...")

    std::string key() const;
};

// Arena key for a component: "name@version"
std::string make_component_key(const std::string& name, const std::string& version);

struct ResolvedNode {
    std::string node_id;
    std::string component;           // Arena key (name@version)
    std::string pointer;             // JSON pointer to the config payload in the flow document
    json config = json::object();
    bool inline_exec = false;        // Payload is a component.exec wrapper
};

struct NodeSchemaError {
    std::string node_id;
    std::string component;
    std::string pointer;
    std::string message;
};

// ============================================================================
// Packaging Projections
// ============================================================================

struct ComponentArtifact {
    std::string name;
    std::string version;
    std::string artifact_path;
    std::optional<std::string> schema_json;
    std::string manifest_json;
    json capabilities = json::object();
    std::string world;
    std::string hash_hex;            // Bare hex digest, scheme prefix stripped
};

struct PackImport {
    std::string pack_id;
    std::string version_req;
};

struct PackMeta {
    int pack_format_version = 1;
    std::string pack_id;
    std::string version = "0.1.0";
    std::string name;
    std::string kind;
    std::string description;
    std::vector<std::string> authors;
    std::string license;
    std::string homepage;
    std::string support;
    std::string vendor;
    std::vector<std::string> entry_flows;
    std::vector<PackImport> imports;
    json annotations = json::object();
    json distribution = json::object();
    std::string created_at_utc;

    // Descriptor sections carried into the manifest without interpretation.
    // The tables are null when absent.
    json events;
    json repo;
    json messaging;
    json interfaces = json::array();
    json components = json::array();
};

struct Provenance {
    std::string builder;
    std::optional<std::string> git_commit;
    std::optional<std::string> git_repo;
    std::string built_at_utc;
    std::optional<std::string> host;
    std::string notes;
};

json pack_meta_to_json(const PackMeta& meta);
json provenance_to_json(const Provenance& provenance);

} // namespace flowpack
