#pragma once

#include "flowpack/archive.hpp"
#include "flowpack/flow_bundle.hpp"
#include "flowpack/types.hpp"

#include <string>
#include <vector>

namespace flowpack {

// Archive layout
inline constexpr const char* PACK_MANIFEST_PATH = "manifest.json";
inline constexpr const char* PACK_FLOWS_DIR = "flows";
inline constexpr const char* PACK_COMPONENTS_DIR = "components";

struct AssemblyRequest {
    PackMeta meta;
    FlowBundle flow;  // Normalized document, hash recomputed
    SigningMode signing = SigningMode::Dev;
    Provenance provenance;
    std::vector<ComponentArtifact> components;
};

struct AssemblyResult {
    bool ok = false;
    std::string error;
    std::string out_path;
    std::string manifest_hash;  // SHA-256 hex of manifest.json
};

// Archive writing service. The pipeline only depends on this interface.
class ArchiveAssembler {
public:
    virtual ~ArchiveAssembler() = default;

    virtual AssemblyResult assemble(const AssemblyRequest& request,
                                    const std::string& output_path) const = 0;
};

// Writes a deterministic tar.gz `.gtpack`, atomically
class GtpackAssembler : public ArchiveAssembler {
public:
    AssemblyResult assemble(const AssemblyRequest& request,
                            const std::string& output_path) const override;
};

// Archive paths for one flow and one component build
std::string flow_dir_path(const std::string& flow_id);
std::string component_dir_path(const std::string& name, const std::string& version);

// The pack manifest (meta, flows, components, signing, provenance).
// Component entries include `artifact_sha256`, the digest of the packaged
// artifact bytes, so they need to be read first.
json build_pack_manifest(const AssemblyRequest& request,
                         const std::vector<std::string>& artifact_sha256);

struct PackEntriesResult {
    bool ok = false;
    std::string error;
    std::vector<TarEntry> entries;  // Includes parent directories
    std::string manifest_text;      // canonical manifest.json bytes
};

// Every archive entry for a request, reading artifacts from disk
PackEntriesResult build_pack_entries(const AssemblyRequest& request);

} // namespace flowpack
