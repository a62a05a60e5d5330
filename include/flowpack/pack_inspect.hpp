#pragma once

#include "flowpack/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace flowpack {

struct InspectedFlow {
    std::string id;
    std::string kind;
    std::string entry;
    size_t node_count = 0;
    std::string declared_hash;
    std::string actual_hash;   // Recomputed from the packaged flow document
};

struct InspectedComponent {
    std::string name;
    std::string version;
    std::string world;
    std::string artifact_hash;
    std::string declared_sha256;
    std::string actual_sha256;  // Empty when the artifact is missing
    std::vector<std::string> missing_files;
};

struct PackInspection {
    bool ok = false;           // Archive and manifest could be read
    std::string error;
    std::vector<std::string> entries;  // Archive paths, directories with a trailing '/'
    json meta = json::object();
    std::string signing;
    json provenance = json::object();
    std::string manifest_hash;
    std::vector<InspectedFlow> flows;
    std::vector<InspectedComponent> components;
    std::vector<std::string> problems;  // Hash mismatches and missing files

    bool verified() const { return ok && problems.empty(); }
};

// Open a built pack, parse its manifest, recompute flow and artifact hashes
// and check that every file the manifest names is present.
PackInspection inspect_pack(const std::string& pack_path);
PackInspection inspect_pack_data(const std::vector<uint8_t>& archive_data);

json pack_inspection_to_json(const PackInspection& inspection);

} // namespace flowpack
