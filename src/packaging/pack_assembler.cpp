#include "flowpack/pack_assembler.hpp"
#include "flowpack/hash.hpp"
#include "flowpack/platform.hpp"

#include <spdlog/spdlog.h>

namespace flowpack {

std::string flow_dir_path(const std::string& flow_id) {
    return std::string(PACK_FLOWS_DIR) + "/" + flow_id;
}

std::string component_dir_path(const std::string& name, const std::string& version) {
    return std::string(PACK_COMPONENTS_DIR) + "/" + make_component_key(name, version);
}

json build_pack_manifest(const AssemblyRequest& request,
                         const std::vector<std::string>& artifact_sha256) {
    const FlowBundle& flow = request.flow;
    std::string flow_dir = flow_dir_path(flow.id);

    json nodes = json::array();
    for (const auto& node : flow.nodes) {
        json entry = {
            {"node_id", node.node_id},
            {"component", {{"name", node.component.name},
                           {"version_req", node.component.version_req}}},
        };
        if (node.schema_id) entry["schema_id"] = *node.schema_id;
        nodes.push_back(std::move(entry));
    }

    json flows = json::array();
    flows.push_back({
        {"id", flow.id},
        {"kind", flow.kind},
        {"entry", flow.entry},
        {"source", flow_dir + "/flow.ygtc"},
        {"document", flow_dir + "/flow.json"},
        {"hash_sha256", flow.hash},
        {"nodes", nodes},
    });

    json components = json::array();
    for (size_t i = 0; i < request.components.size(); ++i) {
        const auto& artifact = request.components[i];
        std::string dir = component_dir_path(artifact.name, artifact.version);

        json entry = {
            {"name", artifact.name},
            {"version", artifact.version},
            {"world", artifact.world},
            {"capabilities", artifact.capabilities},
            {"artifact_hash", artifact.hash_hex},
            {"artifact_sha256", i < artifact_sha256.size() ? artifact_sha256[i] : ""},
            {"artifact", dir + "/component.wasm"},
            {"manifest", dir + "/manifest.json"},
        };
        entry["schema"] = artifact.schema_json ? json(dir + "/schema.json") : json(nullptr);
        components.push_back(std::move(entry));
    }

    return {
        {"meta", pack_meta_to_json(request.meta)},
        {"flows", flows},
        {"components", components},
        {"signing", signing_mode_to_string(request.signing)},
        {"provenance", provenance_to_json(request.provenance)},
    };
}

PackEntriesResult build_pack_entries(const AssemblyRequest& request) {
    PackEntriesResult result;

    std::vector<TarEntry> entries;
    std::vector<std::string> artifact_sha256;

    for (const auto& artifact : request.components) {
        auto bytes = read_binary_file(artifact.artifact_path);
        if (!bytes) {
            result.error = "failed to read component artifact " + artifact.artifact_path;
            return result;
        }
        auto digest = sha256_bytes(*bytes);
        if (!digest.ok) {
            result.error = digest.error;
            return result;
        }
        artifact_sha256.push_back(digest.hex_digest);

        std::string dir = component_dir_path(artifact.name, artifact.version);
        entries.push_back(make_file_entry(dir + "/component.wasm", std::move(*bytes)));
        entries.push_back(make_file_entry(dir + "/manifest.json", artifact.manifest_json));
        if (artifact.schema_json) {
            entries.push_back(make_file_entry(dir + "/schema.json", *artifact.schema_json));
        }
    }

    std::string flow_dir = flow_dir_path(request.flow.id);
    entries.push_back(make_file_entry(flow_dir + "/flow.ygtc", request.flow.source));
    entries.push_back(
        make_file_entry(flow_dir + "/flow.json", canonical_json_dump(request.flow.document)));

    result.manifest_text = canonical_json_dump(build_pack_manifest(request, artifact_sha256));
    entries.push_back(make_file_entry(PACK_MANIFEST_PATH, result.manifest_text));

    add_parent_directories(entries);

    result.ok = true;
    result.entries = std::move(entries);
    return result;
}

AssemblyResult GtpackAssembler::assemble(const AssemblyRequest& request,
                                         const std::string& output_path) const {
    AssemblyResult result;

    auto entries = build_pack_entries(request);
    if (!entries.ok) {
        result.error = entries.error;
        return result;
    }

    auto archive = create_deterministic_archive(entries.entries);
    if (!archive.ok) {
        result.error = archive.error;
        return result;
    }

    auto manifest_hash = sha256_text(entries.manifest_text);
    if (!manifest_hash.ok) {
        result.error = manifest_hash.error;
        return result;
    }

    std::string parent = get_parent_directory(output_path);
    if (!parent.empty() && !create_directories(parent)) {
        result.error = "failed to create output directory " + parent;
        return result;
    }

    auto written = atomic_write_file(output_path, archive.archive_data);
    if (!written.ok) {
        result.error = "failed to write " + output_path + ": " + written.error;
        return result;
    }

    spdlog::debug("wrote {} ({} entries, {} bytes)", output_path, entries.entries.size(),
                  archive.archive_data.size());

    result.ok = true;
    result.out_path = output_path;
    result.manifest_hash = manifest_hash.hex_digest;
    return result;
}

} // namespace flowpack
