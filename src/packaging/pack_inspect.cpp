#include "flowpack/pack_inspect.hpp"
#include "flowpack/archive.hpp"
#include "flowpack/flow_bundle.hpp"
#include "flowpack/hash.hpp"
#include "flowpack/pack_assembler.hpp"
#include "flowpack/platform.hpp"

#include <map>

namespace flowpack {

namespace {

std::string get_string(const json& j, const std::string& key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

std::string bytes_to_string(const std::vector<uint8_t>& data) {
    return std::string(data.begin(), data.end());
}

} // namespace

PackInspection inspect_pack(const std::string& pack_path) {
    auto data = read_binary_file(pack_path);
    if (!data) {
        PackInspection inspection;
        inspection.error = "failed to read " + pack_path;
        return inspection;
    }
    return inspect_pack_data(*data);
}

PackInspection inspect_pack_data(const std::vector<uint8_t>& archive_data) {
    PackInspection inspection;

    auto archive = read_archive_entries(archive_data);
    if (!archive.ok) {
        inspection.error = "invalid pack archive: " + archive.error;
        return inspection;
    }

    std::map<std::string, const TarEntry*> files;
    for (const auto& entry : archive.entries) {
        if (entry.type == TarEntryType::Directory) {
            inspection.entries.push_back(entry.path + "/");
        } else {
            inspection.entries.push_back(entry.path);
            files[entry.path] = &entry;
        }
    }

    auto manifest_it = files.find(PACK_MANIFEST_PATH);
    if (manifest_it == files.end()) {
        inspection.error = std::string("pack has no ") + PACK_MANIFEST_PATH;
        return inspection;
    }

    std::string manifest_text = bytes_to_string(manifest_it->second->data);
    json manifest;
    try {
        manifest = json::parse(manifest_text);
    } catch (const json::parse_error& e) {
        inspection.error = std::string("invalid ") + PACK_MANIFEST_PATH + ": " + e.what();
        return inspection;
    }
    if (!manifest.is_object()) {
        inspection.error = std::string(PACK_MANIFEST_PATH) + " is not a JSON object";
        return inspection;
    }

    auto manifest_hash = sha256_text(manifest_text);
    if (!manifest_hash.ok) {
        inspection.error = manifest_hash.error;
        return inspection;
    }
    inspection.manifest_hash = manifest_hash.hex_digest;

    if (manifest.contains("meta")) inspection.meta = manifest["meta"];
    if (manifest.contains("provenance")) inspection.provenance = manifest["provenance"];
    inspection.signing = get_string(manifest, "signing");

    auto require_file = [&](const std::string& path, std::vector<std::string>* missing) {
        if (path.empty() || files.count(path) > 0) return true;
        inspection.problems.push_back("missing file " + path);
        if (missing) missing->push_back(path);
        return false;
    };

    if (manifest.contains("flows") && manifest["flows"].is_array()) {
        for (const auto& flow_json : manifest["flows"]) {
            InspectedFlow flow;
            flow.id = get_string(flow_json, "id");
            flow.kind = get_string(flow_json, "kind");
            flow.entry = get_string(flow_json, "entry");
            flow.declared_hash = get_string(flow_json, "hash_sha256");
            if (flow_json.contains("nodes") && flow_json["nodes"].is_array()) {
                flow.node_count = flow_json["nodes"].size();
            }

            require_file(get_string(flow_json, "source"), nullptr);

            std::string document_path = get_string(flow_json, "document");
            if (require_file(document_path, nullptr) && !document_path.empty()) {
                try {
                    json document = json::parse(bytes_to_string(files[document_path]->data));
                    flow.actual_hash = hash_flow_document(document);
                } catch (const json::parse_error& e) {
                    inspection.problems.push_back("flow " + flow.id + ": invalid document: " +
                                                  e.what());
                }
            }
            if (!flow.actual_hash.empty() && flow.actual_hash != flow.declared_hash) {
                inspection.problems.push_back("flow " + flow.id + ": hash mismatch");
            }
            inspection.flows.push_back(std::move(flow));
        }
    }

    if (manifest.contains("components") && manifest["components"].is_array()) {
        for (const auto& comp_json : manifest["components"]) {
            InspectedComponent component;
            component.name = get_string(comp_json, "name");
            component.version = get_string(comp_json, "version");
            component.world = get_string(comp_json, "world");
            component.artifact_hash = get_string(comp_json, "artifact_hash");
            component.declared_sha256 = get_string(comp_json, "artifact_sha256");

            std::string artifact_path = get_string(comp_json, "artifact");
            if (artifact_path.empty()) {
                inspection.problems.push_back("component " + component.name +
                                              ": no artifact path");
            } else if (require_file(artifact_path, &component.missing_files)) {
                auto digest = sha256_bytes(files[artifact_path]->data);
                if (digest.ok) component.actual_sha256 = digest.hex_digest;
                if (component.actual_sha256 != component.declared_sha256) {
                    inspection.problems.push_back("component " +
                                                  make_component_key(component.name,
                                                                     component.version) +
                                                  ": artifact hash mismatch");
                }
            }
            require_file(get_string(comp_json, "manifest"), &component.missing_files);
            require_file(get_string(comp_json, "schema"), &component.missing_files);

            inspection.components.push_back(std::move(component));
        }
    }

    inspection.ok = true;
    return inspection;
}

json pack_inspection_to_json(const PackInspection& inspection) {
    json j;
    j["ok"] = inspection.ok;
    j["verified"] = inspection.verified();
    if (!inspection.ok) {
        j["error"] = inspection.error;
        return j;
    }

    j["manifest_hash"] = inspection.manifest_hash;
    j["meta"] = inspection.meta;
    j["signing"] = inspection.signing;
    j["provenance"] = inspection.provenance;
    j["entries"] = inspection.entries;
    j["problems"] = inspection.problems;

    json flows = json::array();
    for (const auto& flow : inspection.flows) {
        flows.push_back({
            {"id", flow.id},
            {"kind", flow.kind},
            {"entry", flow.entry},
            {"nodes", flow.node_count},
            {"hash_sha256", flow.declared_hash},
            {"hash_ok", !flow.actual_hash.empty() && flow.actual_hash == flow.declared_hash},
        });
    }
    j["flows"] = flows;

    json components = json::array();
    for (const auto& component : inspection.components) {
        components.push_back({
            {"name", component.name},
            {"version", component.version},
            {"world", component.world},
            {"artifact_hash", component.artifact_hash},
            {"artifact_sha256", component.actual_sha256},
            {"missing_files", component.missing_files},
        });
    }
    j["components"] = components;
    return j;
}

} // namespace flowpack
