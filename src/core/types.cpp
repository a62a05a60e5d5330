#include "flowpack/types.hpp"

#include <algorithm>
#include <cctype>

namespace flowpack {

namespace {

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<BuildError> parse_build_error(const std::string& s) {
    std::string upper = to_upper(s);

    if (upper == "FLOW_INVALID") return BuildError::FLOW_INVALID;
    if (upper == "PATH_ESCAPES_ROOT") return BuildError::PATH_ESCAPES_ROOT;
    if (upper == "COMPONENT_NOT_FOUND") return BuildError::COMPONENT_NOT_FOUND;
    if (upper == "MANIFEST_INVALID") return BuildError::MANIFEST_INVALID;
    if (upper == "INVALID_VERSION_REQUIREMENT") return BuildError::INVALID_VERSION_REQUIREMENT;
    if (upper == "MISSING_FLOW_NODE") return BuildError::MISSING_FLOW_NODE;
    if (upper == "MISSING_EXEC_PAYLOAD") return BuildError::MISSING_EXEC_PAYLOAD;
    if (upper == "SCHEMA_VALIDATION_FAILED") return BuildError::SCHEMA_VALIDATION_FAILED;
    if (upper == "PACK_META_INVALID") return BuildError::PACK_META_INVALID;
    if (upper == "DIAGNOSTICS_WRITE_FAILED") return BuildError::DIAGNOSTICS_WRITE_FAILED;
    if (upper == "ARCHIVE_ASSEMBLY_FAILED") return BuildError::ARCHIVE_ASSEMBLY_FAILED;
    if (upper == "NON_DETERMINISTIC_BUILD") return BuildError::NON_DETERMINISTIC_BUILD;

    return std::nullopt;
}

std::optional<SigningMode> parse_signing_mode(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "dev") return SigningMode::Dev;
    if (lower == "none") return SigningMode::None;
    return std::nullopt;
}

std::string make_component_key(const std::string& name, const std::string& version) {
    return name + "@" + version;
}

std::string ResolvedComponent::key() const {
    return make_component_key(name, version_str);
}

json pack_meta_to_json(const PackMeta& meta) {
    json j;
    j["pack_version"] = meta.pack_format_version;
    j["pack_id"] = meta.pack_id;
    j["version"] = meta.version;
    j["name"] = meta.name;
    if (!meta.kind.empty()) j["kind"] = meta.kind;
    if (!meta.description.empty()) j["description"] = meta.description;
    j["authors"] = meta.authors;
    if (!meta.license.empty()) j["license"] = meta.license;
    if (!meta.homepage.empty()) j["homepage"] = meta.homepage;
    if (!meta.support.empty()) j["support"] = meta.support;
    if (!meta.vendor.empty()) j["vendor"] = meta.vendor;
    j["entry_flows"] = meta.entry_flows;

    json imports = json::array();
    for (const auto& imp : meta.imports) {
        imports.push_back({{"pack_id", imp.pack_id}, {"version_req", imp.version_req}});
    }
    j["imports"] = imports;
    j["annotations"] = meta.annotations;
    j["distribution"] = meta.distribution;
    j["created_at_utc"] = meta.created_at_utc;
    if (!meta.events.is_null()) j["events"] = meta.events;
    if (!meta.repo.is_null()) j["repo"] = meta.repo;
    if (!meta.messaging.is_null()) j["messaging"] = meta.messaging;
    j["interfaces"] = meta.interfaces;
    j["components"] = meta.components;
    return j;
}

json provenance_to_json(const Provenance& provenance) {
    json j;
    j["builder"] = provenance.builder;
    j["built_at_utc"] = provenance.built_at_utc;
    if (provenance.git_commit) j["git_commit"] = *provenance.git_commit;
    if (provenance.git_repo) j["git_repo"] = *provenance.git_repo;
    if (provenance.host) j["host"] = *provenance.host;
    if (!provenance.notes.empty()) j["notes"] = provenance.notes;
    return j;
}

} // namespace flowpack
