#include "flowpack/component_resolver.hpp"
#include "flowpack/hash.hpp"
#include "flowpack/platform.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace flowpack {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::string> get_string(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Nested string lookup ("artifacts" -> "component_wasm")
std::optional<std::string> get_nested_string(const json& j, const std::string& section,
                                             const std::string& key) {
    if (j.contains(section) && j[section].is_object()) {
        return get_string(j[section], key);
    }
    return std::nullopt;
}

std::string join_roots(const std::vector<std::string>& roots) {
    std::string out;
    for (const auto& root : roots) {
        if (!out.empty()) out += ", ";
        out += root;
    }
    return out.empty() ? "<none>" : out;
}

} // namespace

ComponentPin parse_component_ref(const std::string& raw) {
    ComponentPin pin;
    auto at = raw.find('@');
    if (at == std::string::npos) {
        pin.name = trim(raw);
        pin.version_req = "*";
    } else {
        pin.name = trim(raw.substr(0, at));
        pin.version_req = trim(raw.substr(at + 1));
    }
    return pin;
}

ComponentResolver::ComponentResolver(std::vector<std::string> search_roots)
    : roots_(std::move(search_roots)) {}

const ResolvedComponent* ComponentResolver::find(const std::string& key) const {
    auto it = arena_.find(key);
    return it == arena_.end() ? nullptr : &it->second;
}

void ComponentResolver::scan() {
    scanned_ = true;

    std::vector<std::string> manifest_paths;
    for (const auto& root : roots_) {
        if (!is_directory(root)) {
            spdlog::debug("component search root {} does not exist", root);
            continue;
        }
        spdlog::debug("scanning component search root {}", root);

        std::error_code ec;
        fs::recursive_directory_iterator it(root, ec), end;
        for (; !ec && it != end; it.increment(ec)) {
            if (it->is_directory(ec) && it.depth() >= COMPONENT_SCAN_DEPTH) {
                it.disable_recursion_pending();
                continue;
            }
            if (it->path().filename() == COMPONENT_MANIFEST_FILE && it->is_regular_file(ec)) {
                manifest_paths.push_back(to_portable_path(it->path().string()));
            }
        }
        if (ec) {
            spdlog::warn("stopped scanning {}: {}", root, ec.message());
        }
    }

    std::sort(manifest_paths.begin(), manifest_paths.end());

    for (const auto& path : manifest_paths) {
        Candidate candidate;
        candidate.manifest_path = path;

        auto text = read_text_file(path);
        if (!text) {
            spdlog::warn("skipping unreadable component manifest {}", path);
            continue;
        }

        json manifest;
        try {
            manifest = json::parse(*text);
        } catch (const json::parse_error& e) {
            spdlog::warn("skipping component manifest {}: {}", path, e.what());
            continue;
        }
        if (!manifest.is_object()) {
            spdlog::warn("skipping component manifest {}: not a JSON object", path);
            continue;
        }

        candidate.name = get_string(manifest, "name").value_or("");
        candidate.id = get_string(manifest, "id").value_or("");
        if (candidate.name.empty() && candidate.id.empty()) {
            spdlog::warn("skipping component manifest {}: no name or id", path);
            continue;
        }
        if (candidate.name.empty()) {
            candidate.problem = "missing required field `name`";
        }

        auto version_str = get_string(manifest, "version");
        if (!version_str) {
            candidate.problem = "missing required field `version`";
        } else {
            candidate.version_str = *version_str;
            candidate.version = parse_version(*version_str);
            if (!candidate.version) {
                candidate.problem = "invalid version `" + *version_str + "`";
            }
        }

        spdlog::debug("found component manifest {} ({} {})", path,
                      candidate.name.empty() ? candidate.id : candidate.name,
                      candidate.version_str);
        candidates_.push_back(std::move(candidate));
    }
}

ResolveResult ComponentResolver::resolve(const std::string& name, const std::string& version_req) {
    ResolveResult result;

    std::string req_text = trim(version_req);
    if (req_text.empty()) req_text = "*";

    std::string cache_key = name + '\n' + req_text;
    auto cached = requirement_cache_.find(cache_key);
    if (cached != requirement_cache_.end()) {
        ++cache_hits_;
        spdlog::debug("component {} {} resolved from cache to {}", name, req_text, cached->second);
        result.ok = true;
        result.key = cached->second;
        return result;
    }

    auto range = parse_range(req_text);
    if (!range) {
        result.error_code = BuildError::INVALID_VERSION_REQUIREMENT;
        result.error = "invalid version requirement `" + req_text + "` for component `" + name + "`";
        return result;
    }

    if (!scanned_) {
        scan();
    }

    const Candidate* best = nullptr;
    const Candidate* broken = nullptr;
    for (const auto& candidate : candidates_) {
        if (candidate.name != name && candidate.id != name) continue;

        if (!candidate.problem.empty()) {
            if (!broken) broken = &candidate;
            continue;
        }
        if (!satisfies(*candidate.version, *range)) continue;

        if (best == nullptr || *best->version < *candidate.version) {
            best = &candidate;
        }
    }

    if (!best) {
        if (broken) {
            result.error_code = BuildError::MANIFEST_INVALID;
            result.error = "component manifest " + broken->manifest_path + ": " + broken->problem;
            return result;
        }
        result.error_code = BuildError::COMPONENT_NOT_FOUND;
        result.error = "component `" + name + "` matching `" + req_text +
                       "` not found (searched: " + join_roots(roots_) + ")";
        return result;
    }

    std::string key = make_component_key(best->name, best->version_str);
    if (arena_.count(key) == 0) {
        auto loaded = load(*best);
        if (!loaded.ok) {
            return loaded;
        }
    }

    spdlog::debug("component {} {} resolved to {}", name, req_text, key);
    requirement_cache_[cache_key] = key;
    result.ok = true;
    result.key = key;
    return result;
}

ResolveResult ComponentResolver::load(const Candidate& candidate) {
    ResolveResult result;
    result.error_code = BuildError::MANIFEST_INVALID;
    std::string where = "component manifest " + candidate.manifest_path + ": ";

    auto text = read_text_file(candidate.manifest_path);
    if (!text) {
        result.error = where + "cannot be read";
        return result;
    }

    json manifest;
    try {
        manifest = json::parse(*text);
    } catch (const json::parse_error& e) {
        result.error = where + e.what();
        return result;
    }

    fs::path manifest_dir = fs::path(candidate.manifest_path).parent_path();

    ResolvedComponent component;
    component.name = candidate.name;
    component.version = *candidate.version;
    component.version_str = candidate.version_str;
    component.manifest_path = candidate.manifest_path;
    component.manifest_json = *text;
    component.world = get_string(manifest, "world").value_or("");

    auto artifact = get_nested_string(manifest, "artifacts", "component_wasm");
    if (!artifact || artifact->empty()) {
        result.error = where + "missing required field `artifacts.component_wasm`";
        return result;
    }
    fs::path artifact_path = (manifest_dir / *artifact).lexically_normal();
    if (!is_regular_file(artifact_path.string())) {
        result.error = where + "artifact " + to_portable_path(artifact_path.string()) + " not found";
        return result;
    }
    component.artifact_path = to_portable_path(artifact_path.string());

    if (manifest.contains("config_schema") && !manifest["config_schema"].is_null()) {
        const json& schema = manifest["config_schema"];
        if (!schema.is_object() && !schema.is_boolean()) {
            result.error = where + "`config_schema` must be an object";
            return result;
        }
        component.schema_json = schema.dump();
    } else if (auto schema_file = get_string(manifest, "schema_file")) {
        fs::path schema_path = (manifest_dir / *schema_file).lexically_normal();
        auto schema_text = read_text_file(schema_path.string());
        if (!schema_text) {
            result.error = where + "schema file " + to_portable_path(schema_path.string()) +
                           " cannot be read";
            return result;
        }
        try {
            component.schema_json = json::parse(*schema_text).dump();
        } catch (const json::parse_error& e) {
            result.error = where + "schema file " + to_portable_path(schema_path.string()) +
                           ": " + e.what();
            return result;
        }
    }

    if (manifest.contains("capabilities")) {
        if (!manifest["capabilities"].is_object()) {
            result.error = where + "`capabilities` must be an object";
            return result;
        }
        component.capabilities = manifest["capabilities"];
    }

    if (auto declared = get_nested_string(manifest, "hashes", "component_wasm")) {
        component.artifact_hash = *declared;
    } else {
        auto digest = sha256_file(component.artifact_path);
        if (!digest.ok) {
            result.error = where + digest.error;
            return result;
        }
        component.artifact_hash = "sha256:" + digest.hex_digest;
    }

    std::string key = component.key();
    arena_.emplace(key, std::move(component));

    result.ok = true;
    result.key = key;
    return result;
}

} // namespace flowpack
