#include "flowpack/pack_meta.hpp"
#include "flowpack/platform.hpp"

#include <algorithm>
#include <sstream>

#include <toml++/toml.hpp>

namespace flowpack {

namespace {

template <typename T>
std::string to_text(const T& value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

// TOML values map onto JSON; dates and times become their TOML text
json toml_to_json(const toml::node& node) {
    if (auto* s = node.as_string()) return s->get();
    if (auto* i = node.as_integer()) return i->get();
    if (auto* f = node.as_floating_point()) return f->get();
    if (auto* b = node.as_boolean()) return b->get();
    if (auto* d = node.as_date()) return to_text(d->get());
    if (auto* t = node.as_time()) return to_text(t->get());
    if (auto* dt = node.as_date_time()) return to_text(dt->get());
    if (auto* arr = node.as_array()) {
        json out = json::array();
        for (const auto& elem : *arr) {
            out.push_back(toml_to_json(elem));
        }
        return out;
    }
    if (auto* tbl = node.as_table()) {
        json out = json::object();
        for (const auto& [key, value] : *tbl) {
            out[std::string(key.str())] = toml_to_json(value);
        }
        return out;
    }
    return nullptr;
}

// Optional string field; false when present with another type
bool read_string(const toml::table& tbl, const char* key, std::string& out, std::string& error) {
    const toml::node* node = tbl.get(key);
    if (!node) return true;
    if (auto* s = node->as_string()) {
        out = s->get();
        return true;
    }
    error = std::string("`") + key + "` must be a string";
    return false;
}

bool read_string_array(const toml::table& tbl, const char* key, std::vector<std::string>& out,
                       std::string& error) {
    const toml::node* node = tbl.get(key);
    if (!node) return true;
    auto* arr = node->as_array();
    if (!arr) {
        error = std::string("`") + key + "` must be an array of strings";
        return false;
    }
    out.clear();
    for (const auto& elem : *arr) {
        auto* s = elem.as_string();
        if (!s) {
            error = std::string("`") + key + "` must be an array of strings";
            return false;
        }
        out.push_back(s->get());
    }
    return true;
}

bool read_table(const toml::table& tbl, const char* key, json& out, std::string& error) {
    const toml::node* node = tbl.get(key);
    if (!node) return true;
    if (!node->is_table()) {
        error = std::string("`") + key + "` must be a table";
        return false;
    }
    out = toml_to_json(*node);
    return true;
}

bool read_table_array(const toml::table& tbl, const char* key, json& out, std::string& error) {
    const toml::node* node = tbl.get(key);
    if (!node) return true;
    auto* arr = node->as_array();
    if (!arr || !std::all_of(arr->begin(), arr->end(),
                             [](const toml::node& elem) { return elem.is_table(); })) {
        error = std::string("`") + key + "` must be an array of tables";
        return false;
    }
    out = toml_to_json(*node);
    return true;
}

bool read_imports(const toml::table& tbl, std::vector<PackImport>& out, std::string& error) {
    const toml::node* node = tbl.get("imports");
    if (!node) return true;
    auto* arr = node->as_array();
    if (!arr) {
        error = "`imports` must be an array of tables";
        return false;
    }
    for (const auto& elem : *arr) {
        auto* entry = elem.as_table();
        if (!entry) {
            error = "`imports` must be an array of tables";
            return false;
        }
        PackImport imp;
        if (!read_string(*entry, "pack_id", imp.pack_id, error) ||
            !read_string(*entry, "version_req", imp.version_req, error)) {
            error = "imports: " + error;
            return false;
        }
        if (imp.pack_id.empty() || imp.version_req.empty()) {
            error = "imports entries require `pack_id` and `version_req`";
            return false;
        }
        if (!parse_range(imp.version_req)) {
            error = "import `" + imp.pack_id + "` has invalid version_req `" +
                    imp.version_req + "`";
            return false;
        }
        out.push_back(std::move(imp));
    }
    return true;
}

PackMeta default_meta(const std::string& flow_id, const std::string& default_created_at) {
    PackMeta meta;
    meta.pack_format_version = PACK_FORMAT_VERSION;
    meta.pack_id = "dev.local." + flow_id;
    meta.version = "0.1.0";
    meta.name = flow_id;
    meta.entry_flows = {flow_id};
    meta.created_at_utc = default_created_at;
    return meta;
}

} // namespace

PackMetaResult parse_pack_meta(const std::string& toml_text,
                               const std::string& source_path,
                               const std::string& flow_id,
                               const std::string& default_created_at) {
    PackMetaResult result;
    std::string where = source_path.empty() ? std::string("pack metadata: ")
                                            : "pack metadata " + source_path + ": ";

    toml::table tbl;
    try {
        tbl = toml::parse(toml_text, source_path);
    } catch (const toml::parse_error& e) {
        std::ostringstream ss;
        ss << where << e.description() << " (line " << e.source().begin.line << ")";
        result.error = ss.str();
        return result;
    }

    PackMeta meta = default_meta(flow_id, default_created_at);
    std::string error;

    if (const toml::node* node = tbl.get("pack_version")) {
        auto* value = node->as_integer();
        if (!value || value->get() <= 0) {
            result.error = where + "`pack_version` must be a positive integer";
            return result;
        }
        meta.pack_format_version = static_cast<int>(value->get());
    }

    bool fields_ok = read_string(tbl, "pack_id", meta.pack_id, error) &&
                     read_string(tbl, "version", meta.version, error) &&
                     read_string(tbl, "name", meta.name, error) &&
                     read_string(tbl, "kind", meta.kind, error) &&
                     read_string(tbl, "description", meta.description, error) &&
                     read_string_array(tbl, "authors", meta.authors, error) &&
                     read_string(tbl, "license", meta.license, error) &&
                     read_string(tbl, "homepage", meta.homepage, error) &&
                     read_string(tbl, "support", meta.support, error) &&
                     read_string(tbl, "vendor", meta.vendor, error) &&
                     read_string_array(tbl, "entry_flows", meta.entry_flows, error) &&
                     read_string(tbl, "created_at_utc", meta.created_at_utc, error) &&
                     read_imports(tbl, meta.imports, error) &&
                     read_table(tbl, "annotations", meta.annotations, error) &&
                     read_table(tbl, "distribution", meta.distribution, error) &&
                     read_table(tbl, "events", meta.events, error) &&
                     read_table(tbl, "repo", meta.repo, error) &&
                     read_table(tbl, "messaging", meta.messaging, error) &&
                     read_table_array(tbl, "interfaces", meta.interfaces, error) &&
                     read_table_array(tbl, "components", meta.components, error);
    if (!fields_ok) {
        result.error = where + error;
        return result;
    }

    if (meta.pack_id.empty()) {
        result.error = where + "`pack_id` must not be empty";
        return result;
    }
    if (!parse_version(meta.version)) {
        result.error = where + "invalid pack version `" + meta.version + "`";
        return result;
    }
    if (meta.entry_flows.empty()) {
        result.error = where + "`entry_flows` must not be empty";
        return result;
    }

    result.ok = true;
    result.meta = std::move(meta);
    return result;
}

PackMetaResult load_pack_meta(const std::optional<std::string>& meta_path,
                              const std::string& flow_id,
                              const std::string& default_created_at) {
    if (!meta_path) {
        PackMetaResult result;
        result.ok = true;
        result.meta = default_meta(flow_id, default_created_at);
        return result;
    }

    auto text = read_text_file(*meta_path);
    if (!text) {
        PackMetaResult result;
        result.error = "failed to read pack metadata " + *meta_path;
        return result;
    }
    return parse_pack_meta(*text, *meta_path, flow_id, default_created_at);
}

} // namespace flowpack
