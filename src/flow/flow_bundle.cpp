#include "flowpack/flow_bundle.hpp"
#include "flowpack/hash.hpp"

#include <cctype>
#include <set>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace flowpack {

namespace {

bool is_null_scalar(const std::string& s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

std::optional<bool> parse_bool_scalar(const std::string& s) {
    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    return std::nullopt;
}

bool all_digits(const std::string& s, size_t from, size_t to) {
    if (from >= to) return false;
    for (size_t i = from; i < to; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

std::optional<int64_t> parse_int_scalar(const std::string& s) {
    size_t start = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    if (!all_digits(s, start, s.size())) return std::nullopt;
    try {
        return static_cast<int64_t>(std::stoll(s));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

// [-+]? digits '.' digits? ([eE] [-+]? digits)?  or  [-+]? digits [eE] ...
std::optional<double> parse_float_scalar(const std::string& s) {
    size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    size_t int_start = i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i == int_start) return std::nullopt;

    bool has_fraction = false;
    bool has_exponent = false;
    if (i < s.size() && s[i] == '.') {
        has_fraction = true;
        ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        has_exponent = true;
        ++i;
        if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
        size_t exp_start = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == exp_start) return std::nullopt;
    }
    if (i != s.size() || (!has_fraction && !has_exponent)) return std::nullopt;

    try {
        return std::stod(s);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

json scalar_to_json(const YAML::Node& node) {
    const std::string& text = node.Scalar();

    // Quoted scalars carry the non-specific tag "!"
    if (node.Tag() == "!") {
        return text;
    }
    if (is_null_scalar(text)) return nullptr;
    if (auto b = parse_bool_scalar(text)) return *b;
    if (auto i = parse_int_scalar(text)) return *i;
    if (auto d = parse_float_scalar(text)) return *d;
    return text;
}

json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            json arr = json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            json obj = json::object();
            for (auto it = node.begin(); it != node.end(); ++it) {
                std::string key = it->first.as<std::string>();
                if (obj.contains(key)) {
                    throw std::runtime_error("duplicate key '" + key + "'");
                }
                obj[key] = yaml_to_json(it->second);
            }
            return obj;
        }
    }
    return nullptr;
}

std::string get_string(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

// Requirement text from a node's `version` key; numbers are accepted as written
std::optional<std::string> version_text(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number()) return value.dump();
    return std::nullopt;
}

FlowValidationResult fail(const std::string& where, const std::string& message) {
    FlowValidationResult result;
    result.error = where + message;
    return result;
}

} // namespace

bool is_reserved_node_key(const std::string& key) {
    return key == "routing" || key == "version" || key == "schema";
}

YamlParseResult parse_yaml_document(const std::string& source) {
    YamlParseResult result;
    try {
        YAML::Node root = YAML::Load(source);
        result.value = yaml_to_json(root);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = std::string("invalid YAML: ") + e.what();
    } catch (const std::runtime_error& e) {
        result.error = std::string("invalid YAML: ") + e.what();
    }
    return result;
}

std::string canonical_json_dump(const json& value) {
    // nlohmann::json objects are ordered maps, so dump() emits sorted keys
    return value.dump();
}

std::string hash_flow_document(const json& document) {
    auto digest = sha256_text(canonical_json_dump(document));
    return digest.ok ? digest.hex_digest : std::string();
}

FlowValidationResult YamlFlowValidator::validate(const std::string& source,
                                                 const std::optional<std::string>& path) const {
    std::string where = path ? *path + ": " : std::string();

    // yaml-cpp passes scalar bytes through unchecked; the JSON serializer
    // rejects anything that is not UTF-8
    try {
        (void)json(source).dump();
    } catch (const json::type_error& e) {
        return fail(where, std::string("flow source is not valid UTF-8: ") + e.what());
    }

    YAML::Node root;
    json document;
    try {
        root = YAML::Load(source);
        document = yaml_to_json(root);
    } catch (const YAML::Exception& e) {
        return fail(where, std::string("invalid YAML: ") + e.what());
    } catch (const std::runtime_error& e) {
        return fail(where, std::string("invalid YAML: ") + e.what());
    }

    if (!document.is_object()) {
        return fail(where, "flow document must be a map");
    }

    FlowBundle bundle;
    bundle.id = get_string(document, "id");
    if (bundle.id.empty()) {
        return fail(where, "flow `id` must be a non-empty string");
    }
    bundle.kind = get_string(document, "type");
    if (bundle.kind.empty()) {
        return fail(where, "flow `type` must be a non-empty string");
    }

    if (!document.contains("nodes") || !document["nodes"].is_object() ||
        document["nodes"].empty()) {
        return fail(where, "flow `nodes` must be a non-empty map");
    }
    const json& nodes = document["nodes"];

    // Walk the YAML map rather than the JSON object to keep document order
    for (auto it = root["nodes"].begin(); it != root["nodes"].end(); ++it) {
        std::string node_id = it->first.as<std::string>();
        const json& node = nodes[node_id];
        std::string node_where = where + "node `" + node_id + "`: ";

        if (!node.is_object()) {
            return fail(node_where, "node must be a map");
        }

        std::vector<std::string> component_keys;
        for (const auto& [key, value] : node.items()) {
            if (!is_reserved_node_key(key)) {
                component_keys.push_back(key);
            }
        }
        if (component_keys.size() != 1) {
            return fail(node_where, "node must reference exactly one component, found " +
                                        std::to_string(component_keys.size()));
        }

        NodeRef ref;
        ref.node_id = node_id;
        ref.component.name = component_keys.front();
        ref.component.version_req = "*";

        if (node.contains("version")) {
            auto req = version_text(node["version"]);
            if (!req) {
                return fail(node_where, "`version` must be a string");
            }
            ref.component.version_req = *req;
        }
        if (node.contains("schema")) {
            if (!node["schema"].is_string()) {
                return fail(node_where, "`schema` must be a string");
            }
            ref.schema_id = node["schema"].get<std::string>();
        }

        if (node.contains("routing")) {
            const json& routing = node["routing"];
            if (!routing.is_array()) {
                return fail(node_where, "`routing` must be a list");
            }
            for (const auto& route : routing) {
                if (!route.is_object()) {
                    return fail(node_where, "routing entries must be maps");
                }
                if (!route.contains("to")) continue;
                if (!route["to"].is_string()) {
                    return fail(node_where, "routing `to` must be a string");
                }
                std::string target = route["to"].get<std::string>();
                if (!nodes.contains(target)) {
                    return fail(node_where, "routes to unknown node `" + target + "`");
                }
            }
        }

        bundle.nodes.push_back(std::move(ref));
    }

    if (document.contains("start")) {
        if (!document["start"].is_string()) {
            return fail(where, "flow `start` must be a string");
        }
        bundle.entry = document["start"].get<std::string>();
        if (!nodes.contains(bundle.entry)) {
            return fail(where, "start node `" + bundle.entry + "` does not exist");
        }
    } else {
        bundle.entry = bundle.nodes.front().node_id;
    }

    bundle.hash = hash_flow_document(document);
    if (bundle.hash.empty()) {
        return fail(where, "failed to hash flow document");
    }
    bundle.document = std::move(document);
    bundle.source = source;

    FlowValidationResult result;
    result.ok = true;
    result.bundle = std::move(bundle);
    return result;
}

} // namespace flowpack
