#pragma once

#include "flowpack/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace flowpack {

// Manifest file name searched for below each search root
inline constexpr const char* COMPONENT_MANIFEST_FILE = "component.manifest.json";

// Deepest directory level (below a search root) scanned for manifests
inline constexpr int COMPONENT_SCAN_DEPTH = 3;

struct ResolveResult {
    bool ok = false;
    BuildError error_code = BuildError::COMPONENT_NOT_FOUND;
    std::string error;
    std::string key;  // Arena key (name@version) when ok
};

// Locates component builds on a search path and pins them to the highest
// version satisfying a requirement. Resolved records live in an arena owned
// by the resolver, keyed by "name@version"; nodes refer to them by key.
//
// One resolver is scoped to one build: the search roots are scanned on first
// use and never rescanned.
class ComponentResolver {
public:
    explicit ComponentResolver(std::vector<std::string> search_roots);

    ResolveResult resolve(const std::string& name, const std::string& version_req);

    // Arena lookup; nullptr for unknown keys
    const ResolvedComponent* find(const std::string& key) const;

    const std::map<std::string, ResolvedComponent>& components() const { return arena_; }
    const std::vector<std::string>& search_roots() const { return roots_; }

    // Number of resolve() calls answered from the requirement cache
    size_t cache_hits() const { return cache_hits_; }

private:
    struct Candidate {
        std::string manifest_path;
        std::string name;
        std::string id;
        std::optional<Version> version;
        std::string version_str;
        std::string problem;  // Set when the manifest cannot be used
    };

    void scan();
    ResolveResult load(const Candidate& candidate);

    std::vector<std::string> roots_;
    bool scanned_ = false;
    std::vector<Candidate> candidates_;
    std::map<std::string, std::string> requirement_cache_;
    std::map<std::string, ResolvedComponent> arena_;
    size_t cache_hits_ = 0;
};

// Parse "name" or "name@requirement" (as used by component.exec payloads).
// A missing requirement is "*".
ComponentPin parse_component_ref(const std::string& raw);

} // namespace flowpack
