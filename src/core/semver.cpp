#include "flowpack/semver.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace flowpack {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

// Split string by delimiter, preserving empty parts
std::vector<std::string> split(const std::string& s, const std::string& delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t pos;
    while ((pos = s.find(delim, start)) != std::string::npos) {
        parts.push_back(s.substr(start, pos - start));
        start = pos + delim.length();
    }
    parts.push_back(s.substr(start));
    return parts;
}

bool is_operator_token(const std::string& t) {
    return t == ">=" || t == "<=" || t == ">" || t == "<" || t == "=" || t == "^" || t == "~";
}

// Split a comparator set into tokens. Commas count as whitespace and a bare
// operator token (">= 1.0") is glued to the version that follows it.
std::vector<std::string> tokenize(const std::string& s) {
    std::string spaced = s;
    std::replace(spaced.begin(), spaced.end(), ',', ' ');

    std::vector<std::string> raw;
    std::istringstream iss(spaced);
    std::string token;
    while (iss >> token) {
        raw.push_back(token);
    }

    std::vector<std::string> tokens;
    for (size_t i = 0; i < raw.size(); ++i) {
        if (is_operator_token(raw[i]) && i + 1 < raw.size()) {
            tokens.push_back(raw[i] + raw[i + 1]);
            ++i;
        } else {
            tokens.push_back(raw[i]);
        }
    }
    return tokens;
}

bool is_wildcard(const std::string& part) {
    return part == "*" || part == "x" || part == "X";
}

// A possibly incomplete version as written in a requirement ("1", "1.2", "1.2.*")
struct PartialVersion {
    uint64_t major = 0;
    std::optional<uint64_t> minor;
    std::optional<uint64_t> patch;
    std::string prerelease;
    bool any = false;  // "*" on its own
};

std::optional<uint64_t> parse_number(const std::string& s) {
    if (s.empty() || s.size() > 18) return std::nullopt;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    if (s.size() > 1 && s[0] == '0') return std::nullopt;
    return std::stoull(s);
}

std::optional<PartialVersion> parse_partial(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;
    if (s[0] == 'v' || s[0] == 'V') s = s.substr(1);

    PartialVersion pv;
    if (is_wildcard(s)) {
        pv.any = true;
        return pv;
    }

    // Build metadata never affects matching
    auto plus = s.find('+');
    if (plus != std::string::npos) s = s.substr(0, plus);

    std::string core = s;
    auto dash = s.find('-');
    if (dash != std::string::npos) {
        core = s.substr(0, dash);
        pv.prerelease = s.substr(dash + 1);
        if (pv.prerelease.empty()) return std::nullopt;
    }

    auto parts = split(core, ".");
    if (parts.empty() || parts.size() > 3) return std::nullopt;

    if (is_wildcard(parts[0])) {
        pv.any = true;
        return pv;
    }
    auto major = parse_number(parts[0]);
    if (!major) return std::nullopt;
    pv.major = *major;

    if (parts.size() >= 2 && !is_wildcard(parts[1])) {
        auto minor = parse_number(parts[1]);
        if (!minor) return std::nullopt;
        pv.minor = *minor;

        if (parts.size() == 3 && !is_wildcard(parts[2])) {
            auto patch = parse_number(parts[2]);
            if (!patch) return std::nullopt;
            pv.patch = *patch;
        }
    }

    // A prerelease tag only makes sense on a complete version
    if (!pv.prerelease.empty() && !pv.patch) return std::nullopt;
    return pv;
}

std::optional<Version> make_version(uint64_t major, uint64_t minor, uint64_t patch,
                                    const std::string& prerelease = "") {
    std::string text = std::to_string(major) + "." + std::to_string(minor) + "." +
                       std::to_string(patch);
    if (!prerelease.empty()) text += "-" + prerelease;
    try {
        return semver::version::parse(text);
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

// Lower bound of a partial version: missing parts are zero
std::optional<Version> lower_bound(const PartialVersion& pv) {
    return make_version(pv.major, pv.minor.value_or(0), pv.patch.value_or(0), pv.prerelease);
}

// Exclusive upper bound that bumps the last specified component
std::optional<Version> bump_last(const PartialVersion& pv) {
    if (!pv.minor) return make_version(pv.major + 1, 0, 0);
    if (!pv.patch) return make_version(pv.major, *pv.minor + 1, 0);
    return make_version(pv.major, *pv.minor, *pv.patch + 1);
}

bool push_range(ComparatorSet& set, const std::optional<Version>& low,
                const std::optional<Version>& high) {
    if (!low || !high) return false;
    set.push_back(Constraint{Comparator::Ge, *low});
    set.push_back(Constraint{Comparator::Lt, *high});
    return true;
}

bool add_caret(ComparatorSet& set, const PartialVersion& pv) {
    std::optional<Version> high;
    if (pv.major > 0 || !pv.minor) {
        high = make_version(pv.major + 1, 0, 0);
    } else if (*pv.minor > 0 || !pv.patch) {
        high = make_version(0, *pv.minor + 1, 0);
    } else {
        high = make_version(0, 0, *pv.patch + 1);
    }
    return push_range(set, lower_bound(pv), high);
}

bool add_tilde(ComparatorSet& set, const PartialVersion& pv) {
    std::optional<Version> high;
    if (!pv.minor) {
        high = make_version(pv.major + 1, 0, 0);
    } else {
        high = make_version(pv.major, *pv.minor + 1, 0);
    }
    return push_range(set, lower_bound(pv), high);
}

// Parse a single constraint and append its lowered comparators to the set
bool parse_constraint(const std::string& str, ComparatorSet& set) {
    std::string s = trim(str);
    if (s.empty()) return false;

    std::string op;
    for (const char* candidate : {">=", "<=", ">", "<", "=", "^", "~"}) {
        std::string c(candidate);
        if (s.rfind(c, 0) == 0) {
            op = c;
            break;
        }
    }
    auto pv = parse_partial(s.substr(op.size()));
    if (!pv) return false;

    if (pv->any) {
        // "*" constrains nothing; ">*" and friends are nonsense
        return op.empty() || op == "=" || op == ">=";
    }

    bool complete = pv->minor && pv->patch;

    if (op.empty() || op == "^") {
        return add_caret(set, *pv);
    }
    if (op == "~") {
        return add_tilde(set, *pv);
    }
    if (op == "=") {
        if (complete) {
            auto v = lower_bound(*pv);
            if (!v) return false;
            set.push_back(Constraint{Comparator::Eq, *v});
            return true;
        }
        return push_range(set, lower_bound(*pv), bump_last(*pv));
    }
    if (op == ">=") {
        auto v = lower_bound(*pv);
        if (!v) return false;
        set.push_back(Constraint{Comparator::Ge, *v});
        return true;
    }
    if (op == "<") {
        auto v = lower_bound(*pv);
        if (!v) return false;
        set.push_back(Constraint{Comparator::Lt, *v});
        return true;
    }
    if (op == ">") {
        if (complete) {
            auto v = lower_bound(*pv);
            if (!v) return false;
            set.push_back(Constraint{Comparator::Gt, *v});
            return true;
        }
        // ">1.2" means nothing in 1.2.x qualifies
        auto v = bump_last(*pv);
        if (!v) return false;
        set.push_back(Constraint{Comparator::Ge, *v});
        return true;
    }
    if (op == "<=") {
        if (complete) {
            auto v = lower_bound(*pv);
            if (!v) return false;
            set.push_back(Constraint{Comparator::Le, *v});
            return true;
        }
        auto v = bump_last(*pv);
        if (!v) return false;
        set.push_back(Constraint{Comparator::Lt, *v});
        return true;
    }
    return false;
}

// Parse a comparator set (space or comma separated constraints ANDed together)
std::optional<ComparatorSet> parse_comparator_set(const std::string& str) {
    auto tokens = tokenize(str);
    if (tokens.empty()) return std::nullopt;

    ComparatorSet set;
    for (const auto& token : tokens) {
        if (!parse_constraint(token, set)) return std::nullopt;
    }
    return set;
}

} // namespace

bool VersionRange::matches_any() const {
    for (const auto& set : sets) {
        if (set.empty()) return true;
    }
    return false;
}

std::optional<Version> parse_version(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;

    try {
        return semver::version::parse(s);
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

std::optional<VersionRange> parse_range(const std::string& str) {
    std::string s = trim(str);

    VersionRange range;
    range.source = s;

    if (s.empty() || s == "*") {
        range.sets.push_back(ComparatorSet{});
        return range;
    }

    // Split by || for OR
    for (const auto& part : split(s, "||")) {
        auto set = parse_comparator_set(trim(part));
        if (!set) return std::nullopt;
        range.sets.push_back(*set);
    }

    if (range.sets.empty()) return std::nullopt;
    return range;
}

bool satisfies(const Version& version, const Constraint& constraint) {
    switch (constraint.op) {
        case Comparator::Eq:
            return version == constraint.version;
        case Comparator::Lt:
            return version < constraint.version;
        case Comparator::Le:
            return version <= constraint.version;
        case Comparator::Gt:
            return version > constraint.version;
        case Comparator::Ge:
            return version >= constraint.version;
    }
    return false;
}

bool satisfies(const Version& version, const ComparatorSet& set) {
    // A pre-release only matches a set that names a pre-release of the same
    // MAJOR.MINOR.PATCH, so "^1.0" and "*" never pick up "2.0.0-rc.1"
    if (version.is_prerelease()) {
        bool opted_in = std::any_of(set.begin(), set.end(), [&](const Constraint& c) {
            return c.version.is_prerelease() && c.version.major() == version.major() &&
                   c.version.minor() == version.minor() && c.version.patch() == version.patch();
        });
        if (!opted_in) return false;
    }

    // All constraints in a set must be satisfied (AND)
    for (const auto& constraint : set) {
        if (!satisfies(version, constraint)) {
            return false;
        }
    }
    return true;
}

bool satisfies(const Version& version, const VersionRange& range) {
    // Any set in the range must be satisfied (OR)
    for (const auto& set : range.sets) {
        if (satisfies(version, set)) {
            return true;
        }
    }
    return false;
}

} // namespace flowpack
