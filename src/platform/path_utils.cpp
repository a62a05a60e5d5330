#include "flowpack/path_utils.hpp"
#include "flowpack/platform.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace flowpack {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

bool is_absolute_input(const std::string& path) {
    if (path.empty()) return false;
    if (path[0] == '/' || path[0] == '\\') return true;
    return std::filesystem::path(path).is_absolute();
}

// Lexical prefix check: every component of root must match the head of path
bool lexically_contains(const std::filesystem::path& root, const std::filesystem::path& path) {
    auto lex_root = root.lexically_normal();
    auto lex_path = path.lexically_normal();

    auto root_it = lex_root.begin();
    auto path_it = lex_path.begin();
    for (; root_it != lex_root.end() && path_it != lex_path.end(); ++root_it, ++path_it) {
        // A trailing separator shows up as an empty final component
        if (root_it->empty()) break;
        if (*root_it != *path_it) return false;
    }
    if (root_it != lex_root.end() && !root_it->empty()) return false;
    return true;
}

} // namespace

const char* path_error_to_string(PathError error) {
    switch (error) {
        case PathError::None: return "none";
        case PathError::ContainsNul: return "path contains NUL byte";
        case PathError::AbsoluteNotAllowed: return "absolute path not allowed";
        case PathError::EscapesRoot: return "path escapes root";
    }
    return "unknown";
}

PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute) {
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    std::string trimmed = to_portable_path(relative_path);
    if (!trimmed.empty() && trimmed[0] == '/') {
        if (!allow_absolute) {
            return {false, {}, PathError::AbsoluteNotAllowed};
        }
        while (!trimmed.empty() && trimmed[0] == '/') {
            trimmed.erase(trimmed.begin());
        }
    }

    std::vector<std::string> normalized;
    for (const auto& part : split(trimmed, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    std::filesystem::path out(root);
    for (const auto& c : normalized) {
        out /= c;
    }
    out = out.lexically_normal();

    if (!lexically_contains(std::filesystem::path(root), out)) {
        return {false, {}, PathError::EscapesRoot};
    }

    return {true, to_portable_path(out.string()), PathError::None};
}

PathResult resolve_input_path(const std::string& root, const std::string& path) {
    if (contains_nul(root) || contains_nul(path)) {
        return {false, {}, PathError::ContainsNul};
    }

    if (!is_absolute_input(path)) {
        return normalize_under_root(root, path);
    }

    std::filesystem::path candidate = std::filesystem::path(path).lexically_normal();
    if (!lexically_contains(std::filesystem::path(root), candidate)) {
        return {false, {}, PathError::EscapesRoot};
    }
    return {true, to_portable_path(candidate.string()), PathError::None};
}

} // namespace flowpack
