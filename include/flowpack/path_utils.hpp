#pragma once

#include <string>

namespace flowpack {

enum class PathError {
    None,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

struct PathResult {
    bool ok;
    std::string path;  // normalized path when ok
    PathError error;
};

const char* path_error_to_string(PathError error);

// Normalize a path relative to a root without following symlinks (string-based).
// - Rejects NUL bytes
// - Rejects absolute relative_path when allow_absolute is false
// - Collapses "." and ".." segments
// - Fails if resulting path would escape root
PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute = false);

// Resolve a user-supplied input path against the workspace root.
// Relative paths are normalized under root; absolute paths are accepted
// only when they already lie inside root.
PathResult resolve_input_path(const std::string& root, const std::string& path);

} // namespace flowpack
