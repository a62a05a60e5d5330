#include "flowpack/provenance.hpp"
#include "flowpack/platform.hpp"

#include <cctype>
#include <filesystem>
#include <sstream>

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

bool is_commit_id(const std::string& s) {
    if (s.size() != 40 && s.size() != 64) return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Locate the git directory, following a `.git` file ("gitdir: <path>")
std::optional<fs::path> find_git_dir(const std::string& workspace_root) {
    std::error_code ec;
    fs::path dir = fs::absolute(workspace_root, ec);
    if (ec) return std::nullopt;

    while (true) {
        fs::path dot_git = dir / ".git";
        if (fs::is_directory(dot_git, ec)) {
            return dot_git;
        }
        if (fs::is_regular_file(dot_git, ec)) {
            auto text = read_text_file(dot_git.string());
            if (text) {
                std::string line = trim(*text);
                if (line.rfind("gitdir:", 0) == 0) {
                    fs::path target = trim(line.substr(7));
                    if (target.is_relative()) target = dir / target;
                    return target.lexically_normal();
                }
            }
            return std::nullopt;
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) {
            return std::nullopt;
        }
        dir = dir.parent_path();
    }
}

// Linked worktrees keep shared refs and config in the common directory
fs::path common_dir(const fs::path& git_dir) {
    auto text = read_text_file((git_dir / "commondir").string());
    if (!text) return git_dir;
    fs::path common = trim(*text);
    if (common.is_relative()) common = git_dir / common;
    return common.lexically_normal();
}

std::optional<std::string> lookup_ref(const fs::path& git_dir, const fs::path& common,
                                      const std::string& ref) {
    for (const auto& base : {git_dir, common}) {
        if (auto text = read_text_file((base / ref).string())) {
            std::string value = trim(*text);
            if (is_commit_id(value)) return value;
        }
    }

    auto packed = read_text_file((common / "packed-refs").string());
    if (!packed) return std::nullopt;

    std::istringstream lines(*packed);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.empty() || line[0] == '#' || line[0] == '^') continue;
        auto space = line.find(' ');
        if (space == std::string::npos) continue;
        if (trim(line.substr(space + 1)) == ref) {
            std::string value = line.substr(0, space);
            if (is_commit_id(value)) return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> read_origin_url(const fs::path& common) {
    auto config = read_text_file((common / "config").string());
    if (!config) return std::nullopt;

    std::istringstream lines(*config);
    std::string line;
    bool in_origin = false;
    while (std::getline(lines, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#' || t[0] == ';') continue;
        if (t[0] == '[') {
            in_origin = t == "[remote \"origin\"]";
            continue;
        }
        if (!in_origin) continue;
        auto eq = t.find('=');
        if (eq == std::string::npos) continue;
        if (trim(t.substr(0, eq)) == "url") {
            std::string url = trim(t.substr(eq + 1));
            if (!url.empty()) return url;
        }
    }
    return std::nullopt;
}

} // namespace

GitInfo read_git_info(const std::string& workspace_root) {
    GitInfo info;

    auto git_dir = find_git_dir(workspace_root);
    if (!git_dir) {
        spdlog::debug("no git directory above {}", workspace_root);
        return info;
    }
    fs::path common = common_dir(*git_dir);

    if (auto head = read_text_file((*git_dir / "HEAD").string())) {
        std::string value = trim(*head);
        if (value.rfind("ref:", 0) == 0) {
            info.commit = lookup_ref(*git_dir, common, trim(value.substr(4)));
        } else if (is_commit_id(value)) {
            info.commit = value;
        }
    }
    info.remote_url = read_origin_url(common);
    return info;
}

std::optional<std::time_t> parse_source_date_epoch(const std::string& value) {
    std::string s = trim(value);
    if (s.empty() || s.size() > 18) return std::nullopt;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    return static_cast<std::time_t>(std::stoll(s));
}

Provenance collect_provenance(const std::string& workspace_root, const ProvenanceOptions& options) {
    Provenance provenance;
    provenance.builder = std::string("flowpack ") + FLOWPACK_VERSION;

    GitInfo git = read_git_info(workspace_root);
    provenance.git_commit = git.commit;
    provenance.git_repo = git.remote_url;

    provenance.built_at_utc = options.source_date_epoch
                                  ? format_timestamp(*options.source_date_epoch)
                                  : get_current_timestamp();
    provenance.host = options.host;
    provenance.notes = "Built via flowpack build";
    return provenance;
}

} // namespace flowpack
