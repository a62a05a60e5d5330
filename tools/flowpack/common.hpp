/**
 * flowpack CLI - Common utilities and types
 */

#pragma once

#include <flowpack/platform.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>

namespace flowpack::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root;              // --root
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Resolve the workspace root.
 * Priority: --root flag > current directory
 */
inline std::string resolve_workspace_root(const GlobalOptions& opts) {
    if (!opts.root.empty()) {
        return opts.root;
    }
    return ".";
}

/**
 * Route library logging through spdlog at the level the flags ask for.
 * JSON mode keeps stdout clean by only logging errors.
 */
inline void configure_logging(const GlobalOptions& opts) {
    if (opts.quiet || opts.json) {
        spdlog::set_level(spdlog::level::err);
    } else if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("%^[%l]%$ %v");
}

/**
 * True when FLOWPACK_STRICT or LOCAL_CHECK_STRICT is "1", "true" or "TRUE".
 */
inline bool strict_mode_from_env() {
    for (const char* name : {"FLOWPACK_STRICT", "LOCAL_CHECK_STRICT"}) {
        auto value = flowpack::get_env(name);
        if (value && (*value == "1" || *value == "true" || *value == "TRUE")) {
            return true;
        }
    }
    return false;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

} // namespace flowpack::cli
