#pragma once

#include "flowpack/types.hpp"

#include <ctime>
#include <optional>
#include <string>

#ifndef FLOWPACK_VERSION
#define FLOWPACK_VERSION "unknown"
#endif

namespace flowpack {

struct ProvenanceOptions {
    std::optional<std::string> host;
    // Seconds since the epoch to record instead of the current time
    std::optional<std::time_t> source_date_epoch;
};

struct GitInfo {
    std::optional<std::string> commit;
    std::optional<std::string> remote_url;  // remote "origin"
};

// Read the checked-out revision and origin URL from the `.git` directory of
// `workspace_root` or its nearest ancestor. Reads files only; never runs git.
GitInfo read_git_info(const std::string& workspace_root);

// Builder identity, source revision, host and timestamp for one build.
// Collected once per build and reused by its determinism re-run.
Provenance collect_provenance(const std::string& workspace_root,
                              const ProvenanceOptions& options = {});

// Parse a SOURCE_DATE_EPOCH value; nullopt unless it is a non-negative integer
std::optional<std::time_t> parse_source_date_epoch(const std::string& value);

} // namespace flowpack
