#pragma once

#include "flowpack/types.hpp"

#include <optional>
#include <string>

namespace flowpack {

// Pack format written by this builder
inline constexpr int PACK_FORMAT_VERSION = 1;

struct PackMetaResult {
    bool ok = false;
    std::string error;
    PackMeta meta;
};

// Parse a pack.toml descriptor. Unset fields take their defaults:
//   pack_id      dev.local.<flow_id>
//   version      0.1.0
//   name         <flow_id>
//   entry_flows  [<flow_id>]
//   created_at   default_created_at
PackMetaResult parse_pack_meta(const std::string& toml_text,
                               const std::string& source_path,
                               const std::string& flow_id,
                               const std::string& default_created_at);

// Read and parse `meta_path`, or build the default metadata when it is unset
PackMetaResult load_pack_meta(const std::optional<std::string>& meta_path,
                              const std::string& flow_id,
                              const std::string& default_created_at);

} // namespace flowpack
