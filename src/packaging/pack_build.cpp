#include "flowpack/pack_build.hpp"
#include "flowpack/artifact_collector.hpp"
#include "flowpack/component_resolver.hpp"
#include "flowpack/config_normalizer.hpp"
#include "flowpack/node_resolver.hpp"
#include "flowpack/pack_meta.hpp"
#include "flowpack/path_utils.hpp"
#include "flowpack/platform.hpp"
#include "flowpack/schema_validator.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

namespace flowpack {

namespace fs = std::filesystem;

namespace {

struct BuildPaths {
    std::string workspace_root;
    std::string flow_path;
    std::string output_path;
    std::optional<std::string> meta_path;
    std::vector<std::string> component_dirs;
    std::string diagnostics_dir;
};

// Removes a temporary directory when it goes out of scope
class ScopedTempDir {
public:
    explicit ScopedTempDir(std::string path) : path_(std::move(path)) {}
    ~ScopedTempDir() { remove_directory(path_); }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

std::string absolute_path(const std::string& path) {
    std::error_code ec;
    fs::path p = fs::absolute(path, ec);
    if (ec) p = fs::path(path);
    return to_portable_path(p.lexically_normal().string());
}

// Resolve relative paths against the workspace without a containment check
std::string anchor_path(const std::string& workspace_root, const std::string& path) {
    fs::path p(path);
    if (p.is_absolute()) return to_portable_path(p.lexically_normal().string());
    return to_portable_path((fs::path(workspace_root) / p).lexically_normal().string());
}

BuildResult failure(BuildResult result, BuildError code, const std::string& message) {
    result.ok = false;
    result.stage = BuildStage::Failed;
    result.error_code = code;
    result.error = message;
    spdlog::error("{} ({} after stage {})", message, build_error_to_string(code),
                  build_stage_to_string(result.reached));
    return result;
}

void advance(BuildResult& result, BuildStage stage) {
    result.reached = stage;
    result.stage = stage;
    spdlog::debug("build stage: {}", build_stage_to_string(stage));
}

bool resolve_paths(const BuildConfig& config, BuildPaths& paths, std::string& error) {
    paths.workspace_root = absolute_path(config.workspace_root.empty() ? "." : config.workspace_root);

    auto checked = [&](const std::string& input, const char* what, std::string& out) {
        auto resolved = resolve_input_path(paths.workspace_root, input);
        if (!resolved.ok) {
            error = std::string(what) + " " + input + ": " + path_error_to_string(resolved.error) +
                    " (" + paths.workspace_root + ")";
            return false;
        }
        out = resolved.path;
        return true;
    };

    if (!checked(config.flow_path, "flow", paths.flow_path)) return false;

    if (config.meta_path) {
        std::string meta;
        if (!checked(*config.meta_path, "pack metadata", meta)) return false;
        paths.meta_path = meta;
    }

    if (config.component_dirs.empty()) {
        paths.component_dirs.push_back(join_path(paths.workspace_root, "components"));
    } else {
        for (const auto& dir : config.component_dirs) {
            std::string resolved;
            if (!checked(dir, "component directory", resolved)) return false;
            paths.component_dirs.push_back(resolved);
        }
    }

    paths.output_path = anchor_path(paths.workspace_root, config.output_path);
    paths.diagnostics_dir = config.diagnostics_dir
                                ? anchor_path(paths.workspace_root, *config.diagnostics_dir)
                                : default_diagnostics_dir(paths.workspace_root);
    return true;
}

bool write_diagnostics(const std::vector<ResolvedNode>& nodes,
                       const ComponentResolver& resolver,
                       const std::string& dir,
                       std::vector<std::string>& written,
                       std::string& error) {
    auto created = atomic_create_directory(dir);
    if (!created.ok) {
        error = "failed to create " + dir + ": " + created.error;
        return false;
    }

    for (const auto& node : nodes) {
        const ResolvedComponent* component = resolver.find(node.component);
        json snapshot = {
            {"node_id", node.node_id},
            {"component", component ? component->name : node.component},
            {"version", component ? component->version_str : std::string()},
            {"config", node.config},
        };

        std::string path = join_path(dir, diagnostics_file_name(node.node_id));
        auto result = atomic_write_file(path, snapshot.dump(2) + "\n");
        if (!result.ok) {
            error = "failed to write " + path + ": " + result.error;
            return false;
        }
        written.push_back(path);
    }
    return true;
}

// One pass of the pipeline into the given output and diagnostics locations
BuildResult build_once(const BuildConfig& config,
                       const BuildPaths& paths,
                       const Provenance& provenance,
                       const std::string& output_path,
                       const std::string& diagnostics_dir) {
    BuildResult result;
    result.provenance = provenance;

    // Flow
    auto source = read_text_file(paths.flow_path);
    if (!source) {
        return failure(std::move(result), BuildError::FLOW_INVALID,
                       "failed to read flow " + paths.flow_path);
    }

    YamlFlowValidator default_validator;
    const FlowValidator& validator =
        config.flow_validator ? *config.flow_validator : default_validator;

    auto validated = validator.validate(*source, paths.flow_path);
    if (!validated.ok) {
        return failure(std::move(result), BuildError::FLOW_INVALID,
                       "flow validation failed: " + validated.error);
    }
    FlowBundle bundle = std::move(validated.bundle);
    json flow_doc = bundle.document;
    advance(result, BuildStage::FlowValidated);
    spdlog::info("validated flow {} ({} nodes)", bundle.id, bundle.nodes.size());

    // Nodes
    ComponentResolver resolver(paths.component_dirs);
    auto resolved = resolve_nodes(bundle, flow_doc, resolver);
    if (!resolved.ok) {
        return failure(std::move(result), resolved.error_code, resolved.error);
    }
    advance(result, BuildStage::NodesResolved);
    spdlog::info("resolved {} component nodes", resolved.nodes.size());

    // Defaults
    auto normalized = normalize_node_operations(flow_doc, resolver, resolved.nodes);
    if (!normalized.ok) {
        return failure(std::move(result), normalized.error_code, normalized.error);
    }
    result.nodes = std::move(normalized.nodes);
    advance(result, BuildStage::ConfigNormalized);

    // Schemas
    SchemaValidator schemas(resolver);
    result.schema_errors = schemas.validate_all(result.nodes);
    if (!result.schema_errors.empty()) {
        std::string message = "component schema validation failed:";
        for (const auto& err : result.schema_errors) {
            message += "\n" + format_schema_error(err);
        }
        return failure(std::move(result), BuildError::SCHEMA_VALIDATION_FAILED, message);
    }
    advance(result, BuildStage::SchemaChecked);

    // Artifacts
    result.artifacts = collect_component_artifacts(result.nodes, resolver);
    advance(result, BuildStage::ArtifactsCollected);
    spdlog::info("collected {} component artifacts", result.artifacts.size());

    std::string diag_error;
    if (!write_diagnostics(result.nodes, resolver, diagnostics_dir, result.diagnostics_files,
                           diag_error)) {
        return failure(std::move(result), BuildError::DIAGNOSTICS_WRITE_FAILED, diag_error);
    }

    // Assembly
    auto meta = load_pack_meta(paths.meta_path, bundle.id, provenance.built_at_utc);
    if (!meta.ok) {
        return failure(std::move(result), BuildError::PACK_META_INVALID, meta.error);
    }

    AssemblyRequest request;
    request.meta = std::move(meta.meta);
    request.flow = bundle;
    request.flow.document = flow_doc;
    request.flow.hash = hash_flow_document(flow_doc);
    request.signing = config.signing;
    request.provenance = provenance;
    request.components = result.artifacts;
    result.flow_hash = request.flow.hash;

    GtpackAssembler default_assembler;
    const ArchiveAssembler& assembler = config.assembler ? *config.assembler : default_assembler;

    auto assembled = assembler.assemble(request, output_path);
    if (!assembled.ok) {
        return failure(std::move(result), BuildError::ARCHIVE_ASSEMBLY_FAILED,
                       "pack assembly failed: " + assembled.error);
    }
    result.out_path = assembled.out_path;
    result.manifest_hash = assembled.manifest_hash;
    advance(result, BuildStage::Assembled);

    result.ok = true;
    return result;
}

} // namespace

const char* build_stage_to_string(BuildStage stage) {
    switch (stage) {
        case BuildStage::Start: return "start";
        case BuildStage::FlowValidated: return "flow_validated";
        case BuildStage::NodesResolved: return "nodes_resolved";
        case BuildStage::ConfigNormalized: return "config_normalized";
        case BuildStage::SchemaChecked: return "schema_checked";
        case BuildStage::ArtifactsCollected: return "artifacts_collected";
        case BuildStage::Assembled: return "assembled";
        case BuildStage::DeterminismVerified: return "determinism_verified";
        case BuildStage::Done: return "done";
        case BuildStage::Failed: return "failed";
    }
    return "unknown";
}

std::string default_diagnostics_dir(const std::string& workspace_root) {
    return join_path(workspace_root, ".flowpack/resolved_config");
}

std::string diagnostics_file_name(const std::string& node_id) {
    // Percent-encoding keeps distinct node ids on distinct files ("a/b" vs "a_b")
    static const char digits[] = "0123456789ABCDEF";
    auto escape = [](unsigned char c) {
        return std::string{'%', digits[c >> 4], digits[c & 0x0F]};
    };

    if (node_id.empty()) return "%.json";
    if (node_id == "." || node_id == "..") {
        std::string name;
        for (size_t i = 0; i < node_id.size(); ++i) name += escape('.');
        return name + ".json";
    }

    std::string name;
    for (char ch : node_id) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c == 0x7F || c == '%' || c == '/' || c == '\\' || c == ':') {
            name += escape(c);
        } else {
            name += ch;
        }
    }
    return name + ".json";
}

BuildResult run_pack_build(const BuildConfig& config) {
    BuildPaths paths;
    std::string path_error;
    if (!resolve_paths(config, paths, path_error)) {
        return failure(BuildResult{}, BuildError::PATH_ESCAPES_ROOT, path_error);
    }

    // Frozen for this call; the determinism re-run reuses it
    Provenance provenance = config.provenance
                                ? *config.provenance
                                : collect_provenance(paths.workspace_root, config.provenance_options);

    BuildResult result =
        build_once(config, paths, provenance, paths.output_path, paths.diagnostics_dir);
    if (!result.ok) {
        return result;
    }
    spdlog::info("pack built at {} (manifest hash {})", result.out_path, result.manifest_hash);

    if (config.verify_determinism) {
        // A pack that failed verification is not left at the output path
        auto reject = [&](BuildError code, const std::string& message) {
            if (!remove_file(result.out_path)) {
                spdlog::warn("could not remove unverified pack {}", result.out_path);
            }
            return failure(std::move(result), code, message);
        };

        auto temp = create_temp_directory("flowpack_determinism_");
        if (!temp) {
            return reject(BuildError::NON_DETERMINISTIC_BUILD,
                          "failed to create temporary directory for determinism check");
        }
        ScopedTempDir temp_dir(*temp);

        BuildResult rerun = build_once(config, paths, provenance,
                                       join_path(temp_dir.path(), "deterministic.gtpack"),
                                       join_path(temp_dir.path(), "resolved_config"));
        if (!rerun.ok) {
            BuildError code = rerun.error_code.value_or(BuildError::NON_DETERMINISTIC_BUILD);
            return reject(code, "determinism build failed: " + rerun.error);
        }

        auto expected = read_binary_file(result.out_path);
        auto actual = read_binary_file(rerun.out_path);
        if (!expected || !actual) {
            return reject(BuildError::NON_DETERMINISTIC_BUILD,
                          "failed to read packs for determinism check");
        }
        if (*expected != *actual) {
            return reject(BuildError::NON_DETERMINISTIC_BUILD,
                          "non-deterministic pack output: " + result.out_path +
                              " differs from rebuild");
        }

        result.determinism_verified = true;
        advance(result, BuildStage::DeterminismVerified);
        spdlog::info("verified deterministic pack output");
    }

    result.stage = BuildStage::Done;
    result.reached = BuildStage::Done;
    return result;
}

} // namespace flowpack
