/**
 * flowpack CLI - build command
 *
 * Resolve, validate and assemble a flow into a .gtpack archive.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <flowpack/pack_build.hpp>

namespace flowpack::cli::commands {

namespace {

struct BuildOptions {
    std::string flow;
    std::string output;
    std::string meta;
    std::vector<std::string> components;
    std::string diagnostics;
    std::string sign = "dev";
    bool strict = false;
};

int cmd_build(const GlobalOptions& opts, const BuildOptions& build_opts) {
    configure_logging(opts);

    auto signing = parse_signing_mode(build_opts.sign);
    if (!signing) {
        print_error("Invalid --sign value '" + build_opts.sign + "' (expected dev or none)",
                    opts.json);
        return 1;
    }

    BuildConfig config;
    config.workspace_root = resolve_workspace_root(opts);
    config.flow_path = build_opts.flow;
    config.output_path = build_opts.output;
    if (!build_opts.meta.empty()) config.meta_path = build_opts.meta;
    config.component_dirs = build_opts.components;
    if (!build_opts.diagnostics.empty()) config.diagnostics_dir = build_opts.diagnostics;
    config.signing = *signing;
    config.verify_determinism = build_opts.strict || strict_mode_from_env();

    config.provenance_options.host = get_env("HOSTNAME");
    if (auto epoch = get_env("SOURCE_DATE_EPOCH")) {
        config.provenance_options.source_date_epoch = parse_source_date_epoch(*epoch);
        if (!config.provenance_options.source_date_epoch) {
            print_error("Invalid SOURCE_DATE_EPOCH '" + *epoch + "'", opts.json);
            return 1;
        }
    }

    auto result = run_pack_build(config);

    if (!result.ok) {
        std::string code = result.error_code ? build_error_to_string(*result.error_code)
                                             : "BUILD_FAILED";
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = false;
            j["error_code"] = code;
            j["error"] = result.error;
            j["stage"] = build_stage_to_string(result.reached);
            if (!result.schema_errors.empty()) {
                nlohmann::json errors = nlohmann::json::array();
                for (const auto& err : result.schema_errors) {
                    errors.push_back({{"node_id", err.node_id},
                                      {"component", err.component},
                                      {"pointer", err.pointer},
                                      {"message", err.message}});
                }
                j["schema_errors"] = errors;
            }
            output_json(j);
        } else {
            print_error(result.error + " [" + code + "]", false);
        }
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["pack"] = result.out_path;
        j["manifest_hash"] = result.manifest_hash;
        j["flow_hash"] = result.flow_hash;
        j["components"] = result.artifacts.size();
        j["diagnostics"] = result.diagnostics_files;
        j["determinism_verified"] = result.determinism_verified;
        j["provenance"] = provenance_to_json(result.provenance);
        output_json(j);
    } else if (!opts.quiet) {
        print_success("Pack built at " + result.out_path + " (manifest hash " +
                          result.manifest_hash + ")",
                      false);
        if (result.determinism_verified) {
            print_success("Verified deterministic pack output", false);
        }
    }
    return 0;
}

} // anonymous namespace

void setup_build(CLI::App* app, GlobalOptions& opts) {
    static BuildOptions build_opts;

    app->add_option("flow", build_opts.flow, "Flow file (.ygtc)")->required();
    app->add_option("-o,--output", build_opts.output, "Output .gtpack path")->required();
    app->add_option("--meta", build_opts.meta, "Pack metadata (pack.toml)");
    app->add_option("--components", build_opts.components,
                    "Component search directory (repeatable, default: components/)");
    app->add_option("--diagnostics", build_opts.diagnostics,
                    "Resolved config output directory (default: .flowpack/resolved_config)");
    app->add_option("--sign", build_opts.sign, "Signing mode: dev or none")
        ->check(CLI::IsMember({"dev", "none"}));
    app->add_flag("--strict", build_opts.strict,
                  "Rebuild and require byte-identical output");

    app->callback([&opts]() {
        std::exit(cmd_build(opts, build_opts));
    });
}

} // namespace flowpack::cli::commands
