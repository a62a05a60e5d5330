/**
 * flowpack CLI - Entry Point
 *
 * Builds deployable flow packs and inspects built ones.
 */

#include <CLI/CLI.hpp>
#include <flowpack/provenance.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace flowpack::cli::commands {
    void setup_build(CLI::App* app, GlobalOptions& opts);
    void setup_inspect(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace flowpack::cli;

    CLI::App app{"flowpack - flow pack builder"};
    app.set_version_flag("-V,--version", FLOWPACK_VERSION);
    app.require_subcommand(0, 1);
    app.fallthrough();

    GlobalOptions opts;

    // Global options
    app.add_option("--root", opts.root, "Workspace root (default: current directory)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    auto* build_cmd = app.add_subcommand("build", "Build a .gtpack from a flow");
    commands::setup_build(build_cmd, opts);

    auto* inspect_cmd = app.add_subcommand("inspect", "Show and verify a built pack");
    commands::setup_inspect(inspect_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
