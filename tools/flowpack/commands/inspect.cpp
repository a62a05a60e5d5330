/**
 * flowpack CLI - inspect command
 *
 * Show a built pack's metadata and verify its contents.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <flowpack/pack_inspect.hpp>

namespace flowpack::cli::commands {

namespace {

struct InspectOptions {
    std::string pack;
    bool entries = false;
};

void print_text(const PackInspection& inspection, bool show_entries) {
    const auto& meta = inspection.meta;
    std::cout << "Pack: " << meta.value("pack_id", "") << " " << meta.value("version", "")
              << std::endl;
    std::cout << "  Name: " << meta.value("name", "") << std::endl;
    std::cout << "  Signing: " << inspection.signing << std::endl;
    std::cout << "  Manifest hash: " << inspection.manifest_hash << std::endl;
    if (inspection.provenance.is_object()) {
        std::cout << "  Built: " << inspection.provenance.value("built_at_utc", "") << " by "
                  << inspection.provenance.value("builder", "") << std::endl;
    }

    std::cout << "Flows:" << std::endl;
    for (const auto& flow : inspection.flows) {
        std::cout << "  " << flow.id << " (" << flow.kind << ", entry " << flow.entry << ", "
                  << flow.node_count << " nodes)" << std::endl;
    }

    std::cout << "Components:" << std::endl;
    for (const auto& component : inspection.components) {
        std::cout << "  " << component.name << "@" << component.version;
        if (!component.world.empty()) std::cout << " [" << component.world << "]";
        std::cout << std::endl;
    }

    if (show_entries) {
        std::cout << "Entries:" << std::endl;
        for (const auto& entry : inspection.entries) {
            std::cout << "  " << entry << std::endl;
        }
    }

    if (inspection.problems.empty()) {
        std::cout << "Verified: ok" << std::endl;
    } else {
        std::cout << "Verified: FAILED" << std::endl;
        for (const auto& problem : inspection.problems) {
            std::cout << "  - " << problem << std::endl;
        }
    }
}

int cmd_inspect(const GlobalOptions& opts, const InspectOptions& inspect_opts) {
    configure_logging(opts);

    auto inspection = inspect_pack(inspect_opts.pack);
    if (!inspection.ok) {
        print_error(inspection.error, opts.json);
        return 1;
    }

    if (opts.json) {
        output_json(pack_inspection_to_json(inspection));
    } else {
        print_text(inspection, inspect_opts.entries);
    }
    return inspection.verified() ? 0 : 1;
}

} // anonymous namespace

void setup_inspect(CLI::App* app, GlobalOptions& opts) {
    static InspectOptions inspect_opts;

    app->add_option("pack", inspect_opts.pack, "Pack file (.gtpack)")->required();
    app->add_flag("--entries", inspect_opts.entries, "List archive entries");

    app->callback([&opts]() {
        std::exit(cmd_inspect(opts, inspect_opts));
    });
}

} // namespace flowpack::cli::commands
