#include <doctest/doctest.h>
#include <flowpack/archive.hpp>
#include <flowpack/artifact_collector.hpp>
#include <flowpack/component_resolver.hpp>
#include <flowpack/pack_assembler.hpp>
#include <flowpack/pack_build.hpp>
#include <flowpack/pack_inspect.hpp>

#include "support/fixtures.hpp"

#include <algorithm>

using namespace flowpack;
using flowpack_test::ComponentFixture;
using flowpack_test::TempDir;
using flowpack_test::write_component;
using flowpack_test::write_file;

namespace {

// Assembly request for a one-node flow backed by a real component on disk
struct RequestFixture {
    TempDir tmp;
    AssemblyRequest request;

    RequestFixture() {
        ComponentFixture echo{"echo", "1.0.0"};
        echo.schema = flowpack_test::echo_schema();
        write_component(tmp.join("components"), echo);

        ComponentResolver resolver({tmp.join("components")});
        auto key = resolver.resolve("echo", "*");
        REQUIRE(key.ok);

        YamlFlowValidator validator;
        auto flow = validator.validate(
            "id: hello\ntype: messaging\nnodes:\n  greet:\n    echo:\n      message: hi\n",
            std::nullopt);
        REQUIRE(flow.ok);

        request.meta.pack_id = "dev.local.hello";
        request.meta.name = "hello";
        request.meta.entry_flows = {"hello"};
        request.flow = flow.bundle;
        request.provenance.builder = "flowpack test";
        request.provenance.built_at_utc = "2024-01-01T00:00:00Z";
        request.components.push_back(to_component_artifact(*resolver.find(key.key)));
    }

    std::vector<TarEntry> entries() const {
        auto built = build_pack_entries(request);
        REQUIRE(built.ok);
        return built.entries;
    }
};

std::vector<uint8_t> archive_of(const std::vector<TarEntry>& entries) {
    auto archive = create_deterministic_archive(entries);
    REQUIRE(archive.ok);
    return archive.archive_data;
}

TarEntry* find_entry(std::vector<TarEntry>& entries, const std::string& path) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const TarEntry& e) { return e.path == path; });
    return it == entries.end() ? nullptr : &*it;
}

bool has_problem(const PackInspection& inspection, const std::string& needle) {
    return std::any_of(inspection.problems.begin(), inspection.problems.end(),
                       [&](const std::string& p) { return p.find(needle) != std::string::npos; });
}

} // namespace

TEST_CASE("a freshly assembled pack verifies") {
    RequestFixture fixture;
    auto inspection = inspect_pack_data(archive_of(fixture.entries()));

    REQUIRE_MESSAGE(inspection.ok, inspection.error);
    CHECK(inspection.verified());
    CHECK(inspection.signing == "dev");
    CHECK(inspection.meta["pack_id"] == "dev.local.hello");
    CHECK(inspection.provenance["builder"] == "flowpack test");
    CHECK(inspection.manifest_hash.size() == 64);

    REQUIRE(inspection.flows.size() == 1);
    CHECK(inspection.flows[0].id == "hello");
    CHECK(inspection.flows[0].entry == "greet");
    CHECK(inspection.flows[0].node_count == 1);
    CHECK(inspection.flows[0].actual_hash == inspection.flows[0].declared_hash);

    REQUIRE(inspection.components.size() == 1);
    CHECK(inspection.components[0].name == "echo");
    CHECK(inspection.components[0].actual_sha256 == inspection.components[0].declared_sha256);
    CHECK(inspection.components[0].missing_files.empty());

    CHECK(std::find(inspection.entries.begin(), inspection.entries.end(), "components/") !=
          inspection.entries.end());
    CHECK(inspection.entries.back() == "manifest.json");
}

TEST_CASE("inspect_pack reads a built pack from disk") {
    TempDir tmp;
    ComponentFixture echo{"echo", "1.0.0"};
    write_component(tmp.join("components"), echo);
    write_file(tmp.join("flows/hello.ygtc"),
               "id: hello\ntype: messaging\nnodes:\n  greet:\n    echo: {message: hi}\n");

    BuildConfig config;
    config.workspace_root = tmp.path();
    config.flow_path = "flows/hello.ygtc";
    config.output_path = "hello.gtpack";
    config.provenance_options.source_date_epoch = 0;

    auto built = run_pack_build(config);
    REQUIRE_MESSAGE(built.ok, built.error);

    auto inspection = inspect_pack(built.out_path);
    REQUIRE_MESSAGE(inspection.ok, inspection.error);
    CHECK(inspection.verified());
    CHECK(inspection.manifest_hash == built.manifest_hash);

    json j = pack_inspection_to_json(inspection);
    CHECK(j["verified"] == true);
    CHECK(j["flows"][0]["hash_ok"] == true);
    CHECK(j["components"][0]["name"] == "echo");
}

TEST_CASE("tampered artifacts are reported") {
    RequestFixture fixture;
    auto entries = fixture.entries();
    TarEntry* wasm = find_entry(entries, "components/echo@1.0.0/component.wasm");
    REQUIRE(wasm != nullptr);
    wasm->data.push_back('!');

    auto inspection = inspect_pack_data(archive_of(entries));
    REQUIRE(inspection.ok);
    CHECK_FALSE(inspection.verified());
    CHECK(has_problem(inspection, "echo@1.0.0: artifact hash mismatch"));
}

TEST_CASE("tampered flow documents are reported") {
    RequestFixture fixture;
    auto entries = fixture.entries();
    TarEntry* flow = find_entry(entries, "flows/hello/flow.json");
    REQUIRE(flow != nullptr);
    std::string changed = R"({"id":"hello","nodes":{},"type":"messaging"})";
    flow->data.assign(changed.begin(), changed.end());

    auto inspection = inspect_pack_data(archive_of(entries));
    REQUIRE(inspection.ok);
    CHECK(has_problem(inspection, "flow hello: hash mismatch"));
}

TEST_CASE("missing files are reported") {
    RequestFixture fixture;
    auto entries = fixture.entries();
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [](const TarEntry& e) {
                                     return e.path == "components/echo@1.0.0/schema.json";
                                 }),
                  entries.end());

    auto inspection = inspect_pack_data(archive_of(entries));
    REQUIRE(inspection.ok);
    CHECK_FALSE(inspection.verified());
    REQUIRE(inspection.components.size() == 1);
    CHECK(inspection.components[0].missing_files ==
          std::vector<std::string>{"components/echo@1.0.0/schema.json"});
}

TEST_CASE("archives without a manifest cannot be inspected") {
    std::vector<TarEntry> entries = {make_file_entry("readme.txt", std::string("hi"))};
    auto inspection = inspect_pack_data(archive_of(entries));
    CHECK_FALSE(inspection.ok);
    CHECK(inspection.error.find("manifest.json") != std::string::npos);

    json j = pack_inspection_to_json(inspection);
    CHECK(j["ok"] == false);
    CHECK(j.contains("error"));
}

TEST_CASE("non-archive input cannot be inspected") {
    TempDir tmp;
    write_file(tmp.join("junk.gtpack"), "definitely not gzip");

    auto inspection = inspect_pack(tmp.join("junk.gtpack"));
    CHECK_FALSE(inspection.ok);
    CHECK(inspection.error.find("invalid pack archive") != std::string::npos);

    CHECK_FALSE(inspect_pack(tmp.join("absent.gtpack")).ok);
}
