#include <doctest/doctest.h>
#include <flowpack/config_normalizer.hpp>
#include <flowpack/node_resolver.hpp>

#include "support/fixtures.hpp"

using namespace flowpack;
using flowpack_test::ComponentFixture;
using flowpack_test::TempDir;
using flowpack_test::write_component;

namespace {

struct Resolved {
    json document;
    std::vector<ResolvedNode> nodes;
};

Resolved resolve(ComponentResolver& resolver, const std::string& source) {
    YamlFlowValidator validator;
    auto validated = validator.validate(source, std::nullopt);
    REQUIRE(validated.ok);

    Resolved out;
    out.document = validated.bundle.document;
    auto resolved = resolve_nodes(validated.bundle, out.document, resolver);
    REQUIRE(resolved.ok);
    out.nodes = resolved.nodes;
    return out;
}

ResolvedComponent component_with(const std::string& manifest_json) {
    ResolvedComponent component;
    component.name = "echo";
    component.version_str = "1.0.0";
    component.manifest_json = manifest_json;
    return component;
}

} // namespace

TEST_CASE("default_operation reads the first declared operation") {
    auto named = default_operation(component_with(R"({"operations": [{"name": "echo"}, "x"]})"));
    REQUIRE(named.ok);
    REQUIRE(named.operation);
    CHECK(*named.operation == "echo");

    auto plain = default_operation(component_with(R"({"operations": ["reverse"]})"));
    REQUIRE(plain.ok);
    CHECK(plain.operation.value_or("") == "reverse");

    auto none = default_operation(component_with(R"({"name": "echo"})"));
    REQUIRE(none.ok);
    CHECK_FALSE(none.operation);

    auto empty = default_operation(component_with(R"({"operations": []})"));
    REQUIRE(empty.ok);
    CHECK_FALSE(empty.operation);
}

TEST_CASE("default_operation rejects invalid manifest JSON") {
    auto result = default_operation(component_with("{oops"));
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("echo@1.0.0") != std::string::npos);
}

TEST_CASE("missing operation is backfilled as operation and op") {
    TempDir tmp;
    std::string root = tmp.join("components");
    ComponentFixture fixture{"echo", "1.0.0"};
    fixture.operations = json::array({{{"name", "echo"}}});
    write_component(root, fixture);

    ComponentResolver resolver({root});
    auto flow = resolve(resolver, "id: f\ntype: t\nnodes:\n  a:\n    echo:\n      message: hi\n");

    auto result = normalize_node_operations(flow.document, resolver, flow.nodes);
    REQUIRE(result.ok);
    REQUIRE(result.nodes.size() == 1);
    CHECK(result.nodes[0].config["operation"] == "echo");
    CHECK(result.nodes[0].config["op"] == "echo");
    CHECK(result.nodes[0].config["message"] == "hi");

    // The document carries the defaults; the input records are untouched
    CHECK(flow.document["nodes"]["a"]["echo"]["operation"] == "echo");
    CHECK_FALSE(flow.nodes[0].config.contains("operation"));
}

TEST_CASE("existing operation keys are never overwritten") {
    TempDir tmp;
    std::string root = tmp.join("components");
    ComponentFixture fixture{"reverse", "1.0.0"};
    fixture.operations = json::array({"reverse", "upper"});
    write_component(root, fixture);

    ComponentResolver resolver({root});

    SUBCASE("op set") {
        auto flow = resolve(resolver, "id: f\ntype: t\nnodes:\n  a:\n    reverse:\n      op: upper\n");
        auto result = normalize_node_operations(flow.document, resolver, flow.nodes);
        REQUIRE(result.ok);
        CHECK(result.nodes[0].config["op"] == "upper");
        CHECK_FALSE(result.nodes[0].config.contains("operation"));
    }
    SUBCASE("operation set") {
        auto flow =
            resolve(resolver, "id: f\ntype: t\nnodes:\n  a:\n    reverse:\n      operation: upper\n");
        auto result = normalize_node_operations(flow.document, resolver, flow.nodes);
        REQUIRE(result.ok);
        CHECK(result.nodes[0].config["operation"] == "upper");
        CHECK_FALSE(result.nodes[0].config.contains("op"));
    }
    SUBCASE("blank operation keeps its key and fills the other") {
        auto flow = resolve(resolver,
                            "id: f\ntype: t\nnodes:\n  a:\n    reverse:\n      operation: \" \"\n");
        auto result = normalize_node_operations(flow.document, resolver, flow.nodes);
        REQUIRE(result.ok);
        CHECK(result.nodes[0].config["operation"] == " ");
        CHECK(result.nodes[0].config["op"] == "reverse");
    }
}

TEST_CASE("components without operations leave the payload unchanged") {
    TempDir tmp;
    std::string root = tmp.join("components");
    ComponentFixture fixture{"echo", "1.0.0"};
    fixture.operations = nullptr;
    write_component(root, fixture);

    ComponentResolver resolver({root});
    auto flow = resolve(resolver, "id: f\ntype: t\nnodes:\n  a:\n    echo:\n      message: hi\n");
    json before = flow.document;

    auto result = normalize_node_operations(flow.document, resolver, flow.nodes);
    REQUIRE(result.ok);
    CHECK(flow.document == before);
    CHECK(result.nodes[0].config == json{{"message", "hi"}});
}

TEST_CASE("component.exec payloads are normalized in place") {
    TempDir tmp;
    std::string root = tmp.join("components");
    write_component(root, {"reverse", "1.0.0"});

    ComponentResolver resolver({root});
    auto flow = resolve(
        resolver,
        "id: f\ntype: t\nnodes:\n  run:\n    component.exec:\n      component: reverse\n      text: x\n");

    auto result = normalize_node_operations(flow.document, resolver, flow.nodes);
    REQUIRE(result.ok);
    const json& payload = flow.document["nodes"]["run"]["component.exec"];
    CHECK(payload["operation"] == "handle");
    CHECK(payload["op"] == "handle");
    CHECK(payload["component"] == "reverse");
    CHECK(result.nodes[0].config == payload);
}

TEST_CASE("non-object payloads pass through") {
    TempDir tmp;
    std::string root = tmp.join("components");
    write_component(root, {"echo", "1.0.0"});

    ComponentResolver resolver({root});
    auto flow = resolve(resolver, "id: f\ntype: t\nnodes:\n  a:\n    echo: hello\n");

    auto result = normalize_node_operations(flow.document, resolver, flow.nodes);
    REQUIRE(result.ok);
    CHECK(result.nodes[0].config == "hello");
}
