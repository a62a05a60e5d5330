#include <doctest/doctest.h>
#include <flowpack/node_resolver.hpp>

#include "support/fixtures.hpp"

using namespace flowpack;
using flowpack_test::TempDir;
using flowpack_test::write_component;

namespace {

FlowBundle bundle_from(const std::string& source) {
    YamlFlowValidator validator;
    auto result = validator.validate(source, std::nullopt);
    REQUIRE(result.ok);
    return result.bundle;
}

NodeRef node_ref(const std::string& id, const std::string& component) {
    NodeRef ref;
    ref.node_id = id;
    ref.component = {component, "*"};
    return ref;
}

} // namespace

// ============================================================================
// Classification
// ============================================================================

TEST_CASE("built-in components are recognized") {
    CHECK(is_builtin_component("flow.call"));
    CHECK(is_builtin_component("session.wait"));
    CHECK(is_builtin_component("emit"));
    CHECK(is_builtin_component("emit.response"));
    CHECK(is_builtin_component("component.exec"));
    CHECK_FALSE(is_builtin_component("echo"));
    CHECK_FALSE(is_builtin_component("flow.caller"));
}

TEST_CASE("classify_node returns built-ins without reading the document") {
    auto result = classify_node(node_ref("done", "emit.response"), json::object());
    REQUIRE(result.ok);
    auto* builtin = std::get_if<BuiltInNode>(&result.node);
    REQUIRE(builtin != nullptr);
    CHECK(builtin->component == "emit.response");
}

TEST_CASE("classify_node pins external components from the node") {
    json doc = {{"nodes", {{"greet", {{"echo", {{"message", "hi"}}}}}}}};
    NodeRef ref = node_ref("greet", "echo");
    ref.component.version_req = "^1";

    auto result = classify_node(ref, doc);
    REQUIRE(result.ok);
    auto* external = std::get_if<ExternalNode>(&result.node);
    REQUIRE(external != nullptr);
    CHECK(external->pin.name == "echo");
    CHECK(external->pin.version_req == "^1");
    CHECK(external->payload_key == "echo");
    CHECK_FALSE(external->inline_exec);
}

TEST_CASE("classify_node reads component.exec payloads") {
    json doc = {{"nodes",
                 {{"run", {{"component.exec", {{"component", "reverse@^2.1"}, {"text", "x"}}}}}}}};

    auto result = classify_node(node_ref("run", "component.exec"), doc);
    REQUIRE(result.ok);
    auto* external = std::get_if<ExternalNode>(&result.node);
    REQUIRE(external != nullptr);
    CHECK(external->pin.name == "reverse");
    CHECK(external->pin.version_req == "^2.1");
    CHECK(external->payload_key == "component.exec");
    CHECK(external->inline_exec);
}

TEST_CASE("classify_node failures") {
    SUBCASE("node absent from document") {
        auto result = classify_node(node_ref("ghost", "echo"), json{{"nodes", json::object()}});
        CHECK_FALSE(result.ok);
        CHECK(result.error_code == BuildError::MISSING_FLOW_NODE);
    }
    SUBCASE("exec payload missing") {
        json doc = {{"nodes", {{"run", {{"component.exec", nullptr}}}}}};
        auto result = classify_node(node_ref("run", "component.exec"), doc);
        CHECK_FALSE(result.ok);
        CHECK(result.error_code == BuildError::MISSING_EXEC_PAYLOAD);
    }
    SUBCASE("exec payload without component") {
        json doc = {{"nodes", {{"run", {{"component.exec", {{"text", "x"}}}}}}}};
        auto result = classify_node(node_ref("run", "component.exec"), doc);
        CHECK_FALSE(result.ok);
        CHECK(result.error_code == BuildError::MISSING_EXEC_PAYLOAD);
    }
    SUBCASE("exec payload with empty component") {
        json doc = {{"nodes", {{"run", {{"component.exec", {{"component", "@1.0"}}}}}}}};
        auto result = classify_node(node_ref("run", "component.exec"), doc);
        CHECK_FALSE(result.ok);
        CHECK(result.error_code == BuildError::MISSING_EXEC_PAYLOAD);
    }
}

// ============================================================================
// resolve_nodes
// ============================================================================

TEST_CASE("resolve_nodes skips built-ins and keeps flow order") {
    TempDir tmp;
    std::string root = tmp.join("components");
    write_component(root, {"echo", "1.0.0"});
    write_component(root, {"reverse", "2.1.3"});

    auto bundle = bundle_from(R"(id: mixed
type: messaging
nodes:
  greet:
    echo:
      message: hi
  wait:
    session.wait: {}
  run:
    component.exec:
      component: reverse@^2
      text: abc
  done:
    emit: {}
)");

    ComponentResolver resolver({root});
    auto result = resolve_nodes(bundle, bundle.document, resolver);
    REQUIRE(result.ok);
    REQUIRE(result.nodes.size() == 2);

    CHECK(result.nodes[0].node_id == "greet");
    CHECK(result.nodes[0].component == "echo@1.0.0");
    CHECK(result.nodes[0].pointer == "/nodes/greet/echo");
    CHECK(result.nodes[0].config == json{{"message", "hi"}});
    CHECK_FALSE(result.nodes[0].inline_exec);

    CHECK(result.nodes[1].node_id == "run");
    CHECK(result.nodes[1].component == "reverse@2.1.3");
    CHECK(result.nodes[1].pointer == "/nodes/run/component.exec");
    CHECK(result.nodes[1].config["text"] == "abc");
    CHECK(result.nodes[1].inline_exec);
}

TEST_CASE("nodes sharing a component share one arena record") {
    TempDir tmp;
    std::string root = tmp.join("components");
    write_component(root, {"echo", "1.0.0"});

    auto bundle = bundle_from(
        "id: twice\ntype: t\nnodes:\n  a:\n    echo: {message: a}\n  b:\n    echo: {message: b}\n");

    ComponentResolver resolver({root});
    auto result = resolve_nodes(bundle, bundle.document, resolver);
    REQUIRE(result.ok);
    REQUIRE(result.nodes.size() == 2);
    CHECK(result.nodes[0].component == result.nodes[1].component);
    CHECK(resolver.components().size() == 1);
    CHECK(resolver.cache_hits() == 1);
}

TEST_CASE("resolve_nodes stops at the first unresolved component") {
    TempDir tmp;
    auto bundle = bundle_from("id: f\ntype: t\nnodes:\n  a:\n    missing: {}\n");

    ComponentResolver resolver({tmp.join("components")});
    auto result = resolve_nodes(bundle, bundle.document, resolver);
    CHECK_FALSE(result.ok);
    CHECK(result.error_code == BuildError::COMPONENT_NOT_FOUND);
    CHECK(result.error.find("node `a`") != std::string::npos);
}

TEST_CASE("node payload pointers escape reserved characters") {
    CHECK(escape_pointer_token("a/b~c") == "a~1b~0c");
    CHECK(node_payload_pointer("x/y", "component.exec") == "/nodes/x~1y/component.exec");
}
