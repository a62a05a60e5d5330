#include <doctest/doctest.h>
#include <flowpack/flow_bundle.hpp>

using namespace flowpack;

namespace {

const char* HELLO_FLOW = R"(id: hello
type: messaging
start: greet
nodes:
  greet:
    echo:
      message: "hi"
    version: "^1.0"
    routing:
      - to: finish
  finish:
    emit.response:
      body: done
)";

FlowValidationResult validate(const std::string& source) {
    YamlFlowValidator validator;
    return validator.validate(source, std::string("flows/test.ygtc"));
}

} // namespace

// ============================================================================
// YamlFlowValidator
// ============================================================================

TEST_CASE("valid flow yields a bundle in document order") {
    auto result = validate(HELLO_FLOW);
    REQUIRE(result.ok);

    const auto& bundle = result.bundle;
    CHECK(bundle.id == "hello");
    CHECK(bundle.kind == "messaging");
    CHECK(bundle.entry == "greet");
    REQUIRE(bundle.nodes.size() == 2);
    CHECK(bundle.nodes[0].node_id == "greet");
    CHECK(bundle.nodes[0].component.name == "echo");
    CHECK(bundle.nodes[0].component.version_req == "^1.0");
    CHECK(bundle.nodes[1].node_id == "finish");
    CHECK(bundle.nodes[1].component.name == "emit.response");
    CHECK(bundle.nodes[1].component.version_req == "*");
    CHECK(bundle.source == HELLO_FLOW);
    CHECK(bundle.document["nodes"]["greet"]["echo"]["message"] == "hi");
}

TEST_CASE("node order follows the document, not key order") {
    auto result = validate("id: f\ntype: t\nnodes:\n  zeta:\n    echo: {}\n  alpha:\n    echo: {}\n");
    REQUIRE(result.ok);
    REQUIRE(result.bundle.nodes.size() == 2);
    CHECK(result.bundle.nodes[0].node_id == "zeta");
    CHECK(result.bundle.entry == "zeta");
}

TEST_CASE("bundle hash is the sha256 of the canonical document") {
    auto result = validate(HELLO_FLOW);
    REQUIRE(result.ok);
    CHECK(result.bundle.hash.size() == 64);
    CHECK(result.bundle.hash == hash_flow_document(result.bundle.document));

    // Formatting differences do not change the canonical form
    auto reformatted = validate(
        "type: messaging\nid: hello\nstart: greet\nnodes:\n"
        "  greet: {echo: {message: \"hi\"}, version: \"^1.0\", routing: [{to: finish}]}\n"
        "  finish: {emit.response: {body: done}}\n");
    REQUIRE(reformatted.ok);
    CHECK(reformatted.bundle.hash == result.bundle.hash);
}

TEST_CASE("numeric version keys are accepted as requirement text") {
    auto result = validate("id: f\ntype: t\nnodes:\n  a:\n    echo: {}\n    version: 1\n");
    REQUIRE(result.ok);
    CHECK(result.bundle.nodes[0].component.version_req == "1");
}

TEST_CASE("schema key is recorded on the node") {
    auto result = validate("id: f\ntype: t\nnodes:\n  a:\n    echo: {}\n    schema: echo.config\n");
    REQUIRE(result.ok);
    REQUIRE(result.bundle.nodes[0].schema_id);
    CHECK(*result.bundle.nodes[0].schema_id == "echo.config");
}

TEST_CASE("flow validation failures") {
    SUBCASE("invalid YAML") {
        auto r = validate("id: [unterminated\n");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("invalid YAML") != std::string::npos);
        CHECK(r.error.find("flows/test.ygtc") != std::string::npos);
    }
    SUBCASE("document is not a map") {
        CHECK_FALSE(validate("- a\n- b\n").ok);
    }
    SUBCASE("missing id") {
        auto r = validate("type: t\nnodes:\n  a:\n    echo: {}\n");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("`id`") != std::string::npos);
    }
    SUBCASE("missing type") {
        auto r = validate("id: f\nnodes:\n  a:\n    echo: {}\n");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("`type`") != std::string::npos);
    }
    SUBCASE("empty nodes") {
        CHECK_FALSE(validate("id: f\ntype: t\nnodes: {}\n").ok);
    }
    SUBCASE("node without a component") {
        auto r = validate("id: f\ntype: t\nnodes:\n  a:\n    version: \"1\"\n");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("exactly one component") != std::string::npos);
    }
    SUBCASE("node with two components") {
        CHECK_FALSE(validate("id: f\ntype: t\nnodes:\n  a:\n    echo: {}\n    reverse: {}\n").ok);
    }
    SUBCASE("routing to an unknown node") {
        auto r = validate("id: f\ntype: t\nnodes:\n  a:\n    echo: {}\n    routing:\n      - to: b\n");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("unknown node `b`") != std::string::npos);
    }
    SUBCASE("start names an unknown node") {
        auto r = validate("id: f\ntype: t\nstart: nope\nnodes:\n  a:\n    echo: {}\n");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("nope") != std::string::npos);
    }
    SUBCASE("invalid UTF-8 in a scalar") {
        auto r = validate("id: hello\ntype: messaging\nnodes:\n  greet:\n    echo:\n"
                          "      message: \"caf\xC3\x28\"\n");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("not valid UTF-8") != std::string::npos);
    }
    SUBCASE("duplicate keys") {
        CHECK_FALSE(validate("id: f\nid: g\ntype: t\nnodes:\n  a:\n    echo: {}\n").ok);
    }
    SUBCASE("schema must be a string") {
        CHECK_FALSE(validate("id: f\ntype: t\nnodes:\n  a:\n    echo: {}\n    schema: [x]\n").ok);
    }
}

// ============================================================================
// YAML conversion
// ============================================================================

TEST_CASE("parse_yaml_document converts plain scalars") {
    auto r = parse_yaml_document(
        "count: 3\nratio: 0.5\nenabled: true\nnothing: ~\nname: echo\nneg: -7\nexp: 1e3\n");
    REQUIRE(r.ok);
    CHECK(r.value["count"].is_number_integer());
    CHECK(r.value["count"] == 3);
    CHECK(r.value["ratio"].is_number_float());
    CHECK(r.value["enabled"] == true);
    CHECK(r.value["nothing"].is_null());
    CHECK(r.value["name"] == "echo");
    CHECK(r.value["neg"] == -7);
    CHECK(r.value["exp"].is_number_float());
}

TEST_CASE("parse_yaml_document keeps quoted scalars as strings") {
    auto r = parse_yaml_document("a: \"3\"\nb: 'true'\nc: \"\"\nd: 1.0.0\n");
    REQUIRE(r.ok);
    CHECK(r.value["a"] == "3");
    CHECK(r.value["b"] == "true");
    CHECK(r.value["c"] == "");
    CHECK(r.value["d"] == "1.0.0");
}

TEST_CASE("canonical_json_dump sorts keys and is compact") {
    json j = json::parse(R"({"b": 1, "a": {"d": [1, 2], "c": null}})");
    CHECK(canonical_json_dump(j) == R"({"a":{"c":null,"d":[1,2]},"b":1})");
}

TEST_CASE("reserved node keys") {
    CHECK(is_reserved_node_key("routing"));
    CHECK(is_reserved_node_key("version"));
    CHECK(is_reserved_node_key("schema"));
    CHECK_FALSE(is_reserved_node_key("component.exec"));
}
