#include <doctest/doctest.h>
#include <flowpack/types.hpp>

using namespace flowpack;

TEST_CASE("build errors round-trip through their names") {
    for (auto code : {BuildError::FLOW_INVALID, BuildError::PATH_ESCAPES_ROOT,
                      BuildError::SCHEMA_VALIDATION_FAILED, BuildError::NON_DETERMINISTIC_BUILD}) {
        auto parsed = parse_build_error(build_error_to_string(code));
        REQUIRE(parsed);
        CHECK(*parsed == code);
    }
    CHECK(parse_build_error("component_not_found") == BuildError::COMPONENT_NOT_FOUND);
    CHECK_FALSE(parse_build_error("NOT_AN_ERROR"));
}

TEST_CASE("signing modes parse case-insensitively") {
    CHECK(parse_signing_mode("dev") == SigningMode::Dev);
    CHECK(parse_signing_mode("NONE") == SigningMode::None);
    CHECK_FALSE(parse_signing_mode("sigstore"));
    CHECK(std::string(signing_mode_to_string(SigningMode::Dev)) == "dev");
}

TEST_CASE("component keys join name and version") {
    CHECK(make_component_key("echo", "1.0.0") == "echo@1.0.0");

    ResolvedComponent component;
    component.name = "reverse";
    component.version_str = "2.1.0-rc.1";
    CHECK(component.key() == "reverse@2.1.0-rc.1");
}

TEST_CASE("provenance JSON omits unknown fields") {
    Provenance provenance;
    provenance.builder = "flowpack 0.1.0";
    provenance.built_at_utc = "1970-01-01T00:00:00Z";

    json j = provenance_to_json(provenance);
    CHECK(j["builder"] == "flowpack 0.1.0");
    CHECK_FALSE(j.contains("git_commit"));
    CHECK_FALSE(j.contains("host"));
    CHECK_FALSE(j.contains("notes"));

    provenance.git_commit = "abc";
    provenance.git_repo = "https://example.test/repo.git";
    j = provenance_to_json(provenance);
    CHECK(j["git_commit"] == "abc");
    CHECK(j["git_repo"] == "https://example.test/repo.git");
}
