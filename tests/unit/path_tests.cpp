#include <doctest/doctest.h>
#include <flowpack/path_utils.hpp>
#include <flowpack/platform.hpp>

using flowpack::PathError;
using flowpack::normalize_under_root;
using flowpack::resolve_input_path;

// ============================================================================
// normalize_under_root
// ============================================================================

TEST_CASE("normalize simple relative path under root") {
    auto r = normalize_under_root("/work/space", "flows/hello.ygtc");
    REQUIRE(r.ok);
    CHECK(r.path == "/work/space/flows/hello.ygtc");
}

TEST_CASE("collapse dot and dotdot segments") {
    auto r = normalize_under_root("/work/space", "./flows/../components/./echo");
    REQUIRE(r.ok);
    CHECK(r.path == "/work/space/components/echo");
}

TEST_CASE("reject escape above root") {
    auto r = normalize_under_root("/work/space", "../../etc/passwd");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::EscapesRoot);

    auto nested = normalize_under_root("/work/space", "a/b/../../../etc");
    CHECK_FALSE(nested.ok);
    CHECK(nested.error == PathError::EscapesRoot);
}

TEST_CASE("reject absolute when not allowed") {
    auto r = normalize_under_root("/work/space", "/abs/path");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::AbsoluteNotAllowed);
}

TEST_CASE("absolute input is re-rooted when allowed") {
    auto r = normalize_under_root("/work/space", "/flows/a.ygtc", true);
    REQUIRE(r.ok);
    CHECK(r.path == "/work/space/flows/a.ygtc");
}

TEST_CASE("reject NUL bytes") {
    std::string bad = std::string("flows/\0a", 8);
    auto r = normalize_under_root("/work/space", bad);
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::ContainsNul);
}

TEST_CASE("empty and dot paths resolve to the root") {
    auto empty = normalize_under_root("/work/space", "");
    REQUIRE(empty.ok);
    CHECK(empty.path == "/work/space");

    auto dot = normalize_under_root("/work/space", ".");
    REQUIRE(dot.ok);
    CHECK(dot.path == "/work/space");
}

TEST_CASE("repeated separators and backslashes are normalized") {
    auto r = normalize_under_root("/work/space", "flows//nested\\\\a.ygtc");
    REQUIRE(r.ok);
    CHECK(r.path == "/work/space/flows/nested/a.ygtc");
}

// ============================================================================
// resolve_input_path
// ============================================================================

TEST_CASE("resolve_input_path accepts absolute paths inside the root") {
    auto r = resolve_input_path("/work/space", "/work/space/flows/../flows/a.ygtc");
    REQUIRE(r.ok);
    CHECK(r.path == "/work/space/flows/a.ygtc");
}

TEST_CASE("resolve_input_path rejects absolute paths outside the root") {
    auto r = resolve_input_path("/work/space", "/work/other/a.ygtc");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::EscapesRoot);

    auto sibling = resolve_input_path("/work/space", "/work/spacex/a.ygtc");
    CHECK_FALSE(sibling.ok);
}

TEST_CASE("resolve_input_path rejects relative escapes") {
    auto r = resolve_input_path("/work/space", "../outside.ygtc");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::EscapesRoot);
}

TEST_CASE("path errors have readable descriptions") {
    CHECK(std::string(flowpack::path_error_to_string(PathError::EscapesRoot)) == "path escapes root");
    CHECK(std::string(flowpack::path_error_to_string(PathError::ContainsNul)).find("NUL") !=
          std::string::npos);
}

// ============================================================================
// Platform helpers
// ============================================================================

TEST_CASE("format_timestamp renders RFC3339 UTC") {
    CHECK(flowpack::format_timestamp(0) == "1970-01-01T00:00:00Z");
    CHECK(flowpack::format_timestamp(1700000000) == "2023-11-14T22:13:20Z");
}

TEST_CASE("generate_uuid produces distinct version 4 ids") {
    auto a = flowpack::generate_uuid();
    auto b = flowpack::generate_uuid();
    CHECK(a.size() == 36);
    CHECK(a[14] == '4');
    CHECK(a != b);
}

TEST_CASE("to_portable_path converts backslashes") {
    CHECK(flowpack::to_portable_path("a\\b\\c") == "a/b/c");
}

TEST_CASE("remove_file deletes one file and tolerates a missing one") {
    auto dir = flowpack::create_temp_directory("flowpack_test_");
    REQUIRE(dir);

    std::string path = flowpack::join_path(*dir, "pack.gtpack");
    REQUIRE(flowpack::atomic_write_file(path, std::string("bytes")).ok);
    CHECK(flowpack::remove_file(path));
    CHECK_FALSE(flowpack::path_exists(path));
    CHECK(flowpack::remove_file(path));
    CHECK(flowpack::path_exists(*dir));

    CHECK(flowpack::remove_directory(*dir));
}

TEST_CASE("atomic_write_file replaces file content") {
    auto dir = flowpack::create_temp_directory("flowpack_test_");
    REQUIRE(dir);

    std::string path = flowpack::join_path(*dir, "out.txt");
    REQUIRE(flowpack::atomic_write_file(path, std::string("first")).ok);
    REQUIRE(flowpack::atomic_write_file(path, std::string("second")).ok);

    auto text = flowpack::read_text_file(path);
    REQUIRE(text);
    CHECK(*text == "second");

    CHECK(flowpack::remove_directory(*dir));
    CHECK_FALSE(flowpack::path_exists(*dir));
}
