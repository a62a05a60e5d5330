#pragma once

#include <flowpack/platform.hpp>
#include <flowpack/types.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace flowpack_test {

namespace fs = std::filesystem;
using flowpack::json;

// Scratch directory removed at end of scope
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("flowpack_test_" + flowpack::generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }
    std::string join(const std::string& rel) const { return (path_ / rel).string(); }

private:
    fs::path path_;
};

inline void write_file(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

struct ComponentFixture {
    std::string name;
    std::string version;
    json schema;                                 // null: no config_schema
    json operations = json::array({{{"name", "handle"}}});
    std::string artifact = "wasm-fixture:";
    std::string world = "greentic:component/node@0.4.0";
};

// Lay out <root>/<name>-<version>/component.manifest.json plus its artifact.
// Returns the manifest path.
inline std::string write_component(const std::string& root, const ComponentFixture& fixture) {
    fs::path dir = fs::path(root) / (fixture.name + "-" + fixture.version);

    json manifest = {
        {"name", fixture.name},
        {"version", fixture.version},
        {"world", fixture.world},
        {"artifacts", {{"component_wasm", "component.wasm"}}},
        {"capabilities", json::object()},
    };
    if (!fixture.operations.is_null()) manifest["operations"] = fixture.operations;
    if (!fixture.schema.is_null()) manifest["config_schema"] = fixture.schema;

    std::string manifest_path = (dir / "component.manifest.json").string();
    write_file(manifest_path, manifest.dump(2));
    write_file((dir / "component.wasm").string(), fixture.artifact + fixture.name + fixture.version);
    return manifest_path;
}

// Schema of the echo fixture: a required string `message`
inline json echo_schema() {
    return {
        {"type", "object"},
        {"properties",
         {{"message", {{"type", "string"}}},
          {"operation", {{"type", "string"}}},
          {"op", {{"type", "string"}}}}},
        {"required", {"message"}},
    };
}

} // namespace flowpack_test
