#include "flowpack/schema_validator.hpp"

#include <iterator>
#include <map>
#include <stdexcept>
#include <utility>

#include <nlohmann/json-schema.hpp>
#include <spdlog/spdlog.h>

namespace flowpack {

using nlohmann::json_schema::json_validator;

namespace {

struct Violation {
    std::string pointer;
    std::string message;
};

class CollectingErrorHandler : public nlohmann::json_schema::basic_error_handler {
public:
    void error(const json::json_pointer& ptr, const json& instance,
               const std::string& message) override {
        nlohmann::json_schema::basic_error_handler::error(ptr, instance, message);
        violations.push_back({ptr.to_string(), message});
    }

    std::vector<Violation> violations;
};

struct CompiledSchema {
    std::unique_ptr<json_validator> validator;  // Null when there is no schema
    std::string compile_error;
};

} // namespace

class SchemaValidator::Cache {
public:
    std::map<std::string, CompiledSchema> entries;
};

SchemaValidator::SchemaValidator(const ComponentResolver& resolver)
    : resolver_(resolver), cache_(std::make_unique<Cache>()) {}

SchemaValidator::~SchemaValidator() = default;

json schema_instance(const ResolvedNode& node) {
    json instance = node.config;
    if (node.inline_exec && instance.is_object()) {
        instance.erase("component");
    }
    return instance;
}

std::string format_schema_error(const NodeSchemaError& error) {
    return "- node `" + error.node_id + "` (" + error.component + ") " + error.pointer + ": " +
           error.message;
}

std::vector<NodeSchemaError> SchemaValidator::validate(const ResolvedNode& node) {
    std::vector<NodeSchemaError> errors;

    auto make_error = [&](const std::string& pointer, const std::string& message) {
        errors.push_back(NodeSchemaError{node.node_id, node.component, pointer, message});
    };

    const ResolvedComponent* component = resolver_.find(node.component);
    if (!component) {
        make_error(node.pointer, "component " + node.component + " is not resolved");
        return errors;
    }

    auto it = cache_->entries.find(node.component);
    if (it == cache_->entries.end()) {
        CompiledSchema compiled;
        if (component->schema_json) {
            try {
                auto validator = std::make_unique<json_validator>(
                    nullptr, nlohmann::json_schema::default_string_format_check);
                validator->set_root_schema(json::parse(*component->schema_json));
                compiled.validator = std::move(validator);
                spdlog::debug("compiled config schema for {}", node.component);
            } catch (const std::exception& e) {
                compiled.compile_error = e.what();
                spdlog::debug("config schema for {} does not compile: {}", node.component,
                              e.what());
            }
        }
        it = cache_->entries.emplace(node.component, std::move(compiled)).first;
    }

    const CompiledSchema& compiled = it->second;
    if (!compiled.compile_error.empty()) {
        make_error(node.pointer, "invalid config schema: " + compiled.compile_error);
        return errors;
    }
    if (!compiled.validator) {
        return errors;
    }

    CollectingErrorHandler handler;
    try {
        compiled.validator->validate(schema_instance(node), handler);
    } catch (const std::exception& e) {
        make_error(node.pointer, std::string("schema evaluation failed: ") + e.what());
        return errors;
    }

    for (const auto& violation : handler.violations) {
        make_error(node.pointer + violation.pointer, violation.message);
    }
    return errors;
}

std::vector<NodeSchemaError> SchemaValidator::validate_all(const std::vector<ResolvedNode>& nodes) {
    std::vector<NodeSchemaError> errors;
    for (const auto& node : nodes) {
        auto node_errors = validate(node);
        errors.insert(errors.end(), std::make_move_iterator(node_errors.begin()),
                      std::make_move_iterator(node_errors.end()));
    }
    return errors;
}

} // namespace flowpack
